// File: tests/matrix/partitioned_matrix_test.cpp

#include <gtest/gtest.h>

#include <Eigen/Dense>
#include <stdexcept>
#include <vector>

#include "matrix/partitioned_matrix.hpp"

using matrix::BlockEntry;
using matrix::BlockIndex;

namespace {
    Eigen::MatrixXd filled(const Eigen::Index rows, const Eigen::Index cols, const double offset) {
        Eigen::MatrixXd block(rows, cols);
        for (Eigen::Index i = 0; i < rows; ++i) {
            for (Eigen::Index j = 0; j < cols; ++j) {
                block(i, j) = offset + static_cast<double>(i * cols + j);
            }
        }
        return block;
    }
} // namespace

TEST(PartitionedMatrixTest, AssemblesRectangularGrid) {
    // 3 x 5 matrix, row blocks of 2, column blocks of 3
    std::vector<BlockEntry> blocks = {
            {{0, 0}, filled(2, 3, 0)},   {{0, 1}, filled(2, 2, 100)},
            {{1, 0}, filled(1, 3, 200)}, {{1, 1}, filled(1, 2, 300)},
    };
    const matrix::PartitionedMatrix partitioned(blocks, 3, 5, 2, 2);

    EXPECT_EQ(partitioned.rows(), 3);
    EXPECT_EQ(partitioned.cols(), 5);
    EXPECT_EQ(partitioned.numRowBlocks(), 2);
    EXPECT_EQ(partitioned.numColBlocks(), 2);
    EXPECT_EQ(partitioned.blocks().size(), 4u);
    EXPECT_TRUE(partitioned.contains({1, 0}));

    const Eigen::MatrixXd dense = partitioned.toDense();
    EXPECT_EQ(dense.block(0, 0, 2, 3), filled(2, 3, 0));
    EXPECT_EQ(dense.block(0, 3, 2, 2), filled(2, 2, 100));
    EXPECT_EQ(dense.block(2, 0, 1, 3), filled(1, 3, 200));
    EXPECT_EQ(dense.block(2, 3, 1, 2), filled(1, 2, 300));
}

TEST(PartitionedMatrixTest, MissingBlockIsOutOfRange) {
    const matrix::PartitionedMatrix partitioned({{{0, 0}, filled(2, 2, 0)}}, 4, 4, 2, 2);
    EXPECT_THROW(static_cast<void>(partitioned.block(1, 1)), std::out_of_range);
    EXPECT_THROW(static_cast<void>(partitioned.toDense()), std::out_of_range);
}

TEST(PartitionedMatrixTest, RejectsInconsistentBlocks) {
    // Outside the grid
    EXPECT_THROW(matrix::PartitionedMatrix({{{2, 0}, filled(1, 1, 0)}}, 2, 2, 2, 2), std::invalid_argument);
    // Duplicate index
    EXPECT_THROW(matrix::PartitionedMatrix({{{0, 0}, filled(1, 1, 0)}, {{0, 0}, filled(1, 1, 0)}}, 2, 2, 2, 2),
                 std::invalid_argument);
    // Two blocks of the same block row disagree in height
    EXPECT_THROW(matrix::PartitionedMatrix({{{0, 0}, filled(2, 1, 0)}, {{0, 1}, filled(1, 1, 0)}}, 2, 2, 2, 2),
                 std::invalid_argument);
    EXPECT_THROW(matrix::PartitionedMatrix({}, -1, 2, 1, 1), std::invalid_argument);
}

TEST(PartitionedPSDMatrixTest, ReconstructsUpperBlocksAsTransposes) {
    Eigen::MatrixXd diagonal0(2, 2);
    diagonal0 << 1, 2,
            2, 5;
    Eigen::MatrixXd lower(1, 2);
    lower << 7, 8;
    Eigen::MatrixXd diagonal1(1, 1);
    diagonal1 << 9;

    const matrix::PartitionedPSDMatrix partitioned({{{0, 0}, diagonal0}, {{1, 0}, lower}, {{1, 1}, diagonal1}}, 3, 3,
                                                   2, 2);

    EXPECT_FALSE(partitioned.contains({0, 1}));
    EXPECT_EQ(partitioned.block(0, 1), lower.transpose());

    Eigen::MatrixXd expected(3, 3);
    expected << 1, 2, 7,
            2, 5, 8,
            7, 8, 9;
    EXPECT_EQ(partitioned.toDense(), expected);
}

TEST(PartitionedPSDMatrixTest, RejectsUpperTriangularBlocks) {
    EXPECT_THROW(matrix::PartitionedPSDMatrix({{{0, 1}, filled(1, 1, 0)}}, 2, 2, 2, 2), std::invalid_argument);
}

TEST(PartitionedPSDMatrixTest, RequiresSquareShape) {
    EXPECT_THROW(matrix::PartitionedPSDMatrix({}, 2, 3, 1, 1), std::invalid_argument);
}

TEST(BlockIndexTest, DiagonalAndMirror) {
    constexpr BlockIndex index{2, 1};
    EXPECT_FALSE(index.isDiagonal());
    EXPECT_TRUE((BlockIndex{3, 3}).isDiagonal());
    EXPECT_EQ(index.mirrored(), (BlockIndex{1, 2}));
    EXPECT_LT((BlockIndex{0, 5}), (BlockIndex{1, 0}));
}
