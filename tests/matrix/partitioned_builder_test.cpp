// File: tests/matrix/partitioned_builder_test.cpp

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <Eigen/Dense>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <limits>
#include <span>
#include <stdexcept>
#include <stop_token>
#include <vector>

#include "matrix/kernel_matrix.hpp"
#include "matrix/partitioned_builder.hpp"

using matrix::BlockIndex;
using ::testing::ElementsAre;

namespace {
    const auto absolute_difference = [](const double a, const double b) { return std::abs(a - b); };

    struct CountingEvaluator {
        std::atomic<std::size_t> *calls;

        double operator()(const Eigen::VectorXd &x, const Eigen::VectorXd &y) const {
            calls->fetch_add(1, std::memory_order_relaxed);
            return std::exp(-0.5 * (x - y).squaredNorm());
        }
    };

    std::vector<Eigen::VectorXd> makeDataset(const std::size_t n) {
        std::vector<Eigen::VectorXd> data;
        data.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            const double t = static_cast<double>(i);
            data.push_back(Eigen::Vector3d(std::sin(t), std::cos(0.5 * t), 0.1 * t));
        }
        return data;
    }

    std::vector<BlockIndex> indices(const matrix::PartitionedMatrix &partitioned) {
        std::vector<BlockIndex> result;
        for (const auto &entry: partitioned.blocks()) {
            result.push_back(entry.index);
        }
        return result;
    }
} // namespace

// Three points with |a - b| and blocks of two
TEST(PartitionedKernelMatrixTest, SmallDatasetBlocks) {
    const std::vector<double> data = {1.0, 2.0, 3.0};
    const auto partitioned = matrix::buildPartitionedKernelMatrix(data, 2, 2, absolute_difference);

    EXPECT_EQ(partitioned.rows(), 3);
    EXPECT_EQ(partitioned.cols(), 3);
    EXPECT_EQ(partitioned.numRowBlocks(), 2);
    EXPECT_EQ(partitioned.numColBlocks(), 2);
    EXPECT_THAT(indices(partitioned), ElementsAre(BlockIndex{0, 0}, BlockIndex{1, 0}, BlockIndex{1, 1}));

    Eigen::MatrixXd diagonal0(2, 2);
    diagonal0 << 0, 1,
            1, 0;
    Eigen::MatrixXd lower(1, 2);
    lower << 2, 1;
    Eigen::MatrixXd diagonal1(1, 1);
    diagonal1 << 0;

    EXPECT_EQ(partitioned.blocks()[0].block, diagonal0);
    EXPECT_EQ(partitioned.blocks()[1].block, lower);
    EXPECT_EQ(partitioned.blocks()[2].block, diagonal1);

    Eigen::MatrixXd expected(3, 3);
    expected << 0, 1, 2,
            1, 0, 1,
            2, 1, 0;
    EXPECT_EQ(partitioned.toDense(), expected);
}

TEST(PartitionedKernelMatrixTest, MatchesDenseBuilderForAnyBlockSize) {
    const auto data = makeDataset(11);
    std::atomic<std::size_t> calls{0};
    const auto dense = matrix::buildKernelMatrix(data, CountingEvaluator{&calls});

    for (std::int64_t block_size = 1; block_size <= 12; ++block_size) {
        const auto partitioned =
                matrix::buildPartitionedKernelMatrix(data, block_size, block_size, CountingEvaluator{&calls});
        EXPECT_EQ(partitioned.numRowBlocks(), matrix::numBlocks(11, block_size));
        EXPECT_EQ(partitioned.toDense(), dense.getKernelMatrix()) << "block size " << block_size;
    }
}

TEST(PartitionedKernelMatrixTest, OnlyLowerTriangularBlocksAreEvaluated) {
    const auto data = makeDataset(10);
    std::atomic<std::size_t> calls{0};
    const auto partitioned = matrix::buildPartitionedKernelMatrix(data, 4, 4, CountingEvaluator{&calls});

    // Blocks of 4, 4 and 2 points: three diagonal blocks plus (1,0), (2,0), (2,1)
    EXPECT_EQ(partitioned.blocks().size(), 6u);
    for (const auto &entry: partitioned.blocks()) {
        EXPECT_GE(entry.index.row, entry.index.col);
    }
    const std::size_t diagonal = 4 * 5 / 2 + 4 * 5 / 2 + 2 * 3 / 2;
    const std::size_t off_diagonal = 4 * 4 + 2 * 4 + 2 * 4;
    EXPECT_EQ(calls.load(), diagonal + off_diagonal);
}

TEST(PartitionedKernelMatrixTest, PlanIsLazy) {
    const auto data = makeDataset(6);
    std::atomic<std::size_t> calls{0};
    const auto plan = matrix::planPartitionedKernelMatrix(std::span<const Eigen::VectorXd>(data), 6, 4, 4,
                                                          CountingEvaluator{&calls});

    EXPECT_EQ(plan.tasks.size(), 3u);
    EXPECT_EQ(calls.load(), 0u);

    const Eigen::MatrixXd off_diagonal = plan.tasks[1].compute();
    EXPECT_EQ(plan.tasks[1].index, (BlockIndex{1, 0}));
    EXPECT_EQ(off_diagonal.rows(), 2);
    EXPECT_EQ(off_diagonal.cols(), 4);
    EXPECT_EQ(calls.load(), 8u);
}

TEST(PartitionedKernelMatrixTest, DifferentColumnBlockSizeOnlyChangesReportedGrid) {
    const std::vector<double> data = {1.0, 2.0, 3.0, 4.0, 5.0};
    const auto partitioned = matrix::buildPartitionedKernelMatrix(data, 2, 3, absolute_difference);

    EXPECT_EQ(partitioned.numRowBlocks(), 3);
    EXPECT_EQ(partitioned.numColBlocks(), 2);
    EXPECT_EQ(partitioned.toDense(), matrix::buildKernelMatrix(data, absolute_difference).getKernelMatrix());
}

TEST(PartitionedKernelMatrixTest, ParallelSchedulingGivesTheSameMatrix) {
    const auto data = makeDataset(23);
    std::atomic<std::size_t> calls{0};
    const auto sequential = matrix::buildPartitionedKernelMatrix(data, 5, 5, CountingEvaluator{&calls});
    const auto parallel = matrix::buildPartitionedKernelMatrix(data, 5, 5, CountingEvaluator{&calls},
                                                               matrix::BlockScheduler(4));

    EXPECT_EQ(indices(sequential), indices(parallel));
    EXPECT_EQ(sequential.toDense(), parallel.toDense());
}

TEST(PartitionedKernelMatrixTest, InvalidArguments) {
    const std::vector<double> data = {1.0, 2.0, 3.0};
    EXPECT_THROW(static_cast<void>(matrix::buildPartitionedKernelMatrix(data, 0, 2, absolute_difference)),
                 std::invalid_argument);
    EXPECT_THROW(static_cast<void>(matrix::buildPartitionedKernelMatrix(data, 2, -1, absolute_difference)),
                 std::invalid_argument);
    EXPECT_THROW(static_cast<void>(matrix::buildPartitionedKernelMatrix(std::span<const double>(data), 4, 2, 2,
                                                                         absolute_difference)),
                 std::out_of_range);
    EXPECT_THROW(matrix::BlockScheduler(0), std::invalid_argument);
}

TEST(PartitionedKernelMatrixTest, EmptyDataset) {
    const std::vector<double> data;
    const auto partitioned = matrix::buildPartitionedKernelMatrix(data, 3, 3, absolute_difference);
    EXPECT_EQ(partitioned.numRowBlocks(), 0);
    EXPECT_TRUE(partitioned.blocks().empty());
    EXPECT_EQ(partitioned.toDense().size(), 0);
}

TEST(CrossPartitionedKernelMatrixTest, MatchesCrossBuilderForAnyBlockSizes) {
    const auto first = makeDataset(7);
    auto second = makeDataset(12);
    for (auto &point: second) {
        point *= 0.75;
    }
    std::atomic<std::size_t> calls{0};
    const Eigen::MatrixXd cross = matrix::buildCrossKernelMatrix(first, second, CountingEvaluator{&calls});

    for (std::int64_t row_block_size = 1; row_block_size <= 8; ++row_block_size) {
        for (std::int64_t col_block_size = 1; col_block_size <= 13; col_block_size += 3) {
            const auto partitioned = matrix::buildCrossPartitionedKernelMatrix(first, second, row_block_size,
                                                                               col_block_size, CountingEvaluator{&calls});
            EXPECT_EQ(partitioned.rows(), 7);
            EXPECT_EQ(partitioned.cols(), 12);
            EXPECT_EQ(partitioned.numRowBlocks(), matrix::numBlocks(7, row_block_size));
            EXPECT_EQ(partitioned.numColBlocks(), matrix::numBlocks(12, col_block_size));
            EXPECT_EQ(static_cast<std::int64_t>(partitioned.blocks().size()),
                      partitioned.numRowBlocks() * partitioned.numColBlocks());
            EXPECT_EQ(partitioned.toDense(), cross)
                    << "block sizes " << row_block_size << " x " << col_block_size;
        }
    }
}

TEST(CrossPartitionedKernelMatrixTest, EmptySideGivesEmptyMatrix) {
    const std::vector<double> empty;
    const std::vector<double> points = {1.0, 2.0, 3.0};

    const auto no_rows = matrix::buildCrossPartitionedKernelMatrix(empty, points, 2, 2, absolute_difference);
    EXPECT_EQ(no_rows.numRowBlocks(), 0);
    EXPECT_EQ(no_rows.numColBlocks(), 2);
    EXPECT_TRUE(no_rows.blocks().empty());
    const Eigen::MatrixXd no_rows_dense = no_rows.toDense();
    EXPECT_EQ(no_rows_dense.rows(), 0);
    EXPECT_EQ(no_rows_dense.cols(), 3);
    EXPECT_EQ(no_rows_dense, matrix::buildCrossKernelMatrix(empty, points, absolute_difference));

    const auto no_cols = matrix::buildCrossPartitionedKernelMatrix(points, empty, 2, 2, absolute_difference);
    EXPECT_EQ(no_cols.numRowBlocks(), 2);
    EXPECT_EQ(no_cols.numColBlocks(), 0);
    const Eigen::MatrixXd no_cols_dense = no_cols.toDense();
    EXPECT_EQ(no_cols_dense.rows(), 3);
    EXPECT_EQ(no_cols_dense.cols(), 0);
    EXPECT_EQ(no_cols_dense, matrix::buildCrossKernelMatrix(points, empty, absolute_difference));
}

TEST(PartitionedKernelMatrixTest, HugeBlockSizeGivesSingleBlock) {
    constexpr auto max = std::numeric_limits<std::int64_t>::max();
    const std::vector<double> data = {1.0, 2.0, 3.0};

    const auto partitioned = matrix::buildPartitionedKernelMatrix(data, max, max, absolute_difference);
    EXPECT_EQ(partitioned.numRowBlocks(), 1);
    EXPECT_EQ(partitioned.numColBlocks(), 1);
    EXPECT_THAT(indices(partitioned), ElementsAre(BlockIndex{0, 0}));
    EXPECT_EQ(partitioned.toDense(), matrix::buildKernelMatrix(data, absolute_difference).getKernelMatrix());
}

TEST(CrossPartitionedKernelMatrixTest, FullGridIsEvaluated) {
    const std::vector<double> first = {1.0, 2.0, 3.0};
    const std::vector<double> second = {1.0, 5.0};
    const auto partitioned = matrix::buildCrossPartitionedKernelMatrix(first, second, 2, 1, absolute_difference);

    EXPECT_THAT(indices(partitioned),
                ElementsAre(BlockIndex{0, 0}, BlockIndex{0, 1}, BlockIndex{1, 0}, BlockIndex{1, 1}));

    Eigen::MatrixXd expected(3, 2);
    expected << 0, 4,
            1, 3,
            2, 2;
    EXPECT_EQ(partitioned.toDense(), expected);
}

TEST(BlockSchedulerTest, StopRequestCancelsTheBuild) {
    const auto data = makeDataset(8);
    std::atomic<std::size_t> calls{0};
    std::stop_source source;
    source.request_stop();

    EXPECT_THROW(static_cast<void>(matrix::buildPartitionedKernelMatrix(data, 2, 2, CountingEvaluator{&calls},
                                                                         matrix::BlockScheduler(2),
                                                                         source.get_token())),
                 matrix::BuildCancelled);
    EXPECT_EQ(calls.load(), 0u);
}

TEST(BlockSchedulerTest, StopRequestedMidwayStopsScheduling) {
    std::stop_source source;
    std::vector<matrix::BlockTask> tasks;
    std::size_t computed = 0;
    for (std::int64_t k = 0; k < 5; ++k) {
        tasks.push_back({BlockIndex{k, 0}, [&source, &computed, k]() {
                             ++computed;
                             if (k == 1) {
                                 source.request_stop();
                             }
                             return Eigen::MatrixXd::Constant(1, 1, static_cast<double>(k)).eval();
                         }});
    }

    const matrix::BlockScheduler scheduler;
    EXPECT_THROW(static_cast<void>(scheduler.run(tasks, source.get_token())), matrix::BuildCancelled);
    EXPECT_EQ(computed, 2u);
}

TEST(BlockSchedulerTest, TaskFailureIsRethrown) {
    std::vector<matrix::BlockTask> tasks;
    tasks.push_back({BlockIndex{0, 0}, []() { return Eigen::MatrixXd::Zero(1, 1).eval(); }});
    tasks.push_back({BlockIndex{1, 0}, []() -> Eigen::MatrixXd { throw std::runtime_error("evaluator failed"); }});

    for (const int threads: {1, 3}) {
        const matrix::BlockScheduler scheduler(threads);
        EXPECT_THROW(static_cast<void>(scheduler.run(tasks)), std::runtime_error);
    }
}

TEST(BlockSchedulerTest, ResultsFollowTaskOrder) {
    std::vector<matrix::BlockTask> tasks;
    for (std::int64_t k = 0; k < 16; ++k) {
        tasks.push_back({BlockIndex{k, k}, [k]() { return Eigen::MatrixXd::Constant(2, 2, static_cast<double>(k)).eval(); }});
    }

    const matrix::BlockScheduler scheduler(4);
    const auto entries = scheduler.run(tasks);
    ASSERT_EQ(entries.size(), tasks.size());
    for (std::size_t k = 0; k < entries.size(); ++k) {
        EXPECT_EQ(entries[k].index, tasks[k].index);
        EXPECT_DOUBLE_EQ(entries[k].block(0, 0), static_cast<double>(k));
    }
}
