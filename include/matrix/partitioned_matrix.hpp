// File: matrix/partitioned_matrix.hpp

#ifndef MATRIX_PARTITIONED_MATRIX_HPP
#define MATRIX_PARTITIONED_MATRIX_HPP

#include <Eigen/Dense>
#include <cstdint>
#include <map>
#include <vector>

#include "matrix/block_index.hpp"

namespace matrix {

    struct BlockEntry {
        BlockIndex index;
        Eigen::MatrixXd block;
    };

    /*
     * Logical rows x cols matrix stored as a grid of dense blocks.
     * Entries keep the order they were produced in. Immutable after construction.
     */
    class PartitionedMatrix {
    public:
        /**
         * @throws std::invalid_argument if an entry lies outside the block grid, is duplicated,
         *         or its shape disagrees with the other blocks of its block row or column.
         */
        PartitionedMatrix(std::vector<BlockEntry> blocks, std::int64_t rows, std::int64_t cols,
                          std::int64_t num_row_blocks, std::int64_t num_col_blocks);

        virtual ~PartitionedMatrix() = default;

        PartitionedMatrix(const PartitionedMatrix &) = default;
        PartitionedMatrix &operator=(const PartitionedMatrix &) = default;
        PartitionedMatrix(PartitionedMatrix &&) noexcept = default;
        PartitionedMatrix &operator=(PartitionedMatrix &&) noexcept = default;

        [[nodiscard]] std::int64_t rows() const noexcept { return rows_; }
        [[nodiscard]] std::int64_t cols() const noexcept { return cols_; }
        [[nodiscard]] std::int64_t numRowBlocks() const noexcept { return num_row_blocks_; }
        [[nodiscard]] std::int64_t numColBlocks() const noexcept { return num_col_blocks_; }

        // Stored entries, in production order.
        [[nodiscard]] const std::vector<BlockEntry> &blocks() const noexcept { return blocks_; }

        [[nodiscard]] bool contains(const BlockIndex &index) const { return lookup_.contains(index); }

        /**
         * @brief Dense block at (row, col) of the block grid.
         * @throws std::out_of_range if the block is neither stored nor derivable.
         */
        [[nodiscard]] virtual Eigen::MatrixXd block(std::int64_t row, std::int64_t col) const;

        // Assembles every block of the grid into one dense matrix.
        [[nodiscard]] Eigen::MatrixXd toDense() const;

    protected:
        PartitionedMatrix(std::vector<BlockEntry> blocks, std::int64_t rows, std::int64_t cols,
                          std::int64_t num_row_blocks, std::int64_t num_col_blocks, bool symmetric);

        [[nodiscard]] const Eigen::MatrixXd &stored(const BlockIndex &index) const;

    private:
        std::vector<BlockEntry> blocks_;
        std::map<BlockIndex, std::size_t> lookup_;
        std::int64_t rows_;
        std::int64_t cols_;
        std::int64_t num_row_blocks_;
        std::int64_t num_col_blocks_;
        std::vector<std::int64_t> row_heights_;
        std::vector<std::int64_t> col_widths_;

        void indexBlocks(bool symmetric);
    };

    /*
     * Symmetric positive semi-definite variant: only blocks with row >= col are stored,
     * block (r, c) with r < c is the transpose of block (c, r).
     * The block grid is numRowBlocks x numRowBlocks; numColBlocks is carried as given.
     */
    class PartitionedPSDMatrix final : public PartitionedMatrix {
    public:
        /**
         * @throws std::invalid_argument if an upper-triangular block is supplied or the grid is inconsistent.
         */
        PartitionedPSDMatrix(std::vector<BlockEntry> blocks, std::int64_t rows, std::int64_t cols,
                             std::int64_t num_row_blocks, std::int64_t num_col_blocks);

        [[nodiscard]] Eigen::MatrixXd block(std::int64_t row, std::int64_t col) const override;
    };

} // namespace matrix

#endif // MATRIX_PARTITIONED_MATRIX_HPP
