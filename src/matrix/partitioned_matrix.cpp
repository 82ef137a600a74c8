// File: matrix/partitioned_matrix.cpp

#include "matrix/partitioned_matrix.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <utility>

#include "common/logging/logger.hpp"

namespace matrix {

    namespace {
        constexpr std::int64_t kUnknownExtent = -1;

        void recordExtent(std::vector<std::int64_t> &extents, const std::int64_t position, const std::int64_t extent,
                          const BlockIndex &index) {
            auto &current = extents[static_cast<std::size_t>(position)];
            if (current == kUnknownExtent) {
                current = extent;
            } else if (current != extent) {
                LOG_ERROR("Block {} has extent {} but its neighbours use {}", index, extent, current);
                throw std::invalid_argument("Blocks in the same block row or column must agree in size.");
            }
        }
    } // namespace

    PartitionedMatrix::PartitionedMatrix(std::vector<BlockEntry> blocks, const std::int64_t rows,
                                         const std::int64_t cols, const std::int64_t num_row_blocks,
                                         const std::int64_t num_col_blocks) :
        PartitionedMatrix(std::move(blocks), rows, cols, num_row_blocks, num_col_blocks, false) {}

    PartitionedMatrix::PartitionedMatrix(std::vector<BlockEntry> blocks, const std::int64_t rows,
                                         const std::int64_t cols, const std::int64_t num_row_blocks,
                                         const std::int64_t num_col_blocks, const bool symmetric) :
        blocks_(std::move(blocks)), rows_(rows), cols_(cols), num_row_blocks_(num_row_blocks),
        num_col_blocks_(num_col_blocks) {
        if (rows_ < 0 || cols_ < 0 || num_row_blocks_ < 0 || num_col_blocks_ < 0) {
            LOG_ERROR("Invalid partitioned matrix shape {} x {} with {} x {} blocks", rows_, cols_, num_row_blocks_,
                      num_col_blocks_);
            throw std::invalid_argument("Partitioned matrix dimensions must be non-negative.");
        }
        indexBlocks(symmetric);
    }

    void PartitionedMatrix::indexBlocks(const bool symmetric) {
        if (symmetric && rows_ != cols_) {
            LOG_ERROR("Symmetric partitioned matrix must be square, got {} x {}", rows_, cols_);
            throw std::invalid_argument("Symmetric partitioned matrix must be square.");
        }

        const std::int64_t grid_cols = symmetric ? num_row_blocks_ : num_col_blocks_;
        row_heights_.assign(static_cast<std::size_t>(num_row_blocks_), kUnknownExtent);
        col_widths_.assign(static_cast<std::size_t>(grid_cols), kUnknownExtent);

        for (std::size_t k = 0; k < blocks_.size(); ++k) {
            const auto &[index, dense] = blocks_[k];
            if (index.row < 0 || index.row >= num_row_blocks_ || index.col < 0 || index.col >= grid_cols) {
                LOG_ERROR("Block {} lies outside the {} x {} block grid", index, num_row_blocks_, grid_cols);
                throw std::invalid_argument("Block index outside of the block grid.");
            }
            if (symmetric && index.row < index.col) {
                LOG_ERROR("Upper-triangular block {} supplied to a symmetric partitioned matrix", index);
                throw std::invalid_argument("Symmetric partitioned matrix stores lower-triangular blocks only.");
            }
            if (!lookup_.emplace(index, k).second) {
                LOG_ERROR("Duplicate block {}", index);
                throw std::invalid_argument("Duplicate block index.");
            }

            recordExtent(row_heights_, index.row, dense.rows(), index);
            recordExtent(col_widths_, index.col, dense.cols(), index);
            if (symmetric) {
                recordExtent(row_heights_, index.col, dense.cols(), index);
                recordExtent(col_widths_, index.row, dense.rows(), index);
            }
        }
    }

    const Eigen::MatrixXd &PartitionedMatrix::stored(const BlockIndex &index) const {
        const auto it = lookup_.find(index);
        if (it == lookup_.end()) {
            LOG_ERROR("Block {} is not present in the partitioned matrix", index);
            throw std::out_of_range("Block not present in the partitioned matrix.");
        }
        return blocks_[it->second].block;
    }

    Eigen::MatrixXd PartitionedMatrix::block(const std::int64_t row, const std::int64_t col) const {
        return stored({row, col});
    }

    Eigen::MatrixXd PartitionedMatrix::toDense() const {
        // An empty axis leaves the grid without blocks, so the other axis has no recorded extents.
        if (rows_ == 0 || cols_ == 0) {
            return Eigen::MatrixXd(rows_, cols_);
        }

        const auto sum = [](const std::vector<std::int64_t> &extents) {
            return std::accumulate(extents.begin(), extents.end(), std::int64_t{0});
        };
        const auto known = [](const std::vector<std::int64_t> &extents) {
            return std::find(extents.begin(), extents.end(), kUnknownExtent) == extents.end();
        };
        if (!known(row_heights_) || !known(col_widths_) || sum(row_heights_) != rows_ || sum(col_widths_) != cols_) {
            LOG_ERROR("Cannot assemble a {} x {} matrix from an incomplete block grid", rows_, cols_);
            throw std::out_of_range("Block grid does not cover the whole matrix.");
        }

        Eigen::MatrixXd dense(rows_, cols_);
        Eigen::Index row_offset = 0;
        for (std::size_t r = 0; r < row_heights_.size(); ++r) {
            Eigen::Index col_offset = 0;
            for (std::size_t c = 0; c < col_widths_.size(); ++c) {
                dense.block(row_offset, col_offset, row_heights_[r], col_widths_[c]) =
                        block(static_cast<std::int64_t>(r), static_cast<std::int64_t>(c));
                col_offset += col_widths_[c];
            }
            row_offset += row_heights_[r];
        }
        return dense;
    }

    PartitionedPSDMatrix::PartitionedPSDMatrix(std::vector<BlockEntry> blocks, const std::int64_t rows,
                                               const std::int64_t cols, const std::int64_t num_row_blocks,
                                               const std::int64_t num_col_blocks) :
        PartitionedMatrix(std::move(blocks), rows, cols, num_row_blocks, num_col_blocks, true) {}

    Eigen::MatrixXd PartitionedPSDMatrix::block(const std::int64_t row, const std::int64_t col) const {
        if (row >= col) {
            return stored({row, col});
        }
        return stored({col, row}).transpose();
    }

} // namespace matrix
