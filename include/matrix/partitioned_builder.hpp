// File: matrix/partitioned_builder.hpp

#ifndef MATRIX_PARTITIONED_BUILDER_HPP
#define MATRIX_PARTITIONED_BUILDER_HPP

#include <cstdint>
#include <span>
#include <stdexcept>
#include <stop_token>
#include <utility>
#include <vector>

#include "common/logging/logger.hpp"
#include "common/timer.hpp"
#include "matrix/block_partitioner.hpp"
#include "matrix/block_scheduler.hpp"
#include "matrix/kernel_matrix.hpp"
#include "matrix/pair_combiner.hpp"
#include "matrix/partitioned_matrix.hpp"
#include "types/concepts.hpp"

namespace matrix {

    /**
     * @brief Plans the lower-triangular blocks of the symmetric kernel matrix of a dataset.
     *
     * The dataset is cut into groups of row_block_size points and only block pairs with
     * row >= col are planned. Diagonal blocks are built with buildKernelMatrix, the others with
     * buildCrossKernelMatrix. Tasks capture a view of data and a copy of eval, so data must
     * outlive them.
     *
     * @param length Declared number of points; must equal data.size().
     * @param row_block_size Points per block row, also used for the block columns.
     * @param col_block_size Only determines the reported numColBlocks.
     * @throws std::invalid_argument if a block size is not positive.
     * @throws std::out_of_range if length does not match the dataset.
     */
    template<typename P, PairwiseEvaluator<P> F>
    [[nodiscard]] PartitionPlan planPartitionedKernelMatrix(std::span<const P> data, const std::int64_t length,
                                                            const std::int64_t row_block_size,
                                                            const std::int64_t col_block_size, const F &eval) {
        if (length != static_cast<std::int64_t>(data.size())) {
            LOG_ERROR("Declared kernel matrix length {} does not match dataset size {}", length, data.size());
            throw std::out_of_range("Kernel matrix length does not match the dataset size.");
        }

        PartitionPlan plan;
        plan.rows = length;
        plan.cols = length;
        plan.num_row_blocks = numBlocks(length, row_block_size);
        plan.num_col_blocks = numBlocks(length, col_block_size);

        LOG_INFO("Constructing partitioned kernel matrix.");
        LOG_INFO("Dimension: {} x {}", plan.rows, plan.cols);
        LOG_INFO("Blocks: {} x {}", plan.num_row_blocks, plan.num_col_blocks);
        if (row_block_size != col_block_size) {
            LOG_WARN("Symmetric partitioning uses the row block size {} for both axes (column block size {})",
                     row_block_size, col_block_size);
        }

        const auto groups = partition(data, row_block_size);
        combineLowerTriangular(std::span<const BlockGroup<P>>(groups),
                               [&plan, &eval](const IndexPair &, const BlockGroup<P> &first,
                                              const BlockGroup<P> &second) {
                                   const BlockIndex index{first.index, second.index};
                                   if (index.isDiagonal()) {
                                       plan.tasks.push_back({index, [elements = first.elements, eval]() {
                                                                 return Eigen::MatrixXd(
                                                                         buildKernelMatrix(elements, elements.size(),
                                                                                           eval)
                                                                                 .getKernelMatrix());
                                                             }});
                                   } else {
                                       plan.tasks.push_back(
                                               {index, [rows = first.elements, cols = second.elements, eval]() {
                                                    return buildCrossKernelMatrix(rows, cols, eval);
                                                }});
                                   }
                               });
        return plan;
    }

    /**
     * @brief Plans every block of the kernel matrix between two datasets.
     *
     * Each dataset is partitioned independently and the full block grid is planned with
     * buildCrossKernelMatrix. Tasks view both datasets, which must outlive them.
     *
     * @throws std::invalid_argument if a block size is not positive.
     */
    template<typename P, PairwiseEvaluator<P> F>
    [[nodiscard]] PartitionPlan planCrossPartitionedKernelMatrix(std::span<const P> first, std::span<const P> second,
                                                                 const std::int64_t row_block_size,
                                                                 const std::int64_t col_block_size, const F &eval) {
        PartitionPlan plan;
        plan.rows = static_cast<std::int64_t>(first.size());
        plan.cols = static_cast<std::int64_t>(second.size());
        plan.num_row_blocks = numBlocks(plan.rows, row_block_size);
        plan.num_col_blocks = numBlocks(plan.cols, col_block_size);

        LOG_INFO("Constructing cross partitioned kernel matrix.");
        LOG_INFO("Dimension: {} x {}", plan.rows, plan.cols);
        LOG_INFO("Blocks: {} x {}", plan.num_row_blocks, plan.num_col_blocks);

        const auto row_groups = partition(first, row_block_size);
        const auto col_groups = partition(second, col_block_size);
        combine(std::span<const BlockGroup<P>>(row_groups), std::span<const BlockGroup<P>>(col_groups),
                [&plan, &eval](const IndexPair &, const BlockGroup<P> &rows, const BlockGroup<P> &cols) {
                    plan.tasks.push_back({BlockIndex{rows.index, cols.index},
                                          [row_elements = rows.elements, col_elements = cols.elements, eval]() {
                                              return buildCrossKernelMatrix(row_elements, col_elements, eval);
                                          }});
                });
        return plan;
    }

    /**
     * @brief Builds the symmetric partitioned kernel matrix of a dataset.
     *
     * Only the lower-triangular blocks are evaluated and stored; the scheduler decides how many
     * workers compute them.
     *
     * @throws BuildCancelled if stop is requested before every block has been computed.
     */
    template<typename P, PairwiseEvaluator<P> F>
    [[nodiscard]] PartitionedPSDMatrix
    buildPartitionedKernelMatrix(std::span<const P> data, const std::int64_t length, const std::int64_t row_block_size,
                                 const std::int64_t col_block_size, const F &eval,
                                 const BlockScheduler &scheduler = BlockScheduler{},
                                 const std::stop_token &stop = {}) {
        common::Timer timer("partitioned kernel matrix");
        auto plan = planPartitionedKernelMatrix(data, length, row_block_size, col_block_size, eval);
        return {scheduler.run(plan.tasks, stop), plan.rows, plan.cols, plan.num_row_blocks, plan.num_col_blocks};
    }

    template<typename P, PairwiseEvaluator<P> F>
    [[nodiscard]] PartitionedPSDMatrix
    buildPartitionedKernelMatrix(const std::vector<P> &data, const std::int64_t row_block_size,
                                 const std::int64_t col_block_size, const F &eval,
                                 const BlockScheduler &scheduler = BlockScheduler{},
                                 const std::stop_token &stop = {}) {
        return buildPartitionedKernelMatrix(std::span<const P>(data), static_cast<std::int64_t>(data.size()),
                                            row_block_size, col_block_size, eval, scheduler, stop);
    }

    /**
     * @brief Builds the partitioned kernel matrix between two datasets over the full block grid.
     *
     * @throws BuildCancelled if stop is requested before every block has been computed.
     */
    template<typename P, PairwiseEvaluator<P> F>
    [[nodiscard]] PartitionedMatrix
    buildCrossPartitionedKernelMatrix(std::span<const P> first, std::span<const P> second,
                                      const std::int64_t row_block_size, const std::int64_t col_block_size,
                                      const F &eval, const BlockScheduler &scheduler = BlockScheduler{},
                                      const std::stop_token &stop = {}) {
        common::Timer timer("cross partitioned kernel matrix");
        auto plan = planCrossPartitionedKernelMatrix(first, second, row_block_size, col_block_size, eval);
        return {scheduler.run(plan.tasks, stop), plan.rows, plan.cols, plan.num_row_blocks, plan.num_col_blocks};
    }

    template<typename P, PairwiseEvaluator<P> F>
    [[nodiscard]] PartitionedMatrix
    buildCrossPartitionedKernelMatrix(const std::vector<P> &first, const std::vector<P> &second,
                                      const std::int64_t row_block_size, const std::int64_t col_block_size,
                                      const F &eval, const BlockScheduler &scheduler = BlockScheduler{},
                                      const std::stop_token &stop = {}) {
        return buildCrossPartitionedKernelMatrix(std::span<const P>(first), std::span<const P>(second),
                                                 row_block_size, col_block_size, eval, scheduler, stop);
    }

} // namespace matrix

#endif // MATRIX_PARTITIONED_BUILDER_HPP
