// File: matrix/block_scheduler.hpp

#ifndef MATRIX_BLOCK_SCHEDULER_HPP
#define MATRIX_BLOCK_SCHEDULER_HPP

#include <Eigen/Dense>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <vector>

#include "matrix/block_index.hpp"
#include "matrix/partitioned_matrix.hpp"

namespace matrix {

    // A block of a partitioned kernel matrix whose evaluation is deferred until the task runs.
    struct BlockTask {
        BlockIndex index;
        std::function<Eigen::MatrixXd()> compute;
    };

    // The blocks of a partitioned matrix together with the grid they belong to. Nothing is evaluated yet.
    struct PartitionPlan {
        std::vector<BlockTask> tasks;
        std::int64_t rows = 0;
        std::int64_t cols = 0;
        std::int64_t num_row_blocks = 0;
        std::int64_t num_col_blocks = 0;
    };

    class BuildCancelled : public std::runtime_error {
    public:
        explicit BuildCancelled(const std::string &message) : std::runtime_error(message) {}
    };

    /*
     * Evaluates block tasks, sequentially or on OpenMP workers. The worker count is chosen by the
     * caller; blocks share no state, so they run without locking and each result is stored only
     * once its block has been computed completely.
     */
    class BlockScheduler {
    public:
        /**
         * @param threads Number of workers, 1 evaluates on the calling thread.
         * @throws std::invalid_argument if threads < 1.
         */
        explicit BlockScheduler(int threads = 1);

        [[nodiscard]] int threads() const noexcept { return threads_; }

        /**
         * @brief Runs every task and returns the blocks in task order.
         *
         * Once stop is requested no further task is started and BuildCancelled is thrown.
         * An exception raised by a task is rethrown on the calling thread.
         */
        [[nodiscard]] std::vector<BlockEntry> run(const std::vector<BlockTask> &tasks,
                                                  const std::stop_token &stop = {}) const;

    private:
        int threads_;
    };

} // namespace matrix

#endif // MATRIX_BLOCK_SCHEDULER_HPP
