// File: matrix/block_scheduler.cpp

#include "matrix/block_scheduler.hpp"

#include <atomic>
#include <exception>
#include <utility>

#include "common/logging/logger.hpp"

namespace matrix {

    BlockScheduler::BlockScheduler(const int threads) : threads_(threads) {
        if (threads_ < 1) {
            LOG_ERROR("Invalid number of block workers: {}", threads_);
            throw std::invalid_argument("Block scheduler needs at least one worker.");
        }
    }

    std::vector<BlockEntry> BlockScheduler::run(const std::vector<BlockTask> &tasks,
                                                const std::stop_token &stop) const {
        LOG_INFO("Constructing {} partitions on {} worker(s)", tasks.size(), threads_);

        std::vector<BlockEntry> entries(tasks.size());
        std::exception_ptr failure;
        std::atomic<bool> failed{false};
        std::atomic<std::size_t> skipped{0};
        const auto count = static_cast<std::int64_t>(tasks.size());

#pragma omp parallel for schedule(dynamic) num_threads(threads_) if (threads_ > 1)
        for (std::int64_t k = 0; k < count; ++k) {
            if (failed.load(std::memory_order_relaxed) || stop.stop_requested()) {
                skipped.fetch_add(1, std::memory_order_relaxed);
                continue;
            }

            const auto &task = tasks[static_cast<std::size_t>(k)];
            try {
                LOG_DEBUG(":- Partition: {}", task.index);
                Eigen::MatrixXd block = task.compute();
                LOG_TRACE("Block {} ({} x {}):\n{:.4f}", task.index, block.rows(), block.cols(), block);
                entries[static_cast<std::size_t>(k)] = BlockEntry{task.index, std::move(block)};
            } catch (...) {
#pragma omp critical(block_scheduler_failure)
                {
                    if (!failure) {
                        failure = std::current_exception();
                    }
                }
                failed.store(true, std::memory_order_relaxed);
            }
        }

        if (failure) {
            LOG_ERROR("Partition construction failed, {} block(s) were not started", skipped.load());
            std::rethrow_exception(failure);
        }
        if (skipped.load() > 0) {
            LOG_WARN("Partition construction cancelled, {} of {} block(s) were not computed", skipped.load(),
                     tasks.size());
            throw BuildCancelled("Partitioned kernel matrix construction was cancelled.");
        }
        return entries;
    }

} // namespace matrix
