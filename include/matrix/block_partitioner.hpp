// File: matrix/block_partitioner.hpp

#ifndef MATRIX_BLOCK_PARTITIONER_HPP
#define MATRIX_BLOCK_PARTITIONER_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <vector>

#include "common/logging/logger.hpp"

namespace matrix {

    /*
     * Contiguous run of points tagged with its zero-based block index.
     * The elements view the partitioned dataset, which must outlive the group.
     */
    template<typename P>
    struct BlockGroup {
        std::int64_t index = 0;
        std::span<const P> elements;

        [[nodiscard]] std::size_t size() const noexcept { return elements.size(); }
    };

    // ceil(length / block_size) for positive block sizes.
    [[nodiscard]] inline std::int64_t numBlocks(const std::int64_t length, const std::int64_t block_size) {
        if (block_size <= 0) {
            LOG_ERROR("Invalid block size: {}", block_size);
            throw std::invalid_argument("Block size must be positive.");
        }
        return length / block_size + (length % block_size != 0 ? 1 : 0);
    }

    /**
     * @brief Splits a dataset into consecutive groups of block_size points; the last group keeps the remainder.
     *
     * @throws std::invalid_argument if block_size <= 0.
     */
    template<typename P>
    [[nodiscard]] std::vector<BlockGroup<P>> partition(std::span<const P> data, const std::int64_t block_size) {
        const auto count = numBlocks(static_cast<std::int64_t>(data.size()), block_size);

        std::vector<BlockGroup<P>> groups;
        groups.reserve(static_cast<std::size_t>(count));
        const auto step = static_cast<std::size_t>(block_size);
        for (std::size_t offset = 0, index = 0; offset < data.size(); offset += step, ++index) {
            const auto length = std::min(step, data.size() - offset);
            groups.push_back({static_cast<std::int64_t>(index), data.subspan(offset, length)});
        }
        return groups;
    }

} // namespace matrix

#endif // MATRIX_BLOCK_PARTITIONER_HPP
