// File: matrix/block_index.hpp

#ifndef MATRIX_BLOCK_INDEX_HPP
#define MATRIX_BLOCK_INDEX_HPP

#include <compare>
#include <cstdint>

namespace matrix {

    // Position of a dense block inside the block grid of a partitioned matrix.
    struct BlockIndex {
        std::int64_t row = 0;
        std::int64_t col = 0;

        [[nodiscard]] constexpr bool isDiagonal() const noexcept { return row == col; }

        [[nodiscard]] constexpr BlockIndex mirrored() const noexcept { return {col, row}; }

        friend constexpr auto operator<=>(const BlockIndex &, const BlockIndex &) = default;
    };

} // namespace matrix

#endif // MATRIX_BLOCK_INDEX_HPP
