// File: matrix/pair_combiner.hpp

#ifndef MATRIX_PAIR_COMBINER_HPP
#define MATRIX_PAIR_COMBINER_HPP

#include <compare>
#include <cstddef>
#include <span>

namespace matrix {

    // Zero-based (row, col) position of a pair produced by the combiner.
    struct IndexPair {
        std::size_t row = 0;
        std::size_t col = 0;

        [[nodiscard]] constexpr bool isLowerTriangular() const noexcept { return row >= col; }

        [[nodiscard]] constexpr IndexPair swapped() const noexcept { return {col, row}; }

        friend constexpr auto operator<=>(const IndexPair &, const IndexPair &) = default;
    };

    /**
     * @brief Visits the cartesian product of two sequences, row-major.
     *
     * The visitor is called as visitor(IndexPair{i, j}, rows[i], cols[j]) for every i, j.
     * The visiting order only depends on the inputs, so anything built from it is reproducible.
     */
    template<typename R, typename C, typename Visitor>
    void combine(std::span<const R> rows, std::span<const C> cols, Visitor &&visitor) {
        for (std::size_t i = 0; i < rows.size(); ++i) {
            for (std::size_t j = 0; j < cols.size(); ++j) {
                visitor(IndexPair{i, j}, rows[i], cols[j]);
            }
        }
    }

    /**
     * @brief Visits the cartesian product of a sequence with itself, keeping only pairs with row >= col.
     *
     * This is the deduplication used for symmetric evaluators: every unordered pair, including the
     * diagonal, is visited exactly once, n * (n + 1) / 2 calls in total.
     */
    template<typename P, typename Visitor>
    void combineLowerTriangular(std::span<const P> values, Visitor &&visitor) {
        for (std::size_t i = 0; i < values.size(); ++i) {
            for (std::size_t j = 0; j <= i; ++j) {
                visitor(IndexPair{i, j}, values[i], values[j]);
            }
        }
    }

} // namespace matrix

#endif // MATRIX_PAIR_COMBINER_HPP
