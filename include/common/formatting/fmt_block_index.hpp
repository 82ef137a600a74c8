// File: common/formatting/fmt_block_index.hpp

#ifndef COMMON_FORMATTING_FMT_BLOCK_INDEX_HPP
#define COMMON_FORMATTING_FMT_BLOCK_INDEX_HPP

#include <fmt/core.h>
#include <fmt/format.h>

#include "matrix/block_index.hpp"

template<>
struct fmt::formatter<matrix::BlockIndex> {
    constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const matrix::BlockIndex &index, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "({}, {})", index.row, index.col);
    }
};

#endif // COMMON_FORMATTING_FMT_BLOCK_INDEX_HPP
