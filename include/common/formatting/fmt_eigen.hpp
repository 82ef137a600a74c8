// File: common/formatting/fmt_eigen.hpp

#ifndef COMMON_FORMATTING_FMT_EIGEN_HPP
#define COMMON_FORMATTING_FMT_EIGEN_HPP

#include <Eigen/Core>
#include <fmt/format.h>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>

/*
 * Formatter for dense Eigen matrices and vectors, one bracketed row per line.
 * Supports 'f' (fixed-point), 'e' (scientific) and 'g' (general) with an optional precision.
 * Default: 'g' with full precision.
 * Example: LOG_DEBUG("Block {}:\n{:.3f}", index, block);
 */
template<typename Scalar, int Rows, int Cols, int Options, int MaxRows, int MaxCols>
struct fmt::formatter<Eigen::Matrix<Scalar, Rows, Cols, Options, MaxRows, MaxCols>> {
    char presentation = 'g';
    int precision = -1;

    constexpr auto parse(fmt::format_parse_context &ctx) {
        auto it = ctx.begin();
        const auto end = ctx.end();

        if (it != end && *it == '.') {
            ++it;
        }
        if (it != end && *it >= '0' && *it <= '9') {
            int parsed_precision = 0;
            while (it != end && *it >= '0' && *it <= '9') {
                parsed_precision = parsed_precision * 10 + (*it - '0');
                ++it;
            }
            precision = parsed_precision;
        }

        if (it != end && *it != '}') {
            presentation = *it++;
        }

        if (presentation != 'f' && presentation != 'e' && presentation != 'g') {
            throw fmt::format_error("Invalid format specifier for Eigen matrix");
        }

        return it;
    }

    template<typename FormatContext>
    auto format(const Eigen::Matrix<Scalar, Rows, Cols, Options, MaxRows, MaxCols> &mat, FormatContext &ctx) const {
        std::ostringstream oss;
        oss << std::setprecision(precision >= 0 ? precision : std::numeric_limits<Scalar>::digits10 + 1);
        if (presentation == 'f') {
            oss << std::fixed;
        } else if (presentation == 'e') {
            oss << std::scientific;
        }

        for (Eigen::Index row = 0; row < mat.rows(); ++row) {
            oss << '[';
            for (Eigen::Index col = 0; col < mat.cols(); ++col) {
                oss << mat(row, col);
                if (col < mat.cols() - 1) {
                    oss << ", ";
                }
            }
            oss << ']';
            if (row < mat.rows() - 1) {
                oss << '\n';
            }
        }

        return fmt::format_to(ctx.out(), "{}", oss.str());
    }
};

#endif // COMMON_FORMATTING_FMT_EIGEN_HPP
