// File: matrix/kernel_matrix.hpp

#ifndef MATRIX_KERNEL_MATRIX_HPP
#define MATRIX_KERNEL_MATRIX_HPP

#include <Eigen/Dense>
#include <cstddef>
#include <map>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include "common/logging/logger.hpp"
#include "matrix/eigen_decomposition.hpp"
#include "matrix/pair_combiner.hpp"
#include "types/concepts.hpp"

namespace matrix {

    /*
     * Dense symmetric kernel (Gram) matrix over one dataset, together with its declared dimension.
     */
    class KernelMatrix {
    public:
        KernelMatrix(Eigen::MatrixXd kernel, std::size_t dimension);

        [[nodiscard]] const Eigen::MatrixXd &getKernelMatrix() const noexcept { return kernel_; }

        [[nodiscard]] std::size_t dimension() const noexcept { return dimension_; }

        [[nodiscard]] double operator()(const Eigen::Index row, const Eigen::Index col) const {
            return kernel_(row, col);
        }

        // Leading eigenpairs (largest eigenvalues first). num_components = 0 keeps all of them.
        [[nodiscard]] EigenDecomposition eigenDecomposition(std::size_t num_components = 0) const;

    private:
        Eigen::MatrixXd kernel_;
        std::size_t dimension_;
    };

    /**
     * @brief Builds the n x n kernel matrix K(i, j) = eval(data[i], data[j]) of a dataset.
     *
     * The evaluator runs once per lower-triangular pair (i >= j). The upper triangle reads the stored
     * value of the mirrored pair, so K(i, j) and K(j, i) are the same double even when the evaluator
     * is not bitwise symmetric.
     *
     * @param data The dataset.
     * @param length Declared number of points; must equal data.size().
     * @param eval Pairwise evaluator, assumed symmetric.
     * @throws std::out_of_range if length does not match the dataset.
     */
    template<typename P, PairwiseEvaluator<P> F>
    [[nodiscard]] KernelMatrix buildKernelMatrix(std::span<const P> data, const std::size_t length, const F &eval) {
        if (length != data.size()) {
            LOG_ERROR("Declared kernel matrix length {} does not match dataset size {}", length, data.size());
            throw std::out_of_range("Kernel matrix length does not match the dataset size.");
        }

        std::map<IndexPair, double> kernel_index;
        combineLowerTriangular(data, [&kernel_index, &eval](const IndexPair &index, const P &first, const P &second) {
            kernel_index.emplace(index, static_cast<double>(eval(first, second)));
        });

        const auto n = static_cast<Eigen::Index>(length);
        Eigen::MatrixXd kernel(n, n);
        for (Eigen::Index j = 0; j < n; ++j) {
            for (Eigen::Index i = 0; i < n; ++i) {
                const IndexPair index{static_cast<std::size_t>(i), static_cast<std::size_t>(j)};
                kernel(i, j) = kernel_index.at(index.isLowerTriangular() ? index : index.swapped());
            }
        }

        LOG_DEBUG("   Dimensions: {} x {}", kernel.rows(), kernel.cols());
        return {std::move(kernel), length};
    }

    template<typename P, PairwiseEvaluator<P> F>
    [[nodiscard]] KernelMatrix buildKernelMatrix(const std::vector<P> &data, const F &eval) {
        return buildKernelMatrix(std::span<const P>(data), data.size(), eval);
    }

    /**
     * @brief Builds the n1 x n2 matrix M(i, j) = eval(first[i], second[j]).
     *
     * Every entry is evaluated independently; no symmetry is assumed between the two datasets.
     */
    template<typename P, PairwiseEvaluator<P> F>
    [[nodiscard]] Eigen::MatrixXd buildCrossKernelMatrix(std::span<const P> first, std::span<const P> second,
                                                         const F &eval) {
        Eigen::MatrixXd kernel(static_cast<Eigen::Index>(first.size()), static_cast<Eigen::Index>(second.size()));
        combine(first, second, [&kernel, &eval](const IndexPair &index, const P &x, const P &y) {
            kernel(static_cast<Eigen::Index>(index.row), static_cast<Eigen::Index>(index.col)) =
                    static_cast<double>(eval(x, y));
        });

        LOG_DEBUG("   Dimensions: {} x {}", first.size(), second.size());
        return kernel;
    }

    template<typename P, PairwiseEvaluator<P> F>
    [[nodiscard]] Eigen::MatrixXd buildCrossKernelMatrix(const std::vector<P> &first, const std::vector<P> &second,
                                                         const F &eval) {
        return buildCrossKernelMatrix(std::span<const P>(first), std::span<const P>(second), eval);
    }

} // namespace matrix

#endif // MATRIX_KERNEL_MATRIX_HPP
