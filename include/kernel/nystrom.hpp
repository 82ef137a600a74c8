// File: kernel/nystrom.hpp

#ifndef KERNEL_NYSTROM_HPP
#define KERNEL_NYSTROM_HPP

#include <Eigen/Dense>
#include <cmath>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include "common/logging/logger.hpp"
#include "matrix/eigen_decomposition.hpp"
#include "types/concepts.hpp"

namespace kernel {

    /**
     * @brief Approximate feature map of a kernel obtained with the Nystrom method.
     *
     * Given the eigendecomposition (lambda, V) of the kernel matrix over prototypes p_1..p_m,
     * a point x is mapped to phi(x)_i = (1 / sqrt(lambda_i)) * sum_k eval(p_k, x) * V(k, i).
     * The inner products phi(p_k) . phi(p_l) reproduce the prototype kernel matrix.
     */
    template<typename P, PairwiseEvaluator<P> F>
    class NystromFeatureMap {
    public:
        /**
         * @throws std::invalid_argument if the eigenvectors do not have one row per prototype and one
         *         column per eigenvalue, or if any eigenvalue is not strictly positive.
         */
        NystromFeatureMap(matrix::EigenDecomposition decomposition, std::vector<P> prototypes, F eval) :
            decomposition_(std::move(decomposition)), prototypes_(std::move(prototypes)), eval_(std::move(eval)) {
            decomposition_.validate(prototypes_.size());

            const auto &eigenvalues = decomposition_.eigenvalues;
            for (Eigen::Index i = 0; i < eigenvalues.size(); ++i) {
                if (!(eigenvalues(i) > 0.0)) {
                    LOG_ERROR("Nystrom feature map requires positive eigenvalues, eigenvalue {} is {}", i,
                              eigenvalues(i));
                    throw std::invalid_argument("Nystrom feature map requires strictly positive eigenvalues.");
                }
            }
            inverse_sqrt_eigenvalues_ = eigenvalues.array().sqrt().inverse().matrix();

            LOG_DEBUG("Nystrom feature map with {} prototypes and {} components", prototypes_.size(),
                      eigenvalues.size());
        }

        [[nodiscard]] Eigen::Index dimension() const noexcept { return decomposition_.components(); }

        [[nodiscard]] const std::vector<P> &prototypes() const noexcept { return prototypes_; }

        [[nodiscard]] Eigen::VectorXd operator()(const P &x) const {
            Eigen::VectorXd kernel_row(static_cast<Eigen::Index>(prototypes_.size()));
            for (std::size_t k = 0; k < prototypes_.size(); ++k) {
                kernel_row(static_cast<Eigen::Index>(k)) = static_cast<double>(eval_(prototypes_[k], x));
            }
            return (decomposition_.eigenvectors.transpose() * kernel_row).cwiseProduct(inverse_sqrt_eigenvalues_);
        }

        // Maps every point, one row of the result per point.
        [[nodiscard]] Eigen::MatrixXd map(std::span<const P> points) const {
            Eigen::MatrixXd features(static_cast<Eigen::Index>(points.size()), dimension());
            for (std::size_t n = 0; n < points.size(); ++n) {
                features.row(static_cast<Eigen::Index>(n)) = (*this)(points[n]).transpose();
            }
            return features;
        }

    private:
        matrix::EigenDecomposition decomposition_;
        std::vector<P> prototypes_;
        F eval_;
        Eigen::VectorXd inverse_sqrt_eigenvalues_;
    };

} // namespace kernel

#endif // KERNEL_NYSTROM_HPP
