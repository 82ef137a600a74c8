// File: matrix/eigen_decomposition.hpp

#ifndef MATRIX_EIGEN_DECOMPOSITION_HPP
#define MATRIX_EIGEN_DECOMPOSITION_HPP

#include <Eigen/Dense>
#include <cstddef>

namespace matrix {

    /*
     * Eigenvalues and eigenvectors of a symmetric kernel matrix over m prototypes.
     * eigenvectors is m x d, column i belongs to eigenvalues(i), d = eigenvalues.size().
     */
    struct EigenDecomposition {
        Eigen::VectorXd eigenvalues;
        Eigen::MatrixXd eigenvectors;

        [[nodiscard]] Eigen::Index components() const noexcept { return eigenvalues.size(); }

        /**
         * @brief Checks the shape contract against a prototype count.
         * @throws std::invalid_argument if eigenvectors is not num_prototypes x components().
         */
        void validate(std::size_t num_prototypes) const;

        // Keeps only the eigenpairs whose eigenvalue is strictly greater than tolerance.
        [[nodiscard]] EigenDecomposition truncated(double tolerance) const;

        /**
         * @brief Decomposes a symmetric matrix with Eigen's self-adjoint solver.
         *
         * Eigenpairs are returned by decreasing eigenvalue; num_components = 0 keeps all of them.
         * @throws std::invalid_argument if the matrix is not square or num_components exceeds its size.
         * @throws std::runtime_error if the solver does not converge.
         */
        [[nodiscard]] static EigenDecomposition compute(const Eigen::MatrixXd &symmetric_matrix,
                                                        std::size_t num_components = 0);
    };

} // namespace matrix

#endif // MATRIX_EIGEN_DECOMPOSITION_HPP
