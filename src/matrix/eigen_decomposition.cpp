// File: matrix/eigen_decomposition.cpp

#include "matrix/eigen_decomposition.hpp"

#include <stdexcept>
#include <vector>

#include "common/logging/logger.hpp"

namespace matrix {

    void EigenDecomposition::validate(const std::size_t num_prototypes) const {
        if (eigenvectors.rows() != static_cast<Eigen::Index>(num_prototypes)) {
            LOG_ERROR("Eigenvector matrix has {} rows but there are {} prototypes", eigenvectors.rows(),
                      num_prototypes);
            throw std::invalid_argument("Eigenvectors must have one row per prototype.");
        }
        if (eigenvectors.cols() != eigenvalues.size()) {
            LOG_ERROR("Eigenvector matrix has {} columns but there are {} eigenvalues", eigenvectors.cols(),
                      eigenvalues.size());
            throw std::invalid_argument("Eigenvectors must have one column per eigenvalue.");
        }
    }

    EigenDecomposition EigenDecomposition::truncated(const double tolerance) const {
        std::vector<Eigen::Index> kept;
        for (Eigen::Index i = 0; i < eigenvalues.size(); ++i) {
            if (eigenvalues(i) > tolerance) {
                kept.push_back(i);
            }
        }

        EigenDecomposition result;
        result.eigenvalues.resize(static_cast<Eigen::Index>(kept.size()));
        result.eigenvectors.resize(eigenvectors.rows(), static_cast<Eigen::Index>(kept.size()));
        for (Eigen::Index k = 0; k < static_cast<Eigen::Index>(kept.size()); ++k) {
            result.eigenvalues(k) = eigenvalues(kept[k]);
            result.eigenvectors.col(k) = eigenvectors.col(kept[k]);
        }

        if (result.components() < components()) {
            LOG_DEBUG("Dropped {} eigenpairs with eigenvalue <= {}", components() - result.components(), tolerance);
        }
        return result;
    }

    EigenDecomposition EigenDecomposition::compute(const Eigen::MatrixXd &symmetric_matrix,
                                                   const std::size_t num_components) {
        if (symmetric_matrix.rows() != symmetric_matrix.cols()) {
            LOG_ERROR("Cannot decompose a non-square {} x {} matrix", symmetric_matrix.rows(), symmetric_matrix.cols());
            throw std::invalid_argument("Eigen decomposition requires a square matrix.");
        }
        const Eigen::Index n = symmetric_matrix.rows();
        if (static_cast<Eigen::Index>(num_components) > n) {
            LOG_ERROR("Requested {} eigenpairs from a {} x {} matrix", num_components, n, n);
            throw std::invalid_argument("Number of components exceeds the matrix dimension.");
        }

        const Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(symmetric_matrix);
        if (solver.info() != Eigen::Success) {
            LOG_ERROR("Self-adjoint eigen solver failed to converge");
            throw std::runtime_error("Eigen decomposition did not converge.");
        }

        // Eigen sorts ascending, keep the largest ones first.
        const Eigen::Index d = num_components == 0 ? n : static_cast<Eigen::Index>(num_components);
        EigenDecomposition result;
        result.eigenvalues = solver.eigenvalues().tail(d).reverse();
        result.eigenvectors = solver.eigenvectors().rightCols(d).rowwise().reverse();
        return result;
    }

} // namespace matrix
