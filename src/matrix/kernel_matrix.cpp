// File: matrix/kernel_matrix.cpp

#include "matrix/kernel_matrix.hpp"

namespace matrix {

    KernelMatrix::KernelMatrix(Eigen::MatrixXd kernel, const std::size_t dimension) :
        kernel_(std::move(kernel)), dimension_(dimension) {
        if (kernel_.rows() != kernel_.cols() || static_cast<std::size_t>(kernel_.rows()) != dimension_) {
            LOG_ERROR("Kernel matrix of shape {} x {} does not match declared dimension {}", kernel_.rows(),
                      kernel_.cols(), dimension_);
            throw std::invalid_argument("Kernel matrix must be square with the declared dimension.");
        }
    }

    EigenDecomposition KernelMatrix::eigenDecomposition(const std::size_t num_components) const {
        LOG_DEBUG("Eigen decomposition of {} x {} kernel matrix, components requested: {}", kernel_.rows(),
                  kernel_.cols(), num_components);
        return EigenDecomposition::compute(kernel_, num_components);
    }

} // namespace matrix
