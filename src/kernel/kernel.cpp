// File: kernel/kernel.cpp

#include "kernel/kernel.hpp"

#include <stdexcept>

#include "common/logging/logger.hpp"
#include "kernel/nystrom.hpp"

namespace kernel {

    matrix::KernelMatrix Kernel::buildKernelMatrix(const std::vector<VectorType> &data) const {
        LOG_DEBUG("Building {} kernel matrix over {} points", getKernelType(), data.size());
        return matrix::buildKernelMatrix(data, evaluator());
    }

    Eigen::MatrixXd Kernel::buildCrossKernelMatrix(const std::vector<VectorType> &first,
                                                   const std::vector<VectorType> &second) const {
        LOG_DEBUG("Building {} cross kernel matrix between {} and {} points", getKernelType(), first.size(),
                  second.size());
        return matrix::buildCrossKernelMatrix(first, second, evaluator());
    }

    Kernel::VectorType Kernel::featureMapping(const matrix::EigenDecomposition &decomposition,
                                              const std::vector<VectorType> &prototypes, const VectorType &x) const {
        const NystromFeatureMap<VectorType, decltype(evaluator())> feature_map(decomposition, prototypes, evaluator());
        return feature_map(x);
    }

    void Kernel::validateParameterCount(const VectorType &params, const std::vector<std::string> &param_names) {
        if (params.size() != static_cast<Eigen::Index>(param_names.size())) {
            LOG_ERROR("Expected {} kernel parameters, got {}", param_names.size(), params.size());
            throw std::invalid_argument("Number of parameters does not match expected number for this kernel");
        }
    }

} // namespace kernel
