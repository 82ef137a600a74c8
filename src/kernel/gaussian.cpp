// File: kernel/gaussian.cpp

#include "kernel/gaussian.hpp"

#include <cmath>
#include <stdexcept>

#include "common/logging/logger.hpp"

namespace kernel {

    GaussianKernel::GaussianKernel(const double sigma) : sigma_(sigma) { validateParameters(); }

    double GaussianKernel::evaluate(const VectorType &x, const VectorType &y) const {
        return std::exp(-(x - y).squaredNorm() / (2.0 * sigma_ * sigma_));
    }

    void GaussianKernel::setParameters(const VectorType &params) {
        validateParameterCount(params, getParameterNames());
        const double previous = sigma_;
        sigma_ = params(0);
        try {
            validateParameters();
        } catch (const std::invalid_argument &) {
            sigma_ = previous;
            throw;
        }
    }

    GaussianKernel::VectorType GaussianKernel::getParameters() const { return VectorType::Constant(1, sigma_); }

    void GaussianKernel::validateParameters() const {
        if (!(sigma_ > 0.0)) {
            LOG_ERROR("Invalid Gaussian kernel bandwidth: sigma = {}", sigma_);
            throw std::invalid_argument("Gaussian kernel bandwidth must be positive.");
        }
    }

} // namespace kernel
