// File: kernel/matern_52.cpp

#include "kernel/matern_52.hpp"

#include <cmath>
#include <stdexcept>

#include "common/logging/logger.hpp"

namespace kernel {

    Matern52Kernel::Matern52Kernel(const double length_scale, const double variance) :
        length_scale_(length_scale), variance_(variance) {
        validateParameters();
    }

    double Matern52Kernel::evaluate(const VectorType &x, const VectorType &y) const {
        const double r = (x - y).norm();
        const double z = sqrt_5_ * r / length_scale_;
        return variance_ * (1.0 + z + z * z / 3.0) * std::exp(-z);
    }

    void Matern52Kernel::setParameters(const VectorType &params) {
        validateParameterCount(params, getParameterNames());
        Matern52Kernel candidate(params(0), params(1));
        *this = candidate;
    }

    Matern52Kernel::VectorType Matern52Kernel::getParameters() const {
        VectorType params(2);
        params << length_scale_, variance_;
        return params;
    }

    void Matern52Kernel::validateParameters() const {
        if (!(length_scale_ > 0.0) || !(variance_ > 0.0)) {
            LOG_ERROR("Invalid kernel parameters: length_scale = {}, variance = {}", length_scale_, variance_);
            throw std::invalid_argument("Kernel parameters must be positive.");
        }
    }

} // namespace kernel
