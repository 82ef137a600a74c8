// File: kernel/gaussian.hpp

#ifndef KERNEL_GAUSSIAN_HPP
#define KERNEL_GAUSSIAN_HPP

#include <memory>
#include <string>
#include <vector>

#include "kernel/kernel.hpp"

namespace kernel {

    // k(x, y) = exp(-||x - y||^2 / (2 sigma^2))
    class GaussianKernel final : public Kernel {
    public:
        explicit GaussianKernel(double sigma = 1.0);

        [[nodiscard]] double evaluate(const VectorType &x, const VectorType &y) const override;

        void setParameters(const VectorType &params) override;
        [[nodiscard]] VectorType getParameters() const override;
        [[nodiscard]] std::vector<std::string> getParameterNames() const override { return {"sigma"}; }

        [[nodiscard]] std::shared_ptr<Kernel> clone() const override {
            return std::make_shared<GaussianKernel>(*this);
        }

        [[nodiscard]] std::string getKernelType() const override { return "Gaussian"; }

        [[nodiscard]] double sigma() const noexcept { return sigma_; }

    private:
        double sigma_;

        void validateParameters() const;
    };

} // namespace kernel

#endif // KERNEL_GAUSSIAN_HPP
