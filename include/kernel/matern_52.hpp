// File: kernel/matern_52.hpp

#ifndef KERNEL_MATERN_52_HPP
#define KERNEL_MATERN_52_HPP

#include <memory>
#include <string>
#include <vector>

#include "kernel/kernel.hpp"

namespace kernel {

    // k(x, y) = variance * (1 + z + z^2 / 3) * exp(-z), z = sqrt(5) * ||x - y|| / length_scale
    class Matern52Kernel final : public Kernel {
    public:
        explicit Matern52Kernel(double length_scale = 1.0, double variance = 1.0);

        [[nodiscard]] double evaluate(const VectorType &x, const VectorType &y) const override;

        void setParameters(const VectorType &params) override;
        [[nodiscard]] VectorType getParameters() const override;
        [[nodiscard]] std::vector<std::string> getParameterNames() const override {
            return {"length_scale", "variance"};
        }

        [[nodiscard]] std::shared_ptr<Kernel> clone() const override {
            return std::make_shared<Matern52Kernel>(*this);
        }

        [[nodiscard]] std::string getKernelType() const override { return "Matern52"; }

    private:
        double length_scale_;
        double variance_;
        static constexpr double sqrt_5_ = 2.236067977499790; // Pre-computed sqrt(5)

        void validateParameters() const;
    };

} // namespace kernel

#endif // KERNEL_MATERN_52_HPP
