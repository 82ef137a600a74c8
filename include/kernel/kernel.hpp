// File: kernel/kernel.hpp

#ifndef KERNEL_KERNEL_HPP
#define KERNEL_KERNEL_HPP

#include <Eigen/Dense>
#include <memory>
#include <string>
#include <vector>

#include "matrix/eigen_decomposition.hpp"
#include "matrix/kernel_matrix.hpp"

namespace kernel {

    class Kernel {
    public:
        using VectorType = Eigen::VectorXd;

        virtual ~Kernel() = default;

        // Core functionality
        [[nodiscard]] virtual double evaluate(const VectorType &x, const VectorType &y) const = 0;

        // Evaluator view for the matrix builders. The kernel must outlive it.
        [[nodiscard]] auto evaluator() const {
            return [this](const VectorType &x, const VectorType &y) { return evaluate(x, y); };
        }

        [[nodiscard]] matrix::KernelMatrix buildKernelMatrix(const std::vector<VectorType> &data) const;

        [[nodiscard]] Eigen::MatrixXd buildCrossKernelMatrix(const std::vector<VectorType> &first,
                                                             const std::vector<VectorType> &second) const;

        /**
         * @brief Nystrom approximation of this kernel's feature map at x.
         *
         * @param decomposition Eigendecomposition of the kernel matrix over the prototypes.
         * @param prototypes The prototype subset the decomposition was computed from.
         * @throws std::invalid_argument on a shape mismatch or a non-positive eigenvalue.
         */
        [[nodiscard]] VectorType featureMapping(const matrix::EigenDecomposition &decomposition,
                                                const std::vector<VectorType> &prototypes,
                                                const VectorType &x) const;

        // Parameters
        virtual void setParameters(const VectorType &params) = 0;
        [[nodiscard]] virtual VectorType getParameters() const = 0;
        [[nodiscard]] virtual std::vector<std::string> getParameterNames() const = 0;

        [[nodiscard]] virtual std::shared_ptr<Kernel> clone() const = 0;

        [[nodiscard]] virtual std::string getKernelType() const = 0;

    protected:
        static void validateParameterCount(const VectorType &params, const std::vector<std::string> &param_names);
    };

} // namespace kernel

#endif // KERNEL_KERNEL_HPP
