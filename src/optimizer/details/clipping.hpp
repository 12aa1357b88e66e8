#ifndef NABLA_GRADIENT_CLIPPING_HPP
#define NABLA_GRADIENT_CLIPPING_HPP

#include <stdexcept>
#include <string>

#include <torch/torch.h>

namespace Nabla::Optimizer::Details {

    enum class GradientClippingMode {
        Value,
        Norm,
    };

    struct GradientClippingOptions {
        GradientClippingMode mode{GradientClippingMode::Norm};
        double threshold{1.0};
    };

    inline std::string to_string(GradientClippingMode mode)
    {
        switch (mode) {
            case GradientClippingMode::Value: return "value";
            case GradientClippingMode::Norm:
            default: return "norm";
        }
    }

    class GradientClipping {
    public:
        explicit GradientClipping(GradientClippingOptions options) : options_(options) {
            if (!(options_.threshold > 0.0)) {
                throw std::invalid_argument("GradientClipping threshold must be strictly positive.");
            }
        }

        [[nodiscard]] const GradientClippingOptions& options() const noexcept { return options_; }

        [[nodiscard]] torch::Tensor clip(const torch::Tensor& grad) const {
            switch (options_.mode) {
                case GradientClippingMode::Value:
                    return grad.clamp(-options_.threshold, options_.threshold);
                case GradientClippingMode::Norm:
                default:
                    return clip_by_norm(grad);
            }
        }

    private:
        [[nodiscard]] torch::Tensor clip_by_norm(const torch::Tensor& grad) const {
            const auto norm = grad.norm().item<double>();
            if (norm > options_.threshold) {
                return grad.mul(options_.threshold / (norm + 1e-6));
            }
            return grad;
        }

        GradientClippingOptions options_;
    };

}

#endif // NABLA_GRADIENT_CLIPPING_HPP
