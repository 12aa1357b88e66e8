#ifndef NABLA_OPTIMIZER_GRADIENTS_HPP
#define NABLA_OPTIMIZER_GRADIENTS_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

namespace Nabla::Optimizer {

    // Gradients of one optimization step keyed by parameter identity
    // (the fully qualified name from `named_parameters()`).
    class GradientsParams {
    public:
        using Container = std::map<std::string, torch::Tensor>;

        GradientsParams() = default;

        [[nodiscard]] static GradientsParams from_module(const torch::nn::Module& module) {
            GradientsParams gradients;
            for (const auto& item : module.named_parameters(/*recurse=*/true)) {
                const auto& grad = item.value().grad();
                if (!grad.defined()) {
                    continue;
                }
                gradients.register_gradient(item.key(), grad.detach().clone());
            }
            return gradients;
        }

        void register_gradient(std::string id, torch::Tensor gradient) {
            if (!gradient.defined()) {
                throw std::invalid_argument("Gradient registered for parameter '" + id + "' is undefined.");
            }
            gradients_.insert_or_assign(std::move(id), std::move(gradient));
        }

        [[nodiscard]] std::optional<torch::Tensor> remove(const std::string& id) {
            auto it = gradients_.find(id);
            if (it == gradients_.end()) {
                return std::nullopt;
            }
            auto gradient = std::move(it->second);
            gradients_.erase(it);
            return gradient;
        }

        [[nodiscard]] const torch::Tensor* find(const std::string& id) const {
            auto it = gradients_.find(id);
            return it == gradients_.end() ? nullptr : &it->second;
        }

        template <class Function>
        void transform(Function&& function) {
            for (auto& [id, gradient] : gradients_) {
                gradient = function(gradient);
            }
        }

        [[nodiscard]] std::size_t size() const noexcept { return gradients_.size(); }
        [[nodiscard]] bool empty() const noexcept { return gradients_.empty(); }

        [[nodiscard]] Container::const_iterator begin() const noexcept { return gradients_.begin(); }
        [[nodiscard]] Container::const_iterator end() const noexcept { return gradients_.end(); }

    private:
        Container gradients_{};
    };

}

#endif // NABLA_OPTIMIZER_GRADIENTS_HPP
