#ifndef NABLA_WEIGHT_DECAY_HPP
#define NABLA_WEIGHT_DECAY_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>
#include <torch/optim/serialize.h>

#include "../../utils/check.hpp"
#include "../simple.hpp"

namespace Nabla::Optimizer::Details {

    struct WeightDecayOptions {
        double penalty{0.0};
        std::optional<double> decay_rate{}; // falls back to `penalty`
    };

    struct WeightDecayState {
        TORCH_ARG(torch::Tensor, buffer);

    public:
        void serialize(torch::serialize::InputArchive& archive) {
            _TORCH_OPTIM_DESERIALIZE_TORCH_ARG(torch::Tensor, buffer);
        }

        void serialize(torch::serialize::OutputArchive& archive) const {
            _TORCH_OPTIM_SERIALIZE_TORCH_ARG(buffer);
        }

        [[nodiscard]] WeightDecayState to(const torch::Device& device) const {
            WeightDecayState moved;
            moved.buffer(relocate(buffer(), device));
            return moved;
        }
    };

    class WeightDecay {
    public:
        explicit WeightDecay(WeightDecayOptions options)
            : penalty_(options.penalty),
              decay_rate_(options.decay_rate.value_or(options.penalty)) {
            if (!(penalty_ >= 0.0)) {
                throw std::invalid_argument("WeightDecay penalty must be non-negative.");
            }
            if (!(decay_rate_ >= 0.0)) {
                throw std::invalid_argument("WeightDecay decay_rate must be non-negative.");
            }
        }

        [[nodiscard]] double penalty() const noexcept { return penalty_; }
        [[nodiscard]] double decay_rate() const noexcept { return decay_rate_; }

        // Accumulator policy: buffer = buffer * decay_rate + grad * penalty.
        // The buffer is both the persisted state and the transformed gradient.
        [[nodiscard]] std::pair<torch::Tensor, WeightDecayState>
        transform(const torch::Tensor& grad, std::optional<WeightDecayState> state) const {
            torch::Tensor buffer;
            if (state) {
                Utils::require_same_shape(grad, state->buffer(), "WeightDecay buffer");
                buffer = state->buffer().mul(decay_rate_).add(grad.mul(penalty_));
            } else {
                buffer = grad.mul(penalty_);
            }

            WeightDecayState next;
            next.buffer(buffer);
            return {buffer, std::move(next)};
        }

        // Coupled policy: grad + penalty * tensor. Keeps no state.
        [[nodiscard]] torch::Tensor transform_coupled(const torch::Tensor& grad, const torch::Tensor& tensor) const {
            return grad.add(tensor.mul(penalty_));
        }

    private:
        double penalty_;
        double decay_rate_;
    };

}

#endif // NABLA_WEIGHT_DECAY_HPP
