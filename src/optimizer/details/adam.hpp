#ifndef NABLA_ADAM_HPP
#define NABLA_ADAM_HPP
// "Adam: A Method for Stochastic Optimization" https://arxiv.org/pdf/1412.6980
#include <cmath>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>
#include <torch/optim/serialize.h>

#include "../simple.hpp"
#include "clipping.hpp"
#include "decay.hpp"

namespace Nabla::Optimizer::Details {

    struct AdamOptions {
        double beta1{0.9};
        double beta2{0.999};
        double epsilon{1e-5};
        std::optional<WeightDecayOptions> weight_decay{};
        std::optional<GradientClippingOptions> grad_clipping{};
    };

    struct AdamDescriptor {
        AdamOptions options{};
    };

    struct AdaptiveMomentumState {
        TORCH_ARG(int64_t, step_count) = 0;
        TORCH_ARG(torch::Tensor, moment_1);
        TORCH_ARG(torch::Tensor, moment_2);

    public:
        void serialize(torch::serialize::InputArchive& archive) {
            _TORCH_OPTIM_DESERIALIZE_TORCH_ARG(int64_t, step_count);
            _TORCH_OPTIM_DESERIALIZE_TORCH_ARG(torch::Tensor, moment_1);
            _TORCH_OPTIM_DESERIALIZE_TORCH_ARG(torch::Tensor, moment_2);
        }

        void serialize(torch::serialize::OutputArchive& archive) const {
            _TORCH_OPTIM_SERIALIZE_TORCH_ARG(step_count);
            _TORCH_OPTIM_SERIALIZE_TORCH_ARG(moment_1);
            _TORCH_OPTIM_SERIALIZE_TORCH_ARG(moment_2);
        }

        [[nodiscard]] AdaptiveMomentumState to(const torch::Device& device) const {
            AdaptiveMomentumState moved;
            moved.step_count(step_count());
            moved.moment_1(relocate(moment_1(), device));
            moved.moment_2(relocate(moment_2(), device));
            return moved;
        }
    };

    class AdaptiveMomentum {
    public:
        AdaptiveMomentum(double beta1, double beta2, double epsilon)
            : beta1_(beta1), beta2_(beta2), epsilon_(epsilon) {}

        [[nodiscard]] std::pair<torch::Tensor, AdaptiveMomentumState>
        transform(const torch::Tensor& grad, std::optional<AdaptiveMomentumState> state) const {
            AdaptiveMomentumState next;
            if (state) {
                Utils::require_same_shape(grad, state->moment_1(), "Adam first moment");
                Utils::require_same_shape(grad, state->moment_2(), "Adam second moment");
                next.moment_1(state->moment_1().mul(beta1_).add(grad.mul(1.0 - beta1_)));
                next.moment_2(state->moment_2().mul(beta2_).add(grad.pow(2).mul(1.0 - beta2_)));
                next.step_count(state->step_count() + 1);
            } else {
                next.moment_1(grad.mul(1.0 - beta1_));
                next.moment_2(grad.pow(2).mul(1.0 - beta2_));
                next.step_count(1);
            }

            const auto time = static_cast<double>(next.step_count());
            auto moment_1_corrected = next.moment_1().div(1.0 - std::pow(beta1_, time));
            auto moment_2_corrected = next.moment_2().div(1.0 - std::pow(beta2_, time));

            auto update = moment_1_corrected.div(moment_2_corrected.sqrt().add(epsilon_));
            return {std::move(update), std::move(next)};
        }

    private:
        double beta1_;
        double beta2_;
        double epsilon_;
    };

    struct AdamState {
        TORCH_ARG(std::optional<WeightDecayState>, weight_decay);
        TORCH_ARG(AdaptiveMomentumState, momentum);

    public:
        void serialize(torch::serialize::InputArchive& archive) {
            std::optional<WeightDecayState> decay{};
            torch::serialize::InputArchive decay_archive;
            if (archive.try_read("weight_decay", decay_archive)) {
                WeightDecayState loaded;
                loaded.serialize(decay_archive);
                decay = std::move(loaded);
            }
            weight_decay(std::move(decay));

            torch::serialize::InputArchive momentum_archive;
            archive.read("momentum", momentum_archive);
            AdaptiveMomentumState loaded;
            loaded.serialize(momentum_archive);
            momentum(std::move(loaded));
        }

        void serialize(torch::serialize::OutputArchive& archive) const {
            if (weight_decay()) {
                torch::serialize::OutputArchive decay_archive(archive.compilation_unit());
                weight_decay()->serialize(decay_archive);
                archive.write("weight_decay", decay_archive);
            }

            torch::serialize::OutputArchive momentum_archive(archive.compilation_unit());
            momentum().serialize(momentum_archive);
            archive.write("momentum", momentum_archive);
        }
    };

    class Adam {
    public:
        using Options = AdamOptions;
        using State = AdamState;

        explicit Adam(Options options = {})
            : options_(validated(std::move(options))),
              momentum_(options_.beta1, options_.beta2, options_.epsilon) {
            if (options_.weight_decay) {
                weight_decay_.emplace(*options_.weight_decay);
            }
        }

        [[nodiscard]] const Options& options() const noexcept { return options_; }

        [[nodiscard]] StepOutput<State> step(double learning_rate,
                                             const torch::Tensor& tensor,
                                             const torch::Tensor& grad,
                                             std::optional<State> state) const {
            require_step_inputs(learning_rate, tensor, grad, "Adam::step");

            std::optional<WeightDecayState> decay_state{};
            std::optional<AdaptiveMomentumState> momentum_state{};
            if (state) {
                validate(*state, tensor);
                decay_state = std::move(state->weight_decay());
                momentum_state = std::move(state->momentum());
            }

            auto adapted = grad;
            if (weight_decay_) {
                auto [decayed, next_decay] = weight_decay_->transform(adapted, std::move(decay_state));
                adapted = std::move(decayed);
                decay_state = std::move(next_decay);
            }

            auto [update, next_momentum] = momentum_.transform(adapted, std::move(momentum_state));

            State next;
            next.weight_decay(std::move(decay_state));
            next.momentum(std::move(next_momentum));
            return {apply_update(tensor, update, learning_rate), std::move(next)};
        }

        [[nodiscard]] static State to_device(State state, const torch::Device& device) {
            State moved;
            if (state.weight_decay()) {
                moved.weight_decay(std::optional<WeightDecayState>{state.weight_decay()->to(device)});
            }
            moved.momentum(state.momentum().to(device));
            return moved;
        }

        // Zero state equivalent to "never stepped" for a parameter of this shape.
        [[nodiscard]] State initial_state(const torch::Tensor& tensor) const {
            State state;
            if (weight_decay_) {
                WeightDecayState decay;
                decay.buffer(torch::zeros_like(tensor));
                state.weight_decay(std::optional<WeightDecayState>{std::move(decay)});
            }
            AdaptiveMomentumState momentum;
            momentum.step_count(0);
            momentum.moment_1(torch::zeros_like(tensor));
            momentum.moment_2(torch::zeros_like(tensor));
            state.momentum(std::move(momentum));
            return state;
        }

        void validate(const State& state) const {
            if (weight_decay_.has_value() != state.weight_decay().has_value()) {
                throw std::runtime_error(std::string("Adam state ")
                                         + (state.weight_decay() ? "carries" : "lacks")
                                         + " a weight decay buffer but the optimizer is configured "
                                         + (weight_decay_ ? "with" : "without") + " weight decay.");
            }
            if (state.weight_decay() && !state.weight_decay()->buffer().defined()) {
                throw std::runtime_error("Adam state has an undefined weight decay buffer.");
            }
            const auto& momentum = state.momentum();
            if (!momentum.moment_1().defined() || !momentum.moment_2().defined()) {
                throw std::runtime_error("Adam state is missing its moment estimates.");
            }
            if (momentum.step_count() < 0) {
                throw std::runtime_error("Adam state has a negative step count.");
            }
        }

        void validate(const State& state, const torch::Tensor& tensor) const {
            validate(state);
            if (state.weight_decay()) {
                Utils::require_same_shape(tensor, state.weight_decay()->buffer(), "Adam weight decay buffer");
            }
            Utils::require_same_shape(tensor, state.momentum().moment_1(), "Adam first moment");
            Utils::require_same_shape(tensor, state.momentum().moment_2(), "Adam second moment");
        }

    private:
        static Options validated(Options options) {
            if (!(options.beta1 >= 0.0 && options.beta1 < 1.0)) {
                throw std::invalid_argument("Adam beta1 must be within [0, 1).");
            }
            if (!(options.beta2 >= 0.0 && options.beta2 < 1.0)) {
                throw std::invalid_argument("Adam beta2 must be within [0, 1).");
            }
            if (!(options.epsilon > 0.0)) {
                throw std::invalid_argument("Adam epsilon must be strictly positive.");
            }
            return options;
        }

        Options options_;
        AdaptiveMomentum momentum_;
        std::optional<WeightDecay> weight_decay_{};
    };

    static_assert(SimpleOptimizer<Adam>);

}

#endif // NABLA_ADAM_HPP
