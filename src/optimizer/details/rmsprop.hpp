#ifndef NABLA_RMSPROP_HPP
#define NABLA_RMSPROP_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>

#include <torch/torch.h>
#include <torch/optim/serialize.h>

#include "../simple.hpp"
#include "clipping.hpp"
#include "decay.hpp"

namespace Nabla::Optimizer::Details {

    struct RMSPropOptions {
        double alpha{0.99};
        double momentum{0.9};
        double epsilon{1e-5};
        bool centered{false};
        std::optional<WeightDecayOptions> weight_decay{};
        std::optional<GradientClippingOptions> grad_clipping{};
    };

    struct RMSPropDescriptor {
        RMSPropOptions options{};
    };

    struct SquareAvgState {
        TORCH_ARG(torch::Tensor, square_avg);

    public:
        void serialize(torch::serialize::InputArchive& archive) {
            _TORCH_OPTIM_DESERIALIZE_TORCH_ARG(torch::Tensor, square_avg);
        }

        void serialize(torch::serialize::OutputArchive& archive) const {
            _TORCH_OPTIM_SERIALIZE_TORCH_ARG(square_avg);
        }

        // square_avg = alpha * square_avg + (1 - alpha) * grad^2
        [[nodiscard]] static SquareAvgState transform(double alpha,
                                                      const torch::Tensor& grad,
                                                      std::optional<SquareAvgState> state) {
            auto squared = grad.pow(2).mul(1.0 - alpha);
            SquareAvgState next;
            if (state) {
                Utils::require_same_shape(grad, state->square_avg(), "RMSProp square average");
                next.square_avg(state->square_avg().mul(alpha).add(squared));
            } else {
                next.square_avg(std::move(squared));
            }
            return next;
        }
    };

    struct CenteredState {
        TORCH_ARG(std::optional<torch::Tensor>, grad_avg);
        TORCH_ARG(torch::Tensor, avg);

    public:
        void serialize(torch::serialize::InputArchive& archive) {
            std::optional<torch::Tensor> loaded{};
            c10::IValue ivalue;
            if (archive.try_read("grad_avg", ivalue)) {
                loaded = ivalue.toTensor();
            }
            grad_avg(std::move(loaded));
            _TORCH_OPTIM_DESERIALIZE_TORCH_ARG(torch::Tensor, avg);
        }

        void serialize(torch::serialize::OutputArchive& archive) const {
            if (grad_avg()) {
                archive.write("grad_avg", c10::IValue(*grad_avg()));
            }
            _TORCH_OPTIM_SERIALIZE_TORCH_ARG(avg);
        }

        // Without centering the variance estimate is the square average itself
        // and no running gradient mean is kept.
        [[nodiscard]] static CenteredState transform(double alpha,
                                                     bool centered,
                                                     const torch::Tensor& grad,
                                                     const SquareAvgState& square_avg_state,
                                                     std::optional<CenteredState> state) {
            CenteredState next;
            if (!centered) {
                next.avg(square_avg_state.square_avg());
                return next;
            }

            auto grad_avg_constant = grad.mul(1.0 - alpha);
            torch::Tensor grad_avg;
            if (state && state->grad_avg()) {
                Utils::require_same_shape(grad, *state->grad_avg(), "RMSProp gradient average");
                grad_avg = state->grad_avg()->mul(alpha).add(grad_avg_constant);
            } else {
                grad_avg = std::move(grad_avg_constant);
            }

            next.avg(square_avg_state.square_avg().sub(grad_avg.pow(2)));
            next.grad_avg(std::optional<torch::Tensor>{std::move(grad_avg)});
            return next;
        }
    };

    struct RMSPropMomentumState {
        TORCH_ARG(torch::Tensor, buffer);

    public:
        void serialize(torch::serialize::InputArchive& archive) {
            _TORCH_OPTIM_DESERIALIZE_TORCH_ARG(torch::Tensor, buffer);
        }

        void serialize(torch::serialize::OutputArchive& archive) const {
            _TORCH_OPTIM_SERIALIZE_TORCH_ARG(buffer);
        }
    };

    class RMSPropMomentum {
    public:
        RMSPropMomentum(double momentum, double epsilon) : momentum_(momentum), epsilon_(epsilon) {}

        [[nodiscard]] double momentum() const noexcept { return momentum_; }

        // Normalises the gradient by sqrt(avg) and, when momentum is enabled,
        // accumulates it into the buffer which then becomes the update.
        [[nodiscard]] std::pair<torch::Tensor, std::optional<RMSPropMomentumState>>
        transform(const torch::Tensor& grad,
                  const CenteredState& centered_state,
                  std::optional<RMSPropMomentumState> state) const {
            auto normalized = grad.div(centered_state.avg().sqrt().add(epsilon_));
            if (!(momentum_ > 0.0)) {
                return {std::move(normalized), std::nullopt};
            }

            torch::Tensor buffer;
            if (state) {
                Utils::require_same_shape(grad, state->buffer(), "RMSProp momentum buffer");
                buffer = state->buffer().mul(momentum_).add(normalized);
            } else {
                buffer = std::move(normalized);
            }

            RMSPropMomentumState next;
            next.buffer(buffer);
            return {std::move(buffer), std::optional<RMSPropMomentumState>{std::move(next)}};
        }

    private:
        double momentum_;
        double epsilon_;
    };

    struct RMSPropState {
        TORCH_ARG(SquareAvgState, square_avg);
        TORCH_ARG(CenteredState, centered);
        TORCH_ARG(std::optional<RMSPropMomentumState>, momentum);

    public:
        void serialize(torch::serialize::InputArchive& archive) {
            torch::serialize::InputArchive square_avg_archive;
            archive.read("square_avg", square_avg_archive);
            SquareAvgState loaded_square_avg;
            loaded_square_avg.serialize(square_avg_archive);
            square_avg(std::move(loaded_square_avg));

            torch::serialize::InputArchive centered_archive;
            archive.read("centered", centered_archive);
            CenteredState loaded_centered;
            loaded_centered.serialize(centered_archive);
            centered(std::move(loaded_centered));

            std::optional<RMSPropMomentumState> loaded_momentum{};
            torch::serialize::InputArchive momentum_archive;
            if (archive.try_read("momentum", momentum_archive)) {
                RMSPropMomentumState loaded;
                loaded.serialize(momentum_archive);
                loaded_momentum = std::move(loaded);
            }
            momentum(std::move(loaded_momentum));
        }

        void serialize(torch::serialize::OutputArchive& archive) const {
            torch::serialize::OutputArchive square_avg_archive(archive.compilation_unit());
            square_avg().serialize(square_avg_archive);
            archive.write("square_avg", square_avg_archive);

            torch::serialize::OutputArchive centered_archive(archive.compilation_unit());
            centered().serialize(centered_archive);
            archive.write("centered", centered_archive);

            if (momentum()) {
                torch::serialize::OutputArchive momentum_archive(archive.compilation_unit());
                momentum()->serialize(momentum_archive);
                archive.write("momentum", momentum_archive);
            }
        }
    };

    class RMSProp {
    public:
        using Options = RMSPropOptions;
        using State = RMSPropState;

        explicit RMSProp(Options options = {})
            : options_(validated(std::move(options))),
              momentum_(options_.momentum, options_.epsilon) {
            if (options_.weight_decay) {
                weight_decay_.emplace(*options_.weight_decay);
            }
        }

        [[nodiscard]] const Options& options() const noexcept { return options_; }

        [[nodiscard]] StepOutput<State> step(double learning_rate,
                                             const torch::Tensor& tensor,
                                             const torch::Tensor& grad,
                                             std::optional<State> state) const {
            require_step_inputs(learning_rate, tensor, grad, "RMSProp::step");

            std::optional<SquareAvgState> square_avg_state{};
            std::optional<CenteredState> centered_state{};
            std::optional<RMSPropMomentumState> momentum_state{};
            if (state) {
                validate(*state, tensor);
                square_avg_state = std::move(state->square_avg());
                centered_state = std::move(state->centered());
                momentum_state = std::move(state->momentum());
            }

            // Coupled penalty, stateless. Shares the option name with Adam's
            // accumulator policy but not its semantics.
            auto adapted = grad;
            if (weight_decay_) {
                adapted = weight_decay_->transform_coupled(adapted, tensor);
            }

            auto next_square_avg = SquareAvgState::transform(options_.alpha, adapted, std::move(square_avg_state));
            auto next_centered = CenteredState::transform(options_.alpha,
                                                          options_.centered,
                                                          adapted,
                                                          next_square_avg,
                                                          std::move(centered_state));
            auto [update, next_momentum] = momentum_.transform(adapted, next_centered, std::move(momentum_state));

            State next;
            next.square_avg(std::move(next_square_avg));
            next.centered(std::move(next_centered));
            next.momentum(std::move(next_momentum));
            return {apply_update(tensor, update, learning_rate), std::move(next)};
        }

        [[nodiscard]] static State to_device(State state, const torch::Device& device) {
            State moved;

            SquareAvgState square_avg;
            square_avg.square_avg(relocate(state.square_avg().square_avg(), device));
            moved.square_avg(std::move(square_avg));

            CenteredState centered;
            if (state.centered().grad_avg()) {
                centered.grad_avg(std::optional<torch::Tensor>{relocate(*state.centered().grad_avg(), device)});
            }
            centered.avg(relocate(state.centered().avg(), device));
            moved.centered(std::move(centered));

            if (state.momentum()) {
                RMSPropMomentumState momentum;
                momentum.buffer(relocate(state.momentum()->buffer(), device));
                moved.momentum(std::optional<RMSPropMomentumState>{std::move(momentum)});
            }
            return moved;
        }

        [[nodiscard]] State initial_state(const torch::Tensor& tensor) const {
            State state;

            SquareAvgState square_avg;
            square_avg.square_avg(torch::zeros_like(tensor));
            state.square_avg(std::move(square_avg));

            CenteredState centered;
            if (options_.centered) {
                centered.grad_avg(std::optional<torch::Tensor>{torch::zeros_like(tensor)});
            }
            centered.avg(torch::zeros_like(tensor));
            state.centered(std::move(centered));

            if (momentum_.momentum() > 0.0) {
                RMSPropMomentumState momentum;
                momentum.buffer(torch::zeros_like(tensor));
                state.momentum(std::optional<RMSPropMomentumState>{std::move(momentum)});
            }
            return state;
        }

        // A persisted `avg` means square_avg - grad_avg^2 only for centered
        // optimizers, so the grad_avg slot has to agree with the configuration.
        void validate(const State& state) const {
            const bool has_grad_avg = state.centered().grad_avg().has_value();
            if (has_grad_avg != options_.centered) {
                throw std::runtime_error(std::string("RMSProp state was recorded with centered=")
                                         + (has_grad_avg ? "true" : "false")
                                         + " but the optimizer is configured with centered="
                                         + (options_.centered ? "true" : "false") + ".");
            }

            const bool expects_momentum = momentum_.momentum() > 0.0;
            if (state.momentum().has_value() != expects_momentum) {
                throw std::runtime_error(std::string("RMSProp state ")
                                         + (state.momentum() ? "carries" : "lacks")
                                         + " a momentum buffer but the optimizer momentum is "
                                         + std::to_string(momentum_.momentum()) + ".");
            }

            if (!state.square_avg().square_avg().defined() || !state.centered().avg().defined()) {
                throw std::runtime_error("RMSProp state is missing its square average.");
            }
            if (has_grad_avg && !state.centered().grad_avg()->defined()) {
                throw std::runtime_error("RMSProp state has an undefined gradient average.");
            }
            if (state.momentum() && !state.momentum()->buffer().defined()) {
                throw std::runtime_error("RMSProp state has an undefined momentum buffer.");
            }
        }

        void validate(const State& state, const torch::Tensor& tensor) const {
            validate(state);
            Utils::require_same_shape(tensor, state.square_avg().square_avg(), "RMSProp square average");
            Utils::require_same_shape(tensor, state.centered().avg(), "RMSProp average");
            if (state.centered().grad_avg()) {
                Utils::require_same_shape(tensor, *state.centered().grad_avg(), "RMSProp gradient average");
            }
            if (state.momentum()) {
                Utils::require_same_shape(tensor, state.momentum()->buffer(), "RMSProp momentum buffer");
            }
        }

    private:
        static Options validated(Options options) {
            if (!(options.alpha >= 0.0 && options.alpha <= 1.0)) {
                throw std::invalid_argument("RMSProp alpha must be within [0, 1].");
            }
            if (!(options.momentum >= 0.0)) {
                throw std::invalid_argument("RMSProp momentum must be non-negative.");
            }
            if (!(options.epsilon > 0.0)) {
                throw std::invalid_argument("RMSProp epsilon must be strictly positive.");
            }
            return options;
        }

        Options options_;
        RMSPropMomentum momentum_;
        std::optional<WeightDecay> weight_decay_{};
    };

    static_assert(SimpleOptimizer<RMSProp>);

}

#endif // NABLA_RMSPROP_HPP
