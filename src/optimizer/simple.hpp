#ifndef NABLA_OPTIMIZER_SIMPLE_HPP
#define NABLA_OPTIMIZER_SIMPLE_HPP
// Per-parameter optimizer contract.
// -----------------------------------------------------------------------------
// A simple optimizer owns only its (immutable) configuration. Every call to
// `step` receives the parameter value, its gradient and the state produced by
// the previous call for that parameter, and returns the new value and the new
// state. Nothing is modified in place, so the previous state can be dropped
// by the caller without affecting the result.
//
// Required members for an optimizer type `O`:
//   using State = ...;
//   StepOutput<State> step(double lr, const Tensor&, const Tensor&, std::optional<State>) const;
//   static State to_device(State, const torch::Device&);
//   State initial_state(const Tensor&) const;
//   void validate(const State&) const;
//   void validate(const State&, const Tensor&) const;

#include <concepts>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../utils/check.hpp"

namespace Nabla::Optimizer {

    template <class State>
    struct StepOutput {
        torch::Tensor tensor{};
        State state{};
    };

    template <class Optim>
    concept SimpleOptimizer = requires(const Optim& optim,
                                       double learning_rate,
                                       const torch::Tensor& tensor,
                                       std::optional<typename Optim::State> state,
                                       const typename Optim::State& recorded,
                                       const torch::Device& device) {
        typename Optim::State;
        { optim.step(learning_rate, tensor, tensor, std::move(state)) }
            -> std::same_as<StepOutput<typename Optim::State>>;
        { Optim::to_device(typename Optim::State{}, device) } -> std::same_as<typename Optim::State>;
        { optim.initial_state(tensor) } -> std::same_as<typename Optim::State>;
        optim.validate(recorded);
        optim.validate(recorded, tensor);
    };

    namespace Details {
        inline void require_step_inputs(double learning_rate,
                                        const torch::Tensor& tensor,
                                        const torch::Tensor& grad,
                                        const std::string& context)
        {
            if (!(learning_rate >= 0.0)) {
                throw std::invalid_argument(context + " requires a non-negative learning rate, got "
                                            + std::to_string(learning_rate) + ".");
            }
            Utils::require_same_shape(tensor, grad, context + " gradient");
        }

        // Final stage shared by every optimizer: plain scaled subtraction.
        [[nodiscard]] inline torch::Tensor apply_update(const torch::Tensor& tensor,
                                                        const torch::Tensor& update,
                                                        double learning_rate)
        {
            return tensor.sub(update.mul(learning_rate));
        }

        [[nodiscard]] inline torch::Tensor relocate(const torch::Tensor& tensor, const torch::Device& device)
        {
            if (!tensor.defined()) {
                return tensor;
            }
            return tensor.to(device);
        }
    }
}

#endif // NABLA_OPTIMIZER_SIMPLE_HPP
