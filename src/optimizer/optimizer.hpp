#ifndef NABLA_OPTIMIZER_HPP
#define NABLA_OPTIMIZER_HPP
// This file is a factory, keep it free of update logic. Algorithms live under "/details".
#include <variant>

#include "simple.hpp"
#include "gradients.hpp"
#include "adaptor.hpp"

#include "details/adam.hpp"
#include "details/clipping.hpp"
#include "details/decay.hpp"
#include "details/rmsprop.hpp"


namespace Nabla::Optimizer {
    using WeightDecayOptions = Details::WeightDecayOptions;
    using WeightDecayState = Details::WeightDecayState;
    using WeightDecay = Details::WeightDecay;

    using GradientClippingMode = Details::GradientClippingMode;
    using GradientClippingOptions = Details::GradientClippingOptions;
    using GradientClipping = Details::GradientClipping;

    using AdamOptions = Details::AdamOptions;
    using AdamDescriptor = Details::AdamDescriptor;
    using AdamState = Details::AdamState;
    using AdaptiveMomentumState = Details::AdaptiveMomentumState;
    using AdamOptimizer = Details::Adam;

    using RMSPropOptions = Details::RMSPropOptions;
    using RMSPropDescriptor = Details::RMSPropDescriptor;
    using RMSPropState = Details::RMSPropState;
    using SquareAvgState = Details::SquareAvgState;
    using CenteredState = Details::CenteredState;
    using RMSPropMomentumState = Details::RMSPropMomentumState;
    using RMSPropOptimizer = Details::RMSProp;


    using Descriptor = std::variant<AdamDescriptor,
                                    RMSPropDescriptor>;


    [[nodiscard]] constexpr auto Adam(const AdamOptions& options = {}) noexcept -> AdamDescriptor {
        return AdamDescriptor{.options = options};
    }

    [[nodiscard]] constexpr auto RMSProp(const RMSPropOptions& options = {}) noexcept -> RMSPropDescriptor {
        return RMSPropDescriptor{.options = options};
    }

}

#endif //NABLA_OPTIMIZER_HPP
