#ifndef NABLA_OPTIMIZER_REGISTRY_HPP
#define NABLA_OPTIMIZER_REGISTRY_HPP


#include <memory>
#include <variant>

#include "optimizer.hpp"

namespace Nabla::Optimizer {
    namespace Details {
        template <class Optim, class Options>
        OptimizerAdaptor<Optim> make_adaptor(const Options& options) {
            OptimizerAdaptor<Optim> adaptor{Optim(options)};
            if (options.grad_clipping) {
                adaptor.with_grad_clipping(GradientClipping(*options.grad_clipping));
            }
            return adaptor;
        }
    }

    // Typed adaptors, for callers that need to_record()/load_record().
    [[nodiscard]] inline OptimizerAdaptor<AdamOptimizer> init(const AdamDescriptor& descriptor) {
        return Details::make_adaptor<AdamOptimizer>(descriptor.options);
    }

    [[nodiscard]] inline OptimizerAdaptor<RMSPropOptimizer> init(const RMSPropDescriptor& descriptor) {
        return Details::make_adaptor<RMSPropOptimizer>(descriptor.options);
    }

    [[nodiscard]] inline std::unique_ptr<ModuleOptimizer> build_optimizer(const Descriptor& descriptor) {
        return std::visit(
            [](const auto& concrete_descriptor) -> std::unique_ptr<ModuleOptimizer> {
                using AdaptorType = decltype(init(concrete_descriptor));
                return std::make_unique<AdaptorType>(init(concrete_descriptor));
            },
            descriptor);
    }
}

#endif // NABLA_OPTIMIZER_REGISTRY_HPP
