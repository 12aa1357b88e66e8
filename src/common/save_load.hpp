#ifndef NABLA_COMMON_SAVE_LOAD_HPP
#define NABLA_COMMON_SAVE_LOAD_HPP
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "../optimizer/optimizer.hpp"
#include "../optimizer/registry.hpp"

namespace Nabla::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;

    inline constexpr const char* kDescriptorFile = "optimizer.json";
    inline constexpr const char* kStateFile = "state.binary";

    namespace Detail {
        inline std::string to_lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char character) {
                return static_cast<char>(std::tolower(character));
            });
            return value;
        }

        template <class Numeric>
        Numeric get_numeric(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            static_assert(std::is_arithmetic_v<Numeric>, "Numeric type required for property tree extraction.");
            const auto value = tree.get_optional<Numeric>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing numeric field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        inline bool get_boolean(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto value = tree.get_optional<bool>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing boolean field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        inline std::string get_string(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto value = tree.get_optional<std::string>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing string field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        inline PropertyTree serialize_weight_decay(const Optimizer::WeightDecayOptions& options)
        {
            PropertyTree tree;
            tree.put("penalty", options.penalty);
            if (options.decay_rate) {
                tree.put("decay_rate", *options.decay_rate);
            }
            return tree;
        }

        inline Optimizer::WeightDecayOptions deserialize_weight_decay(const PropertyTree& tree, const std::string& context)
        {
            Optimizer::WeightDecayOptions options;
            options.penalty = get_numeric<double>(tree, "penalty", context + " weight_decay");
            if (auto decay_rate = tree.get_optional<double>("decay_rate")) {
                options.decay_rate = *decay_rate;
            }
            return options;
        }

        inline PropertyTree serialize_grad_clipping(const Optimizer::GradientClippingOptions& options)
        {
            PropertyTree tree;
            tree.put("mode", Optimizer::Details::to_string(options.mode));
            tree.put("threshold", options.threshold);
            return tree;
        }

        inline Optimizer::GradientClippingOptions deserialize_grad_clipping(const PropertyTree& tree,
                                                                            const std::string& context)
        {
            Optimizer::GradientClippingOptions options;
            const auto mode = to_lower(get_string(tree, "mode", context + " grad_clipping"));
            if (mode == "value") {
                options.mode = Optimizer::GradientClippingMode::Value;
            } else if (mode == "norm") {
                options.mode = Optimizer::GradientClippingMode::Norm;
            } else {
                std::ostringstream message;
                message << "Unknown gradient clipping mode '" << mode << "' in " << context;
                throw std::runtime_error(message.str());
            }
            options.threshold = get_numeric<double>(tree, "threshold", context + " grad_clipping");
            return options;
        }

        template <class Options>
        void write_shared_options(PropertyTree& tree, const Options& options)
        {
            if (options.weight_decay) {
                tree.add_child("weight_decay", serialize_weight_decay(*options.weight_decay));
            }
            if (options.grad_clipping) {
                tree.add_child("grad_clipping", serialize_grad_clipping(*options.grad_clipping));
            }
        }

        template <class Options>
        void read_shared_options(const PropertyTree& tree, Options& options, const std::string& context)
        {
            if (auto decay = tree.get_child_optional("weight_decay")) {
                options.weight_decay = deserialize_weight_decay(*decay, context);
            }
            if (auto clipping = tree.get_child_optional("grad_clipping")) {
                options.grad_clipping = deserialize_grad_clipping(*clipping, context);
            }
        }
    }

    inline PropertyTree serialize_optimizer_descriptor(const Optimizer::Descriptor& descriptor)
    {
        return std::visit(
            [](const auto& concrete_descriptor) {
                using DescriptorType = std::decay_t<decltype(concrete_descriptor)>;
                const auto& options = concrete_descriptor.options;
                PropertyTree tree;
                if constexpr (std::is_same_v<DescriptorType, Optimizer::AdamDescriptor>) {
                    tree.put("type", "adam");
                    tree.put("beta1", options.beta1);
                    tree.put("beta2", options.beta2);
                    tree.put("epsilon", options.epsilon);
                } else if constexpr (std::is_same_v<DescriptorType, Optimizer::RMSPropDescriptor>) {
                    tree.put("type", "rmsprop");
                    tree.put("alpha", options.alpha);
                    tree.put("momentum", options.momentum);
                    tree.put("epsilon", options.epsilon);
                    tree.put("centered", options.centered);
                } else {
                    static_assert(sizeof(DescriptorType) == 0, "Unsupported optimizer descriptor.");
                }
                Detail::write_shared_options(tree, options);
                return tree;
            },
            descriptor);
    }

    inline Optimizer::Descriptor deserialize_optimizer_descriptor(const PropertyTree& tree, const std::string& context)
    {
        const auto type = Detail::to_lower(Detail::get_string(tree, "type", context));
        if (type == "adam") {
            Optimizer::AdamOptions options;
            options.beta1 = Detail::get_numeric<double>(tree, "beta1", context);
            options.beta2 = Detail::get_numeric<double>(tree, "beta2", context);
            options.epsilon = Detail::get_numeric<double>(tree, "epsilon", context);
            Detail::read_shared_options(tree, options, context);
            return Optimizer::Adam(options);
        }
        if (type == "rmsprop") {
            Optimizer::RMSPropOptions options;
            options.alpha = Detail::get_numeric<double>(tree, "alpha", context);
            options.momentum = Detail::get_numeric<double>(tree, "momentum", context);
            options.epsilon = Detail::get_numeric<double>(tree, "epsilon", context);
            options.centered = Detail::get_boolean(tree, "centered", context);
            Detail::read_shared_options(tree, options, context);
            return Optimizer::RMSProp(options);
        }

        std::ostringstream message;
        message << "Unknown optimizer type '" << type << "' in " << context;
        throw std::runtime_error(message.str());
    }

    inline void write_json_file(const std::filesystem::path& path, const PropertyTree& tree)
    {
        boost::property_tree::write_json(path.string(), tree);
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        PropertyTree tree;
        boost::property_tree::read_json(path.string(), tree);
        return tree;
    }

    struct OptimizerCheckpoint {
        Optimizer::Descriptor descriptor{};
        std::unique_ptr<Optimizer::ModuleOptimizer> optimizer{};
    };

    inline void save_checkpoint(const std::filesystem::path& directory,
                                const Optimizer::Descriptor& descriptor,
                                const Optimizer::ModuleOptimizer& optimizer)
    {
        namespace fs = std::filesystem;
        if (directory.empty()) {
            throw std::invalid_argument("save_checkpoint requires a non-empty directory path.");
        }
        fs::create_directories(directory);

        const auto descriptor_path = directory / kDescriptorFile;
        const auto state_path = directory / kStateFile;

        try {
            write_json_file(descriptor_path, serialize_optimizer_descriptor(descriptor));
        } catch (const std::exception& error) {
            throw std::runtime_error(std::string("Failed to write optimizer description to '")
                                     + descriptor_path.string() + "': " + error.what());
        }

        try {
            optimizer.save(state_path);
        } catch (const c10::Error& error) {
            throw std::runtime_error(std::string("Failed to write optimizer state to '")
                                     + state_path.string() + "': " + error.what());
        }
    }

    inline OptimizerCheckpoint load_checkpoint(const std::filesystem::path& directory)
    {
        namespace fs = std::filesystem;
        if (directory.empty()) {
            throw std::invalid_argument("load_checkpoint requires a non-empty directory path.");
        }

        const auto descriptor_path = directory / kDescriptorFile;
        const auto state_path = directory / kStateFile;
        if (!fs::exists(descriptor_path)) {
            throw std::runtime_error(std::string("Optimizer description not found at '")
                                     + descriptor_path.string() + "'.");
        }
        if (!fs::exists(state_path)) {
            throw std::runtime_error(std::string("Optimizer state not found at '") + state_path.string() + "'.");
        }

        PropertyTree tree;
        try {
            tree = read_json_file(descriptor_path);
        } catch (const std::exception& error) {
            throw std::runtime_error(std::string("Failed to read optimizer description from '")
                                     + descriptor_path.string() + "': " + error.what());
        }

        OptimizerCheckpoint checkpoint;
        checkpoint.descriptor = deserialize_optimizer_descriptor(tree, "optimizer");
        checkpoint.optimizer = Optimizer::build_optimizer(checkpoint.descriptor);
        checkpoint.optimizer->load(state_path);
        return checkpoint;
    }
}

#endif // NABLA_COMMON_SAVE_LOAD_HPP
