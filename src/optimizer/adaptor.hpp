#ifndef NABLA_OPTIMIZER_ADAPTOR_HPP
#define NABLA_OPTIMIZER_ADAPTOR_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "details/clipping.hpp"
#include "gradients.hpp"
#include "simple.hpp"

namespace Nabla::Optimizer {

    // Runtime handle over a whole module, independent of the algorithm.
    class ModuleOptimizer {
    public:
        virtual ~ModuleOptimizer() = default;

        virtual torch::nn::Module& step(double learning_rate, torch::nn::Module& module, GradientsParams gradients) = 0;
        virtual void to_device(const torch::Device& device) = 0;

        virtual void save(torch::serialize::OutputArchive& archive) const = 0;
        virtual void load(torch::serialize::InputArchive& archive) = 0;

        [[nodiscard]] virtual std::size_t size() const noexcept = 0;

        void save(const std::filesystem::path& path) const {
            torch::serialize::OutputArchive archive;
            save(archive);
            archive.save_to(path.string());
        }

        void load(const std::filesystem::path& path) {
            torch::serialize::InputArchive archive;
            try {
                archive.load_from(path.string());
            } catch (const c10::Error& error) {
                throw std::runtime_error("Failed to open optimizer state archive '" + path.string() + "': " + error.what());
            }
            load(archive);
        }
    };

    template <class Optim>
    class OptimizerAdaptor final : public ModuleOptimizer {
        static_assert(SimpleOptimizer<Optim>, "OptimizerAdaptor requires a per-parameter optimizer.");

    public:
        using State = typename Optim::State;
        using Record = std::map<std::string, State>;

        explicit OptimizerAdaptor(Optim optimizer) : optimizer_(std::move(optimizer)) {}

        OptimizerAdaptor& with_grad_clipping(Details::GradientClipping clipping) {
            grad_clipping_.emplace(std::move(clipping));
            return *this;
        }

        [[nodiscard]] const Optim& optimizer() const noexcept { return optimizer_; }

        torch::nn::Module& step(double learning_rate, torch::nn::Module& module, GradientsParams gradients) override {
            if (!(learning_rate >= 0.0)) {
                throw std::invalid_argument("Optimizer step requires a non-negative learning rate.");
            }

            if (grad_clipping_) {
                gradients.transform([this](const torch::Tensor& gradient) { return grad_clipping_->clip(gradient); });
            }

            torch::NoGradGuard no_grad;
            // Nothing is committed until every parameter has stepped.
            std::vector<std::tuple<std::string, torch::Tensor, StepOutput<State>>> pending;
            for (auto& item : module.named_parameters(/*recurse=*/true)) {
                auto gradient = gradients.remove(item.key());
                if (!gradient) {
                    continue;
                }

                auto& parameter = item.value();
                const auto device = parameter.device();
                auto grad = gradient->detach();
                if (grad.device() != device) {
                    grad = grad.to(device);
                }

                std::optional<State> previous{};
                if (auto it = records_.find(item.key()); it != records_.end()) {
                    previous = Optim::to_device(it->second, device);
                }

                auto output = optimizer_.step(learning_rate, parameter.detach(), grad, std::move(previous));
                pending.emplace_back(item.key(), parameter, std::move(output));
            }

            for (auto& [id, parameter, output] : pending) {
                parameter.set_data(output.tensor);
                records_.insert_or_assign(id, std::move(output.state));
            }
            return module;
        }

        void to_device(const torch::Device& device) override {
            Record moved;
            for (const auto& [id, state] : records_) {
                moved.emplace(id, Optim::to_device(state, device));
            }
            records_ = std::move(moved);
        }

        [[nodiscard]] Record to_record() const { return records_; }

        OptimizerAdaptor& load_record(Record record) {
            for (const auto& [id, state] : record) {
                try {
                    optimizer_.validate(state);
                } catch (const std::exception& error) {
                    throw std::runtime_error("Optimizer record for parameter '" + id + "' is incompatible: " + error.what());
                }
            }
            records_ = std::move(record);
            return *this;
        }

        void save(torch::serialize::OutputArchive& archive) const override {
            archive.write("parameter_count", c10::IValue(static_cast<int64_t>(records_.size())));
            std::size_t index = 0;
            for (const auto& [id, state] : records_) {
                torch::serialize::OutputArchive entry(archive.compilation_unit());
                entry.write("id", c10::IValue(id));

                torch::serialize::OutputArchive state_archive(archive.compilation_unit());
                state.serialize(state_archive);
                entry.write("state", state_archive);

                archive.write("parameter_" + std::to_string(index++), entry);
            }
        }

        void load(torch::serialize::InputArchive& archive) override {
            c10::IValue count;
            archive.read("parameter_count", count);
            const auto parameter_count = count.toInt();
            if (parameter_count < 0) {
                throw std::runtime_error("Optimizer state archive reports a negative parameter count.");
            }

            Record record;
            for (int64_t index = 0; index < parameter_count; ++index) {
                const auto key = "parameter_" + std::to_string(index);
                torch::serialize::InputArchive entry;
                if (!archive.try_read(key, entry)) {
                    throw std::runtime_error("Optimizer state archive is missing entry '" + key + "'.");
                }

                c10::IValue id;
                entry.read("id", id);

                torch::serialize::InputArchive state_archive;
                entry.read("state", state_archive);
                State state;
                state.serialize(state_archive);

                if (!record.emplace(id.toStringRef(), std::move(state)).second) {
                    throw std::runtime_error("Optimizer state archive contains parameter '" + id.toStringRef() + "' twice.");
                }
            }
            load_record(std::move(record));
        }

        [[nodiscard]] std::size_t size() const noexcept override { return records_.size(); }

        using ModuleOptimizer::load;
        using ModuleOptimizer::save;

    private:
        Optim optimizer_;
        std::optional<Details::GradientClipping> grad_clipping_{};
        Record records_{};
    };

}

#endif // NABLA_OPTIMIZER_ADAPTOR_HPP
