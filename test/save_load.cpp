#include <fstream>

#include "common.hpp"

namespace Nabla::Test {
    namespace SaveLoad = Common::SaveLoad;

    namespace {
        Optimizer::Descriptor rmsprop_descriptor() {
            return Optimizer::RMSProp(Optimizer::RMSPropOptions{
                .alpha = 0.95,
                .momentum = 0.5,
                .epsilon = 1e-8,
                .centered = false,
                .weight_decay = Optimizer::WeightDecayOptions{.penalty = 0.05},
                .grad_clipping = Optimizer::GradientClippingOptions{.mode = Optimizer::GradientClippingMode::Value,
                                                                    .threshold = 2.0}});
        }
    }

    TEST(SaveLoadTests, AdamDescriptorRoundTrip) {
        const Optimizer::Descriptor descriptor = Optimizer::Adam(Optimizer::AdamOptions{
            .beta1 = 0.8,
            .beta2 = 0.99,
            .epsilon = 1e-7,
            .weight_decay = Optimizer::WeightDecayOptions{.penalty = 0.5, .decay_rate = 0.25}});

        const auto tree = SaveLoad::serialize_optimizer_descriptor(descriptor);
        EXPECT_EQ(tree.get<std::string>("type"), "adam");
        EXPECT_FALSE(tree.get_child_optional("grad_clipping").has_value());

        const auto restored = SaveLoad::deserialize_optimizer_descriptor(tree, "test");
        ASSERT_TRUE(std::holds_alternative<Optimizer::AdamDescriptor>(restored));
        const auto& options = std::get<Optimizer::AdamDescriptor>(restored).options;
        EXPECT_DOUBLE_EQ(options.beta1, 0.8);
        EXPECT_DOUBLE_EQ(options.beta2, 0.99);
        EXPECT_DOUBLE_EQ(options.epsilon, 1e-7);
        ASSERT_TRUE(options.weight_decay.has_value());
        EXPECT_DOUBLE_EQ(options.weight_decay->penalty, 0.5);
        ASSERT_TRUE(options.weight_decay->decay_rate.has_value());
        EXPECT_DOUBLE_EQ(*options.weight_decay->decay_rate, 0.25);
        EXPECT_FALSE(options.grad_clipping.has_value());
    }

    TEST(SaveLoadTests, RMSPropDescriptorRoundTripThroughFile) {
        TemporaryDirectory directory("nabla_save_load");
        const auto path = directory.path() / "optimizer.json";

        SaveLoad::write_json_file(path, SaveLoad::serialize_optimizer_descriptor(rmsprop_descriptor()));
        const auto restored = SaveLoad::deserialize_optimizer_descriptor(SaveLoad::read_json_file(path), path.string());

        ASSERT_TRUE(std::holds_alternative<Optimizer::RMSPropDescriptor>(restored));
        const auto& options = std::get<Optimizer::RMSPropDescriptor>(restored).options;
        EXPECT_DOUBLE_EQ(options.alpha, 0.95);
        EXPECT_DOUBLE_EQ(options.momentum, 0.5);
        EXPECT_DOUBLE_EQ(options.epsilon, 1e-8);
        EXPECT_FALSE(options.centered);
        ASSERT_TRUE(options.weight_decay.has_value());
        EXPECT_FALSE(options.weight_decay->decay_rate.has_value());
        ASSERT_TRUE(options.grad_clipping.has_value());
        EXPECT_EQ(options.grad_clipping->mode, Optimizer::GradientClippingMode::Value);
        EXPECT_DOUBLE_EQ(options.grad_clipping->threshold, 2.0);
    }

    TEST(SaveLoadTests, RejectsMissingField) {
        auto tree = SaveLoad::serialize_optimizer_descriptor(Optimizer::Adam());
        tree.erase("beta2");

        try {
            (void)SaveLoad::deserialize_optimizer_descriptor(tree, "optimizer");
            FAIL() << "Expected a missing field error.";
        } catch (const std::runtime_error& error) {
            EXPECT_NE(std::string(error.what()).find("beta2"), std::string::npos);
        }
    }

    TEST(SaveLoadTests, RejectsUnknownOptimizerType) {
        SaveLoad::PropertyTree tree;
        tree.put("type", "lbfgs");
        EXPECT_THROW((void)SaveLoad::deserialize_optimizer_descriptor(tree, "optimizer"), std::runtime_error);
    }

    TEST(SaveLoadTests, RejectsUnknownClippingMode) {
        auto tree = SaveLoad::serialize_optimizer_descriptor(rmsprop_descriptor());
        tree.put("grad_clipping.mode", "percentile");
        EXPECT_THROW((void)SaveLoad::deserialize_optimizer_descriptor(tree, "optimizer"), std::runtime_error);
    }

    TEST(SaveLoadTests, CheckpointRoundTripContinuesIdentically) {
        TemporaryDirectory directory("nabla_checkpoint");
        const auto descriptor = rmsprop_descriptor();

        auto reference = reference_linear();
        auto restored = reference_linear();
        auto optimizer = Optimizer::build_optimizer(descriptor);
        optimizer->step(kLearningRate, *reference, gradients_of(reference, first_batch()));
        SaveLoad::save_checkpoint(directory.path(), descriptor, *optimizer);

        EXPECT_TRUE(std::filesystem::exists(directory.path() / SaveLoad::kDescriptorFile));
        EXPECT_TRUE(std::filesystem::exists(directory.path() / SaveLoad::kStateFile));

        {
            auto warmup = Optimizer::build_optimizer(descriptor);
            warmup->step(kLearningRate, *restored, gradients_of(restored, first_batch()));
        }
        auto checkpoint = SaveLoad::load_checkpoint(directory.path());
        ASSERT_TRUE(std::holds_alternative<Optimizer::RMSPropDescriptor>(checkpoint.descriptor));
        ASSERT_EQ(checkpoint.optimizer->size(), 2u);

        optimizer->step(kLearningRate, *reference, gradients_of(reference, second_batch()));
        checkpoint.optimizer->step(kLearningRate, *restored, gradients_of(restored, second_batch()));

        expect_identical(restored->weight, reference->weight);
        expect_identical(restored->bias, reference->bias);
    }

    TEST(SaveLoadTests, CheckpointRejectsToggledCenteredFlag) {
        TemporaryDirectory directory("nabla_checkpoint");
        const auto descriptor = rmsprop_descriptor();

        auto linear = reference_linear();
        auto optimizer = Optimizer::build_optimizer(descriptor);
        optimizer->step(kLearningRate, *linear, gradients_of(linear, first_batch()));
        SaveLoad::save_checkpoint(directory.path(), descriptor, *optimizer);

        const auto descriptor_path = directory.path() / SaveLoad::kDescriptorFile;
        auto tree = SaveLoad::read_json_file(descriptor_path);
        tree.put("centered", true);
        SaveLoad::write_json_file(descriptor_path, tree);

        try {
            (void)SaveLoad::load_checkpoint(directory.path());
            FAIL() << "Expected the centered mismatch to be rejected.";
        } catch (const std::runtime_error& error) {
            EXPECT_NE(std::string(error.what()).find("centered"), std::string::npos);
        }
    }

    TEST(SaveLoadTests, CheckpointReportsMissingFiles) {
        TemporaryDirectory directory("nabla_checkpoint");
        EXPECT_THROW((void)SaveLoad::load_checkpoint(directory.path()), std::runtime_error);

        std::ofstream(directory.path() / SaveLoad::kDescriptorFile) << "{ \"type\": \"adam\" }";
        EXPECT_THROW((void)SaveLoad::load_checkpoint(directory.path()), std::runtime_error);

        EXPECT_THROW(SaveLoad::save_checkpoint({}, Optimizer::Adam(), *Optimizer::build_optimizer(Optimizer::Adam())),
                     std::invalid_argument);
    }
}
