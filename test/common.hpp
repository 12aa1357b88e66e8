#ifndef NABLA_TEST_COMMON_HPP
#define NABLA_TEST_COMMON_HPP

#include <filesystem>
#include <limits>
#include <random>
#include <string>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "../include/Nabla.h"

namespace Nabla::Test {

    inline constexpr double kLearningRate = 0.01;

    // Weight laid out as [inputs, outputs]: forward(x) = x @ weight + bias.
    struct LinearImpl : torch::nn::Module {
        LinearImpl(torch::Tensor weight_init, torch::Tensor bias_init) {
            weight = register_parameter("weight", std::move(weight_init));
            bias = register_parameter("bias", std::move(bias_init));
        }

        torch::Tensor forward(const torch::Tensor& input) {
            return input.matmul(weight).add(bias);
        }

        torch::Tensor weight;
        torch::Tensor bias;
    };
    TORCH_MODULE(Linear);

    inline torch::TensorOptions options() {
        return torch::TensorOptions().dtype(torch::kFloat64);
    }

    inline torch::Tensor reference_weight() {
        return torch::tensor({{-0.3206, 0.1374, 0.4043, 0.3200, 0.0859, 0.0671},
                              {0.0777, -0.0185, -0.3667, 0.2550, 0.1955, -0.2922},
                              {-0.0190, 0.0346, -0.2962, 0.2484, -0.2780, 0.3130},
                              {-0.2980, -0.2214, -0.3715, -0.2981, -0.0761, 0.1626},
                              {0.3300, -0.2182, 0.3717, -0.1729, 0.3796, -0.0304},
                              {-0.0159, -0.0120, 0.1258, 0.1921, 0.0293, 0.3833}},
                             options());
    }

    inline torch::Tensor reference_bias() {
        return torch::tensor({-0.3905, 0.0884, -0.0970, 0.1176, 0.1366, 0.0130}, options());
    }

    inline torch::Tensor first_batch() {
        return torch::tensor({{0.6294, 0.0940, 0.8176, 0.8824, 0.5228, 0.4310},
                              {0.7152, 0.9559, 0.7893, 0.5684, 0.5939, 0.8883}},
                             options());
    }

    inline torch::Tensor second_batch() {
        return torch::tensor({{0.8491, 0.2108, 0.8939, 0.4433, 0.5527, 0.2528},
                              {0.3270, 0.0412, 0.5538, 0.9605, 0.3195, 0.9085}},
                             options());
    }

    inline Linear reference_linear() {
        return Linear(reference_weight(), reference_bias());
    }

    // Backpropagates the sum of all outputs, so every output receives a unit gradient.
    inline Optimizer::GradientsParams gradients_of(Linear& linear, const torch::Tensor& input) {
        linear->zero_grad();
        auto output = linear->forward(input);
        output.backward(torch::ones_like(output));
        return Optimizer::GradientsParams::from_module(*linear);
    }

    inline double max_abs_difference(const torch::Tensor& actual, const torch::Tensor& expected) {
        return (actual.detach().to(torch::kCPU) - expected.to(actual.scalar_type())).abs().max().item<double>();
    }

    inline void expect_close(const torch::Tensor& actual, const torch::Tensor& expected, double tolerance) {
        ASSERT_EQ(actual.sizes(), expected.sizes());
        EXPECT_LE(max_abs_difference(actual, expected), tolerance)
            << "actual:\n" << actual << "\nexpected:\n" << expected;
    }

    inline void expect_identical(const torch::Tensor& actual, const torch::Tensor& expected) {
        ASSERT_TRUE(actual.defined());
        ASSERT_TRUE(expected.defined());
        EXPECT_TRUE(torch::equal(actual.to(torch::kCPU), expected.to(torch::kCPU)));
    }

    class TemporaryDirectory {
    public:
        explicit TemporaryDirectory(const std::string& prefix) {
            std::random_device device;
            path_ = std::filesystem::temp_directory_path()
                  / (prefix + "_" + std::to_string(device()) + "_" + std::to_string(device()));
            std::filesystem::create_directories(path_);
        }

        ~TemporaryDirectory() {
            std::error_code ignored;
            std::filesystem::remove_all(path_, ignored);
        }

        TemporaryDirectory(const TemporaryDirectory&) = delete;
        TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };
}

#endif // NABLA_TEST_COMMON_HPP
