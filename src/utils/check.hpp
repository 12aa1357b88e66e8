#ifndef NABLA_CHECK_HPP
#define NABLA_CHECK_HPP

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

namespace Nabla::Utils {

    inline std::string format_shape(const torch::IntArrayRef& shape)
    {
        if (shape.empty()) {
            return std::string{"()"};
        }

        std::ostringstream stream;
        stream << '(';
        for (std::size_t i = 0; i < shape.size(); ++i) {
            if (i > 0) {
                stream << ", ";
            }
            stream << shape[i];
        }
        stream << ')';
        return stream.str();
    }

    inline std::string format_shape(const torch::Tensor& tensor)
    {
        if (!tensor.defined()) {
            return std::string{"<undefined>"};
        }
        return format_shape(tensor.sizes());
    }

    // Throws std::invalid_argument unless both tensors are defined and share a shape.
    inline void require_same_shape(const torch::Tensor& reference,
                                   const torch::Tensor& candidate,
                                   const std::string& context)
    {
        if (!reference.defined() || !candidate.defined()) {
            throw std::invalid_argument(context + " requires defined tensors.");
        }
        if (reference.sizes() != candidate.sizes()) {
            throw std::invalid_argument(context + " shape mismatch: expected " + format_shape(reference)
                                        + " but found " + format_shape(candidate) + ".");
        }
    }

    [[nodiscard]] inline bool is_finite(const torch::Tensor& tensor)
    {
        if (!tensor.defined()) {
            return true;
        }
        return torch::isfinite(tensor).all().item<bool>();
    }

    [[nodiscard]] inline bool all_finite(const std::vector<torch::Tensor>& tensors)
    {
        for (const auto& tensor : tensors) {
            if (!is_finite(tensor)) {
                return false;
            }
        }
        return true;
    }
}

#endif // NABLA_CHECK_HPP
