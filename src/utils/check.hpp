#ifndef LATENT_CHECK_HPP
#define LATENT_CHECK_HPP

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

namespace Latent::Utils::Check {
    inline std::string format_shape(const std::vector<int64_t>& shape)
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
        return format_shape(tensor.sizes().vec());
    }

    [[noreturn]] inline void throw_mismatch(const std::string& context,
                                            const torch::Tensor& tensor,
                                            const std::vector<int64_t>& expected)
    {
        std::ostringstream stream;
        stream << context << ": dimension mismatch, got " << format_shape(tensor)
               << " but expected " << format_shape(expected) << '.';
        throw std::invalid_argument(stream.str());
    }

    // Accepts a (rows x columns) matrix. A negative `rows` leaves the batch dimension free.
    inline void Matrix(const torch::Tensor& tensor, int64_t rows, int64_t columns, const std::string& context)
    {
        if (!tensor.defined()) {
            throw std::invalid_argument(context + ": tensor must be defined.");
        }
        const std::vector<int64_t> expected{rows, columns};
        if (tensor.dim() != 2) {
            throw_mismatch(context, tensor, expected);
        }
        if (tensor.size(1) != columns) {
            throw_mismatch(context, tensor, expected);
        }
        if (rows >= 0 && tensor.size(0) != rows) {
            throw_mismatch(context, tensor, expected);
        }
        if (tensor.size(0) == 0) {
            throw std::invalid_argument(context + ": batch must contain at least one row.");
        }
    }

    inline void SameShape(const torch::Tensor& lhs, const torch::Tensor& rhs, const std::string& context)
    {
        if (!lhs.defined() || !rhs.defined()) {
            throw std::invalid_argument(context + ": tensors must be defined.");
        }
        if (lhs.sizes() != rhs.sizes()) {
            throw_mismatch(context, lhs, rhs.sizes().vec());
        }
    }
}

#endif //LATENT_CHECK_HPP
