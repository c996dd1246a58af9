#ifndef LATENT_PLOT_DETAILS_IMAGE_HPP
#define LATENT_PLOT_DETAILS_IMAGE_HPP

#include <array>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Latent::Plot::Details {
    inline auto as_cpu_contiguous(const torch::Tensor& tensor) -> torch::Tensor
    {
        if (!tensor.defined()) {
            throw std::invalid_argument("Plot tensor must be defined");
        }
        auto result = tensor.detach();
        if (!result.device().is_cpu()) {
            result = result.cpu();
        }
        if (!result.is_contiguous()) {
            result = result.contiguous();
        }
        return result;
    }

    inline auto flatten_to_double_vector(const torch::Tensor& tensor) -> std::vector<double>
    {
        auto contiguous = as_cpu_contiguous(tensor).to(torch::kFloat64).reshape({-1}).contiguous();
        const auto* data = contiguous.data_ptr<double>();
        return {data, data + contiguous.numel()};
    }

    inline auto build_color_palette() -> std::vector<std::string>
    {
        static const std::array<const char*, 10> palette = {
            "#1f77b4", "#ff7f0e", "#2ca02c", "#d62728", "#9467bd",
            "#8c564b", "#e377c2", "#7f7f7f", "#bcbd22", "#17becf"};
        return {palette.begin(), palette.end()};
    }

    inline auto prepare_grayscale_tensor(torch::Tensor tensor) -> torch::Tensor
    {
        tensor = as_cpu_contiguous(std::move(tensor)).to(torch::kFloat32);
        if (tensor.dim() == 3 && tensor.size(0) == 1) {
            tensor = tensor.squeeze(0);
        }
        if (tensor.dim() != 2) {
            throw std::invalid_argument("Image expects grayscale tensors to be 2D after squeezing");
        }
        return tensor.contiguous();
    }

    inline auto build_grayscale_writer(const torch::Tensor& tensor)
        -> std::function<void(std::FILE*)>
    {
        auto prepared = prepare_grayscale_tensor(tensor.clone());
        const auto height = prepared.size(0);
        const auto width = prepared.size(1);
        return [prepared, height, width](std::FILE* pipe) {
            auto accessor = prepared.accessor<float, 2>();
            for (int64_t row = 0; row < height; ++row) {
                for (int64_t col = 0; col < width; ++col) {
                    if (std::fprintf(pipe,
                                      "%lld %lld %.*g\n",
                                      static_cast<long long>(col),
                                      static_cast<long long>(row),
                                      6,
                                      static_cast<double>(accessor[row][col])) < 0) {
                        throw std::runtime_error("Failed to write grayscale image data to gnuplot");
                    }
                }
                if (std::fprintf(pipe, "\n") < 0) {
                    throw std::runtime_error("Failed to write grayscale row separator to gnuplot");
                }
            }
        };
    }

    inline auto format_double(double value) -> std::string
    {
        std::ostringstream stream;
        stream << std::setprecision(6) << value;
        return stream.str();
    }
}

#endif //LATENT_PLOT_DETAILS_IMAGE_HPP
