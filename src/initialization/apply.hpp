#ifndef LATENT_INITIALIZATION_APPLY_HPP
#define LATENT_INITIALIZATION_APPLY_HPP
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <torch/torch.h>
#include <ATen/CPUGeneratorImpl.h>

#include "initialization.hpp"

namespace Latent::Initialization::Details {
    [[nodiscard]] inline at::Generator make_generator(std::uint64_t seed) {
        return at::make_generator<at::CPUGeneratorImpl>(seed);
    }

    // Glorot bound for a (fan_in x fan_out) matrix.
    [[nodiscard]] inline double xavier_bound(std::int64_t fan_in, std::int64_t fan_out, double constant = 1.0) {
        if (fan_in <= 0 || fan_out <= 0) {
            throw std::invalid_argument("Xavier initialization requires positive fan sizes, got ("
                                        + std::to_string(fan_in) + ", " + std::to_string(fan_out) + ").");
        }
        return constant * std::sqrt(6.0 / static_cast<double>(fan_in + fan_out));
    }

    [[nodiscard]] inline torch::Tensor xavier_uniform(std::int64_t fan_in,
                                                      std::int64_t fan_out,
                                                      double constant,
                                                      at::Generator& generator) {
        const auto bound = xavier_bound(fan_in, fan_out, constant);
        auto weight = torch::empty({fan_in, fan_out}, torch::TensorOptions().dtype(torch::kFloat32));
        weight.uniform_(-bound, bound, generator);
        return weight;
    }

    [[nodiscard]] inline torch::Tensor xavier_normal(std::int64_t fan_in,
                                                     std::int64_t fan_out,
                                                     double constant,
                                                     at::Generator& generator) {
        // std = bound / sqrt(3) gives the same variance as the uniform draw.
        const auto stddev = xavier_bound(fan_in, fan_out, constant) / std::sqrt(3.0);
        auto weight = torch::empty({fan_in, fan_out}, torch::TensorOptions().dtype(torch::kFloat32));
        weight.normal_(0.0, stddev, generator);
        return weight;
    }

    [[nodiscard]] inline torch::Tensor initialize_weight(const ::Latent::Initialization::Descriptor& descriptor,
                                                         std::int64_t fan_in,
                                                         std::int64_t fan_out,
                                                         at::Generator& generator) {
        switch (descriptor.type) {
            case ::Latent::Initialization::Type::XavierNormal:
                return xavier_normal(fan_in, fan_out, descriptor.constant, generator);
            case ::Latent::Initialization::Type::Zero:
                if (fan_in <= 0 || fan_out <= 0) {
                    throw std::invalid_argument("Zero initialization requires positive fan sizes.");
                }
                return torch::zeros({fan_in, fan_out}, torch::TensorOptions().dtype(torch::kFloat32));
            case ::Latent::Initialization::Type::XavierUniform:
            default:
                return xavier_uniform(fan_in, fan_out, descriptor.constant, generator);
        }
    }

    [[nodiscard]] inline torch::Tensor zero_bias(std::int64_t fan_out) {
        return torch::zeros({fan_out}, torch::TensorOptions().dtype(torch::kFloat32));
    }
}
#endif // LATENT_INITIALIZATION_APPLY_HPP
