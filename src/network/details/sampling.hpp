#ifndef LATENT_NETWORK_SAMPLING_HPP
#define LATENT_NETWORK_SAMPLING_HPP

#include <cstdint>

#include <torch/torch.h>

#include "../../utils/check.hpp"

namespace Latent::Network::Details {
    // Noise is drawn on the CPU so a single seeded generator covers every device.
    [[nodiscard]] inline torch::Tensor standard_normal(std::int64_t rows,
                                                       std::int64_t columns,
                                                       at::Generator& generator,
                                                       const torch::Device& device)
    {
        auto noise = torch::randn({rows, columns}, generator, torch::TensorOptions().dtype(torch::kFloat32));
        return noise.to(device);
    }

    // z = mean + sqrt(exp(log_sigma_sq)) * eps
    [[nodiscard]] inline torch::Tensor reparameterize(const torch::Tensor& z_mean,
                                                      const torch::Tensor& z_log_sigma_sq,
                                                      const torch::Tensor& eps)
    {
        ::Latent::Utils::Check::SameShape(eps, z_mean, "Reparameterization noise");
        ::Latent::Utils::Check::SameShape(z_log_sigma_sq, z_mean, "Reparameterization log variance");
        return z_mean + torch::sqrt(torch::exp(z_log_sigma_sq)) * eps;
    }
}

#endif //LATENT_NETWORK_SAMPLING_HPP
