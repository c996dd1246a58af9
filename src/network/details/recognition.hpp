#ifndef LATENT_NETWORK_RECOGNITION_HPP
#define LATENT_NETWORK_RECOGNITION_HPP

#include <torch/torch.h>

#include "parameters.hpp"

namespace Latent::Network::Details {
    // Parameters of the diagonal Gaussian q(z|x).
    struct Posterior {
        torch::Tensor z_mean{};
        torch::Tensor z_log_sigma_sq{};
    };

    [[nodiscard]] inline Posterior recognize(const Recognition& network, const torch::Tensor& inputs)
    {
        auto hidden = network.h1.forward(inputs);
        hidden = network.h2.forward(hidden);
        return {network.out_mean.forward(hidden), network.out_log_sigma.forward(hidden)};
    }
}

#endif //LATENT_NETWORK_RECOGNITION_HPP
