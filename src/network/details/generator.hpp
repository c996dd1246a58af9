#ifndef LATENT_NETWORK_GENERATOR_HPP
#define LATENT_NETWORK_GENERATOR_HPP

#include <torch/torch.h>

#include "parameters.hpp"

namespace Latent::Network::Details {
    // Bernoulli means of p(x|z), already squashed by the sigmoid of out_mean.
    [[nodiscard]] inline torch::Tensor generate(const Generation& network, const torch::Tensor& z)
    {
        auto hidden = network.h1.forward(z);
        hidden = network.h2.forward(hidden);
        return network.out_mean.forward(hidden);
    }
}

#endif //LATENT_NETWORK_GENERATOR_HPP
