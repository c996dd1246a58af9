#ifndef LATENT_RELU_HPP
#define LATENT_RELU_HPP

#include <torch/torch.h>

#include <utility>

#include "../activation.hpp"

namespace Latent::Activation::Details {
    struct ReLU {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::relu(std::move(input));
        }
    };


}

#endif //LATENT_RELU_HPP
