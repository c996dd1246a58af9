#ifndef LATENT_SIGMOID_HPP
#define LATENT_SIGMOID_HPP

#include <torch/torch.h>

#include <utility>

#include "../activation.hpp"

namespace Latent::Activation::Details {
    struct Sigmoid {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::sigmoid(std::move(input));
        }
    };
}

#endif //LATENT_SIGMOID_HPP
