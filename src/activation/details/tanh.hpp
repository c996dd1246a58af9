#ifndef LATENT_TANH_HPP
#define LATENT_TANH_HPP

#include <torch/torch.h>

#include <utility>

#include "../activation.hpp"

namespace Latent::Activation::Details {

    struct Tanh {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::tanh(std::move(input));
        }
    };

}

#endif //LATENT_TANH_HPP
