#ifndef LATENT_SOFTPLUS_HPP
#define LATENT_SOFTPLUS_HPP

#include <torch/torch.h>

#include <utility>

#include "../activation.hpp"

namespace Latent::Activation::Details {
    // log(1 + exp(x)), libtorch switches to the identity above the threshold.
    struct Softplus {
        double beta{1.0};
        double threshold{20.0};

        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::softplus(std::move(input), beta, threshold);
        }
    };
}

#endif //LATENT_SOFTPLUS_HPP
