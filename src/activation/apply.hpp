#ifndef LATENT_ACTIVATION_APPLY_HPP
#define LATENT_ACTIVATION_APPLY_HPP

#include <torch/torch.h>

#include <string>
#include <utility>

#include "activation.hpp"
#include "details/relu.hpp"
#include "details/sigmoid.hpp"
#include "details/softplus.hpp"
#include "details/tanh.hpp"

namespace Latent::Activation::Details {
    inline torch::Tensor apply(::Latent::Activation::Type type, torch::Tensor input) {
        switch (type) {
            case ::Latent::Activation::Type::Softplus:
                return Softplus{}(std::move(input));
            case ::Latent::Activation::Type::ReLU:
                return ReLU{}(std::move(input));
            case ::Latent::Activation::Type::Sigmoid:
                return Sigmoid{}(std::move(input));
            case ::Latent::Activation::Type::Tanh:
                return Tanh{}(std::move(input));
            case ::Latent::Activation::Type::Identity:
                return input;
            default:
                return input;
        }
    }

    inline std::string to_string(::Latent::Activation::Type type) {
        switch (type) {
            case ::Latent::Activation::Type::Softplus: return "Softplus";
            case ::Latent::Activation::Type::ReLU: return "ReLU";
            case ::Latent::Activation::Type::Sigmoid: return "Sigmoid";
            case ::Latent::Activation::Type::Tanh: return "Tanh";
            case ::Latent::Activation::Type::Identity:
            default: return "Identity";
        }
    }
}
#endif // LATENT_ACTIVATION_APPLY_HPP
