#ifndef LATENT_FC_HPP
#define LATENT_FC_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../activation/apply.hpp"
#include "../../initialization/apply.hpp"
#include "../../initialization/initialization.hpp"
#include "../../utils/check.hpp"


namespace Latent::Layer::Details {
    struct FCOptions {
        std::int64_t in_features{};
        std::int64_t out_features{};
        bool bias{true};
    };

    struct FCDescriptor {
        FCOptions options;
        ::Latent::Activation::Descriptor activation{::Latent::Activation::Identity};
        ::Latent::Initialization::Descriptor initialization{::Latent::Initialization::XavierUniform};
    };

    // Weight is stored as (in_features x out_features) so the forward pass reads x·W + b.
    struct RegisteredLayer {
        torch::Tensor weight{};
        torch::Tensor bias{};
        ::Latent::Activation::Type activation{::Latent::Activation::Type::Identity};
        std::string name{};

        [[nodiscard]] std::int64_t in_features() const { return weight.size(0); }
        [[nodiscard]] std::int64_t out_features() const { return weight.size(1); }

        [[nodiscard]] torch::Tensor forward(const torch::Tensor& input) const
        {
            if (input.dim() != 2 || input.size(1) != in_features()) {
                ::Latent::Utils::Check::throw_mismatch("Layer '" + name + "'", input, {-1, in_features()});
            }
            auto output = bias.defined() ? torch::addmm(bias, input, weight) : input.matmul(weight);
            return ::Latent::Activation::Details::apply(activation, std::move(output));
        }
    };

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const FCDescriptor& descriptor, const std::string& name, at::Generator& generator)
    {
        if (descriptor.options.in_features <= 0 || descriptor.options.out_features <= 0) {
            throw std::invalid_argument("Fully connected layer '" + name + "' requires positive in/out features.");
        }

        RegisteredLayer registered_layer{};
        registered_layer.name = name;
        registered_layer.activation = descriptor.activation.type;
        registered_layer.weight = owner.register_parameter(
            name + "_weight",
            ::Latent::Initialization::Details::initialize_weight(descriptor.initialization,
                                                                 descriptor.options.in_features,
                                                                 descriptor.options.out_features,
                                                                 generator));
        if (descriptor.options.bias) {
            registered_layer.bias = owner.register_parameter(
                name + "_bias",
                ::Latent::Initialization::Details::zero_bias(descriptor.options.out_features));
        }
        return registered_layer;
    }
}

#endif //LATENT_FC_HPP
