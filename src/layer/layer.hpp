#ifndef LATENT_LAYER_HPP
#define LATENT_LAYER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/fc.hpp"

namespace Latent::Layer {
    using FCOptions = Details::FCOptions;
    using FCDescriptor = Details::FCDescriptor;
    using RegisteredLayer = Details::RegisteredLayer;

    [[nodiscard]] inline auto FC(const FCOptions& options,
                                 ::Latent::Activation::Descriptor activation = ::Latent::Activation::Identity,
                                 ::Latent::Initialization::Descriptor initialization = ::Latent::Initialization::XavierUniform) -> FCDescriptor {
        return {options, activation, initialization};
    }
}

#endif //LATENT_LAYER_HPP
