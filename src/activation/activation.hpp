#ifndef LATENT_ACTIVATION_HPP
#define LATENT_ACTIVATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

namespace Latent::Activation {
    enum class Type {
        Identity,
        Softplus,
        ReLU,
        Sigmoid,
        Tanh,
    };

    struct Descriptor {
        Type type{Type::Softplus};
    };

    inline constexpr Descriptor Identity{Type::Identity};
    inline constexpr Descriptor Softplus{Type::Softplus};
    inline constexpr Descriptor ReLU{Type::ReLU};
    inline constexpr Descriptor Sigmoid{Type::Sigmoid};
    inline constexpr Descriptor Tanh{Type::Tanh};
}

#endif //LATENT_ACTIVATION_HPP
