#ifndef LATENT_INITIALIZATION_HPP
#define LATENT_INITIALIZATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "apply.hpp"

namespace Latent::Initialization {
    enum class Type {
        XavierUniform,
        XavierNormal,
        Zero,
    };

    struct Descriptor {
        Type type{Type::XavierUniform};
        double constant{1.0};
    };

    inline constexpr Descriptor XavierUniform{Type::XavierUniform};
    inline constexpr Descriptor XavierNormal{Type::XavierNormal};
    inline constexpr Descriptor Zero{Type::Zero};
}

#endif //LATENT_INITIALIZATION_HPP
