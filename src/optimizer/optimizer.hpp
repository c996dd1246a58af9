#ifndef LATENT_OPTIMIZER_HPP
#define LATENT_OPTIMIZER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <variant>

#include "registry.hpp"


#include "details/adam.hpp"
#include "details/sgd.hpp"


namespace Latent::Optimizer {
    using SGDOptions = Details::SGDOptions;
    using SGDDescriptor = Details::SGDDescriptor;

    using AdamOptions = Details::AdamOptions;
    using AdamDescriptor = Details::AdamDescriptor;


    using Descriptor = std::variant<AdamDescriptor,
                                    SGDDescriptor>;


    [[nodiscard]] inline constexpr auto SGD(const SGDOptions& options = {}) noexcept -> SGDDescriptor {
        return SGDDescriptor{.options = options};
    }

    [[nodiscard]] constexpr auto Adam(const AdamOptions& options = {}) noexcept -> AdamDescriptor {
        return AdamDescriptor{.options = options};
    }

}

#endif //LATENT_OPTIMIZER_HPP
