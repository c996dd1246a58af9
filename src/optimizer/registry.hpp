#ifndef LATENT_OPTIMIZER_REGISTRY_HPP
#define LATENT_OPTIMIZER_REGISTRY_HPP


#include <memory>
#include <stdexcept>

#include <torch/torch.h>

#include "details/adam.hpp"
#include "details/sgd.hpp"

namespace Latent::Optimizer::Details {
    template <class Owner, class Descriptor>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner&, const Descriptor&) {
        static_assert(sizeof(Descriptor) == 0, "Unsupported optimizer descriptor provided to build_optimizer.");
        return nullptr;
    }

    template <class Owner>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const SGDDescriptor& descriptor) {
        if (descriptor.options.learning_rate <= 0.0) {
            throw std::invalid_argument("SGD learning rate must be positive.");
        }
        auto options = to_torch_options(descriptor.options);
        return std::make_unique<torch::optim::SGD>(owner.parameters(), options);
    }

    template <class Owner>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const AdamDescriptor& descriptor) {
        if (descriptor.options.learning_rate <= 0.0) {
            throw std::invalid_argument("Adam learning rate must be positive.");
        }
        auto options = to_torch_options(descriptor.options);
        return std::make_unique<torch::optim::Adam>(owner.parameters(), options);
    }
}

#endif //LATENT_OPTIMIZER_REGISTRY_HPP
