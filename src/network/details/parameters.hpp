#ifndef LATENT_NETWORK_PARAMETERS_HPP
#define LATENT_NETWORK_PARAMETERS_HPP

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../initialization/initialization.hpp"
#include "../../layer/layer.hpp"
#include "architecture.hpp"

namespace Latent::Network::Details {
    struct Recognition {
        ::Latent::Layer::RegisteredLayer h1{};
        ::Latent::Layer::RegisteredLayer h2{};
        ::Latent::Layer::RegisteredLayer out_mean{};
        ::Latent::Layer::RegisteredLayer out_log_sigma{};
    };

    // out_log_sigma mirrors the recognition head; nothing downstream consumes it.
    struct Generation {
        ::Latent::Layer::RegisteredLayer h1{};
        ::Latent::Layer::RegisteredLayer h2{};
        ::Latent::Layer::RegisteredLayer out_mean{};
        ::Latent::Layer::RegisteredLayer out_log_sigma{};
    };

    struct Parameters {
        Recognition recognition{};
        Generation generation{};
    };

    template <class Owner>
    Parameters build_parameters(Owner& owner,
                                const Architecture& architecture,
                                ::Latent::Activation::Descriptor activation,
                                ::Latent::Initialization::Descriptor initialization,
                                at::Generator& generator)
    {
        validate(architecture);
        using ::Latent::Layer::FC;
        using ::Latent::Layer::Details::build_registered_layer;
        const auto& a = architecture;

        Parameters parameters{};
        auto& recog = parameters.recognition;
        recog.h1 = build_registered_layer(owner, FC({a.n_input, a.n_hidden_recog_1}, activation, initialization), "recog_h1", generator);
        recog.h2 = build_registered_layer(owner, FC({a.n_hidden_recog_1, a.n_hidden_recog_2}, activation, initialization), "recog_h2", generator);
        recog.out_mean = build_registered_layer(owner, FC({a.n_hidden_recog_2, a.n_z}, ::Latent::Activation::Identity, initialization), "recog_out_mean", generator);
        recog.out_log_sigma = build_registered_layer(owner, FC({a.n_hidden_recog_2, a.n_z}, ::Latent::Activation::Identity, initialization), "recog_out_log_sigma", generator);

        auto& gener = parameters.generation;
        gener.h1 = build_registered_layer(owner, FC({a.n_z, a.n_hidden_gener_1}, activation, initialization), "gener_h1", generator);
        gener.h2 = build_registered_layer(owner, FC({a.n_hidden_gener_1, a.n_hidden_gener_2}, activation, initialization), "gener_h2", generator);
        gener.out_mean = build_registered_layer(owner, FC({a.n_hidden_gener_2, a.n_input}, ::Latent::Activation::Sigmoid, initialization), "gener_out_mean", generator);
        gener.out_log_sigma = build_registered_layer(owner, FC({a.n_hidden_gener_2, a.n_input}, ::Latent::Activation::Identity, initialization), "gener_out_log_sigma", generator);

        return parameters;
    }
}

#endif //LATENT_NETWORK_PARAMETERS_HPP
