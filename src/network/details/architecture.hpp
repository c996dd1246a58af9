#ifndef LATENT_NETWORK_ARCHITECTURE_HPP
#define LATENT_NETWORK_ARCHITECTURE_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace Latent::Network::Details {
    // Layer widths of the recognition (encoder) and generator (decoder) networks.
    struct Architecture {
        std::int64_t n_hidden_recog_1{500};
        std::int64_t n_hidden_recog_2{500};
        std::int64_t n_hidden_gener_1{500};
        std::int64_t n_hidden_gener_2{500};
        std::int64_t n_input{784};  // MNIST 28x28
        std::int64_t n_z{20};
    };

    inline void validate(const Architecture& architecture)
    {
        const auto require_positive = [](std::int64_t value, const char* field) {
            if (value <= 0) {
                throw std::invalid_argument(std::string("Architecture field '") + field
                                            + "' must be positive, got " + std::to_string(value) + ".");
            }
        };
        require_positive(architecture.n_hidden_recog_1, "n_hidden_recog_1");
        require_positive(architecture.n_hidden_recog_2, "n_hidden_recog_2");
        require_positive(architecture.n_hidden_gener_1, "n_hidden_gener_1");
        require_positive(architecture.n_hidden_gener_2, "n_hidden_gener_2");
        require_positive(architecture.n_input, "n_input");
        require_positive(architecture.n_z, "n_z");
    }
}

#endif //LATENT_NETWORK_ARCHITECTURE_HPP
