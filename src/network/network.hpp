#ifndef LATENT_NETWORK_HPP
#define LATENT_NETWORK_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/architecture.hpp"
#include "details/generator.hpp"
#include "details/parameters.hpp"
#include "details/recognition.hpp"
#include "details/sampling.hpp"

namespace Latent::Network {
    using Architecture = Details::Architecture;
    using Recognition = Details::Recognition;
    using Generation = Details::Generation;
    using Parameters = Details::Parameters;
    using Posterior = Details::Posterior;
}

#endif //LATENT_NETWORK_HPP
