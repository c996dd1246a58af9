#ifndef LATENT_DATA_HPP
#define LATENT_DATA_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/batch_provider.hpp"
#include "load/load.hpp"
#endif //LATENT_DATA_HPP
