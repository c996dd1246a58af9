#ifndef LATENT_LIBRARY_H
#define LATENT_LIBRARY_H

#include "../src/core.hpp"
#include "../src/activation/activation.hpp"
#include "../src/initialization/initialization.hpp"
#include "../src/layer/layer.hpp"
#include "../src/loss/loss.hpp"
#include "../src/network/network.hpp"
#include "../src/optimizer/optimizer.hpp"

#include "../src/data/data.hpp"
#include "../src/plot/plot.hpp"



// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Re-exports the model, its training driver and the descriptor factories
//    used to configure it, plus the MNIST loaders and the latent-space plots.
//  - Every module is header-only under src/; linking only requires libtorch
//    and the OpenCV core/imgproc/imgcodecs components.

#endif // LATENT_LIBRARY_H
