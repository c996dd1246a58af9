#ifndef LATENT_LOSS_GAUSSIAN_KL_HPP
#define LATENT_LOSS_GAUSSIAN_KL_HPP

#include <utility>

#include <torch/torch.h>

#include "../../utils/check.hpp"
#include "reduction.hpp"

namespace Latent::Loss::Details {
    struct GaussianKLOptions {
        Reduction reduction{Reduction::Mean};
    };

    struct GaussianKLDescriptor {
        GaussianKLOptions options{};
    };

    // Closed form KL(N(mean, exp(log_sigma_sq)) || N(0, I)), summed over the latent axis.
    inline torch::Tensor compute(const GaussianKLDescriptor& descriptor, const torch::Tensor& z_mean, const torch::Tensor& z_log_sigma_sq) {
        ::Latent::Utils::Check::SameShape(z_mean, z_log_sigma_sq, "Gaussian KL divergence");
        auto kl = -0.5 * (1.0 + z_log_sigma_sq - z_mean.square() - torch::exp(z_log_sigma_sq)).sum(1);
        return apply_reduction(std::move(kl), descriptor.options.reduction);
    }
}
#endif //LATENT_LOSS_GAUSSIAN_KL_HPP
