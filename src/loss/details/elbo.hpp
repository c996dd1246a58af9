#ifndef LATENT_LOSS_ELBO_HPP
#define LATENT_LOSS_ELBO_HPP

#include <torch/torch.h>

#include "bernoulli.hpp"
#include "gaussian_kl.hpp"
#include "reduction.hpp"

namespace Latent::Loss::Details {

    struct ELBOOptions {
        Reduction reduction{Reduction::Mean};
        double epsilon{1e-10};
    };

    struct ELBODescriptor {
        ELBOOptions options{};
    };

    struct ELBOTerms {
        torch::Tensor reconstruction{};
        torch::Tensor latent{};
        torch::Tensor total{};
    };

    // Negative evidence lower bound. Both terms are summed per example before the batch reduction.
    inline ELBOTerms compute(const ELBODescriptor& descriptor,
                             const torch::Tensor& reconstruction,
                             const torch::Tensor& target,
                             const torch::Tensor& z_mean,
                             const torch::Tensor& z_log_sigma_sq) {
        const BernoulliDescriptor bernoulli{{.reduction = Reduction::None, .epsilon = descriptor.options.epsilon}};
        const GaussianKLDescriptor gaussian{{.reduction = Reduction::None}};

        auto reconstruction_loss = compute(bernoulli, reconstruction, target);
        auto latent_loss = compute(gaussian, z_mean, z_log_sigma_sq);
        if (reconstruction_loss.size(0) != latent_loss.size(0)) {
            ::Latent::Utils::Check::throw_mismatch("ELBO batch", z_mean, {reconstruction_loss.size(0), z_mean.size(1)});
        }

        ELBOTerms terms{};
        terms.total = apply_reduction(reconstruction_loss + latent_loss, descriptor.options.reduction);
        terms.reconstruction = apply_reduction(std::move(reconstruction_loss), descriptor.options.reduction);
        terms.latent = apply_reduction(std::move(latent_loss), descriptor.options.reduction);
        return terms;
    }

}

#endif // LATENT_LOSS_ELBO_HPP
