#ifndef LATENT_LOSS_HPP
#define LATENT_LOSS_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/reduction.hpp"
#include "details/bernoulli.hpp"
#include "details/gaussian_kl.hpp"
#include "details/elbo.hpp"

namespace Latent::Loss {
    using Reduction = Details::Reduction;
    using ELBOTerms = Details::ELBOTerms;

    [[nodiscard]] constexpr auto Bernoulli(const Details::BernoulliOptions& options = {}) noexcept -> Details::BernoulliDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto GaussianKL(const Details::GaussianKLOptions& options = {}) noexcept -> Details::GaussianKLDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto ELBO(const Details::ELBOOptions& options = {}) noexcept -> Details::ELBODescriptor {
        return {options};
    }
}

#endif //LATENT_LOSS_HPP
