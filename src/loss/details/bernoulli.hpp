#ifndef LATENT_LOSS_BERNOULLI_HPP
#define LATENT_LOSS_BERNOULLI_HPP

#include <torch/torch.h>

#include "../../utils/check.hpp"
#include "reduction.hpp"

namespace Latent::Loss::Details {

    struct BernoulliOptions {
        Reduction reduction{Reduction::Mean};
        double epsilon{1e-10};  // keeps log() away from 0
    };

    struct BernoulliDescriptor {
        BernoulliOptions options{};
    };

    // Negative log-likelihood of `target` under independent Bernoulli pixels with means `prediction`,
    // summed over the feature axis.
    inline torch::Tensor compute(const BernoulliDescriptor& descriptor, const torch::Tensor& prediction, const torch::Tensor& target) {
        ::Latent::Utils::Check::SameShape(prediction, target, "Bernoulli reconstruction loss");
        const auto eps = descriptor.options.epsilon;
        auto tgt = target.to(prediction.device(), prediction.scalar_type());
        // eps is added after 1 - prediction: 1 + 1e-10 rounds to 1 in float32.
        auto log_likelihood = tgt * torch::log(eps + prediction)
                            + (1.0 - tgt) * torch::log(eps + (1.0 - prediction));
        return apply_reduction(-log_likelihood.sum(1), descriptor.options.reduction);
    }

}

#endif // LATENT_LOSS_BERNOULLI_HPP
