#ifndef LATENT_LOSS_REDUCTION_HPP
#define LATENT_LOSS_REDUCTION_HPP

#include <torch/torch.h>

namespace Latent::Loss::Details {

    enum class Reduction { Mean, Sum, None };

    // Reduces a per-example loss vector over the batch axis.
    inline torch::Tensor apply_reduction(torch::Tensor loss, Reduction reduction) {
        switch (reduction) {
            case Reduction::None:
                return loss;
            case Reduction::Sum:
                return loss.sum();
            case Reduction::Mean:
            default:
                return loss.mean();
        }
    }

}

#endif // LATENT_LOSS_REDUCTION_HPP
