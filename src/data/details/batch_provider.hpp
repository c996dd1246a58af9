#ifndef LATENT_DATA_BATCH_PROVIDER_HPP
#define LATENT_DATA_BATCH_PROVIDER_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../initialization/apply.hpp"

namespace Latent::Data {
    struct Batch {
        torch::Tensor inputs{};
        torch::Tensor labels{};  // undefined when the provider carries no labels
    };

    // Serves mini-batches without replacement: a fresh permutation is drawn whenever the
    // remaining examples of the current one cannot fill the requested batch.
    class BatchProvider {
    public:
        explicit BatchProvider(torch::Tensor inputs, torch::Tensor labels = {}, std::uint64_t seed = 0, bool shuffle = true)
            : inputs_(std::move(inputs)),
              labels_(std::move(labels)),
              generator_(::Latent::Initialization::Details::make_generator(seed)),
              shuffle_(shuffle)
        {
            if (!inputs_.defined() || inputs_.dim() != 2) {
                throw std::invalid_argument("BatchProvider expects a (samples x features) input matrix.");
            }
            if (inputs_.size(0) == 0) {
                throw std::logic_error("BatchProvider requires at least one example.");
            }
            if (labels_.defined() && labels_.size(0) != inputs_.size(0)) {
                throw std::invalid_argument("BatchProvider received " + std::to_string(labels_.size(0))
                                            + " labels for " + std::to_string(inputs_.size(0)) + " examples.");
            }
            reshuffle();
        }

        [[nodiscard]] std::int64_t num_examples() const noexcept { return inputs_.size(0); }
        [[nodiscard]] std::int64_t num_features() const noexcept { return inputs_.size(1); }
        [[nodiscard]] std::int64_t epochs_completed() const noexcept { return epochs_completed_; }
        [[nodiscard]] const torch::Tensor& inputs() const noexcept { return inputs_; }
        [[nodiscard]] const torch::Tensor& labels() const noexcept { return labels_; }

        Batch next_batch(std::int64_t batch_size)
        {
            if (batch_size <= 0) {
                throw std::invalid_argument("Batch size must be greater than zero.");
            }
            if (batch_size > num_examples()) {
                throw std::invalid_argument("Batch size " + std::to_string(batch_size) + " exceeds the "
                                            + std::to_string(num_examples()) + " available examples.");
            }
            if (cursor_ + batch_size > num_examples()) {
                ++epochs_completed_;
                reshuffle();
            }

            const auto indices = order_.narrow(0, cursor_, batch_size);
            cursor_ += batch_size;

            Batch batch{};
            batch.inputs = inputs_.index_select(0, indices);
            if (labels_.defined()) {
                batch.labels = labels_.index_select(0, indices.to(labels_.device()));
            }
            return batch;
        }

    private:
        void reshuffle()
        {
            const auto options = torch::TensorOptions().dtype(torch::kInt64);
            order_ = shuffle_ ? torch::randperm(num_examples(), generator_, options)
                              : torch::arange(num_examples(), options);
            if (order_.device() != inputs_.device()) {
                order_ = order_.to(inputs_.device());
            }
            cursor_ = 0;
        }

        torch::Tensor inputs_;
        torch::Tensor labels_;
        at::Generator generator_;
        bool shuffle_;
        torch::Tensor order_{};
        std::int64_t cursor_{0};
        std::int64_t epochs_completed_{0};
    };
}

#endif //LATENT_DATA_BATCH_PROVIDER_HPP
