#ifndef LATENT_CORE_HPP
#define LATENT_CORE_HPP
/*
 * Core of the library: the variational autoencoder and its training driver.
 * ---------------------------------------------------------------------------
 *  - `Model` owns the recognition and generator parameters, a seeded random
 *    generator shared by initialization and reparameterization noise, and the
 *    optimizer. Every call recomputes its forward pass from the current
 *    parameters; only `partial_fit` runs a backward pass.
 *  - Operations that sample the latent code (`partial_fit`, `reconstruct`,
 *    `cost`) are bound to the fixed batch size given at construction.
 *    `transform` and `generate` accept any number of rows.
 *  - `train` walks a `Data::BatchProvider` for a number of epochs and reports
 *    the running average cost on the configured stream.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>


#include <torch/torch.h>
#ifdef TORCH_CUDA_AVAILABLE
#include <torch/cuda.h>
#endif

#include "activation/activation.hpp"
#include "activation/apply.hpp"
#include "data/details/batch_provider.hpp"
#include "initialization/apply.hpp"
#include "initialization/initialization.hpp"
#include "loss/loss.hpp"
#include "network/network.hpp"
#include "optimizer/optimizer.hpp"
#include "utils/check.hpp"
#include "utils/progressbar.hpp"
#include "utils/terminal.hpp"

namespace Latent {
    struct ModelOptions {
        Network::Architecture architecture{};
        Activation::Descriptor activation{Activation::Softplus};
        Initialization::Descriptor initialization{Initialization::XavierUniform};
        Optimizer::Descriptor optimizer{Optimizer::Adam({.learning_rate = 1e-3})};
        Loss::Details::ELBODescriptor loss{Loss::ELBO()};
        std::int64_t batch_size{100};
        std::uint64_t seed{0};
    };

    struct TrainOptions {
        std::size_t epoch{10};
        std::size_t display_step{5};
        bool monitor{true};
        bool progress{false};  // per-epoch progress bar on `stream`
        std::ostream* stream{&std::cout};
    };

    struct TrainingHistory {
        std::vector<double> epoch_costs{};  // running average per epoch
        std::vector<double> batch_costs{};  // every partial_fit, in order
    };

    class Model : public torch::nn::Module {
    public:
        explicit Model(ModelOptions options = {})
            : options_(std::move(options)),
              generator_(Initialization::Details::make_generator(options_.seed))
        {
            if (options_.batch_size <= 0) {
                throw std::invalid_argument("Model batch size must be greater than zero.");
            }
            parameters_ = Network::Details::build_parameters(*this,
                                                             options_.architecture,
                                                             options_.activation,
                                                             options_.initialization,
                                                             generator_);
            optimizer_ = std::visit([this](const auto& descriptor) {
                return Optimizer::Details::build_optimizer(*this, descriptor);
            }, options_.optimizer);
        }

        Model(const Model&) = delete;
        Model& operator=(const Model&) = delete;

        // One optimizer step on the total cost of `inputs`; returns that cost.
        double partial_fit(const torch::Tensor& inputs)
        {
            auto batch = prepare_input(inputs, options_.batch_size, "partial_fit");
            torch::nn::Module::train(true);

            optimizer_->zero_grad();
            auto terms = forward_terms(batch);
            terms.total.backward();
            optimizer_->step();
            ++steps_;

            return terms.total.detach().item<double>();
        }

        // Latent means of q(z|x); no sampling involved.
        [[nodiscard]] torch::Tensor transform(const torch::Tensor& inputs)
        {
            auto batch = prepare_input(inputs, -1, "transform");
            torch::NoGradGuard no_grad{};
            return Network::Details::recognize(parameters_.recognition, batch).z_mean;
        }

        // Decoder means for `z`, or for a single code drawn from the prior when `z` is omitted.
        [[nodiscard]] torch::Tensor generate(std::optional<torch::Tensor> z = std::nullopt)
        {
            torch::Tensor codes;
            if (z.has_value()) {
                Utils::Check::Matrix(*z, -1, options_.architecture.n_z, "generate");
                codes = z->to(device_, torch::kFloat32);
            } else {
                codes = Network::Details::standard_normal(1, options_.architecture.n_z, generator_, device_);
            }
            torch::NoGradGuard no_grad{};
            return Network::Details::generate(parameters_.generation, codes);
        }

        // `count` decoded prior samples in a single pass.
        [[nodiscard]] torch::Tensor sample(std::int64_t count)
        {
            if (count <= 0) {
                throw std::invalid_argument("sample requires a positive count.");
            }
            return generate(Network::Details::standard_normal(count, options_.architecture.n_z, generator_, device_));
        }

        // Encoder, sampling step and decoder.
        [[nodiscard]] torch::Tensor reconstruct(const torch::Tensor& inputs)
        {
            auto batch = prepare_input(inputs, options_.batch_size, "reconstruct");
            torch::NoGradGuard no_grad{};
            const auto posterior = Network::Details::recognize(parameters_.recognition, batch);
            const auto z = draw_latent(posterior);
            return Network::Details::generate(parameters_.generation, z);
        }

        // Cost of a batch under the current parameters, without an update.
        [[nodiscard]] double cost(const torch::Tensor& inputs)
        {
            return evaluate(inputs).total.item<double>();
        }

        [[nodiscard]] Loss::ELBOTerms evaluate(const torch::Tensor& inputs)
        {
            auto batch = prepare_input(inputs, options_.batch_size, "evaluate");
            torch::NoGradGuard no_grad{};
            return forward_terms(batch);
        }

        void to_device(bool use_cuda)
        {
            if (use_cuda) {
#ifdef TORCH_CUDA_AVAILABLE
                if (!torch::cuda::is_available()) {
                    throw std::runtime_error("CUDA device requested but is unavailable.");
                }
                device_ = torch::Device(torch::kCUDA, 0);
#else
                throw std::runtime_error("CUDA device requested but is unavailable.");
#endif
            } else {
                device_ = torch::Device(torch::kCPU);
            }
            this->to(device_);
        }

        [[nodiscard]] const Network::Architecture& architecture() const noexcept { return options_.architecture; }
        [[nodiscard]] const Network::Parameters& network_parameters() const noexcept { return parameters_; }
        [[nodiscard]] const ModelOptions& options() const noexcept { return options_; }
        [[nodiscard]] std::int64_t batch_size() const noexcept { return options_.batch_size; }
        [[nodiscard]] std::size_t steps() const noexcept { return steps_; }
        [[nodiscard]] torch::Device device() const noexcept { return device_; }

    private:
        torch::Tensor prepare_input(const torch::Tensor& inputs, std::int64_t rows, const std::string& context) const
        {
            Utils::Check::Matrix(inputs, rows, options_.architecture.n_input, context);
            return inputs.to(device_, torch::kFloat32);
        }

        torch::Tensor draw_latent(const Network::Posterior& posterior)
        {
            auto eps = Network::Details::standard_normal(posterior.z_mean.size(0),
                                                         options_.architecture.n_z,
                                                         generator_,
                                                         device_);
            return Network::Details::reparameterize(posterior.z_mean, posterior.z_log_sigma_sq, eps);
        }

        Loss::ELBOTerms forward_terms(const torch::Tensor& batch)
        {
            const auto posterior = Network::Details::recognize(parameters_.recognition, batch);
            const auto z = draw_latent(posterior);
            const auto reconstruction = Network::Details::generate(parameters_.generation, z);
            return Loss::Details::compute(options_.loss, reconstruction, batch, posterior.z_mean, posterior.z_log_sigma_sq);
        }

        ModelOptions options_;
        at::Generator generator_;
        Network::Parameters parameters_{};
        std::unique_ptr<torch::optim::Optimizer> optimizer_{};
        torch::Device device_{torch::kCPU};
        std::size_t steps_{0};
    };

    namespace TrainingDetails {
        inline void log_epoch(std::ostream& stream,
                              std::size_t epoch_index,
                              std::size_t total_epochs,
                              double cost,
                              double duration_seconds)
        {
            using Utils::Terminal::ApplyColor;
            using Utils::Terminal::Colors::kBrightBlack;
            using Utils::Terminal::Colors::kBrightYellow;

            std::ostringstream line;
            line << "Epoch [" << std::setw(4) << std::setfill('0') << epoch_index << "/"
                 << std::setw(4) << std::setfill('0') << total_epochs << "] | " << std::setfill(' ');
            line << ApplyColor("cost", kBrightYellow) << ": "
                 << std::fixed << std::setprecision(9) << cost;

            std::ostringstream duration_stream;
            duration_stream << std::fixed << std::setprecision(2) << duration_seconds << "sec";
            line << " | " << ApplyColor("duration: " + duration_stream.str(), kBrightBlack);

            stream << line.str() << '\n';
        }
    }

    // Each epoch runs floor(n_samples / batch_size) steps; the reported cost is the
    // batch costs weighted by batch_size / n_samples.
    inline TrainingHistory train(Model& model, Data::BatchProvider& provider, TrainOptions options = {})
    {
        if (provider.num_features() != model.architecture().n_input) {
            throw std::invalid_argument("train: dimension mismatch, provider yields "
                                        + std::to_string(provider.num_features()) + " features but the model expects "
                                        + std::to_string(model.architecture().n_input) + ".");
        }
        const auto batch_size = model.batch_size();
        const auto n_samples = provider.num_examples();
        const auto total_batch = n_samples / batch_size;
        if (total_batch == 0) {
            throw std::invalid_argument("train: dataset of " + std::to_string(n_samples)
                                        + " examples cannot fill a batch of " + std::to_string(batch_size) + ".");
        }
        if (options.display_step == 0) {
            options.display_step = 1;
        }
        if (options.stream == nullptr) {
            options.monitor = false;
            options.progress = false;
        }

        TrainingHistory history{};
        history.epoch_costs.reserve(options.epoch);
        history.batch_costs.reserve(options.epoch * static_cast<std::size_t>(total_batch));

        for (std::size_t epoch = 0; epoch < options.epoch; ++epoch) {
            const auto epoch_start = std::chrono::steady_clock::now();
            std::optional<Utils::ProgressBar> bar{};
            if (options.progress) {
                bar.emplace(total_batch, "Epoch " + std::to_string(epoch + 1), options.stream);
            }

            double avg_cost = 0.0;
            for (std::int64_t step = 0; step < total_batch; ++step) {
                const auto batch = provider.next_batch(batch_size);
                const double cost = model.partial_fit(batch.inputs);
                history.batch_costs.push_back(cost);
                avg_cost += cost / static_cast<double>(n_samples) * static_cast<double>(batch_size);
                if (bar) {
                    bar->update(step + 1);
                }
            }
            history.epoch_costs.push_back(avg_cost);

            if (options.monitor && epoch % options.display_step == 0) {
                const auto duration_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - epoch_start).count();
                TrainingDetails::log_epoch(*options.stream, epoch + 1, options.epoch, avg_cost, duration_seconds);
            }
        }
        return history;
    }

    inline TrainingHistory train(Model& model, torch::Tensor inputs, TrainOptions options = {})
    {
        Data::BatchProvider provider(std::move(inputs), {}, model.options().seed);
        return train(model, provider, std::move(options));
    }
}

#endif //LATENT_CORE_HPP
