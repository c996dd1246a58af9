#include <catch2/catch.hpp>
#include "test_helpers.hpp"

#include <cmath>
#include <stdexcept>

using namespace Latent;

namespace {
    torch::Tensor binary_inputs(std::int64_t rows, std::int64_t cols, std::uint64_t seed) {
        auto generator = Initialization::Details::make_generator(seed);
        return torch::rand({rows, cols}, generator).gt(0.5).to(torch::kFloat32);
    }
}

TEST_CASE("Model registers every network weight", "[model]") {
    Model model(small_model_options());
    const auto named = model.named_parameters();

    REQUIRE(named.contains("recog_h1_weight"));
    REQUIRE(named.contains("recog_out_log_sigma_bias"));
    REQUIRE(named.contains("gener_out_mean_weight"));
    REQUIRE(named["recog_h1_weight"].sizes() == torch::IntArrayRef({16, 8}));
    REQUIRE(named["gener_out_mean_weight"].sizes() == torch::IntArrayRef({8, 16}));
    REQUIRE(model.network_parameters().recognition.out_mean.out_features() == 2);
}

TEST_CASE("Model construction validates its options", "[model]") {
    auto options = small_model_options();

    SECTION("batch size") {
        options.batch_size = 0;
        REQUIRE_THROWS_AS(Model(options), std::invalid_argument);
    }
    SECTION("architecture") {
        options.architecture.n_z = 0;
        REQUIRE_THROWS_AS(Model(options), std::invalid_argument);
    }
    SECTION("learning rate") {
        options.optimizer = Optimizer::Adam({.learning_rate = 0.0});
        REQUIRE_THROWS_AS(Model(options), std::invalid_argument);
    }
}

TEST_CASE("transform returns the latent means", "[model]") {
    Model model(small_model_options());
    const auto inputs = binary_inputs(6, 16, 3);

    const auto first = model.transform(inputs);
    const auto second = model.transform(inputs);
    REQUIRE(first.sizes() == torch::IntArrayRef({6, 2}));
    REQUIRE(torch::equal(first, second));

    Model twin(small_model_options());
    REQUIRE(torch::equal(first, twin.transform(inputs)));
}

TEST_CASE("generate decodes latent codes into pixel means", "[model]") {
    Model model(small_model_options());

    SECTION("explicit codes") {
        const auto z = torch::randn({3, 2});
        const auto decoded = model.generate(z);
        REQUIRE(decoded.sizes() == torch::IntArrayRef({3, 16}));
        REQUIRE(in_unit_interval(decoded));
        REQUIRE(torch::equal(decoded, model.generate(z)));
    }

    SECTION("a single prior draw when no code is given") {
        const auto decoded = model.generate();
        REQUIRE(decoded.sizes() == torch::IntArrayRef({1, 16}));
    }

    SECTION("sample draws several prior codes at once") {
        REQUIRE(model.sample(5).sizes() == torch::IntArrayRef({5, 16}));
        REQUIRE_THROWS_AS(model.sample(0), std::invalid_argument);
    }

    SECTION("codes with the wrong width are rejected") {
        REQUIRE_THROWS_AS(model.generate(torch::zeros({3, 4})), std::invalid_argument);
    }
}

TEST_CASE("Zero weights decode every code to one half", "[model]") {
    auto options = small_model_options(4, 2, 2);
    options.initialization = Initialization::Zero;
    Model model(options);

    const auto decoded = model.generate(torch::zeros({2, 2}));
    REQUIRE(torch::allclose(decoded, torch::full({2, 4}, 0.5f)));

    // KL vanishes and each of the 4 pixels costs log(2).
    const auto inputs = torch::tensor({{1.0f, 0.0f, 1.0f, 0.0f}, {0.0f, 0.0f, 1.0f, 1.0f}});
    REQUIRE(model.cost(inputs) == Approx(4.0 * std::log(2.0)).epsilon(1e-5));

    const auto terms = model.evaluate(inputs);
    REQUIRE(terms.latent.item<double>() == Approx(0.0).margin(1e-7));
}

TEST_CASE("reconstruct runs encoder, sampling and decoder", "[model]") {
    Model model(small_model_options());
    const auto inputs = binary_inputs(4, 16, 5);

    const auto reconstruction = model.reconstruct(inputs);
    REQUIRE(reconstruction.sizes() == inputs.sizes());
    REQUIRE(in_unit_interval(reconstruction));
}

TEST_CASE("Reconstructing zero inputs stays strictly inside (0, 1)", "[model]") {
    Model model(small_model_options(4, 2, 2));
    const auto reconstruction = model.reconstruct(torch::zeros({2, 4}));

    REQUIRE(reconstruction.sizes() == torch::IntArrayRef({2, 4}));
    REQUIRE(reconstruction.gt(0).all().item<bool>());
    REQUIRE(reconstruction.lt(1).all().item<bool>());
}

TEST_CASE("A saturated decoder still yields a finite cost and update", "[model]") {
    auto options = small_model_options(4, 2, 2);
    options.optimizer = Optimizer::SGD({.learning_rate = 1e-3});
    Model model(options);
    {
        // Sigmoid rounds to exactly 1 (or 0) in float32 at these biases.
        torch::NoGradGuard no_grad{};
        auto bias = model.network_parameters().generation.out_mean.bias;
        bias.copy_(torch::tensor({200.0f, 200.0f, -200.0f, -200.0f}));
    }
    REQUIRE(torch::equal(model.generate(torch::zeros({1, 2})), torch::tensor({{1.0f, 1.0f, 0.0f, 0.0f}})));

    // Every pixel disagrees with its saturated prediction.
    const auto inputs = torch::tensor({{0.0f, 0.0f, 1.0f, 1.0f}, {0.0f, 0.0f, 1.0f, 1.0f}});
    REQUIRE(std::isfinite(model.cost(inputs)));

    const double cost = model.partial_fit(inputs);
    REQUIRE(std::isfinite(cost));
    for (const auto& parameter : model.parameters()) {
        REQUIRE(torch::isfinite(parameter).all().item<bool>());
    }
}

TEST_CASE("Sampling operations are bound to the batch size", "[model]") {
    Model model(small_model_options());

    REQUIRE_THROWS_AS(model.reconstruct(binary_inputs(3, 16, 1)), std::invalid_argument);
    REQUIRE_THROWS_AS(model.partial_fit(binary_inputs(5, 16, 1)), std::invalid_argument);
    REQUIRE_THROWS_AS(model.cost(binary_inputs(2, 16, 1)), std::invalid_argument);
    REQUIRE_THROWS_AS(model.transform(binary_inputs(4, 15, 1)), std::invalid_argument);
    REQUIRE_THROWS_WITH(model.reconstruct(binary_inputs(3, 16, 1)), Catch::Contains("(4, 16)"));
}

TEST_CASE("partial_fit updates the parameters", "[model]") {
    for (const auto& optimizer : {Optimizer::Descriptor{Optimizer::Adam({.learning_rate = 1e-2})},
                                  Optimizer::Descriptor{Optimizer::SGD({.learning_rate = 1e-2})}}) {
        auto options = small_model_options();
        options.optimizer = optimizer;
        Model model(options);
        const auto inputs = binary_inputs(4, 16, 11);
        const auto before = model.transform(inputs);

        const double cost = model.partial_fit(inputs);
        REQUIRE(std::isfinite(cost));
        REQUIRE(cost > 0.0);
        REQUIRE(model.steps() == 1);
        REQUIRE_FALSE(torch::equal(before, model.transform(inputs)));
    }
}

TEST_CASE("Requesting CUDA without support fails loudly", "[model]") {
    Model model(small_model_options());
    if (!torch::cuda::is_available()) {
        REQUIRE_THROWS_AS(model.to_device(true), std::runtime_error);
    }
    model.to_device(false);
    REQUIRE(model.device().is_cpu());
}
