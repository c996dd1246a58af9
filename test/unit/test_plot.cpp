#include <catch2/catch.hpp>
#include "test_helpers.hpp"

#include <stdexcept>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

using namespace Latent;

TEST_CASE("tile lays images out row by row", "[plot]") {
    // Three 2x2 images filled with 1, 2 and 3 on a 2x2 grid.
    const auto images = torch::stack({torch::full({4}, 1.0f), torch::full({4}, 2.0f), torch::full({4}, 3.0f)});
    const auto canvas = Plot::Details::tile(images, 2, 2, {.rows = 2, .cols = 2});

    REQUIRE(canvas.sizes() == torch::IntArrayRef({4, 4}));
    REQUIRE(canvas[0][0].item<float>() == 1.0f);
    REQUIRE(canvas[1][3].item<float>() == 2.0f);
    REQUIRE(canvas[3][0].item<float>() == 3.0f);
    REQUIRE(canvas[3][3].item<float>() == 0.0f);
}

TEST_CASE("Reconstruction canvas pairs inputs with outputs", "[plot]") {
    const auto originals = torch::zeros({5, 4});
    const auto reconstructions = torch::ones({5, 4});
    const auto canvas = Plot::Details::reconstruction_canvas(originals, reconstructions, 3, {.rows = 2, .cols = 2});

    REQUIRE(canvas.sizes() == torch::IntArrayRef({6, 4}));
    REQUIRE(canvas.narrow(1, 0, 2).max().item<float>() == 0.0f);
    REQUIRE(canvas.narrow(1, 2, 2).min().item<float>() == 1.0f);

    REQUIRE_THROWS_AS(Plot::Details::reconstruction_canvas(originals, torch::ones({4, 4}), 3), std::invalid_argument);
}

TEST_CASE("Manifold canvas decodes a grid over the latent plane", "[plot]") {
    Model model(small_model_options(4, 2, 2));
    const Plot::ManifoldOptions options{.nx = 3, .ny = 2, .min = -2.0, .max = 2.0, .shape = {.rows = 2, .cols = 2}};
    const auto canvas = Plot::Manifold(model, options);

    REQUIRE(canvas.sizes() == torch::IntArrayRef({4, 6}));
    REQUIRE(in_unit_interval(canvas));

    // Top-left cell holds the lowest x and the highest y, bottom-right the opposite corner.
    const auto top_left = model.generate(torch::tensor({{-2.0f, 2.0f}})).reshape({2, 2});
    const auto bottom_right = model.generate(torch::tensor({{2.0f, -2.0f}})).reshape({2, 2});
    REQUIRE(torch::allclose(canvas.narrow(0, 0, 2).narrow(1, 0, 2), top_left));
    REQUIRE(torch::allclose(canvas.narrow(0, 2, 2).narrow(1, 4, 2), bottom_right));
}

TEST_CASE("Manifold requires a two dimensional latent space", "[plot]") {
    Model model(small_model_options(4, 3, 2));
    REQUIRE_THROWS_AS(Plot::Manifold(model), std::invalid_argument);
}

TEST_CASE("Plots validate their inputs before rendering", "[plot]") {
    REQUIRE_THROWS_AS(Plot::LatentScatter(torch::zeros({5, 3}), torch::zeros({5}, torch::kInt64)), std::invalid_argument);
    REQUIRE_THROWS_AS(Plot::LatentScatter(torch::zeros({5, 2}), torch::zeros({4}, torch::kInt64)), std::invalid_argument);
    REQUIRE_THROWS_AS(Plot::Reconstructions(torch::zeros({2, 784}), torch::zeros({3, 784})), std::invalid_argument);
}

TEST_CASE("Save writes the canvas as an 8-bit grayscale image", "[plot]") {
    TempDir dir("latent_plot");
    const auto path = (dir.path() / "canvas.png").string();
    auto canvas = torch::zeros({3, 5});
    canvas[0][0] = 1.0f;
    canvas[2][4] = 2.0f;

    Plot::Save(canvas, path);
    const auto image = cv::imread(path, cv::IMREAD_GRAYSCALE);

    REQUIRE(image.rows == 3);
    REQUIRE(image.cols == 5);
    REQUIRE(image.at<unsigned char>(0, 0) == 255);
    REQUIRE(image.at<unsigned char>(1, 1) == 0);
    REQUIRE(image.at<unsigned char>(2, 4) == 255);
}
