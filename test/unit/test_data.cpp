#include <catch2/catch.hpp>
#include "test_helpers.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

using namespace Latent;

namespace {
    void write_be32(std::ofstream& file, std::uint32_t value) {
        const char bytes[4] = {static_cast<char>((value >> 24U) & 0xFFU),
                               static_cast<char>((value >> 16U) & 0xFFU),
                               static_cast<char>((value >> 8U) & 0xFFU),
                               static_cast<char>(value & 0xFFU)};
        file.write(bytes, 4);
    }

    // count images of 2x2 pixels; pixel j of image i holds 10 * i + j.
    void write_images(const std::filesystem::path& path, std::uint32_t count, std::uint32_t magic = 2051) {
        std::ofstream file(path, std::ios::binary);
        write_be32(file, magic);
        write_be32(file, count);
        write_be32(file, 2);
        write_be32(file, 2);
        for (std::uint32_t i = 0; i < count; ++i) {
            for (std::uint32_t j = 0; j < 4; ++j) {
                file.put(static_cast<char>(10 * i + j));
            }
        }
    }

    void write_labels(const std::filesystem::path& path, std::uint32_t count) {
        std::ofstream file(path, std::ios::binary);
        write_be32(file, 2049);
        write_be32(file, count);
        for (std::uint32_t i = 0; i < count; ++i) {
            file.put(static_cast<char>(i % 10));
        }
    }

    void write_mnist(const std::filesystem::path& root, std::uint32_t train, std::uint32_t test) {
        std::filesystem::create_directories(root);
        write_images(root / "train-images-idx3-ubyte", train);
        write_labels(root / "train-labels-idx1-ubyte", train);
        write_images(root / "t10k-images-idx3-ubyte", test);
        write_labels(root / "t10k-labels-idx1-ubyte", test);
    }

    void write_png(const std::filesystem::path& path, int rows, int cols, unsigned char value) {
        const cv::Mat image(rows, cols, CV_8UC1, cv::Scalar(value));
        REQUIRE(cv::imwrite(path.string(), image));
    }
}

TEST_CASE("MNIST images are flattened to one row per example", "[data][mnist]") {
    TempDir dir("latent_mnist");
    write_mnist(dir.path(), 4, 3);

    auto [x_train, y_train, x_test, y_test] = Data::Load::MNIST(dir.path().string());

    REQUIRE(x_train.sizes() == torch::IntArrayRef({4, 4}));
    REQUIRE(x_test.sizes() == torch::IntArrayRef({3, 4}));
    REQUIRE(x_train.dtype() == torch::kFloat32);
    REQUIRE(y_train.dtype() == torch::kInt64);
    REQUIRE(x_train[1][2].item<float>() == Approx(12.0f / 255.0f));
    REQUIRE(torch::equal(y_test, torch::tensor({0, 1, 2}, torch::kInt64)));
    REQUIRE(in_unit_interval(x_train));
}

TEST_CASE("MNIST loader honours fractions, raw values and nested layouts", "[data][mnist]") {
    TempDir dir("latent_mnist");
    write_mnist(dir.path() / "MNIST" / "raw", 4, 2);

    auto [x_train, y_train, x_test, y_test] = Data::Load::MNIST(dir.path().string(), 0.5f, 1.0f, false);
    REQUIRE(x_train.size(0) == 2);
    REQUIRE(y_train.size(0) == 2);
    REQUIRE(x_test.size(0) == 2);
    REQUIRE(x_train[1][3].item<float>() == Approx(13.0f));

    REQUIRE_THROWS_AS(Data::Load::MNIST(dir.path().string(), 1.5f), std::invalid_argument);
}

TEST_CASE("MNIST loader reports missing and corrupt files", "[data][mnist]") {
    TempDir dir("latent_mnist");
    REQUIRE_THROWS_AS(Data::Load::MNIST(dir.path().string()), std::runtime_error);

    write_mnist(dir.path(), 2, 2);
    write_images(dir.path() / "t10k-images-idx3-ubyte", 2, 1234);
    REQUIRE_THROWS_WITH(Data::Load::MNIST(dir.path().string()), Catch::Contains("magic number"));
}

TEST_CASE("ImageFolder labels classes by sorted directory name", "[data][images]") {
    TempDir dir("latent_images");
    std::filesystem::create_directories(dir.path() / "b_second");
    std::filesystem::create_directories(dir.path() / "a_first");
    write_png(dir.path() / "a_first" / "0.png", 4, 4, 255);
    write_png(dir.path() / "a_first" / "1.png", 4, 4, 0);
    write_png(dir.path() / "b_second" / "0.png", 8, 8, 255);
    std::ofstream(dir.path() / "b_second" / "notes.txt") << "ignored";

    auto [images, labels] = Data::Load::ImageFolder(dir.path().string(), {.rows = 4, .cols = 4});

    REQUIRE(images.sizes() == torch::IntArrayRef({3, 16}));
    REQUIRE(torch::equal(labels, torch::tensor({0, 0, 1}, torch::kInt64)));
    REQUIRE(images[0].min().item<float>() == Approx(1.0f));
    REQUIRE(images[1].max().item<float>() == Approx(0.0f));
    REQUIRE(images[2].min().item<float>() == Approx(1.0f));
}

TEST_CASE("ImageFolder rejects unusable folders", "[data][images]") {
    TempDir dir("latent_images");
    REQUIRE_THROWS_AS(Data::Load::ImageFolder((dir.path() / "missing").string()), std::runtime_error);
    REQUIRE_THROWS_AS(Data::Load::ImageFolder(dir.path().string()), std::runtime_error);
    REQUIRE_THROWS_AS(Data::Load::ImageFolder(dir.path().string(), {.rows = 0}), std::invalid_argument);
}
