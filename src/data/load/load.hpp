#ifndef LATENT_LOAD_HPP
#define LATENT_LOAD_HPP
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>


#include <torch/torch.h>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>

namespace Latent::Data::Load {
    namespace Details {
        template <class Tensor>
        Tensor apply_fraction(Tensor tensor, std::size_t count) {
            if (tensor.dim() == 0) {
                return tensor;
            }
            if (tensor.size(0) <= static_cast<int64_t>(count)) {
                return tensor;
            }
            const auto copy_count = static_cast<int64_t>(count);
            return tensor.narrow(0, 0, copy_count).clone();
        }

        inline std::size_t fraction_count(float fraction, std::size_t total) {
            if (!std::isfinite(fraction) || fraction < 0.0f || fraction > 1.0f) {
                throw std::invalid_argument("Dataset fractions must lie in [0, 1].");
            }
            return std::clamp<std::size_t>(
                static_cast<std::size_t>(std::round(fraction * static_cast<float>(total))), 0, total);
        }

        // (N, 1, rows, cols) uint8 -> (N, rows*cols) float32, optionally scaled to [0, 1].
        inline torch::Tensor flatten_images(const torch::Tensor& tensor, bool normalise) {
            auto images = tensor.to(torch::kFloat32);
            if (normalise) {
                images = images / 255.0f;
            }
            return images.reshape({images.size(0), -1}).contiguous();
        }

        inline std::filesystem::path resolve_mnist_root(const std::string& root) {
            const std::array<std::filesystem::path, 3> candidates = {
                std::filesystem::path(root),
                std::filesystem::path(root) / "MNIST",
                std::filesystem::path(root) / "MNIST" / "raw"
            };

            const std::array<const char*, 4> required_files = {
                "train-images-idx3-ubyte",
                "train-labels-idx1-ubyte",
                "t10k-images-idx3-ubyte",
                "t10k-labels-idx1-ubyte"
            };

            for (const auto& candidate : candidates) {
                if (!std::filesystem::exists(candidate)) {
                    continue;
                }

                const bool has_all_files = std::all_of(required_files.begin(), required_files.end(), [&](const char* file) {
                    return std::filesystem::exists(candidate / file);
                });

                if (has_all_files) {
                    return candidate;
                }
            }

            throw std::runtime_error("Unable to locate MNIST dataset in the provided root: " + root);
        }

        inline std::uint32_t read_big_endian_u32(std::ifstream& file, const std::filesystem::path& file_path, const char* context) {
            std::array<std::uint8_t, 4> buffer{};
            if (!file.read(reinterpret_cast<char*>(buffer.data()), 4)) {
                throw std::runtime_error("Failed to read " + std::string(context) + " from " + file_path.string());
            }

            return (static_cast<std::uint32_t>(buffer[0]) << 24U) |
                   (static_cast<std::uint32_t>(buffer[1]) << 16U) |
                   (static_cast<std::uint32_t>(buffer[2]) << 8U) |
                   static_cast<std::uint32_t>(buffer[3]);
        }

        inline torch::Tensor read_idx_images(const std::filesystem::path& file_path) {
            std::ifstream file(file_path, std::ios::binary);
            if (!file) {
                throw std::runtime_error("Failed to open MNIST image file: " + file_path.string());
            }

            const auto magic = read_big_endian_u32(file, file_path, "magic number");
            if (magic != 2051) {
                throw std::runtime_error("Unexpected MNIST image file magic number in " + file_path.string());
            }

            const auto count = static_cast<int64_t>(read_big_endian_u32(file, file_path, "image count"));
            const auto rows = static_cast<int64_t>(read_big_endian_u32(file, file_path, "rows"));
            const auto cols = static_cast<int64_t>(read_big_endian_u32(file, file_path, "columns"));

            if (rows <= 0 || cols <= 0) {
                throw std::runtime_error("MNIST image dimensions must be positive in file: " + file_path.string());
            }

            const auto expected_size = static_cast<std::size_t>(count * rows * cols);
            std::vector<std::uint8_t> buffer(expected_size);
            if (!file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()))) {
                throw std::runtime_error("Failed to read MNIST image payload from: " + file_path.string());
            }

            if (static_cast<std::size_t>(file.gcount()) != expected_size) {
                throw std::runtime_error("MNIST image file truncated: " + file_path.string());
            }

            auto tensor = torch::empty({count, 1, rows, cols}, torch::kUInt8);
            std::memcpy(tensor.data_ptr<std::uint8_t>(), buffer.data(), buffer.size());
            return tensor;
        }

        inline torch::Tensor read_idx_labels(const std::filesystem::path& file_path) {
            std::ifstream file(file_path, std::ios::binary);
            if (!file) {
                throw std::runtime_error("Failed to open MNIST label file: " + file_path.string());
            }

            const auto magic = read_big_endian_u32(file, file_path, "magic number");
            if (magic != 2049) {
                throw std::runtime_error("Unexpected MNIST label file magic number in " + file_path.string());
            }

            const auto count = static_cast<int64_t>(read_big_endian_u32(file, file_path, "label count"));

            std::vector<std::uint8_t> buffer(static_cast<std::size_t>(count));
            if (!file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()))) {
                throw std::runtime_error("Failed to read MNIST label payload from: " + file_path.string());
            }

            if (static_cast<std::size_t>(file.gcount()) != buffer.size()) {
                throw std::runtime_error("MNIST label file truncated: " + file_path.string());
            }

            auto tensor = torch::empty({count}, torch::kInt64);
            auto accessor = tensor.accessor<int64_t, 1>();
            for (int64_t index = 0; index < count; ++index) {
                accessor[index] = static_cast<int64_t>(buffer[static_cast<std::size_t>(index)]);
            }

            return tensor;
        }

        inline bool is_supported_image(const std::filesystem::path& path) {
            auto extension = path.extension().string();
            std::transform(extension.begin(), extension.end(), extension.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            static const std::array<const char*, 6> supported = {".png", ".pgm", ".bmp", ".jpg", ".jpeg", ".tif"};
            return std::any_of(supported.begin(), supported.end(), [&](const char* candidate) {
                return extension == candidate;
            });
        }

        inline std::vector<std::filesystem::path> collect_image_files(const std::filesystem::path& directory) {
            std::vector<std::filesystem::path> files;
            for (const auto& entry : std::filesystem::directory_iterator(directory)) {
                if (entry.is_regular_file() && is_supported_image(entry.path())) {
                    files.push_back(entry.path());
                }
            }
            std::sort(files.begin(), files.end());
            return files;
        }

        inline torch::Tensor read_grayscale_image(const std::filesystem::path& file_path, int rows, int cols, bool normalise) {
            cv::Mat image = cv::imread(file_path.string(), cv::IMREAD_GRAYSCALE);
            if (image.empty()) {
                throw std::runtime_error("Failed to decode image: " + file_path.string());
            }
            if (image.rows != rows || image.cols != cols) {
                cv::Mat resized;
                cv::resize(image, resized, cv::Size(cols, rows), 0.0, 0.0, cv::INTER_AREA);
                image = resized;
            }

            cv::Mat image_float;
            const double scale = normalise ? (1.0 / 255.0) : 1.0;
            image.convertTo(image_float, CV_32F, scale);
            if (!image_float.isContinuous()) {
                image_float = image_float.clone();
            }
            return torch::from_blob(image_float.data, {static_cast<int64_t>(rows) * cols},
                                    torch::TensorOptions().dtype(torch::kFloat32)).clone();
        }
    }

    struct ImageFolderOptions {
        int rows{28};
        int cols{28};
        bool normalise{true};
    };

    // Flattened MNIST: (N, 784) float images and (N) int64 labels for both splits.
    [[nodiscard]] inline std::tuple<torch::Tensor, torch::Tensor, torch::Tensor, torch::Tensor>
    MNIST(const std::string& root, float train_fraction = 1.0f, float test_fraction = 1.0f, bool normalise = true) {
        const auto dataset_root = Details::resolve_mnist_root(root);

        auto train_inputs = Details::read_idx_images(dataset_root / "train-images-idx3-ubyte");
        auto train_targets = Details::read_idx_labels(dataset_root / "train-labels-idx1-ubyte");
        auto test_inputs = Details::read_idx_images(dataset_root / "t10k-images-idx3-ubyte");
        auto test_targets = Details::read_idx_labels(dataset_root / "t10k-labels-idx1-ubyte");

        if (train_inputs.size(0) != train_targets.size(0)) {
            throw std::runtime_error("MNIST training images and labels count mismatch");
        }

        if (test_inputs.size(0) != test_targets.size(0)) {
            throw std::runtime_error("MNIST test images and labels count mismatch");
        }

        const auto effective_train = Details::fraction_count(train_fraction, static_cast<std::size_t>(train_inputs.size(0)));
        const auto effective_test = Details::fraction_count(test_fraction, static_cast<std::size_t>(test_inputs.size(0)));

        train_inputs = Details::apply_fraction(std::move(train_inputs), effective_train);
        train_targets = Details::apply_fraction(std::move(train_targets), effective_train);
        test_inputs = Details::apply_fraction(std::move(test_inputs), effective_test);
        test_targets = Details::apply_fraction(std::move(test_targets), effective_test);

        return {Details::flatten_images(train_inputs, normalise), train_targets,
                Details::flatten_images(test_inputs, normalise), test_targets};
    }

    // One sub-directory per class (sorted names give the label), or a flat folder labelled 0.
    [[nodiscard]] inline std::pair<torch::Tensor, torch::Tensor>
    ImageFolder(const std::string& root, const ImageFolderOptions& options = {}) {
        namespace fs = std::filesystem;
        if (options.rows <= 0 || options.cols <= 0) {
            throw std::invalid_argument("ImageFolder requires positive image dimensions.");
        }
        if (!fs::is_directory(root)) {
            throw std::runtime_error("Image folder does not exist: " + root);
        }

        std::vector<fs::path> class_directories;
        for (const auto& entry : fs::directory_iterator(root)) {
            if (entry.is_directory()) {
                class_directories.push_back(entry.path());
            }
        }
        std::sort(class_directories.begin(), class_directories.end());
        if (class_directories.empty()) {
            class_directories.emplace_back(root);
        }

        std::vector<torch::Tensor> samples;
        std::vector<int64_t> labels;
        for (std::size_t label = 0; label < class_directories.size(); ++label) {
            for (const auto& file : Details::collect_image_files(class_directories[label])) {
                samples.push_back(Details::read_grayscale_image(file, options.rows, options.cols, options.normalise));
                labels.push_back(static_cast<int64_t>(label));
            }
        }

        if (samples.empty()) {
            throw std::runtime_error("Image folder contains no supported files: " + root);
        }

        auto label_tensor = torch::tensor(labels, torch::TensorOptions().dtype(torch::kInt64));
        return {torch::stack(samples), label_tensor};
    }
}

#endif //LATENT_LOAD_HPP
