#ifndef LATENT_PLOT_DETAILS_CANVAS_HPP
#define LATENT_PLOT_DETAILS_CANVAS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "../../core.hpp"
#include "../../utils/check.hpp"
#include "image.hpp"

namespace Latent::Plot {
    struct ImageShape {
        std::int64_t rows{28};
        std::int64_t cols{28};
    };

    struct ManifoldOptions {
        std::int64_t nx{20};
        std::int64_t ny{20};
        double min{-3.0};
        double max{3.0};
        ImageShape shape{};
    };
}

namespace Latent::Plot::Details {
    // Lays (N, rows*cols) images out row-major on a (grid_rows*rows, grid_cols*cols) canvas.
    // Unused cells stay black.
    inline torch::Tensor tile(const torch::Tensor& images, std::int64_t grid_rows, std::int64_t grid_cols, const ImageShape& shape)
    {
        if (grid_rows <= 0 || grid_cols <= 0) {
            throw std::invalid_argument("Canvas grid must have positive dimensions.");
        }
        auto flat = as_cpu_contiguous(images).to(torch::kFloat32);
        ::Latent::Utils::Check::Matrix(flat, -1, shape.rows * shape.cols, "Canvas images");

        const auto cells = grid_rows * grid_cols;
        const auto count = std::min<std::int64_t>(flat.size(0), cells);
        auto padded = torch::zeros({cells, shape.rows * shape.cols}, torch::kFloat32);
        padded.narrow(0, 0, count).copy_(flat.narrow(0, 0, count));

        return padded.reshape({grid_rows, grid_cols, shape.rows, shape.cols})
                     .permute({0, 2, 1, 3})
                     .reshape({grid_rows * shape.rows, grid_cols * shape.cols})
                     .contiguous();
    }

    // Pairs each original (left column) with its reconstruction (right column).
    inline torch::Tensor reconstruction_canvas(const torch::Tensor& originals,
                                               const torch::Tensor& reconstructions,
                                               std::int64_t count,
                                               const ImageShape& shape = {})
    {
        ::Latent::Utils::Check::SameShape(originals, reconstructions, "Reconstruction canvas");
        if (count <= 0) {
            throw std::invalid_argument("Reconstruction canvas requires a positive count.");
        }
        count = std::min<std::int64_t>(count, originals.size(0));
        auto lhs = as_cpu_contiguous(originals).narrow(0, 0, count).to(torch::kFloat32);
        auto rhs = as_cpu_contiguous(reconstructions).narrow(0, 0, count).to(torch::kFloat32);
        auto interleaved = torch::stack({lhs, rhs}, 1).reshape({2 * count, -1});
        return tile(interleaved, count, 2, shape);
    }

    // Decodes a regular grid over a 2-D latent space. Latent dimension 0 runs left to right,
    // dimension 1 bottom to top.
    inline torch::Tensor manifold_canvas(::Latent::Model& model, const ManifoldOptions& options = {})
    {
        if (model.architecture().n_z != 2) {
            throw std::invalid_argument("Manifold canvas requires a 2-D latent space, model has n_z = "
                                        + std::to_string(model.architecture().n_z) + ".");
        }
        if (options.nx <= 0 || options.ny <= 0 || !(options.max > options.min)) {
            throw std::invalid_argument("Manifold canvas requires a non-empty grid and min < max.");
        }

        const auto xs = torch::linspace(options.min, options.max, options.nx, torch::kFloat32);
        const auto ys = torch::linspace(options.min, options.max, options.ny, torch::kFloat32);
        auto codes = torch::empty({options.ny * options.nx, 2}, torch::kFloat32);
        auto accessor = codes.accessor<float, 2>();
        auto x_accessor = xs.accessor<float, 1>();
        auto y_accessor = ys.accessor<float, 1>();
        for (std::int64_t row = 0; row < options.ny; ++row) {
            for (std::int64_t col = 0; col < options.nx; ++col) {
                const auto index = row * options.nx + col;
                accessor[index][0] = x_accessor[col];
                accessor[index][1] = y_accessor[options.ny - 1 - row];
            }
        }

        const auto decoded = model.generate(codes);
        return tile(decoded, options.ny, options.nx, options.shape);
    }
}

#endif //LATENT_PLOT_DETAILS_CANVAS_HPP
