#ifndef LATENT_PLOT_HPP
#define LATENT_PLOT_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include <string>
#include <utility>

#include <torch/torch.h>

#include "details/canvas.hpp"
#include "details/image.hpp"
#include "details/render.hpp"

namespace Latent::Plot {
    inline void Render(const torch::Tensor& canvas, const RenderOptions& options = {}) {
        Details::RenderCanvas(canvas, options);
    }

    inline void Reconstructions(const torch::Tensor& originals, const torch::Tensor& reconstructions, const ReconstructionOptions& options = {}) {
        Details::RenderPairs(originals, reconstructions, options);
    }

    inline void LatentScatter(const torch::Tensor& z_mean, const torch::Tensor& labels, const ScatterOptions& options = {}) {
        Details::RenderScatter(z_mean, labels, options);
    }

    [[nodiscard]] inline torch::Tensor Manifold(Model& model, const ManifoldOptions& manifold = {}) {
        return Details::manifold_canvas(model, manifold);
    }

    inline torch::Tensor Manifold(Model& model, const ManifoldOptions& manifold, const RenderOptions& options) {
        auto canvas = Details::manifold_canvas(model, manifold);
        Details::RenderCanvas(canvas, options);
        return canvas;
    }

    inline void Save(const torch::Tensor& canvas, const std::string& path) {
        Details::SaveCanvas(canvas, path);
    }
}

#endif //LATENT_PLOT_HPP
