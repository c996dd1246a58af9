#ifndef LATENT_PLOT_DETAILS_RENDER_HPP
#define LATENT_PLOT_DETAILS_RENDER_HPP

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "../../utils/check.hpp"
#include "../../utils/gnuplot.hpp"
#include "canvas.hpp"
#include "image.hpp"

namespace Latent::Plot {
    struct RenderOptions {
        std::string title{};
        std::optional<std::string> output{};  // PNG path; opens a window when empty
    };

    struct ReconstructionOptions {
        std::int64_t count{5};
        ImageShape shape{};
        std::string inputTitle{"Test input"};
        std::string reconstructionTitle{"Reconstruction"};
        std::optional<std::string> output{};
    };

    struct ScatterOptions {
        std::string title{"Latent space"};
        double pointSize{0.5};
        std::optional<std::string> output{};
    };
}

namespace Latent::Plot::Details {
    inline Utils::Gnuplot make_plotter(const std::optional<std::string>& output)
    {
        Utils::Gnuplot::TerminalOptions terminal{};
        terminal.output = output;
        return Utils::Gnuplot{"gnuplot", std::move(terminal)};
    }

    inline std::string next_datablock_id()
    {
        static std::atomic<std::size_t> datablockCounter{0};
        return "Latent_image_" + std::to_string(++datablockCounter);
    }

    // Sends one grayscale image as a datablock and plots it; row 0 is drawn on top.
    inline void plot_grayscale(Utils::Gnuplot& plotter, const torch::Tensor& image)
    {
        auto prepared = prepare_grayscale_tensor(image);
        const auto height = prepared.size(0);
        const auto width = prepared.size(1);

        std::ostringstream xrange;
        xrange << "set xrange [-0.5:" << format_double(static_cast<double>(width) - 0.5) << ']';
        plotter.command(xrange.str());
        std::ostringstream yrange;
        yrange << "set yrange [" << format_double(static_cast<double>(height) - 0.5) << ":-0.5]";
        plotter.command(yrange.str());
        plotter.command("set size ratio -1");
        plotter.command("set cbrange [0:1]");
        plotter.setPalette("gray");

        const auto datablockId = next_datablock_id();
        plotter.defineDatablock(datablockId, build_grayscale_writer(prepared));
        plotter.command("plot $" + datablockId + " using 1:2:3 with image");
    }

    inline void prepare_image_axes(Utils::Gnuplot& plotter)
    {
        plotter.setMouse(false);
        plotter.unsetKey();
        plotter.command("unset colorbox");
        plotter.command("set view map");
        plotter.command("unset xtics");
        plotter.command("unset ytics");
    }

    inline void RenderCanvas(const torch::Tensor& canvas, const RenderOptions& options)
    {
        auto plotter = make_plotter(options.output);
        prepare_image_axes(plotter);
        if (!options.title.empty()) {
            plotter.setTitle(options.title);
        }
        plot_grayscale(plotter, canvas);
    }

    // One row per example: original on the left, reconstruction on the right.
    inline void RenderPairs(const torch::Tensor& originals,
                            const torch::Tensor& reconstructions,
                            const ReconstructionOptions& options)
    {
        Utils::Check::SameShape(originals, reconstructions, "Reconstructions");
        Utils::Check::Matrix(originals, -1, options.shape.rows * options.shape.cols, "Reconstructions");
        if (options.count <= 0) {
            throw std::invalid_argument("Reconstructions requires a positive count.");
        }
        const auto count = std::min<std::int64_t>(options.count, originals.size(0));
        const auto lhs = as_cpu_contiguous(originals);
        const auto rhs = as_cpu_contiguous(reconstructions);

        auto plotter = make_plotter(options.output);
        std::ostringstream layout;
        layout << "layout " << count << ",2";
        plotter.beginMultiplot(layout.str());
        prepare_image_axes(plotter);

        for (std::int64_t index = 0; index < count; ++index) {
            plotter.setTitle(options.inputTitle);
            plot_grayscale(plotter, lhs[index].reshape({options.shape.rows, options.shape.cols}));
            plotter.setTitle(options.reconstructionTitle);
            plot_grayscale(plotter, rhs[index].reshape({options.shape.rows, options.shape.cols}));
        }
        plotter.endMultiplot();
    }

    // Latent means coloured by class label, one dataset per label.
    inline void RenderScatter(const torch::Tensor& z_mean, const torch::Tensor& labels, const ScatterOptions& options)
    {
        Utils::Check::Matrix(z_mean, -1, 2, "LatentScatter");
        if (!labels.defined() || labels.dim() != 1 || labels.size(0) != z_mean.size(0)) {
            throw std::invalid_argument("LatentScatter expects one label per latent point.");
        }

        const auto points = as_cpu_contiguous(z_mean).to(torch::kFloat64);
        const auto targets = as_cpu_contiguous(labels).to(torch::kInt64);
        auto point_accessor = points.accessor<double, 2>();
        auto label_accessor = targets.accessor<int64_t, 1>();

        std::map<int64_t, Utils::Gnuplot::DataSet2D> groups;
        for (int64_t index = 0; index < points.size(0); ++index) {
            auto& group = groups[label_accessor[index]];
            group.x.push_back(point_accessor[index][0]);
            group.y.push_back(point_accessor[index][1]);
        }

        const auto palette = build_color_palette();
        std::vector<Utils::Gnuplot::DataSet2D> datasets;
        datasets.reserve(groups.size());
        std::size_t colour = 0;
        for (auto& [label, group] : groups) {
            group.title = std::to_string(label);
            group.style = Utils::Gnuplot::PlotStyle{Utils::Gnuplot::PlotMode::Points,
                                                    palette[colour++ % palette.size()],
                                                    7,
                                                    options.pointSize};
            datasets.push_back(std::move(group));
        }

        auto plotter = make_plotter(options.output);
        plotter.setMouse(true);
        if (!options.title.empty()) {
            plotter.setTitle(options.title);
        }
        plotter.setXLabel("z_1");
        plotter.setYLabel("z_2");
        plotter.setGrid(true);
        plotter.setKey("outside right");
        plotter.plot(datasets);
    }

    // Canvas values are clamped to [0, 1] and written as an 8-bit grayscale image.
    inline void SaveCanvas(const torch::Tensor& canvas, const std::string& path)
    {
        auto prepared = prepare_grayscale_tensor(canvas);
        auto bytes = prepared.clamp(0.0, 1.0).mul(255.0).round().to(torch::kUInt8).contiguous();
        cv::Mat image(static_cast<int>(bytes.size(0)), static_cast<int>(bytes.size(1)), CV_8UC1, bytes.data_ptr<std::uint8_t>());
        if (!cv::imwrite(path, image)) {
            throw std::runtime_error("Failed to write image: " + path);
        }
    }
}

#endif //LATENT_PLOT_DETAILS_RENDER_HPP
