#ifndef LATENT_GNUPLOT_HPP
#define LATENT_GNUPLOT_HPP

#include <algorithm>
#include <cstdio>
#include <functional>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace Latent::Utils {
    // Pipe to a persistent gnuplot process. Commands are flushed one by one; image data goes
    // through datablocks since '-' cannot be read inside a multiplot.
    class Gnuplot {
    public:
        enum class PlotMode {
            Lines,
            Points
        };

        struct PlotStyle {
            PlotMode mode{PlotMode::Lines};
            std::optional<std::string> lineColor{};
            std::optional<int> pointType{};
            std::optional<double> pointSize{};
        };

        struct DataSet2D {
            std::vector<double> x{};
            std::vector<double> y{};
            std::string title{};
            PlotStyle style{};
        };

        struct TerminalOptions {
            std::string terminal{"qt"};
            bool enhanced{true};
            // PNG file written through the pngcairo terminal instead of a window.
            std::optional<std::string> output{};
        };

        explicit Gnuplot(std::string command = "gnuplot")
            : Gnuplot(std::move(command), TerminalOptions{}) {}

        explicit Gnuplot(std::string command, TerminalOptions terminalOptions)
            : terminalOptions_(std::move(terminalOptions))
        {
            if (command.find("-persist") == std::string::npos) {
                command += " -persist";
            }
            pipe_ = popen(command.c_str(), "w");
            if (pipe_ == nullptr) {
                throw std::runtime_error("Failed to open pipe to gnuplot");
            }
            try {
                std::string terminal = terminalOptions_.output ? std::string{"pngcairo"} : terminalOptions_.terminal;
                if (terminalOptions_.enhanced) {
                    terminal += " enhanced";
                }
                this->command("set terminal " + terminal);
                if (terminalOptions_.output) {
                    this->command("set output '" + EscapeSingleQuotes(*terminalOptions_.output) + "'");
                }
            } catch (const std::exception&) {
                close();
                throw;
            }
        }

        ~Gnuplot() {
            close();
        }

        Gnuplot(const Gnuplot&) = delete;
        Gnuplot& operator=(const Gnuplot&) = delete;

        void command(const std::string& cmd) {
            writeLine(cmd);
            flush();
        }

        void setTitle(const std::string& title) { command("set title '" + EscapeSingleQuotes(title) + "'"); }
        void setXLabel(const std::string& label) { command("set xlabel '" + EscapeSingleQuotes(label) + "'"); }
        void setYLabel(const std::string& label) { command("set ylabel '" + EscapeSingleQuotes(label) + "'"); }
        void setGrid(bool enable = true) { command(std::string(enable ? "set" : "unset") + " grid"); }
        void setKey(const std::string& options) { command("set key " + options); }
        void unsetKey() { command("unset key"); }
        void setPalette(const std::string& options) { command("set palette " + options); }
        void beginMultiplot(const std::string& options) { command("set multiplot " + options); }
        void endMultiplot() { command("unset multiplot"); }

        // Mouse interaction only exists on window terminals.
        void setMouse(bool enable = true) {
            if (!terminalOptions_.output) {
                command(std::string(enable ? "set" : "unset") + " mouse");
            }
        }

        void plot(const std::vector<DataSet2D>& dataSets) {
            if (dataSets.empty()) {
                throw std::invalid_argument("No datasets provided");
            }
            std::ostringstream header;
            header << "plot ";
            for (std::size_t i = 0; i < dataSets.size(); ++i) {
                header << (i > 0 ? ", '-' " : "'-' ") << describe(dataSets[i]);
            }
            writeLine(header.str());
            for (const auto& dataSet : dataSets) {
                const std::size_t size = std::min(dataSet.x.size(), dataSet.y.size());
                for (std::size_t i = 0; i < size; ++i) {
                    if (std::fprintf(pipe_, "%.*g %.*g\n", 15, dataSet.x[i], 15, dataSet.y[i]) < 0) {
                        throw std::runtime_error("Failed to write 2D data to gnuplot");
                    }
                }
                writeLine("e");
            }
            flush();
        }

        void defineDatablock(const std::string& name, const std::function<void(std::FILE*)>& writer) {
            if (name.empty() || !writer) {
                throw std::invalid_argument("defineDatablock requires a name and a writer");
            }
            const std::string blockName = name.front() == '$' ? name : "$" + name;
            writeLine(blockName + " << EOD");
            writer(pipe_);
            writeLine("EOD");
            flush();
        }

        static std::string EscapeSingleQuotes(const std::string& input) {
            std::string escaped;
            escaped.reserve(input.size());
            for (char ch : input) {
                if (ch == '\'') {
                    escaped += "\\'";
                } else {
                    escaped += ch;
                }
            }
            return escaped;
        }

    private:
        TerminalOptions terminalOptions_;
        std::FILE* pipe_{nullptr};

        void close() {
            if (pipe_ != nullptr) {
                pclose(pipe_);
                pipe_ = nullptr;
            }
        }

        void writeLine(const std::string& line) {
            if (pipe_ == nullptr) {
                throw std::runtime_error("gnuplot process is not available");
            }
            if (std::fputs((line + '\n').c_str(), pipe_) < 0) {
                throw std::runtime_error("Failed to write to gnuplot");
            }
        }

        void flush() {
            if (std::fflush(pipe_) != 0) {
                throw std::runtime_error("Failed to flush gnuplot pipe");
            }
        }

        static std::string describe(const DataSet2D& dataSet) {
            std::ostringstream stream;
            if (dataSet.title.empty()) {
                stream << "notitle ";
            } else {
                stream << "title '" << EscapeSingleQuotes(dataSet.title) << "' ";
            }
            const auto& style = dataSet.style;
            stream << "with " << (style.mode == PlotMode::Points ? "points" : "lines");
            if (style.lineColor) {
                stream << " lc rgb '" << EscapeSingleQuotes(*style.lineColor) << "'";
            }
            if (style.pointType) {
                stream << " pt " << *style.pointType;
            }
            if (style.pointSize) {
                stream << " ps " << *style.pointSize;
            }
            return stream.str();
        }
    };
}

#endif //LATENT_GNUPLOT_HPP
