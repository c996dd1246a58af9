#ifndef LATENT_TERMINAL_HPP
#define LATENT_TERMINAL_HPP

#include <string>
#include <string_view>

namespace Latent::Utils::Terminal {
    namespace Colors {
        inline constexpr std::string_view kReset        = "\033[0m";
        inline constexpr std::string_view kBrightBlack  = "\033[90m";
        inline constexpr std::string_view kBrightYellow = "\033[93m";
        inline constexpr std::string_view kTurquoise    = "\033[38;5;49m";
    }

    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }

    inline std::string Tag() {
        return ApplyColor("[Latent]", Colors::kTurquoise);
    }
}

#endif //LATENT_TERMINAL_HPP
