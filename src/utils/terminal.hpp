#ifndef REVERIE_UTILS_TERMINAL_HPP
#define REVERIE_UTILS_TERMINAL_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace Reverie::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";

        inline constexpr std::string_view kBrightBlack   = "\033[90m";
        inline constexpr std::string_view kBrightRed     = "\033[91m";

        // Named 256-color convenience
        inline constexpr std::string_view kTurquoise    = "\033[38;5;49m";
        inline constexpr std::string_view kOrange       = "\033[38;5;208m";
    }

    // ---------- Control ----------
    namespace Control {
        inline constexpr std::string_view kEraseToLineEnd   = "\033[K";
    }

    // ---------- Helpers ----------
    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }
}

#endif // REVERIE_UTILS_TERMINAL_HPP
