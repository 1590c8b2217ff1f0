#ifndef REVERIE_UTILS_LOG_HPP
#define REVERIE_UTILS_LOG_HPP

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "terminal.hpp"

namespace Reverie::Utils::Log {
    enum class Level : int { Quiet = 0, Error = 1, Warning = 2, Info = 3, Debug = 4 };

    namespace Details {
        inline std::atomic<int>& threshold()
        {
            static std::atomic<int> level{static_cast<int>(Level::Info)};
            return level;
        }

        inline std::string_view prefix(Level level)
        {
            switch (level) {
                case Level::Error: return "error";
                case Level::Warning: return "warn ";
                case Level::Info: return "info ";
                case Level::Debug: return "debug";
                case Level::Quiet:
                default: return "";
            }
        }

        inline std::string_view color(Level level)
        {
            switch (level) {
                case Level::Error: return Terminal::Colors::kBrightRed;
                case Level::Warning: return Terminal::Colors::kOrange;
                case Level::Info: return Terminal::Colors::kTurquoise;
                case Level::Debug:
                default: return Terminal::Colors::kBrightBlack;
            }
        }

        template <class... Args>
        std::string concat(Args&&... args)
        {
            std::ostringstream stream;
            (stream << ... << std::forward<Args>(args));
            return stream.str();
        }
    }

    inline void SetLevel(Level level) noexcept { Details::threshold().store(static_cast<int>(level)); }

    [[nodiscard]] inline Level GetLevel() noexcept { return static_cast<Level>(Details::threshold().load()); }

    [[nodiscard]] inline bool Enabled(Level level) noexcept
    {
        return level != Level::Quiet && static_cast<int>(level) <= Details::threshold().load();
    }

    inline Level LevelFromString(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (value == "quiet") return Level::Quiet;
        if (value == "error") return Level::Error;
        if (value == "warning" || value == "warn") return Level::Warning;
        if (value == "info") return Level::Info;
        if (value == "debug") return Level::Debug;
        throw std::invalid_argument("Unknown log level '" + value + "'.");
    }

    inline std::string LevelToString(Level level)
    {
        switch (level) {
            case Level::Quiet: return "quiet";
            case Level::Error: return "error";
            case Level::Warning: return "warning";
            case Level::Debug: return "debug";
            case Level::Info:
            default: return "info";
        }
    }

    template <class... Args>
    void Write(Level level, Args&&... args)
    {
        if (!Enabled(level)) {
            return;
        }
        const auto message = Details::concat(std::forward<Args>(args)...);
        auto& stream = (level == Level::Error || level == Level::Warning) ? std::cerr : std::cout;
        stream << Terminal::ApplyColor(Details::prefix(level), Details::color(level)) << ' ' << message << std::endl;
    }

    template <class... Args> void Error(Args&&... args) { Write(Level::Error, std::forward<Args>(args)...); }
    template <class... Args> void Warning(Args&&... args) { Write(Level::Warning, std::forward<Args>(args)...); }
    template <class... Args> void Info(Args&&... args) { Write(Level::Info, std::forward<Args>(args)...); }
    template <class... Args> void Debug(Args&&... args) { Write(Level::Debug, std::forward<Args>(args)...); }
}

#endif // REVERIE_UTILS_LOG_HPP
