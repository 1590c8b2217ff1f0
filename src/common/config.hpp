#ifndef REVERIE_COMMON_CONFIG_HPP
#define REVERIE_COMMON_CONFIG_HPP

#include <cmath>
#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "../network/adapter.hpp"
#include "../octave/octave.hpp"
#include "../utils/log.hpp"

namespace Reverie {
    // Tunables of one dream() call. Defaults suit a 2 GB GPU with the BVLC GoogLeNet.
    struct DreamOptions {
        bool progress{true};
        // Number of octaves, the input size included.
        int64_t scale{4};
        // Octaves per halving of the image side: 2 shrinks each side by sqrt(2) per octave.
        int64_t per_octave{2};
        // Gradient ascent steps per octave.
        int64_t steps{10};
        // Median per-pixel change of one step.
        double step_size{1.5};
        int64_t jitter{32};
        // Largest tile edge pushed through the network at once; lower it when the device runs out of memory.
        int64_t max_tile_size{512};
    };

    namespace Config {
        struct NetworkSettings {
            std::string model_path{"bvlc_googlenet.pt"};
            std::optional<int> gpu{};
            std::string input_layer{"data"};
            Network::Normalization normalization{};
        };

        struct Settings {
            NetworkSettings network{};
            DreamOptions dream{};
            std::string end_layer{"inception_4c/output"};
            Utils::Log::Level log_level{Utils::Log::Level::Info};
        };

        inline void Validate(const DreamOptions& options)
        {
            auto fail = [](const char* field, const auto& value, const char* requirement) {
                std::ostringstream message;
                message << "Dream option '" << field << "' " << requirement << " (received " << value << ").";
                throw std::invalid_argument(message.str());
            };
            if (options.scale < 1) fail("scale", options.scale, "must be at least 1");
            if (options.per_octave < 1) fail("per_octave", options.per_octave, "must be at least 1");
            if (options.steps < 0) fail("steps", options.steps, "must not be negative");
            if (!std::isfinite(options.step_size)) fail("step_size", options.step_size, "must be finite");
            if (options.jitter < 0) fail("jitter", options.jitter, "must not be negative");
            if (options.max_tile_size < 1) fail("max_tile_size", options.max_tile_size, "must be at least 1");
        }

        inline Octave::AscentOptions ToAscentOptions(const DreamOptions& options)
        {
            Octave::AscentOptions ascent;
            ascent.steps = options.steps;
            ascent.step_size = options.step_size;
            ascent.jitter = options.jitter;
            ascent.max_tile_size = options.max_tile_size;
            return ascent;
        }
    }
}

#endif // REVERIE_COMMON_CONFIG_HPP
