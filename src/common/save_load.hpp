#ifndef REVERIE_COMMON_SAVE_LOAD_HPP
#define REVERIE_COMMON_SAVE_LOAD_HPP
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "../utils/log.hpp"
#include "config.hpp"

namespace Reverie::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;

    namespace Detail {
        inline std::string to_lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char character) {
                return static_cast<char>(std::tolower(character));
            });
            return value;
        }

        // Absent keys keep `fallback`; present but malformed keys are an error.
        template <class T>
        T get_or(const PropertyTree& tree, const std::string& key, const T& fallback, const std::string& context)
        {
            const auto node = tree.get_child_optional(key);
            if (!node) {
                return fallback;
            }
            try {
                return node->get_value<T>();
            } catch (const boost::property_tree::ptree_bad_data&) {
                std::ostringstream message;
                message << "Invalid value '" << node->data() << "' for field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
        }

        template <class T>
        std::vector<T> read_array(const PropertyTree& tree, const std::string& context)
        {
            std::vector<T> values;
            values.reserve(tree.size());
            for (const auto& child : tree) {
                try {
                    values.push_back(child.second.get_value<T>());
                } catch (const boost::property_tree::ptree_bad_data&) {
                    std::ostringstream message;
                    message << "Invalid array element in " << context;
                    throw std::runtime_error(message.str());
                }
            }
            return values;
        }

        template <class T>
        PropertyTree write_array(const std::vector<T>& values)
        {
            PropertyTree array;
            for (const auto& value : values) {
                PropertyTree element;
                element.put("", value);
                array.push_back({"", element});
            }
            return array;
        }

        // "cpu" -> none, "cuda" -> 0, "cuda:N" -> N.
        inline std::optional<int> device_from_string(const std::string& value, const std::string& context)
        {
            const auto lowered = to_lower(value);
            if (lowered == "cpu") {
                return std::nullopt;
            }
            if (lowered == "cuda" || lowered == "gpu") {
                return 0;
            }
            for (const std::string prefix : {"cuda:", "gpu:"}) {
                if (lowered.rfind(prefix, 0) == 0) {
                    const auto index = lowered.substr(prefix.size());
                    if (!index.empty() && std::all_of(index.begin(), index.end(), [](unsigned char c) { return std::isdigit(c); })) {
                        try {
                            return std::stoi(index);
                        } catch (const std::out_of_range&) {
                            std::ostringstream message;
                            message << "Device index in '" << value << "' in " << context << " is out of range";
                            throw std::runtime_error(message.str());
                        }
                    }
                }
            }
            std::ostringstream message;
            message << "Unknown device '" << value << "' in " << context << " (expected cpu, cuda or cuda:N)";
            throw std::runtime_error(message.str());
        }

        inline std::string device_to_string(const std::optional<int>& gpu)
        {
            if (!gpu.has_value()) {
                return "cpu";
            }
            return "cuda:" + std::to_string(*gpu);
        }
    }

    inline Config::NetworkSettings deserialize_network(const PropertyTree& tree, const std::string& context)
    {
        Config::NetworkSettings settings;
        settings.model_path = Detail::get_or<std::string>(tree, "model", settings.model_path, context);
        settings.input_layer = Detail::get_or<std::string>(tree, "input", settings.input_layer, context);
        if (const auto device = tree.get_optional<std::string>("device")) {
            settings.gpu = Detail::device_from_string(*device, context);
        }
        if (const auto mean = tree.get_child_optional("mean")) {
            const auto values = Detail::read_array<float>(*mean, context + " mean");
            if (values.size() != 3) {
                throw std::runtime_error("Field 'mean' in " + context + " must hold exactly three values.");
            }
            std::copy(values.begin(), values.end(), settings.normalization.mean.begin());
        }
        settings.normalization.reverse_channels =
            Detail::get_or<bool>(tree, "reverse_channels", settings.normalization.reverse_channels, context);
        return settings;
    }

    inline PropertyTree serialize_network(const Config::NetworkSettings& settings)
    {
        PropertyTree tree;
        tree.put("model", settings.model_path);
        tree.put("input", settings.input_layer);
        tree.put("device", Detail::device_to_string(settings.gpu));
        const std::vector<float> mean(settings.normalization.mean.begin(), settings.normalization.mean.end());
        tree.add_child("mean", Detail::write_array(mean));
        tree.put("reverse_channels", settings.normalization.reverse_channels);
        return tree;
    }

    inline DreamOptions deserialize_dream(const PropertyTree& tree, const std::string& context)
    {
        DreamOptions options;
        options.progress = Detail::get_or<bool>(tree, "progress", options.progress, context);
        options.scale = Detail::get_or<std::int64_t>(tree, "scale", options.scale, context);
        options.per_octave = Detail::get_or<std::int64_t>(tree, "per_octave", options.per_octave, context);
        options.steps = Detail::get_or<std::int64_t>(tree, "steps", options.steps, context);
        options.step_size = Detail::get_or<double>(tree, "step_size", options.step_size, context);
        options.jitter = Detail::get_or<std::int64_t>(tree, "jitter", options.jitter, context);
        options.max_tile_size = Detail::get_or<std::int64_t>(tree, "max_tile_size", options.max_tile_size, context);
        return options;
    }

    inline PropertyTree serialize_dream(const DreamOptions& options)
    {
        PropertyTree tree;
        tree.put("progress", options.progress);
        tree.put("scale", options.scale);
        tree.put("per_octave", options.per_octave);
        tree.put("steps", options.steps);
        tree.put("step_size", options.step_size);
        tree.put("jitter", options.jitter);
        tree.put("max_tile_size", options.max_tile_size);
        return tree;
    }

    inline Config::Settings deserialize_settings(const PropertyTree& tree, const std::string& context)
    {
        Config::Settings settings;
        if (const auto network = tree.get_child_optional("network")) {
            settings.network = deserialize_network(*network, context + " network");
        }
        if (const auto dream = tree.get_child_optional("dream")) {
            settings.dream = deserialize_dream(*dream, context + " dream");
        }
        settings.end_layer = Detail::get_or<std::string>(tree, "end", settings.end_layer, context);
        if (const auto level = tree.get_optional<std::string>("log_level")) {
            try {
                settings.log_level = Utils::Log::LevelFromString(*level);
            } catch (const std::invalid_argument& error) {
                throw std::runtime_error(std::string(error.what()) + " in " + context);
            }
        }
        Config::Validate(settings.dream);
        return settings;
    }

    inline PropertyTree serialize_settings(const Config::Settings& settings)
    {
        PropertyTree tree;
        tree.add_child("network", serialize_network(settings.network));
        tree.add_child("dream", serialize_dream(settings.dream));
        tree.put("end", settings.end_layer);
        tree.put("log_level", Utils::Log::LevelToString(settings.log_level));
        return tree;
    }

    inline void write_json_file(const std::filesystem::path& path, const PropertyTree& tree)
    {
        std::ofstream stream(path);
        if (!stream) {
            std::ostringstream message;
            message << "Failed to open '" << path.string() << "' for writing.";
            throw std::runtime_error(message.str());
        }
        boost::property_tree::write_json(stream, tree, true);
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        PropertyTree tree;
        try {
            boost::property_tree::read_json(path.string(), tree);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw std::runtime_error("Failed to read settings '" + path.string() + "': " + error.what());
        }
        return tree;
    }

    inline Config::Settings LoadSettings(const std::filesystem::path& path)
    {
        return deserialize_settings(read_json_file(path), "'" + path.string() + "'");
    }

    inline void SaveSettings(const Config::Settings& settings, const std::filesystem::path& path)
    {
        write_json_file(path, serialize_settings(settings));
    }
}

#endif // REVERIE_COMMON_SAVE_LOAD_HPP
