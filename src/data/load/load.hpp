#ifndef REVERIE_LOAD_HPP
#define REVERIE_LOAD_HPP
#include <filesystem>
#include <stdexcept>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace Reverie::Data::Load {
    // Decoded as 8-bit, 3-channel BGR whatever the file holds (grey or alpha included).
    inline cv::Mat Image(const std::filesystem::path& path)
    {
        if (!std::filesystem::exists(path)) {
            throw std::runtime_error("Image file not found: " + path.string());
        }
        cv::Mat image = cv::imread(path.string(), cv::IMREAD_COLOR);
        if (image.empty()) {
            throw std::runtime_error("Failed to decode image: " + path.string());
        }
        return image;
    }

    inline void SaveImage(const cv::Mat& image, const std::filesystem::path& path)
    {
        if (image.empty()) {
            throw std::invalid_argument("Cannot save an empty image to " + path.string());
        }
        bool written = false;
        try {
            written = cv::imwrite(path.string(), image);
        } catch (const cv::Exception& error) {
            throw std::runtime_error("Failed to encode image " + path.string() + ": " + error.what());
        }
        if (!written) {
            throw std::runtime_error("Failed to write image: " + path.string());
        }
    }
}

#endif // REVERIE_LOAD_HPP
