#ifndef REVERIE_DATA_CODEC_HPP
#define REVERIE_DATA_CODEC_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "../../common/error.hpp"
#include "../../network/adapter.hpp"

namespace Reverie::Data {
    namespace Details {
        inline void require_hwc3(const torch::Tensor& image, const char* context)
        {
            if (!image.defined() || image.dim() != 3 || image.size(2) != 3) {
                throw InvalidShape(std::string(context) + " expects an (H, W, 3) image, received "
                                   + Common::format_shape(image) + ".");
            }
        }

        inline void require_chw3(const torch::Tensor& tensor, const char* context)
        {
            if (!tensor.defined() || tensor.dim() != 3 || tensor.size(0) != 3) {
                throw InvalidShape(std::string(context) + " expects a (3, H, W) tensor, received "
                                   + Common::format_shape(tensor) + ".");
            }
        }
    }

    // Values rounded half-to-even, clipped to [0, 255] and cast to uint8.
    inline torch::Tensor ClipRound(const torch::Tensor& image)
    {
        return torch::round(image.to(torch::kFloat32)).clamp(0.0, 255.0).to(torch::kUInt8);
    }

    // OpenCV native (BGR) matrix of any depth -> (H, W, 3) float32 RGB tensor.
    inline torch::Tensor FromMat(const cv::Mat& image)
    {
        if (image.empty() || image.dims != 2 || image.channels() != 3) {
            throw InvalidShape("Codec expects a non-empty 3-channel image.");
        }
        cv::Mat image_float;
        image.convertTo(image_float, CV_32F);
        cv::Mat rgb;
        cv::cvtColor(image_float, rgb, cv::COLOR_BGR2RGB);
        if (!rgb.isContinuous()) {
            rgb = rgb.clone();
        }
        const auto options = torch::TensorOptions().dtype(torch::kFloat32);
        return torch::from_blob(rgb.data, {rgb.rows, rgb.cols, 3}, options).clone();
    }

    // (H, W, 3) uint8 RGB tensor -> OpenCV native 8-bit BGR matrix.
    inline cv::Mat ToMat(const torch::Tensor& image)
    {
        Details::require_hwc3(image, "ToMat");
        auto pixels = image.to(torch::kCPU).to(torch::kUInt8).contiguous();
        cv::Mat rgb(static_cast<int>(pixels.size(0)), static_cast<int>(pixels.size(1)), CV_8UC3, pixels.data_ptr<std::uint8_t>());
        cv::Mat bgr;
        cv::cvtColor(rgb, bgr, cv::COLOR_RGB2BGR);
        return bgr;
    }

    /*
     * Conversion between raw pixels and the network input layout.
     * preprocess : (H, W, 3) RGB in [0, 255] -> (3, H, W) float32, channel order
     *              reversed when the network wants BGR, per-channel mean removed.
     * postprocess: exact inverse followed by ClipRound.
     */
    class Codec {
    public:
        explicit Codec(Network::Normalization normalization = {})
            : normalization_(normalization),
              mean_(torch::tensor({normalization.mean[0], normalization.mean[1], normalization.mean[2]},
                                  torch::TensorOptions().dtype(torch::kFloat32)).view({3, 1, 1})) {}

        [[nodiscard]] torch::Tensor preprocess(const torch::Tensor& image) const
        {
            Details::require_hwc3(image, "Codec::preprocess");
            auto planes = image.to(torch::kCPU).to(torch::kFloat32).permute({2, 0, 1});
            if (normalization_.reverse_channels) {
                planes = planes.flip({0});
            }
            return (planes - mean_).contiguous();
        }

        [[nodiscard]] torch::Tensor preprocess(const cv::Mat& image) const
        {
            return preprocess(FromMat(image));
        }

        // (3, H, W) network tensor -> (H, W, 3) float RGB, neither clipped nor rounded.
        [[nodiscard]] torch::Tensor deprocess(const torch::Tensor& tensor) const
        {
            Details::require_chw3(tensor, "Codec::deprocess");
            auto planes = tensor.to(torch::kCPU).to(torch::kFloat32) + mean_;
            if (normalization_.reverse_channels) {
                planes = planes.flip({0});
            }
            return planes.permute({1, 2, 0}).contiguous();
        }

        [[nodiscard]] torch::Tensor postprocess(const torch::Tensor& tensor) const
        {
            return ClipRound(deprocess(tensor));
        }

        [[nodiscard]] cv::Mat to_image(const torch::Tensor& tensor) const
        {
            return ToMat(postprocess(tensor));
        }

        [[nodiscard]] const Network::Normalization& normalization() const noexcept { return normalization_; }

    private:
        Network::Normalization normalization_;
        torch::Tensor mean_;
    };
}

#endif // REVERIE_DATA_CODEC_HPP
