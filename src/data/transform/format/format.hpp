#ifndef REVERIE_DATA_TRANSFORM_FORMAT_HPP
#define REVERIE_DATA_TRANSFORM_FORMAT_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>
#include <torch/nn/functional.h>

#include "../../../common/error.hpp"

namespace Reverie::Data::Transform::Format {
    namespace Options {

        enum class InterpMode {
            Bilinear,
            Nearest,
            Bicubic,
        };

        struct ResizeOptions {
            InterpMode interp = InterpMode::Bicubic;
            bool antialias = true;
        };
    }

    namespace Details {

        inline torch::Tensor to_float32(const torch::Tensor& tensor) {
            if (tensor.scalar_type() == torch::kFloat32) {
                return tensor;
            }
            return tensor.to(tensor.options().dtype(torch::kFloat32));
        }

        // Interpolates every channel plane of a (C,H,W) tensor to (C,height,width).
        inline torch::Tensor resize_planes(
                const torch::Tensor& planes,
                int64_t height,
                int64_t width,
                const Options::ResizeOptions& options) {

            auto opts = torch::nn::functional::InterpolateFuncOptions()
                            .size(std::vector<int64_t>{height, width});

            switch (options.interp) {
                case Options::InterpMode::Bilinear:
                    opts = opts.mode(torch::kBilinear).align_corners(false).antialias(options.antialias);
                    break;
                case Options::InterpMode::Nearest:
                    opts = opts.mode(torch::kNearest);
                    break;
                case Options::InterpMode::Bicubic:
                    opts = opts.mode(torch::kBicubic).align_corners(false).antialias(options.antialias);
                    break;
            }

            // Each plane is its own single-channel batch entry so channels never mix.
            auto batched = planes.unsqueeze(1);
            auto resized = torch::nn::functional::interpolate(batched, opts);
            return resized.squeeze(1).contiguous();
        }
    }

    /*
     * Resizes a channel-first (C,H,W) float tensor to (C,height,width).
     * Bicubic with antialiasing follows the PIL cubic kernel (a = -0.5) when shrinking.
     * The input is never modified; a new tensor is always returned.
     */
    inline torch::Tensor Resize(const torch::Tensor& tensor,
                                int64_t height,
                                int64_t width,
                                Options::ResizeOptions options = {}) {
        if (!tensor.defined()) {
            throw InvalidShape("Format::Resize expects a defined tensor.");
        }
        if (tensor.dim() != 3) {
            throw InvalidShape("Format::Resize only supports 3D (C,H,W) tensors, received "
                               + Common::format_shape(tensor) + ".");
        }
        if (height <= 0 || width <= 0) {
            throw std::invalid_argument("Format::Resize expects positive target height and width.");
        }

        const auto dtype = tensor.scalar_type();
        auto float_tensor = Details::to_float32(tensor);
        if (float_tensor.size(1) == height && float_tensor.size(2) == width) {
            return float_tensor.clone().to(dtype);
        }
        return Details::resize_planes(float_tensor, height, width, options).to(dtype);
    }
}

#endif // REVERIE_DATA_TRANSFORM_FORMAT_HPP
