#ifndef REVERIE_NETWORK_ADAPTER_HPP
#define REVERIE_NETWORK_ADAPTER_HPP
/*
 * Capability interface between the dreaming core and a pretrained network.
 * ---------------------------------------------------------------------------
 * The network is modelled as a set of named layer buffers, each holding the
 * forward activation and the backward gradient of the first batch element.
 * The core only ever:
 *  - resizes the input layer (set_input),
 *  - reads/writes those buffers through the four accessors below,
 *  - runs forward up to a layer and backward from a layer.
 * Implementations own the buffers exclusively and are not thread-safe; a
 * single adapter must never serve two dream runs at once.
 */

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include <torch/torch.h>

namespace Reverie::Network {
    // Per-channel constants the pretrained network was trained with.
    struct Normalization {
        // Mean in the network's channel order (BGR for the BVLC Caffe models).
        std::array<float, 3> mean{103.939f, 116.779f, 123.68f};
        // Reverse RGB -> BGR before subtracting the mean.
        bool reverse_channels{true};
    };

    using Shape3D = std::array<int64_t, 3>;

    class Adapter {
    public:
        virtual ~Adapter() = default;

        [[nodiscard]] virtual const std::string& input_layer() const noexcept = 0;
        [[nodiscard]] virtual const Normalization& normalization() const noexcept = 0;
        [[nodiscard]] virtual const torch::Device& device() const noexcept = 0;

        // Every layer name usable as a forward end / backward start, input layer first.
        [[nodiscard]] virtual std::vector<std::string> layer_names() const = 0;

        // Reshapes the input buffer to (channels, height, width); previous contents are dropped.
        virtual void set_input(const Shape3D& shape) = 0;

        [[nodiscard]] virtual torch::Tensor get_activation(const std::string& layer) const = 0;
        virtual void set_activation(const std::string& layer, const torch::Tensor& value) = 0;

        [[nodiscard]] virtual torch::Tensor get_gradient(const std::string& layer) const = 0;
        virtual void set_gradient(const std::string& layer, const torch::Tensor& value) = 0;

        virtual void forward(const std::string& end) = 0;
        virtual void backward(const std::string& start) = 0;

        virtual void zero_all_gradients() = 0;
    };
}

#endif // REVERIE_NETWORK_ADAPTER_HPP
