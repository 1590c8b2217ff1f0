#ifndef REVERIE_NETWORK_STAGED_HPP
#define REVERIE_NETWORK_STAGED_HPP

#include <algorithm>
#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/error.hpp"
#include "../adapter.hpp"

namespace Reverie::Network::Details {
    // One named layer of a chain network: consumes the previous layer's output.
    struct Stage {
        std::string name{};
        std::function<torch::Tensor(const torch::Tensor&)> run{};
    };

    // Forward/backward buffers of a layer, stored with a leading batch dimension of one.
    struct Blob {
        torch::Tensor data{};
        torch::Tensor diff{};
    };

    inline constexpr Shape3D kDefaultInputShape{3, 224, 224};

    /*
     * Adapter over a chain of stages evaluated with libtorch autograd.
     *  - forward(end) runs the stages in order up to `end`, keeps every stage
     *    output (retain_grad) and mirrors detached copies into the blobs.
     *  - backward(start) seeds the recorded output of `start` with its diff
     *    blob and harvests the gradients of every earlier layer and the input.
     * The recorded graph is released after each backward.
     */
    class StagedAdapter : public Adapter {
    public:
        StagedAdapter(std::vector<Stage> stages,
                      std::string input_layer,
                      Normalization normalization,
                      torch::Device device)
            : stages_(std::move(stages)),
              input_layer_(std::move(input_layer)),
              normalization_(normalization),
              device_(device)
        {
            if (input_layer_.empty()) {
                throw std::invalid_argument("Network input layer name must not be empty.");
            }
            if (stages_.empty()) {
                throw std::invalid_argument("Network must expose at least one layer besides its input.");
            }
            std::unordered_set<std::string> seen{input_layer_};
            for (const auto& stage : stages_) {
                if (!stage.run) {
                    throw std::invalid_argument("Layer '" + stage.name + "' has no forward function.");
                }
                if (!seen.insert(stage.name).second) {
                    throw std::invalid_argument("Duplicate layer name '" + stage.name + "'.");
                }
                blobs_.emplace(stage.name, Blob{});
            }
            blobs_.emplace(input_layer_, Blob{});
            set_input(kDefaultInputShape);
        }

        [[nodiscard]] const std::string& input_layer() const noexcept override { return input_layer_; }
        [[nodiscard]] const Normalization& normalization() const noexcept override { return normalization_; }
        [[nodiscard]] const torch::Device& device() const noexcept override { return device_; }

        [[nodiscard]] std::vector<std::string> layer_names() const override
        {
            std::vector<std::string> names;
            names.reserve(stages_.size() + 1);
            names.push_back(input_layer_);
            for (const auto& stage : stages_) {
                names.push_back(stage.name);
            }
            return names;
        }

        void set_input(const Shape3D& shape) override
        {
            if (shape[0] <= 0 || shape[1] <= 0 || shape[2] <= 0) {
                throw InvalidShape("Input layer shape must be strictly positive.");
            }
            const auto options = torch::TensorOptions().dtype(torch::kFloat32).device(device_);
            auto& input = blobs_.at(input_layer_);
            input.data = torch::zeros({1, shape[0], shape[1], shape[2]}, options);
            input.diff = torch::zeros({1, shape[0], shape[1], shape[2]}, options);
            release_graph();
        }

        [[nodiscard]] torch::Tensor get_activation(const std::string& layer) const override
        {
            return first_element(blob(layer).data, layer, "activation");
        }

        void set_activation(const std::string& layer, const torch::Tensor& value) override
        {
            assign(first_element(blob(layer).data, layer, "activation"), value, layer);
        }

        [[nodiscard]] torch::Tensor get_gradient(const std::string& layer) const override
        {
            return first_element(blob(layer).diff, layer, "gradient");
        }

        void set_gradient(const std::string& layer, const torch::Tensor& value) override
        {
            assign(first_element(blob(layer).diff, layer, "gradient"), value, layer);
        }

        void forward(const std::string& end) override
        {
            const auto end_position = position(end);
            torch::AutoGradMode enable_grad(true);

            graph_input_ = blobs_.at(input_layer_).data.detach().clone().requires_grad_(true);
            graph_outputs_.clear();
            graph_outputs_.reserve(end_position);

            torch::Tensor value = graph_input_;
            for (std::size_t index = 0; index < end_position; ++index) {
                const auto& stage = stages_[index];
                value = stage.run(value);
                if (!value.defined()) {
                    throw std::runtime_error("Layer '" + stage.name + "' produced an undefined tensor.");
                }
                if (value.requires_grad()) {
                    value.retain_grad();
                }
                graph_outputs_.push_back(value);

                auto& target = blobs_.at(stage.name);
                target.data = value.detach().clone();
                if (!target.diff.defined() || target.diff.sizes() != target.data.sizes()) {
                    target.diff = torch::zeros_like(target.data);
                }
            }
            graph_end_ = end_position;
        }

        void backward(const std::string& start) override
        {
            const auto start_position = position(start);
            if (!graph_end_.has_value() || start_position > *graph_end_) {
                throw std::logic_error("Backward from '" + start + "' requires a forward pass reaching it.");
            }

            if (start_position > 0) {
                auto& output = graph_outputs_[start_position - 1];
                if (!output.requires_grad()) {
                    throw std::logic_error("Layer '" + start + "' does not depend on the input layer.");
                }
                torch::AutoGradMode enable_grad(true);
                output.backward(blobs_.at(start).diff);

                for (std::size_t index = 0; index + 1 < start_position; ++index) {
                    blobs_.at(stages_[index].name).diff = harvest(graph_outputs_[index]);
                }
                blobs_.at(input_layer_).diff = harvest(graph_input_);
            }
            release_graph();
        }

        void zero_all_gradients() override
        {
            for (auto& [name, entry] : blobs_) {
                if (entry.diff.defined()) {
                    entry.diff.zero_();
                }
            }
        }

    private:
        // 0 is the input layer, i > 0 is stages_[i - 1].
        [[nodiscard]] std::size_t position(const std::string& layer) const
        {
            if (layer == input_layer_) {
                return 0;
            }
            const auto it = std::find_if(stages_.begin(), stages_.end(), [&](const Stage& stage) {
                return stage.name == layer;
            });
            if (it == stages_.end()) {
                throw std::out_of_range("Unknown network layer '" + layer + "'.");
            }
            return static_cast<std::size_t>(std::distance(stages_.begin(), it)) + 1;
        }

        [[nodiscard]] const Blob& blob(const std::string& layer) const
        {
            const auto it = blobs_.find(layer);
            if (it == blobs_.end()) {
                throw std::out_of_range("Unknown network layer '" + layer + "'.");
            }
            return it->second;
        }

        static torch::Tensor first_element(const torch::Tensor& buffer, const std::string& layer, const char* kind)
        {
            if (!buffer.defined()) {
                throw std::logic_error(std::string("Layer '") + layer + "' holds no " + kind
                                       + " yet; run forward through it first.");
            }
            return buffer[0];
        }

        static void assign(torch::Tensor destination, const torch::Tensor& value, const std::string& layer)
        {
            if (!value.defined()) {
                throw InvalidShape("Cannot write an undefined tensor into layer '" + layer + "'.");
            }
            if (value.numel() != 1 && value.sizes() != destination.sizes()) {
                throw InvalidShape("Layer '" + layer + "' expects " + Common::format_shape(destination)
                                   + ", received " + Common::format_shape(value) + ".");
            }
            torch::NoGradGuard no_grad;
            destination.copy_(value.detach());
        }

        static torch::Tensor harvest(const torch::Tensor& tensor)
        {
            const auto& grad = tensor.grad();
            if (grad.defined()) {
                return grad.detach().clone();
            }
            return torch::zeros_like(tensor.detach());
        }

        void release_graph()
        {
            graph_input_ = torch::Tensor{};
            graph_outputs_.clear();
            graph_end_.reset();
        }

        std::vector<Stage> stages_;
        std::string input_layer_;
        Normalization normalization_;
        torch::Device device_;
        std::unordered_map<std::string, Blob> blobs_{};

        torch::Tensor graph_input_{};
        std::vector<torch::Tensor> graph_outputs_{};
        std::optional<std::size_t> graph_end_{};
    };
}

#endif // REVERIE_NETWORK_STAGED_HPP
