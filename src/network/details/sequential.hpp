#ifndef REVERIE_NETWORK_SEQUENTIAL_HPP
#define REVERIE_NETWORK_SEQUENTIAL_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "staged.hpp"

namespace Reverie::Network::Details {
    // In-process chain network; layer names are the names the modules were registered under.
    class SequentialAdapter final : public StagedAdapter {
    public:
        explicit SequentialAdapter(torch::nn::Sequential sequential,
                                   std::string input_layer = "data",
                                   Normalization normalization = {},
                                   torch::Device device = torch::Device(torch::kCPU))
            : StagedAdapter(build_stages(prepare(std::move(sequential), device)),
                            std::move(input_layer),
                            normalization,
                            device) {}

    private:
        static torch::nn::Sequential prepare(torch::nn::Sequential sequential, const torch::Device& device)
        {
            if (!sequential) {
                throw std::invalid_argument("SequentialAdapter expects a constructed torch::nn::Sequential.");
            }
            sequential->to(device);
            sequential->eval();
            for (auto& parameter : sequential->parameters()) {
                parameter.set_requires_grad(false);
            }
            return sequential;
        }

        static std::vector<Stage> build_stages(const torch::nn::Sequential& sequential)
        {
            const auto children = sequential->named_children();
            std::vector<Stage> stages;
            stages.reserve(sequential->size());
            auto module = sequential->begin();
            for (std::size_t index = 0; index < sequential->size(); ++index, ++module) {
                Stage stage;
                stage.name = children[index].key();
                stage.run = [layer = *module](const torch::Tensor& input) mutable {
                    return layer.forward(input);
                };
                stages.push_back(std::move(stage));
            }
            return stages;
        }
    };
}

#endif // REVERIE_NETWORK_SEQUENTIAL_HPP
