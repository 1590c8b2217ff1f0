#ifndef REVERIE_NETWORK_TORCHSCRIPT_HPP
#define REVERIE_NETWORK_TORCHSCRIPT_HPP

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/script.h>
#include <torch/torch.h>

#include "device.hpp"
#include "staged.hpp"

namespace Reverie::Network::Details {
    struct TorchScriptOptions {
        std::string model_path{};
        std::optional<int> gpu{};
        std::string input_layer{"data"};
        Normalization normalization{};
    };

    /*
     * Pretrained network loaded from a TorchScript archive.
     * The archive must be a chain container (an exported nn.Sequential): each
     * top-level child is one layer and consumes the previous child's output.
     * Layer names are the child names returned by named_children(), verbatim;
     * nothing is renamed or split. To address a layer as "inception_4c/output",
     * the exporter must register the child under exactly that name
     * (nn.Sequential(OrderedDict(...)); module names reject only '.' and empty names).
     * An archive exported with other child names is still loaded, and
     * layers() lists the names that `end` must then use.
     */
    class TorchScriptAdapter final : public StagedAdapter {
    public:
        explicit TorchScriptAdapter(const TorchScriptOptions& options)
            : TorchScriptAdapter(options, select_device(options.gpu)) {}

    private:
        TorchScriptAdapter(const TorchScriptOptions& options, torch::Device device)
            : StagedAdapter(build_stages(load_module(options.model_path, device)),
                            options.input_layer,
                            options.normalization,
                            device) {}

        static torch::jit::script::Module load_module(const std::string& path, const torch::Device& device)
        {
            if (path.empty()) {
                throw std::invalid_argument("TorchScript model path must not be empty.");
            }
            if (!std::filesystem::exists(path)) {
                throw std::runtime_error("TorchScript model '" + path + "' does not exist.");
            }

            torch::jit::script::Module module;
            try {
                module = torch::jit::load(path, device);
            } catch (const c10::Error& error) {
                throw std::runtime_error("Failed to load TorchScript model '" + path + "': "
                                         + error.what_without_backtrace());
            }
            module.eval();
            for (auto parameter : module.parameters()) {
                parameter.set_requires_grad(false);
            }
            return module;
        }

        static std::vector<Stage> build_stages(const torch::jit::script::Module& module)
        {
            std::vector<Stage> stages;
            for (const auto& child : module.named_children()) {
                Stage stage;
                stage.name = child.name;
                stage.run = [layer = child.value](const torch::Tensor& input) mutable {
                    std::vector<torch::jit::IValue> inputs{input};
                    return layer.forward(inputs).toTensor();
                };
                stages.push_back(std::move(stage));
            }
            if (stages.empty()) {
                throw std::runtime_error("TorchScript model exposes no child layers; export it as an nn.Sequential.");
            }
            return stages;
        }
    };
}

#endif // REVERIE_NETWORK_TORCHSCRIPT_HPP
