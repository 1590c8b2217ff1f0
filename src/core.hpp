#ifndef REVERIE_CORE_HPP
#define REVERIE_CORE_HPP
/*
 * Dreaming front-end.
 * ---------------------------------------------------------------------------
 * Responsibilities:
 *  - Own the network adapter (single owner, never shared between runs) and
 *    the codec matching its normalization.
 *  - Validate the per-call options before any computation.
 *  - Drive one dream run: zero the gradient buffers, preprocess, reseed the
 *    jitter generator, descend the octave pyramid, postprocess.
 *  - Scope the progress display so it is closed on every exit path.
 */

#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include <opencv2/core.hpp>

#include "common/config.hpp"
#include "common/error.hpp"
#include "data/codec/codec.hpp"
#include "network/network.hpp"
#include "octave/octave.hpp"
#include "utils/log.hpp"
#include "utils/progressbar.hpp"

namespace Reverie {
    class Dreamer {
    public:
        explicit Dreamer(std::unique_ptr<Network::Adapter> network)
            : network_(require_network(std::move(network))),
              codec_(network_->normalization()) {}

        Dreamer(const Dreamer&) = delete;
        Dreamer& operator=(const Dreamer&) = delete;
        Dreamer(Dreamer&&) = default;
        Dreamer& operator=(Dreamer&&) = default;

        [[nodiscard]] static Dreamer FromTorchScript(const Config::NetworkSettings& settings)
        {
            Network::TorchScriptOptions options;
            options.model_path = settings.model_path;
            options.gpu = settings.gpu;
            options.input_layer = settings.input_layer;
            options.normalization = settings.normalization;
            auto network = std::make_unique<Network::TorchScriptAdapter>(options);
            Utils::Log::Info("Loaded '", settings.model_path, "' on ", Network::Details::describe_device(network->device()),
                             " (", network->layer_names().size(), " layers)");
            return Dreamer(std::move(network));
        }

        // Valid end layers, input layer first.
        [[nodiscard]] std::vector<std::string> layers() const { return network_->layer_names(); }

        [[nodiscard]] Network::Adapter& network() noexcept { return *network_; }
        [[nodiscard]] const Network::Adapter& network() const noexcept { return *network_; }
        [[nodiscard]] const Data::Codec& codec() const noexcept { return codec_; }

        // An empty factory disables the display even when DreamOptions::progress is set.
        void set_progress_factory(Utils::Progress::SinkFactory factory) { progress_factory_ = std::move(factory); }

        // BGR image (8-bit or float) -> dreamed 8-bit BGR image.
        [[nodiscard]] cv::Mat dream(const cv::Mat& image, const std::string& end, const DreamOptions& options = {})
        {
            return Data::ToMat(run(Data::FromMat(image), end, options));
        }

        // (H, W, 3) RGB tensor in [0, 255] -> dreamed (H, W, 3) uint8 RGB tensor.
        [[nodiscard]] torch::Tensor dream(const torch::Tensor& image, const std::string& end, const DreamOptions& options = {})
        {
            return run(image, end, options);
        }

    private:
        static std::unique_ptr<Network::Adapter> require_network(std::unique_ptr<Network::Adapter> network)
        {
            if (!network) {
                throw std::invalid_argument("Dreamer requires a network adapter.");
            }
            return network;
        }

        void require_layer(const std::string& end) const
        {
            const auto names = network_->layer_names();
            if (std::find(names.begin(), names.end(), end) == names.end()) {
                throw std::out_of_range("Unknown end layer '" + end + "'.");
            }
        }

        torch::Tensor run(const torch::Tensor& image, const std::string& end, const DreamOptions& options)
        {
            Config::Validate(options);
            require_layer(end);

            const auto start = std::chrono::steady_clock::now();
            Utils::Log::Info("Dreaming at '", end, "': scale=", options.scale, ", per_octave=", options.per_octave,
                             ", steps=", options.steps, ", step_size=", options.step_size,
                             ", jitter=", options.jitter, ", max_tile_size=", options.max_tile_size);

            network_->zero_all_gradients();
            const auto base = codec_.preprocess(image).to(network_->device());

            torch::Tensor detail;
            {
                Utils::Progress::Tracker progress(options.progress ? progress_factory_ : Utils::Progress::SinkFactory{});
                Octave::Scheduler scheduler(*network_, end, Config::ToAscentOptions(options), progress);
                detail = scheduler.octave_detail(base, options.scale, options.per_octave);
                progress.release();
            }

            auto result = codec_.postprocess(detail + base);
            const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
            Utils::Log::Info("Dream finished in ", elapsed, " s");
            return result;
        }

        std::unique_ptr<Network::Adapter> network_;
        Data::Codec codec_;
        Utils::Progress::SinkFactory progress_factory_{Utils::Progress::TerminalBar()};
    };
}

#endif // REVERIE_CORE_HPP
