#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <torch/torch.h>
#include "../include/Reverie.h"

// reverie_demo <input image> <output image> [settings.json] [end layer]
int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <input image> <output image> [settings.json] [end layer]" << std::endl;
        return 2;
    }

    try {
        Reverie::Config::Settings settings;
        if (argc > 3) {
            settings = Reverie::Common::SaveLoad::LoadSettings(argv[3]);
        }
        if (argc > 4) {
            settings.end_layer = argv[4];
        }
        Reverie::Utils::Log::SetLevel(settings.log_level);

        std::cout << "Cuda: " << torch::cuda::is_available() << std::endl;
        auto dreamer = Reverie::Dreamer::FromTorchScript(settings.network);
        for (const auto& layer : dreamer.layers()) {
            Reverie::Utils::Log::Debug("  layer ", layer);
        }

        const auto image = Reverie::Data::Load::Image(argv[1]);
        const auto dreamed = dreamer.dream(image, settings.end_layer, settings.dream);
        Reverie::Data::Load::SaveImage(dreamed, argv[2]);
        Reverie::Utils::Log::Info("Wrote ", argv[2]);
    } catch (const std::exception& error) {
        Reverie::Utils::Log::Error(error.what());
        return 1;
    }
    return 0;
}
