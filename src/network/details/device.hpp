#ifndef REVERIE_NETWORK_DEVICE_HPP
#define REVERIE_NETWORK_DEVICE_HPP

#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include <torch/torch.h>
#include <torch/cuda.h>

namespace Reverie::Network::Details {
    // No index selects the CPU; an index selects that CUDA device and fails loudly when it is missing.
    inline torch::Device select_device(std::optional<int> gpu)
    {
        if (!gpu.has_value()) {
            return torch::Device(torch::kCPU);
        }
        if (!torch::cuda::is_available()) {
            throw std::runtime_error("CUDA device requested but is unavailable.");
        }
        const auto count = static_cast<int>(torch::cuda::device_count());
        if (*gpu < 0 || *gpu >= count) {
            std::ostringstream message;
            message << "CUDA device index " << *gpu << " is out of range (" << count << " device(s) visible).";
            throw std::out_of_range(message.str());
        }
        return torch::Device(torch::kCUDA, static_cast<c10::DeviceIndex>(*gpu));
    }

    inline std::string describe_device(const torch::Device& device)
    {
        return device.str();
    }
}

#endif // REVERIE_NETWORK_DEVICE_HPP
