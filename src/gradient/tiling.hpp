#ifndef REVERIE_GRADIENT_TILING_HPP
#define REVERIE_GRADIENT_TILING_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../common/error.hpp"
#include "../network/adapter.hpp"
#include "../utils/log.hpp"
#include "../utils/progressbar.hpp"

namespace Reverie::Gradient {
    struct Tile {
        int64_t y{0};
        int64_t x{0};
        int64_t height{0};
        int64_t width{0};
    };

    namespace Details {
        // Offsets and extents along one axis: `count` near-equal spans, the last one takes the remainder.
        struct Span {
            int64_t offset;
            int64_t extent;
        };

        inline std::vector<Span> split_axis(int64_t length, int64_t max_extent)
        {
            const int64_t count = (length - 1) / max_extent + 1;
            const int64_t base = length / count;
            std::vector<Span> spans;
            spans.reserve(static_cast<std::size_t>(count));
            for (int64_t index = 0; index < count; ++index) {
                int64_t extent = base;
                if (index == count - 1) {
                    extent += length - base * count;
                }
                spans.push_back({base * index, extent});
            }
            return spans;
        }
    }

    // Row-major tile grid of ceil(height / max_tile) x ceil(width / max_tile) tiles covering the image exactly.
    inline std::vector<Tile> Partition(int64_t height, int64_t width, int64_t max_tile)
    {
        if (height <= 0 || width <= 0) {
            throw InvalidShape("Tile partition expects a non-empty image.");
        }
        if (max_tile <= 0) {
            throw std::invalid_argument("Maximum tile size must be positive.");
        }

        const auto rows = Details::split_axis(height, max_tile);
        const auto columns = Details::split_axis(width, max_tile);

        std::vector<Tile> tiles;
        tiles.reserve(rows.size() * columns.size());
        for (const auto& row : rows) {
            for (const auto& column : columns) {
                tiles.push_back({row.offset, column.offset, row.extent, column.extent});
            }
        }
        return tiles;
    }

    /*
     * Gradient of "maximise the activation of `end`" with respect to a (3,H,W) image.
     * Each tile is pushed through the network on its own (input layer reshaped to
     * the tile), the objective gradient is seeded with the layer's activation, and
     * the input-layer gradient is written back at the tile's position.
     * Tiles run one after the other on the shared adapter.
     */
    inline torch::Tensor ComputeGradient(Network::Adapter& network,
                                         const torch::Tensor& image,
                                         const std::string& end,
                                         int64_t max_tile_size,
                                         Utils::Progress::Tracker* progress = nullptr)
    {
        if (!image.defined() || image.dim() != 3) {
            throw InvalidShape("ComputeGradient expects a (C,H,W) image, received " + Common::format_shape(image) + ".");
        }

        const auto channels = image.size(0);
        const auto tiles = Partition(image.size(1), image.size(2), max_tile_size);
        const auto& input = network.input_layer();

        Utils::Log::Debug("Gradient at '", end, "' over ", image.size(1), 'x', image.size(2), " in ", tiles.size(), " tile(s)");

        auto gradient = torch::zeros_like(image);
        for (const auto& tile : tiles) {
            using torch::indexing::Slice;
            const std::vector<torch::indexing::TensorIndex> region{
                Slice(), Slice(tile.y, tile.y + tile.height), Slice(tile.x, tile.x + tile.width)};

            network.set_input({channels, tile.height, tile.width});
            network.set_activation(input, image.index(region));
            network.forward(end);
            network.set_gradient(end, network.get_activation(end));
            network.backward(end);
            gradient.index(region).copy_(network.get_gradient(input));

            if (progress != nullptr) {
                progress->advance(tile.height * tile.width);
            }
        }
        return gradient;
    }
}

#endif // REVERIE_GRADIENT_TILING_HPP
