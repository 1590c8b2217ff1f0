#ifndef REVERIE_OCTAVE_HPP
#define REVERIE_OCTAVE_HPP

#include <array>
#include <cmath>
#include <cstdint>
#include <random>
#include <string>
#include <tuple>
#include <utility>

#include <torch/torch.h>

#include "../common/error.hpp"
#include "../data/transform/format/format.hpp"
#include "../gradient/tiling.hpp"
#include "../network/adapter.hpp"
#include "../utils/log.hpp"
#include "../utils/progressbar.hpp"

namespace Reverie::Octave {
    // Every scheduler starts its jitter sequence from this seed, so equal inputs give equal dreams.
    inline constexpr std::mt19937::result_type kJitterSeed = 0;

    struct AscentOptions {
        int64_t steps{10};
        double step_size{1.5};
        int64_t jitter{32};
        int64_t max_tile_size{512};
    };

    namespace Details {
        // Median of |gradient| over every element; the two central values are averaged for even counts.
        inline float median_abs(const torch::Tensor& gradient)
        {
            const auto flat = gradient.abs().flatten();
            const auto count = flat.numel();
            if (count == 0) {
                throw InvalidShape("Cannot normalise an empty gradient.");
            }
            const auto upper = std::get<0>(torch::kthvalue(flat, count / 2 + 1));
            if (count % 2 == 1) {
                return upper.item<float>();
            }
            const auto lower = std::get<0>(torch::kthvalue(flat, count / 2));
            return ((lower + upper) / 2).item<float>();
        }

        // Spatial size of the next coarser octave: each side divided by 2^(1/per_octave), rounded up.
        inline std::array<int64_t, 2> coarser_size(int64_t height, int64_t width, int64_t per_octave)
        {
            const double factor = std::pow(2.0, 1.0 / static_cast<double>(per_octave));
            return {static_cast<int64_t>(std::ceil(static_cast<double>(height) / factor)),
                    static_cast<int64_t>(std::ceil(static_cast<double>(width) / factor))};
        }
    }

    /*
     * Multiscale gradient ascent.
     * ---------------------------------------------------------------------------
     * detail(base, scale):
     *  - scale == 1: start from a zero detail,
     *  - otherwise: shrink base, recurse with scale - 1, grow the returned
     *    detail back to base's size,
     *  - ascend on base + detail for `steps` jittered steps,
     *  - return the ascended image minus base.
     * The scheduler borrows the network and the progress tracker for one run.
     */
    class Scheduler {
    public:
        Scheduler(Network::Adapter& network,
                  std::string end,
                  AscentOptions options,
                  Utils::Progress::Tracker& progress)
            : network_(network),
              end_(std::move(end)),
              options_(options),
              progress_(progress),
              rng_(kJitterSeed) {}

        Scheduler(const Scheduler&) = delete;
        Scheduler& operator=(const Scheduler&) = delete;

        [[nodiscard]] torch::Tensor octave_detail(const torch::Tensor& base, int64_t scale, int64_t per_octave)
        {
            if (!base.defined() || base.dim() != 3) {
                throw InvalidShape("Octave detail expects a (C,H,W) base image, received "
                                   + Common::format_shape(base) + ".");
            }
            if (scale < 1 || per_octave < 1) {
                throw std::invalid_argument("Octave scale and per_octave must be at least 1.");
            }

            const auto height = base.size(1);
            const auto width = base.size(2);
            progress_.add_total(height * width * options_.steps);

            torch::Tensor detail;
            if (scale == 1) {
                detail = torch::zeros_like(base);
            } else {
                const auto [smaller_height, smaller_width] = Details::coarser_size(height, width, per_octave);
                const auto smaller_base = Data::Transform::Format::Resize(base, smaller_height, smaller_width);
                const auto smaller_detail = octave_detail(smaller_base, scale - 1, per_octave);
                detail = Data::Transform::Format::Resize(smaller_detail, height, width);
            }

            Utils::Log::Debug("Octave ", scale, ": ", height, 'x', width, ", ", options_.steps, " step(s)");

            auto image = base + detail;
            ascend(image);
            return image - base;
        }

        // Runs `steps` ascent steps on `image`, replacing it with the result.
        void ascend(torch::Tensor& image)
        {
            for (int64_t step = 0; step < options_.steps; ++step) {
                ascent_step(image);
            }
        }

        void ascent_step(torch::Tensor& image)
        {
            const auto [x, y] = draw_jitter();
            image = torch::roll(image, {y, x}, {1, 2});

            const auto gradient = Gradient::ComputeGradient(network_, image, end_, options_.max_tile_size, &progress_);
            const auto median = Details::median_abs(gradient);
            if (median == 0.0f) {
                // Not guarded: the update below turns into NaN/inf.
                Utils::Log::Warning("Gradient at '", end_, "' is zero almost everywhere; the ascent step is undefined.");
            }
            image.add_(gradient.mul(options_.step_size).div(median));

            image = torch::roll(image, {-y, -x}, {1, 2});
        }

        [[nodiscard]] const AscentOptions& options() const noexcept { return options_; }

    private:
        // (x, y) drawn in that order, each uniform over [-jitter, jitter].
        std::pair<int64_t, int64_t> draw_jitter()
        {
            std::uniform_int_distribution<int64_t> distribution(-options_.jitter, options_.jitter);
            const auto x = distribution(rng_);
            const auto y = distribution(rng_);
            return {x, y};
        }

        Network::Adapter& network_;
        std::string end_;
        AscentOptions options_;
        Utils::Progress::Tracker& progress_;
        std::mt19937 rng_;
    };
}

#endif // REVERIE_OCTAVE_HPP
