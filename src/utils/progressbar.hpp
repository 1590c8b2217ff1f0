#ifndef REVERIE_UTILS_PROGRESSBAR_HPP
#define REVERIE_UTILS_PROGRESSBAR_HPP

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <exception>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

#include "log.hpp"
#include "terminal.hpp"

namespace Reverie::Utils::Progress {
    // Receives pixel counts as tiles complete. close() is called exactly once by the owning Tracker.
    class Sink {
    public:
        virtual ~Sink() = default;
        virtual void advance(std::int64_t pixels) = 0;
        virtual void close() = 0;
    };

    using SinkFactory = std::function<std::unique_ptr<Sink>(std::int64_t total)>;

    namespace Details {
        // 1234567 -> "1.23M"
        inline std::string scale_units(std::int64_t value)
        {
            static constexpr std::array<const char*, 5> suffixes{"", "k", "M", "G", "T"};
            double scaled = static_cast<double>(value);
            std::size_t index = 0;
            while (std::fabs(scaled) >= 1000.0 && index + 1 < suffixes.size()) {
                scaled /= 1000.0;
                ++index;
            }
            std::ostringstream stream;
            if (index == 0) {
                stream << value;
            } else {
                stream << std::fixed << std::setprecision(scaled < 10.0 ? 2 : (scaled < 100.0 ? 1 : 0)) << scaled
                       << suffixes[index];
            }
            return stream.str();
        }
    }

    class ProgressBar final : public Sink {
    public:
        ProgressBar(std::int64_t total, std::string label, std::string unit = "pix", std::size_t width = 30)
            : total_(std::max<std::int64_t>(total, 0)),
              label_(std::move(label)),
              unit_(std::move(unit)),
              width_(std::max<std::size_t>(width, static_cast<std::size_t>(1))),
              current_(0),
              last_units_(-1),
              finished_(false) {}

        ~ProgressBar() override {
            if (!finished_) {
                finish();
            }
        }

        void advance(std::int64_t pixels) override {
            update(current_ + pixels);
        }

        void update(std::int64_t current) {
            if (finished_ || total_ <= 0) {
                return;
            }
            current_ = std::clamp<std::int64_t>(current, 0, total_);

            const double ratio = static_cast<double>(current_) /
                                 static_cast<double>(std::max<std::int64_t>(total_, 1));
            auto scaled_units = static_cast<std::int64_t>(std::round(ratio * width_ * 8.0));
            const std::int64_t max_units = static_cast<std::int64_t>(width_) * 8;
            if (scaled_units > max_units) {
                scaled_units = max_units;
            }

            if (scaled_units == last_units_ && current_ != total_) {
                return;
            }
            last_units_ = scaled_units;

            const std::size_t full_cells = static_cast<std::size_t>(scaled_units / 8);
            std::size_t partial_index = static_cast<std::size_t>(scaled_units % 8);

            std::ostringstream stream;
            stream << '\r' << label_ << " [";
            for (std::size_t i = 0; i < full_cells && i < width_; ++i) {
                stream << "\xE2\x96\x88";
            }

            const bool has_partial_cell = partial_index > 0 && full_cells < width_;
            if (has_partial_cell) {
                stream << PartialBlock(partial_index);
            }

            const std::size_t printed_cells = full_cells + (has_partial_cell ? 1 : 0);
            if (printed_cells < width_) {
                stream << std::string(width_ - printed_cells, ' ');
            }

            stream << "] ";
            stream << std::setw(3) << static_cast<int>(std::round(ratio * 100.0)) << "% ";
            stream << Details::scale_units(current_) << '/' << Details::scale_units(total_) << ' ' << unit_;
            stream << Terminal::Control::kEraseToLineEnd;

            std::cout << stream.str() << std::flush;
        }

        void close() override {
            finish();
        }

        [[nodiscard]] std::int64_t total() const {
            return total_;
        }

        [[nodiscard]] std::int64_t current() const {
            return current_;
        }

    private:
        static const char* PartialBlock(std::size_t index) { // smooth pBar
            static constexpr const char* blocks[] = {
                "",
                "\xE2\x96\x8F",
                "\xE2\x96\x8E",
                "\xE2\x96\x8D",
                "\xE2\x96\x8C",
                "\xE2\x96\x8B",
                "\xE2\x96\x8A",
                "\xE2\x96\x89"
            };
            if (index >= (sizeof(blocks) / sizeof(blocks[0]))) {
                return blocks[(sizeof(blocks) / sizeof(blocks[0])) - 1];
            }
            return blocks[index];
        }

        void finish() {
            if (finished_) {
                return;
            }
            finished_ = true;
            if (last_units_ >= 0) {
                std::cout << std::endl;
            }
        }

        std::int64_t total_;
        std::string label_;
        std::string unit_;
        std::size_t width_;
        std::int64_t current_;
        std::int64_t last_units_;
        bool finished_;
    };

    inline SinkFactory TerminalBar(std::string label = "Dreaming")
    {
        return [label = std::move(label)](std::int64_t total) -> std::unique_ptr<Sink> {
            return std::make_unique<ProgressBar>(total, label);
        };
    }

    /*
     * Pixel accounting for one dream run.
     *  - The total grows while the octave pyramid is descended (add_total).
     *  - The sink is created on the first advance() so it sees the full total.
     *  - The destructor closes the sink, whatever path left the enclosing scope.
     */
    class Tracker {
    public:
        explicit Tracker(SinkFactory factory = {}) : factory_(std::move(factory)) {}

        Tracker(const Tracker&) = delete;
        Tracker& operator=(const Tracker&) = delete;

        ~Tracker() { release(); }

        void add_total(std::int64_t pixels) noexcept { total_ += pixels; }

        void advance(std::int64_t pixels)
        {
            reported_ += pixels;
            if (!factory_) {
                return;
            }
            if (!sink_) {
                sink_ = factory_(total_);
                if (!sink_) {
                    factory_ = {};
                    return;
                }
            }
            sink_->advance(pixels);
        }

        [[nodiscard]] bool enabled() const noexcept { return static_cast<bool>(factory_); }
        [[nodiscard]] std::int64_t total() const noexcept { return total_; }
        [[nodiscard]] std::int64_t reported() const noexcept { return reported_; }

        // Safe to call more than once; failures while closing are logged, never thrown.
        void release() noexcept
        {
            if (!sink_) {
                return;
            }
            auto sink = std::move(sink_);
            try {
                sink->close();
            } catch (const std::exception& error) {
                Log::Warning("Progress display failed to close: ", error.what());
            } catch (...) {
                Log::Warning("Progress display failed to close with a non-standard exception.");
            }
        }

    private:
        SinkFactory factory_{};
        std::unique_ptr<Sink> sink_{};
        std::int64_t total_{0};
        std::int64_t reported_{0};
    };
}

#endif // REVERIE_UTILS_PROGRESSBAR_HPP
