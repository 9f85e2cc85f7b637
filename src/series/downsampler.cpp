/// @file src/series/downsampler.cpp
/// @brief Downsampler — activity-preserving reduction of daily WIP series.

#include "finagg/downsample.hpp"

#include "../core/text.hpp"

#include <algorithm>

namespace finagg::series {

// ─── Resolution ───────────────────────────────────────────────────────────────

std::size_t target_points(Resolution resolution) noexcept {
    switch (resolution) {
        case Resolution::Low:      return constants::LOW_RESOLUTION_POINTS;
        case Resolution::Standard: return constants::STANDARD_RESOLUTION_POINTS;
        case Resolution::High:     return constants::HIGH_RESOLUTION_POINTS;
    }
    return constants::STANDARD_RESOLUTION_POINTS;
}

std::optional<Resolution> parse_resolution(std::string_view text) noexcept {
    if (detail::iequals(text, "low"))      return Resolution::Low;
    if (detail::iequals(text, "standard")) return Resolution::Standard;
    if (detail::iequals(text, "high"))     return Resolution::High;
    return std::nullopt;
}

std::string_view to_string(Resolution resolution) noexcept {
    switch (resolution) {
        case Resolution::Low:      return "low";
        case Resolution::Standard: return "standard";
        case Resolution::High:     return "high";
    }
    return "standard";
}

// ─── Downsampler ──────────────────────────────────────────────────────────────

Downsampler::Downsampler(DownsampleConfig config) noexcept
    : config_(config) {}

const DownsampleConfig& Downsampler::config() const noexcept {
    return config_;
}

std::optional<std::vector<ledger::DailyMetric>>
Downsampler::apply(std::span<const ledger::DailyMetric> metrics) const {
    return downsample(metrics, config_.target_points, config_.mode);
}

std::vector<std::size_t>
Downsampler::sample_indices(std::size_t idle_count,
                            std::size_t slots,
                            SamplingMode mode) {
    std::vector<std::size_t> picks;
    if (idle_count == 0 || slots == 0) return picks;

    if (mode == SamplingMode::Stride) {
        // ceil(idle / slots); the walk may stop short of `slots` picks.
        const std::size_t step = (idle_count + slots - 1) / slots;
        picks.reserve(idle_count / step + 1);
        for (std::size_t i = 0; i < idle_count; i += step) {
            picks.push_back(i);
        }
        return picks;
    }

    if (slots >= idle_count) {
        picks.resize(idle_count);
        for (std::size_t i = 0; i < idle_count; ++i) picks[i] = i;
        return picks;
    }

    // idle_count > slots, so floor(k * idle / slots) is strictly increasing.
    picks.reserve(slots);
    for (std::size_t k = 0; k < slots; ++k) {
        picks.push_back(k * idle_count / slots);
    }
    return picks;
}

std::optional<std::vector<ledger::DailyMetric>>
Downsampler::downsample(std::span<const ledger::DailyMetric> metrics,
                        std::size_t target_points,
                        SamplingMode mode) {
    if (target_points == 0) return std::nullopt;

    if (metrics.size() <= target_points) {
        return std::vector<ledger::DailyMetric>(metrics.begin(), metrics.end());
    }

    std::vector<ledger::DailyMetric> result;
    std::vector<const ledger::DailyMetric*> idle;
    result.reserve(target_points);

    // Active days are kept unconditionally.
    for (const auto& m : metrics) {
        if (m.has_activity()) {
            result.push_back(m);
        } else {
            idle.push_back(&m);
        }
    }

    if (result.size() < target_points) {
        const std::size_t slots = target_points - result.size();
        for (std::size_t i : sample_indices(idle.size(), slots, mode)) {
            result.push_back(*idle[i]);
        }
    }

    std::stable_sort(result.begin(), result.end(),
                     [](const ledger::DailyMetric& a, const ledger::DailyMetric& b) {
                         return a.date < b.date;
                     });
    return result;
}

}  // namespace finagg::series
