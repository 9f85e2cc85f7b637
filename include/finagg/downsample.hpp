#pragma once

/// @file include/finagg/downsample.hpp
/// @brief Time-Series Downsampler — bounded-size display series.
///
/// # Module: Downsampler
///
/// ## Responsibility
/// Reduce a long daily WIP series to roughly `target_points` entries without
/// ever dropping a day that carried financial activity.
///
/// ## Algorithm
/// 1. `size <= target` → input returned unchanged.
/// 2. Split into active days (any category non-zero) and idle days (all five
///    totals exactly zero, balance carried forward).
/// 3. Keep every active day.
/// 4. Fill the remaining `target − active` slots with an evenly spaced sample
///    of idle days, preserving their order.
/// 5. No slots left → active days only (output may exceed the target).
/// 6. Sort the result by date.
///
/// ## Sampling Modes
/// - `EvenFill` selects exactly `min(slots, idle)` idle days at indices
///   ⌊k · idle / slots⌋, so the output hits the target whenever enough idle
///   days exist.
/// - `Stride` takes every ⌈idle / slots⌉-th idle day from index 0. It can
///   fall short of the target (390 idle days, 110 slots → 98 sampled).
///
/// ## Guarantees
/// - Every active day of the input appears unchanged in the output
/// - Output is sorted ascending by date
/// - `target_points == 0` is a contract violation → `nullopt`

#include "finagg/balance.hpp"
#include "finagg/constants.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace finagg::series {

// ─── Types ────────────────────────────────────────────────────────────────────

/// How idle days are sampled into the free slots.
enum class SamplingMode {
    EvenFill,
    Stride,
};

/// Caller-facing display resolution.
enum class Resolution {
    Low,
    Standard,
    High,
};

/// Point budget for a resolution: Low 60, Standard 120, High 365.
[[nodiscard]] std::size_t target_points(Resolution resolution) noexcept;

/// Parse "low" / "standard" / "high" (case-insensitive).
[[nodiscard]] std::optional<Resolution> parse_resolution(std::string_view text) noexcept;

/// Lower-case name of a resolution.
[[nodiscard]] std::string_view to_string(Resolution resolution) noexcept;

/// Downsampler configuration.
struct DownsampleConfig {
    std::size_t  target_points = constants::STANDARD_RESOLUTION_POINTS;
    SamplingMode mode          = SamplingMode::EvenFill;
};

// ─── Downsampler ──────────────────────────────────────────────────────────────

/// Activity-preserving downsampler for daily WIP metrics.
class Downsampler {
public:
    explicit Downsampler(DownsampleConfig config = DownsampleConfig{}) noexcept;

    /// Downsample with the configured target and mode.
    [[nodiscard]] std::optional<std::vector<ledger::DailyMetric>>
    apply(std::span<const ledger::DailyMetric> metrics) const;

    /// Downsample `metrics` to about `target_points` entries.
    ///
    /// # Returns
    /// `nullopt` if `target_points == 0`; otherwise the downsampled series.
    [[nodiscard]] static std::optional<std::vector<ledger::DailyMetric>>
    downsample(std::span<const ledger::DailyMetric> metrics,
               std::size_t target_points,
               SamplingMode mode = SamplingMode::EvenFill);

    [[nodiscard]] const DownsampleConfig& config() const noexcept;

private:
    /// Indices (into the idle list) selected for `slots` free slots.
    [[nodiscard]] static std::vector<std::size_t>
    sample_indices(std::size_t idle_count,
                   std::size_t slots,
                   SamplingMode mode);

    DownsampleConfig config_;
};

}  // namespace finagg::series
