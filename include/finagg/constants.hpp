#pragma once

#include <cstddef>
#include <string_view>

/// @file include/finagg/constants.hpp
/// @brief Policy constants for the finagg aggregation engine.
///
/// Point budgets, aging boundaries and tolerances shared by every module.
/// Callers may override most of these through the config structs; the values
/// here are the defaults.

namespace finagg::constants {

// ─── Category Layout ──────────────────────────────────────────────────────────

/// Number of WIP categories carried in a CategoryVector.
static constexpr int CATEGORY_COUNT = 5;

// ─── Downsampling Budgets ─────────────────────────────────────────────────────

/// Point budget for the "low" display resolution.
static constexpr std::size_t LOW_RESOLUTION_POINTS = 60;

/// Point budget for the "standard" display resolution (default).
static constexpr std::size_t STANDARD_RESOLUTION_POINTS = 120;

/// Point budget for the "high" display resolution (one year of days).
static constexpr std::size_t HIGH_RESOLUTION_POINTS = 365;

// ─── Aging Boundaries (inclusive upper day limits) ────────────────────────────

/// Upper bound of the `current` bucket under the 30-day scheme.
static constexpr long AGING_CURRENT_30 = 30;

/// Upper bound of the `current` bucket under the 60-day scheme, and of the
/// `days31_60` bucket under the 30-day scheme.
static constexpr long AGING_CURRENT_60 = 60;

/// Upper bound of the `days61_90` bucket.
static constexpr long AGING_90 = 90;

/// Upper bound of the `days91_120` bucket. Older balances are `days120_plus`.
static constexpr long AGING_120 = 120;

// ─── Service Lines ────────────────────────────────────────────────────────────

/// Master service-line key for rows whose service line has no mapping.
static constexpr std::string_view UNKNOWN_SERVICE_LINE = "UNKNOWN";

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Balances smaller than this in magnitude are treated as settled.
static constexpr double SETTLED_EPSILON = 0.005;

/// Tolerance used when comparing two independently summed balances.
static constexpr double BALANCE_EPSILON = 1e-6;

} // namespace finagg::constants
