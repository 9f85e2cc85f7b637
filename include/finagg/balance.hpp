#pragma once

/// @file include/finagg/balance.hpp
/// @brief Balance Aggregator and Opening Balance Calculator — public API.
///
/// # Module: WIP Balance
///
/// ## Responsibility
/// Turn a stream of WIP ledger rows into categorised daily metrics with a
/// running work-in-progress balance, and collapse the same arithmetic into a
/// single opening-balance scalar for rows that precede a reporting window.
///
/// ## The Core Formula
///     change_d  = production_d + adjustments_d + disbursements_d
///               + provisions_d − billing_d
///     wip_d     = wip_{d−1} + change_d,      wip_{−1} = opening balance
///
/// Fees are stored as positive magnitudes and subtracted; every other
/// category is added with its sign as recorded in the ledger.
///
/// ## Guarantees
/// - Total functions: empty input and unknown codes are not errors
/// - Input order does not matter; output is sorted ascending by date
/// - Stateless, `const`/static only — safe for concurrent callers
///
/// ## NOT Responsible For
/// - Fetching or scoping rows (caller supplies the filtered stream)
/// - Downsampling for display (see finagg/downsample.hpp)

#include "finagg/types.hpp"

#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace finagg::ledger {

// ─── Types ────────────────────────────────────────────────────────────────────

/// Category totals and cumulative WIP for one calendar day.
struct DailyMetric {
    std::string date;                 ///< YYYY-MM-DD
    double      production    = 0.0;
    double      adjustments   = 0.0;
    double      disbursements = 0.0;
    double      billing       = 0.0;
    double      provisions    = 0.0;
    double      wip_balance   = 0.0;  ///< Cumulative, inclusive of this day

    /// True if any of the five category totals is non-zero.
    [[nodiscard]] bool has_activity() const noexcept;

    /// The five category totals as a CategoryVector.
    [[nodiscard]] CategoryVector totals() const noexcept;

    bool operator==(const DailyMetric&) const = default;
};

/// Window-level totals plus the closing WIP balance.
struct AggregateSummary {
    double total_production    = 0.0;
    double total_adjustments   = 0.0;
    double total_disbursements = 0.0;
    double total_billing       = 0.0;
    double total_provisions    = 0.0;
    double current_wip_balance = 0.0;

    /// One-line summary.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const AggregateSummary&) const = default;
};

/// Output of one aggregation call.
struct WipSeries {
    std::vector<DailyMetric> daily_metrics;
    AggregateSummary         summary;
};

/// A per-type sum produced by a data source that grouped rows by type.
struct TypeSum {
    std::string type_code;
    std::string sub_type_code;  ///< Empty when the source grouped by type only
    double      amount = 0.0;
};

/// A per-day, per-type sum (group by date and type at the source).
struct DatedTypeSum {
    CalendarDate date;
    std::string  type_code;
    std::string  sub_type_code;
    double       amount = 0.0;
};

// ─── BalanceAggregator ────────────────────────────────────────────────────────

/// Groups ledger rows by day and accumulates a running WIP balance.
class BalanceAggregator {
public:
    /// Aggregate raw transactions into daily metrics.
    ///
    /// # Algorithm
    /// 1. Bucket rows by calendar day (input need not be sorted).
    /// 2. Categorise each row and add its amount to the day's category total.
    /// 3. Walk the days ascending, adding each day's WIP change to a running
    ///    total seeded at `opening_balance`.
    ///
    /// Days whose rows are all Unknown still appear, with zero totals.
    [[nodiscard]] static WipSeries
    aggregate(std::span<const Transaction> transactions,
              double opening_balance = 0.0);

    /// Aggregate rows that were pre-grouped by (date, type) at the source.
    /// Same output as `aggregate` over the equivalent raw rows.
    [[nodiscard]] static WipSeries
    aggregate_type_sums(std::span<const DatedTypeSum> sums,
                        double opening_balance = 0.0);

private:
    /// Day-keyed category totals; std::map keeps YYYY-MM-DD keys ascending.
    using DayTotals = std::map<std::string, CategoryVector>;

    /// Walk `days` in order and produce the series seeded at `opening_balance`.
    [[nodiscard]] static WipSeries
    build_series(const DayTotals& days, double opening_balance);
};

// ─── OpeningBalanceCalculator ─────────────────────────────────────────────────

/// Collapses the WIP formula to one scalar for rows before a window.
///
/// Both entry points apply identical categorisation and signs, so raw rows
/// and their per-type sums always yield the same balance.
class OpeningBalanceCalculator {
public:
    /// Opening balance over every row supplied.
    [[nodiscard]] static double
    from_transactions(std::span<const Transaction> transactions) noexcept;

    /// Opening balance over rows dated strictly before `cutoff`.
    [[nodiscard]] static double
    from_transactions(std::span<const Transaction> transactions,
                      CalendarDate cutoff) noexcept;

    /// Opening balance from pre-aggregated per-type sums.
    [[nodiscard]] static double
    from_type_sums(std::span<const TypeSum> sums) noexcept;

    /// Category totals over every row supplied (the vector behind the scalar).
    [[nodiscard]] static CategoryVector
    category_totals(std::span<const Transaction> transactions) noexcept;
};

}  // namespace finagg::ledger
