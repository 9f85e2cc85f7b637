#pragma once

/// @file include/finagg/engine.hpp
/// @brief Report Engine — wires the calculators into client/group reports.
///
/// # Module: Report Engine
///
/// ## Responsibility
/// Orchestrate the full WIP reporting pipeline:
///   rows before window → OpeningBalanceCalculator ┐
///   rows in window     → BalanceAggregator ───────┴→ Downsampler → GraphReport
/// once over all rows and once per master service line, and the debtor
/// pipeline:
///   debtor rows → DebtorAnalyzer (overall + per service line)
///               → InvoiceDetailBuilder → DebtorReport
///
/// ## Usage
/// ```cpp
/// Engine engine;
/// auto rows = DataLoader::load_transactions("wip.csv");
/// if (rows) {
///     auto report = engine.build_graph_report(rows->rows, *from, *to, ServiceLineMap{});
///     if (report) fmt::print("{}\n", report->to_string());
/// }
/// ```
///
/// ## Guarantees
/// - Pure: reports are functions of (rows, dates, config); no I/O, no clock
/// - `const` member functions only after construction
/// - Reports are plain values, safe to cache by (scope, window, resolution)

#include "finagg/balance.hpp"
#include "finagg/debtors.hpp"
#include "finagg/downsample.hpp"
#include "finagg/service_line.hpp"
#include "finagg/types.hpp"
#include "finagg/wip_breakdown.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>

namespace finagg::core {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

/// Configuration parameters for the report engine.
struct EngineConfig {
    /// Display resolution; mapped to a point budget for the downsampler.
    series::Resolution resolution = series::Resolution::Standard;

    /// Explicit point budget. Overrides `resolution` when set.
    std::optional<std::size_t> target_points;

    /// How idle days fill the downsampler's free slots.
    series::SamplingMode sampling = series::SamplingMode::EvenFill;

    /// Aging scheme for debtor reports.
    debtors::AgingScheme aging_scheme = debtors::AgingScheme::Sixty;
};

// ─── Reports ──────────────────────────────────────────────────────────────────

/// WIP graph data for one scope, overall and per master service line.
struct GraphReport {
    double                           opening_balance = 0.0;
    ledger::WipSeries                overall;
    std::map<std::string, ledger::WipSeries> by_master_service_line;

    [[nodiscard]] std::string to_string() const;
};

/// Debtor data for one scope.
struct DebtorReport {
    debtors::DebtorMetrics                        overall;
    std::map<std::string, debtors::DebtorMetrics> by_master_service_line;
    debtors::InvoicesByBucket                     invoices_by_bucket;
    std::size_t                                   total_invoices = 0;

    [[nodiscard]] std::string to_string() const;
};

// ─── Engine ───────────────────────────────────────────────────────────────────

/// Builds GraphReport / DebtorReport values from scoped ledger rows.
class Engine {
public:
    explicit Engine(EngineConfig config = EngineConfig{});

    /// Build a graph report from rows already split by the caller.
    ///
    /// # Arguments
    /// * `period`  — rows inside the reporting window
    /// * `opening` — rows before the window (seed the running balance)
    /// * `map`     — service-line mapping for the per-master breakdown
    ///
    /// Each master service line is seeded with the opening balance of its
    /// own opening rows.
    ///
    /// # Returns
    /// `nullopt` if the configured point budget is zero.
    [[nodiscard]] std::optional<GraphReport>
    build_graph_report(std::span<const Transaction> period,
                       std::span<const Transaction> opening,
                       const ServiceLineMap& map) const;

    /// Build a graph report for the window [from, to] out of a single row
    /// stream: rows before `from` seed the balance, rows after `to` are
    /// ignored.
    ///
    /// # Returns
    /// `nullopt` if `to < from` or the point budget is zero.
    [[nodiscard]] std::optional<GraphReport>
    build_graph_report(std::span<const Transaction> rows,
                       CalendarDate from,
                       CalendarDate to,
                       const ServiceLineMap& map) const;

    /// Build a debtor report aged relative to `today`.
    [[nodiscard]] DebtorReport
    build_debtor_report(std::span<const DebtorTransaction> rows,
                        CalendarDate today,
                        const ServiceLineMap& map) const;

    /// WIP breakdown per task id.
    [[nodiscard]] std::map<std::string, ledger::WipBreakdown>
    task_balances(std::span<const Transaction> rows) const;

    /// Point budget after applying the `target_points` override.
    [[nodiscard]] std::size_t effective_target_points() const noexcept;

    [[nodiscard]] const EngineConfig& config() const noexcept;

private:
    /// Aggregate one partition and downsample its daily series.
    [[nodiscard]] std::optional<ledger::WipSeries>
    build_series(std::span<const Transaction> period,
                 double opening_balance) const;

    EngineConfig config_;
};

}  // namespace finagg::core
