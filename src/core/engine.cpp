/// @file src/core/engine.cpp
/// @brief Report Engine — WIP graph and debtor pipelines.

#include "finagg/engine.hpp"

#include <fmt/format.h>

#include <utility>
#include <vector>

namespace finagg::core {

namespace {

/// Append one labelled line per series summary.
void append_series(std::string& out, std::string_view label, const ledger::WipSeries& s) {
    out += fmt::format("  {:<12} points={:<4} {}\n",
                       label, s.daily_metrics.size(), s.summary.to_string());
}

}  // anonymous namespace

// ─── Report formatting ────────────────────────────────────────────────────────

std::string GraphReport::to_string() const {
    std::string out = fmt::format("WIP graph  opening={:.2f}\n", opening_balance);
    append_series(out, "overall", overall);
    for (const auto& [master, series] : by_master_service_line) {
        append_series(out, master, series);
    }
    return out;
}

std::string DebtorReport::to_string() const {
    std::string out = fmt::format("Debtors  open_invoices={}\n", total_invoices);
    out += fmt::format("  {:<12} {}\n", "overall", overall.to_string());
    for (const auto& [master, metrics] : by_master_service_line) {
        out += fmt::format("  {:<12} {}\n", master, metrics.to_string());
    }
    for (const auto& [bucket, invoices] : invoices_by_bucket) {
        out += fmt::format("  [{}] {} invoice(s)\n", debtors::to_string(bucket), invoices.size());
        for (const auto& inv : invoices) {
            out += fmt::format("    {:<12} {}  original={:.2f}  paid={:.2f}  net={:.2f}  "
                               "days={}  service_line={}\n",
                               inv.invoice_number, format_date(inv.invoice_date),
                               inv.original_amount, inv.payments_received,
                               inv.net_balance, inv.days_outstanding, inv.service_line);
        }
    }
    return out;
}

// ─── Engine constructor ───────────────────────────────────────────────────────

Engine::Engine(EngineConfig config)
    : config_(std::move(config))
{}

const EngineConfig& Engine::config() const noexcept {
    return config_;
}

std::size_t Engine::effective_target_points() const noexcept {
    return config_.target_points.value_or(series::target_points(config_.resolution));
}

// ─── Engine::build_series ─────────────────────────────────────────────────────

std::optional<ledger::WipSeries>
Engine::build_series(std::span<const Transaction> period,
                     double opening_balance) const {
    auto series = ledger::BalanceAggregator::aggregate(period, opening_balance);

    auto sampled = series::Downsampler::downsample(
        series.daily_metrics, effective_target_points(), config_.sampling);
    if (!sampled) {
        return std::nullopt;
    }

    // The summary covers every day; only the plotted points are reduced.
    series.daily_metrics = std::move(*sampled);
    return series;
}

// ─── Engine::build_graph_report ───────────────────────────────────────────────

std::optional<GraphReport>
Engine::build_graph_report(std::span<const Transaction> period,
                           std::span<const Transaction> opening,
                           const ServiceLineMap& map) const {
    if (effective_target_points() == 0) {
        return std::nullopt;
    }

    GraphReport report;
    report.opening_balance = ledger::OpeningBalanceCalculator::from_transactions(opening);

    auto overall = build_series(period, report.opening_balance);
    if (!overall) {
        return std::nullopt;
    }
    report.overall = std::move(*overall);

    const auto period_parts  = partition_by_master(period, map);
    const auto opening_parts = partition_by_master(opening, map);

    for (const auto& [master, rows] : period_parts) {
        double seed = 0.0;
        if (const auto it = opening_parts.find(master); it != opening_parts.end()) {
            seed = ledger::OpeningBalanceCalculator::from_transactions(it->second);
        }
        auto part = build_series(rows, seed);
        if (!part) {
            return std::nullopt;
        }
        report.by_master_service_line.emplace(master, std::move(*part));
    }

    return report;
}

std::optional<GraphReport>
Engine::build_graph_report(std::span<const Transaction> rows,
                           CalendarDate from,
                           CalendarDate to,
                           const ServiceLineMap& map) const {
    if (to < from) {
        return std::nullopt;
    }

    std::vector<Transaction> period;
    std::vector<Transaction> opening;
    for (const auto& txn : rows) {
        if (txn.date < from) {
            opening.push_back(txn);
        } else if (txn.date <= to) {
            period.push_back(txn);
        }
    }

    return build_graph_report(period, opening, map);
}

// ─── Engine::build_debtor_report ──────────────────────────────────────────────

DebtorReport
Engine::build_debtor_report(std::span<const DebtorTransaction> rows,
                            CalendarDate today,
                            const ServiceLineMap& map) const {
    const debtors::DebtorConfig cfg{.scheme = config_.aging_scheme};
    const debtors::DebtorAnalyzer analyzer(cfg);
    const debtors::InvoiceDetailBuilder builder(cfg);

    DebtorReport report;
    report.overall = analyzer.analyze(rows, today);
    report.by_master_service_line =
        analyzer.analyze_by_service_line(rows, today, map.mapping(), map.unknown_key());
    report.invoices_by_bucket = builder.build(rows, today, map.mapping());
    report.total_invoices     = debtors::InvoiceDetailBuilder::count(report.invoices_by_bucket);
    return report;
}

// ─── Engine::task_balances ────────────────────────────────────────────────────

std::map<std::string, ledger::WipBreakdown>
Engine::task_balances(std::span<const Transaction> rows) const {
    return ledger::WipBreakdownCalculator::by_task(rows);
}

}  // namespace finagg::core
