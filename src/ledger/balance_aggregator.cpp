/// @file src/ledger/balance_aggregator.cpp
/// @brief BalanceAggregator — daily grouping and running WIP balance.
///
/// Rows are bucketed into a std::map keyed by the ISO date string, so the
/// walk in build_series() visits days in ascending order without a separate
/// sort. Each bucket is a CategoryVector; the day's WIP change is its dot
/// product with the category sign weights.

#include "finagg/balance.hpp"
#include "finagg/categorizer.hpp"

#include <fmt/format.h>

namespace finagg::ledger {

// ─── DailyMetric ──────────────────────────────────────────────────────────────

bool DailyMetric::has_activity() const noexcept {
    return production    != 0.0 ||
           adjustments   != 0.0 ||
           disbursements != 0.0 ||
           billing       != 0.0 ||
           provisions    != 0.0;
}

CategoryVector DailyMetric::totals() const noexcept {
    CategoryVector v;
    v << production, adjustments, disbursements, billing, provisions;
    return v;
}

// ─── AggregateSummary ─────────────────────────────────────────────────────────

std::string AggregateSummary::to_string() const {
    return fmt::format(
        "Production={:.2f}  Adjustments={:.2f}  Disbursements={:.2f}  "
        "Billing={:.2f}  Provisions={:.2f}  WIP={:.2f}",
        total_production, total_adjustments, total_disbursements,
        total_billing, total_provisions, current_wip_balance);
}

// ─── BalanceAggregator::aggregate ─────────────────────────────────────────────

WipSeries BalanceAggregator::aggregate(std::span<const Transaction> transactions,
                                       double opening_balance) {
    DayTotals days;

    for (const auto& txn : transactions) {
        // Every row opens its day, even when its category is Unknown.
        auto [it, inserted] = days.try_emplace(format_date(txn.date),
                                               CategoryVector::Zero());

        const auto category = TransactionCategorizer::category(txn.type_code,
                                                               txn.sub_type_code);
        if (const auto idx = TransactionCategorizer::slot(category)) {
            it->second[*idx] += txn.amount;
        }
    }

    return build_series(days, opening_balance);
}

// ─── BalanceAggregator::aggregate_type_sums ───────────────────────────────────

WipSeries BalanceAggregator::aggregate_type_sums(std::span<const DatedTypeSum> sums,
                                                 double opening_balance) {
    DayTotals days;

    for (const auto& sum : sums) {
        auto [it, inserted] = days.try_emplace(format_date(sum.date),
                                               CategoryVector::Zero());

        const auto category = TransactionCategorizer::category(sum.type_code,
                                                               sum.sub_type_code);
        if (const auto idx = TransactionCategorizer::slot(category)) {
            it->second[*idx] += sum.amount;
        }
    }

    return build_series(days, opening_balance);
}

// ─── BalanceAggregator::build_series ──────────────────────────────────────────

WipSeries BalanceAggregator::build_series(const DayTotals& days,
                                          double opening_balance) {
    WipSeries out;
    out.daily_metrics.reserve(days.size());

    CategoryVector window_totals = CategoryVector::Zero();
    double running = opening_balance;

    for (const auto& [date, totals] : days) {
        running += wip_change(totals);
        window_totals += totals;

        out.daily_metrics.push_back(DailyMetric{
            .date          = date,
            .production    = totals[PRODUCTION],
            .adjustments   = totals[ADJUSTMENTS],
            .disbursements = totals[DISBURSEMENTS],
            .billing       = totals[BILLING],
            .provisions    = totals[PROVISIONS],
            .wip_balance   = running,
        });
    }

    out.summary = AggregateSummary{
        .total_production    = window_totals[PRODUCTION],
        .total_adjustments   = window_totals[ADJUSTMENTS],
        .total_disbursements = window_totals[DISBURSEMENTS],
        .total_billing       = window_totals[BILLING],
        .total_provisions    = window_totals[PROVISIONS],
        .current_wip_balance = running,
    };
    return out;
}

}  // namespace finagg::ledger
