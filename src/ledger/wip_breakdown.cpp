/// @file src/ledger/wip_breakdown.cpp
/// @brief WipBreakdownCalculator — gross/net WIP per task.

#include "finagg/wip_breakdown.hpp"
#include "finagg/categorizer.hpp"

#include "../core/text.hpp"

#include <fmt/format.h>

namespace finagg::ledger {

// ─── WipBreakdown ─────────────────────────────────────────────────────────────

double WipBreakdown::time_balance() const noexcept {
    return time + time_adjustments;
}

double WipBreakdown::disbursement_balance() const noexcept {
    return disbursements + disbursement_adjustments;
}

std::string WipBreakdown::to_string() const {
    return fmt::format(
        "Time={:.2f} (adj {:+.2f})  Disb={:.2f} (adj {:+.2f})  Fees={:.2f}  "
        "Provision={:.2f}  Gross={:.2f}  Net={:.2f}",
        time, time_adjustments, disbursements, disbursement_adjustments,
        fees, provision, gross_wip, net_wip);
}

// ─── WipBreakdownCalculator ───────────────────────────────────────────────────

void WipBreakdownCalculator::accumulate(WipBreakdown& out,
                                        const Transaction& txn) noexcept {
    switch (TransactionCategorizer::category(txn.type_code, txn.sub_type_code)) {
        case TransactionCategory::Time:
            out.time += txn.amount;
            break;
        case TransactionCategory::Disbursement:
            out.disbursements += txn.amount;
            break;
        case TransactionCategory::Fee:
            out.fees += txn.amount;
            break;
        case TransactionCategory::Provision:
            out.provision += txn.amount;
            break;
        case TransactionCategory::Adjustment:
            if (detail::icontains(txn.sub_type_code, "time")) {
                out.time_adjustments += txn.amount;
            } else if (detail::icontains(txn.sub_type_code, "disb")) {
                out.disbursement_adjustments += txn.amount;
            } else {
                out.unallocated_adjustments += txn.amount;
            }
            break;
        case TransactionCategory::Unknown:
            break;
    }
}

void WipBreakdownCalculator::finalise(WipBreakdown& out) noexcept {
    out.gross_wip = out.time + out.time_adjustments
                  + out.disbursements + out.disbursement_adjustments
                  - out.fees;
    out.net_wip = out.gross_wip + out.provision;
}

WipBreakdown
WipBreakdownCalculator::calculate(std::span<const Transaction> transactions) noexcept {
    WipBreakdown out;
    for (const auto& txn : transactions) {
        accumulate(out, txn);
    }
    finalise(out);
    return out;
}

std::map<std::string, WipBreakdown>
WipBreakdownCalculator::by_task(std::span<const Transaction> transactions) {
    std::map<std::string, WipBreakdown> out;
    for (const auto& txn : transactions) {
        if (!txn.task_id || txn.task_id->empty()) continue;
        accumulate(out[*txn.task_id], txn);
    }
    for (auto& [task, breakdown] : out) {
        finalise(breakdown);
    }
    return out;
}

}  // namespace finagg::ledger
