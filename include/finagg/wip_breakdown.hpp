#pragma once

/// @file include/finagg/wip_breakdown.hpp
/// @brief Task WIP breakdown — gross and net WIP split by component.
///
/// Adjustments are attributed to time or disbursements from the sub-type
/// text (`TIME` → time adjustment, `DISB` → disbursement adjustment).
/// Adjustments matching neither are reported separately and kept out of
/// gross WIP.
///
///     gross_wip = time + time_adjustments + disbursements
///               + disbursement_adjustments − fees
///     net_wip   = gross_wip + provision

#include "finagg/types.hpp"

#include <map>
#include <span>
#include <string>

namespace finagg::ledger {

/// WIP components for one task (or any scoped row set).
struct WipBreakdown {
    double time                     = 0.0;
    double time_adjustments         = 0.0;
    double disbursements            = 0.0;
    double disbursement_adjustments = 0.0;
    double unallocated_adjustments  = 0.0;
    double fees                     = 0.0;
    double provision                = 0.0;
    double gross_wip                = 0.0;
    double net_wip                  = 0.0;

    /// Time balance: time + time adjustments.
    [[nodiscard]] double time_balance() const noexcept;

    /// Disbursement balance: disbursements + disbursement adjustments.
    [[nodiscard]] double disbursement_balance() const noexcept;

    [[nodiscard]] std::string to_string() const;
};

/// Stateless calculator for WipBreakdown.
class WipBreakdownCalculator {
public:
    /// Breakdown over every row supplied.
    [[nodiscard]] static WipBreakdown
    calculate(std::span<const Transaction> transactions) noexcept;

    /// Breakdown per task id. Rows without a task id are skipped.
    [[nodiscard]] static std::map<std::string, WipBreakdown>
    by_task(std::span<const Transaction> transactions);

private:
    /// Add one row's amount to the matching component of `out`.
    static void accumulate(WipBreakdown& out, const Transaction& txn) noexcept;

    /// Recompute gross and net WIP from the components.
    static void finalise(WipBreakdown& out) noexcept;
};

}  // namespace finagg::ledger
