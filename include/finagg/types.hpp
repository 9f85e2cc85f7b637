#pragma once

/// @file include/finagg/types.hpp
/// @brief Shared value types for the finagg aggregation engine.
///
/// Every module includes this file. It defines the ledger input records, the
/// calendar-day type and the Eigen-based category vector used for all WIP
/// arithmetic.

#include "finagg/constants.hpp"

#include <Eigen/Dense>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace finagg {

// ─── Calendar ─────────────────────────────────────────────────────────────────

/// A calendar day. Transactions carry day precision only.
using CalendarDate = std::chrono::sys_days;

/// Parse `YYYY-MM-DD`, optionally followed by a time part starting with `T`
/// or a space (e.g. `2024-01-05T13:45:00Z`), which is discarded.
///
/// # Returns
/// `nullopt` if the text is not a valid calendar day.
[[nodiscard]] std::optional<CalendarDate> parse_date(std::string_view text) noexcept;

/// Format a calendar day as `YYYY-MM-DD`.
[[nodiscard]] std::string format_date(CalendarDate date);

/// Whole days from `from` to `to` (negative when `to` precedes `from`).
[[nodiscard]] long days_between(CalendarDate from, CalendarDate to) noexcept;

// ─── Category Vector ──────────────────────────────────────────────────────────

/// Category totals in fixed order:
/// [production, adjustments, disbursements, billing, provisions].
using CategoryVector = Eigen::Vector<double, constants::CATEGORY_COUNT>;

/// Index of each category inside a CategoryVector.
enum CategoryIndex : int {
    PRODUCTION    = 0,
    ADJUSTMENTS   = 1,
    DISBURSEMENTS = 2,
    BILLING       = 3,
    PROVISIONS    = 4,
};

/// Sign each category carries in the WIP movement:
///   change = production + adjustments + disbursements + provisions − billing
[[nodiscard]] const CategoryVector& wip_flow_weights() noexcept;

/// WIP movement implied by a set of category totals.
[[nodiscard]] double wip_change(const CategoryVector& totals) noexcept;

// ─── Ledger Records ───────────────────────────────────────────────────────────

/// A single WIP ledger row. Read-only input to the engine.
///
/// A row may reference a task, a client, or both. The caller resolves which
/// rows belong to a scope (client rows OR rows of the client's tasks) before
/// handing them over.
struct Transaction {
    CalendarDate               date;
    double                     amount = 0.0;  ///< Signed, used as-is
    std::string                type_code;     ///< Primary code (T, D, ADJ, F, P, ...)
    std::string                sub_type_code; ///< Refinement, may be empty
    std::optional<std::string> task_id;
    std::optional<std::string> client_id;
    std::string                service_line;  ///< Raw service-line code
};

/// A single debtor (receivables) ledger row.
///
/// Receipts are negative, invoices and credit notes positive.
struct DebtorTransaction {
    CalendarDate               date;
    double                     amount = 0.0;
    std::string                entry_type;     ///< Free text ("Invoice", "Receipt", ...)
    std::optional<std::string> invoice_number; ///< Correlation key
    std::string                service_line;
};

} // namespace finagg
