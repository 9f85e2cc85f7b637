#pragma once

/// @file include/finagg/categorizer.hpp
/// @brief Transaction Categorizer — maps ledger type codes to WIP categories.
///
/// # Module: Transaction Categorizer
///
/// ## Responsibility
/// Classify a WIP ledger row into exactly one of five disjoint categories
/// (time, adjustment, disbursement, fee, provision) or Unknown, from its
/// primary type code and optional sub-type.
///
/// ## Code Table (case-insensitive, whitespace-trimmed)
///   Time         T, TI, TIM, TIME
///   Disbursement D, DI, DIS, DISB
///   Fee          F, FEE
///   Adjustment   ADJ
///   Provision    P, PRO, PROV
///
/// A recognised primary code always decides the category. When the primary
/// code is not recognised, a fee-variant sub-type (`F`, or any
/// sub-type containing `FEE` or `BILLING`) classifies the row as Fee.
///
/// ## Guarantees
/// - Pure and `noexcept`; unrecognised codes yield Unknown, never an error
/// - At most one flag of CategoryFlags is ever true

#include "finagg/types.hpp"

#include <optional>
#include <string_view>

namespace finagg::ledger {

// ─── Types ────────────────────────────────────────────────────────────────────

/// Disjoint semantic category of a WIP ledger row.
enum class TransactionCategory {
    Time,
    Adjustment,
    Disbursement,
    Fee,
    Provision,
    Unknown,
};

/// Flag-set form of a TransactionCategory.
struct CategoryFlags {
    bool is_time         = false;
    bool is_adjustment   = false;
    bool is_disbursement = false;
    bool is_fee          = false;
    bool is_provision    = false;

    /// True when no flag is set (Unknown category).
    [[nodiscard]] bool is_unknown() const noexcept;

    bool operator==(const CategoryFlags&) const = default;
};

/// Human-readable category name ("Time", "Fee", ...).
[[nodiscard]] std::string_view to_string(TransactionCategory category) noexcept;

// ─── TransactionCategorizer ───────────────────────────────────────────────────

/// Stateless classifier for WIP ledger type codes.
class TransactionCategorizer {
public:
    /// Classify a row by primary code and optional sub-type.
    [[nodiscard]] static TransactionCategory
    category(std::string_view type_code,
             std::string_view sub_type_code = {}) noexcept;

    /// Same classification expressed as a flag set.
    [[nodiscard]] static CategoryFlags
    categorize(std::string_view type_code,
               std::string_view sub_type_code = {}) noexcept;

    /// Slot of a category inside a CategoryVector.
    ///
    /// # Returns
    /// `nullopt` for Unknown, which contributes to no total.
    [[nodiscard]] static std::optional<CategoryIndex>
    slot(TransactionCategory category) noexcept;

    /// True if `sub_type_code` names a fee/billing variant.
    [[nodiscard]] static bool
    is_fee_variant(std::string_view sub_type_code) noexcept;

private:
    /// Classify the primary code alone. Unknown if not in the code table.
    [[nodiscard]] static TransactionCategory
    primary_category(std::string_view type_code) noexcept;
};

}  // namespace finagg::ledger
