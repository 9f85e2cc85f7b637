/// @file src/ledger/transaction_categorizer.cpp
/// @brief TransactionCategorizer — WIP type-code classification table.

#include "finagg/categorizer.hpp"

#include "../core/text.hpp"

#include <array>

namespace finagg::ledger {

// ─── Code table (file-local) ──────────────────────────────────────────────────

namespace {

struct CodeEntry {
    std::string_view    code;
    TransactionCategory category;
};

constexpr std::array<CodeEntry, 14> CODE_TABLE{{
    {"T",    TransactionCategory::Time},
    {"TI",   TransactionCategory::Time},
    {"TIM",  TransactionCategory::Time},
    {"TIME", TransactionCategory::Time},
    {"D",    TransactionCategory::Disbursement},
    {"DI",   TransactionCategory::Disbursement},
    {"DIS",  TransactionCategory::Disbursement},
    {"DISB", TransactionCategory::Disbursement},
    {"F",    TransactionCategory::Fee},
    {"FEE",  TransactionCategory::Fee},
    {"ADJ",  TransactionCategory::Adjustment},
    {"P",    TransactionCategory::Provision},
    {"PRO",  TransactionCategory::Provision},
    {"PROV", TransactionCategory::Provision},
}};

constexpr std::size_t MAX_CODE_LENGTH = 4;

/// Sub-types that mark a billing row: the bare code, or any text with a token.
constexpr std::string_view FEE_SUBTYPE_CODE = "f";

constexpr std::array<std::string_view, 2> FEE_SUBTYPE_TOKENS{"fee", "billing"};

}  // namespace

// ─── CategoryFlags / to_string ────────────────────────────────────────────────

bool CategoryFlags::is_unknown() const noexcept {
    return !is_time && !is_adjustment && !is_disbursement && !is_fee && !is_provision;
}

std::string_view to_string(TransactionCategory category) noexcept {
    switch (category) {
        case TransactionCategory::Time:         return "Time";
        case TransactionCategory::Adjustment:   return "Adjustment";
        case TransactionCategory::Disbursement: return "Disbursement";
        case TransactionCategory::Fee:          return "Fee";
        case TransactionCategory::Provision:    return "Provision";
        case TransactionCategory::Unknown:      return "Unknown";
    }
    return "Unknown";
}

// ─── TransactionCategorizer ───────────────────────────────────────────────────

TransactionCategory
TransactionCategorizer::primary_category(std::string_view type_code) noexcept {
    const auto trimmed = detail::trim(type_code);
    if (trimmed.empty() || trimmed.size() > MAX_CODE_LENGTH) return TransactionCategory::Unknown;

    std::array<char, MAX_CODE_LENGTH> buf{};
    for (std::size_t i = 0; i < trimmed.size(); ++i) {
        const auto c = static_cast<unsigned char>(trimmed[i]);
        buf[i] = (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A')
                                        : static_cast<char>(c);
    }
    const std::string_view upper(buf.data(), trimmed.size());

    for (const auto& entry : CODE_TABLE) {
        if (entry.code == upper) return entry.category;
    }
    return TransactionCategory::Unknown;
}

bool TransactionCategorizer::is_fee_variant(std::string_view sub_type_code) noexcept {
    if (detail::trim(sub_type_code).empty()) return false;
    if (detail::iequals(sub_type_code, FEE_SUBTYPE_CODE)) return true;
    for (auto token : FEE_SUBTYPE_TOKENS) {
        if (detail::icontains(sub_type_code, token)) return true;
    }
    return false;
}

TransactionCategory
TransactionCategorizer::category(std::string_view type_code,
                                 std::string_view sub_type_code) noexcept {
    const auto primary = primary_category(type_code);
    if (primary != TransactionCategory::Unknown) return primary;

    // Generic primary code: billing rows are recognised by their sub-type.
    if (is_fee_variant(sub_type_code)) return TransactionCategory::Fee;

    return TransactionCategory::Unknown;
}

CategoryFlags
TransactionCategorizer::categorize(std::string_view type_code,
                                   std::string_view sub_type_code) noexcept {
    CategoryFlags flags;
    switch (category(type_code, sub_type_code)) {
        case TransactionCategory::Time:         flags.is_time = true;         break;
        case TransactionCategory::Adjustment:   flags.is_adjustment = true;   break;
        case TransactionCategory::Disbursement: flags.is_disbursement = true; break;
        case TransactionCategory::Fee:          flags.is_fee = true;          break;
        case TransactionCategory::Provision:    flags.is_provision = true;    break;
        case TransactionCategory::Unknown:                                    break;
    }
    return flags;
}

std::optional<CategoryIndex>
TransactionCategorizer::slot(TransactionCategory category) noexcept {
    switch (category) {
        case TransactionCategory::Time:         return PRODUCTION;
        case TransactionCategory::Adjustment:   return ADJUSTMENTS;
        case TransactionCategory::Disbursement: return DISBURSEMENTS;
        case TransactionCategory::Fee:          return BILLING;
        case TransactionCategory::Provision:    return PROVISIONS;
        case TransactionCategory::Unknown:      return std::nullopt;
    }
    return std::nullopt;
}

}  // namespace finagg::ledger
