/// @file src/ledger/opening_balance.cpp
/// @brief OpeningBalanceCalculator — WIP balance before a reporting window.

#include "finagg/balance.hpp"
#include "finagg/categorizer.hpp"

namespace finagg::ledger {

namespace {

/// Add `amount` to the slot of its category. Unknown rows are dropped.
void accumulate(CategoryVector& totals,
                std::string_view type_code,
                std::string_view sub_type_code,
                double amount) noexcept {
    const auto category = TransactionCategorizer::category(type_code, sub_type_code);
    if (const auto idx = TransactionCategorizer::slot(category)) {
        totals[*idx] += amount;
    }
}

}  // namespace

CategoryVector
OpeningBalanceCalculator::category_totals(std::span<const Transaction> transactions) noexcept {
    CategoryVector totals = CategoryVector::Zero();
    for (const auto& txn : transactions) {
        accumulate(totals, txn.type_code, txn.sub_type_code, txn.amount);
    }
    return totals;
}

double
OpeningBalanceCalculator::from_transactions(std::span<const Transaction> transactions) noexcept {
    return wip_change(category_totals(transactions));
}

double
OpeningBalanceCalculator::from_transactions(std::span<const Transaction> transactions,
                                            CalendarDate cutoff) noexcept {
    CategoryVector totals = CategoryVector::Zero();
    for (const auto& txn : transactions) {
        if (txn.date < cutoff) {
            accumulate(totals, txn.type_code, txn.sub_type_code, txn.amount);
        }
    }
    return wip_change(totals);
}

double
OpeningBalanceCalculator::from_type_sums(std::span<const TypeSum> sums) noexcept {
    CategoryVector totals = CategoryVector::Zero();
    for (const auto& sum : sums) {
        accumulate(totals, sum.type_code, sum.sub_type_code, sum.amount);
    }
    return wip_change(totals);
}

}  // namespace finagg::ledger
