/// @file src/debtors/invoice_details.cpp
/// @brief InvoiceDetailBuilder — open invoices grouped by aging bucket.
///
/// The invoice date and original amount come from the earliest invoice-like
/// row of a group. Net balance is the sum of every row in the group, so
/// credit notes and journals also reduce it; `payments_received` only
/// counts payment-like rows.

#include "finagg/debtors.hpp"

#include <algorithm>
#include <cmath>

namespace finagg::debtors {

InvoiceDetailBuilder::InvoiceDetailBuilder(DebtorConfig config) noexcept
    : config_(config) {}

InvoicesByBucket
InvoiceDetailBuilder::build(std::span<const DebtorTransaction> transactions,
                            CalendarDate today,
                            const std::map<std::string, std::string>& service_line_names) const {
    std::map<std::string, std::vector<const DebtorTransaction*>> groups;
    for (const auto& txn : transactions) {
        if (!txn.invoice_number || txn.invoice_number->empty()) continue;
        groups[*txn.invoice_number].push_back(&txn);
    }

    InvoicesByBucket out;
    for (auto& [number, rows] : groups) {
        std::stable_sort(rows.begin(), rows.end(),
                         [](const DebtorTransaction* a, const DebtorTransaction* b) {
                             return a->date < b->date;
                         });

        const auto invoice = std::find_if(rows.begin(), rows.end(), [](const auto* r) {
            return DebtorAnalyzer::is_invoice_entry(r->entry_type);
        });
        if (invoice == rows.end()) continue;

        InvoiceDetail detail;
        detail.invoice_number  = number;
        detail.invoice_date    = (*invoice)->date;
        detail.original_amount = (*invoice)->amount;

        const auto name = service_line_names.find((*invoice)->service_line);
        detail.service_line = name != service_line_names.end()
            ? name->second
            : (*invoice)->service_line;

        for (const auto* row : rows) {
            detail.net_balance += row->amount;
            if (DebtorAnalyzer::is_payment_entry(row->entry_type)) {
                detail.payments_received += row->amount;
                detail.payment_history.push_back(PaymentRecord{row->date, row->amount});
            }
        }

        if (std::abs(detail.net_balance) < constants::SETTLED_EPSILON) continue;

        detail.days_outstanding = days_between(detail.invoice_date, today);
        const auto bucket = DebtorAnalyzer::bucket_for(detail.days_outstanding, config_.scheme);
        out[bucket].push_back(std::move(detail));
    }

    for (auto& [bucket, invoices] : out) {
        std::stable_sort(invoices.begin(), invoices.end(),
                         [](const InvoiceDetail& a, const InvoiceDetail& b) {
                             return a.invoice_date < b.invoice_date;
                         });
    }
    return out;
}

std::size_t InvoiceDetailBuilder::count(const InvoicesByBucket& buckets) noexcept {
    std::size_t n = 0;
    for (const auto& [bucket, invoices] : buckets) {
        n += invoices.size();
    }
    return n;
}

}  // namespace finagg::debtors
