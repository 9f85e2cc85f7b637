/// @file src/debtors/debtor_analyzer.cpp
/// @brief DebtorAnalyzer — aging buckets and weighted payment speed.
///
/// Payment speed works on invoice groups: rows sharing an invoice number,
/// ordered by date (stable, so same-day rows keep input order). Within a
/// group the first invoice-like row and the first payment-like row are
/// paired; later payments on the same invoice are ignored here.

#include "finagg/debtors.hpp"

#include "../core/text.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace finagg::debtors {

// ─── Parsing / names ──────────────────────────────────────────────────────────

std::optional<AgingScheme> parse_aging_scheme(std::string_view text) noexcept {
    if (detail::iequals(text, "60") || detail::iequals(text, "sixty"))  return AgingScheme::Sixty;
    if (detail::iequals(text, "30") || detail::iequals(text, "thirty")) return AgingScheme::Thirty;
    return std::nullopt;
}

std::string_view to_string(AgingBucket bucket) noexcept {
    switch (bucket) {
        case AgingBucket::Current:     return "current";
        case AgingBucket::Days31To60:  return "31-60";
        case AgingBucket::Days61To90:  return "61-90";
        case AgingBucket::Days91To120: return "91-120";
        case AgingBucket::Days120Plus: return "120+";
    }
    return "current";
}

// ─── AgingBuckets ─────────────────────────────────────────────────────────────

double AgingBuckets::total() const noexcept {
    return current + days31_60 + days61_90 + days91_120 + days120_plus;
}

double& AgingBuckets::at(AgingBucket bucket) noexcept {
    switch (bucket) {
        case AgingBucket::Current:     return current;
        case AgingBucket::Days31To60:  return days31_60;
        case AgingBucket::Days61To90:  return days61_90;
        case AgingBucket::Days91To120: return days91_120;
        case AgingBucket::Days120Plus: return days120_plus;
    }
    return current;
}

AgingBuckets& AgingBuckets::operator+=(const AgingBuckets& other) noexcept {
    current      += other.current;
    days31_60    += other.days31_60;
    days61_90    += other.days61_90;
    days91_120   += other.days91_120;
    days120_plus += other.days120_plus;
    return *this;
}

// ─── DebtorMetrics ────────────────────────────────────────────────────────────

std::string DebtorMetrics::to_string() const {
    const std::string paid = avg_payment_days_paid
        ? fmt::format("{:.1f}", *avg_payment_days_paid)
        : std::string("n/a");
    return fmt::format(
        "Balance={:.2f}  Current={:.2f}  31-60={:.2f}  61-90={:.2f}  "
        "91-120={:.2f}  120+={:.2f}  DaysPaid={}  DaysOutstanding={:.1f}  "
        "Rows={}  Invoices={}",
        total_balance, aging.current, aging.days31_60, aging.days61_90,
        aging.days91_120, aging.days120_plus, paid,
        avg_payment_days_outstanding, transaction_count, invoice_count);
}

// ─── DebtorAnalyzer ───────────────────────────────────────────────────────────

DebtorAnalyzer::DebtorAnalyzer(DebtorConfig config) noexcept
    : config_(config) {}

const DebtorConfig& DebtorAnalyzer::config() const noexcept {
    return config_;
}

bool DebtorAnalyzer::is_invoice_entry(std::string_view entry_type) noexcept {
    // "inv" also covers "invoice".
    return detail::icontains(entry_type, "inv");
}

bool DebtorAnalyzer::is_payment_entry(std::string_view entry_type) noexcept {
    if (is_invoice_entry(entry_type)) return false;
    return detail::icontains(entry_type, "payment") ||
           detail::icontains(entry_type, "receipt");
}

AgingBucket DebtorAnalyzer::bucket_for(long days_outstanding,
                                       AgingScheme scheme) noexcept {
    if (scheme == AgingScheme::Thirty) {
        if (days_outstanding <= constants::AGING_CURRENT_30) return AgingBucket::Current;
        if (days_outstanding <= constants::AGING_CURRENT_60) return AgingBucket::Days31To60;
    } else if (days_outstanding <= constants::AGING_CURRENT_60) {
        return AgingBucket::Current;
    }
    if (days_outstanding <= constants::AGING_90)  return AgingBucket::Days61To90;
    if (days_outstanding <= constants::AGING_120) return AgingBucket::Days91To120;
    return AgingBucket::Days120Plus;
}

AgingBucket DebtorAnalyzer::bucket_for(long days_outstanding) const noexcept {
    return bucket_for(days_outstanding, config_.scheme);
}

DebtorAnalyzer::PaymentSpeed
DebtorAnalyzer::payment_speed(std::span<const DebtorTransaction> transactions,
                              CalendarDate today) {
    std::map<std::string, std::vector<const DebtorTransaction*>> groups;
    for (const auto& txn : transactions) {
        if (!txn.invoice_number || txn.invoice_number->empty()) continue;
        groups[*txn.invoice_number].push_back(&txn);
    }

    double paid_weighted_days        = 0.0;
    double paid_weight               = 0.0;
    double outstanding_weighted_days = 0.0;
    double outstanding_weight        = 0.0;

    for (auto& [number, rows] : groups) {
        std::stable_sort(rows.begin(), rows.end(),
                         [](const DebtorTransaction* a, const DebtorTransaction* b) {
                             return a->date < b->date;
                         });

        const auto invoice = std::find_if(rows.begin(), rows.end(), [](const auto* r) {
            return is_invoice_entry(r->entry_type);
        });
        if (invoice == rows.end()) continue;  // payments with no invoice row

        const auto payment = std::find_if(rows.begin(), rows.end(), [](const auto* r) {
            return is_payment_entry(r->entry_type);
        });

        const double weight = std::abs((*invoice)->amount);

        if (payment != rows.end()) {
            const long days_to_pay = days_between((*invoice)->date, (*payment)->date);
            paid_weighted_days += static_cast<double>(days_to_pay) * weight;
            paid_weight        += weight;
        } else {
            const long days_open = days_between((*invoice)->date, today);
            outstanding_weighted_days += static_cast<double>(days_open) * weight;
            outstanding_weight        += weight;
        }
    }

    PaymentSpeed out;
    if (paid_weight > 0.0) {
        out.avg_days_paid = paid_weighted_days / paid_weight;
    }
    if (outstanding_weight > 0.0) {
        out.avg_days_outstanding = outstanding_weighted_days / outstanding_weight;
    }
    return out;
}

DebtorMetrics DebtorAnalyzer::analyze(std::span<const DebtorTransaction> transactions,
                                      CalendarDate today) const {
    DebtorMetrics out;
    out.transaction_count = transactions.size();

    for (const auto& txn : transactions) {
        out.total_balance += txn.amount;
        out.aging.at(bucket_for(days_between(txn.date, today))) += txn.amount;
        if (is_invoice_entry(txn.entry_type)) {
            ++out.invoice_count;
        }
    }

    const auto speed = payment_speed(transactions, today);
    out.avg_payment_days_paid        = speed.avg_days_paid;
    out.avg_payment_days_outstanding = speed.avg_days_outstanding;
    return out;
}

std::map<std::string, DebtorMetrics>
DebtorAnalyzer::analyze_by_service_line(std::span<const DebtorTransaction> transactions,
                                        CalendarDate today,
                                        const std::map<std::string, std::string>& mapping,
                                        std::string_view unknown_key) const {
    std::map<std::string, std::vector<DebtorTransaction>> groups;
    for (const auto& txn : transactions) {
        const auto it = mapping.find(txn.service_line);
        const std::string key = (it != mapping.end() && !it->second.empty())
            ? it->second
            : std::string(unknown_key);
        groups[key].push_back(txn);
    }

    std::map<std::string, DebtorMetrics> out;
    for (const auto& [key, rows] : groups) {
        out.emplace(key, analyze(rows, today));
    }
    return out;
}

}  // namespace finagg::debtors
