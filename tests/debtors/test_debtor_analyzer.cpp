/// @file tests/debtors/test_debtor_analyzer.cpp
/// @brief Unit tests for DebtorAnalyzer (aging and payment speed).
///
/// Test categories:
///   - Bucket boundaries under both aging schemes
///   - Entry-type classification
///   - Full ledger: balance, aging, counts, weighted averages
///   - Null/zero conventions for the two averages
///   - Per-service-line breakdown

#include <gtest/gtest.h>
#include "finagg/debtors.hpp"

#include <optional>
#include <string>
#include <vector>

using namespace finagg;
using namespace finagg::debtors;

namespace {

DebtorTransaction row(const char* date, double amount, const char* entry,
                      std::optional<std::string> invoice, const char* service_line = "TAX01") {
    return DebtorTransaction{
        .date           = *parse_date(date),
        .amount         = amount,
        .entry_type     = entry,
        .invoice_number = std::move(invoice),
        .service_line   = service_line,
    };
}

/// Three invoices (paid, part-paid, open) plus one unallocated journal.
std::vector<DebtorTransaction> ledger() {
    return {
        row("2024-01-01",  1000.0, "Invoice", "INV-1"),
        row("2024-01-31", -1000.0, "Receipt", "INV-1"),
        row("2024-03-01",   500.0, "Invoice", "INV-2", "AUD01"),
        row("2024-04-10",  -200.0, "Payment", "INV-2", "AUD01"),
        row("2024-05-01",  -100.0, "Payment", "INV-2", "AUD01"),
        row("2024-06-01",  2000.0, "INV",     "INV-3"),
        row("2024-02-15",    50.0, "Journal", std::nullopt, "ZZZ"),
    };
}

const CalendarDate TODAY = *parse_date("2024-06-30");

}  // namespace

// ─── Bucket boundaries ────────────────────────────────────────────────────────

TEST(AgingScheme, SixtyDayBoundaries) {
    const auto s = AgingScheme::Sixty;
    EXPECT_EQ(DebtorAnalyzer::bucket_for(-5, s),  AgingBucket::Current);
    EXPECT_EQ(DebtorAnalyzer::bucket_for(0, s),   AgingBucket::Current);
    EXPECT_EQ(DebtorAnalyzer::bucket_for(60, s),  AgingBucket::Current);
    EXPECT_EQ(DebtorAnalyzer::bucket_for(61, s),  AgingBucket::Days61To90);
    EXPECT_EQ(DebtorAnalyzer::bucket_for(90, s),  AgingBucket::Days61To90);
    EXPECT_EQ(DebtorAnalyzer::bucket_for(91, s),  AgingBucket::Days91To120);
    EXPECT_EQ(DebtorAnalyzer::bucket_for(120, s), AgingBucket::Days91To120);
    EXPECT_EQ(DebtorAnalyzer::bucket_for(121, s), AgingBucket::Days120Plus);
}

TEST(AgingScheme, ThirtyDayBoundaries) {
    const auto s = AgingScheme::Thirty;
    EXPECT_EQ(DebtorAnalyzer::bucket_for(30, s),  AgingBucket::Current);
    EXPECT_EQ(DebtorAnalyzer::bucket_for(31, s),  AgingBucket::Days31To60);
    EXPECT_EQ(DebtorAnalyzer::bucket_for(60, s),  AgingBucket::Days31To60);
    EXPECT_EQ(DebtorAnalyzer::bucket_for(61, s),  AgingBucket::Days61To90);
    EXPECT_EQ(DebtorAnalyzer::bucket_for(500, s), AgingBucket::Days120Plus);
}

TEST(AgingScheme, Parse) {
    EXPECT_EQ(parse_aging_scheme("60"), AgingScheme::Sixty);
    EXPECT_EQ(parse_aging_scheme("Thirty"), AgingScheme::Thirty);
    EXPECT_EQ(parse_aging_scheme(" 30 "), AgingScheme::Thirty);
    EXPECT_FALSE(parse_aging_scheme("45").has_value());
}

// ─── Entry types ──────────────────────────────────────────────────────────────

TEST(EntryType, InvoiceAndPaymentTokens) {
    EXPECT_TRUE(DebtorAnalyzer::is_invoice_entry("Invoice"));
    EXPECT_TRUE(DebtorAnalyzer::is_invoice_entry("INV"));
    EXPECT_TRUE(DebtorAnalyzer::is_invoice_entry("Interim invoice"));
    EXPECT_FALSE(DebtorAnalyzer::is_invoice_entry("Receipt"));

    EXPECT_TRUE(DebtorAnalyzer::is_payment_entry("Receipt"));
    EXPECT_TRUE(DebtorAnalyzer::is_payment_entry("CARD PAYMENT"));
    EXPECT_FALSE(DebtorAnalyzer::is_payment_entry("Journal"));
    // An invoice-like entry is never also a payment.
    EXPECT_FALSE(DebtorAnalyzer::is_payment_entry("Invoice payment"));
}

// ─── analyze ──────────────────────────────────────────────────────────────────

TEST(DebtorAnalyzer, BalanceAndAgingSixty) {
    const auto rows = ledger();
    const auto m = DebtorAnalyzer{}.analyze(rows, TODAY);

    EXPECT_DOUBLE_EQ(m.total_balance, 2250.0);
    EXPECT_DOUBLE_EQ(m.aging.current, 1900.0);       // 2000 (29 d) − 100 (60 d)
    EXPECT_DOUBLE_EQ(m.aging.days31_60, 0.0);
    EXPECT_DOUBLE_EQ(m.aging.days61_90, -200.0);     // 81 d
    EXPECT_DOUBLE_EQ(m.aging.days91_120, 0.0);
    EXPECT_DOUBLE_EQ(m.aging.days120_plus, 550.0);   // 1000 − 1000 + 500 + 50
    EXPECT_DOUBLE_EQ(m.aging.total(), m.total_balance);
    EXPECT_EQ(m.transaction_count, 7u);
    EXPECT_EQ(m.invoice_count, 3u);
}

TEST(DebtorAnalyzer, BalanceAndAgingThirty) {
    const auto rows = ledger();
    const DebtorAnalyzer analyzer(DebtorConfig{.scheme = AgingScheme::Thirty});
    const auto m = analyzer.analyze(rows, TODAY);

    EXPECT_DOUBLE_EQ(m.aging.current, 2000.0);
    EXPECT_DOUBLE_EQ(m.aging.days31_60, -100.0);
    EXPECT_DOUBLE_EQ(m.aging.total(), m.total_balance);
}

TEST(DebtorAnalyzer, WeightedPaymentSpeed) {
    const auto rows = ledger();
    const auto m = DebtorAnalyzer{}.analyze(rows, TODAY);

    // INV-1 paid after 30 days (weight 1000), INV-2 first paid after 40 (weight 500).
    ASSERT_TRUE(m.avg_payment_days_paid.has_value());
    EXPECT_NEAR(*m.avg_payment_days_paid, (30.0 * 1000 + 40.0 * 500) / 1500.0, 1e-9);
    // INV-3 open for 29 days.
    EXPECT_NEAR(m.avg_payment_days_outstanding, 29.0, 1e-9);
}

TEST(DebtorAnalyzer, NoPaymentsMeansPaidAverageIsNull) {
    const std::vector<DebtorTransaction> rows{
        row("2024-06-20", 100.0, "Invoice", "A"),
        row("2024-06-10", 300.0, "Invoice", "B"),
    };
    const auto m = DebtorAnalyzer{}.analyze(rows, TODAY);
    EXPECT_FALSE(m.avg_payment_days_paid.has_value());
    EXPECT_NEAR(m.avg_payment_days_outstanding, (10.0 * 100 + 20.0 * 300) / 400.0, 1e-9);
}

TEST(DebtorAnalyzer, NothingOutstandingMeansZero) {
    const std::vector<DebtorTransaction> rows{
        row("2024-06-01",  100.0, "Invoice", "A"),
        row("2024-06-11", -100.0, "Receipt", "A"),
    };
    const auto m = DebtorAnalyzer{}.analyze(rows, TODAY);
    ASSERT_TRUE(m.avg_payment_days_paid.has_value());
    EXPECT_DOUBLE_EQ(*m.avg_payment_days_paid, 10.0);
    EXPECT_DOUBLE_EQ(m.avg_payment_days_outstanding, 0.0);
}

TEST(DebtorAnalyzer, EmptyInput) {
    const auto m = DebtorAnalyzer{}.analyze({}, TODAY);
    EXPECT_DOUBLE_EQ(m.total_balance, 0.0);
    EXPECT_EQ(m.aging, AgingBuckets{});
    EXPECT_FALSE(m.avg_payment_days_paid.has_value());
    EXPECT_DOUBLE_EQ(m.avg_payment_days_outstanding, 0.0);
    EXPECT_EQ(m.transaction_count, 0u);
    EXPECT_EQ(m.invoice_count, 0u);
}

TEST(DebtorAnalyzer, PaymentsWithoutInvoiceRowAreIgnoredForSpeed) {
    const std::vector<DebtorTransaction> rows{
        row("2024-06-01", -50.0, "Receipt", "ORPHAN"),
    };
    const auto m = DebtorAnalyzer{}.analyze(rows, TODAY);
    EXPECT_FALSE(m.avg_payment_days_paid.has_value());
    EXPECT_DOUBLE_EQ(m.total_balance, -50.0);
}

TEST(DebtorAnalyzer, FutureDatedRowsAgeAsCurrent) {
    const std::vector<DebtorTransaction> rows{row("2024-07-15", 75.0, "Invoice", "F")};
    const auto m = DebtorAnalyzer{}.analyze(rows, TODAY);
    EXPECT_DOUBLE_EQ(m.aging.current, 75.0);
}

// ─── analyze_by_service_line ──────────────────────────────────────────────────

TEST(DebtorAnalyzer, ByServiceLine) {
    const auto rows = ledger();
    const std::map<std::string, std::string> mapping{{"TAX01", "TAX"}};

    const auto parts = DebtorAnalyzer{}.analyze_by_service_line(rows, TODAY, mapping);
    ASSERT_EQ(parts.size(), 2u);

    const auto& tax = parts.at("TAX");
    EXPECT_DOUBLE_EQ(tax.total_balance, 2000.0);   // INV-1 settled, INV-3 open
    EXPECT_EQ(tax.invoice_count, 2u);

    const auto& unknown = parts.at("UNKNOWN");   // AUD01 and ZZZ are unmapped
    EXPECT_DOUBLE_EQ(unknown.total_balance, 250.0);
    EXPECT_EQ(unknown.transaction_count, 4u);

    double sum = 0.0;
    for (const auto& [key, m] : parts) sum += m.total_balance;
    EXPECT_DOUBLE_EQ(sum, DebtorAnalyzer{}.analyze(rows, TODAY).total_balance);
}

TEST(DebtorMetrics, ToStringShowsMissingPaidAverage) {
    const DebtorMetrics m{};
    EXPECT_NE(m.to_string().find("DaysPaid=n/a"), std::string::npos);
}
