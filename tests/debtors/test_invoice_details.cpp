/// @file tests/debtors/test_invoice_details.cpp
/// @brief Unit tests for InvoiceDetailBuilder.

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

const CalendarDate TODAY = *parse_date("2024-06-30");

}  // namespace

TEST(InvoiceDetailBuilder, SettledInvoicesAreExcluded) {
    const std::vector<DebtorTransaction> rows{
        row("2024-01-01",  1000.0, "Invoice", "INV-1"),
        row("2024-01-31", -1000.0, "Receipt", "INV-1"),
    };
    const auto buckets = InvoiceDetailBuilder{}.build(rows, TODAY);
    EXPECT_TRUE(buckets.empty());
    EXPECT_EQ(InvoiceDetailBuilder::count(buckets), 0u);
}

TEST(InvoiceDetailBuilder, PartialPaymentsReduceNetBalance) {
    const std::vector<DebtorTransaction> rows{
        row("2024-03-01",  500.0, "Invoice", "INV-2"),
        row("2024-04-10", -200.0, "Payment", "INV-2"),
        row("2024-05-01", -100.0, "Receipt", "INV-2"),
    };

    const auto buckets = InvoiceDetailBuilder{}.build(rows, TODAY);
    ASSERT_EQ(InvoiceDetailBuilder::count(buckets), 1u);
    ASSERT_EQ(buckets.count(AgingBucket::Days120Plus), 1u);   // 121 days

    const auto& inv = buckets.at(AgingBucket::Days120Plus).front();
    EXPECT_EQ(inv.invoice_number, "INV-2");
    EXPECT_EQ(format_date(inv.invoice_date), "2024-03-01");
    EXPECT_DOUBLE_EQ(inv.original_amount, 500.0);
    EXPECT_DOUBLE_EQ(inv.payments_received, -300.0);
    EXPECT_DOUBLE_EQ(inv.net_balance, 200.0);
    EXPECT_EQ(inv.days_outstanding, 121);
    ASSERT_EQ(inv.payment_history.size(), 2u);
    EXPECT_DOUBLE_EQ(inv.payment_history[0].amount, -200.0);
    EXPECT_EQ(format_date(inv.payment_history[1].date), "2024-05-01");
}

TEST(InvoiceDetailBuilder, CreditNotesCountTowardsNetOnly) {
    const std::vector<DebtorTransaction> rows{
        row("2024-06-01", 400.0, "Invoice",     "INV-4"),
        row("2024-06-05", -50.0, "Credit note", "INV-4"),
    };
    const auto buckets = InvoiceDetailBuilder{}.build(rows, TODAY);
    const auto& inv = buckets.at(AgingBucket::Current).front();
    EXPECT_DOUBLE_EQ(inv.payments_received, 0.0);
    EXPECT_DOUBLE_EQ(inv.net_balance, 350.0);
    EXPECT_TRUE(inv.payment_history.empty());
}

TEST(InvoiceDetailBuilder, OldestFirstWithinBucket) {
    const std::vector<DebtorTransaction> rows{
        row("2024-06-20", 10.0, "Invoice", "B"),
        row("2024-05-15", 20.0, "Invoice", "A"),
        row("2024-06-01", 30.0, "Invoice", "C"),
    };
    const auto buckets = InvoiceDetailBuilder{}.build(rows, TODAY);
    const auto& current = buckets.at(AgingBucket::Current);
    ASSERT_EQ(current.size(), 3u);
    EXPECT_EQ(current[0].invoice_number, "A");
    EXPECT_EQ(current[1].invoice_number, "C");
    EXPECT_EQ(current[2].invoice_number, "B");
}

TEST(InvoiceDetailBuilder, SchemeAndServiceLineNames) {
    const std::vector<DebtorTransaction> rows{
        row("2024-05-20", 100.0, "Invoice", "X", "TAX01"),
        row("2024-05-20", 100.0, "Invoice", "Y", "AUD01"),
    };
    const std::map<std::string, std::string> names{{"TAX01", "Tax"}};

    const InvoiceDetailBuilder builder(DebtorConfig{.scheme = AgingScheme::Thirty});
    const auto buckets = builder.build(rows, TODAY, names);   // 41 days old

    const auto& mid = buckets.at(AgingBucket::Days31To60);
    ASSERT_EQ(mid.size(), 2u);
    EXPECT_EQ(mid[0].service_line, "Tax");
    EXPECT_EQ(mid[1].service_line, "AUD01");
}

TEST(InvoiceDetailBuilder, RowsWithoutInvoiceRowOrNumberAreSkipped) {
    const std::vector<DebtorTransaction> rows{
        row("2024-06-01", -80.0, "Receipt", "ORPHAN"),
        row("2024-06-01", 120.0, "Invoice", std::nullopt),
    };
    EXPECT_TRUE(InvoiceDetailBuilder{}.build(rows, TODAY).empty());
}
