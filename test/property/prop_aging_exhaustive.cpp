/**
 * @file  prop_aging_exhaustive.cpp
 * @brief Property: ∀ debtor rows, today: aging buckets partition the balance
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_aging_exhaustive
 *
 * For both aging schemes:
 *   • Σ buckets == total balance
 *   • the 31–60 bucket is empty under the 60-day scheme
 *   • bucket_for is monotone in the age (older never maps to a younger bucket)
 *   • the paid average, when present, is finite
 */

#include <rapidcheck.h>

#include "finagg/debtors.hpp"

#include <array>
#include <chrono>
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

using namespace finagg;
using namespace finagg::debtors;

namespace {

constexpr std::array<const char*, 5> ENTRY_TYPES{"Invoice", "Receipt", "Payment", "Journal", "Credit"};

rc::Gen<DebtorTransaction> gen_row() {
    return rc::gen::apply(
        [](int day, int cents, std::size_t entry, int invoice) {
            DebtorTransaction row{
                .date       = *parse_date("2023-01-01") + std::chrono::days{day},
                .amount     = static_cast<double>(cents) / 100.0,
                .entry_type = ENTRY_TYPES[entry],
            };
            if (invoice > 0) row.invoice_number = "INV-" + std::to_string(invoice);
            return row;
        },
        rc::gen::inRange(0, 500),
        rc::gen::inRange(-200000, 200000),
        rc::gen::inRange<std::size_t>(0, ENTRY_TYPES.size()),
        rc::gen::inRange(0, 20));
}

}  // namespace

int main() {
    rc::check(
        "aging_exhaustive: buckets sum to the total balance",
        []() {
            const auto rows   = *rc::gen::container<std::vector<DebtorTransaction>>(gen_row());
            const auto offset = *rc::gen::inRange(0, 700);
            const auto today  = *parse_date("2023-01-01") + std::chrono::days{offset};
            const auto scheme = *rc::gen::element(AgingScheme::Sixty, AgingScheme::Thirty);

            const auto m = DebtorAnalyzer(DebtorConfig{.scheme = scheme}).analyze(rows, today);

            RC_ASSERT(std::abs(m.aging.total() - m.total_balance) < 1e-6);
            RC_ASSERT(m.transaction_count == rows.size());
            if (scheme == AgingScheme::Sixty) RC_ASSERT(m.aging.days31_60 == 0.0);
            if (m.avg_payment_days_paid) RC_ASSERT(std::isfinite(*m.avg_payment_days_paid));
        }
    );

    rc::check(
        "aging_exhaustive: older ages never land in younger buckets",
        [](int a, int b) {
            const long lo = std::min(a, b) % 1000;
            const long hi = lo + std::abs(static_cast<long>(b) - a) % 1000;
            for (const auto scheme : {AgingScheme::Sixty, AgingScheme::Thirty}) {
                RC_ASSERT(static_cast<int>(DebtorAnalyzer::bucket_for(lo, scheme)) <=
                          static_cast<int>(DebtorAnalyzer::bucket_for(hi, scheme)));
            }
        }
    );

    return 0;
}
