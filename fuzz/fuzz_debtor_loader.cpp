/**
 * @file  fuzz_debtor_loader.cpp
 * @brief libFuzzer target for the debtor CSV loader and analyzer
 *
 * Build:
 *   cmake -DFINAGG_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_debtor_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_debtor_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Aging buckets sum to the total balance (both schemes).
 *   3. The paid average, when present, is finite.
 *   4. The invoice detail count never exceeds the invoice-like row count.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "finagg/data_loader.hpp"
#include "finagg/debtors.hpp"

using namespace finagg;
using namespace finagg::debtors;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    const auto report = core::DataLoader::parse_debtor_transactions(input);
    const auto today  = *parse_date("2024-06-30");

    double magnitude = 0.0;
    for (const auto& row : report.rows) magnitude += std::abs(row.amount);
    if (!(magnitude < 1e250)) {
        return 0;  // day-weighted sums would overflow
    }

    for (const auto scheme : {AgingScheme::Sixty, AgingScheme::Thirty}) {
        const DebtorConfig cfg{.scheme = scheme};
        const auto m = DebtorAnalyzer(cfg).analyze(report.rows, today);

        // Invariant 2: exhaustive buckets
        const double tolerance = 1e-12 * (1.0 + magnitude) * (1.0 + m.transaction_count);
        assert(std::abs(m.aging.total() - m.total_balance) <= tolerance);

        // Invariant 3: finite averages
        if (m.avg_payment_days_paid) {
            assert(std::isfinite(*m.avg_payment_days_paid));
        }

        // Invariant 4: at most one detail per invoice-like row
        const auto buckets = InvoiceDetailBuilder(cfg).build(report.rows, today);
        assert(InvoiceDetailBuilder::count(buckets) <= m.invoice_count);
        (void)tolerance;
    }

    return 0;
}
