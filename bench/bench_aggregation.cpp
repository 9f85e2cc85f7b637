/**
 * @file  bench/bench_aggregation.cpp
 * @brief Google Benchmark suite for the WIP and debtor pipelines.
 *
 * Benchmarks
 * ----------
 *   BM_Categorize                — code-table lookup incl. fee sub-type scan
 *   BM_Aggregate                 — daily grouping + running balance
 *   BM_OpeningBalance            — one-pass category totals
 *   BM_Downsample_EvenFill / Stride
 *   BM_DebtorAnalyze             — aging + payment speed
 *   BM_GraphReport               — full engine path with service-line split
 *
 * Build (CMake):
 *   cmake -DFINAGG_BENCH=ON ..
 *   cmake --build build --target bench_aggregation
 *   ./build/bench_aggregation --benchmark_format=json
 *
 * Throughput units: items/second (ledger rows or daily points processed).
 */

#include "benchmark/benchmark.h"

#include "finagg/balance.hpp"
#include "finagg/categorizer.hpp"
#include "finagg/debtors.hpp"
#include "finagg/downsample.hpp"
#include "finagg/engine.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

static const finagg::CalendarDate BENCH_START = *finagg::parse_date("2020-01-01");

/// N synthetic WIP rows spread over `days` calendar days.
static std::vector<finagg::Transaction> make_rows(std::size_t n, int days = 1460) {
    static constexpr std::array<const char*, 6> CODES{"T", "D", "ADJ", "F", "P", "X"};
    static constexpr std::array<const char*, 3> LINES{"TAX01", "AUD01", "ADV01"};
    std::vector<finagg::Transaction> rows;
    rows.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        rows.push_back(finagg::Transaction{
            .date         = BENCH_START + std::chrono::days{static_cast<int>((i * 7919) % days)},
            .amount       = 10.0 + static_cast<double>(i % 97),
            .type_code    = CODES[i % CODES.size()],
            .task_id      = "TSK-" + std::to_string(i % 50),
            .service_line = LINES[i % LINES.size()],
        });
    }
    return rows;
}

/// N daily points, one in `active_every` with activity.
static std::vector<finagg::ledger::DailyMetric> make_series(std::size_t n, std::size_t active_every) {
    std::vector<finagg::ledger::DailyMetric> out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i].date = finagg::format_date(BENCH_START + std::chrono::days{static_cast<int>(i)});
        if (i % active_every == 0) out[i].production = 1.0;
    }
    return out;
}

static std::vector<finagg::DebtorTransaction> make_debtor_rows(std::size_t n) {
    std::vector<finagg::DebtorTransaction> rows;
    rows.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const bool invoice = (i % 3 != 2);
        rows.push_back(finagg::DebtorTransaction{
            .date           = BENCH_START + std::chrono::days{static_cast<int>(i % 700)},
            .amount         = invoice ? 500.0 : -250.0,
            .entry_type     = invoice ? "Invoice" : "Receipt",
            .invoice_number = "INV-" + std::to_string(i / 3),
            .service_line   = (i % 2) ? "TAX01" : "AUD01",
        });
    }
    return rows;
}

// ── Categoriser ────────────────────────────────────────────────────────────────

static void BM_Categorize(benchmark::State& state) {
    static constexpr std::array<const char*, 8> CODES{"T", "tim", "DIS", "adj", "FEE", "P", "GEN", "WO"};
    static constexpr std::array<const char*, 4> SUBS{"", "Interim fee", "Time", "misc"};
    std::size_t i = 0;
    for (auto _ : state) {
        const auto c = finagg::ledger::TransactionCategorizer::category(
            CODES[i % CODES.size()], SUBS[i % SUBS.size()]);
        benchmark::DoNotOptimize(c);
        ++i;
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Categorize);

// ── Aggregation ────────────────────────────────────────────────────────────────

static void BM_Aggregate(benchmark::State& state) {
    const auto rows = make_rows(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto out = finagg::ledger::BalanceAggregator::aggregate(rows, 0.0);
        benchmark::DoNotOptimize(out.summary.current_wip_balance);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Aggregate)->RangeMultiplier(8)->Range(512, 262144)->Unit(benchmark::kMicrosecond);

static void BM_OpeningBalance(benchmark::State& state) {
    const auto rows = make_rows(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        const double b = finagg::ledger::OpeningBalanceCalculator::from_transactions(rows);
        benchmark::DoNotOptimize(b);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_OpeningBalance)->RangeMultiplier(8)->Range(512, 262144)->Unit(benchmark::kMicrosecond);

// ── Downsampling ───────────────────────────────────────────────────────────────

static void BM_Downsample_EvenFill(benchmark::State& state) {
    const auto series = make_series(static_cast<std::size_t>(state.range(0)), 17);
    for (auto _ : state) {
        auto out = finagg::series::Downsampler::downsample(
            series, 120, finagg::series::SamplingMode::EvenFill);
        benchmark::DoNotOptimize(out->data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Downsample_EvenFill)->RangeMultiplier(4)->Range(365, 23360)->Unit(benchmark::kMicrosecond);

static void BM_Downsample_Stride(benchmark::State& state) {
    const auto series = make_series(static_cast<std::size_t>(state.range(0)), 17);
    for (auto _ : state) {
        auto out = finagg::series::Downsampler::downsample(
            series, 120, finagg::series::SamplingMode::Stride);
        benchmark::DoNotOptimize(out->data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Downsample_Stride)->RangeMultiplier(4)->Range(365, 23360)->Unit(benchmark::kMicrosecond);

// ── Debtors ────────────────────────────────────────────────────────────────────

static void BM_DebtorAnalyze(benchmark::State& state) {
    const auto rows  = make_debtor_rows(static_cast<std::size_t>(state.range(0)));
    const auto today = BENCH_START + std::chrono::days{730};
    const finagg::debtors::DebtorAnalyzer analyzer;
    for (auto _ : state) {
        auto m = analyzer.analyze(rows, today);
        benchmark::DoNotOptimize(m.total_balance);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_DebtorAnalyze)->RangeMultiplier(8)->Range(512, 65536)->Unit(benchmark::kMicrosecond);

// ── Engine ─────────────────────────────────────────────────────────────────────

static void BM_GraphReport(benchmark::State& state) {
    const auto rows = make_rows(static_cast<std::size_t>(state.range(0)));
    finagg::core::ServiceLineMap map;
    map.set("TAX01", "TAX");
    map.set("AUD01", "AUDIT");
    const finagg::core::Engine engine;
    const auto from = BENCH_START + std::chrono::days{365};
    const auto to   = BENCH_START + std::chrono::days{1459};
    for (auto _ : state) {
        auto report = engine.build_graph_report(rows, from, to, map);
        benchmark::DoNotOptimize(report->opening_balance);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_GraphReport)->RangeMultiplier(8)->Range(512, 65536)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
