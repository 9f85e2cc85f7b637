/// @file src/main.cpp
/// @brief finagg CLI entry point.
///
/// Usage:
///   finagg --wip <csv> [--from DATE] [--to DATE] [--resolution low|standard|high]
///                      [--service-lines <csv>]
///   finagg --balances <csv>
///   finagg --debtors <csv> --today DATE [--scheme 60|30] [--service-lines <csv>]
///   finagg --help

#include "finagg/data_loader.hpp"
#include "finagg/engine.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace {

using namespace finagg;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  finagg --wip <csv> [--from DATE] [--to DATE]\n"
        "         [--resolution low|standard|high] [--service-lines <csv>]\n"
        "                                WIP graph report\n"
        "  finagg --balances <csv>       WIP breakdown per task\n"
        "  finagg --debtors <csv> --today DATE [--scheme 60|30]\n"
        "         [--service-lines <csv>]\n"
        "                                Debtor aging and payment speed\n"
        "  finagg --help                 Show this help\n"
        "\n"
        "CSV formats (header required):\n"
        "  WIP:           date,amount,type,subtype,task,client,service_line\n"
        "  Debtors:       date,amount,entry_type,invoice,service_line\n"
        "  Service lines: service_line,master\n"
        "Dates are YYYY-MM-DD.\n"
    );
}

/// `--flag value` pairs after the mode argument.
using Options = std::map<std::string, std::string>;

std::optional<Options> parse_options(int argc, char* argv[], int first) {
    Options opts;
    for (int i = first; i < argc; i += 2) {
        const std::string key(argv[i]);
        if (key.rfind("--", 0) != 0 || i + 1 >= argc) {
            fmt::print(stderr, "[finagg] error: expected '--flag value', got '{}'\n", key);
            return std::nullopt;
        }
        opts[key] = argv[i + 1];
    }
    return opts;
}

std::optional<CalendarDate> date_option(const Options& opts, const std::string& key) {
    const auto it = opts.find(key);
    if (it == opts.end()) return std::nullopt;
    return parse_date(it->second);
}

template <typename Row>
void report_skipped(const core::LoadReport<Row>& report, const std::string& path) {
    if (report.skipped() == 0) return;
    fmt::print(stderr, "[finagg] warning: skipped {} malformed row(s) in '{}'\n",
               report.skipped(), path);
}

/// Service-line mapping from `--service-lines`, or an empty map.
std::optional<core::ServiceLineMap> load_mapping(const Options& opts) {
    const auto it = opts.find("--service-lines");
    if (it == opts.end()) {
        return core::ServiceLineMap{};
    }
    auto map = core::DataLoader::load_service_lines(it->second);
    if (!map) {
        fmt::print(stderr, "[finagg] error: cannot open file '{}'\n", it->second);
    }
    return map;
}

void print_series(const ledger::WipSeries& series) {
    for (const auto& m : series.daily_metrics) {
        fmt::print("    {}  prod={:>12.2f}  adj={:>10.2f}  disb={:>10.2f}  "
                   "bill={:>12.2f}  prov={:>10.2f}  wip={:>12.2f}\n",
                   m.date, m.production, m.adjustments, m.disbursements,
                   m.billing, m.provisions, m.wip_balance);
    }
}

/// Returns 0 on success, 1 on error.
int run_wip(const std::string& filepath, const Options& opts) {
    auto loaded = core::DataLoader::load_transactions(filepath);
    if (!loaded) {
        fmt::print(stderr, "[finagg] error: cannot open file '{}'\n", filepath);
        return 1;
    }
    report_skipped(*loaded, filepath);
    if (loaded->rows.empty()) {
        fmt::print(stderr, "[finagg] error: no valid rows loaded from '{}'\n", filepath);
        return 1;
    }

    core::EngineConfig cfg;
    if (const auto it = opts.find("--resolution"); it != opts.end()) {
        const auto res = series::parse_resolution(it->second);
        if (!res) {
            fmt::print(stderr, "[finagg] error: unknown resolution '{}'\n", it->second);
            return 1;
        }
        cfg.resolution = *res;
    }

    const auto mapping = load_mapping(opts);
    if (!mapping) return 1;

    // Window defaults to the span of the data.
    const auto& rows = loaded->rows;
    const auto [lo, hi] = std::minmax_element(
        rows.begin(), rows.end(),
        [](const Transaction& a, const Transaction& b) { return a.date < b.date; });

    auto from = lo->date;
    auto to   = hi->date;
    for (const auto* key : {"--from", "--to"}) {
        if (!opts.count(key)) continue;
        const auto date = date_option(opts, key);
        if (!date) {
            fmt::print(stderr, "[finagg] error: invalid date for {} '{}'\n", key, opts.at(key));
            return 1;
        }
        (std::string(key) == "--from" ? from : to) = *date;
    }

    const core::Engine engine(cfg);
    const auto report = engine.build_graph_report(rows, from, to, *mapping);
    if (!report) {
        fmt::print(stderr, "[finagg] error: empty reporting window {} .. {}\n",
                   format_date(from), format_date(to));
        return 1;
    }

    fmt::print("Loaded {} rows from '{}'  window {} .. {}  resolution={}\n",
               rows.size(), filepath, format_date(from), format_date(to),
               series::to_string(cfg.resolution));
    fmt::print("{}", report->to_string());
    fmt::print("  overall series:\n");
    print_series(report->overall);
    return 0;
}

/// Returns 0 on success, 1 on error.
int run_balances(const std::string& filepath) {
    auto loaded = core::DataLoader::load_transactions(filepath);
    if (!loaded) {
        fmt::print(stderr, "[finagg] error: cannot open file '{}'\n", filepath);
        return 1;
    }
    report_skipped(*loaded, filepath);

    const core::Engine engine;
    const auto balances = engine.task_balances(loaded->rows);
    if (balances.empty()) {
        fmt::print(stderr, "[finagg] error: no task rows in '{}'\n", filepath);
        return 1;
    }

    for (const auto& [task, breakdown] : balances) {
        fmt::print("{:<16} {}\n", task, breakdown.to_string());
    }
    return 0;
}

/// Returns 0 on success, 1 on error.
int run_debtors(const std::string& filepath, const Options& opts) {
    if (!opts.count("--today")) {
        fmt::print(stderr, "[finagg] error: --debtors requires --today DATE\n");
        return 1;
    }
    const auto today = date_option(opts, "--today");
    if (!today) {
        fmt::print(stderr, "[finagg] error: invalid date for --today '{}'\n", opts.at("--today"));
        return 1;
    }

    core::EngineConfig cfg;
    if (const auto it = opts.find("--scheme"); it != opts.end()) {
        const auto scheme = debtors::parse_aging_scheme(it->second);
        if (!scheme) {
            fmt::print(stderr, "[finagg] error: unknown aging scheme '{}'\n", it->second);
            return 1;
        }
        cfg.aging_scheme = *scheme;
    }

    auto loaded = core::DataLoader::load_debtor_transactions(filepath);
    if (!loaded) {
        fmt::print(stderr, "[finagg] error: cannot open file '{}'\n", filepath);
        return 1;
    }
    report_skipped(*loaded, filepath);

    const auto mapping = load_mapping(opts);
    if (!mapping) return 1;

    const core::Engine engine(cfg);
    const auto report = engine.build_debtor_report(loaded->rows, *today, *mapping);

    fmt::print("Loaded {} rows from '{}'  today={}\n",
               loaded->rows.size(), filepath, format_date(*today));
    fmt::print("{}", report.to_string());
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode != "--wip" && mode != "--balances" && mode != "--debtors") {
        fmt::print(stderr, "[finagg] error: unknown option: {}\n", mode);
        print_usage();
        return 1;
    }

    if (argc < 3) {
        fmt::print(stderr, "[finagg] error: {} requires a CSV file path\n", mode);
        print_usage();
        return 1;
    }

    const std::string filepath(argv[2]);
    const auto opts = parse_options(argc, argv, 3);
    if (!opts) {
        print_usage();
        return 1;
    }

    if (mode == "--wip")      return run_wip(filepath, *opts);
    if (mode == "--balances") return run_balances(filepath);
    return run_debtors(filepath, *opts);
}
