/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for WIP and debtor ledger extracts.

#include "finagg/data_loader.hpp"

#include "text.hpp"

#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>
#include <string>

namespace finagg::core {

namespace {

/// Empty field → nullopt, anything else → owned copy.
std::optional<std::string> optional_field(const std::vector<std::string>& fields,
                                          std::size_t index) {
    if (index >= fields.size() || fields[index].empty()) {
        return std::nullopt;
    }
    return fields[index];
}

std::string field_or_empty(const std::vector<std::string>& fields, std::size_t index) {
    return index < fields.size() ? fields[index] : std::string{};
}

}  // anonymous namespace

// ─── DataLoader::parse_amount ─────────────────────────────────────────────────

std::optional<double> DataLoader::parse_amount(std::string_view text) noexcept {
    text = detail::trim(text);
    if (text.empty()) {
        return 0.0;
    }
    if (text.front() == '+') {
        text.remove_prefix(1);
    }

    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;  // not a number, or trailing garbage
    }
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

// ─── DataLoader::split_row ────────────────────────────────────────────────────

std::vector<std::string> DataLoader::split_row(std::string_view line) {
    std::vector<std::string> fields;
    std::size_t start = 0;
    while (true) {
        const auto comma = line.find(',', start);
        const auto token = line.substr(start, comma == std::string_view::npos
                                                  ? std::string_view::npos
                                                  : comma - start);
        fields.emplace_back(detail::trim(token));
        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }
    return fields;
}

// ─── Row parsers ──────────────────────────────────────────────────────────────

std::optional<Transaction>
DataLoader::parse_transaction_row(std::string_view line) noexcept {
    const auto fields = split_row(line);
    if (fields.size() < 3) {
        return std::nullopt;
    }

    const auto date   = parse_date(fields[0]);
    const auto amount = parse_amount(fields[1]);
    if (!date || !amount) {
        return std::nullopt;
    }

    return Transaction{
        .date          = *date,
        .amount        = *amount,
        .type_code     = fields[2],
        .sub_type_code = field_or_empty(fields, 3),
        .task_id       = optional_field(fields, 4),
        .client_id     = optional_field(fields, 5),
        .service_line  = field_or_empty(fields, 6),
    };
}

std::optional<DebtorTransaction>
DataLoader::parse_debtor_row(std::string_view line) noexcept {
    const auto fields = split_row(line);
    if (fields.size() < 3) {
        return std::nullopt;
    }

    const auto date   = parse_date(fields[0]);
    const auto amount = parse_amount(fields[1]);
    if (!date || !amount) {
        return std::nullopt;
    }

    return DebtorTransaction{
        .date           = *date,
        .amount         = *amount,
        .entry_type     = fields[2],
        .invoice_number = optional_field(fields, 3),
        .service_line   = field_or_empty(fields, 4),
    };
}

std::optional<ledger::TypeSum>
DataLoader::parse_type_sum_row(std::string_view line) noexcept {
    const auto fields = split_row(line);
    if (fields.size() < 2 || fields[0].empty()) {
        return std::nullopt;
    }

    const auto amount = parse_amount(fields[1]);
    if (!amount) {
        return std::nullopt;
    }

    // An optional third column carries the sub-type.
    return ledger::TypeSum{
        .type_code     = fields[0],
        .sub_type_code = field_or_empty(fields, 2),
        .amount        = *amount,
    };
}

// ─── DataLoader::parse_lines ──────────────────────────────────────────────────

template <typename Row, typename ParseFn>
LoadReport<Row>
DataLoader::parse_lines(std::string_view csv_content, ParseFn parse_row) noexcept {
    LoadReport<Row> report;
    bool header_skipped = false;
    std::size_t line_no = 0;

    std::size_t pos = 0;
    while (pos <= csv_content.size()) {
        const auto eol = csv_content.find('\n', pos);
        std::string_view line = csv_content.substr(
            pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
        pos = (eol == std::string_view::npos) ? csv_content.size() + 1 : eol + 1;
        ++line_no;

        line = detail::trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        // First non-empty, non-comment line is the header.
        if (!header_skipped) {
            header_skipped = true;
            continue;
        }

        if (auto row = parse_row(line)) {
            report.rows.push_back(std::move(*row));
        } else {
            report.skipped_lines.push_back(line_no);
        }
    }

    return report;
}

// ─── Public parsers ───────────────────────────────────────────────────────────

LoadReport<Transaction>
DataLoader::parse_transactions(std::string_view csv_content) noexcept {
    return parse_lines<Transaction>(csv_content, &DataLoader::parse_transaction_row);
}

LoadReport<DebtorTransaction>
DataLoader::parse_debtor_transactions(std::string_view csv_content) noexcept {
    return parse_lines<DebtorTransaction>(csv_content, &DataLoader::parse_debtor_row);
}

LoadReport<ledger::TypeSum>
DataLoader::parse_type_sums(std::string_view csv_content) noexcept {
    return parse_lines<ledger::TypeSum>(csv_content, &DataLoader::parse_type_sum_row);
}

ServiceLineMap
DataLoader::parse_service_lines(std::string_view csv_content) noexcept {
    struct Entry {
        std::string service_line;
        std::string master;
    };

    const auto report = parse_lines<Entry>(
        csv_content, [](std::string_view line) -> std::optional<Entry> {
            const auto fields = split_row(line);
            if (fields.size() < 2 || fields[0].empty() || fields[1].empty()) {
                return std::nullopt;
            }
            return Entry{fields[0], fields[1]};
        });

    ServiceLineMap map;
    for (const auto& entry : report.rows) {
        map.set(entry.service_line, entry.master);
    }
    return map;
}

// ─── File loaders ─────────────────────────────────────────────────────────────

std::optional<std::string> DataLoader::read_file(const std::string& filepath) noexcept {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

std::optional<LoadReport<Transaction>>
DataLoader::load_transactions(const std::string& filepath) noexcept {
    const auto contents = read_file(filepath);
    if (!contents) {
        return std::nullopt;
    }
    return parse_transactions(*contents);
}

std::optional<LoadReport<DebtorTransaction>>
DataLoader::load_debtor_transactions(const std::string& filepath) noexcept {
    const auto contents = read_file(filepath);
    if (!contents) {
        return std::nullopt;
    }
    return parse_debtor_transactions(*contents);
}

std::optional<LoadReport<ledger::TypeSum>>
DataLoader::load_type_sums(const std::string& filepath) noexcept {
    const auto contents = read_file(filepath);
    if (!contents) {
        return std::nullopt;
    }
    return parse_type_sums(*contents);
}

std::optional<ServiceLineMap>
DataLoader::load_service_lines(const std::string& filepath) noexcept {
    const auto contents = read_file(filepath);
    if (!contents) {
        return std::nullopt;
    }
    return parse_service_lines(*contents);
}

}  // namespace finagg::core
