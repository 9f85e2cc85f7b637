#pragma once

/// @file include/finagg/data_loader.hpp
/// @brief CSV loaders for ledger extracts.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV extracts of the WIP and debtor ledgers (and their helper
/// tables) into engine input records. Malformed rows are skipped and
/// reported back to the caller; the loader never fails a whole file for a
/// bad row.
///
/// ## Expected CSV Formats (header row required)
/// ```
/// date,amount,type,subtype,task,client,service_line
/// 2024-01-01,1000,T,Time,TSK-1,CLI-1,TAX
///
/// date,amount,entry_type,invoice,service_line
/// 2024-01-01,500,Invoice,INV-1,TAX
///
/// type,amount                 (pre-aggregated per-type sums)
/// T,15000
///
/// service_line,master         (service-line mapping)
/// TAX01,TAX
/// ```
/// Blank lines and lines starting with `#` are ignored. Empty optional
/// fields (subtype, task, client, invoice, service_line) are allowed; an
/// empty amount reads as 0.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` only when a file cannot be opened
/// - Does not print; skipped rows are listed in the LoadReport

#include "finagg/balance.hpp"
#include "finagg/service_line.hpp"
#include "finagg/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace finagg::core {

/// Parsed rows plus the 1-based line numbers of rows that were skipped.
template <typename Row>
struct LoadReport {
    std::vector<Row>         rows;
    std::vector<std::size_t> skipped_lines;

    [[nodiscard]] std::size_t skipped() const noexcept { return skipped_lines.size(); }
};

/// Loads ledger extracts from CSV files and strings.
class DataLoader {
public:
    /// Load WIP transactions from a CSV file.
    [[nodiscard]] static std::optional<LoadReport<Transaction>>
    load_transactions(const std::string& filepath) noexcept;

    /// Load debtor transactions from a CSV file.
    [[nodiscard]] static std::optional<LoadReport<DebtorTransaction>>
    load_debtor_transactions(const std::string& filepath) noexcept;

    /// Load per-type sums from a CSV file.
    [[nodiscard]] static std::optional<LoadReport<ledger::TypeSum>>
    load_type_sums(const std::string& filepath) noexcept;

    /// Load a service-line mapping from a CSV file.
    ///
    /// # Returns
    /// `nullopt` if the file cannot be opened; otherwise the mapping built
    /// from every valid row (later rows replace earlier ones).
    [[nodiscard]] static std::optional<ServiceLineMap>
    load_service_lines(const std::string& filepath) noexcept;

    /// Parse WIP transactions from CSV text (first data line is the header).
    [[nodiscard]] static LoadReport<Transaction>
    parse_transactions(std::string_view csv_content) noexcept;

    /// Parse debtor transactions from CSV text.
    [[nodiscard]] static LoadReport<DebtorTransaction>
    parse_debtor_transactions(std::string_view csv_content) noexcept;

    /// Parse per-type sums from CSV text.
    [[nodiscard]] static LoadReport<ledger::TypeSum>
    parse_type_sums(std::string_view csv_content) noexcept;

    /// Parse a service-line mapping from CSV text.
    [[nodiscard]] static ServiceLineMap
    parse_service_lines(std::string_view csv_content) noexcept;

    /// Parse an amount field. Empty reads as 0.
    ///
    /// # Returns
    /// `nullopt` if the text is not a finite number.
    [[nodiscard]] static std::optional<double>
    parse_amount(std::string_view text) noexcept;

private:
    /// Split one CSV line on commas, trimming whitespace around each field.
    [[nodiscard]] static std::vector<std::string>
    split_row(std::string_view line);

    [[nodiscard]] static std::optional<Transaction>
    parse_transaction_row(std::string_view line) noexcept;

    [[nodiscard]] static std::optional<DebtorTransaction>
    parse_debtor_row(std::string_view line) noexcept;

    [[nodiscard]] static std::optional<ledger::TypeSum>
    parse_type_sum_row(std::string_view line) noexcept;

    /// Apply `parse_row` to every data line of `csv_content`.
    template <typename Row, typename ParseFn>
    [[nodiscard]] static LoadReport<Row>
    parse_lines(std::string_view csv_content, ParseFn parse_row) noexcept;

    /// Read a whole file into a string.
    [[nodiscard]] static std::optional<std::string>
    read_file(const std::string& filepath) noexcept;
};

}  // namespace finagg::core
