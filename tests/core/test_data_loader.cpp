/// @file tests/core/test_data_loader.cpp
/// @brief Unit tests for the CSV DataLoader.
///
/// Test categories:
///   - Well-formed WIP, debtor, type-sum and service-line extracts
///   - Header, blank-line and comment handling
///   - Malformed rows are skipped and their line numbers reported
///   - Empty optional fields and empty amounts
///   - File loading (missing file → nullopt)

#include <gtest/gtest.h>
#include "finagg/data_loader.hpp"

#include <cstdio>
#include <fstream>
#include <string>

using namespace finagg;
using namespace finagg::core;

// ─── parse_amount ─────────────────────────────────────────────────────────────

TEST(ParseAmount, AcceptsSignedDecimals) {
    EXPECT_DOUBLE_EQ(*DataLoader::parse_amount("1000"), 1000.0);
    EXPECT_DOUBLE_EQ(*DataLoader::parse_amount("-50.25"), -50.25);
    EXPECT_DOUBLE_EQ(*DataLoader::parse_amount("+12.5"), 12.5);
    EXPECT_DOUBLE_EQ(*DataLoader::parse_amount("  7 "), 7.0);
}

TEST(ParseAmount, EmptyReadsAsZero) {
    const auto v = DataLoader::parse_amount("");
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 0.0);
}

TEST(ParseAmount, RejectsGarbageAndNonFinite) {
    EXPECT_FALSE(DataLoader::parse_amount("abc").has_value());
    EXPECT_FALSE(DataLoader::parse_amount("12x").has_value());
    EXPECT_FALSE(DataLoader::parse_amount("nan").has_value());
    EXPECT_FALSE(DataLoader::parse_amount("inf").has_value());
}

// ─── parse_transactions ───────────────────────────────────────────────────────

TEST(ParseTransactions, WellFormedRows) {
    const std::string csv =
        "date,amount,type,subtype,task,client,service_line\n"
        "2024-01-01,1000,T,Time,TSK-1,CLI-1,TAX\n"
        "2024-01-02,-50,ADJ,Time write-down,TSK-1,,TAX\n";

    const auto report = DataLoader::parse_transactions(csv);
    ASSERT_EQ(report.rows.size(), 2u);
    EXPECT_EQ(report.skipped(), 0u);

    const auto& first = report.rows[0];
    EXPECT_EQ(format_date(first.date), "2024-01-01");
    EXPECT_DOUBLE_EQ(first.amount, 1000.0);
    EXPECT_EQ(first.type_code, "T");
    EXPECT_EQ(first.sub_type_code, "Time");
    ASSERT_TRUE(first.task_id.has_value());
    EXPECT_EQ(*first.task_id, "TSK-1");
    ASSERT_TRUE(first.client_id.has_value());
    EXPECT_EQ(*first.client_id, "CLI-1");
    EXPECT_EQ(first.service_line, "TAX");

    EXPECT_FALSE(report.rows[1].client_id.has_value());
}

TEST(ParseTransactions, TrailingColumnsAreOptional) {
    const auto report = DataLoader::parse_transactions(
        "date,amount,type\n"
        "2024-01-01,10,D\n");
    ASSERT_EQ(report.rows.size(), 1u);
    EXPECT_TRUE(report.rows[0].sub_type_code.empty());
    EXPECT_FALSE(report.rows[0].task_id.has_value());
    EXPECT_TRUE(report.rows[0].service_line.empty());
}

TEST(ParseTransactions, MalformedRowsAreSkippedWithLineNumbers) {
    const std::string csv =
        "# exported 2024-02-01\n"          // line 1
        "date,amount,type\n"               // line 2 (header)
        "2024-01-01,100,T\n"               // line 3
        "not-a-date,100,T\n"               // line 4
        "\n"                               // line 5
        "2024-01-02,abc,T\n"               // line 6
        "2024-01-03\n"                     // line 7
        "2024-01-04,,F\r\n";               // line 8, empty amount → 0

    const auto report = DataLoader::parse_transactions(csv);
    ASSERT_EQ(report.rows.size(), 2u);
    EXPECT_DOUBLE_EQ(report.rows[1].amount, 0.0);
    ASSERT_EQ(report.skipped_lines.size(), 3u);
    EXPECT_EQ(report.skipped_lines[0], 4u);
    EXPECT_EQ(report.skipped_lines[1], 6u);
    EXPECT_EQ(report.skipped_lines[2], 7u);
}

TEST(ParseTransactions, HeaderOnlyOrEmpty) {
    EXPECT_TRUE(DataLoader::parse_transactions("").rows.empty());
    EXPECT_TRUE(DataLoader::parse_transactions("date,amount,type\n").rows.empty());
}

// ─── parse_debtor_transactions ────────────────────────────────────────────────

TEST(ParseDebtorTransactions, WellFormedRows) {
    const auto report = DataLoader::parse_debtor_transactions(
        "date,amount,entry_type,invoice,service_line\n"
        "2024-01-01,500,Invoice,INV-1,TAX\n"
        "2024-01-20,-500,Receipt,INV-1,TAX\n"
        "2024-01-25,-20,Journal,,AUD\n");

    ASSERT_EQ(report.rows.size(), 3u);
    EXPECT_EQ(report.rows[0].entry_type, "Invoice");
    ASSERT_TRUE(report.rows[0].invoice_number.has_value());
    EXPECT_EQ(*report.rows[0].invoice_number, "INV-1");
    EXPECT_FALSE(report.rows[2].invoice_number.has_value());
    EXPECT_EQ(report.rows[2].service_line, "AUD");
}

// ─── parse_type_sums ──────────────────────────────────────────────────────────

TEST(ParseTypeSums, TypeAndAmount) {
    const auto report = DataLoader::parse_type_sums(
        "type,amount\n"
        "T,15000\n"
        "F,4000\n"
        ",10\n");
    ASSERT_EQ(report.rows.size(), 2u);
    EXPECT_EQ(report.rows[0].type_code, "T");
    EXPECT_DOUBLE_EQ(report.rows[1].amount, 4000.0);
    EXPECT_EQ(report.skipped(), 1u);
}

// ─── parse_service_lines ──────────────────────────────────────────────────────

TEST(ParseServiceLines, LaterRowsReplaceEarlier) {
    const auto map = DataLoader::parse_service_lines(
        "service_line,master\n"
        "TAX01,TAX\n"
        "AUD01,AUDIT\n"
        "TAX01,ADVISORY\n"
        "BROKEN\n");
    EXPECT_EQ(map.size(), 2u);
    EXPECT_EQ(map.master_for("TAX01"), "ADVISORY");
    EXPECT_EQ(map.master_for("AUD01"), "AUDIT");
    EXPECT_EQ(map.master_for("XYZ"), "UNKNOWN");
}

// ─── File loading ─────────────────────────────────────────────────────────────

TEST(LoadTransactions, MissingFileIsNullopt) {
    EXPECT_FALSE(DataLoader::load_transactions("/nonexistent/finagg/wip.csv").has_value());
    EXPECT_FALSE(DataLoader::load_service_lines("/nonexistent/finagg/sl.csv").has_value());
}

TEST(LoadTransactions, ReadsFileFromDisk) {
    const std::string path = ::testing::TempDir() + "finagg_loader_test.csv";
    {
        std::ofstream out(path);
        out << "date,amount,type,subtype,task,client,service_line\n"
            << "2024-05-01,250,T,,TSK-9,,TAX\n";
    }

    const auto report = DataLoader::load_transactions(path);
    std::remove(path.c_str());

    ASSERT_TRUE(report.has_value());
    ASSERT_EQ(report->rows.size(), 1u);
    EXPECT_DOUBLE_EQ(report->rows[0].amount, 250.0);
}
