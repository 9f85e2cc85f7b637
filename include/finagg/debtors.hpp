#pragma once

/// @file include/finagg/debtors.hpp
/// @brief Debtor Aging & Payment Analyzer — public API.
///
/// # Module: Debtor Analyzer
///
/// ## Responsibility
/// Bucket debtor balances by age and measure how quickly invoices are paid,
/// over a receivables transaction stream that is independent of WIP.
///
/// ## Aging Schemes
///   Sixty   current 0–60 | 61–90 | 91–120 | 120+         (default)
///   Thirty  current 0–30 | 31–60 | 61–90 | 91–120 | 120+
/// Age is `today − transaction date` in whole days. Future-dated rows have a
/// negative age and fall into `current`.
///
/// ## Payment Speed
/// Rows are grouped by invoice number (rows without one only feed the
/// balance and aging). In each group the earliest invoice-like row fixes the
/// invoice date and amount; the earliest payment-like row, if any, is the
/// payment. Averages are weighted by |invoice amount|:
///   paid         Σ(days_to_pay · w) / Σw      → nullopt when no paid invoice
///   outstanding  Σ(days_open · w) / Σw        → 0 when none outstanding
///
/// Entry types are matched case-insensitively: invoice-like contains `inv`;
/// payment-like contains `payment` or `receipt` and is not invoice-like.
///
/// ## Guarantees
/// - `today` is always supplied by the caller; the clock is never read
/// - Aging buckets always sum to the total balance
/// - Stateless apart from the immutable config; safe for concurrent callers

#include "finagg/types.hpp"
#include "finagg/constants.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace finagg::debtors {

// ─── Types ────────────────────────────────────────────────────────────────────

/// Day-range partition used for aging.
enum class AgingScheme {
    Sixty,   ///< current = 0–60 days
    Thirty,  ///< current = 0–30 days, adds days31_60
};

/// Parse "60" / "30" (also "sixty" / "thirty").
[[nodiscard]] std::optional<AgingScheme> parse_aging_scheme(std::string_view text) noexcept;

/// Bucket an age that an AgingBuckets entry is keyed by.
enum class AgingBucket {
    Current,
    Days31To60,
    Days61To90,
    Days91To120,
    Days120Plus,
};

[[nodiscard]] std::string_view to_string(AgingBucket bucket) noexcept;

/// Signed balances per age bucket.
struct AgingBuckets {
    double current      = 0.0;
    double days31_60    = 0.0;  ///< Always 0 under AgingScheme::Sixty
    double days61_90    = 0.0;
    double days91_120   = 0.0;
    double days120_plus = 0.0;

    /// Sum of all buckets.
    [[nodiscard]] double total() const noexcept;

    /// Mutable reference to one bucket.
    [[nodiscard]] double& at(AgingBucket bucket) noexcept;

    AgingBuckets& operator+=(const AgingBuckets& other) noexcept;

    bool operator==(const AgingBuckets&) const = default;
};

/// Aggregate receivables metrics for one row set.
struct DebtorMetrics {
    double                total_balance = 0.0;
    AgingBuckets          aging;
    std::optional<double> avg_payment_days_paid;
    double                avg_payment_days_outstanding = 0.0;
    std::size_t           transaction_count = 0;
    std::size_t           invoice_count     = 0;

    [[nodiscard]] std::string to_string() const;
};

/// One payment applied to an invoice.
struct PaymentRecord {
    CalendarDate date;
    double       amount = 0.0;
};

/// Invoice-level view used for collections detail.
struct InvoiceDetail {
    std::string                invoice_number;
    CalendarDate               invoice_date;
    double                     original_amount   = 0.0;
    double                     payments_received = 0.0;  ///< Signed sum (receipts are negative)
    double                     net_balance       = 0.0;
    long                       days_outstanding  = 0;
    std::string                service_line;
    std::vector<PaymentRecord> payment_history;
};

/// Open invoices keyed by the bucket their age falls into.
using InvoicesByBucket = std::map<AgingBucket, std::vector<InvoiceDetail>>;

/// Analyzer configuration.
struct DebtorConfig {
    AgingScheme scheme = AgingScheme::Sixty;
};

// ─── DebtorAnalyzer ───────────────────────────────────────────────────────────

/// Computes DebtorMetrics over receivables rows.
class DebtorAnalyzer {
public:
    explicit DebtorAnalyzer(DebtorConfig config = DebtorConfig{}) noexcept;

    /// Metrics over every row supplied, aged relative to `today`.
    [[nodiscard]] DebtorMetrics
    analyze(std::span<const DebtorTransaction> transactions,
            CalendarDate today) const;

    /// Metrics per master service line. `mapping` translates raw service-line
    /// codes; unmapped codes are grouped under `unknown_key`.
    [[nodiscard]] std::map<std::string, DebtorMetrics>
    analyze_by_service_line(std::span<const DebtorTransaction> transactions,
                            CalendarDate today,
                            const std::map<std::string, std::string>& mapping,
                            std::string_view unknown_key = constants::UNKNOWN_SERVICE_LINE) const;

    /// Bucket an age in days under this analyzer's scheme.
    [[nodiscard]] AgingBucket bucket_for(long days_outstanding) const noexcept;

    /// Bucket an age in days under `scheme`.
    [[nodiscard]] static AgingBucket
    bucket_for(long days_outstanding, AgingScheme scheme) noexcept;

    /// True if `entry_type` describes an invoice.
    [[nodiscard]] static bool is_invoice_entry(std::string_view entry_type) noexcept;

    /// True if `entry_type` describes a payment or receipt.
    [[nodiscard]] static bool is_payment_entry(std::string_view entry_type) noexcept;

    [[nodiscard]] const DebtorConfig& config() const noexcept;

private:
    struct PaymentSpeed {
        std::optional<double> avg_days_paid;
        double                avg_days_outstanding = 0.0;
    };

    /// Weighted payment-speed averages over invoice groups.
    [[nodiscard]] static PaymentSpeed
    payment_speed(std::span<const DebtorTransaction> transactions,
                  CalendarDate today);

    DebtorConfig config_;
};

// ─── InvoiceDetailBuilder ─────────────────────────────────────────────────────

/// Builds invoice-level detail grouped by aging bucket.
///
/// Unlike the payment-speed average, every payment-like row of an invoice
/// is applied here, so partially paid invoices show their remaining
/// balance. Settled invoices (|net| < SETTLED_EPSILON) are left out.
class InvoiceDetailBuilder {
public:
    explicit InvoiceDetailBuilder(DebtorConfig config = DebtorConfig{}) noexcept;

    /// Open invoices, oldest first within each bucket.
    ///
    /// `service_line_names` maps raw service-line codes to display names;
    /// codes without an entry are reported as-is.
    [[nodiscard]] InvoicesByBucket
    build(std::span<const DebtorTransaction> transactions,
          CalendarDate today,
          const std::map<std::string, std::string>& service_line_names = {}) const;

    /// Total number of invoices across all buckets.
    [[nodiscard]] static std::size_t count(const InvoicesByBucket& buckets) noexcept;

private:
    DebtorConfig config_;
};

}  // namespace finagg::debtors
