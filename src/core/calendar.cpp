/// @file src/core/calendar.cpp
/// @brief Calendar-day parsing/formatting and the category weight vector.

#include "finagg/types.hpp"

#include <fmt/format.h>

#include <charconv>

namespace finagg {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

/// Parse exactly `text.size()` decimal digits. Signs are not accepted.
[[nodiscard]] std::optional<int> parse_digits(std::string_view text) noexcept {
    if (text.empty()) return std::nullopt;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
    }
    int value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

}  // namespace

// ─── parse_date ───────────────────────────────────────────────────────────────

std::optional<CalendarDate> parse_date(std::string_view text) noexcept {
    // Layout: YYYY-MM-DD[(T| )...]
    if (text.size() < 10) return std::nullopt;
    if (text[4] != '-' || text[7] != '-') return std::nullopt;
    if (text.size() > 10 && text[10] != 'T' && text[10] != ' ') return std::nullopt;

    const auto y = parse_digits(text.substr(0, 4));
    const auto m = parse_digits(text.substr(5, 2));
    const auto d = parse_digits(text.substr(8, 2));
    if (!y || !m || !d) return std::nullopt;

    const std::chrono::year_month_day ymd{
        std::chrono::year{*y},
        std::chrono::month{static_cast<unsigned>(*m)},
        std::chrono::day{static_cast<unsigned>(*d)},
    };
    if (!ymd.ok()) return std::nullopt;  // e.g. 2023-02-29

    return CalendarDate{ymd};
}

// ─── format_date ──────────────────────────────────────────────────────────────

std::string format_date(CalendarDate date) {
    const std::chrono::year_month_day ymd{date};
    return fmt::format("{:04d}-{:02d}-{:02d}",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()));
}

// ─── days_between ─────────────────────────────────────────────────────────────

long days_between(CalendarDate from, CalendarDate to) noexcept {
    return static_cast<long>((to - from).count());
}

// ─── Category weights ─────────────────────────────────────────────────────────

const CategoryVector& wip_flow_weights() noexcept {
    // [production, adjustments, disbursements, billing, provisions]
    static const CategoryVector weights =
        (CategoryVector() << 1.0, 1.0, 1.0, -1.0, 1.0).finished();
    return weights;
}

double wip_change(const CategoryVector& totals) noexcept {
    return wip_flow_weights().dot(totals);
}

}  // namespace finagg
