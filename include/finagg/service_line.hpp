#pragma once

/// @file include/finagg/service_line.hpp
/// @brief Service-line to master service-line mapping and row partitioning.
///
/// Reports are broken down by master service line. Raw service-line codes on
/// ledger rows are translated through a ServiceLineMap; codes with no entry
/// fall under the map's unknown key.

#include "finagg/constants.hpp"
#include "finagg/types.hpp"

#include <cstddef>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace finagg::core {

/// Raw service-line code → master service-line code.
class ServiceLineMap {
public:
    explicit ServiceLineMap(std::string unknown_key =
                                std::string(constants::UNKNOWN_SERVICE_LINE));

    ServiceLineMap(std::map<std::string, std::string> mapping,
                   std::string unknown_key =
                       std::string(constants::UNKNOWN_SERVICE_LINE));

    /// Add or replace one mapping. Empty codes are ignored.
    void set(const std::string& service_line, const std::string& master);

    /// Master code for a raw code, or the unknown key.
    [[nodiscard]] const std::string& master_for(const std::string& service_line) const noexcept;

    [[nodiscard]] const std::map<std::string, std::string>& mapping() const noexcept;
    [[nodiscard]] const std::string& unknown_key() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;

private:
    std::map<std::string, std::string> mapping_;
    std::string                        unknown_key_;
};

/// Split rows by master service line, preserving input order within each part.
///
/// Works for any row type with a `service_line` member (Transaction,
/// DebtorTransaction).
template <typename Row>
[[nodiscard]] std::map<std::string, std::vector<Row>>
partition_by_master(std::span<const Row> rows, const ServiceLineMap& map) {
    std::map<std::string, std::vector<Row>> parts;
    for (const Row& row : rows) {
        parts[map.master_for(row.service_line)].push_back(row);
    }
    return parts;
}

}  // namespace finagg::core
