/// @file src/core/service_line.cpp
/// @brief ServiceLineMap — raw → master service-line lookup.

#include "finagg/service_line.hpp"

#include <utility>

namespace finagg::core {

ServiceLineMap::ServiceLineMap(std::string unknown_key)
    : unknown_key_(std::move(unknown_key))
{}

ServiceLineMap::ServiceLineMap(std::map<std::string, std::string> mapping,
                               std::string unknown_key)
    : unknown_key_(std::move(unknown_key))
{
    for (auto& [code, master] : mapping) {
        set(code, master);
    }
}

void ServiceLineMap::set(const std::string& service_line, const std::string& master) {
    if (service_line.empty()) return;
    mapping_[service_line] = master;
}

const std::string&
ServiceLineMap::master_for(const std::string& service_line) const noexcept {
    const auto it = mapping_.find(service_line);
    if (it == mapping_.end() || it->second.empty()) {
        return unknown_key_;
    }
    return it->second;
}

const std::map<std::string, std::string>& ServiceLineMap::mapping() const noexcept {
    return mapping_;
}

const std::string& ServiceLineMap::unknown_key() const noexcept {
    return unknown_key_;
}

std::size_t ServiceLineMap::size() const noexcept {
    return mapping_.size();
}

bool ServiceLineMap::empty() const noexcept {
    return mapping_.empty();
}

}  // namespace finagg::core
