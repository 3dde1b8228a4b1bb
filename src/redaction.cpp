// src/redaction.cpp
// Deny-list redaction

#include "telemetry/redaction.hpp"
#include "telemetry/utils.hpp"

namespace telemetry {

Redactor::Redactor(const std::vector<std::string>& deny_terms) {
    for (const auto& term : deny_terms) {
        std::string normalized = Utils::to_lower(Utils::trim(term));
        if (!normalized.empty()) {
            terms_.push_back(normalized);
        }
    }
}

bool Redactor::is_sensitive(const std::string& key) const {
    std::string lower = Utils::to_lower(key);
    for (const auto& term : terms_) {
        if (lower.find(term) != std::string::npos) {
            return true;
        }
    }
    return false;
}

size_t Redactor::redact(Properties& data) const {
    size_t replaced = 0;
    for (auto& [key, value] : data) {
        if (is_sensitive(key)) {
            value = std::string(REDACTED_VALUE);
            replaced++;
        }
    }
    return replaced;
}

Properties Redactor::redacted(const Properties& data) const {
    Properties copy = data;
    redact(copy);
    return copy;
}

} // namespace telemetry
