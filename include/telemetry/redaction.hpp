// include/telemetry/redaction.hpp
// Purpose: Deny-list redaction of sensitive structured data

#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace telemetry {

constexpr const char* REDACTED_VALUE = "***REDACTED***";

// A key is sensitive when its lowercase form contains any deny-list term
class Redactor {
public:
    explicit Redactor(const std::vector<std::string>& deny_terms);

    bool is_sensitive(const std::string& key) const;

    // Returns the number of values replaced
    size_t redact(Properties& data) const;
    Properties redacted(const Properties& data) const;

    const std::vector<std::string>& deny_terms() const { return terms_; }

private:
    std::vector<std::string> terms_;
};

} // namespace telemetry
