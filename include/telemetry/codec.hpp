// include/telemetry/codec.hpp
// Purpose: JSON wire codec for telemetry items
// A batch travels as a JSON array; metric samples and health reports carry a "kind" tag

#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace telemetry {

class Batch;

namespace Codec {

constexpr const char* KIND_METRIC = "metric";
constexpr const char* KIND_HEALTH = "health";

// Throws ProtocolError(SERIALIZATION_FAILED) when an item cannot be encoded
std::string encode_batch(const Batch& batch);
std::string encode_items(const std::vector<TelemetryItem>& items);

// Throws ProtocolError(MALFORMED_DATA) on anything that is not an encoded batch
std::vector<TelemetryItem> decode_batch(const std::string& payload);

// Single item helpers
std::string encode_item(const TelemetryItem& item);
TelemetryItem decode_item(const std::string& payload);

} // namespace Codec

} // namespace telemetry
