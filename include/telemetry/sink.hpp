// include/telemetry/sink.hpp
// Purpose: Transport capability the delivery pipeline sends batches through

#pragma once

#include "types.hpp"
#include <string>

namespace telemetry {

class Batch;

struct SendResult {
    DeliveryOutcome outcome = DeliveryOutcome::SUCCESS;
    size_t accepted = 0;
    size_t rejected = 0;
    std::string detail;
};

// A destination for batches. Failures are reported by throwing telemetry::Error
// subclasses: NetworkError, TimeoutError and ServerError(429/5xx) are transient,
// AuthError, ProtocolError and other ServerErrors are permanent.
class TelemetrySink {
public:
    virtual ~TelemetrySink() = default;

    // Bounded by the sink's own send timeout
    virtual SendResult send(const Batch& batch) = 0;

    virtual std::string name() const = 0;

    virtual void close() {}
};

} // namespace telemetry
