#pragma once

#include <core/types.hpp>

// Liveness-by-port check: "is something accepting TCP connections here".
// No handshake and no retries; retry policy belongs to the caller.
class LivenessProbe {
public:
    virtual ~LivenessProbe() = default;

    // True iff a connection to endpoint completes within timeout_ms.
    // Refused, timed out, unreachable and unparseable hosts all return false.
    // Only numeric addresses and "localhost" are accepted, so the call never
    // blocks on name resolution past the timeout.
    virtual bool probe(const Endpoint& endpoint, int timeout_ms);
};
