#pragma once

#include <stdexcept>
#include <string>

namespace callsync {

// A request is not allowed in the current call state (recoverable).
// Surfaced to the caller; nothing is retried at this layer.
class CallStateException : public std::runtime_error {
public:
    explicit CallStateException(const std::string& what)
        : std::runtime_error(what) {}
};

// The radio reported something outside the driver contract (unmapped state,
// duplicate or out-of-range leg index). Tracker and transport have
// desynchronized; the update is aborted and must not be retried.
class DriverProtocolViolation : public std::logic_error {
public:
    explicit DriverProtocolViolation(const std::string& what)
        : std::logic_error(what) {}
};

} // namespace callsync
