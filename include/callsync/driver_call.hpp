#pragma once

#include "callsync/types.hpp"
#include <optional>
#include <string>

namespace callsync {

/**
 * DriverCall
 *
 * Immutable snapshot of one call leg as reported by the radio transport
 * in a poll result. Field values are owned by the driver; the tracker only
 * compares them against its own connections.
 */
struct DriverCall {
    int index = 0;                                   // 1-based leg index
    DriverCallState state = DriverCallState::ACTIVE;
    bool is_mt = false;                              // Mobile terminated
    bool is_mpty = false;                            // Part of a multiparty call
    bool is_voice = true;
    std::string number;                              // Opaque remote address

    // Text form used in logs and scenario files:
    //   "<index> <STATE> mt|mo [mpty] [data] [number]"
    std::string toString() const;

    // Parse the text form. Returns nullopt on malformed input.
    // An unknown state name is malformed input here; unknown numeric states
    // coming from the transport are rejected by callStateFromDriverState().
    static std::optional<DriverCall> parse(const std::string& line);
};

bool operator==(const DriverCall& a, const DriverCall& b);
inline bool operator!=(const DriverCall& a, const DriverCall& b) { return !(a == b); }

// Total mapping from the driver enumeration to the logical Call state.
// Throws DriverProtocolViolation for any value outside the enumeration.
CallState callStateFromDriverState(DriverCallState state);

// Parse a driver state name ("ACTIVE", "HOLDING", ...)
std::optional<DriverCallState> parseDriverCallState(const std::string& name);

} // namespace callsync
