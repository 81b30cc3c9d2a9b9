#pragma once

#include <cstdint>
#include <cstddef>
#include <string>

namespace callsync {

// Stable identity of a Connection for its whole lifetime (never reused)
using ConnectionId = uint32_t;
constexpr ConnectionId INVALID_CONNECTION_ID = 0;

// Leg index not yet assigned by the radio (locally originated, unconfirmed)
constexpr int UNASSIGNED_INDEX = -1;

// Raw call state as reported by the radio driver (closed set)
enum class DriverCallState : uint8_t {
    ACTIVE = 0,
    HOLDING = 1,
    DIALING = 2,     // MO call only
    ALERTING = 3,    // MO call only
    INCOMING = 4,    // MT call only
    WAITING = 5,     // MT call only
};

// Logical aggregate state of a Call
enum class CallState : uint8_t {
    IDLE,
    ACTIVE,
    HOLDING,
    DIALING,
    ALERTING,
    INCOMING,
    WAITING,
    DISCONNECTED,
    DISCONNECTING,
};

// Fixed tracker-owned call groupings. A Connection refers to its owning
// Call through this handle.
enum class CallSlot : uint8_t {
    RINGING = 0,
    FOREGROUND = 1,
    BACKGROUND = 2,
};

constexpr size_t NUM_CALL_SLOTS = 3;

// Call technology family; selects the aggregation payload
enum class CallTechnology : uint8_t {
    CDMA,
    GSM,
};

// Overall phone state derived from the three calls
enum class PhoneState : uint8_t {
    IDLE,       // No calls
    RINGING,    // Ringing call present
    OFFHOOK,    // At least one call dialing, active or on hold
};

// Why a connection ended
enum class DisconnectCause : uint8_t {
    NOT_DISCONNECTED,
    INCOMING_MISSED,     // Incoming leg dropped before it was answered
    NORMAL,              // Remote hangup
    LOCAL,               // Local hangup
    BUSY,
    CONGESTION,
    INVALID_NUMBER,      // Radio never confirmed a dialed leg
    INCOMING_REJECTED,   // Incoming leg rejected locally
    OUT_OF_SERVICE,
    ERROR_UNSPECIFIED,
};

// Owning phone handle (pass-through for upper layers)
struct PhoneHandle {
    uint32_t id = 0;
    std::string name = "phone0";
    CallTechnology technology = CallTechnology::CDMA;
};

const char* driverCallStateToString(DriverCallState state);
const char* callStateToString(CallState state);
const char* callSlotToString(CallSlot slot);
const char* callTechnologyToString(CallTechnology technology);
const char* phoneStateToString(PhoneState state);
const char* disconnectCauseToString(DisconnectCause cause);

} // namespace callsync
