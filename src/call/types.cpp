#include "callsync/types.hpp"

namespace callsync {

const char* driverCallStateToString(DriverCallState state) {
    switch (state) {
        case DriverCallState::ACTIVE:   return "ACTIVE";
        case DriverCallState::HOLDING:  return "HOLDING";
        case DriverCallState::DIALING:  return "DIALING";
        case DriverCallState::ALERTING: return "ALERTING";
        case DriverCallState::INCOMING: return "INCOMING";
        case DriverCallState::WAITING:  return "WAITING";
        default: return "UNKNOWN";
    }
}

const char* callStateToString(CallState state) {
    switch (state) {
        case CallState::IDLE:          return "IDLE";
        case CallState::ACTIVE:        return "ACTIVE";
        case CallState::HOLDING:       return "HOLDING";
        case CallState::DIALING:       return "DIALING";
        case CallState::ALERTING:      return "ALERTING";
        case CallState::INCOMING:      return "INCOMING";
        case CallState::WAITING:       return "WAITING";
        case CallState::DISCONNECTED:  return "DISCONNECTED";
        case CallState::DISCONNECTING: return "DISCONNECTING";
        default: return "UNKNOWN";
    }
}

const char* callSlotToString(CallSlot slot) {
    switch (slot) {
        case CallSlot::RINGING:    return "ringing";
        case CallSlot::FOREGROUND: return "foreground";
        case CallSlot::BACKGROUND: return "background";
        default: return "unknown";
    }
}

const char* callTechnologyToString(CallTechnology technology) {
    switch (technology) {
        case CallTechnology::CDMA: return "CDMA";
        case CallTechnology::GSM:  return "GSM";
        default: return "Unknown";
    }
}

const char* phoneStateToString(PhoneState state) {
    switch (state) {
        case PhoneState::IDLE:    return "IDLE";
        case PhoneState::RINGING: return "RINGING";
        case PhoneState::OFFHOOK: return "OFFHOOK";
        default: return "UNKNOWN";
    }
}

const char* disconnectCauseToString(DisconnectCause cause) {
    switch (cause) {
        case DisconnectCause::NOT_DISCONNECTED:  return "NOT_DISCONNECTED";
        case DisconnectCause::INCOMING_MISSED:   return "INCOMING_MISSED";
        case DisconnectCause::NORMAL:            return "NORMAL";
        case DisconnectCause::LOCAL:             return "LOCAL";
        case DisconnectCause::BUSY:              return "BUSY";
        case DisconnectCause::CONGESTION:        return "CONGESTION";
        case DisconnectCause::INVALID_NUMBER:    return "INVALID_NUMBER";
        case DisconnectCause::INCOMING_REJECTED: return "INCOMING_REJECTED";
        case DisconnectCause::OUT_OF_SERVICE:    return "OUT_OF_SERVICE";
        case DisconnectCause::ERROR_UNSPECIFIED: return "ERROR_UNSPECIFIED";
        default: return "UNKNOWN";
    }
}

} // namespace callsync
