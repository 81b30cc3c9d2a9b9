#include "callsync/driver_call.hpp"
#include "callsync/errors.hpp"
#include <sstream>

namespace callsync {

CallState callStateFromDriverState(DriverCallState state) {
    switch (state) {
        case DriverCallState::ACTIVE:   return CallState::ACTIVE;
        case DriverCallState::HOLDING:  return CallState::HOLDING;
        case DriverCallState::DIALING:  return CallState::DIALING;
        case DriverCallState::ALERTING: return CallState::ALERTING;
        case DriverCallState::INCOMING: return CallState::INCOMING;
        case DriverCallState::WAITING:  return CallState::WAITING;
        default:
            throw DriverProtocolViolation("illegal driver call state: " +
                                          std::to_string(static_cast<int>(state)));
    }
}

std::optional<DriverCallState> parseDriverCallState(const std::string& name) {
    for (DriverCallState state : {DriverCallState::ACTIVE, DriverCallState::HOLDING,
                                  DriverCallState::DIALING, DriverCallState::ALERTING,
                                  DriverCallState::INCOMING, DriverCallState::WAITING}) {
        if (name == driverCallStateToString(state)) {
            return state;
        }
    }
    return std::nullopt;
}

std::string DriverCall::toString() const {
    std::ostringstream out;
    out << index << " " << driverCallStateToString(state) << " " << (is_mt ? "mt" : "mo");
    if (is_mpty) out << " mpty";
    if (!is_voice) out << " data";
    if (!number.empty()) out << " " << number;
    return out.str();
}

std::optional<DriverCall> DriverCall::parse(const std::string& line) {
    std::istringstream in(line);
    DriverCall dc;

    std::string state_name;
    std::string direction;
    if (!(in >> dc.index >> state_name >> direction)) {
        return std::nullopt;
    }
    if (dc.index <= 0) {
        return std::nullopt;
    }

    auto state = parseDriverCallState(state_name);
    if (!state) {
        return std::nullopt;
    }
    dc.state = *state;

    if (direction == "mt") {
        dc.is_mt = true;
    } else if (direction != "mo") {
        return std::nullopt;
    }

    std::string token;
    while (in >> token) {
        if (token == "mpty") {
            dc.is_mpty = true;
        } else if (token == "data") {
            dc.is_voice = false;
        } else if (dc.number.empty()) {
            dc.number = token;
        } else {
            return std::nullopt;
        }
    }

    return dc;
}

bool operator==(const DriverCall& a, const DriverCall& b) {
    return a.index == b.index && a.state == b.state && a.is_mt == b.is_mt &&
           a.is_mpty == b.is_mpty && a.is_voice == b.is_voice && a.number == b.number;
}

} // namespace callsync
