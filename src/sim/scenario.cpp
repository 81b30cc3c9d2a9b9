#include "scenario.hpp"
#include "callsync/errors.hpp"
#include "callsync/logging.hpp"
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace callsync {
namespace sim {

namespace {

size_t radioLegCount(const TrackerConfig& config) {
    if (config.max_connections > 0) {
        return config.max_connections;
    }
    return makeCallProfile(config.technology).max_connections;
}

std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream in(line.substr(0, line.find('#')));
    std::string token;
    while (in >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::optional<int> parseInt(const std::string& text) {
    if (text.empty()) return std::nullopt;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (*end != '\0') return std::nullopt;
    return static_cast<int>(value);
}

std::optional<CallSlot> parseSlot(const std::string& name) {
    if (name == "ringing") return CallSlot::RINGING;
    if (name == "fg" || name == "foreground") return CallSlot::FOREGROUND;
    if (name == "bg" || name == "background") return CallSlot::BACKGROUND;
    return std::nullopt;
}

std::optional<CallState> parseCallState(const std::string& name) {
    for (CallState state : {CallState::IDLE, CallState::ACTIVE, CallState::HOLDING,
                            CallState::DIALING, CallState::ALERTING, CallState::INCOMING,
                            CallState::WAITING, CallState::DISCONNECTED,
                            CallState::DISCONNECTING}) {
        if (name == callStateToString(state)) return state;
    }
    return std::nullopt;
}

std::optional<PhoneState> parsePhoneState(const std::string& name) {
    for (PhoneState state : {PhoneState::IDLE, PhoneState::RINGING, PhoneState::OFFHOOK}) {
        if (name == phoneStateToString(state)) return state;
    }
    return std::nullopt;
}

std::optional<DisconnectCause> parseCause(const std::string& name) {
    for (DisconnectCause cause : {DisconnectCause::NOT_DISCONNECTED, DisconnectCause::INCOMING_MISSED,
                                  DisconnectCause::NORMAL, DisconnectCause::LOCAL,
                                  DisconnectCause::BUSY, DisconnectCause::CONGESTION,
                                  DisconnectCause::INVALID_NUMBER, DisconnectCause::INCOMING_REJECTED,
                                  DisconnectCause::OUT_OF_SERVICE, DisconnectCause::ERROR_UNSPECIFIED}) {
        if (name == disconnectCauseToString(cause)) return cause;
    }
    return std::nullopt;
}

} // namespace

ScenarioRunner::ScenarioRunner(const TrackerConfig& config)
    : radio_(config.technology, radioLegCount(config))
    , tracker_(radio_, config)
{
    radio_.connectTracker(tracker_);

    tracker_.setNewRingingConnectionCallback([this](const Connection& conn) {
        events_.push_back("ring #" + std::to_string(conn.getId()) + " " + conn.getAddress());
    });
    tracker_.setDisconnectCallback([this](const Connection& conn) {
        last_cause_[conn.getAddress()] = conn.getDisconnectCause();
        events_.push_back("disconnect #" + std::to_string(conn.getId()) + " " +
                          disconnectCauseToString(conn.getDisconnectCause()));
    });
    tracker_.setPhoneStateChangedCallback([this](PhoneState state) {
        events_.push_back(std::string("phone ") + phoneStateToString(state));
    });
}

ScenarioResult ScenarioRunner::run(std::istream& in) {
    ScenarioResult result;
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        line_no++;
        std::string error;
        if (!runLine(line, error)) {
            result.ok = false;
            result.line = line_no;
            result.message = error;
            LOG_ERROR("SCENARIO", "line %zu: %s", line_no, error.c_str());
            break;
        }
    }

    result.commands_run = commands_run_;
    result.expectations_checked = expectations_checked_;
    return result;
}

bool ScenarioRunner::runLine(const std::string& line, std::string& error) {
    std::vector<std::string> args = tokenize(line);
    if (args.empty()) {
        return true;
    }

    const std::string& cmd = args[0];

    if (cmd == "expect") {
        expectations_checked_++;
        return expect(args, error);
    }
    if (cmd == "expect-cause") {
        expectations_checked_++;
        return expectCause(args, error);
    }
    if (cmd == "expect-error") {
        expectations_checked_++;
        std::vector<std::string> rest(args.begin() + 1, args.end());
        if (rest.empty()) {
            error = "expect-error needs a command";
            return false;
        }
        try {
            if (!execute(rest, error)) {
                return false;
            }
        } catch (const CallStateException& e) {
            LOG_DEBUG("SCENARIO", "expected failure: %s", e.what());
            radio_.pump();
            return true;
        } catch (const std::invalid_argument& e) {
            LOG_DEBUG("SCENARIO", "expected failure: %s", e.what());
            radio_.pump();
            return true;
        } catch (const std::exception& e) {
            error = "'" + rest[0] + "' failed unexpectedly: " + e.what();
            return false;
        }
        error = "'" + rest[0] + "' succeeded but should have failed";
        return false;
    }
    if (cmd == "dump") {
        std::fputs(dump().c_str(), stdout);
        return true;
    }

    try {
        if (!execute(args, error)) {
            return false;
        }
        commands_run_++;
        radio_.pump();
    } catch (const std::exception& e) {
        error = "'" + cmd + "' failed: " + e.what();
        return false;
    }
    return true;
}

bool ScenarioRunner::execute(const std::vector<std::string>& args, std::string& error) {
    const std::string& cmd = args[0];

    auto argInt = [&](size_t pos, int& out) {
        if (pos >= args.size()) {
            error = "'" + cmd + "' needs argument " + std::to_string(pos);
            return false;
        }
        auto value = parseInt(args[pos]);
        if (!value) {
            error = "'" + cmd + "': bad number '" + args[pos] + "'";
            return false;
        }
        out = *value;
        return true;
    };

    auto argLeg = [&](size_t pos, const Connection*& out) {
        int index = 0;
        if (!argInt(pos, index)) return false;
        out = findByIndex(index);
        if (!out) {
            error = "'" + cmd + "': no connection at leg " + std::to_string(index);
            return false;
        }
        return true;
    };

    auto radioResult = [&](bool ok, int index) {
        if (!ok) {
            error = "'" + cmd + "': radio has no suitable leg " + std::to_string(index);
        }
        return ok;
    };

    if (cmd == "dial") {
        if (args.size() < 2) {
            error = "dial needs a number";
            return false;
        }
        tracker_.dial(args[1]);
    } else if (cmd == "ring") {
        if (args.size() < 2) {
            error = "ring needs a number";
            return false;
        }
        if (radio_.ringIncoming(args[1]) < 0) {
            error = "ring: no free leg";
            return false;
        }
    } else if (cmd == "alert" || cmd == "answer") {
        int index = 0;
        if (!argInt(1, index)) return false;
        bool ok = (cmd == "alert") ? radio_.remoteAlert(index) : radio_.remoteAnswer(index);
        return radioResult(ok, index);
    } else if (cmd == "remote-hangup") {
        int index = 0;
        int cause = SimulatedRadio::CAUSE_NORMAL;
        if (!argInt(1, index)) return false;
        if (args.size() > 2 && !argInt(2, cause)) return false;
        return radioResult(radio_.remoteHangup(index, cause), index);
    } else if (cmd == "fail-dial") {
        int cause = 0;
        if (!argInt(1, cause)) return false;
        radio_.failNextDial(cause);
    } else if (cmd == "fail-flash") {
        radio_.failNextFlash();
    } else if (cmd == "accept") {
        tracker_.acceptCall();
    } else if (cmd == "reject") {
        tracker_.rejectCall();
    } else if (cmd == "swap") {
        tracker_.switchWaitingOrHoldingAndActive();
    } else if (cmd == "conference") {
        tracker_.conference();
    } else if (cmd == "separate") {
        const Connection* conn = nullptr;
        if (!argLeg(1, conn)) return false;
        tracker_.separate(conn->getId());
    } else if (cmd == "hangup") {
        auto slot = args.size() > 1 ? parseSlot(args[1]) : std::nullopt;
        if (!slot) {
            error = "hangup needs ringing|fg|bg";
            return false;
        }
        switch (*slot) {
            case CallSlot::RINGING:    tracker_.hangup(tracker_.getRingingCall()); break;
            case CallSlot::FOREGROUND: tracker_.hangup(tracker_.getForegroundCall()); break;
            case CallSlot::BACKGROUND: tracker_.hangup(tracker_.getBackgroundCall()); break;
        }
    } else if (cmd == "hangup-conn") {
        const Connection* conn = nullptr;
        if (!argLeg(1, conn)) return false;
        tracker_.hangup(conn->getId());
    } else if (cmd == "clear") {
        tracker_.clearDisconnected();
    } else {
        error = "unknown command '" + cmd + "'";
        return false;
    }

    return true;
}

bool ScenarioRunner::expect(const std::vector<std::string>& args, std::string& error) {
    if (args.size() < 3) {
        error = "expect needs a target and a state";
        return false;
    }

    if (args[1] == "phone") {
        auto state = parsePhoneState(args[2]);
        if (!state) {
            error = "unknown phone state '" + args[2] + "'";
            return false;
        }
        if (tracker_.getPhoneState() != *state) {
            error = std::string("phone is ") + phoneStateToString(tracker_.getPhoneState()) +
                    ", expected " + args[2];
            return false;
        }
        return true;
    }

    auto slot = parseSlot(args[1]);
    auto state = parseCallState(args[2]);
    if (!slot || !state) {
        error = "bad expectation '" + args[1] + " " + args[2] + "'";
        return false;
    }

    const Call& c = tracker_.getCall(*slot);
    if (c.getState() != *state) {
        error = std::string(callSlotToString(*slot)) + " call is " + c.toString() +
                ", expected " + args[2];
        return false;
    }

    if (args.size() > 3) {
        auto count = parseInt(args[3]);
        if (!count) {
            error = "bad leg count '" + args[3] + "'";
            return false;
        }
        if (c.getConnections().size() != static_cast<size_t>(*count)) {
            error = std::string(callSlotToString(*slot)) + " call has " +
                    std::to_string(c.getConnections().size()) + " legs, expected " + args[3];
            return false;
        }
    }

    return true;
}

bool ScenarioRunner::expectCause(const std::vector<std::string>& args, std::string& error) {
    if (args.size() < 3) {
        error = "expect-cause needs a number and a cause";
        return false;
    }

    auto cause = parseCause(args[2]);
    if (!cause) {
        error = "unknown cause '" + args[2] + "'";
        return false;
    }

    auto it = last_cause_.find(args[1]);
    if (it == last_cause_.end()) {
        error = "no disconnect seen for " + args[1];
        return false;
    }
    if (it->second != *cause) {
        error = args[1] + " disconnected with " + disconnectCauseToString(it->second) +
                ", expected " + args[2];
        return false;
    }
    return true;
}

const Connection* ScenarioRunner::findByIndex(int index) const {
    for (CallSlot slot : {CallSlot::RINGING, CallSlot::FOREGROUND, CallSlot::BACKGROUND}) {
        for (const auto& conn : tracker_.getCall(slot).getConnections()) {
            if (conn.hasIndex() && conn.getIndex() == index && !conn.isDisconnected()) {
                return &conn;
            }
        }
    }
    return nullptr;
}

namespace {

const char* const CDMA_DEMO = R"(# Outgoing call, then a three-way party added by flash
dial 5551000
expect fg DIALING 1
expect phone OFFHOOK
alert 1
expect fg ALERTING 1
answer 1
expect fg ACTIVE 1
dial 5552000
expect fg ACTIVE 2

# Call waiting while in the three-way call
ring 5553000
expect ringing WAITING 1
reject
expect ringing DISCONNECTED 1
expect-cause 5553000 INCOMING_REJECTED

# Ending the foreground call drops both parties
hangup fg
expect fg DISCONNECTED 2
expect-cause 5551000 LOCAL
expect-cause 5552000 LOCAL
expect phone IDLE
clear
expect fg IDLE 0
expect ringing IDLE 0
)";

const char* const GSM_DEMO = R"(# Two calls, conference, then split
dial 5551000
answer 1
expect fg ACTIVE 1
dial 5552000
expect bg HOLDING 1
expect fg DIALING 1
answer 2
expect fg ACTIVE 1
conference
expect fg ACTIVE 2
expect bg IDLE 0
separate 1
expect fg ACTIVE 1
expect bg HOLDING 1

# Waiting call turned away
ring 5553000
expect ringing WAITING 1
expect phone RINGING
hangup ringing
expect-cause 5553000 INCOMING_REJECTED

# Hang up the active party; the held one resumes
hangup fg
expect-cause 5551000 LOCAL
expect fg ACTIVE 1
expect bg IDLE 0
remote-hangup 2
expect fg DISCONNECTED 1
expect-cause 5552000 NORMAL
expect phone IDLE
)";

} // namespace

const char* demoScript(CallTechnology technology) {
    return technology == CallTechnology::GSM ? GSM_DEMO : CDMA_DEMO;
}

std::string ScenarioRunner::dump() const {
    std::ostringstream out;
    out << "phone " << phoneStateToString(tracker_.getPhoneState()) << "\n";
    for (CallSlot slot : {CallSlot::RINGING, CallSlot::FOREGROUND, CallSlot::BACKGROUND}) {
        const Call& c = tracker_.getCall(slot);
        out << "  " << callSlotToString(slot) << ": " << c.toString() << "\n";
        for (const auto& conn : c.getConnections()) {
            out << "    " << conn.toString() << "\n";
        }
    }
    out << "  radio:";
    if (radio_.getLegs().empty()) {
        out << " (no legs)";
    }
    out << "\n";
    for (const auto& dc : radio_.getLegs()) {
        out << "    " << dc.toString() << "\n";
    }
    return out.str();
}

} // namespace sim
} // namespace callsync
