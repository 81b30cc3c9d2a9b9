/**
 * Call Simulator - randomized soak run
 *
 * Drives a CallTracker against the simulated radio with random user
 * commands and network events, and checks the call model after every step.
 *
 * Usage:
 *   ./call_simulator [options]
 *
 * Options:
 *   --seed <n>     Random seed (default: 1)
 *   --steps <n>    Number of steps (default: 5000)
 *   --gsm          Simulate a GSM radio (default: CDMA)
 *   --verbose      Enable verbose logging
 */

#include <algorithm>
#include <iostream>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "sim/simulated_radio.hpp"
#include "tracker/call_tracker.hpp"
#include "callsync/errors.hpp"
#include "callsync/logging.hpp"

using namespace callsync;
using namespace callsync::sim;

class CallSimulator {
public:
    CallSimulator(CallTechnology technology, uint32_t seed)
        : radio_(technology, makeCallProfile(technology).max_connections)
        , tracker_(radio_, makeConfig(technology))
        , rng_(seed)
        , seed_(seed)
    {
        radio_.connectTracker(tracker_);
        tracker_.setDisconnectCallback([this](const Connection&) { disconnects_++; });
        tracker_.setNewRingingConnectionCallback([this](const Connection&) { rings_++; });
    }

    bool run(size_t steps) {
        printHeader(steps);

        for (size_t step = 1; step <= steps; step++) {
            std::string action = randomAction();
            try {
                apply(action);
                radio_.pump();
            } catch (const CallStateException&) {
                // Not allowed in the current state
                rejected_++;
                radio_.pump();
            } catch (const DriverProtocolViolation& e) {
                std::cout << "  \033[31m✗ Step " << step << " (" << action
                          << "): protocol violation: " << e.what() << "\033[0m\n";
                return false;
            }

            std::string problem = checkInvariants();
            if (!problem.empty()) {
                std::cout << "  \033[31m✗ Step " << step << " (" << action << "): "
                          << problem << "\033[0m\n";
                dump();
                return false;
            }

            if (step % 1000 == 0) {
                std::cout << "  [STEP " << step << "] rings=" << rings_
                          << ", disconnects=" << disconnects_
                          << ", rejected=" << rejected_
                          << ", radio legs=" << radio_.getLegs().size() << std::endl;
            }
        }

        printSummary(steps);
        return true;
    }

private:
    SimulatedRadio radio_;
    CallTracker tracker_;
    std::mt19937 rng_;
    uint32_t seed_;

    size_t rings_ = 0;
    size_t disconnects_ = 0;
    size_t rejected_ = 0;
    int next_number_ = 5550000;

    static TrackerConfig makeConfig(CallTechnology technology) {
        TrackerConfig config;
        config.technology = technology;
        config.phone_name = "soak";
        return config;
    }

    size_t pick(size_t n) {
        return std::uniform_int_distribution<size_t>(0, n - 1)(rng_);
    }

    std::string randomAction() {
        static const std::vector<std::string> actions = {
            "dial", "dial", "ring", "ring", "alert", "answer", "answer",
            "remote-hangup", "remote-hangup", "fail-dial", "fail-flash",
            "accept", "accept", "reject", "swap", "conference", "separate",
            "hangup", "hangup", "hangup-conn", "clear"
        };
        return actions[pick(actions.size())];
    }

    int randomLeg() {
        const auto& legs = radio_.getLegs();
        if (legs.empty()) return 1;
        return legs[pick(legs.size())].index;
    }

    std::string nextNumber() {
        return std::to_string(next_number_++);
    }

    void apply(const std::string& action) {
        if (action == "dial") {
            tracker_.dial(nextNumber());
        } else if (action == "ring") {
            radio_.ringIncoming(nextNumber());
        } else if (action == "alert") {
            radio_.remoteAlert(randomLeg());
        } else if (action == "answer") {
            radio_.remoteAnswer(randomLeg());
        } else if (action == "remote-hangup") {
            static const int causes[] = {16, 16, 17, 34, 1, 1001};
            radio_.remoteHangup(randomLeg(), causes[pick(6)]);
        } else if (action == "fail-dial") {
            radio_.failNextDial(pick(2) ? 17 : 34);
        } else if (action == "fail-flash") {
            radio_.failNextFlash();
        } else if (action == "accept") {
            tracker_.acceptCall();
        } else if (action == "reject") {
            tracker_.rejectCall();
        } else if (action == "swap") {
            tracker_.switchWaitingOrHoldingAndActive();
        } else if (action == "conference") {
            tracker_.conference();
        } else if (action == "separate") {
            const Connection* conn = tracker_.getForegroundCall().getLatestConnection();
            if (!conn) throw CallStateException("no foreground connection");
            tracker_.separate(conn->getId());
        } else if (action == "hangup") {
            switch (pick(3)) {
                case 0:  tracker_.hangup(tracker_.getRingingCall()); break;
                case 1:  tracker_.hangup(tracker_.getForegroundCall()); break;
                default: tracker_.hangup(tracker_.getBackgroundCall()); break;
            }
        } else if (action == "hangup-conn") {
            std::vector<ConnectionId> ids;
            for (CallSlot slot : {CallSlot::RINGING, CallSlot::FOREGROUND, CallSlot::BACKGROUND}) {
                for (const auto& conn : tracker_.getCall(slot).getConnections()) {
                    ids.push_back(conn.getId());
                }
            }
            if (ids.empty()) throw CallStateException("no connections");
            tracker_.hangup(ids[pick(ids.size())]);
        } else if (action == "clear") {
            tracker_.clearDisconnected();
        }
    }

    // Returns a description of the first broken rule, or "" if all hold
    std::string checkInvariants() const {
        std::set<ConnectionId> seen;

        for (CallSlot slot : {CallSlot::RINGING, CallSlot::FOREGROUND, CallSlot::BACKGROUND}) {
            const Call& c = tracker_.getCall(slot);
            std::string name = callSlotToString(slot);

            if ((c.getState() == CallState::IDLE) != c.getConnections().empty()) {
                return name + " call is " + c.toString() + " with " +
                       std::to_string(c.getConnections().size()) + " legs";
            }

            for (const auto& conn : c.getConnections()) {
                if (!seen.insert(conn.getId()).second) {
                    return "connection #" + std::to_string(conn.getId()) + " in two calls";
                }
                if (conn.getOwner() != slot) {
                    return "connection #" + std::to_string(conn.getId()) + " owner mismatch in " + name;
                }
                if (c.getState() == CallState::DISCONNECTED &&
                    conn.getState() != CallState::DISCONNECTED) {
                    return name + " call DISCONNECTED with live leg " + conn.toString();
                }
            }
        }

        // A leg merged by flash needs a reported leg of its own call to ride on
        if (!tracker_.hasPendingDial()) {
            for (CallSlot slot : {CallSlot::FOREGROUND, CallSlot::BACKGROUND}) {
                const auto& legs = tracker_.getCall(slot).getConnections();
                bool reported = std::any_of(legs.begin(), legs.end(), [](const Connection& conn) {
                    return conn.hasIndex() && !conn.isDisconnected();
                });
                for (const auto& conn : legs) {
                    if (!reported && !conn.hasIndex() && !conn.isDisconnected()) {
                        return "carried leg " + conn.toString() + " in " + callSlotToString(slot) +
                               " call without a reported leg";
                    }
                }
            }
        }

        bool ringing = tracker_.getRingingCall().isRinging();
        if (ringing != (tracker_.getPhoneState() == PhoneState::RINGING)) {
            return std::string("phone state ") + phoneStateToString(tracker_.getPhoneState()) +
                   " does not match the ringing call";
        }

        return "";
    }

    void dump() const {
        std::cout << "  Tracker:\n";
        for (CallSlot slot : {CallSlot::RINGING, CallSlot::FOREGROUND, CallSlot::BACKGROUND}) {
            const Call& c = tracker_.getCall(slot);
            std::cout << "    " << callSlotToString(slot) << ": " << c.toString() << "\n";
            for (const auto& conn : c.getConnections()) {
                std::cout << "      " << conn.toString() << "\n";
            }
        }
        std::cout << "  Radio:\n";
        for (const auto& dc : radio_.getLegs()) {
            std::cout << "    " << dc.toString() << "\n";
        }
    }

    void printHeader(size_t steps) {
        std::cout << "\n";
        std::cout << "=== CallSync Soak Simulator ===\n";
        std::cout << "\n";
        std::cout << "Configuration:\n";
        std::cout << "  Technology: " << callTechnologyToString(radio_.getTechnology()) << "\n";
        std::cout << "  Seed:       " << seed_ << "\n";
        std::cout << "  Steps:      " << steps << "\n";
        std::cout << "\n";
    }

    void printSummary(size_t steps) {
        std::cout << "\n";
        std::cout << "  \033[32m✓ " << steps << " steps, invariants held\033[0m\n";
        std::cout << "  Rings:       " << rings_ << "\n";
        std::cout << "  Disconnects: " << disconnects_ << "\n";
        std::cout << "  Rejected:    " << rejected_ << "\n";
        std::cout << "\n";
    }
};

int main(int argc, char* argv[]) {
    uint32_t seed = 1;
    size_t steps = 5000;
    CallTechnology technology = CallTechnology::CDMA;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--seed" && i + 1 < argc) {
            seed = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--steps" && i + 1 < argc) {
            steps = std::stoul(argv[++i]);
        } else if (arg == "--gsm") {
            technology = CallTechnology::GSM;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Call Simulator - randomized soak run\n\n";
            std::cout << "Usage: " << argv[0] << " [options]\n\n";
            std::cout << "Options:\n";
            std::cout << "  --seed <n>    Random seed (default: 1)\n";
            std::cout << "  --steps <n>   Number of steps (default: 5000)\n";
            std::cout << "  --gsm         Simulate a GSM radio (default: CDMA)\n";
            std::cout << "  --verbose     Enable verbose logging\n";
            return 0;
        }
    }

    setLogLevel(verbose ? LogLevel::DEBUG : LogLevel::WARN);

    CallSimulator sim(technology, seed);
    bool success = sim.run(steps);
    return success ? 0 : 1;
}
