#pragma once

#include "simulated_radio.hpp"
#include "tracker/call_tracker.hpp"
#include <istream>
#include <map>
#include <string>
#include <vector>

namespace callsync {
namespace sim {

// Outcome of a scenario run
struct ScenarioResult {
    bool ok = true;
    size_t line = 0;                 // Failing line (1-based), 0 if ok
    std::string message;             // Failure description
    size_t commands_run = 0;
    size_t expectations_checked = 0;
};

/**
 * Scenario Runner
 *
 * Drives a CallTracker against a SimulatedRadio from a line-oriented script.
 * After every command the radio is pumped until it has nothing left to say,
 * so each line observes a settled tracker.
 *
 * Script commands ('#' starts a comment; <leg> is a radio leg index):
 *   dial <number>                 ring <number>
 *   alert <leg>                   answer <leg>
 *   remote-hangup <leg> [cause]   fail-dial <cause>      fail-flash
 *   accept    reject    swap    conference    separate <leg>
 *   hangup ringing|fg|bg          hangup-conn <leg>      clear
 *   expect ringing|fg|bg <STATE> [legs]
 *   expect phone IDLE|RINGING|OFFHOOK
 *   expect-cause <number> <CAUSE>
 *   expect-error <command...>     dump
 */
class ScenarioRunner {
public:
    explicit ScenarioRunner(const TrackerConfig& config = TrackerConfig{});

    ScenarioRunner(const ScenarioRunner&) = delete;
    ScenarioRunner& operator=(const ScenarioRunner&) = delete;

    // Run one script line. Returns false and fills error on failure.
    bool runLine(const std::string& line, std::string& error);

    // Run a whole script, stopping at the first failing line
    ScenarioResult run(std::istream& in);

    // Human-readable snapshot of the three calls
    std::string dump() const;

    // Tracker notifications seen so far ("ring #1 5551234", "phone OFFHOOK", ...)
    const std::vector<std::string>& getEvents() const { return events_; }

    CallTracker& tracker() { return tracker_; }
    SimulatedRadio& radio() { return radio_; }

private:
    SimulatedRadio radio_;
    CallTracker tracker_;

    std::vector<std::string> events_;
    std::map<std::string, DisconnectCause> last_cause_;    // By remote number
    size_t commands_run_ = 0;
    size_t expectations_checked_ = 0;

    bool execute(const std::vector<std::string>& args, std::string& error);
    bool expect(const std::vector<std::string>& args, std::string& error);
    bool expectCause(const std::vector<std::string>& args, std::string& error);

    // Tracked connection currently reported at the given radio index
    const Connection* findByIndex(int index) const;
};

// Built-in walkthrough script for the given technology (used by `callsync demo`)
const char* demoScript(CallTechnology technology);

} // namespace sim
} // namespace callsync
