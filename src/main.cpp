#include "config/settings.hpp"
#include "sim/scenario.hpp"
#include "tracker/event_loop.hpp"
#include "callsync/logging.hpp"

#include <iostream>
#include <fstream>
#include <sstream>
#include <cstring>
#include <stdexcept>

using namespace callsync;

void printUsage(const char* prog) {
    std::cerr << "CallSync - Call state tracker for CDMA/GSM radios\n\n";
    std::cerr << "Usage: " << prog << " [options] <command>\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  replay [file]   Run a scenario script against the simulated radio\n";
    std::cerr << "                  (from file or stdin)\n";
    std::cerr << "  demo            Run the built-in walkthrough for the technology\n";
    std::cerr << "  info            Show tracker configuration\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  -c <file>       Settings file (default: ~/.config/callsync/settings.ini)\n";
    std::cerr << "  -t <tech>       Technology: cdma, gsm (overrides settings)\n";
    std::cerr << "  -v              Verbose logging (debug level)\n";
    std::cerr << "\nScript commands:\n";
    std::cerr << "  dial <number>, ring <number>, alert <leg>, answer <leg>,\n";
    std::cerr << "  remote-hangup <leg> [cause], fail-dial <cause>, fail-flash,\n";
    std::cerr << "  accept, reject, swap, conference, separate <leg>,\n";
    std::cerr << "  hangup ringing|fg|bg, hangup-conn <leg>, clear,\n";
    std::cerr << "  expect ringing|fg|bg <STATE> [legs], expect phone <STATE>,\n";
    std::cerr << "  expect-cause <number> <CAUSE>, expect-error <command>, dump\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << prog << " -t gsm demo\n";
    std::cerr << "  " << prog << " replay scenarios/three_way.txt -v\n";
    std::cerr << "\n";
}

void printInfo(const TrackerSettings& settings) {
    TrackerConfig config = settings.toTrackerConfig();
    sim::SimulatedRadio radio(config.technology);
    CallTracker tracker(radio, config);
    const CallProfile& profile = tracker.getProfile();

    std::cout << "=== CallSync ===\n\n";

    std::cout << "Phone:\n";
    std::cout << "  Name:           " << config.phone_name << "\n";
    std::cout << "  Id:             " << config.phone_id << "\n";
    std::cout << "  Technology:     " << callTechnologyToString(profile.technology) << "\n";
    std::cout << "\n";

    std::cout << "Tracker:\n";
    std::cout << "  Leg slots:      " << profile.max_connections << "\n";
    std::cout << "  Legs per call:  " << profile.max_connections_per_call << "\n";
    std::cout << "  Merge by flash: " << (profile.merge_via_flash ? "yes" : "no") << "\n";
    std::cout << "  Separate:       " << (profile.supports_separate ? "yes" : "no") << "\n";
    std::cout << "  Hold:           " << (profile.supports_hold ? "yes" : "no") << "\n";
    std::cout << "\n";

    std::cout << "Logging:\n";
    std::cout << "  Level:          " << logLevelToString(settings.log_level) << "\n";
}

// Each script line runs as one task on the call event loop; a failing line
// faults the loop so nothing after it runs.
int runScript(std::istream& in, const TrackerConfig& config) {
    sim::ScenarioRunner runner(config);
    CallEventLoop loop("replay");
    loop.start();

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        bool queued = loop.post([&runner, line, line_no]() {
            std::string error;
            if (!runner.runLine(line, error)) {
                throw std::runtime_error("line " + std::to_string(line_no) + ": " + error);
            }
        });
        if (!queued) {
            break;
        }
    }

    loop.waitIdle();
    loop.stop();

    for (const auto& event : runner.getEvents()) {
        std::cout << "  " << event << "\n";
    }
    std::cout << "\n" << runner.dump();

    if (auto fault = loop.fault()) {
        try {
            std::rethrow_exception(fault);
        } catch (const std::exception& e) {
            std::cerr << "\nFAILED: " << e.what() << "\n";
        }
        return 1;
    }

    std::cout << "\nOK (" << line_no << " lines)\n";
    return 0;
}

int main(int argc, char* argv[]) {
    const char* command = nullptr;
    const char* input_file = nullptr;
    const char* settings_file = nullptr;
    const char* technology = nullptr;
    bool verbose = false;

    // Options can appear before or after the command
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            settings_file = argv[++i];
        } else if (strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            technology = argv[++i];
        } else if (strcmp(argv[i], "-v") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            // Non-option argument: first is command, second is input file
            if (!command) {
                command = argv[i];
            } else if (!input_file) {
                input_file = argv[i];
            }
        } else {
            std::cerr << "Error: unknown option " << argv[i] << "\n";
            return 1;
        }
    }

    if (!command) {
        printUsage(argv[0]);
        return 1;
    }

    TrackerSettings settings;
    if (settings_file) {
        if (!settings.load(settings_file)) {
            std::cerr << "Error: Cannot open settings file: " << settings_file << "\n";
            return 1;
        }
    } else {
        // The default file is optional
        settings.load();
    }

    if (technology) {
        auto tech = parseCallTechnology(technology);
        if (!tech) {
            std::cerr << "Error: unknown technology: " << technology << "\n";
            return 1;
        }
        settings.technology = *tech;
    }
    if (verbose) {
        settings.log_level = LogLevel::DEBUG;
    }
    settings.applyLogging();

    TrackerConfig config = settings.toTrackerConfig();

    if (strcmp(command, "info") == 0) {
        printInfo(settings);
        return 0;
    } else if (strcmp(command, "demo") == 0) {
        std::cout << "Running " << callTechnologyToString(config.technology) << " demo...\n\n";
        std::istringstream script(sim::demoScript(config.technology));
        return runScript(script, config);
    } else if (strcmp(command, "replay") == 0) {
        if (!input_file) {
            return runScript(std::cin, config);
        }
        std::ifstream file(input_file);
        if (!file) {
            std::cerr << "Error: Cannot open file: " << input_file << "\n";
            return 1;
        }
        return runScript(file, config);
    }

    std::cerr << "Error: unknown command: " << command << "\n";
    printUsage(argv[0]);
    return 1;
}
