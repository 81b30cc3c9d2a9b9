#pragma once

#include "tracker/call_tracker.hpp"
#include "callsync/logging.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace callsync {

// Settings that persist across sessions
struct TrackerSettings {
    // Save/load to file
    bool save(const std::string& path = "") const;
    bool load(const std::string& path = "");

    // Get default settings file path
    static std::string getDefaultPath();

    // Phone
    std::string phone_name = "phone0";
    uint32_t phone_id = 0;
    CallTechnology technology = CallTechnology::CDMA;

    // Tracker limits (0 = technology default)
    size_t max_connections = 0;
    size_t max_connections_per_call = 0;

    // Logging
    LogLevel log_level = LogLevel::INFO;
    LogCategories log_categories;

    TrackerConfig toTrackerConfig() const;

    // Install log level and category enables as the process-wide logger settings
    void applyLogging() const;
};

// "cdma" / "gsm" (case-insensitive)
std::optional<CallTechnology> parseCallTechnology(const std::string& name);

} // namespace callsync
