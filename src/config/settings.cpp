#include "settings.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sys/stat.h>

namespace callsync {

std::string TrackerSettings::getDefaultPath() {
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/callsync/settings.ini";
    }
    return "settings.ini";
}

// Helper to create directory if it doesn't exist
static void ensureDirectory(const std::string& path) {
    size_t pos = path.find_last_of('/');
    if (pos != std::string::npos) {
        std::string dir = path.substr(0, pos);
        // Create parent directories recursively
        for (size_t i = 0; i < dir.size(); i++) {
            if (dir[i] == '/') {
                std::string subdir = dir.substr(0, i);
                if (!subdir.empty()) {
                    mkdir(subdir.c_str(), 0755);
                }
            }
        }
        mkdir(dir.c_str(), 0755);
    }
}

static std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

static bool parseBool(const std::string& value) {
    return value == "1" || value == "true" || value == "yes";
}

std::optional<CallTechnology> parseCallTechnology(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "cdma") return CallTechnology::CDMA;
    if (lower == "gsm") return CallTechnology::GSM;
    return std::nullopt;
}

// Save settings to INI file
bool TrackerSettings::save(const std::string& path) const {
    std::string filepath = path.empty() ? getDefaultPath() : path;
    ensureDirectory(filepath);

    std::ofstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    std::string tech = technology == CallTechnology::GSM ? "gsm" : "cdma";

    file << "[Phone]\n";
    file << "name=" << phone_name << "\n";
    file << "id=" << phone_id << "\n";
    file << "technology=" << tech << "\n";

    file << "\n[Tracker]\n";
    file << "max_connections=" << max_connections << "\n";
    file << "max_connections_per_call=" << max_connections_per_call << "\n";

    file << "\n[Logging]\n";
    file << "level=" << logLevelToString(log_level) << "\n";
    file << "tracker=" << (log_categories.tracker ? "1" : "0") << "\n";
    file << "call=" << (log_categories.call ? "1" : "0") << "\n";
    file << "radio=" << (log_categories.radio ? "1" : "0") << "\n";
    file << "loop=" << (log_categories.loop ? "1" : "0") << "\n";

    return file.good();
}

// Load settings from INI file. Unknown keys and bad values are skipped.
bool TrackerSettings::load(const std::string& path) {
    std::string filepath = path.empty() ? getDefaultPath() : path;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    std::string section;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }
        if (line[0] == '[') {
            size_t close = line.find(']');
            section = line.substr(1, close == std::string::npos ? std::string::npos : close - 1);
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        if (section == "Phone") {
            if (key == "name") {
                phone_name = value;
            } else if (key == "id") {
                phone_id = static_cast<uint32_t>(std::strtoul(value.c_str(), nullptr, 10));
            } else if (key == "technology") {
                if (auto tech = parseCallTechnology(value)) {
                    technology = *tech;
                } else {
                    LOG_WARN("CONFIG", "Unknown technology '%s', keeping %s",
                             value.c_str(), callTechnologyToString(technology));
                }
            }
        } else if (section == "Tracker") {
            if (key == "max_connections") {
                max_connections = std::strtoul(value.c_str(), nullptr, 10);
            } else if (key == "max_connections_per_call") {
                max_connections_per_call = std::strtoul(value.c_str(), nullptr, 10);
            }
        } else if (section == "Logging") {
            if (key == "level") {
                if (auto level = parseLogLevel(value.c_str())) {
                    log_level = *level;
                } else {
                    LOG_WARN("CONFIG", "Unknown log level '%s'", value.c_str());
                }
            } else if (key == "tracker") {
                log_categories.tracker = parseBool(value);
            } else if (key == "call") {
                log_categories.call = parseBool(value);
            } else if (key == "radio") {
                log_categories.radio = parseBool(value);
            } else if (key == "loop") {
                log_categories.loop = parseBool(value);
            }
        }
    }

    return true;
}

TrackerConfig TrackerSettings::toTrackerConfig() const {
    TrackerConfig config;
    config.technology = technology;
    config.phone_name = phone_name;
    config.phone_id = phone_id;
    config.max_connections = max_connections;
    config.max_connections_per_call = max_connections_per_call;
    return config;
}

void TrackerSettings::applyLogging() const {
    setLogLevel(log_level);
    g_log_categories = log_categories;
}

} // namespace callsync
