/**
 * Settings Test Suite
 *
 * INI save/load, tolerance of unknown or bad entries, and conversion to
 * tracker configuration and logger settings.
 */

#include "config/settings.hpp"
#include "callsync/logging.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

using namespace callsync;

// Test counters
static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) \
    do { std::cout << "  Testing " << name << "... " << std::flush; tests_run++; } while(0)

#define PASS() \
    do { std::cout << "PASS\n"; tests_passed++; } while(0)

#define FAIL(msg) \
    do { std::cout << "FAIL: " << msg << "\n"; return false; } while(0)

static const std::string TEST_FILE = "/tmp/callsync_test_settings.ini";

static void writeFile(const std::string& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

bool test_defaults() {
    TEST("Defaults");

    TrackerSettings settings;
    if (settings.technology != CallTechnology::CDMA) FAIL("Technology");
    if (settings.max_connections != 0 || settings.max_connections_per_call != 0) FAIL("Limits");
    if (settings.log_level != LogLevel::INFO) FAIL("Log level");

    PASS();
    return true;
}

bool test_save_load() {
    TEST("Save and load");

    TrackerSettings out;
    out.phone_name = "bench-2";
    out.phone_id = 7;
    out.technology = CallTechnology::GSM;
    out.max_connections_per_call = 3;
    out.log_level = LogLevel::DEBUG;
    out.log_categories.call = false;
    out.log_categories.loop = true;

    if (!out.save(TEST_FILE)) FAIL("Save failed");

    TrackerSettings in;
    if (!in.load(TEST_FILE)) FAIL("Load failed");
    std::remove(TEST_FILE.c_str());

    if (in.phone_name != "bench-2") FAIL("Name '" << in.phone_name << "'");
    if (in.phone_id != 7) FAIL("Id");
    if (in.technology != CallTechnology::GSM) FAIL("Technology");
    if (in.max_connections != 0) FAIL("max_connections");
    if (in.max_connections_per_call != 3) FAIL("max_connections_per_call");
    if (in.log_level != LogLevel::DEBUG) FAIL("Log level");
    if (in.log_categories.call || !in.log_categories.loop || !in.log_categories.tracker) {
        FAIL("Log categories");
    }

    PASS();
    return true;
}

bool test_missing_file() {
    TEST("Missing file leaves defaults");

    TrackerSettings settings;
    if (settings.load("/tmp/callsync_no_such_dir/settings.ini")) FAIL("Load reported success");
    if (settings.phone_name != "phone0") FAIL("Defaults changed");

    PASS();
    return true;
}

bool test_bad_entries_skipped() {
    TEST("Unknown keys and bad values are skipped");

    writeFile(TEST_FILE,
        "# hand edited\n"
        "[Phone]\n"
        "  name = lab phone \n"
        "technology=lte\n"
        "colour=blue\n"
        "\n"
        "[Radio]\n"
        "name=ignored\n"
        "\n"
        "[Tracker]\n"
        "max_connections=4\n"
        "\n"
        "[Logging]\n"
        "level=loud\n"
        "radio=no\n");

    TrackerSettings settings;
    settings.technology = CallTechnology::GSM;
    if (!settings.load(TEST_FILE)) FAIL("Load failed");
    std::remove(TEST_FILE.c_str());

    if (settings.phone_name != "lab phone") FAIL("Name '" << settings.phone_name << "'");
    if (settings.technology != CallTechnology::GSM) FAIL("Bad technology replaced the old one");
    if (settings.max_connections != 4) FAIL("max_connections");
    if (settings.log_level != LogLevel::INFO) FAIL("Bad level applied");
    if (settings.log_categories.radio) FAIL("radio=no not applied");

    PASS();
    return true;
}

bool test_parse_technology() {
    TEST("Technology names");

    if (parseCallTechnology("cdma") != CallTechnology::CDMA) FAIL("cdma");
    if (parseCallTechnology("GSM") != CallTechnology::GSM) FAIL("GSM");
    if (parseCallTechnology("Gsm") != CallTechnology::GSM) FAIL("Gsm");
    if (parseCallTechnology("umts")) FAIL("umts accepted");
    if (parseCallTechnology("")) FAIL("empty accepted");

    PASS();
    return true;
}

bool test_tracker_config() {
    TEST("Tracker configuration from settings");

    TrackerSettings settings;
    settings.phone_name = "bench";
    settings.phone_id = 3;
    settings.technology = CallTechnology::GSM;
    settings.max_connections_per_call = 4;

    TrackerConfig config = settings.toTrackerConfig();
    if (config.technology != CallTechnology::GSM) FAIL("Technology");
    if (config.phone_name != "bench" || config.phone_id != 3) FAIL("Phone");
    if (config.max_connections != 0) FAIL("max_connections");
    if (config.max_connections_per_call != 4) FAIL("max_connections_per_call");

    PASS();
    return true;
}

bool test_apply_logging() {
    TEST("Logger settings applied");

    TrackerSettings settings;
    settings.log_level = LogLevel::ERROR;
    settings.log_categories.tracker = false;
    settings.applyLogging();

    bool ok = g_log_level == LogLevel::ERROR && !g_log_categories.tracker;

    g_log_categories = LogCategories{};
    setLogLevel(LogLevel::NONE);

    if (!ok) FAIL("Not applied");

    PASS();
    return true;
}

int main() {
    setLogLevel(LogLevel::NONE);

    std::cout << "=== Settings Test Suite ===\n\n";

    test_defaults();
    test_save_load();
    test_missing_file();
    test_bad_entries_skipped();
    test_parse_technology();
    test_tracker_config();
    test_apply_logging();

    std::cout << "\n=== Results: " << tests_passed << "/" << tests_run << " passed ===\n";

    return (tests_passed == tests_run) ? 0 : 1;
}
