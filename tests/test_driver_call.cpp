/**
 * Driver Call Test Suite
 *
 * Driver state mapping, slot policy, fail cause codes and the DriverCall
 * text form used by logs and scenario scripts.
 */

#include "callsync/driver_call.hpp"
#include "callsync/errors.hpp"
#include "tracker/call_tracker.hpp"
#include <iostream>

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

// ============================================================================
// State Mapping
// ============================================================================

bool test_state_mapping() {
    TEST("Driver state -> call state");

    struct { DriverCallState in; CallState out; } cases[] = {
        {DriverCallState::ACTIVE,   CallState::ACTIVE},
        {DriverCallState::HOLDING,  CallState::HOLDING},
        {DriverCallState::DIALING,  CallState::DIALING},
        {DriverCallState::ALERTING, CallState::ALERTING},
        {DriverCallState::INCOMING, CallState::INCOMING},
        {DriverCallState::WAITING,  CallState::WAITING},
    };

    for (const auto& c : cases) {
        if (callStateFromDriverState(c.in) != c.out) {
            FAIL(driverCallStateToString(c.in) << " mapped to "
                 << callStateToString(callStateFromDriverState(c.in)));
        }
    }

    PASS();
    return true;
}

bool test_state_mapping_rejects_unknown() {
    TEST("Unknown driver state is a protocol violation");

    try {
        callStateFromDriverState(static_cast<DriverCallState>(42));
        FAIL("No exception for state 42");
    } catch (const DriverProtocolViolation&) {
    }

    try {
        callSlotFromDriverState(static_cast<DriverCallState>(42));
        FAIL("No exception from slot policy for state 42");
    } catch (const DriverProtocolViolation&) {
    }

    PASS();
    return true;
}

bool test_slot_policy() {
    TEST("Slot policy");

    if (callSlotFromDriverState(DriverCallState::ACTIVE) != CallSlot::FOREGROUND) FAIL("ACTIVE");
    if (callSlotFromDriverState(DriverCallState::DIALING) != CallSlot::FOREGROUND) FAIL("DIALING");
    if (callSlotFromDriverState(DriverCallState::ALERTING) != CallSlot::FOREGROUND) FAIL("ALERTING");
    if (callSlotFromDriverState(DriverCallState::HOLDING) != CallSlot::BACKGROUND) FAIL("HOLDING");
    if (callSlotFromDriverState(DriverCallState::INCOMING) != CallSlot::RINGING) FAIL("INCOMING");
    if (callSlotFromDriverState(DriverCallState::WAITING) != CallSlot::RINGING) FAIL("WAITING");

    PASS();
    return true;
}

bool test_fail_cause_codes() {
    TEST("Fail cause codes");

    if (disconnectCauseFromFailCode(16) != DisconnectCause::NORMAL) FAIL("16");
    if (disconnectCauseFromFailCode(17) != DisconnectCause::BUSY) FAIL("17");
    if (disconnectCauseFromFailCode(1) != DisconnectCause::INVALID_NUMBER) FAIL("1");
    for (int code : {34, 41, 42, 44, 49, 58, 1003}) {
        if (disconnectCauseFromFailCode(code) != DisconnectCause::CONGESTION) {
            FAIL("Code " << code << " is not congestion");
        }
    }
    if (disconnectCauseFromFailCode(1001) != DisconnectCause::OUT_OF_SERVICE) FAIL("1001");
    if (disconnectCauseFromFailCode(0) != DisconnectCause::ERROR_UNSPECIFIED) FAIL("0");
    if (disconnectCauseFromFailCode(65535) != DisconnectCause::ERROR_UNSPECIFIED) FAIL("65535");

    PASS();
    return true;
}

// ============================================================================
// Text Form
// ============================================================================

bool test_parse_full_line() {
    TEST("Parse full line");

    auto dc = DriverCall::parse("3 WAITING mt mpty data +15551234");
    if (!dc) FAIL("Valid line rejected");
    if (dc->index != 3) FAIL("Index " << dc->index);
    if (dc->state != DriverCallState::WAITING) FAIL("State");
    if (!dc->is_mt) FAIL("Direction");
    if (!dc->is_mpty) FAIL("Multiparty flag");
    if (dc->is_voice) FAIL("Data flag");
    if (dc->number != "+15551234") FAIL("Number '" << dc->number << "'");

    PASS();
    return true;
}

bool test_parse_minimal_line() {
    TEST("Parse minimal line");

    auto dc = DriverCall::parse("1 DIALING mo");
    if (!dc) FAIL("Valid line rejected");
    if (dc->is_mt || dc->is_mpty || !dc->is_voice) FAIL("Flags not defaulted");
    if (!dc->number.empty()) FAIL("Unexpected number");

    PASS();
    return true;
}

bool test_parse_rejects_malformed() {
    TEST("Malformed lines rejected");

    const char* bad[] = {
        "",
        "1",
        "1 ACTIVE",
        "0 ACTIVE mo",
        "-2 ACTIVE mo",
        "1 RINGING mo",
        "1 active mo",
        "1 ACTIVE sideways",
        "x ACTIVE mo",
        "1 ACTIVE mo 555 666",
    };

    for (const char* line : bad) {
        if (DriverCall::parse(line)) {
            FAIL("Accepted '" << line << "'");
        }
    }

    PASS();
    return true;
}

bool test_to_string_parses_back() {
    TEST("toString output parses back");

    DriverCall dc;
    dc.index = 2;
    dc.state = DriverCallState::HOLDING;
    dc.is_mt = true;
    dc.is_mpty = true;
    dc.is_voice = false;
    dc.number = "5550100";

    if (dc.toString() != "2 HOLDING mt mpty data 5550100") {
        FAIL("Got '" << dc.toString() << "'");
    }

    auto parsed = DriverCall::parse(dc.toString());
    if (!parsed || *parsed != dc) FAIL("Round trip changed the call");

    PASS();
    return true;
}

bool test_equality() {
    TEST("Equality compares every field");

    DriverCall a = *DriverCall::parse("1 ACTIVE mo 5551000");
    DriverCall b = a;
    if (a != b) FAIL("Copies differ");

    b.is_mpty = true;
    if (a == b) FAIL("Multiparty flag ignored");

    b = a;
    b.number = "5551001";
    if (a == b) FAIL("Number ignored");

    PASS();
    return true;
}

int main() {
    std::cout << "=== Driver Call Test Suite ===\n\n";

    std::cout << "State Mapping:\n";
    test_state_mapping();
    test_state_mapping_rejects_unknown();
    test_slot_policy();
    test_fail_cause_codes();

    std::cout << "\nText Form:\n";
    test_parse_full_line();
    test_parse_minimal_line();
    test_parse_rejects_malformed();
    test_to_string_parses_back();
    test_equality();

    std::cout << "\n=== Results: " << tests_passed << "/" << tests_run << " passed ===\n";

    return (tests_passed == tests_run) ? 0 : 1;
}
