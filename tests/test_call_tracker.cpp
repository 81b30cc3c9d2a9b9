/**
 * Call Tracker Test Suite
 *
 * Feeds hand-written poll results into a CallTracker and checks the
 * resulting calls, disconnect causes, notifications and the commands the
 * tracker sends to the radio. The radio is a recorder: nothing is answered
 * unless the test does it.
 */

#include "tracker/call_tracker.hpp"
#include "callsync/errors.hpp"
#include "callsync/logging.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

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
// Recording radio
// ============================================================================

class RecordingRadio : public IRadioLink {
public:
    std::vector<std::string> commands;
    uint32_t last_token = 0;
    int polls = 0;
    int fail_cause_requests = 0;

    void getCurrentCalls(uint32_t poll_token) override { last_token = poll_token; polls++; }
    void getLastCallFailCause() override { fail_cause_requests++; }
    void dial(const std::string& address) override { commands.push_back("dial " + address); }
    void acceptCall() override { commands.push_back("accept"); }
    void rejectCall() override { commands.push_back("reject"); }
    void hangupConnection(int index) override { commands.push_back("hangup " + std::to_string(index)); }
    void hangupWaitingOrBackground() override { commands.push_back("hangup-waiting-or-background"); }
    void hangupForegroundResumeBackground() override { commands.push_back("hangup-foreground-resume-background"); }
    void switchWaitingOrHoldingAndActive() override { commands.push_back("switch"); }
    void conference() override { commands.push_back("conference"); }
    void separateConnection(int index) override { commands.push_back("separate " + std::to_string(index)); }
    void sendFlash(const std::string& feature_code) override { commands.push_back("flash " + feature_code); }

    bool sent(const std::string& command) const {
        for (const auto& c : commands) {
            if (c == command) return true;
        }
        return false;
    }
};

static TrackerConfig config(CallTechnology technology) {
    TrackerConfig cfg;
    cfg.technology = technology;
    cfg.phone_name = "test";
    return cfg;
}

static std::vector<DriverCall> snapshot(const std::vector<std::string>& lines) {
    std::vector<DriverCall> calls;
    for (const auto& line : lines) {
        calls.push_back(*DriverCall::parse(line));
    }
    return calls;
}

// Answer the tracker's latest poll
static void feed(CallTracker& tracker, RecordingRadio& radio, const std::vector<std::string>& lines) {
    tracker.onPollResult(radio.last_token, snapshot(lines));
}

// Dial and let the radio confirm the leg as index 1, answered
static ConnectionId establishCall(CallTracker& tracker, RecordingRadio& radio, const std::string& number) {
    ConnectionId id = tracker.dial(number);
    feed(tracker, radio, {"1 DIALING mo " + number});
    feed(tracker, radio, {"1 ACTIVE mo " + number});
    return id;
}

// ============================================================================
// Poll Diff
// ============================================================================

bool test_incoming_leg_rings() {
    TEST("New incoming leg lands in the ringing call");

    RecordingRadio radio;
    CallTracker tracker(radio, config(CallTechnology::CDMA));

    std::vector<std::string> rang;
    tracker.setNewRingingConnectionCallback([&rang](const Connection& conn) {
        rang.push_back(conn.getAddress());
    });

    tracker.onCallStateChanged();
    feed(tracker, radio, {"1 INCOMING mt 5557000"});

    if (rang.size() != 1 || rang[0] != "5557000") FAIL("Ringing callback not fired once");
    if (tracker.getRingingCall().getState() != CallState::INCOMING) FAIL("Ringing call state");
    if (tracker.getPhoneState() != PhoneState::RINGING) FAIL("Phone not RINGING");

    const Connection* conn = tracker.getRingingCall().getLatestConnection();
    if (!conn->isIncoming() || conn->getIndex() != 1) FAIL("Leg identity");

    PASS();
    return true;
}

bool test_dial_matches_pending_leg() {
    TEST("Dialed leg is matched to the reported leg");

    RecordingRadio radio;
    CallTracker tracker(radio, config(CallTechnology::CDMA));

    ConnectionId id = tracker.dial("5551000");
    if (!radio.sent("dial 5551000")) FAIL("Dial not sent");
    if (!tracker.hasPendingDial()) FAIL("No pending dial");
    if (tracker.getForegroundCall().getState() != CallState::DIALING) FAIL("Foreground not DIALING");
    if (tracker.getPhoneState() != PhoneState::OFFHOOK) FAIL("Phone not OFFHOOK");

    // The network may reformat the number
    feed(tracker, radio, {"1 DIALING mo +15551000"});

    const Connection* conn = tracker.findConnection(id);
    if (!conn) FAIL("Pending leg lost");
    if (conn->getIndex() != 1) FAIL("Index not assigned");
    if (conn->getAddress() != "+15551000") FAIL("Address not updated");
    if (tracker.hasPendingDial()) FAIL("Still pending");
    if (tracker.getForegroundCall().getConnections().size() != 1) FAIL("Duplicate leg created");

    feed(tracker, radio, {"1 ALERTING mo +15551000"});
    if (tracker.getForegroundCall().getState() != CallState::ALERTING) FAIL("Not ALERTING");
    feed(tracker, radio, {"1 ACTIVE mo +15551000"});
    if (tracker.getForegroundCall().getState() != CallState::ACTIVE) FAIL("Not ACTIVE");
    if (!tracker.findConnection(id)->wasConnected()) FAIL("Not marked connected");

    PASS();
    return true;
}

bool test_dial_without_leg_uses_fail_cause() {
    TEST("Dial the radio never reports takes the fail cause");

    RecordingRadio radio;
    CallTracker tracker(radio, config(CallTechnology::CDMA));

    ConnectionId id = tracker.dial("5551000");
    feed(tracker, radio, {});

    if (tracker.hasPendingDial()) FAIL("Pending dial kept");
    if (radio.fail_cause_requests != 1) FAIL("Fail cause not requested");
    if (!tracker.isAwaitingFailCause()) FAIL("Not awaiting fail cause");

    tracker.onLastCallFailCause(17);

    const Connection* conn = tracker.findConnection(id);
    if (!conn || conn->getDisconnectCause() != DisconnectCause::BUSY) FAIL("Cause not BUSY");
    if (tracker.getForegroundCall().getState() != CallState::DISCONNECTED) FAIL("Foreground not DISCONNECTED");
    if (tracker.getPhoneState() != PhoneState::IDLE) FAIL("Phone not IDLE");

    PASS();
    return true;
}

bool test_local_hangup_is_local() {
    TEST("Leg dropped after local hangup is LOCAL");

    RecordingRadio radio;
    CallTracker tracker(radio, config(CallTechnology::CDMA));
    ConnectionId id = establishCall(tracker, radio, "5551000");

    tracker.hangup(tracker.getForegroundCall());
    if (!radio.sent("hangup-foreground-resume-background")) FAIL("Hangup not sent");
    if (tracker.getForegroundCall().getState() != CallState::DISCONNECTING) FAIL("Not DISCONNECTING");

    feed(tracker, radio, {});

    if (radio.fail_cause_requests != 0) FAIL("Fail cause requested for a local hangup");
    if (tracker.findConnection(id)->getDisconnectCause() != DisconnectCause::LOCAL) FAIL("Cause not LOCAL");
    if (tracker.getForegroundCall().getState() != CallState::DISCONNECTED) FAIL("Not DISCONNECTED");
    if (tracker.getPhoneState() != PhoneState::IDLE) FAIL("Phone not IDLE");

    // Swept by the next explicit clear
    tracker.clearDisconnected();
    if (tracker.getForegroundCall().getState() != CallState::IDLE) FAIL("Not swept");

    PASS();
    return true;
}

bool test_remote_hangup_uses_fail_cause() {
    TEST("Remote hangup waits for the fail cause");

    RecordingRadio radio;
    CallTracker tracker(radio, config(CallTechnology::CDMA));
    ConnectionId id = establishCall(tracker, radio, "5551000");

    std::vector<DisconnectCause> causes;
    tracker.setDisconnectCallback([&causes](const Connection& conn) {
        causes.push_back(conn.getDisconnectCause());
    });

    feed(tracker, radio, {});
    if (!causes.empty()) FAIL("Disconnected before the cause arrived");
    if (tracker.getForegroundCall().getState() != CallState::ACTIVE) FAIL("Call ended early");

    tracker.onLastCallFailCause(16);
    if (causes.size() != 1 || causes[0] != DisconnectCause::NORMAL) FAIL("Cause not NORMAL");
    if (tracker.findConnection(id)->getState() != CallState::DISCONNECTED) FAIL("Leg not DISCONNECTED");

    PASS();
    return true;
}

bool test_incoming_missed_and_rejected() {
    TEST("Unanswered incoming legs are MISSED or REJECTED");

    RecordingRadio radio;
    CallTracker tracker(radio, config(CallTechnology::GSM));

    std::vector<PhoneState> phone;
    tracker.setPhoneStateChangedCallback([&phone](PhoneState state) { phone.push_back(state); });

    tracker.pollCalls();
    feed(tracker, radio, {"1 INCOMING mt 5557000"});
    ConnectionId missed = tracker.getRingingCall().getLatestConnection()->getId();
    feed(tracker, radio, {});

    if (tracker.findConnection(missed)->getDisconnectCause() != DisconnectCause::INCOMING_MISSED) {
        FAIL("First call not MISSED");
    }
    if (phone.size() != 2 || phone[0] != PhoneState::RINGING || phone[1] != PhoneState::IDLE) {
        FAIL("Phone state sequence");
    }

    tracker.pollCalls();
    feed(tracker, radio, {"1 INCOMING mt 5557001"});
    ConnectionId rejected = tracker.getRingingCall().getLatestConnection()->getId();
    if (tracker.findConnection(missed)) FAIL("Old ringing leg not swept by new ring");

    tracker.rejectCall();
    if (!radio.sent("reject")) FAIL("Reject not sent");
    feed(tracker, radio, {});

    if (tracker.findConnection(rejected)->getDisconnectCause() != DisconnectCause::INCOMING_REJECTED) {
        FAIL("Second call not REJECTED");
    }
    if (radio.fail_cause_requests != 0) FAIL("Fail cause requested");

    PASS();
    return true;
}

bool test_stale_poll_ignored() {
    TEST("Stale poll results are ignored");

    RecordingRadio radio;
    CallTracker tracker(radio, config(CallTechnology::CDMA));

    tracker.pollCalls();
    uint32_t stale = radio.last_token;
    tracker.pollCalls();
    if (radio.last_token == stale) FAIL("Token not advanced");

    tracker.onPollResult(stale, snapshot({"1 INCOMING mt 5557000"}));
    if (tracker.getRingingCall().hasConnections()) FAIL("Stale result applied");

    feed(tracker, radio, {"1 INCOMING mt 5557000"});
    if (!tracker.getRingingCall().hasConnections()) FAIL("Current result not applied");

    PASS();
    return true;
}

bool test_bad_snapshot_leaves_tracker_untouched() {
    TEST("Malformed snapshot is rejected before any change");

    RecordingRadio radio;
    CallTracker tracker(radio, config(CallTechnology::CDMA));
    ConnectionId id = establishCall(tracker, radio, "5551000");

    std::vector<std::vector<DriverCall>> bad;

    // Unknown state
    auto unknown = snapshot({"1 HOLDING mo 5551000", "2 INCOMING mt 5557000"});
    unknown[1].state = static_cast<DriverCallState>(42);
    bad.push_back(unknown);

    // Duplicate index
    bad.push_back(snapshot({"1 HOLDING mo 5551000", "1 ACTIVE mo 5551000"}));

    // Index outside the leg table
    bad.push_back(snapshot({"9 INCOMING mt 5557000"}));
    auto zero = snapshot({"1 INCOMING mt 5557000"});
    zero[0].index = 0;
    bad.push_back(zero);

    for (const auto& calls : bad) {
        tracker.pollCalls();
        try {
            tracker.onPollResult(radio.last_token, calls);
            FAIL("No exception");
        } catch (const DriverProtocolViolation&) {
        }

        if (tracker.getForegroundCall().getState() != CallState::ACTIVE) FAIL("Foreground changed");
        if (tracker.getRingingCall().hasConnections()) FAIL("Ringing call changed");
        if (tracker.getBackgroundCall().hasConnections()) FAIL("Background call changed");
        const Connection* conn = tracker.findConnection(id);
        if (!conn || conn->getLastDriverCall()->state != DriverCallState::ACTIVE) FAIL("Leg snapshot changed");
    }

    PASS();
    return true;
}

bool test_leg_moves_between_calls() {
    TEST("Held leg moves to the background call");

    RecordingRadio radio;
    CallTracker tracker(radio, config(CallTechnology::GSM));
    ConnectionId id = establishCall(tracker, radio, "5551000");

    feed(tracker, radio, {"1 HOLDING mo 5551000"});

    if (tracker.getForegroundCall().getState() != CallState::IDLE) FAIL("Foreground not IDLE");
    if (tracker.getBackgroundCall().getState() != CallState::HOLDING) FAIL("Background not HOLDING");
    if (!tracker.getBackgroundCall().hasConnection(id)) FAIL("Leg identity lost in the move");
    if (tracker.findConnection(id)->getOwner() != CallSlot::BACKGROUND) FAIL("Owner not updated");

    PASS();
    return true;
}

bool test_conference_leg_drop() {
    TEST("Leg leaving a conference detaches, call lives on");

    RecordingRadio radio;
    CallTracker tracker(radio, config(CallTechnology::GSM));

    tracker.pollCalls();
    feed(tracker, radio, {"1 ACTIVE mo mpty 5551000", "2 ACTIVE mo mpty 5552000"});
    if (tracker.getForegroundCall().getConnections().size() != 2) FAIL("Conference not built");
    ConnectionId leaving = tracker.getForegroundCall().getEarliestConnection()->getId();

    feed(tracker, radio, {"2 ACTIVE mo 5552000"});
    tracker.onLastCallFailCause(16);

    const ICall& fg = tracker.getForegroundCall();
    if (fg.getState() != CallState::ACTIVE) FAIL("Foreground state " << fg.toString());
    if (fg.getConnections().size() != 1) FAIL("Leaving leg still attached");
    if (fg.hasConnection(leaving)) FAIL("Wrong leg detached");

    PASS();
    return true;
}

bool test_deferred_hangup_of_pending_dial() {
    TEST("Hangup of a dial not yet reported is deferred");

    RecordingRadio radio;
    CallTracker tracker(radio, config(CallTechnology::CDMA));

    ConnectionId id = tracker.dial("5551000");
    tracker.hangup(id);
    if (radio.sent("hangup 1")) FAIL("Hangup sent before the index was known");
    if (tracker.findConnection(id)->getState() != CallState::DISCONNECTING) FAIL("Leg not DISCONNECTING");

    int polls = radio.polls;
    feed(tracker, radio, {"1 DIALING mo 5551000"});
    if (!radio.sent("hangup 1")) FAIL("Deferred hangup not sent");
    if (radio.polls != polls + 1) FAIL("No follow-up poll after deferred hangup");

    feed(tracker, radio, {});
    if (tracker.findConnection(id)->getDisconnectCause() != DisconnectCause::LOCAL) FAIL("Cause not LOCAL");
    if (tracker.getForegroundCall().getState() != CallState::DISCONNECTED) FAIL("Not DISCONNECTED");

    PASS();
    return true;
}

bool test_dial_collision_with_incoming() {
    TEST("Incoming call replacing our dialing leg");

    RecordingRadio radio;
    CallTracker tracker(radio, config(CallTechnology::GSM));

    ConnectionId mo = tracker.dial("5551000");
    feed(tracker, radio, {"1 DIALING mo 5551000"});
    feed(tracker, radio, {"1 INCOMING mt 5557000"});

    if (!tracker.getRingingCall().isRinging()) FAIL("Incoming call not ringing");
    if (tracker.getRingingCall().getLatestConnection()->getId() == mo) FAIL("Leg identity reused");

    tracker.onLastCallFailCause(34);
    if (tracker.findConnection(mo)->getDisconnectCause() != DisconnectCause::CONGESTION) FAIL("Cause not CONGESTION");

    PASS();
    return true;
}

bool test_outgoing_leg_replaces_incoming() {
    TEST("Outgoing call replacing a tracked incoming leg");

    RecordingRadio radio;
    CallTracker tracker(radio, config(CallTechnology::GSM));

    std::vector<DisconnectCause> causes;
    tracker.setDisconnectCallback([&causes](const Connection& conn) {
        causes.push_back(conn.getDisconnectCause());
    });

    tracker.pollCalls();
    feed(tracker, radio, {"1 INCOMING mt 5557000"});
    ConnectionId incoming = tracker.getRingingCall().getLatestConnection()->getId();

    feed(tracker, radio, {"1 DIALING mo 5551000"});

    if (causes.size() != 1 || causes[0] != DisconnectCause::INCOMING_MISSED) FAIL("Incoming leg not MISSED");
    if (tracker.findConnection(incoming)) FAIL("Incoming leg kept");
    if (tracker.getRingingCall().getState() != CallState::IDLE) FAIL("Ringing not IDLE");

    const Connection* conn = tracker.getForegroundCall().getLatestConnection();
    if (!conn || conn->isIncoming() || conn->getIndex() != 1) FAIL("Outgoing leg not tracked");
    if (conn->getAddress() != "5551000") FAIL("Address '" << conn->getAddress() << "'");
    if (tracker.getForegroundCall().getState() != CallState::DIALING) FAIL("Foreground not DIALING");
    if (radio.fail_cause_requests != 0) FAIL("Fail cause requested");

    PASS();
    return true;
}

// ============================================================================
// Commands
// ============================================================================

bool test_illegal_commands() {
    TEST("Illegal commands throw");

    RecordingRadio radio;
    CallTracker tracker(radio, config(CallTechnology::CDMA));

    auto throwsState = [](auto fn) {
        try {
            fn();
        } catch (const CallStateException&) {
            return true;
        }
        return false;
    };

    if (!throwsState([&] { tracker.acceptCall(); })) FAIL("accept while idle");
    if (!throwsState([&] { tracker.rejectCall(); })) FAIL("reject while idle");
    if (!throwsState([&] { tracker.conference(); })) FAIL("conference while idle");
    if (!throwsState([&] { tracker.hangup(tracker.getBackgroundCall()); })) FAIL("hangup of empty call");
    if (!throwsState([&] { tracker.hangup(ConnectionId(99)); })) FAIL("hangup of unknown leg");

    try {
        tracker.dial("");
        FAIL("Empty address accepted");
    } catch (const std::invalid_argument&) {
    }

    tracker.pollCalls();
    feed(tracker, radio, {"1 INCOMING mt 5557000"});
    if (!throwsState([&] { tracker.dial("5551000"); })) FAIL("dial while ringing");
    if (!throwsState([&] { tracker.switchWaitingOrHoldingAndActive(); })) FAIL("switch while incoming");
    if (!throwsState([&] { tracker.separate(tracker.getRingingCall().getLatestConnection()->getId()); })) {
        FAIL("separate on CDMA");
    }
    if (!radio.commands.empty()) FAIL("Radio received a command: " << radio.commands[0]);

    PASS();
    return true;
}

bool test_gsm_dial_holds_active_call() {
    TEST("GSM dial puts the active call on hold");

    RecordingRadio radio;
    CallTracker tracker(radio, config(CallTechnology::GSM));
    ConnectionId first = establishCall(tracker, radio, "5551000");

    ConnectionId second = tracker.dial("5552000");
    if (radio.commands.size() < 2 || radio.commands[radio.commands.size() - 2] != "switch") {
        FAIL("Switch not sent before dial");
    }
    if (!tracker.getBackgroundCall().hasConnection(first)) FAIL("First call not moved to background");
    if (tracker.getBackgroundCall().getState() != CallState::HOLDING) FAIL("Background not HOLDING");

    feed(tracker, radio, {"1 HOLDING mo 5551000", "2 DIALING mo 5552000"});
    if (tracker.findConnection(second)->getIndex() != 2) FAIL("Second leg not matched");
    if (tracker.getBackgroundCall().getConnections().size() != 1) FAIL("Background leg count");

    // Both calls in use: no third dial
    try {
        tracker.dial("5553000");
        FAIL("Third dial accepted");
    } catch (const CallStateException&) {
    }

    PASS();
    return true;
}

bool test_gsm_conference_and_separate() {
    TEST("GSM conference and separate follow the radio");

    RecordingRadio radio;
    CallTracker tracker(radio, config(CallTechnology::GSM));

    tracker.pollCalls();
    feed(tracker, radio, {"1 HOLDING mo 5551000", "2 ACTIVE mo 5552000"});
    if (!tracker.canConference()) FAIL("Cannot conference");

    tracker.conference();
    if (!radio.sent("conference")) FAIL("Conference not sent");
    // Nothing moves until the radio reports it
    if (tracker.getBackgroundCall().getConnections().size() != 1) FAIL("Moved early");

    feed(tracker, radio, {"1 ACTIVE mo mpty 5551000", "2 ACTIVE mo mpty 5552000"});
    if (tracker.getForegroundCall().getConnections().size() != 2) FAIL("Not merged");
    if (tracker.getBackgroundCall().getState() != CallState::IDLE) FAIL("Background not IDLE");

    const Connection* first = nullptr;
    for (const auto& conn : tracker.getForegroundCall().getConnections()) {
        if (conn.getIndex() == 1) first = &conn;
    }
    tracker.separate(first->getId());
    if (!radio.sent("separate 1")) FAIL("Separate not sent");

    feed(tracker, radio, {"1 ACTIVE mo 5551000", "2 HOLDING mo 5552000"});
    if (tracker.getForegroundCall().getConnections().size() != 1) FAIL("Foreground leg count");
    if (tracker.getBackgroundCall().getState() != CallState::HOLDING) FAIL("Background not HOLDING");

    PASS();
    return true;
}

bool test_cdma_three_way() {
    TEST("CDMA three-way dial by flash");

    RecordingRadio radio;
    CallTracker tracker(radio, config(CallTechnology::CDMA));
    establishCall(tracker, radio, "5551000");

    ConnectionId party = tracker.dial("5552000");
    if (!radio.sent("flash 5552000")) FAIL("Flash not sent");
    if (radio.sent("dial 5552000")) FAIL("Dial sent for a three-way party");
    if (tracker.getForegroundCall().getConnections().size() != 2) FAIL("Party not attached");
    if (tracker.canDial()) FAIL("Dial allowed during three-way setup");

    tracker.onFlashResult(true);
    if (!tracker.findConnection(party)->wasConnected()) FAIL("Party not connected");

    // The radio still reports a single leg
    feed(tracker, radio, {"1 ACTIVE mo 5551000"});
    if (tracker.getForegroundCall().getState() != CallState::ACTIVE) FAIL("Foreground not ACTIVE");
    if (tracker.getForegroundCall().getConnections().size() != 2) FAIL("Party lost");
    if (!tracker.getForegroundCall().isMultiparty()) FAIL("Not multiparty");

    // Dropping the reported leg ends the whole call
    feed(tracker, radio, {});
    tracker.onLastCallFailCause(16);
    if (tracker.getForegroundCall().getState() != CallState::DISCONNECTED) FAIL("Not DISCONNECTED");
    if (tracker.getForegroundCall().getConnections().size() != 2) FAIL("Leg count after drop");
    if (tracker.findConnection(party)->getDisconnectCause() != DisconnectCause::NORMAL) FAIL("Party cause");

    PASS();
    return true;
}

bool test_cdma_three_way_flash_failure() {
    TEST("CDMA three-way flash failure drops the party");

    RecordingRadio radio;
    CallTracker tracker(radio, config(CallTechnology::CDMA));
    establishCall(tracker, radio, "5551000");

    ConnectionId party = tracker.dial("5552000");
    std::vector<ConnectionId> dropped;
    tracker.setDisconnectCallback([&dropped](const Connection& conn) { dropped.push_back(conn.getId()); });

    tracker.onFlashResult(false);
    if (dropped.size() != 1 || dropped[0] != party) FAIL("Party not disconnected");
    if (tracker.getForegroundCall().hasConnection(party)) FAIL("Party still attached");

    feed(tracker, radio, {"1 ACTIVE mo 5551000"});
    if (tracker.getForegroundCall().getState() != CallState::ACTIVE) FAIL("Foreground not ACTIVE");
    if (!tracker.canDial()) FAIL("Cannot retry");

    PASS();
    return true;
}

bool test_cdma_accept_waiting() {
    TEST("CDMA waiting call accepted by flash");

    RecordingRadio radio;
    CallTracker tracker(radio, config(CallTechnology::CDMA));
    establishCall(tracker, radio, "5551000");

    feed(tracker, radio, {"1 ACTIVE mo 5551000", "2 WAITING mt 5557000"});
    if (tracker.getRingingCall().getState() != CallState::WAITING) FAIL("Not WAITING");
    ConnectionId waiting = tracker.getRingingCall().getLatestConnection()->getId();

    tracker.acceptCall();
    if (!radio.sent("flash ")) FAIL("Empty flash not sent");
    if (tracker.getRingingCall().getState() != CallState::IDLE) FAIL("Ringing not IDLE");
    if (!tracker.getForegroundCall().hasConnection(waiting)) FAIL("Waiting leg not in foreground");
    if (tracker.findConnection(waiting)->hasIndex()) FAIL("Merged leg kept its index");
    if (tracker.getPhoneState() != PhoneState::OFFHOOK) FAIL("Phone not OFFHOOK");

    // The network stops reporting the waiting leg; nothing drops
    feed(tracker, radio, {"1 ACTIVE mo 5551000"});
    if (tracker.getForegroundCall().getConnections().size() != 2) FAIL("Merged leg dropped");
    if (radio.fail_cause_requests != 0) FAIL("Fail cause requested");

    PASS();
    return true;
}

bool test_cdma_accept_waiting_after_party_left() {
    TEST("CDMA waiting call accepted after the other party left");

    RecordingRadio radio;
    CallTracker tracker(radio, config(CallTechnology::CDMA));
    ConnectionId first = establishCall(tracker, radio, "5551000");

    feed(tracker, radio, {"1 ACTIVE mo 5551000", "2 WAITING mt 5557000"});
    ConnectionId waiting = tracker.getRingingCall().getLatestConnection()->getId();

    // The foreground party hangs up before the user answers
    feed(tracker, radio, {"2 WAITING mt 5557000"});
    tracker.onLastCallFailCause(16);
    if (tracker.findConnection(first)->getDisconnectCause() != DisconnectCause::NORMAL) FAIL("First call cause");

    radio.commands.clear();
    tracker.acceptCall();
    if (radio.sent("flash ")) FAIL("Flash sent with no call to flash against");
    if (!radio.sent("accept")) FAIL("Plain accept not sent");
    if (tracker.getForegroundCall().hasConnection(waiting)) FAIL("Waiting leg merged locally");

    feed(tracker, radio, {"2 ACTIVE mt 5557000"});
    const ICall& fg = tracker.getForegroundCall();
    if (fg.getState() != CallState::ACTIVE) FAIL("Foreground " << fg.toString());
    if (fg.getConnections().size() != 1 || !fg.hasConnection(waiting)) FAIL("Foreground legs");
    if (fg.isMultiparty()) FAIL("Single party reported as multiparty");
    if (tracker.findConnection(waiting)->getIndex() != 2) FAIL("Leg index lost");

    tracker.hangup(tracker.getForegroundCall());
    feed(tracker, radio, {});
    if (tracker.findConnection(waiting)->getDisconnectCause() != DisconnectCause::LOCAL) FAIL("Cause not LOCAL");
    if (tracker.getPhoneState() != PhoneState::IDLE) FAIL("Phone not IDLE");

    PASS();
    return true;
}

bool test_cdma_carried_leg_follows_hangup() {
    TEST("CDMA merged leg ends with its call after hangup");

    RecordingRadio radio;
    CallTracker tracker(radio, config(CallTechnology::CDMA));
    establishCall(tracker, radio, "5551000");

    feed(tracker, radio, {"1 ACTIVE mo 5551000", "2 WAITING mt 5557000"});
    ConnectionId merged = tracker.getRingingCall().getLatestConnection()->getId();
    tracker.acceptCall();
    feed(tracker, radio, {"1 ACTIVE mo 5551000"});

    tracker.hangup(tracker.getForegroundCall());
    feed(tracker, radio, {});

    if (radio.fail_cause_requests != 0) FAIL("Fail cause requested for a local hangup");
    if (tracker.findConnection(merged)->getDisconnectCause() != DisconnectCause::LOCAL) FAIL("Merged leg cause");
    if (tracker.getForegroundCall().getState() != CallState::DISCONNECTED) FAIL("Foreground not DISCONNECTED");
    if (tracker.getPhoneState() != PhoneState::IDLE) FAIL("Phone not IDLE");

    // The next call starts clean
    ConnectionId next = tracker.dial("5552000");
    feed(tracker, radio, {"1 DIALING mo 5552000"});
    const ICall& fg = tracker.getForegroundCall();
    if (fg.getConnections().size() != 1 || !fg.hasConnection(next)) FAIL("Stale leg beside the new call");
    if (fg.isMultiparty()) FAIL("New call reported as multiparty");

    PASS();
    return true;
}

bool test_cdma_carried_leg_without_reported_leg() {
    TEST("CDMA merged leg dropped when its call is no longer reported");

    RecordingRadio radio;
    CallTracker tracker(radio, config(CallTechnology::CDMA));
    establishCall(tracker, radio, "5551000");

    feed(tracker, radio, {"1 ACTIVE mo 5551000", "2 WAITING mt 5557000"});
    ConnectionId merged = tracker.getRingingCall().getLatestConnection()->getId();
    tracker.acceptCall();

    // The network ends the call; the merged party has no leg of its own
    feed(tracker, radio, {});
    if (radio.fail_cause_requests != 1) FAIL("Fail cause not requested");
    tracker.onLastCallFailCause(16);

    if (tracker.findConnection(merged)->getDisconnectCause() != DisconnectCause::NORMAL) FAIL("Merged leg cause");
    if (tracker.getForegroundCall().getState() != CallState::DISCONNECTED) FAIL("Foreground not DISCONNECTED");
    if (tracker.getPhoneState() != PhoneState::IDLE) FAIL("Phone not IDLE");

    PASS();
    return true;
}

bool test_capacity_override() {
    TEST("Configured conference capacity");

    RecordingRadio radio;
    TrackerConfig cfg = config(CallTechnology::CDMA);
    cfg.max_connections_per_call = 3;
    cfg.max_connections = 4;
    CallTracker tracker(radio, cfg);

    if (tracker.getProfile().max_connections_per_call != 3) FAIL("Per-call capacity not applied");
    if (tracker.getProfile().max_connections != 4) FAIL("Leg slots not applied");
    if (tracker.getPhone().name != "test") FAIL("Phone name");

    // Index 5 is now outside the leg table
    tracker.pollCalls();
    try {
        feed(tracker, radio, {"5 INCOMING mt 5557000"});
        FAIL("Index 5 accepted");
    } catch (const DriverProtocolViolation&) {
    }

    PASS();
    return true;
}

int main() {
    setLogLevel(LogLevel::WARN);

    std::cout << "=== Call Tracker Test Suite ===\n\n";

    std::cout << "Poll Diff:\n";
    test_incoming_leg_rings();
    test_dial_matches_pending_leg();
    test_dial_without_leg_uses_fail_cause();
    test_local_hangup_is_local();
    test_remote_hangup_uses_fail_cause();
    test_incoming_missed_and_rejected();
    test_stale_poll_ignored();
    test_bad_snapshot_leaves_tracker_untouched();
    test_leg_moves_between_calls();
    test_conference_leg_drop();
    test_deferred_hangup_of_pending_dial();
    test_dial_collision_with_incoming();
    test_outgoing_leg_replaces_incoming();

    std::cout << "\nCommands:\n";
    test_illegal_commands();
    test_gsm_dial_holds_active_call();
    test_gsm_conference_and_separate();
    test_cdma_three_way();
    test_cdma_three_way_flash_failure();
    test_cdma_accept_waiting();
    test_cdma_accept_waiting_after_party_left();
    test_cdma_carried_leg_follows_hangup();
    test_cdma_carried_leg_without_reported_leg();
    test_capacity_override();

    std::cout << "\n=== Results: " << tests_passed << "/" << tests_run << " passed ===\n";

    return (tests_passed == tests_run) ? 0 : 1;
}
