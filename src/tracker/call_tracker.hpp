#pragma once

#include "radio_link.hpp"
#include "call/call.hpp"
#include "call/call_profile.hpp"
#include "callsync/driver_call.hpp"
#include "callsync/types.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace callsync {

// Tracker configuration
struct TrackerConfig {
    CallTechnology technology = CallTechnology::CDMA;
    std::string phone_name = "phone0";
    uint32_t phone_id = 0;
    size_t max_connections = 0;             // Leg slots (0 = technology default)
    size_t max_connections_per_call = 0;    // Conference capacity (0 = technology default)
};

// Slot policy: which call a leg in the given driver state belongs to.
// Throws DriverProtocolViolation for values outside the enumeration.
CallSlot callSlotFromDriverState(DriverCallState state);

// Map a radio "last call fail cause" code to a disconnect cause
DisconnectCause disconnectCauseFromFailCode(int code);

/**
 * Call Tracker
 *
 * Owner and arbiter of the three calls (ringing, foreground, background).
 * Diffs each poll result against the tracked legs and drives
 * attach/update/detach/clearDisconnected on the calls. It is the only
 * caller of the Call tracker interface.
 *
 * Not thread-safe: every command and radio event must run on the same
 * worker (see CallEventLoop).
 *
 * Typical flow (outgoing):
 *   1. dial(address) -> pending local leg in the foreground call (DIALING)
 *   2. onPollResult() matches the leg the radio reports and assigns its index
 *   3. hangup(call) -> call DISCONNECTING, request sent to the radio
 *   4. onPollResult() without the leg -> leg and call DISCONNECTED
 *   5. next state change or clearDisconnected() sweeps the call back to IDLE
 */
class CallTracker {
public:
    // Callback types
    using CallStateChangedCallback = std::function<void()>;
    using NewRingingConnectionCallback = std::function<void(const Connection& conn)>;
    using DisconnectCallback = std::function<void(const Connection& conn)>;
    using PhoneStateChangedCallback = std::function<void(PhoneState state)>;

    explicit CallTracker(IRadioLink& radio, const TrackerConfig& config = TrackerConfig{});

    CallTracker(const CallTracker&) = delete;
    CallTracker& operator=(const CallTracker&) = delete;

    // --- Calls ---

    ICall& getRingingCall() { return ringing_call_; }
    ICall& getForegroundCall() { return foreground_call_; }
    ICall& getBackgroundCall() { return background_call_; }
    const ICall& getRingingCall() const { return ringing_call_; }
    const ICall& getForegroundCall() const { return foreground_call_; }
    const ICall& getBackgroundCall() const { return background_call_; }
    const Call& getCall(CallSlot slot) const;

    const Connection* findConnection(ConnectionId id) const;

    PhoneState getPhoneState() const { return phone_state_; }
    const CallProfile& getProfile() const { return profile_; }
    const PhoneHandle& getPhone() const { return phone_; }

    bool hasPendingDial() const { return pending_mo_ != INVALID_CONNECTION_ID; }
    bool isAwaitingFailCause() const { return awaiting_fail_cause_; }
    uint32_t getLastPollToken() const { return poll_token_; }

    // --- Commands (throw CallStateException when not allowed) ---

    // Place an outgoing call. Returns the id of the new connection.
    ConnectionId dial(const std::string& address);

    void acceptCall();
    void rejectCall();
    void switchWaitingOrHoldingAndActive();

    bool canDial() const;
    bool canConference() const;

    // Merge the background call (or the CDMA three-way leg) into the foreground
    void conference();

    // Split one leg out of the foreground conference (GSM only)
    void separate(ConnectionId id);

    void hangup(ICall& call);
    void hangup(ConnectionId id);

    // Sweep DISCONNECTED legs from every call
    void clearDisconnected();

    // --- Radio events ---

    // Ask the radio for a fresh call list. Earlier outstanding polls become stale.
    void pollCalls();

    // Call list answer. Ignored unless token matches the latest request.
    // Throws DriverProtocolViolation (tracker untouched) on a malformed list.
    void onPollResult(uint32_t token, const std::vector<DriverCall>& calls);

    // Unsolicited "call state changed" notification
    void onCallStateChanged();

    // Answer to getLastCallFailCause()
    void onLastCallFailCause(int code);

    // Answer to sendFlash()
    void onFlashResult(bool success);

    // --- Callbacks ---

    void setCallStateChangedCallback(CallStateChangedCallback cb) { on_call_state_changed_ = std::move(cb); }
    void setNewRingingConnectionCallback(NewRingingConnectionCallback cb) { on_new_ringing_ = std::move(cb); }
    void setDisconnectCallback(DisconnectCallback cb) { on_disconnect_ = std::move(cb); }
    void setPhoneStateChangedCallback(PhoneStateChangedCallback cb) { on_phone_state_changed_ = std::move(cb); }

private:
    IRadioLink& radio_;
    CallProfile profile_;
    PhoneHandle phone_;

    Call ringing_call_;
    Call foreground_call_;
    Call background_call_;

    // Leg table: entry i holds the connection reported at driver index i+1
    std::vector<ConnectionId> legs_;
    ConnectionId next_connection_id_ = 1;

    // Locally dialed leg the radio has not reported yet
    ConnectionId pending_mo_ = INVALID_CONNECTION_ID;
    bool hangup_pending_mo_ = false;

    // CDMA three-way leg waiting for its flash result
    ConnectionId pending_three_way_ = INVALID_CONNECTION_ID;

    // Legs that dropped without a known cause, waiting for onLastCallFailCause()
    std::vector<ConnectionId> dropped_during_poll_;
    bool awaiting_fail_cause_ = false;

    uint32_t poll_token_ = 0;
    PhoneState phone_state_ = PhoneState::IDLE;

    // Callbacks
    CallStateChangedCallback on_call_state_changed_;
    NewRingingConnectionCallback on_new_ringing_;
    DisconnectCallback on_disconnect_;
    PhoneStateChangedCallback on_phone_state_changed_;

    Call& call(CallSlot slot);
    Call* ownCall(const ICall& call);
    Connection* locate(ConnectionId id);
    ConnectionId allocateId() { return next_connection_id_++; }

    void hangupCall(Call& call);
    void hangupLeg(Connection& conn);
    void fakeHoldForegroundBeforeDial();

    // Move a leg into the foreground as a network-merged leg (no own index)
    void mergeIntoForeground(ConnectionId id);
    // True if a live leg of the call still holds its slot in the leg table
    bool hasReportedLeg(const Call& c) const;
    void releaseLegSlot(ConnectionId id);

    // Poll handlers (call_tracker_handlers.cpp)
    void validateSnapshot(const std::vector<DriverCall>& calls) const;
    ConnectionId createLeg(const DriverCall& dc);
    bool updateLeg(ConnectionId id, const DriverCall& dc);
    void collectCarriedLegs(CallSlot slot, std::vector<ConnectionId>& dropped);
    void resolveDropped(const std::vector<ConnectionId>& dropped);
    void disconnectLeg(ConnectionId id, DisconnectCause cause);
    void disconnectLegs(const std::vector<std::pair<ConnectionId, DisconnectCause>>& legs);

    void internalClearDisconnected();
    void updatePhoneState();
    void notifyCallStateChanged();
};

} // namespace callsync
