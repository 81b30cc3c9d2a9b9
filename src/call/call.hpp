#pragma once

#include "connection.hpp"
#include "call_profile.hpp"
#include "callsync/types.hpp"
#include "callsync/driver_call.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace callsync {

/**
 * Call capability set
 *
 * The only view of a call that upper layers (UI, conference management)
 * get. State changes are driven exclusively by the CallTracker.
 */
class ICall {
public:
    virtual ~ICall() = default;

    // Member legs in attach order (read-only)
    virtual const std::vector<Connection>& getConnections() const = 0;

    virtual bool isMultiparty() const = 0;

    // Ask the owning tracker to hang this call up. Fire-and-forget: returns
    // with the call in DISCONNECTING. Throws CallStateException when the
    // call is already disconnected/disconnecting or cannot be hung up.
    virtual void hangup() = 0;

    virtual const PhoneHandle& getPhone() const = 0;
    virtual CallState getState() const = 0;
    virtual std::string toString() const = 0;

    // --- Convenience queries ---

    bool isIdle() const { return !isAlive(); }

    bool isAlive() const {
        CallState state = getState();
        return state != CallState::IDLE && state != CallState::DISCONNECTED &&
               state != CallState::DISCONNECTING;
    }

    bool isRinging() const {
        CallState state = getState();
        return state == CallState::INCOMING || state == CallState::WAITING;
    }

    bool isDialingOrAlerting() const {
        CallState state = getState();
        return state == CallState::DIALING || state == CallState::ALERTING;
    }

    bool hasConnections() const { return !getConnections().empty(); }
    bool hasConnection(ConnectionId id) const;

    // Most recently attached leg, or nullptr
    const Connection* getLatestConnection() const;

    // First attached leg, or nullptr
    const Connection* getEarliestConnection() const;
};

/**
 * Call
 *
 * Logical grouping of one or more Connections sharing an aggregate state.
 * One class serves every technology family; the CallProfile supplies the
 * conference capacity. Calls are never destroyed: when the last member
 * leaves, the call is recycled to IDLE.
 *
 * Invariants (after every tracker operation):
 *   IDLE <=> no connections
 *   DISCONNECTED => every member DISCONNECTED
 */
class Call : public ICall {
public:
    // Installed by the owning tracker; receives hangup() requests
    using HangupHandler = std::function<void(Call& call)>;

    Call(CallSlot slot, const CallProfile& profile, const PhoneHandle& phone);

    // --- ICall ---

    const std::vector<Connection>& getConnections() const override { return connections_; }
    bool isMultiparty() const override { return connections_.size() > 1; }
    void hangup() override;
    const PhoneHandle& getPhone() const override { return phone_; }
    CallState getState() const override { return state_; }
    std::string toString() const override { return callStateToString(state_); }

    CallSlot getSlot() const { return slot_; }
    const CallProfile& getProfile() const { return profile_; }
    void setHangupHandler(HangupHandler handler) { on_hangup_ = std::move(handler); }

    // --- Tracker interface ---

    // Add a leg reported by the radio; aggregate state follows the snapshot.
    // Capacity is the tracker's responsibility and is not checked here.
    void attach(Connection conn, const DriverCall& dc);

    // Add a leg with an explicit aggregate state, bypassing the driver mapping
    // (locally originated legs the radio has not reported yet)
    void attachFake(Connection conn, CallState state);

    // Re-evaluate after a member disconnected. Returns true exactly once:
    // when the call flips to DISCONNECTED because every member is DISCONNECTED.
    // A call with no members returns false and stays IDLE even though "every
    // member is DISCONNECTED" holds vacuously; IDLE means no connections.
    bool connectionDisconnected(ConnectionId id);

    // Remove a member and hand it back. Recycles the call to IDLE when the
    // last member leaves. Returns nullopt if id is not a member.
    std::optional<Connection> detach(ConnectionId id);

    // Recompute the aggregate state from a new snapshot of a member.
    // Returns true if the state changed.
    bool update(ConnectionId id, const DriverCall& dc);

    // True if no more legs can be added via conference
    bool isFull() const { return connections_.size() == profile_.max_connections_per_call; }

    // Local hangup dispatched to the radio, no response yet.
    // Every member becomes hangup-pending and the call DISCONNECTING.
    void onHangupLocal();

    // Sweep DISCONNECTED members. Returns how many were removed.
    size_t clearDisconnected();

    Connection* findConnection(ConnectionId id);
    const Connection* findConnection(ConnectionId id) const;
    Connection* findConnectionByIndex(int index);

private:
    CallSlot slot_;
    CallProfile profile_;
    PhoneHandle phone_;

    CallState state_ = CallState::IDLE;
    std::vector<Connection> connections_;

    HangupHandler on_hangup_;

    // Set the aggregate state and mirror it into the members
    void setState(CallState state);
};

} // namespace callsync
