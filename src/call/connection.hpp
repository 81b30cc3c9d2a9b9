#pragma once

#include "callsync/types.hpp"
#include "callsync/driver_call.hpp"
#include <optional>
#include <string>

namespace callsync {

/**
 * Connection
 *
 * One call leg. Owned by value by exactly one Call at any instant; the owner
 * is recorded as a CallSlot handle and changes only when the tracker moves
 * the leg with Call::detach() / Call::attach().
 *
 * The logical state mirrors the owning Call, except while a local hangup is
 * pending (DISCONNECTING) and once the leg has disconnected (DISCONNECTED).
 */
class Connection {
public:
    // Leg reported by the radio with no matching tracked connection
    Connection(ConnectionId id, const DriverCall& dc, CallSlot owner);

    // Locally originated leg the radio has not confirmed yet
    Connection(ConnectionId id, const std::string& address, CallSlot owner);

    // --- Identity ---

    ConnectionId getId() const { return id_; }
    int getIndex() const { return index_; }
    bool hasIndex() const { return index_ != UNASSIGNED_INDEX; }
    const std::string& getAddress() const { return address_; }
    bool isIncoming() const { return incoming_; }
    CallSlot getOwner() const { return owner_; }

    // --- State ---

    CallState getState() const;
    bool isAlive() const;
    bool isHangupPending() const { return hangup_pending_; }
    bool isDisconnected() const { return disconnected_; }
    bool wasConnected() const { return connected_; }
    DisconnectCause getDisconnectCause() const { return cause_; }
    const std::optional<DriverCall>& getLastDriverCall() const { return last_dc_; }

    std::string toString() const;

    // --- Tracker interface ---

    void setOwner(CallSlot owner) { owner_ = owner; }
    void setParentState(CallState state) { parent_state_ = state; }
    void assignIndex(int index) { index_ = index; }

    // Record a new snapshot for this leg.
    // Returns true if the leg details (address, multiparty flag) changed.
    bool update(const DriverCall& dc);

    // True if a pending local dial can be the leg described by dc
    bool matchesPendingDial(const DriverCall& dc) const;

    // Local hangup requested; the radio has not confirmed it yet
    void onHangupLocal();

    // Leg reached a connected state (answered, or confirmed by the network)
    void markConnected() { connected_ = true; }

    // Mark the leg disconnected with the given cause.
    // Returns false if it had already disconnected.
    bool onDisconnect(DisconnectCause cause);

    // Cause recorded at local hangup / dial failure, applied when the leg drops
    DisconnectCause getPendingCause() const { return pending_cause_; }
    void setPendingCause(DisconnectCause cause) { pending_cause_ = cause; }

private:
    ConnectionId id_;
    int index_ = UNASSIGNED_INDEX;
    std::string address_;
    bool incoming_ = false;
    CallSlot owner_;

    CallState parent_state_ = CallState::IDLE;
    bool hangup_pending_ = false;
    bool disconnected_ = false;
    bool connected_ = false;

    DisconnectCause cause_ = DisconnectCause::NOT_DISCONNECTED;
    DisconnectCause pending_cause_ = DisconnectCause::NOT_DISCONNECTED;

    std::optional<DriverCall> last_dc_;
};

} // namespace callsync
