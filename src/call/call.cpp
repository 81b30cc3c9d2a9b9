#include "call.hpp"
#include "callsync/errors.hpp"
#include "callsync/logging.hpp"
#include <algorithm>

namespace callsync {

// ============================================================================
// ICall helpers
// ============================================================================

bool ICall::hasConnection(ConnectionId id) const {
    const auto& conns = getConnections();
    return std::any_of(conns.begin(), conns.end(),
                       [id](const Connection& c) { return c.getId() == id; });
}

const Connection* ICall::getLatestConnection() const {
    const auto& conns = getConnections();
    return conns.empty() ? nullptr : &conns.back();
}

const Connection* ICall::getEarliestConnection() const {
    const auto& conns = getConnections();
    return conns.empty() ? nullptr : &conns.front();
}

// ============================================================================
// Call
// ============================================================================

Call::Call(CallSlot slot, const CallProfile& profile, const PhoneHandle& phone)
    : slot_(slot)
    , profile_(profile)
    , phone_(phone)
{
}

void Call::hangup() {
    if (state_ == CallState::DISCONNECTED || state_ == CallState::DISCONNECTING) {
        throw CallStateException(std::string("cannot hang up ") + callSlotToString(slot_) +
                                 " call in state " + callStateToString(state_));
    }
    if (!on_hangup_) {
        throw CallStateException(std::string(callSlotToString(slot_)) +
                                 " call is not owned by a tracker");
    }

    on_hangup_(*this);
}

void Call::attach(Connection conn, const DriverCall& dc) {
    CallState new_state = callStateFromDriverState(dc.state);

    conn.setOwner(slot_);
    connections_.push_back(std::move(conn));

    LOG_CALL(DEBUG, "%s: attach leg %d (%zu legs)",
             callSlotToString(slot_), dc.index, connections_.size());
    setState(new_state);
}

void Call::attachFake(Connection conn, CallState state) {
    conn.setOwner(slot_);
    connections_.push_back(std::move(conn));

    LOG_CALL(DEBUG, "%s: attach local leg as %s (%zu legs)",
             callSlotToString(slot_), callStateToString(state), connections_.size());
    setState(state);
}

bool Call::connectionDisconnected(ConnectionId id) {
    if (state_ == CallState::DISCONNECTED || connections_.empty()) {
        return false;
    }

    // If only disconnected connections remain, we are disconnected
    bool all_disconnected = std::all_of(connections_.begin(), connections_.end(),
        [](const Connection& c) { return c.getState() == CallState::DISCONNECTED; });

    if (!all_disconnected) {
        LOG_CALL(DEBUG, "%s: leg #%u gone, call still has live legs",
                 callSlotToString(slot_), id);
        return false;
    }

    LOG_CALL(INFO, "%s: all legs disconnected", callSlotToString(slot_));
    setState(CallState::DISCONNECTED);
    return true;
}

std::optional<Connection> Call::detach(ConnectionId id) {
    auto it = std::find_if(connections_.begin(), connections_.end(),
                           [id](const Connection& c) { return c.getId() == id; });
    if (it == connections_.end()) {
        return std::nullopt;
    }

    Connection conn = std::move(*it);
    connections_.erase(it);

    if (connections_.empty()) {
        setState(CallState::IDLE);
    }

    return conn;
}

bool Call::update(ConnectionId id, const DriverCall& dc) {
    CallState new_state = callStateFromDriverState(dc.state);

    if (new_state == state_) {
        return false;
    }

    LOG_CALL(DEBUG, "%s: %s -> %s (leg #%u)", callSlotToString(slot_),
             callStateToString(state_), callStateToString(new_state), id);
    setState(new_state);
    return true;
}

void Call::onHangupLocal() {
    for (auto& conn : connections_) {
        conn.onHangupLocal();
    }
    setState(CallState::DISCONNECTING);
}

size_t Call::clearDisconnected() {
    size_t before = connections_.size();

    connections_.erase(
        std::remove_if(connections_.begin(), connections_.end(),
                       [](const Connection& c) { return c.getState() == CallState::DISCONNECTED; }),
        connections_.end());

    if (connections_.empty()) {
        setState(CallState::IDLE);
    }

    return before - connections_.size();
}

Connection* Call::findConnection(ConnectionId id) {
    for (auto& conn : connections_) {
        if (conn.getId() == id) return &conn;
    }
    return nullptr;
}

const Connection* Call::findConnection(ConnectionId id) const {
    for (const auto& conn : connections_) {
        if (conn.getId() == id) return &conn;
    }
    return nullptr;
}

Connection* Call::findConnectionByIndex(int index) {
    if (index == UNASSIGNED_INDEX) {
        return nullptr;
    }
    for (auto& conn : connections_) {
        if (conn.getIndex() == index) return &conn;
    }
    return nullptr;
}

void Call::setState(CallState state) {
    state_ = state;
    for (auto& conn : connections_) {
        conn.setParentState(state);
    }
}

} // namespace callsync
