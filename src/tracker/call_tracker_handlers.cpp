// CallTracker radio event handlers: poll diff, disconnect resolution,
// fail cause and flash results

#include "call_tracker.hpp"
#include "callsync/errors.hpp"
#include "callsync/logging.hpp"
#include <algorithm>

namespace callsync {

// ============================================================================
// Polling
// ============================================================================

void CallTracker::pollCalls() {
    poll_token_++;
    if (poll_token_ == 0) {
        poll_token_ = 1;
    }
    LOG_TRACKER(TRACE, "CallTracker: poll #%u", poll_token_);
    radio_.getCurrentCalls(poll_token_);
}

void CallTracker::onCallStateChanged() {
    pollCalls();
}

void CallTracker::validateSnapshot(const std::vector<DriverCall>& calls) const {
    std::vector<bool> seen(legs_.size(), false);

    for (const auto& dc : calls) {
        if (dc.index < 1 || static_cast<size_t>(dc.index) > legs_.size()) {
            throw DriverProtocolViolation("leg index out of range: " + std::to_string(dc.index));
        }
        if (seen[dc.index - 1]) {
            throw DriverProtocolViolation("duplicate leg index: " + std::to_string(dc.index));
        }
        seen[dc.index - 1] = true;

        // Both throw for states outside the enumeration
        callStateFromDriverState(dc.state);
        callSlotFromDriverState(dc.state);
    }
}

void CallTracker::onPollResult(uint32_t token, const std::vector<DriverCall>& calls) {
    if (token != poll_token_) {
        LOG_TRACKER(DEBUG, "CallTracker: ignoring stale poll #%u (latest #%u)", token, poll_token_);
        return;
    }

    // Nothing below runs on a malformed list
    validateSnapshot(calls);

    std::vector<DriverCall> sorted = calls;
    std::sort(sorted.begin(), sorted.end(),
              [](const DriverCall& a, const DriverCall& b) { return a.index < b.index; });

    ConnectionId new_ringing = INVALID_CONNECTION_ID;
    bool changed = false;
    bool sent_deferred_hangup = false;
    bool non_hangup_changed = false;
    std::vector<ConnectionId> dropped;

    size_t cur = 0;
    for (size_t i = 0; i < legs_.size(); i++) {
        const int index = static_cast<int>(i) + 1;
        const DriverCall* dc = nullptr;
        if (cur < sorted.size() && sorted[cur].index == index) {
            dc = &sorted[cur++];
        }

        ConnectionId id = legs_[i];
        if (id != INVALID_CONNECTION_ID && !locate(id)) {
            // Swept while the slot was still held
            legs_[i] = INVALID_CONNECTION_ID;
            id = INVALID_CONNECTION_ID;
        }

        if (id != INVALID_CONNECTION_ID && dc && locate(id)->isIncoming() != dc->is_mt) {
            // Direction changed: the radio replaced our leg with a different call
            LOG_TRACKER(WARN, "CallTracker: leg %d (#%u) replaced by %s call", index, id,
                        dc->is_mt ? "incoming" : "outgoing");
            dropped.push_back(id);
            legs_[i] = INVALID_CONNECTION_ID;
            id = INVALID_CONNECTION_ID;
        }

        if (id == INVALID_CONNECTION_ID && dc) {
            Connection* pending = locate(pending_mo_);
            if (pending && pending->matchesPendingDial(*dc)) {
                // The radio confirmed our dial
                LOG_TRACKER(INFO, "CallTracker: pending leg #%u is index %d", pending_mo_, index);
                ConnectionId mo = pending_mo_;
                pending->assignIndex(index);
                legs_[i] = mo;
                pending_mo_ = INVALID_CONNECTION_ID;
                updateLeg(mo, *dc);

                if (hangup_pending_mo_) {
                    hangup_pending_mo_ = false;
                    LOG_TRACKER(INFO, "CallTracker: sending deferred hangup for index %d", index);
                    radio_.hangupConnection(index);
                    sent_deferred_hangup = true;
                }
            } else {
                legs_[i] = createLeg(*dc);
                if (callSlotFromDriverState(dc->state) == CallSlot::RINGING) {
                    new_ringing = legs_[i];
                } else {
                    LOG_TRACKER(WARN, "CallTracker: leg %d appeared as %s without a dial",
                                index, driverCallStateToString(dc->state));
                }
            }
            changed = true;
            non_hangup_changed = true;
        } else if (id != INVALID_CONNECTION_ID && !dc) {
            LOG_TRACKER(DEBUG, "CallTracker: leg %d (#%u) dropped", index, id);
            dropped.push_back(id);
            legs_[i] = INVALID_CONNECTION_ID;
            changed = true;
        } else if (id != INVALID_CONNECTION_ID && dc) {
            bool leg_changed = updateLeg(id, *dc);
            changed = changed || leg_changed;
            non_hangup_changed = non_hangup_changed || leg_changed;
        }
    }

    // First poll after a dial: the leg should have appeared by now
    if (pending_mo_ != INVALID_CONNECTION_ID) {
        LOG_TRACKER(INFO, "CallTracker: pending leg #%u dropped before poll", pending_mo_);
        dropped.push_back(pending_mo_);
        pending_mo_ = INVALID_CONNECTION_ID;
        hangup_pending_mo_ = false;
        changed = true;
    }

    // Legs merged by flash ride on a reported leg of their call; without one
    // the network no longer carries them
    for (CallSlot slot : {CallSlot::FOREGROUND, CallSlot::BACKGROUND}) {
        if (call(slot).hasConnections() && !hasReportedLeg(call(slot))) {
            size_t before = dropped.size();
            collectCarriedLegs(slot, dropped);
            if (dropped.size() != before) {
                LOG_TRACKER(DEBUG, "CallTracker: %s call lost its reported leg, dropping %zu carried legs",
                            callSlotToString(slot), dropped.size() - before);
                changed = true;
            }
        }
    }

    if (new_ringing != INVALID_CONNECTION_ID && on_new_ringing_) {
        if (const Connection* conn = locate(new_ringing)) {
            on_new_ringing_(*conn);
        }
    }

    resolveDropped(dropped);

    if (new_ringing != INVALID_CONNECTION_ID || non_hangup_changed) {
        internalClearDisconnected();
    }

    updatePhoneState();

    if (changed) {
        notifyCallStateChanged();
    }

    if (sent_deferred_hangup) {
        pollCalls();
    }
}

// ============================================================================
// Leg create / update
// ============================================================================

ConnectionId CallTracker::createLeg(const DriverCall& dc) {
    ConnectionId id = allocateId();
    CallSlot slot = callSlotFromDriverState(dc.state);
    Call& target = call(slot);

    if (target.getConnections().size() >= profile_.max_connections_per_call) {
        // The radio is authoritative; record the overflow and keep going
        LOG_TRACKER(WARN, "CallTracker: %s call over capacity (%zu legs)",
                    callSlotToString(slot), target.getConnections().size() + 1);
    }

    LOG_TRACKER(INFO, "CallTracker: new leg %s -> #%u (%s)",
                dc.toString().c_str(), id, callSlotToString(slot));
    target.attach(Connection(id, dc, slot), dc);
    return id;
}

bool CallTracker::updateLeg(ConnectionId id, const DriverCall& dc) {
    Connection* conn = locate(id);
    if (!conn) {
        return false;
    }

    CallSlot new_slot = callSlotFromDriverState(dc.state);
    CallSlot old_slot = conn->getOwner();
    bool changed = conn->update(dc);

    if (new_slot != old_slot) {
        // Re-parent: ownership moves between calls
        LOG_TRACKER(DEBUG, "CallTracker: leg %d moves %s -> %s", dc.index,
                    callSlotToString(old_slot), callSlotToString(new_slot));
        auto moved = call(old_slot).detach(id);
        call(new_slot).attach(std::move(*moved), dc);
        return true;
    }

    return call(new_slot).update(id, dc) || changed;
}

// Legs merged into a call by flash ride on that call's reported leg
void CallTracker::collectCarriedLegs(CallSlot slot, std::vector<ConnectionId>& dropped) {
    for (const auto& conn : call(slot).getConnections()) {
        if (!conn.hasIndex() && conn.getId() != pending_mo_ && !conn.isDisconnected() &&
            std::find(dropped.begin(), dropped.end(), conn.getId()) == dropped.end()) {
            dropped.push_back(conn.getId());
        }
    }
}

// ============================================================================
// Disconnect resolution
// ============================================================================

void CallTracker::resolveDropped(const std::vector<ConnectionId>& dropped) {
    std::vector<std::pair<ConnectionId, DisconnectCause>> resolved;

    for (ConnectionId id : dropped) {
        Connection* conn = locate(id);
        if (!conn || conn->isDisconnected()) {
            continue;
        }

        if (id == pending_three_way_) {
            pending_three_way_ = INVALID_CONNECTION_ID;
        }

        bool local = conn->getPendingCause() == DisconnectCause::LOCAL;

        if (conn->isIncoming() && !conn->wasConnected()) {
            resolved.emplace_back(id, local ? DisconnectCause::INCOMING_REJECTED
                                            : DisconnectCause::INCOMING_MISSED);
        } else if (local) {
            resolved.emplace_back(id, DisconnectCause::LOCAL);
        } else {
            dropped_during_poll_.push_back(id);
        }
    }

    disconnectLegs(resolved);

    if (!dropped_during_poll_.empty() && !awaiting_fail_cause_) {
        awaiting_fail_cause_ = true;
        LOG_TRACKER(DEBUG, "CallTracker: %zu legs need a fail cause", dropped_during_poll_.size());
        radio_.getLastCallFailCause();
    }
}

void CallTracker::disconnectLeg(ConnectionId id, DisconnectCause cause) {
    disconnectLegs({{id, cause}});
}

void CallTracker::disconnectLegs(const std::vector<std::pair<ConnectionId, DisconnectCause>>& legs) {
    std::vector<ConnectionId> disconnected;

    for (const auto& [id, cause] : legs) {
        Connection* conn = locate(id);
        if (!conn || !conn->onDisconnect(cause)) {
            continue;
        }
        disconnected.push_back(id);
        if (on_disconnect_) {
            on_disconnect_(*conn);
        }
    }

    // Calls are evaluated once the whole batch is marked, so legs that drop
    // together end the call together
    for (ConnectionId id : disconnected) {
        Connection* conn = locate(id);
        if (!conn) {
            continue;
        }
        Call& owner = call(conn->getOwner());
        if (owner.getState() == CallState::DISCONNECTED) {
            continue;
        }
        if (!owner.connectionDisconnected(id)) {
            // The call lives on with its other legs; drop this one now
            owner.detach(id);
        }
    }
}

void CallTracker::onLastCallFailCause(int code) {
    awaiting_fail_cause_ = false;

    DisconnectCause cause = disconnectCauseFromFailCode(code);
    LOG_TRACKER(INFO, "CallTracker: last call fail cause %d (%s)",
                code, disconnectCauseToString(cause));

    std::vector<std::pair<ConnectionId, DisconnectCause>> legs;
    for (ConnectionId id : dropped_during_poll_) {
        legs.emplace_back(id, cause);
    }
    dropped_during_poll_.clear();
    disconnectLegs(legs);

    updatePhoneState();
    notifyCallStateChanged();
}

void CallTracker::onFlashResult(bool success) {
    if (pending_three_way_ == INVALID_CONNECTION_ID) {
        LOG_TRACKER(DEBUG, "CallTracker: flash %s", success ? "acknowledged" : "failed");
        return;
    }

    ConnectionId id = pending_three_way_;
    pending_three_way_ = INVALID_CONNECTION_ID;

    Connection* conn = locate(id);
    if (!conn || conn->isDisconnected()) {
        // Dropped with its call before the network answered
        return;
    }

    if (success) {
        LOG_TRACKER(INFO, "CallTracker: three-way leg #%u connected", id);
        conn->markConnected();
    } else {
        LOG_TRACKER(WARN, "CallTracker: three-way dial failed for #%u", id);
        disconnectLeg(id, DisconnectCause::ERROR_UNSPECIFIED);
    }

    updatePhoneState();
    notifyCallStateChanged();

    // The foreground leg's next snapshot restores the aggregate state
    pollCalls();
}

} // namespace callsync
