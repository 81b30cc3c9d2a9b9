#include "call_tracker.hpp"
#include "callsync/errors.hpp"
#include "callsync/logging.hpp"
#include <stdexcept>

namespace callsync {

namespace {

CallProfile resolveProfile(const TrackerConfig& config) {
    CallProfile profile = makeCallProfile(config.technology);
    if (config.max_connections > 0) {
        profile.max_connections = config.max_connections;
    }
    if (config.max_connections_per_call > 0) {
        profile.max_connections_per_call = config.max_connections_per_call;
    }
    return profile;
}

PhoneHandle makePhone(const TrackerConfig& config) {
    PhoneHandle phone;
    phone.id = config.phone_id;
    phone.name = config.phone_name;
    phone.technology = config.technology;
    return phone;
}

} // namespace

CallSlot callSlotFromDriverState(DriverCallState state) {
    switch (state) {
        case DriverCallState::ACTIVE:
        case DriverCallState::DIALING:
        case DriverCallState::ALERTING:
            return CallSlot::FOREGROUND;

        case DriverCallState::HOLDING:
            return CallSlot::BACKGROUND;

        case DriverCallState::INCOMING:
        case DriverCallState::WAITING:
            return CallSlot::RINGING;

        default:
            throw DriverProtocolViolation("illegal driver call state: " +
                                          std::to_string(static_cast<int>(state)));
    }
}

DisconnectCause disconnectCauseFromFailCode(int code) {
    switch (code) {
        case 1:     return DisconnectCause::INVALID_NUMBER;   // Unassigned number
        case 16:    return DisconnectCause::NORMAL;           // Normal clearing
        case 17:    return DisconnectCause::BUSY;             // User busy
        case 34:                                              // No circuit available
        case 41:                                              // Temporary failure
        case 42:                                              // Switching congestion
        case 44:                                              // Channel not available
        case 49:                                              // QoS not available
        case 58:                                              // Bearer not available
        case 1003:  return DisconnectCause::CONGESTION;       // CDMA reorder
        case 1001:  return DisconnectCause::OUT_OF_SERVICE;   // CDMA drop
        default:    return DisconnectCause::ERROR_UNSPECIFIED;
    }
}

CallTracker::CallTracker(IRadioLink& radio, const TrackerConfig& config)
    : radio_(radio)
    , profile_(resolveProfile(config))
    , phone_(makePhone(config))
    , ringing_call_(CallSlot::RINGING, profile_, phone_)
    , foreground_call_(CallSlot::FOREGROUND, profile_, phone_)
    , background_call_(CallSlot::BACKGROUND, profile_, phone_)
    , legs_(profile_.max_connections, INVALID_CONNECTION_ID)
{
    auto handler = [this](Call& c) { hangupCall(c); };
    ringing_call_.setHangupHandler(handler);
    foreground_call_.setHangupHandler(handler);
    background_call_.setHangupHandler(handler);

    LOG_TRACKER(INFO, "CallTracker: %s, %zu legs, %zu per call",
                callTechnologyToString(profile_.technology),
                profile_.max_connections, profile_.max_connections_per_call);
}

// ============================================================================
// Lookup
// ============================================================================

Call& CallTracker::call(CallSlot slot) {
    switch (slot) {
        case CallSlot::RINGING:    return ringing_call_;
        case CallSlot::BACKGROUND: return background_call_;
        case CallSlot::FOREGROUND:
        default:                   return foreground_call_;
    }
}

const Call& CallTracker::getCall(CallSlot slot) const {
    switch (slot) {
        case CallSlot::RINGING:    return ringing_call_;
        case CallSlot::BACKGROUND: return background_call_;
        case CallSlot::FOREGROUND:
        default:                   return foreground_call_;
    }
}

Call* CallTracker::ownCall(const ICall& c) {
    if (&c == &ringing_call_) return &ringing_call_;
    if (&c == &foreground_call_) return &foreground_call_;
    if (&c == &background_call_) return &background_call_;
    return nullptr;
}

Connection* CallTracker::locate(ConnectionId id) {
    if (id == INVALID_CONNECTION_ID) {
        return nullptr;
    }
    for (Call* c : {&ringing_call_, &foreground_call_, &background_call_}) {
        if (Connection* conn = c->findConnection(id)) {
            return conn;
        }
    }
    return nullptr;
}

const Connection* CallTracker::findConnection(ConnectionId id) const {
    for (const Call* c : {&ringing_call_, &foreground_call_, &background_call_}) {
        if (const Connection* conn = c->findConnection(id)) {
            return conn;
        }
    }
    return nullptr;
}

// ============================================================================
// Commands
// ============================================================================

bool CallTracker::canDial() const {
    if (ringing_call_.isRinging() || pending_mo_ != INVALID_CONNECTION_ID ||
        pending_three_way_ != INVALID_CONNECTION_ID) {
        return false;
    }

    if (profile_.merge_via_flash) {
        // One call at a time; an active call may add a three-way party
        if (background_call_.isAlive()) return false;
        return foreground_call_.isIdle() ||
               (foreground_call_.getState() == CallState::ACTIVE && !foreground_call_.isFull());
    }

    if (foreground_call_.isDialingOrAlerting()) return false;
    return !(foreground_call_.isAlive() && background_call_.isAlive());
}

ConnectionId CallTracker::dial(const std::string& address) {
    if (address.empty()) {
        throw std::invalid_argument("empty dial address");
    }

    // Note: clearDisconnected() before canDial() so a just-ended call does not block
    clearDisconnected();

    if (!canDial()) {
        throw CallStateException(std::string("cannot dial in current state (foreground ") +
                                 foreground_call_.toString() + ", background " +
                                 background_call_.toString() + ", ringing " +
                                 ringing_call_.toString() + ")");
    }

    ConnectionId id = allocateId();

    if (profile_.merge_via_flash && foreground_call_.getState() == CallState::ACTIVE) {
        LOG_TRACKER(INFO, "CallTracker: three-way dial %s (#%u)", address.c_str(), id);
        foreground_call_.attachFake(Connection(id, address, CallSlot::FOREGROUND),
                                    CallState::DIALING);
        pending_three_way_ = id;
        radio_.sendFlash(address);
    } else {
        if (foreground_call_.getState() == CallState::ACTIVE) {
            // Network puts the active call on hold before dialing
            radio_.switchWaitingOrHoldingAndActive();
            fakeHoldForegroundBeforeDial();
        }

        LOG_TRACKER(INFO, "CallTracker: dial %s (#%u)", address.c_str(), id);
        foreground_call_.attachFake(Connection(id, address, CallSlot::FOREGROUND),
                                    CallState::DIALING);
        pending_mo_ = id;
        hangup_pending_mo_ = false;
        radio_.dial(address);
    }

    updatePhoneState();
    notifyCallStateChanged();
    pollCalls();
    return id;
}

void CallTracker::fakeHoldForegroundBeforeDial() {
    std::vector<ConnectionId> ids;
    for (const auto& conn : foreground_call_.getConnections()) {
        ids.push_back(conn.getId());
    }

    for (ConnectionId id : ids) {
        auto conn = foreground_call_.detach(id);
        if (conn) {
            background_call_.attachFake(std::move(*conn), CallState::HOLDING);
        }
    }
}

void CallTracker::acceptCall() {
    CallState state = ringing_call_.getState();

    if (state == CallState::INCOMING) {
        LOG_TRACKER(INFO, "CallTracker: accept incoming call");
        radio_.acceptCall();
    } else if (state == CallState::WAITING) {
        if (profile_.merge_via_flash && !hasReportedLeg(foreground_call_)) {
            // Nothing on the radio to flash against; answer it as a plain call
            LOG_TRACKER(INFO, "CallTracker: accept waiting call, foreground has no reported leg");
            radio_.acceptCall();
        } else if (profile_.merge_via_flash) {
            if (foreground_call_.isFull()) {
                throw CallStateException("foreground call is full");
            }
            const Connection* waiting = ringing_call_.getLatestConnection();
            LOG_TRACKER(INFO, "CallTracker: accept waiting call #%u by flash", waiting->getId());
            mergeIntoForeground(waiting->getId());
            radio_.sendFlash("");
        } else {
            LOG_TRACKER(INFO, "CallTracker: accept waiting call");
            radio_.switchWaitingOrHoldingAndActive();
        }
    } else {
        throw CallStateException("phone not ringing");
    }

    updatePhoneState();
    notifyCallStateChanged();
    pollCalls();
}

void CallTracker::rejectCall() {
    if (!ringing_call_.isRinging()) {
        throw CallStateException("phone not ringing");
    }

    LOG_TRACKER(INFO, "CallTracker: reject ringing call");
    radio_.rejectCall();
    ringing_call_.onHangupLocal();

    updatePhoneState();
    notifyCallStateChanged();
    pollCalls();
}

void CallTracker::switchWaitingOrHoldingAndActive() {
    if (ringing_call_.getState() == CallState::INCOMING) {
        throw CallStateException("cannot switch while a call is incoming");
    }

    if (profile_.merge_via_flash) {
        if (ringing_call_.getState() == CallState::WAITING) {
            // The flash that toggles parties also picks up the waiting call
            acceptCall();
            return;
        }
        radio_.sendFlash("");
    } else {
        radio_.switchWaitingOrHoldingAndActive();
    }
    pollCalls();
}

bool CallTracker::canConference() const {
    if (foreground_call_.getState() != CallState::ACTIVE) {
        return false;
    }

    size_t merged = foreground_call_.getConnections().size() +
                    background_call_.getConnections().size();
    if (merged > profile_.max_connections_per_call) {
        return false;
    }

    if (profile_.merge_via_flash) {
        return pending_three_way_ == INVALID_CONNECTION_ID &&
               (foreground_call_.isMultiparty() || background_call_.hasConnections());
    }

    return background_call_.getState() == CallState::HOLDING &&
           !foreground_call_.isFull() && !background_call_.isFull();
}

void CallTracker::conference() {
    if (!canConference()) {
        throw CallStateException("cannot conference in current state");
    }

    if (profile_.merge_via_flash) {
        LOG_TRACKER(INFO, "CallTracker: conference by flash");
        std::vector<ConnectionId> ids;
        for (const auto& conn : background_call_.getConnections()) {
            ids.push_back(conn.getId());
        }
        for (ConnectionId id : ids) {
            mergeIntoForeground(id);
        }
        radio_.sendFlash("");
        notifyCallStateChanged();
    } else {
        // Legs move to the foreground when the radio reports them ACTIVE
        LOG_TRACKER(INFO, "CallTracker: conference");
        radio_.conference();
    }
    pollCalls();
}

void CallTracker::separate(ConnectionId id) {
    if (!profile_.supports_separate) {
        throw CallStateException(std::string("separate is not supported for ") +
                                 callTechnologyToString(profile_.technology));
    }

    const Connection* conn = foreground_call_.findConnection(id);
    if (!conn || !foreground_call_.isMultiparty() || !conn->hasIndex()) {
        throw CallStateException("connection is not part of the foreground conference");
    }

    LOG_TRACKER(INFO, "CallTracker: separate leg %d", conn->getIndex());
    radio_.separateConnection(conn->getIndex());
    pollCalls();
}

void CallTracker::hangup(ICall& c) {
    Call* target = ownCall(c);
    if (!target) {
        throw CallStateException("call does not belong to this tracker");
    }
    if (target->getState() == CallState::DISCONNECTED ||
        target->getState() == CallState::DISCONNECTING) {
        throw CallStateException(std::string("call already ") + target->toString());
    }
    hangupCall(*target);
}

void CallTracker::hangupCall(Call& c) {
    if (!c.hasConnections()) {
        throw CallStateException("no connections in call");
    }

    if (&c == &ringing_call_) {
        LOG_TRACKER(INFO, "CallTracker: hangup ringing call");
        radio_.hangupWaitingOrBackground();
    } else if (&c == &foreground_call_) {
        const Connection* latest = c.getLatestConnection();
        if (c.isDialingOrAlerting() &&
            (latest->hasIndex() || latest->getId() == pending_mo_)) {
            LOG_TRACKER(INFO, "CallTracker: hangup dialing leg #%u", latest->getId());
            hangupLeg(*c.findConnection(latest->getId()));
        } else {
            LOG_TRACKER(INFO, "CallTracker: hangup foreground call");
            radio_.hangupForegroundResumeBackground();
        }
    } else {
        if (ringing_call_.isRinging()) {
            // Keep the ringing call; release the held legs one by one
            LOG_TRACKER(INFO, "CallTracker: hangup background legs individually");
            for (const auto& conn : c.getConnections()) {
                if (conn.hasIndex()) {
                    radio_.hangupConnection(conn.getIndex());
                }
            }
        } else {
            LOG_TRACKER(INFO, "CallTracker: hangup background call");
            radio_.hangupWaitingOrBackground();
        }
    }

    c.onHangupLocal();
    updatePhoneState();
    notifyCallStateChanged();
    pollCalls();
}

void CallTracker::hangup(ConnectionId id) {
    Connection* conn = locate(id);
    if (!conn) {
        throw CallStateException("unknown connection #" + std::to_string(id));
    }
    if (conn->isDisconnected()) {
        throw CallStateException("connection #" + std::to_string(id) + " already disconnected");
    }
    if (id != pending_mo_ && !conn->hasIndex()) {
        throw CallStateException("connection #" + std::to_string(id) + " index not assigned");
    }

    hangupLeg(*conn);
    notifyCallStateChanged();
    pollCalls();
}

void CallTracker::hangupLeg(Connection& conn) {
    if (conn.getId() == pending_mo_) {
        // Sent once the radio reports the leg
        LOG_TRACKER(DEBUG, "CallTracker: hangup deferred for pending leg #%u", conn.getId());
        hangup_pending_mo_ = true;
    } else {
        radio_.hangupConnection(conn.getIndex());
    }
    conn.onHangupLocal();
}

void CallTracker::clearDisconnected() {
    internalClearDisconnected();
    updatePhoneState();
    notifyCallStateChanged();
}

// ============================================================================
// Local merge (flash-based technologies)
// ============================================================================

bool CallTracker::hasReportedLeg(const Call& c) const {
    for (const auto& conn : c.getConnections()) {
        if (conn.hasIndex() && !conn.isDisconnected() &&
            legs_[conn.getIndex() - 1] == conn.getId()) {
            return true;
        }
    }
    return false;
}

void CallTracker::releaseLegSlot(ConnectionId id) {
    for (auto& entry : legs_) {
        if (entry == id) {
            entry = INVALID_CONNECTION_ID;
        }
    }
}

void CallTracker::mergeIntoForeground(ConnectionId id) {
    Connection* conn = locate(id);
    if (!conn) {
        return;
    }

    // The network now reports this party through the foreground leg
    auto moved = call(conn->getOwner()).detach(id);
    releaseLegSlot(id);
    moved->assignIndex(UNASSIGNED_INDEX);
    moved->markConnected();
    foreground_call_.attachFake(std::move(*moved), CallState::ACTIVE);
}

// ============================================================================
// Notification
// ============================================================================

void CallTracker::internalClearDisconnected() {
    size_t removed = ringing_call_.clearDisconnected() +
                     foreground_call_.clearDisconnected() +
                     background_call_.clearDisconnected();
    if (removed > 0) {
        LOG_TRACKER(DEBUG, "CallTracker: swept %zu disconnected legs", removed);
    }
}

void CallTracker::updatePhoneState() {
    PhoneState old_state = phone_state_;

    if (ringing_call_.isRinging()) {
        phone_state_ = PhoneState::RINGING;
    } else if (pending_mo_ != INVALID_CONNECTION_ID ||
               !(foreground_call_.isIdle() && background_call_.isIdle())) {
        phone_state_ = PhoneState::OFFHOOK;
    } else {
        phone_state_ = PhoneState::IDLE;
    }

    if (phone_state_ != old_state) {
        LOG_TRACKER(INFO, "CallTracker: phone %s -> %s",
                    phoneStateToString(old_state), phoneStateToString(phone_state_));
        if (on_phone_state_changed_) {
            on_phone_state_changed_(phone_state_);
        }
    }
}

void CallTracker::notifyCallStateChanged() {
    if (on_call_state_changed_) {
        on_call_state_changed_();
    }
}

} // namespace callsync
