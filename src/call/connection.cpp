#include "connection.hpp"
#include "callsync/logging.hpp"
#include <sstream>

namespace callsync {

Connection::Connection(ConnectionId id, const DriverCall& dc, CallSlot owner)
    : id_(id)
    , index_(dc.index)
    , address_(dc.number)
    , incoming_(dc.is_mt)
    , owner_(owner)
    , last_dc_(dc)
{
    if (dc.state == DriverCallState::ACTIVE || dc.state == DriverCallState::HOLDING) {
        connected_ = true;
    }
}

Connection::Connection(ConnectionId id, const std::string& address, CallSlot owner)
    : id_(id)
    , address_(address)
    , owner_(owner)
{
}

CallState Connection::getState() const {
    if (disconnected_) {
        return CallState::DISCONNECTED;
    }
    if (hangup_pending_) {
        return CallState::DISCONNECTING;
    }
    return parent_state_;
}

bool Connection::isAlive() const {
    CallState state = getState();
    return state != CallState::IDLE && state != CallState::DISCONNECTED &&
           state != CallState::DISCONNECTING;
}

bool Connection::update(const DriverCall& dc) {
    bool changed = false;

    if (!dc.number.empty() && dc.number != address_) {
        LOG_CALL(DEBUG, "Connection %u: address updated", id_);
        address_ = dc.number;
        changed = true;
    }

    if (last_dc_ && last_dc_->is_mpty != dc.is_mpty) {
        changed = true;
    }

    if (dc.state == DriverCallState::ACTIVE || dc.state == DriverCallState::HOLDING) {
        connected_ = true;
    }

    last_dc_ = dc;
    return changed;
}

bool Connection::matchesPendingDial(const DriverCall& dc) const {
    // Networks reformat dialed numbers, so only direction and progress are compared
    if (incoming_ || dc.is_mt) {
        return false;
    }
    return dc.state == DriverCallState::DIALING || dc.state == DriverCallState::ALERTING ||
           dc.state == DriverCallState::ACTIVE;
}

void Connection::onHangupLocal() {
    if (disconnected_) {
        return;
    }
    hangup_pending_ = true;
    pending_cause_ = DisconnectCause::LOCAL;
}

bool Connection::onDisconnect(DisconnectCause cause) {
    if (disconnected_) {
        return false;
    }

    disconnected_ = true;
    hangup_pending_ = false;
    cause_ = cause;

    LOG_CALL(INFO, "Connection %u (index %d) disconnected: %s",
             id_, index_, disconnectCauseToString(cause));
    return true;
}

std::string Connection::toString() const {
    std::ostringstream out;
    out << "#" << id_ << " idx=" << index_ << " " << callStateToString(getState())
        << (incoming_ ? " mt" : " mo");
    if (!address_.empty()) out << " " << address_;
    if (disconnected_) out << " (" << disconnectCauseToString(cause_) << ")";
    return out.str();
}

} // namespace callsync
