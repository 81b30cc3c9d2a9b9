#include "simulated_radio.hpp"
#include "tracker/call_tracker.hpp"
#include "callsync/logging.hpp"
#include <algorithm>

namespace callsync {
namespace sim {

// Radio-level fail cause when every leg slot is in use
static constexpr int CAUSE_NO_CIRCUIT = 34;

SimulatedRadio::SimulatedRadio(CallTechnology technology, size_t max_legs)
    : technology_(technology)
    , max_legs_(max_legs)
{
}

void SimulatedRadio::connectTracker(CallTracker& tracker) {
    on_poll_result_ = [&tracker](uint32_t token, const std::vector<DriverCall>& calls) {
        tracker.onPollResult(token, calls);
    };
    on_fail_cause_ = [&tracker](int code) { tracker.onLastCallFailCause(code); };
    on_flash_result_ = [&tracker](bool success) { tracker.onFlashResult(success); };
    on_state_changed_ = [&tracker]() { tracker.onCallStateChanged(); };
}

size_t SimulatedRadio::pump() {
    size_t delivered = 0;

    while (!results_.empty()) {
        if (delivered >= MAX_RESULTS_PER_PUMP) {
            LOG_RADIO(WARN, "SimulatedRadio: result limit reached, %zu left queued", results_.size());
            break;
        }

        auto result = std::move(results_.front());
        results_.pop_front();
        result();
        delivered++;
    }

    return delivered;
}

// ============================================================================
// IRadioLink
// ============================================================================

void SimulatedRadio::getCurrentCalls(uint32_t poll_token) {
    std::vector<DriverCall> snapshot = legs_;
    results_.push_back([this, poll_token, snapshot]() {
        if (on_poll_result_) on_poll_result_(poll_token, snapshot);
    });
}

void SimulatedRadio::getLastCallFailCause() {
    int code = last_fail_cause_;
    results_.push_back([this, code]() {
        if (on_fail_cause_) on_fail_cause_(code);
    });
}

void SimulatedRadio::dial(const std::string& address) {
    logCommand("dial " + address);

    if (fail_next_dial_) {
        last_fail_cause_ = *fail_next_dial_;
        fail_next_dial_.reset();
        LOG_RADIO(INFO, "SimulatedRadio: dial %s fails with cause %d", address.c_str(), last_fail_cause_);
        return;
    }

    int index = freeIndex();
    if (index < 0) {
        last_fail_cause_ = CAUSE_NO_CIRCUIT;
        LOG_RADIO(WARN, "SimulatedRadio: no free leg for dial %s", address.c_str());
        return;
    }

    DriverCall dc;
    dc.index = index;
    dc.state = DriverCallState::DIALING;
    dc.is_mt = false;
    dc.number = address;
    legs_.push_back(dc);
}

void SimulatedRadio::acceptCall() {
    logCommand("accept");
    realertWaiting();
    for (auto& dc : legs_) {
        if (dc.state == DriverCallState::INCOMING) {
            dc.state = DriverCallState::ACTIVE;
        }
    }
}

void SimulatedRadio::rejectCall() {
    logCommand("reject");
    removeLegs([](const DriverCall& dc) {
        return dc.state == DriverCallState::INCOMING || dc.state == DriverCallState::WAITING;
    });
}

void SimulatedRadio::hangupConnection(int index) {
    logCommand("hangup " + std::to_string(index));
    last_fail_cause_ = CAUSE_NORMAL;
    removeLegs([index](const DriverCall& dc) { return dc.index == index; });
    realertWaiting();
    refreshMultiparty();
}

void SimulatedRadio::hangupWaitingOrBackground() {
    logCommand("hangup-waiting-or-background");
    last_fail_cause_ = CAUSE_NORMAL;

    if (hasLegIn(DriverCallState::INCOMING) || hasLegIn(DriverCallState::WAITING)) {
        removeLegs([](const DriverCall& dc) {
            return dc.state == DriverCallState::INCOMING || dc.state == DriverCallState::WAITING;
        });
    } else {
        removeLegs([](const DriverCall& dc) { return dc.state == DriverCallState::HOLDING; });
    }
    refreshMultiparty();
}

void SimulatedRadio::hangupForegroundResumeBackground() {
    logCommand("hangup-foreground-resume-background");
    last_fail_cause_ = CAUSE_NORMAL;

    removeLegs([](const DriverCall& dc) {
        return dc.state == DriverCallState::ACTIVE || dc.state == DriverCallState::DIALING ||
               dc.state == DriverCallState::ALERTING;
    });

    // A waiting call takes precedence over the held one
    DriverCallState resumed = hasLegIn(DriverCallState::WAITING) ? DriverCallState::WAITING
                                                                 : DriverCallState::HOLDING;
    for (auto& dc : legs_) {
        if (dc.state == resumed) {
            dc.state = DriverCallState::ACTIVE;
        }
    }
    refreshMultiparty();
}

void SimulatedRadio::switchWaitingOrHoldingAndActive() {
    logCommand("switch");

    if (hasLegIn(DriverCallState::WAITING)) {
        for (auto& dc : legs_) {
            if (dc.state == DriverCallState::ACTIVE) {
                dc.state = DriverCallState::HOLDING;
            } else if (dc.state == DriverCallState::WAITING) {
                dc.state = DriverCallState::ACTIVE;
            }
        }
    } else {
        for (auto& dc : legs_) {
            if (dc.state == DriverCallState::ACTIVE) {
                dc.state = DriverCallState::HOLDING;
            } else if (dc.state == DriverCallState::HOLDING) {
                dc.state = DriverCallState::ACTIVE;
            }
        }
    }
    refreshMultiparty();
}

void SimulatedRadio::conference() {
    logCommand("conference");
    for (auto& dc : legs_) {
        if (dc.state == DriverCallState::HOLDING) {
            dc.state = DriverCallState::ACTIVE;
        }
    }
    refreshMultiparty();
}

void SimulatedRadio::separateConnection(int index) {
    logCommand("separate " + std::to_string(index));
    for (auto& dc : legs_) {
        if (dc.state == DriverCallState::ACTIVE && dc.index != index) {
            dc.state = DriverCallState::HOLDING;
        }
    }
    refreshMultiparty();
}

void SimulatedRadio::sendFlash(const std::string& feature_code) {
    logCommand("flash " + feature_code);

    bool success = true;
    if (fail_next_flash_) {
        fail_next_flash_ = false;
        success = false;
    } else if (feature_code.empty()) {
        // The waiting party joins the single traffic channel
        removeLegs([](const DriverCall& dc) { return dc.state == DriverCallState::WAITING; });
    }

    results_.push_back([this, success]() {
        if (on_flash_result_) on_flash_result_(success);
    });
}

// ============================================================================
// Network side
// ============================================================================

int SimulatedRadio::ringIncoming(const std::string& number) {
    int index = freeIndex();
    if (index < 0) {
        LOG_RADIO(WARN, "SimulatedRadio: no free leg for incoming %s", number.c_str());
        return -1;
    }

    DriverCall dc;
    dc.index = index;
    dc.state = legs_.empty() ? DriverCallState::INCOMING : DriverCallState::WAITING;
    dc.is_mt = true;
    dc.number = number;
    legs_.push_back(dc);

    LOG_RADIO(INFO, "SimulatedRadio: incoming %s", dc.toString().c_str());
    queueStateChanged();
    return index;
}

bool SimulatedRadio::remoteAlert(int index) {
    DriverCall* dc = findLeg(index);
    if (!dc || dc->state != DriverCallState::DIALING) {
        return false;
    }
    dc->state = DriverCallState::ALERTING;
    queueStateChanged();
    return true;
}

bool SimulatedRadio::remoteAnswer(int index) {
    DriverCall* dc = findLeg(index);
    if (!dc || (dc->state != DriverCallState::DIALING && dc->state != DriverCallState::ALERTING)) {
        return false;
    }
    dc->state = DriverCallState::ACTIVE;
    queueStateChanged();
    return true;
}

bool SimulatedRadio::remoteHangup(int index, int fail_cause) {
    if (!findLeg(index)) {
        return false;
    }
    last_fail_cause_ = fail_cause;
    removeLegs([index](const DriverCall& dc) { return dc.index == index; });
    realertWaiting();
    refreshMultiparty();
    queueStateChanged();
    return true;
}

// ============================================================================
// Helpers
// ============================================================================

int SimulatedRadio::freeIndex() const {
    for (size_t i = 1; i <= max_legs_; i++) {
        bool used = std::any_of(legs_.begin(), legs_.end(),
                                [i](const DriverCall& dc) { return dc.index == static_cast<int>(i); });
        if (!used) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

DriverCall* SimulatedRadio::findLeg(int index) {
    for (auto& dc : legs_) {
        if (dc.index == index) return &dc;
    }
    return nullptr;
}

bool SimulatedRadio::hasLegIn(DriverCallState state) const {
    return std::any_of(legs_.begin(), legs_.end(),
                       [state](const DriverCall& dc) { return dc.state == state; });
}

void SimulatedRadio::removeLegs(const std::function<bool(const DriverCall&)>& pred) {
    legs_.erase(std::remove_if(legs_.begin(), legs_.end(), pred), legs_.end());
}

// A waiting call left alone is offered again as a normal incoming call
void SimulatedRadio::realertWaiting() {
    bool only_waiting = std::all_of(legs_.begin(), legs_.end(),
                                    [](const DriverCall& dc) { return dc.state == DriverCallState::WAITING; });
    if (!only_waiting) {
        return;
    }
    for (auto& dc : legs_) {
        dc.state = DriverCallState::INCOMING;
    }
}

void SimulatedRadio::refreshMultiparty() {
    if (technology_ == CallTechnology::CDMA) {
        return;
    }

    auto count = [this](DriverCallState state) {
        return std::count_if(legs_.begin(), legs_.end(),
                             [state](const DriverCall& dc) { return dc.state == state; });
    };
    auto active = count(DriverCallState::ACTIVE);
    auto held = count(DriverCallState::HOLDING);

    for (auto& dc : legs_) {
        if (dc.state == DriverCallState::ACTIVE) {
            dc.is_mpty = active > 1;
        } else if (dc.state == DriverCallState::HOLDING) {
            dc.is_mpty = held > 1;
        }
    }
}

void SimulatedRadio::queueStateChanged() {
    results_.push_back([this]() {
        if (on_state_changed_) on_state_changed_();
    });
}

void SimulatedRadio::logCommand(const std::string& command) {
    LOG_RADIO(DEBUG, "SimulatedRadio: <- %s", command.c_str());
    command_log_.push_back(command);
}

} // namespace sim
} // namespace callsync
