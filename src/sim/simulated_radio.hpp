#pragma once

#include "tracker/radio_link.hpp"
#include "callsync/driver_call.hpp"
#include "callsync/types.hpp"
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace callsync {

class CallTracker;

namespace sim {

/**
 * Simulated Radio
 *
 * In-memory network and modem model behind the IRadioLink interface.
 * Commands change the model immediately; their results (poll answers, fail
 * causes, flash results, unsolicited state changes) are queued and only
 * delivered by pump(), so the tracker is never re-entered from a command.
 *
 * CDMA mode follows CDMA network behaviour: a three-way party or an
 * accepted waiting call is not reported as a separate leg.
 * When the last other call ends, a waiting call is re-offered as INCOMING.
 *
 * Usage:
 *   SimulatedRadio radio(CallTechnology::CDMA);
 *   CallTracker tracker(radio, config);
 *   radio.connectTracker(tracker);
 *   tracker.dial("5551234");
 *   radio.pump();
 *   radio.remoteAnswer(1);
 *   radio.pump();
 */
class SimulatedRadio : public IRadioLink {
public:
    using PollResultCallback = std::function<void(uint32_t token, const std::vector<DriverCall>& calls)>;
    using FailCauseCallback = std::function<void(int code)>;
    using FlashResultCallback = std::function<void(bool success)>;
    using StateChangedCallback = std::function<void()>;

    // Normal clearing (remote hangup)
    static constexpr int CAUSE_NORMAL = 16;

    explicit SimulatedRadio(CallTechnology technology = CallTechnology::CDMA, size_t max_legs = 8);

    // --- IRadioLink ---

    void getCurrentCalls(uint32_t poll_token) override;
    void getLastCallFailCause() override;
    void dial(const std::string& address) override;
    void acceptCall() override;
    void rejectCall() override;
    void hangupConnection(int index) override;
    void hangupWaitingOrBackground() override;
    void hangupForegroundResumeBackground() override;
    void switchWaitingOrHoldingAndActive() override;
    void conference() override;
    void separateConnection(int index) override;
    void sendFlash(const std::string& feature_code) override;

    // --- Result delivery ---

    // Route every result to the tracker's event entry points
    void connectTracker(CallTracker& tracker);

    void setPollResultCallback(PollResultCallback cb) { on_poll_result_ = std::move(cb); }
    void setFailCauseCallback(FailCauseCallback cb) { on_fail_cause_ = std::move(cb); }
    void setFlashResultCallback(FlashResultCallback cb) { on_flash_result_ = std::move(cb); }
    void setStateChangedCallback(StateChangedCallback cb) { on_state_changed_ = std::move(cb); }

    // Deliver queued results until none are left (delivering a result may
    // queue more). Returns the number delivered.
    size_t pump();
    bool hasPendingResults() const { return !results_.empty(); }

    // --- Network side ---

    // New mobile-terminated call; WAITING if another call exists.
    // Returns the leg index, or -1 if every slot is busy.
    int ringIncoming(const std::string& number);

    bool remoteAlert(int index);
    bool remoteAnswer(int index);
    bool remoteHangup(int index, int fail_cause = CAUSE_NORMAL);

    // The next dial never produces a leg; the fail cause reports why
    void failNextDial(int fail_cause) { fail_next_dial_ = fail_cause; }
    void failNextFlash() { fail_next_flash_ = true; }

    // --- Inspection ---

    const std::vector<DriverCall>& getLegs() const { return legs_; }
    const std::vector<std::string>& getCommandLog() const { return command_log_; }
    int getLastFailCause() const { return last_fail_cause_; }
    CallTechnology getTechnology() const { return technology_; }

private:
    CallTechnology technology_;
    size_t max_legs_;

    std::vector<DriverCall> legs_;
    int last_fail_cause_ = CAUSE_NORMAL;
    std::optional<int> fail_next_dial_;
    bool fail_next_flash_ = false;

    std::deque<std::function<void()>> results_;
    std::vector<std::string> command_log_;

    PollResultCallback on_poll_result_;
    FailCauseCallback on_fail_cause_;
    FlashResultCallback on_flash_result_;
    StateChangedCallback on_state_changed_;

    // Upper bound for one pump() so a feedback loop cannot spin forever
    static constexpr size_t MAX_RESULTS_PER_PUMP = 1000;

    int freeIndex() const;
    DriverCall* findLeg(int index);
    bool hasLegIn(DriverCallState state) const;
    void removeLegs(const std::function<bool(const DriverCall&)>& pred);
    void realertWaiting();
    void refreshMultiparty();
    void queueStateChanged();
    void logCommand(const std::string& command);
};

} // namespace sim
} // namespace callsync
