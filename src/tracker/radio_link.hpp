#pragma once

#include <cstdint>
#include <string>

namespace callsync {

/**
 * Radio Link Interface
 *
 * Narrow command surface of the radio/transport collaborator. Every command
 * is fire-and-forget: it returns immediately and its outcome shows up later
 * as a tracker event (poll result, last call fail cause, flash result).
 * Implementations must never call back into the tracker from inside a
 * command.
 *
 * Timeout and retry policy, if any, belongs to the implementation.
 */
class IRadioLink {
public:
    virtual ~IRadioLink() = default;

    // Request the current call list; answered by CallTracker::onPollResult
    // carrying the same token
    virtual void getCurrentCalls(uint32_t poll_token) = 0;

    // Cause of the most recent network-side disconnect; answered by
    // CallTracker::onLastCallFailCause
    virtual void getLastCallFailCause() = 0;

    virtual void dial(const std::string& address) = 0;
    virtual void acceptCall() = 0;
    virtual void rejectCall() = 0;

    virtual void hangupConnection(int index) = 0;
    virtual void hangupWaitingOrBackground() = 0;
    virtual void hangupForegroundResumeBackground() = 0;

    virtual void switchWaitingOrHoldingAndActive() = 0;
    virtual void conference() = 0;
    virtual void separateConnection(int index) = 0;

    // CDMA flash: empty feature code for accept-waiting / conference,
    // an address for a three-way dial; answered by CallTracker::onFlashResult
    virtual void sendFlash(const std::string& feature_code) = 0;
};

} // namespace callsync
