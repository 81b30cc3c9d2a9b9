#pragma once

#include "callsync/types.hpp"
#include <cstddef>

namespace callsync {

/**
 * Call technology payload
 *
 * Everything that differs between call technology families. Calls share
 * one aggregation algorithm; the profile chosen from configuration supplies
 * the limits and the conference protocol:
 *
 * - CDMA: the network reports a single leg for a three-way or call-waiting
 *   session. Merging is a flash toward the network plus a local move of the
 *   legs into the foreground call. Calls cannot be split.
 * - GSM: every leg is reported. Merging and splitting are network commands
 *   and the next snapshot re-parents the legs.
 */
struct CallProfile {
    CallTechnology technology = CallTechnology::CDMA;
    size_t max_connections = 8;            // Leg slots tracked (driver index 1..N)
    size_t max_connections_per_call = 2;   // Conference capacity
    bool merge_via_flash = true;           // Conference/accept-waiting by flash
    bool supports_separate = false;        // Split one leg out of a conference
    bool supports_hold = false;            // Network-side hold
};

// Default payload for a technology family
CallProfile makeCallProfile(CallTechnology technology);

} // namespace callsync
