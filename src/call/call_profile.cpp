#include "call_profile.hpp"

namespace callsync {

CallProfile makeCallProfile(CallTechnology technology) {
    CallProfile profile;
    profile.technology = technology;

    switch (technology) {
        case CallTechnology::GSM:
            profile.max_connections = 7;
            profile.max_connections_per_call = 5;
            profile.merge_via_flash = false;
            profile.supports_separate = true;
            profile.supports_hold = true;
            break;

        case CallTechnology::CDMA:
        default:
            // Three-way calling: the original party plus one added party
            profile.max_connections = 8;
            profile.max_connections_per_call = 2;
            profile.merge_via_flash = true;
            profile.supports_separate = false;
            profile.supports_hold = false;
            break;
    }

    return profile;
}

} // namespace callsync
