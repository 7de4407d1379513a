#pragma once

#include <string>

namespace droidlink::buildinfo {

inline std::string git_commit() {
#ifdef DROIDLINK_GIT_COMMIT
    return std::string(DROIDLINK_GIT_COMMIT);
#else
    return "unknown";
#endif
}

inline std::string version() {
#ifdef DROIDLINK_VERSION
    return std::string(DROIDLINK_VERSION);
#else
    return "0.0.0";
#endif
}

inline std::string build_time_utc_approx() {
    // Not truly UTC, but stable and available without runtime deps.
    return std::string(__DATE__) + " " + std::string(__TIME__);
}

} // namespace droidlink::buildinfo
