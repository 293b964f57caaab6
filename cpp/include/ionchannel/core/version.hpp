#pragma once

#ifndef IC_VERSION_MAJOR
#define IC_VERSION_MAJOR 0
#endif
#ifndef IC_VERSION_MINOR
#define IC_VERSION_MINOR 1
#endif
#ifndef IC_VERSION_PATCH
#define IC_VERSION_PATCH 0
#endif

namespace ionchannel {

/// Version information
struct Version {
    static constexpr int MAJOR = IC_VERSION_MAJOR;
    static constexpr int MINOR = IC_VERSION_MINOR;
    static constexpr int PATCH = IC_VERSION_PATCH;

    static const char* get_version_string();
};

} // namespace ionchannel
