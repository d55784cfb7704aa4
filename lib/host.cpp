#include "lib/host.hpp"

namespace Host {
    
    Platform detect() {
#if defined(__linux__)
        return Platform::LINUX;
#elif defined(_WIN32) || defined(__CYGWIN__)
        return Platform::WINDOWS;
#elif defined(__APPLE__)
        return Platform::MACOS;
#else
        return Platform::UNSUPPORTED;
#endif
    }
    
    std::string getPlatformName(Platform platform) {
        switch (platform) {
            case Platform::LINUX: return "Linux";
            case Platform::WINDOWS: return "Windows";
            case Platform::MACOS: return "macOS";
            default: return "unsupported";
        }
    }
}
