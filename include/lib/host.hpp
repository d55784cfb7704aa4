#ifndef HOST_HPP
#define HOST_HPP

#include <string>

namespace Host {
    enum class Platform {
        LINUX,
        WINDOWS,
        MACOS,
        UNSUPPORTED
    };
    
    Platform detect();
    std::string getPlatformName(Platform platform);
}

#endif // HOST_HPP
