#ifndef VERSION_HPP
#define VERSION_HPP

#include <string>

namespace Version {
    extern const std::string VERSION;
    
    // "zlib 1.2.13, liblzma 5.4.1, bzip2 1.0.8"
    std::string codecVersions();
    
    void printVersion();
    void printBanner();
}

#endif // VERSION_HPP
