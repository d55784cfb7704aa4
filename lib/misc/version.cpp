#include "misc/version.hpp"
#include "utils/colors.hpp"
#include <iostream>
#include <zlib.h>
#include <lzma.h>
#include <bzlib.h>

namespace Version {
    const std::string VERSION = "1.0.0";
    
    std::string codecVersions() {
        std::string bzip2 = BZ2_bzlibVersion();
        bzip2 = bzip2.substr(0, bzip2.find(','));
        
        return std::string("zlib ") + zlibVersion() + 
               ", liblzma " + lzma_version_string() + 
               ", bzip2 " + bzip2;
    }
    
    void printVersion() {
        std::cout << Colors::bold("BootForge") << " v" << VERSION << std::endl;
        std::cout << "Image codecs: " << codecVersions() << std::endl;
    }
    
    void printBanner() {
        std::cout << Colors::cyan(R"(
 ____              _   _____                    
| __ )  ___   ___ | |_|  ___|__  _ __ __ _  ___ 
|  _ \ / _ \ / _ \| __| |_ / _ \| '__/ _` |/ _ \
| |_) | (_) | (_) | |_|  _| (_) | | | (_| |  __/
|____/ \___/ \___/ \__|_|  \___/|_|  \__, |\___|
                                     |___/      
)") << std::endl;
        std::cout << Colors::bold("BootForge") << " v" << VERSION << " - ";
        std::cout << "Boot Media Creator" << std::endl;
        std::cout << std::endl;
    }
}
