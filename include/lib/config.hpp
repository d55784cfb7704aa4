#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <chrono>
#include <string>
#include <vector>

namespace Settings {
    
    struct Timeouts {
        std::chrono::seconds boot{30};
        std::chrono::seconds partition{60};
        std::chrono::seconds quickFormat{300};
        std::chrono::seconds fullFormat{6 * 3600};
        std::chrono::seconds extract{3600};
        std::chrono::seconds probe{10};
    };
    
    struct Config {
        std::string tempRoot;
        std::string bootsectPath;                   // BOOTSECT_PATH
        std::string hardcodedBootsectPath = "C:\\tools\\bootsect.exe";
        std::vector<std::string> mbrSearchPaths;
        std::vector<std::string> efiLoaderPaths;
        std::vector<std::string> efiScanDirs;
        Timeouts timeouts;
        int mountPollAttempts = 10;
        std::chrono::milliseconds mountPollInterval{1000};
        std::string logFile;
        bool verbose = false;
    };
    
    Config defaults();
    
    // defaults() overlaid with BOOTFORGE_TMPDIR, BOOTSECT_PATH, BOOTFORGE_MBR_PATH,
    // BOOTFORGE_LOG_FILE and BOOTFORGE_TOOL_TIMEOUT
    Config fromEnvironment();
}

#endif // CONFIG_HPP
