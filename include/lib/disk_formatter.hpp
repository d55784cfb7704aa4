#ifndef DISK_FORMATTER_HPP
#define DISK_FORMATTER_HPP

#include "lib/config.hpp"
#include "lib/media_types.hpp"
#include "lib/platform/strategy.hpp"
#include "lib/progress.hpp"
#include <string>

namespace DiskFormatter {
    
    struct FormatResult {
        bool success = false;
        std::string mountHandle;
        bool scratch = false;       // mountHandle is a scratch mount owned by the caller
        std::string message;
    };
    
    class Formatter {
    private:
        Platform::PlatformStrategy& strategy;
        Settings::Config config;
        
    public:
        Formatter(Platform::PlatformStrategy& platformStrategy, const Settings::Config& settings);
        
        // Partition, format and mount the device. Updates device.mountPoint on success.
        FormatResult format(Media::Device& device, const Media::FormatSpec& spec, 
                            Progress::Reporter& progress);
        
    private:
        void runStep(const std::string& goal, std::vector<Fallback::Method> methods,
                     Progress::Reporter& progress, int low, int high, bool partitioning);
        Platform::MountHandle pollMountHandle(const Media::Device& device, const Media::FormatSpec& spec);
    };
}

#endif // DISK_FORMATTER_HPP
