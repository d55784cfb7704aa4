#include "lib/platform/strategy.hpp"
#include "lib/platform/linux.hpp"
#include "lib/platform/macos.hpp"
#include "lib/platform/unsupported.hpp"
#include "lib/platform/windows.hpp"
#include "utils/logs.hpp"

namespace Platform {
    
    ScopedMounts::ScopedMounts(PlatformStrategy& platformStrategy)
        : strategy(platformStrategy) {
    }
    
    ScopedMounts::~ScopedMounts() {
        try {
            releaseAll();
        } catch (const std::exception& e) {
            Logs::error(std::string("Releasing mounts failed: ") + e.what());
        }
    }
    
    void ScopedMounts::track(const std::string& mountPoint) {
        if (!mountPoint.empty()) {
            mounts.push_back(mountPoint);
        }
    }
    
    void ScopedMounts::releaseAll() {
        if (mounts.empty()) {
            return;
        }
        
        std::vector<std::string> pending;
        pending.swap(mounts);
        strategy.unmountAll(pending);
    }
    
    std::unique_ptr<PlatformStrategy> create(Host::Platform platform,
                                             Process::ToolRunner& runner,
                                             const Settings::Config& config) {
        switch (platform) {
            case Host::Platform::LINUX:
                return std::unique_ptr<PlatformStrategy>(new LinuxStrategy(runner, config));
            case Host::Platform::WINDOWS:
                return std::unique_ptr<PlatformStrategy>(new WindowsStrategy(runner, config));
            case Host::Platform::MACOS:
                return std::unique_ptr<PlatformStrategy>(new MacStrategy(runner, config));
            default:
                return std::unique_ptr<PlatformStrategy>(new UnsupportedStrategy());
        }
    }
}
