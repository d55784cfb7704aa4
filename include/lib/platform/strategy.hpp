#ifndef PLATFORM_STRATEGY_HPP
#define PLATFORM_STRATEGY_HPP

#include "lib/config.hpp"
#include "lib/fallback_chain.hpp"
#include "lib/host.hpp"
#include "lib/media_types.hpp"
#include "lib/progress.hpp"
#include "utils/process.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Platform {
    
    struct MountHandle {
        std::string path;       // mount directory or drive letter
        bool scratch = false;   // created by us, must be released
    };
    
    // OS-specific primitives. One implementation per host, chosen once by
    // Platform::create(); the pipeline never branches on the host itself.
    class PlatformStrategy {
    public:
        virtual ~PlatformStrategy() = default;
        
        virtual Host::Platform platform() const = 0;
        
        virtual bool checkPrivileges() = 0;
        virtual std::string resolveFirstPartition(const Media::Device& device) = 0;
        
        // Mounts on a fresh scratch directory; returns "" and leaves nothing behind on failure
        virtual std::string mountPartition(const std::string& partition) = 0;
        virtual void unmountAll(const std::vector<std::string>& mountPoints) = 0;
        
        virtual Media::Result markBootable(const Media::Device& device, 
                                           BootStructures::TableType scheme,
                                           Progress::Reporter& progress) = 0;
        virtual Media::Result writeBiosBoot(const Media::Device& device, 
                                            const Media::BootSpec& boot,
                                            Progress::Reporter& progress) = 0;
        virtual Media::Result writeUefiBoot(const Media::Device& device, 
                                            const Media::BootSpec& boot,
                                            Progress::Reporter& progress) = 0;
        virtual Media::Result writeFreeDosBoot(const Media::Device& device, 
                                               const Media::BootSpec& boot,
                                               Progress::Reporter& progress) = 0;
        
        // Formatting catalogue
        virtual bool supportsFilesystem(FilesystemSupport::FSType fs) const = 0;
        virtual void dismountDevice(const Media::Device& device) = 0;
        virtual std::vector<Fallback::Method> partitionTableMethods(const Media::Device& device,
                                                                    const Media::FormatSpec& spec) = 0;
        virtual std::vector<Fallback::Method> partitionMethods(const Media::Device& device,
                                                               const Media::FormatSpec& spec) = 0;
        virtual std::vector<Fallback::Method> formatMethods(const Media::Device& device,
                                                            const Media::FormatSpec& spec) = 0;
        
        // Single polling attempt; an empty path means "not yet"
        virtual MountHandle resolveMountHandle(const Media::Device& device,
                                               const Media::FormatSpec& spec) = 0;
        
        // Deployment catalogue
        virtual std::string rawDevicePath(const Media::Device& device) const = 0;
        virtual std::vector<Fallback::Method> extractionMethods(const std::string& image,
                                                                const std::string& staging) = 0;
        virtual std::vector<Fallback::Method> windowsBootSectorMethods(const Media::Device& device,
                                                                       const std::string& staging) = 0;
        virtual std::vector<Fallback::Method> dosSystemTransferMethods(const Media::Device& device,
                                                                       const std::string& staging) = 0;
    };
    
    // Releases every tracked mount point through the strategy when it goes out of scope
    class ScopedMounts {
    private:
        PlatformStrategy& strategy;
        std::vector<std::string> mounts;
        
    public:
        explicit ScopedMounts(PlatformStrategy& platformStrategy);
        ~ScopedMounts();
        
        ScopedMounts(const ScopedMounts&) = delete;
        ScopedMounts& operator=(const ScopedMounts&) = delete;
        
        void track(const std::string& mountPoint);
        void releaseAll();
        const std::vector<std::string>& paths() const { return mounts; }
    };
    
    std::unique_ptr<PlatformStrategy> create(Host::Platform platform,
                                             Process::ToolRunner& runner,
                                             const Settings::Config& config);
}

#endif // PLATFORM_STRATEGY_HPP
