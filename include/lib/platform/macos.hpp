#ifndef PLATFORM_MACOS_HPP
#define PLATFORM_MACOS_HPP

#include "lib/platform/strategy.hpp"

namespace Platform {
    
    class MacStrategy : public PlatformStrategy {
    private:
        Process::ToolRunner& runner;
        Settings::Config config;
        
    public:
        MacStrategy(Process::ToolRunner& toolRunner, const Settings::Config& settings);
        
        Host::Platform platform() const override;
        
        bool checkPrivileges() override;
        std::string resolveFirstPartition(const Media::Device& device) override;
        std::string mountPartition(const std::string& partition) override;
        void unmountAll(const std::vector<std::string>& mountPoints) override;
        
        Media::Result markBootable(const Media::Device& device, BootStructures::TableType scheme,
                                   Progress::Reporter& progress) override;
        Media::Result writeBiosBoot(const Media::Device& device, const Media::BootSpec& boot,
                                    Progress::Reporter& progress) override;
        Media::Result writeUefiBoot(const Media::Device& device, const Media::BootSpec& boot,
                                    Progress::Reporter& progress) override;
        Media::Result writeFreeDosBoot(const Media::Device& device, const Media::BootSpec& boot,
                                       Progress::Reporter& progress) override;
        
        bool supportsFilesystem(FilesystemSupport::FSType fs) const override;
        void dismountDevice(const Media::Device& device) override;
        std::vector<Fallback::Method> partitionTableMethods(const Media::Device& device,
                                                            const Media::FormatSpec& spec) override;
        std::vector<Fallback::Method> partitionMethods(const Media::Device& device,
                                                       const Media::FormatSpec& spec) override;
        std::vector<Fallback::Method> formatMethods(const Media::Device& device,
                                                    const Media::FormatSpec& spec) override;
        MountHandle resolveMountHandle(const Media::Device& device,
                                       const Media::FormatSpec& spec) override;
        
        std::string rawDevicePath(const Media::Device& device) const override;
        std::vector<Fallback::Method> extractionMethods(const std::string& image,
                                                        const std::string& staging) override;
        std::vector<Fallback::Method> windowsBootSectorMethods(const Media::Device& device,
                                                               const std::string& staging) override;
        std::vector<Fallback::Method> dosSystemTransferMethods(const Media::Device& device,
                                                               const std::string& staging) override;
        
        // /dev/disk2 for "disk2", "rdisk2" or "/dev/rdisk2"
        static std::string diskPath(const std::string& name);
        
    private:
        bool partitionPresent(const std::string& partition);
        std::string mountedVolume(const std::string& partition);
        Media::Result legacyBoot(const Media::Device& device, BootStructures::TableType scheme,
                                 const std::string& goal, Progress::Reporter& progress);
    };
}

#endif // PLATFORM_MACOS_HPP
