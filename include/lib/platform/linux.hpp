#ifndef PLATFORM_LINUX_HPP
#define PLATFORM_LINUX_HPP

#include "lib/platform/strategy.hpp"

namespace Platform {
    
    class LinuxStrategy : public PlatformStrategy {
    private:
        Process::ToolRunner& runner;
        Settings::Config config;
        
    public:
        LinuxStrategy(Process::ToolRunner& toolRunner, const Settings::Config& settings);
        
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
        
    private:
        std::string activeMount(const Media::Device& device);
        void releasePartition(const std::string& partition);
        bool waitForPartition(const std::string& device);
        Media::Result installBootCode(const std::string& device, BootStructures::TableType scheme);
        
        Fallback::Method partitionStep(const std::string& name, const std::vector<std::string>& argv,
                                       const std::string& device, const std::string& input = "");
        Fallback::Method syslinuxMethod(const Media::Device& device, BootStructures::TableType scheme);
        Fallback::Method extlinuxMethod(const Media::Device& device, BootStructures::TableType scheme);
        Fallback::Method grubMethod(const std::string& mountPoint);
        Fallback::Method freeDosRecordMethod(const Media::Device& device);
    };
}

#endif // PLATFORM_LINUX_HPP
