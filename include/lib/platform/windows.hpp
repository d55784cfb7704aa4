#ifndef PLATFORM_WINDOWS_HPP
#define PLATFORM_WINDOWS_HPP

#include "lib/platform/strategy.hpp"

namespace Platform {
    
    // Drives Windows through diskpart, PowerShell storage cmdlets and the
    // boot tools shipped with Windows or on PATH.
    class WindowsStrategy : public PlatformStrategy {
    private:
        Process::ToolRunner& runner;
        Settings::Config config;
        
    public:
        WindowsStrategy(Process::ToolRunner& toolRunner, const Settings::Config& settings);
        
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
        
        // "E:\" and "e" both become "E:"
        static std::string normalizeDriveLetter(const std::string& drive);
        
    private:
        int diskNumber(const Media::Device& device) const;
        std::string driveOf(const Media::Device& device);
        
        Fallback::Method diskpartMethod(const std::string& name, const std::vector<std::string>& script,
                                        std::chrono::seconds timeout);
        Fallback::Method powershellMethod(const std::string& name, const std::string& command,
                                          std::chrono::seconds timeout);
        Fallback::Method bootsectMethod(const std::string& name, const std::string& tool,
                                        const std::string& drive);
        Fallback::Method efiCopyMethod(const std::string& name, const std::string& source,
                                       const std::string& drive);
    };
}

#endif // PLATFORM_WINDOWS_HPP
