#ifndef PLATFORM_UNSUPPORTED_HPP
#define PLATFORM_UNSUPPORTED_HPP

#include "lib/platform/strategy.hpp"

namespace Platform {
    
    // Reports every capability as unavailable
    class UnsupportedStrategy : public PlatformStrategy {
    public:
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
    };
}

#endif // PLATFORM_UNSUPPORTED_HPP
