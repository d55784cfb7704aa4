#include "lib/platform/unsupported.hpp"

namespace Platform {
    
    static Media::Result unavailable(const std::string& operation) {
        return Media::Result::fail("UnsupportedPlatformError: " + operation + " is not available on this host");
    }
    
    Host::Platform UnsupportedStrategy::platform() const {
        return Host::Platform::UNSUPPORTED;
    }
    
    bool UnsupportedStrategy::checkPrivileges() {
        return false;
    }
    
    std::string UnsupportedStrategy::resolveFirstPartition(const Media::Device&) {
        return "";
    }
    
    std::string UnsupportedStrategy::mountPartition(const std::string&) {
        return "";
    }
    
    void UnsupportedStrategy::unmountAll(const std::vector<std::string>&) {
    }
    
    Media::Result UnsupportedStrategy::markBootable(const Media::Device&, BootStructures::TableType,
                                                    Progress::Reporter&) {
        return unavailable("Marking a partition bootable");
    }
    
    Media::Result UnsupportedStrategy::writeBiosBoot(const Media::Device&, const Media::BootSpec&,
                                                     Progress::Reporter&) {
        return unavailable("BIOS boot");
    }
    
    Media::Result UnsupportedStrategy::writeUefiBoot(const Media::Device&, const Media::BootSpec&,
                                                     Progress::Reporter&) {
        return unavailable("UEFI boot");
    }
    
    Media::Result UnsupportedStrategy::writeFreeDosBoot(const Media::Device&, const Media::BootSpec&,
                                                        Progress::Reporter&) {
        return unavailable("FreeDOS boot");
    }
    
    bool UnsupportedStrategy::supportsFilesystem(FilesystemSupport::FSType) const {
        return false;
    }
    
    void UnsupportedStrategy::dismountDevice(const Media::Device&) {
    }
    
    std::vector<Fallback::Method> UnsupportedStrategy::partitionTableMethods(const Media::Device&,
                                                                             const Media::FormatSpec&) {
        return {};
    }
    
    std::vector<Fallback::Method> UnsupportedStrategy::partitionMethods(const Media::Device&,
                                                                        const Media::FormatSpec&) {
        return {};
    }
    
    std::vector<Fallback::Method> UnsupportedStrategy::formatMethods(const Media::Device&,
                                                                     const Media::FormatSpec&) {
        return {};
    }
    
    MountHandle UnsupportedStrategy::resolveMountHandle(const Media::Device&, const Media::FormatSpec&) {
        return MountHandle();
    }
    
    std::string UnsupportedStrategy::rawDevicePath(const Media::Device&) const {
        return "";
    }
    
    std::vector<Fallback::Method> UnsupportedStrategy::extractionMethods(const std::string&,
                                                                         const std::string&) {
        return {};
    }
    
    std::vector<Fallback::Method> UnsupportedStrategy::windowsBootSectorMethods(const Media::Device&,
                                                                                const std::string&) {
        return {};
    }
    
    std::vector<Fallback::Method> UnsupportedStrategy::dosSystemTransferMethods(const Media::Device&,
                                                                                const std::string&) {
        return {};
    }
}
