#ifndef MOCK_PLATFORM_HPP
#define MOCK_PLATFORM_HPP

#include <gmock/gmock.h>

#include "lib/platform/strategy.hpp"

namespace Platform {
    
    class MockPlatformStrategy : public PlatformStrategy {
    public:
        MOCK_METHOD(Host::Platform, platform, (), (const, override));
        
        MOCK_METHOD(bool, checkPrivileges, (), (override));
        MOCK_METHOD(std::string, resolveFirstPartition, (const Media::Device& device), (override));
        MOCK_METHOD(std::string, mountPartition, (const std::string& partition), (override));
        MOCK_METHOD(void, unmountAll, (const std::vector<std::string>& mountPoints), (override));
        
        MOCK_METHOD(Media::Result, markBootable, (const Media::Device& device, BootStructures::TableType scheme,
                                                  Progress::Reporter& progress), (override));
        MOCK_METHOD(Media::Result, writeBiosBoot, (const Media::Device& device, const Media::BootSpec& boot,
                                                   Progress::Reporter& progress), (override));
        MOCK_METHOD(Media::Result, writeUefiBoot, (const Media::Device& device, const Media::BootSpec& boot,
                                                   Progress::Reporter& progress), (override));
        MOCK_METHOD(Media::Result, writeFreeDosBoot, (const Media::Device& device, const Media::BootSpec& boot,
                                                      Progress::Reporter& progress), (override));
        
        MOCK_METHOD(bool, supportsFilesystem, (FilesystemSupport::FSType fs), (const, override));
        MOCK_METHOD(void, dismountDevice, (const Media::Device& device), (override));
        MOCK_METHOD(std::vector<Fallback::Method>, partitionTableMethods, 
                    (const Media::Device& device, const Media::FormatSpec& spec), (override));
        MOCK_METHOD(std::vector<Fallback::Method>, partitionMethods, 
                    (const Media::Device& device, const Media::FormatSpec& spec), (override));
        MOCK_METHOD(std::vector<Fallback::Method>, formatMethods, 
                    (const Media::Device& device, const Media::FormatSpec& spec), (override));
        MOCK_METHOD(MountHandle, resolveMountHandle, 
                    (const Media::Device& device, const Media::FormatSpec& spec), (override));
        
        MOCK_METHOD(std::string, rawDevicePath, (const Media::Device& device), (const, override));
        MOCK_METHOD(std::vector<Fallback::Method>, extractionMethods, 
                    (const std::string& image, const std::string& staging), (override));
        MOCK_METHOD(std::vector<Fallback::Method>, windowsBootSectorMethods, 
                    (const Media::Device& device, const std::string& staging), (override));
        MOCK_METHOD(std::vector<Fallback::Method>, dosSystemTransferMethods, 
                    (const Media::Device& device, const std::string& staging), (override));
    };
    
    inline Fallback::Method succeedingMethod(const std::string& name) {
        Fallback::Method method;
        method.name = name;
        method.action = []() { return Media::Result::ok(); };
        return method;
    }
    
    inline Fallback::Method failingMethod(const std::string& name, const std::string& reason) {
        Fallback::Method method;
        method.name = name;
        method.action = [reason]() { return Media::Result::fail(reason); };
        return method;
    }
}

#endif // MOCK_PLATFORM_HPP
