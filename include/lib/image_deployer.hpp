#ifndef IMAGE_DEPLOYER_HPP
#define IMAGE_DEPLOYER_HPP

#include "lib/config.hpp"
#include "lib/media_types.hpp"
#include "lib/platform/strategy.hpp"
#include "lib/progress.hpp"
#include "utils/process.hpp"
#include <string>

namespace ImageDeployer {
    
    struct DeployResult {
        bool success = false;
        bool rawWritten = false;    // the image went onto the raw device
        Media::ImageType resolvedType = Media::ImageType::GENERIC;
        std::string message;
    };
    
    class Deployer {
    private:
        Platform::PlatformStrategy& strategy;
        Process::ToolRunner& runner;
        Settings::Config config;
        
    public:
        Deployer(Platform::PlatformStrategy& platformStrategy, Process::ToolRunner& toolRunner,
                 const Settings::Config& settings);
        
        // Raw write when extractFiles is false, otherwise extract into a
        // staging directory and copy onto mountHandle
        DeployResult deploy(const std::string& image, const Media::Device& device, 
                            const std::string& mountHandle, Media::ImageType imageType,
                            bool extractFiles, Progress::Reporter& progress);
        
        Media::ImageType resolveType(const std::string& image, Media::ImageType hint);
        
    private:
        uint64_t writeRaw(const std::string& image, const Media::Device& device, Progress::Reporter& progress);
        void placeBootFiles(const Media::Device& device, const std::string& staging, 
                            Media::ImageType type, Progress::Reporter& progress);
    };
}

#endif // IMAGE_DEPLOYER_HPP
