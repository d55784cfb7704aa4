#include "lib/image_deployer.hpp"
#include "lib/errors.hpp"
#include "lib/image_inspector.hpp"
#include "lib/image_writer.hpp"
#include "lib/platform/common.hpp"
#include "utils/logs.hpp"
#include "utils/temp_dir.hpp"
#include <unistd.h>

namespace ImageDeployer {
    
    static std::string targetRoot(const std::string& mountHandle) {
        // Bare drive letters name the current directory of that drive
        if (mountHandle.size() == 2 && mountHandle[1] == ':') {
            return mountHandle + "/";
        }
        return mountHandle;
    }
    
    Deployer::Deployer(Platform::PlatformStrategy& platformStrategy, Process::ToolRunner& toolRunner,
                       const Settings::Config& settings)
        : strategy(platformStrategy), runner(toolRunner), config(settings) {
    }
    
    Media::ImageType Deployer::resolveType(const std::string& image, Media::ImageType hint) {
        if (hint != Media::ImageType::AUTO) {
            return hint;
        }
        
        Media::ImageType byName = ImageInspector::typeFromFileName(image);
        if (byName != Media::ImageType::GENERIC) {
            return byName;
        }
        
        return ImageInspector::detectImageType(image, 
                                               ImageInspector::listEntries(image, runner, config.timeouts.probe));
    }
    
    uint64_t Deployer::writeRaw(const std::string& image, const Media::Device& device, 
                                Progress::Reporter& progress) {
        std::string raw = strategy.rawDevicePath(device);
        if (raw.empty()) {
            throw UnsupportedPlatformError("no raw device path for " + device.name);
        }
        
        strategy.dismountDevice(device);
        return ImageWriter::writeRaw(image, raw, progress);
    }
    
    void Deployer::placeBootFiles(const Media::Device& device, const std::string& staging,
                                  Media::ImageType type, Progress::Reporter& progress) {
        Media::Result result;
        
        switch (type) {
            case Media::ImageType::WINDOWS:
                result = Fallback::runChain("Windows boot sector", 
                                            strategy.windowsBootSectorMethods(device, staging), progress);
                break;
            case Media::ImageType::FREEDOS:
                result = Fallback::runChain("DOS system transfer", 
                                            strategy.dosSystemTransferMethods(device, staging), progress);
                break;
            default:
                progress.update(100, "No image-specific boot files");
                return;
        }
        
        if (result.success) {
            Logs::info(result.message);
        } else {
            Logs::warning(result.message + " (continuing)");
        }
    }
    
    DeployResult Deployer::deploy(const std::string& image, const Media::Device& device,
                                  const std::string& mountHandle, Media::ImageType imageType,
                                  bool extractFiles, Progress::Reporter& progress) {
        DeployResult outcome;
        
        try {
            if (!extractFiles) {
                outcome.resolvedType = imageType == Media::ImageType::AUTO ? 
                                       ImageInspector::typeFromFileName(image) : imageType;
                uint64_t written = writeRaw(image, device, progress);
                
                outcome.success = true;
                outcome.rawWritten = true;
                outcome.message = "Raw image written (" + std::to_string(written) + " bytes)";
                return outcome;
            }
            
            if (mountHandle.empty()) {
                throw ExtractionError("no mounted filesystem to copy onto");
            }
            
            outcome.resolvedType = resolveType(image, imageType);
            progress.update(2, "Image type: " + Media::getImageTypeName(outcome.resolvedType));
            
            ScopedTempDir staging(config.tempRoot, "bootforge_stage_");
            
            Progress::Reporter extractProgress(progress, 5, 40);
            Media::Result extracted = Fallback::runChain("Extract image", 
                                                         strategy.extractionMethods(image, staging.path()),
                                                         extractProgress);
            
            if (!extracted.success) {
                if (outcome.resolvedType != Media::ImageType::LINUX) {
                    throw ExtractionError(extracted.message);
                }
                
                // Linux images are usually hybrid and boot fine when copied sector by sector
                Logs::warning(extracted.message);
                Logs::warning("Falling back to a raw write of " + image);
                staging.remove();
                
                Progress::Reporter rawProgress(progress, 40, 100);
                uint64_t written = writeRaw(image, device, rawProgress);
                
                outcome.success = true;
                outcome.rawWritten = true;
                outcome.message = "Extraction failed, raw image written (" + std::to_string(written) + " bytes)";
                return outcome;
            }
            
            Progress::Reporter copyProgress(progress, 40, 85);
            Media::Result copied = Platform::copyTree(staging.path(), targetRoot(mountHandle), 
                [&copyProgress](uint64_t copiedBytes, uint64_t totalBytes) {
                    int percent = totalBytes > 0 ? static_cast<int>(copiedBytes * 100 / totalBytes) : 100;
                    copyProgress.update(percent, "Copying files");
                });
            
            if (!copied.success) {
                throw ExtractionError(copied.message);
            }
            copyProgress.update(100, copied.message);
            
            Progress::Reporter placeProgress(progress, 85, 100);
            placeBootFiles(device, staging.path(), outcome.resolvedType, placeProgress);
            
            sync();
            
            outcome.success = true;
            outcome.message = copied.message + " onto " + mountHandle;
            Logs::success(outcome.message);
        } catch (const BootForgeException& e) {
            outcome.success = false;
            outcome.message = ErrorHandler::describe(e);
            Logs::error(outcome.message);
        }
        
        return outcome;
    }
}
