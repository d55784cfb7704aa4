#include "lib/disk_formatter.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"
#include <thread>

namespace DiskFormatter {
    
    Formatter::Formatter(Platform::PlatformStrategy& platformStrategy, const Settings::Config& settings)
        : strategy(platformStrategy), config(settings) {
    }
    
    void Formatter::runStep(const std::string& goal, std::vector<Fallback::Method> methods,
                            Progress::Reporter& progress, int low, int high, bool partitioning) {
        Progress::Reporter window(progress, low, high);
        Media::Result result = Fallback::runChain(goal, std::move(methods), window);
        
        if (!result.success) {
            if (partitioning) {
                throw PartitionError(result.message);
            }
            throw FormatError(result.message);
        }
        
        Logs::debug(result.message);
    }
    
    Platform::MountHandle Formatter::pollMountHandle(const Media::Device& device, 
                                                     const Media::FormatSpec& spec) {
        for (int attempt = 1; attempt <= config.mountPollAttempts; attempt++) {
            Platform::MountHandle handle = strategy.resolveMountHandle(device, spec);
            if (!handle.path.empty()) {
                return handle;
            }
            
            Logs::debug("Mount handle not ready (attempt " + std::to_string(attempt) + "/" + 
                        std::to_string(config.mountPollAttempts) + ")");
            if (attempt < config.mountPollAttempts) {
                std::this_thread::sleep_for(config.mountPollInterval);
            }
        }
        
        throw MountResolutionError("no mount handle for " + device.name + " after " + 
                                   std::to_string(config.mountPollAttempts) + " attempts");
    }
    
    FormatResult Formatter::format(Media::Device& device, const Media::FormatSpec& spec,
                                   Progress::Reporter& progress) {
        FormatResult outcome;
        std::string fsName = FilesystemSupport::getFSName(spec.filesystem);
        
        try {
            if (!strategy.supportsFilesystem(spec.filesystem)) {
                throw UnsupportedFilesystemError(fsName + " is not supported on " + 
                                                 Host::getPlatformName(strategy.platform()));
            }
            
            strategy.dismountDevice(device);
            progress.update(5, "Device dismounted");
            
            if (!strategy.checkPrivileges()) {
                throw PrivilegeError("administrator privileges are required to format " + device.name);
            }
            progress.update(15, "Privileges verified");
            
            runStep("Create " + BootStructures::getTableName(spec.scheme) + " partition table",
                    strategy.partitionTableMethods(device, spec), progress, 15, 30, true);
            progress.update(30, "Partition table created");
            
            runStep("Create partition", strategy.partitionMethods(device, spec), progress, 30, 50, true);
            progress.update(50, "Partition created");
            
            runStep("Create " + fsName + " filesystem", strategy.formatMethods(device, spec), 
                    progress, 50, 75, false);
            progress.update(75, fsName + " filesystem created");
            
            Platform::MountHandle handle = pollMountHandle(device, spec);
            progress.update(90, "Mounted at " + handle.path);
            
            device.mountPoint = handle.path;
            
            outcome.success = true;
            outcome.mountHandle = handle.path;
            outcome.scratch = handle.scratch;
            outcome.message = device.name + " formatted as " + fsName;
            progress.update(100, outcome.message);
            
            Logs::success(outcome.message);
        } catch (const BootForgeException& e) {
            outcome = FormatResult();
            outcome.message = ErrorHandler::describe(e);
            Logs::error(outcome.message);
        }
        
        return outcome;
    }
}
