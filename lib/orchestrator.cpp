#include "lib/orchestrator.hpp"
#include "lib/disk_formatter.hpp"
#include "lib/errors.hpp"
#include "lib/image_deployer.hpp"
#include "utils/logs.hpp"

namespace Pipeline {
    
    Orchestrator::Orchestrator(Platform::PlatformStrategy& platformStrategy, Process::ToolRunner& toolRunner,
                               const Settings::Config& settings, Progress::Sink eventSink)
        : strategy(platformStrategy), runner(toolRunner), config(settings), sink(std::move(eventSink)) {
    }
    
    Media::Result Orchestrator::installBoot(const Media::Device& device, const Media::BootSpec& boot,
                                            Progress::Reporter& progress) {
        switch (boot.bootType) {
            case Media::BootType::BIOS:
                return strategy.writeBiosBoot(device, boot, progress);
            case Media::BootType::UEFI:
                return strategy.writeUefiBoot(device, boot, progress);
            case Media::BootType::FREEDOS:
                return strategy.writeFreeDosBoot(device, boot, progress);
            case Media::BootType::DUAL:
                break;
        }
        
        Media::Result bios;
        Media::Result uefi;
        
        try {
            Progress::Reporter biosProgress(progress, 0, 50);
            bios = strategy.writeBiosBoot(device, boot, biosProgress);
        } catch (const std::exception& e) {
            bios = ErrorHandler::toResult(e);
        }
        
        try {
            Progress::Reporter uefiProgress(progress, 50, 100);
            uefi = strategy.writeUefiBoot(device, boot, uefiProgress);
        } catch (const std::exception& e) {
            uefi = ErrorHandler::toResult(e);
        }
        
        if (bios.success && uefi.success) {
            return Media::Result::ok("BIOS and UEFI boot installed");
        }
        if (bios.success) {
            Logs::warning("UEFI boot failed: " + uefi.message);
            return Media::Result::ok("Warning: only BIOS boot installed; UEFI failed: " + uefi.message);
        }
        if (uefi.success) {
            Logs::warning("BIOS boot failed: " + bios.message);
            return Media::Result::ok("Warning: only UEFI boot installed; BIOS failed: " + bios.message);
        }
        return Media::Result::fail("BIOS: " + bios.message + "; UEFI: " + uefi.message);
    }
    
    Media::PipelineResult Orchestrator::run(Request& request, const std::atomic<bool>& cancelRequested) {
        Progress::Reporter progress(sink);
        Media::PipelineResult result;
        Platform::ScopedMounts mounts(strategy);
        
        auto finish = [&](Media::Stage state, const std::string& message) {
            result.state = state;
            result.success = state == Media::Stage::DONE;
            result.message = message;
            
            Media::Terminal terminal = Media::Terminal::FAILURE;
            if (state == Media::Stage::DONE) terminal = Media::Terminal::SUCCESS;
            if (state == Media::Stage::CANCELLED) terminal = Media::Terminal::CANCELLED;
            
            if (state == Media::Stage::DONE) {
                Logs::success(message);
            } else if (state == Media::Stage::CANCELLED) {
                Logs::warning(message);
            } else {
                Logs::error(message);
            }
            progress.finish(state, terminal, message);
            return result;
        };
        
        if (!request.device.error.empty()) {
            return finish(Media::Stage::FAILED, "DeviceError: " + request.device.name + ": " + request.device.error);
        }
        
        try {
            if (cancelRequested) {
                return finish(Media::Stage::CANCELLED, "Cancelled before formatting");
            }
            
            if (!strategy.checkPrivileges()) {
                return finish(Media::Stage::FAILED, "PrivilegeError: administrator privileges are required");
            }
            
            result.lastStage = Media::Stage::FORMATTING;
            progress.beginStage(Media::Stage::FORMATTING, "Formatting " + request.device.name);
            
            DiskFormatter::Formatter formatter(strategy, config);
            DiskFormatter::FormatResult formatted = formatter.format(request.device, request.format, progress);
            if (!formatted.success) {
                return finish(Media::Stage::FAILED, formatted.message);
            }
            
            result.mountHandle = formatted.mountHandle;
            if (formatted.scratch) {
                mounts.track(formatted.mountHandle);
            }
            
            if (cancelRequested) {
                return finish(Media::Stage::CANCELLED, "Cancelled after formatting");
            }
            
            result.lastStage = Media::Stage::DEPLOYING;
            progress.beginStage(Media::Stage::DEPLOYING, "Deploying " + request.image);
            
            Media::ImageType hint = request.boot.imageType;
            if (hint == Media::ImageType::AUTO) {
                hint = request.metadata.type;
            }
            
            ImageDeployer::Deployer deployer(strategy, runner, config);
            ImageDeployer::DeployResult deployed = deployer.deploy(request.image, request.device, 
                                                                   formatted.mountHandle, hint,
                                                                   request.extractFiles, progress);
            if (!deployed.success) {
                return finish(Media::Stage::FAILED, deployed.message);
            }
            
            if (deployed.rawWritten) {
                return finish(Media::Stage::DONE, deployed.message + "; image boot records kept");
            }
            
            if (cancelRequested) {
                return finish(Media::Stage::CANCELLED, "Cancelled before installing boot code");
            }
            
            result.lastStage = Media::Stage::INSTALLING_BOOT;
            progress.beginStage(Media::Stage::INSTALLING_BOOT, 
                                "Installing " + Media::getBootTypeName(request.boot.bootType) + " boot code");
            
            Media::BootSpec boot = request.boot;
            boot.imageType = deployed.resolvedType;
            
            Media::Result installed = installBoot(request.device, boot, progress);
            if (!installed.success) {
                return finish(Media::Stage::FAILED, installed.message);
            }
            
            return finish(Media::Stage::DONE, installed.message);
        } catch (const std::exception& e) {
            return finish(Media::Stage::FAILED, ErrorHandler::describe(e));
        }
    }
    
    Worker::Worker(Orchestrator& pipeline, Request work)
        : orchestrator(pipeline), request(std::move(work)), cancelRequested(false), done(false) {
    }
    
    Worker::~Worker() {
        if (thread.joinable()) {
            thread.join();
        }
    }
    
    void Worker::start() {
        if (thread.joinable()) {
            return;
        }
        
        thread = std::thread([this]() {
            Media::PipelineResult outcome = orchestrator.run(request, cancelRequested);
            {
                std::lock_guard<std::mutex> lock(resultMutex);
                result = outcome;
            }
            done = true;
        });
    }
    
    void Worker::cancel() {
        cancelRequested = true;
    }
    
    bool Worker::cancelled() const {
        return cancelRequested;
    }
    
    bool Worker::finished() const {
        return done;
    }
    
    Media::PipelineResult Worker::wait() {
        if (thread.joinable()) {
            thread.join();
        }
        
        std::lock_guard<std::mutex> lock(resultMutex);
        return result;
    }
}
