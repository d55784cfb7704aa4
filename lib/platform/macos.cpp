#include "lib/platform/macos.hpp"
#include "lib/platform/common.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"
#include <sstream>
#include <unistd.h>

namespace Platform {
    
    using FilesystemSupport::FSType;
    using BootStructures::TableType;
    
    static std::string trim(const std::string& text) {
        size_t start = text.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) {
            return "";
        }
        size_t end = text.find_last_not_of(" \t\r\n");
        return text.substr(start, end - start + 1);
    }
    
    MacStrategy::MacStrategy(Process::ToolRunner& toolRunner, const Settings::Config& settings)
        : runner(toolRunner), config(settings) {
    }
    
    Host::Platform MacStrategy::platform() const {
        return Host::Platform::MACOS;
    }
    
    std::string MacStrategy::diskPath(const std::string& name) {
        std::string base = name.substr(name.find_last_of('/') + 1);
        if (base.compare(0, 5, "rdisk") == 0) {
            base = base.substr(1);
        }
        return "/dev/" + base;
    }
    
    bool MacStrategy::checkPrivileges() {
        return geteuid() == 0;
    }
    
    // Disk arbitration may know the slice before its node shows up
    bool MacStrategy::partitionPresent(const std::string& partition) {
        if (pathExists(partition)) {
            return true;
        }
        return runner.run({"diskutil", "info", partition}, config.timeouts.probe).ok();
    }
    
    std::string MacStrategy::resolveFirstPartition(const Media::Device& device) {
        std::string partition = diskPath(device.name) + "s1";
        return partitionPresent(partition) ? partition : "";
    }
    
    std::string MacStrategy::mountedVolume(const std::string& partition) {
        Process::Outcome outcome = runner.run({"diskutil", "info", partition}, config.timeouts.probe);
        if (!outcome.ok()) {
            return "";
        }
        
        std::istringstream lines(outcome.output);
        std::string line;
        while (std::getline(lines, line)) {
            size_t pos = line.find("Mount Point:");
            if (pos != std::string::npos) {
                std::string value = trim(line.substr(pos + 12));
                return value.compare(0, 3, "Not") == 0 ? "" : value;
            }
        }
        return "";
    }
    
    std::string MacStrategy::mountPartition(const std::string& partition) {
        if (!partitionPresent(partition)) {
            return "";
        }
        
        std::string mountPoint = createScratchDir(config.tempRoot, "bootforge_mount_");
        if (mountPoint.empty()) {
            return "";
        }
        
        Media::Result mounted = runTool(runner, {"diskutil", "mount", "-mountPoint", mountPoint, partition},
                                        config.timeouts.partition);
        if (!mounted.success) {
            Logs::warning("Cannot mount " + partition + ": " + mounted.message);
            removeScratchDir(config.tempRoot, mountPoint);
            return "";
        }
        
        return mountPoint;
    }
    
    void MacStrategy::unmountAll(const std::vector<std::string>& mountPoints) {
        for (const auto& mountPoint : mountPoints) {
            Media::Result result = runTool(runner, {"diskutil", "unmount", mountPoint}, config.timeouts.partition);
            if (!result.success) {
                result = runTool(runner, {"umount", mountPoint}, config.timeouts.partition);
                if (!result.success) {
                    Logs::warning("Failed to unmount " + mountPoint + ": " + result.message);
                }
            }
            removeScratchDir(config.tempRoot, mountPoint);
        }
    }
    
    Media::Result MacStrategy::markBootable(const Media::Device& device, TableType scheme,
                                            Progress::Reporter& progress) {
        if (scheme == TableType::GPT) {
            progress.update(100, "GPT partitions carry no active flag");
            return Media::Result::ok("GPT partitions carry no active flag");
        }
        
        std::string dev = diskPath(device.name);
        std::string raw = rawDevicePath(device);
        
        Fallback::Method direct;
        direct.name = "direct active flag";
        direct.action = [this, dev, raw]() {
            runTool(runner, {"diskutil", "unmountDisk", dev}, config.timeouts.partition);
            
            BootStructures::PartitionTable table(raw);
            table.makeBootable(0);
            table.commit();
            return Media::Result::ok("Active flag set on " + raw);
        };
        
        std::vector<Fallback::Method> methods = {
            toolMethod("fdisk active flag", runner, {"fdisk", "-e", dev}, config.timeouts.partition,
                       "f 1\nw\ny\nq\n"),
            direct
        };
        
        return Fallback::runChain("Mark bootable", methods, progress);
    }
    
    Media::Result MacStrategy::legacyBoot(const Media::Device& device, TableType scheme,
                                          const std::string& goal, Progress::Reporter& progress) {
        Progress::Reporter markProgress(progress, 0, 20);
        Media::Result marked = markBootable(device, scheme, markProgress);
        if (!marked.success) {
            Logs::warning(marked.message);
        }
        
        std::string dev = diskPath(device.name);
        std::string raw = rawDevicePath(device);
        
        // The disk must be free of mounted volumes before sector 0 is rewritten
        Fallback::Method direct = directBootCodeMethod(raw, config, scheme);
        std::function<Media::Result()> write = direct.action;
        direct.action = [this, dev, write]() {
            Media::Result released = runTool(runner, {"diskutil", "unmountDisk", dev}, config.timeouts.partition);
            if (!released.success) {
                Logs::warning(released.message);
            }
            return write();
        };
        
        std::vector<Fallback::Method> methods = {
            direct,
            ddBootCodeMethod(runner, raw, config, scheme)
        };
        
        Progress::Reporter chainProgress(progress, 20, 100);
        Media::Result result = Fallback::runChain(goal, methods, chainProgress);
        if (!result.success) {
            result.message = "BootSectorWriteError: " + result.message;
        }
        return result;
    }
    
    Media::Result MacStrategy::writeBiosBoot(const Media::Device& device, const Media::BootSpec& boot,
                                             Progress::Reporter& progress) {
        return legacyBoot(device, boot.scheme, "BIOS boot", progress);
    }
    
    Media::Result MacStrategy::writeFreeDosBoot(const Media::Device& device, const Media::BootSpec& boot,
                                                Progress::Reporter& progress) {
        (void)boot;
        return legacyBoot(device, TableType::MBR, "FreeDOS boot", progress);
    }
    
    Media::Result MacStrategy::writeUefiBoot(const Media::Device& device, const Media::BootSpec& boot,
                                             Progress::Reporter& progress) {
        (void)boot;
        ScopedMounts mounts(*this);
        
        std::string partition = resolveFirstPartition(device);
        std::string mountPoint = device.mountPoint;
        if (mountPoint.empty() || !pathExists(mountPoint)) {
            mountPoint = partition.empty() ? "" : mountedVolume(partition);
        }
        if (mountPoint.empty() && !partition.empty()) {
            mountPoint = mountPartition(partition);
            mounts.track(mountPoint);
        }
        
        if (mountPoint.empty()) {
            return Media::Result::fail("BootSectorWriteError: cannot mount the first partition of " + 
                                       diskPath(device.name));
        }
        
        std::vector<Fallback::Method> methods = {
            imageLoaderMethod(mountPoint),
            installedLoaderMethod(mountPoint, config.efiLoaderPaths)
        };
        
        Media::Result result = Fallback::runChain("UEFI boot", methods, progress);
        if (!result.success) {
            result.message = "BootSectorWriteError: " + result.message;
        }
        return result;
    }
    
    bool MacStrategy::supportsFilesystem(FSType fs) const {
        return FilesystemSupport::isSupported(fs, Host::Platform::MACOS);
    }
    
    void MacStrategy::dismountDevice(const Media::Device& device) {
        Media::Result result = runTool(runner, {"diskutil", "unmountDisk", diskPath(device.name)}, 
                                       config.timeouts.partition);
        if (!result.success) {
            Logs::warning(result.message);
        }
    }
    
    std::vector<Fallback::Method> MacStrategy::partitionTableMethods(const Media::Device& device,
                                                                     const Media::FormatSpec& spec) {
        std::string dev = diskPath(device.name);
        std::string scheme = spec.scheme == TableType::GPT ? "GPT" : "MBR";
        
        return {
            toolMethod("diskutil eraseDisk", runner, {"diskutil", "eraseDisk", "free", "EMPTY", scheme, dev},
                       config.timeouts.partition),
            toolMethod("diskutil partitionDisk", runner, {"diskutil", "partitionDisk", dev, "1", scheme, 
                                                          "free", "EMPTY", "R"}, config.timeouts.partition)
        };
    }
    
    std::vector<Fallback::Method> MacStrategy::partitionMethods(const Media::Device& device,
                                                                const Media::FormatSpec& spec) {
        std::string dev = diskPath(device.name);
        std::string scheme = spec.scheme == TableType::GPT ? "GPT" : "MBR";
        
        Fallback::Method method = toolMethod("diskutil partitionDisk", runner, 
                                             {"diskutil", "partitionDisk", dev, "1", scheme, 
                                              "%noformat%", "%noformat%", "R"}, config.timeouts.partition);
        std::function<Media::Result()> run = method.action;
        method.action = [this, run, dev]() {
            Media::Result result = run();
            if (!result.success) {
                return result;
            }
            
            if (!partitionPresent(dev + "s1")) {
                return Media::Result::fail("partition node " + dev + "s1 did not appear");
            }
            return Media::Result::ok("Partition " + dev + "s1 created");
        };
        return {method};
    }
    
    std::vector<Fallback::Method> MacStrategy::formatMethods(const Media::Device& device,
                                                             const Media::FormatSpec& spec) {
        std::string partition = diskPath(device.name) + "s1";
        std::string label = FilesystemSupport::normalizeLabel(spec.label, spec.filesystem);
        std::chrono::seconds timeout = spec.quick ? config.timeouts.quickFormat : config.timeouts.fullFormat;
        
        std::string personality;
        std::vector<std::string> fallback;
        
        switch (spec.filesystem) {
            case FSType::FAT32:
                personality = "MS-DOS FAT32";
                fallback = {"newfs_msdos", "-F", "32", "-v", label, partition};
                break;
            case FSType::EXFAT:
                personality = "ExFAT";
                fallback = {"newfs_exfat", "-v", label, partition};
                break;
            case FSType::HFSPLUS:
                personality = "JHFS+";
                fallback = {"newfs_hfs", "-J", "-v", label, partition};
                break;
            case FSType::APFS:
                personality = "APFS";
                fallback = {"newfs_apfs", "-v", label, partition};
                break;
            default:
                throw UnsupportedFilesystemError(FilesystemSupport::getFSName(spec.filesystem) + 
                                                 " cannot be created on macOS");
        }
        
        return {
            toolMethod("diskutil eraseVolume", runner, {"diskutil", "eraseVolume", personality, label, partition}, 
                       timeout),
            toolMethod(fallback.front(), runner, fallback, timeout)
        };
    }
    
    MountHandle MacStrategy::resolveMountHandle(const Media::Device& device,
                                                const Media::FormatSpec& spec) {
        (void)spec;
        MountHandle handle;
        
        std::string partition = resolveFirstPartition(device);
        if (partition.empty()) {
            return handle;
        }
        
        // diskutil mounts freshly erased volumes under /Volumes on its own
        handle.path = mountedVolume(partition);
        if (handle.path.empty()) {
            runTool(runner, {"diskutil", "mount", partition}, config.timeouts.partition);
            handle.path = mountedVolume(partition);
        }
        handle.scratch = false;
        return handle;
    }
    
    std::string MacStrategy::rawDevicePath(const Media::Device& device) const {
        std::string dev = diskPath(device.name);
        return "/dev/r" + dev.substr(5);
    }
    
    std::vector<Fallback::Method> MacStrategy::extractionMethods(const std::string& image,
                                                                 const std::string& staging) {
        std::vector<Fallback::Method> methods = 
            archiveExtractionMethods(runner, image, staging, config.timeouts.extract);
        
        Fallback::Method attach;
        attach.name = "hdiutil attach and copy";
        attach.precondition = [this]() {
            return !runner.which("hdiutil").empty();
        };
        attach.action = [this, image, staging]() {
            std::string mountPoint = createScratchDir(config.tempRoot, "bootforge_image_");
            if (mountPoint.empty()) {
                return Media::Result::fail("cannot create an image mount point");
            }
            
            Media::Result attached = runTool(runner, {"hdiutil", "attach", "-nobrowse", "-readonly", 
                                                      "-mountpoint", mountPoint, image}, config.timeouts.partition);
            if (!attached.success) {
                removeScratchDir(config.tempRoot, mountPoint);
                return attached;
            }
            
            ScopedMounts mounts(*this);
            mounts.track(mountPoint);
            return copyTree(mountPoint, staging, nullptr);
        };
        methods.push_back(attach);
        
        return methods;
    }
    
    std::vector<Fallback::Method> MacStrategy::windowsBootSectorMethods(const Media::Device& device,
                                                                        const std::string& staging) {
        (void)device;
        (void)staging;
        return {};
    }
    
    std::vector<Fallback::Method> MacStrategy::dosSystemTransferMethods(const Media::Device& device,
                                                                        const std::string& staging) {
        (void)device;
        (void)staging;
        return {};
    }
}
