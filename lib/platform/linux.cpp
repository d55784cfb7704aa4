#include "lib/platform/linux.hpp"
#include "lib/platform/common.hpp"
#include "lib/dev_handler.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace Platform {
    
    using FilesystemSupport::FSType;
    using BootStructures::TableType;
    
    static const char* BASIC_DATA_GUID = "EBD0A0A2-B9E5-4433-87C0-68B6B72699C7";
    static const char* LINUX_DATA_GUID = "0FC63DAF-8483-4772-8E79-3D69D8477DE4";
    
    static bool isExtFamily(FSType fs) {
        return fs == FSType::EXT2 || fs == FSType::EXT3 || fs == FSType::EXT4;
    }
    
    LinuxStrategy::LinuxStrategy(Process::ToolRunner& toolRunner, const Settings::Config& settings)
        : runner(toolRunner), config(settings) {
    }
    
    Host::Platform LinuxStrategy::platform() const {
        return Host::Platform::LINUX;
    }
    
    bool LinuxStrategy::checkPrivileges() {
        return geteuid() == 0;
    }
    
    std::string LinuxStrategy::resolveFirstPartition(const Media::Device& device) {
        std::string partition = DeviceHandler::partitionPath(device.name, 1);
        return pathExists(partition) ? partition : "";
    }
    
    std::string LinuxStrategy::mountPartition(const std::string& partition) {
        if (!pathExists(partition)) {
            return "";
        }
        
        std::string mountPoint = createScratchDir(config.tempRoot, "bootforge_mount_");
        if (mountPoint.empty()) {
            return "";
        }
        
        Media::Result mounted = runTool(runner, {"mount", partition, mountPoint}, config.timeouts.partition);
        if (!mounted.success) {
            Logs::warning("Cannot mount " + partition + ": " + mounted.message);
            removeScratchDir(config.tempRoot, mountPoint);
            return "";
        }
        
        Logs::debug("Mounted " + partition + " on " + mountPoint);
        return mountPoint;
    }
    
    void LinuxStrategy::unmountAll(const std::vector<std::string>& mountPoints) {
        for (const auto& mountPoint : mountPoints) {
            if (DeviceHandler::isMountPoint(mountPoint)) {
                Media::Result result = runTool(runner, {"umount", mountPoint}, config.timeouts.partition);
                if (!result.success) {
                    Logs::warning("Failed to unmount " + mountPoint + " cleanly, detaching lazily");
                    runTool(runner, {"umount", "-l", mountPoint}, config.timeouts.partition);
                }
            }
            removeScratchDir(config.tempRoot, mountPoint);
        }
    }
    
    std::string LinuxStrategy::activeMount(const Media::Device& device) {
        if (DeviceHandler::isMountPoint(device.mountPoint)) {
            return device.mountPoint;
        }
        
        std::string partition = resolveFirstPartition(device);
        if (partition.empty()) {
            return "";
        }
        
        std::vector<std::string> dirs = DeviceHandler::mountedPartitions(partition);
        return dirs.empty() ? "" : dirs.front();
    }
    
    void LinuxStrategy::releasePartition(const std::string& partition) {
        for (const auto& dir : DeviceHandler::mountedPartitions(partition)) {
            runTool(runner, {"umount", dir}, config.timeouts.partition);
        }
    }
    
    bool LinuxStrategy::waitForPartition(const std::string& device) {
        std::string partition = DeviceHandler::partitionPath(device, 1);
        
        return DeviceHandler::waitForNode(partition, config.mountPollAttempts, config.mountPollInterval, [&]() {
            if (!runner.which("partprobe").empty()) {
                runner.run({"partprobe", device}, config.timeouts.probe);
            } else if (!runner.which("blockdev").empty()) {
                runner.run({"blockdev", "--rereadpt", device}, config.timeouts.probe);
            }
        });
    }
    
    Media::Result LinuxStrategy::installBootCode(const std::string& device, TableType scheme) {
        std::string source = BootStructures::findBootCode(bootCodeSearchPaths(config, scheme));
        if (source.empty()) {
            Logs::warning("No " + std::string(scheme == TableType::MBR ? "mbr.bin" : "gptmbr.bin") + 
                          " found, leaving existing MBR code in place");
            return Media::Result::ok();
        }
        
        BootStructures::PartitionTable table(device);
        table.writeBootCode(BootStructures::loadBootCode(source));
        table.commit();
        return Media::Result::ok("Boot code from " + source);
    }
    
    Media::Result LinuxStrategy::markBootable(const Media::Device& device, TableType scheme,
                                              Progress::Reporter& progress) {
        std::string dev = DeviceHandler::devicePath(device.name);
        std::vector<Fallback::Method> methods;
        
        if (scheme == TableType::MBR) {
            methods.push_back(toolMethod("parted boot flag", runner, 
                                         {"parted", "-s", dev, "set", "1", "boot", "on"}, config.timeouts.partition));
            methods.push_back(toolMethod("sfdisk activate", runner, 
                                         {"sfdisk", "--activate", dev, "1"}, config.timeouts.partition));
            
            Fallback::Method direct;
            direct.name = "direct active flag";
            direct.action = [dev]() {
                BootStructures::PartitionTable table(dev);
                table.makeBootable(0);
                table.commit();
                return Media::Result::ok("Active flag set on " + dev);
            };
            methods.push_back(direct);
        } else {
            methods.push_back(toolMethod("parted legacy_boot flag", runner, 
                                         {"parted", "-s", dev, "set", "1", "legacy_boot", "on"}, config.timeouts.partition));
            methods.push_back(toolMethod("sgdisk legacy BIOS attribute", runner, 
                                         {"sgdisk", "-A", "1:set:2", dev}, config.timeouts.partition));
        }
        
        return Fallback::runChain("Mark bootable", methods, progress);
    }
    
    Fallback::Method LinuxStrategy::syslinuxMethod(const Media::Device& device, TableType scheme) {
        Fallback::Method method;
        method.name = "syslinux";
        method.precondition = [this, device]() {
            return !runner.which("syslinux").empty() && !resolveFirstPartition(device).empty();
        };
        method.action = [this, device, scheme]() {
            std::string dev = DeviceHandler::devicePath(device.name);
            std::string partition = resolveFirstPartition(device);
            
            std::string mountPoint = activeMount(device);
            if (!mountPoint.empty()) {
                writeSyslinuxBridge(mountPoint);
                sync();
            }
            
            // syslinux writes through the raw partition and needs it unmounted
            releasePartition(partition);
            
            Media::Result installed = runTool(runner, {"syslinux", "--install", partition}, config.timeouts.boot);
            if (!installed.success) {
                return installed;
            }
            
            Media::Result code = installBootCode(dev, scheme);
            return code.success ? Media::Result::ok("syslinux installed on " + partition) : code;
        };
        return method;
    }
    
    Fallback::Method LinuxStrategy::extlinuxMethod(const Media::Device& device, TableType scheme) {
        Fallback::Method method;
        method.name = "extlinux";
        method.precondition = [this, device]() {
            return !runner.which("extlinux").empty() && !resolveFirstPartition(device).empty();
        };
        method.action = [this, device, scheme]() {
            ScopedMounts mounts(*this);
            
            std::string mountPoint = activeMount(device);
            if (mountPoint.empty()) {
                mountPoint = mountPartition(resolveFirstPartition(device));
                mounts.track(mountPoint);
            }
            if (mountPoint.empty()) {
                return Media::Result::fail("cannot mount the first partition");
            }
            
            writeSyslinuxBridge(mountPoint);
            
            std::string installDir = findPathIgnoreCase(mountPoint, "boot/syslinux");
            if (installDir.empty()) installDir = findPathIgnoreCase(mountPoint, "syslinux");
            if (installDir.empty()) installDir = mountPoint;
            
            Media::Result installed = runTool(runner, {"extlinux", "--install", installDir}, config.timeouts.boot);
            if (!installed.success) {
                return installed;
            }
            
            Media::Result code = installBootCode(DeviceHandler::devicePath(device.name), scheme);
            return code.success ? Media::Result::ok("extlinux installed in " + installDir) : code;
        };
        return method;
    }
    
    Media::Result LinuxStrategy::writeBiosBoot(const Media::Device& device, const Media::BootSpec& boot,
                                               Progress::Reporter& progress) {
        std::string dev = DeviceHandler::devicePath(device.name);
        
        Progress::Reporter markProgress(progress, 0, 20);
        Media::Result marked = markBootable(device, boot.scheme, markProgress);
        if (!marked.success) {
            Logs::warning(marked.message);
        }
        
        std::vector<Fallback::Method> methods;
        bool windowsImage = boot.imageType == Media::ImageType::WINDOWS;
        
        if (windowsImage && boot.scheme == TableType::MBR) {
            methods.push_back(msSysMethod("ms-sys Windows 7 MBR", runner, "--mbr7", dev, config.timeouts.boot));
        }
        if (!windowsImage) {
            methods.push_back(syslinuxMethod(device, boot.scheme));
            methods.push_back(extlinuxMethod(device, boot.scheme));
        }
        if (boot.scheme == TableType::MBR) {
            methods.push_back(msSysMethod("ms-sys generic MBR", runner, "--mbr", dev, config.timeouts.boot));
        }
        methods.push_back(directBootCodeMethod(dev, config, boot.scheme));
        
        Progress::Reporter chainProgress(progress, 20, 100);
        Media::Result result = Fallback::runChain("BIOS boot", methods, chainProgress);
        if (!result.success) {
            result.message = "BootSectorWriteError: " + result.message;
        }
        return result;
    }
    
    Fallback::Method LinuxStrategy::grubMethod(const std::string& mountPoint) {
        Fallback::Method method;
        method.name = "grub-install";
        method.precondition = [this]() {
            return !runner.which("grub-install").empty() || !runner.which("grub2-install").empty();
        };
        method.action = [this, mountPoint]() {
            std::string tool = runner.which("grub-install").empty() ? "grub2-install" : "grub-install";
            std::string bootDir = (fs::path(mountPoint) / "boot").string();
            
            Media::Result installed = runTool(runner, {tool, "--target=x86_64-efi", 
                                                       "--efi-directory=" + mountPoint,
                                                       "--boot-directory=" + bootDir,
                                                       "--removable", "--no-nvram"}, config.timeouts.boot);
            if (!installed.success) {
                return installed;
            }
            
            std::string grubDir = findPathIgnoreCase(mountPoint, "boot/grub");
            if (grubDir.empty()) grubDir = findPathIgnoreCase(mountPoint, "boot/grub2");
            
            // Images normally ship their own grub.cfg; only bridge to their loopback entries otherwise
            if (!grubDir.empty() && findPathIgnoreCase(grubDir, "grub.cfg").empty()) {
                std::ofstream cfg(fs::path(grubDir) / "grub.cfg");
                cfg << "insmod part_msdos\n";
                cfg << "insmod part_gpt\n";
                cfg << "insmod fat\n";
                cfg << "if [ -f /boot/grub/loopback.cfg ]; then\n";
                cfg << "    configfile /boot/grub/loopback.cfg\n";
                cfg << "fi\n";
            }
            
            if (findPathIgnoreCase(mountPoint, "EFI/BOOT/BOOTX64.EFI").empty()) {
                return Media::Result::fail(tool + " did not produce EFI/BOOT/BOOTX64.EFI");
            }
            return Media::Result::ok("GRUB EFI installed");
        };
        return method;
    }
    
    Media::Result LinuxStrategy::writeUefiBoot(const Media::Device& device, const Media::BootSpec& boot,
                                               Progress::Reporter& progress) {
        ScopedMounts mounts(*this);
        
        std::string mountPoint = activeMount(device);
        if (mountPoint.empty()) {
            mountPoint = mountPartition(resolveFirstPartition(device));
            mounts.track(mountPoint);
        }
        
        if (mountPoint.empty()) {
            return Media::Result::fail("BootSectorWriteError: cannot mount the first partition of " + 
                                       DeviceHandler::devicePath(device.name));
        }
        
        std::vector<Fallback::Method> methods;
        methods.push_back(imageLoaderMethod(mountPoint));
        if (boot.imageType == Media::ImageType::LINUX) {
            methods.push_back(grubMethod(mountPoint));
        }
        methods.push_back(installedLoaderMethod(mountPoint, config.efiLoaderPaths));
        methods.push_back(scanLoaderMethod(mountPoint, config.efiScanDirs));
        
        Media::Result result = Fallback::runChain("UEFI boot", methods, progress);
        sync();
        
        if (!result.success) {
            result.message = "BootSectorWriteError: " + result.message;
        }
        return result;
    }
    
    Fallback::Method LinuxStrategy::freeDosRecordMethod(const Media::Device& device) {
        Fallback::Method method;
        method.name = "ms-sys FreeDOS boot record";
        method.precondition = [this, device]() {
            return !runner.which("ms-sys").empty() && !resolveFirstPartition(device).empty();
        };
        method.action = [this, device]() {
            std::string partition = resolveFirstPartition(device);
            releasePartition(partition);
            
            Media::Result record = runTool(runner, {"ms-sys", "--fat32free", partition}, config.timeouts.boot);
            if (!record.success) {
                return record;
            }
            
            return runTool(runner, {"ms-sys", "--mbrdos", DeviceHandler::devicePath(device.name)}, 
                           config.timeouts.boot);
        };
        return method;
    }
    
    Media::Result LinuxStrategy::writeFreeDosBoot(const Media::Device& device, const Media::BootSpec& boot,
                                                  Progress::Reporter& progress) {
        (void)boot;
        std::string dev = DeviceHandler::devicePath(device.name);
        
        Progress::Reporter markProgress(progress, 0, 20);
        Media::Result marked = markBootable(device, TableType::MBR, markProgress);
        if (!marked.success) {
            Logs::warning(marked.message);
        }
        
        std::vector<Fallback::Method> methods = {
            freeDosRecordMethod(device),
            syslinuxMethod(device, TableType::MBR),
            directBootCodeMethod(dev, config, TableType::MBR)
        };
        
        Progress::Reporter chainProgress(progress, 20, 100);
        Media::Result result = Fallback::runChain("FreeDOS boot", methods, chainProgress);
        if (!result.success) {
            result.message = "BootSectorWriteError: " + result.message;
        }
        return result;
    }
    
    bool LinuxStrategy::supportsFilesystem(FSType fs) const {
        return FilesystemSupport::isSupported(fs, Host::Platform::LINUX);
    }
    
    void LinuxStrategy::dismountDevice(const Media::Device& device) {
        if (!DeviceHandler::unmountDevice(device.name, runner)) {
            Logs::warning("Some partitions of " + device.name + " are still mounted");
        }
    }
    
    Fallback::Method LinuxStrategy::partitionStep(const std::string& name, const std::vector<std::string>& argv,
                                                  const std::string& device, const std::string& input) {
        Fallback::Method method = toolMethod(name, runner, argv, config.timeouts.partition, input);
        std::function<Media::Result()> run = method.action;
        
        method.action = [this, run, device]() {
            Media::Result result = run();
            if (!result.success) {
                return result;
            }
            
            if (!waitForPartition(device)) {
                return Media::Result::fail("partition node " + DeviceHandler::partitionPath(device, 1) + 
                                           " did not appear");
            }
            return Media::Result::ok("Partition " + DeviceHandler::partitionPath(device, 1) + " created");
        };
        return method;
    }
    
    std::vector<Fallback::Method> LinuxStrategy::partitionTableMethods(const Media::Device& device,
                                                                       const Media::FormatSpec& spec) {
        std::string dev = DeviceHandler::devicePath(device.name);
        bool gpt = spec.scheme == TableType::GPT;
        
        std::vector<Fallback::Method> methods = {
            toolMethod("parted mklabel", runner, {"parted", "-s", dev, "mklabel", gpt ? "gpt" : "msdos"},
                       config.timeouts.partition),
            toolMethod("sfdisk label", runner, {"sfdisk", "--wipe", "always", dev}, config.timeouts.partition,
                       gpt ? "label: gpt\n" : "label: dos\n")
        };
        
        if (gpt) {
            methods.push_back(toolMethod("sgdisk zap", runner, {"sgdisk", "-o", dev}, config.timeouts.partition));
        }
        return methods;
    }
    
    std::vector<Fallback::Method> LinuxStrategy::partitionMethods(const Media::Device& device,
                                                                  const Media::FormatSpec& spec) {
        std::string dev = DeviceHandler::devicePath(device.name);
        bool gpt = spec.scheme == TableType::GPT;
        bool linuxData = isExtFamily(spec.filesystem);
        
        std::string partedType = "fat32";
        std::string mbrType = "c";
        if (linuxData) {
            partedType = "ext4";
            mbrType = "83";
        } else if (spec.filesystem == FSType::NTFS || spec.filesystem == FSType::EXFAT ||
                   spec.filesystem == FSType::UDF) {
            partedType = "ntfs";
            mbrType = "7";
        }
        
        std::string sfdiskType = gpt ? (linuxData ? LINUX_DATA_GUID : BASIC_DATA_GUID) : mbrType;
        
        std::vector<Fallback::Method> methods = {
            partitionStep("parted mkpart", {"parted", "-s", "-a", "optimal", dev, "mkpart", "primary", 
                                            partedType, "1MiB", "100%"}, dev),
            partitionStep("sfdisk partition", {"sfdisk", dev}, dev, 
                          "start=2048, type=" + sfdiskType + "\n")
        };
        
        if (gpt) {
            methods.push_back(partitionStep("sgdisk partition", {"sgdisk", "-n", "1:2048:0", "-t", 
                                                                 linuxData ? "1:8300" : "1:0700", dev}, dev));
        }
        return methods;
    }
    
    std::vector<Fallback::Method> LinuxStrategy::formatMethods(const Media::Device& device,
                                                               const Media::FormatSpec& spec) {
        std::string partition = DeviceHandler::partitionPath(device.name, 1);
        std::string label = FilesystemSupport::normalizeLabel(spec.label, spec.filesystem);
        std::chrono::seconds timeout = spec.quick ? config.timeouts.quickFormat : config.timeouts.fullFormat;
        
        auto withCheck = [&spec](std::vector<std::string> argv, const std::string& flag) {
            if (!spec.quick) {
                argv.insert(argv.end() - 1, flag);
            }
            return argv;
        };
        
        std::vector<Fallback::Method> methods;
        
        switch (spec.filesystem) {
            case FSType::FAT32:
                for (const char* tool : {"mkfs.vfat", "mkfs.fat", "mkdosfs"}) {
                    methods.push_back(toolMethod(tool, runner, 
                                                 withCheck({tool, "-F", "32", "-n", label, partition}, "-c"), timeout));
                }
                break;
            case FSType::NTFS:
                for (const char* tool : {"mkfs.ntfs", "mkntfs"}) {
                    std::vector<std::string> argv = {tool, "-L", label, partition};
                    if (spec.quick) argv.insert(argv.begin() + 1, "-f");
                    methods.push_back(toolMethod(tool, runner, argv, timeout));
                }
                break;
            case FSType::EXFAT:
                methods.push_back(toolMethod("mkfs.exfat (exfatprogs)", runner, 
                                             {"mkfs.exfat", "-L", label, partition}, timeout));
                methods.push_back(toolMethod("mkfs.exfat (exfat-utils)", runner, 
                                             {"mkfs.exfat", "-n", label, partition}, timeout));
                methods.push_back(toolMethod("mkexfatfs", runner, {"mkexfatfs", "-n", label, partition}, timeout));
                break;
            case FSType::UDF:
                for (const char* tool : {"mkudffs", "mkfs.udf"}) {
                    methods.push_back(toolMethod(tool, runner, {tool, "--media-type=hd", "--blocksize=512",
                                                                "--label=" + label, partition}, timeout));
                }
                break;
            case FSType::EXT2:
            case FSType::EXT3:
            case FSType::EXT4: {
                std::string name = FilesystemSupport::getFSName(spec.filesystem);
                std::string tool = "mkfs." + name;
                methods.push_back(toolMethod(tool, runner, 
                                             withCheck({tool, "-F", "-L", label, partition}, "-c"), timeout));
                methods.push_back(toolMethod("mke2fs", runner, 
                                             withCheck({"mke2fs", "-t", name, "-F", "-L", label, partition}, "-c"), 
                                             timeout));
                break;
            }
            default:
                throw UnsupportedFilesystemError(FilesystemSupport::getFSName(spec.filesystem) + 
                                                 " cannot be created on Linux");
        }
        
        return methods;
    }
    
    MountHandle LinuxStrategy::resolveMountHandle(const Media::Device& device,
                                                  const Media::FormatSpec& spec) {
        (void)spec;
        MountHandle handle;
        
        std::string partition = resolveFirstPartition(device);
        if (partition.empty()) {
            return handle;
        }
        
        handle.path = mountPartition(partition);
        handle.scratch = !handle.path.empty();
        return handle;
    }
    
    std::string LinuxStrategy::rawDevicePath(const Media::Device& device) const {
        return DeviceHandler::devicePath(device.name);
    }
    
    std::vector<Fallback::Method> LinuxStrategy::extractionMethods(const std::string& image,
                                                                   const std::string& staging) {
        std::vector<Fallback::Method> methods = 
            archiveExtractionMethods(runner, image, staging, config.timeouts.extract);
        
        Fallback::Method loop;
        loop.name = "loop mount and copy";
        loop.precondition = [this]() {
            return !runner.which("mount").empty();
        };
        loop.action = [this, image, staging]() {
            std::string mountPoint = createScratchDir(config.tempRoot, "bootforge_image_");
            if (mountPoint.empty()) {
                return Media::Result::fail("cannot create an image mount point");
            }
            
            Media::Result mounted = runTool(runner, {"mount", "-o", "loop,ro", image, mountPoint}, 
                                            config.timeouts.partition);
            if (!mounted.success) {
                removeScratchDir(config.tempRoot, mountPoint);
                return mounted;
            }
            
            ScopedMounts mounts(*this);
            mounts.track(mountPoint);
            return copyTree(mountPoint, staging, nullptr);
        };
        methods.push_back(loop);
        
        return methods;
    }
    
    std::vector<Fallback::Method> LinuxStrategy::windowsBootSectorMethods(const Media::Device& device,
                                                                          const std::string& staging) {
        (void)staging;
        return {
            msSysMethod("ms-sys Windows 7 MBR", runner, "--mbr7", 
                        DeviceHandler::devicePath(device.name), config.timeouts.boot)
        };
    }
    
    std::vector<Fallback::Method> LinuxStrategy::dosSystemTransferMethods(const Media::Device& device,
                                                                          const std::string& staging) {
        (void)staging;
        return {
            msSysMethod("ms-sys FreeDOS system transfer", runner, "--fat32free",
                        DeviceHandler::partitionPath(device.name, 1), config.timeouts.boot)
        };
    }
}
