#include "lib/platform/windows.hpp"
#include "lib/platform/common.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"
#include "utils/temp_dir.hpp"
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace Platform {
    
    using FilesystemSupport::FSType;
    using BootStructures::TableType;
    
    static const uint64_t FAT32_FORMAT_LIMIT = 32ULL * 1024 * 1024 * 1024;
    
    static std::string driveRoot(const std::string& drive) {
        return drive + "/";
    }
    
    static std::string psQuote(const std::string& text) {
        std::string quoted = "'";
        for (char c : text) {
            quoted += c;
            if (c == '\'') quoted += '\'';
        }
        return quoted + "'";
    }
    
    static std::string diskpartFsName(FSType fs) {
        switch (fs) {
            case FSType::FAT32: return "fat32";
            case FSType::NTFS: return "ntfs";
            case FSType::EXFAT: return "exfat";
            case FSType::UDF: return "udf";
            default: return "";
        }
    }
    
    // Disk image mounted with Mount-DiskImage, dismounted on scope exit
    class MountedDiskImage {
    private:
        Process::ToolRunner& runner;
        std::string image;
        std::chrono::seconds timeout;
        
    public:
        MountedDiskImage(Process::ToolRunner& toolRunner, const std::string& imagePath, std::chrono::seconds limit)
            : runner(toolRunner), image(imagePath), timeout(limit) {
        }
        
        ~MountedDiskImage() {
            Process::Outcome outcome = runner.run({"powershell", "-NoProfile", "-NonInteractive", "-Command",
                                                   "Dismount-DiskImage -ImagePath " + psQuote(image)}, timeout);
            if (!outcome.ok()) {
                Logs::warning("Could not dismount " + image + ": " + Process::summarize(outcome));
            }
        }
    };
    
    WindowsStrategy::WindowsStrategy(Process::ToolRunner& toolRunner, const Settings::Config& settings)
        : runner(toolRunner), config(settings) {
    }
    
    Host::Platform WindowsStrategy::platform() const {
        return Host::Platform::WINDOWS;
    }
    
    std::string WindowsStrategy::normalizeDriveLetter(const std::string& drive) {
        for (char c : drive) {
            if (std::isalpha(static_cast<unsigned char>(c))) {
                return std::string(1, static_cast<char>(std::toupper(static_cast<unsigned char>(c)))) + ":";
            }
        }
        return "";
    }
    
    int WindowsStrategy::diskNumber(const Media::Device& device) const {
        if (device.index >= 0) {
            return device.index;
        }
        
        size_t end = device.name.size();
        size_t start = end;
        while (start > 0 && std::isdigit(static_cast<unsigned char>(device.name[start - 1]))) {
            start--;
        }
        
        if (start == end) {
            return -1;
        }
        return std::stoi(device.name.substr(start));
    }
    
    bool WindowsStrategy::checkPrivileges() {
        // "net session" only succeeds from an elevated prompt
        return runner.run({"net", "session"}, config.timeouts.probe).ok();
    }
    
    std::string WindowsStrategy::driveOf(const Media::Device& device) {
        if (!device.mountPoint.empty()) {
            return normalizeDriveLetter(device.mountPoint);
        }
        
        int disk = diskNumber(device);
        if (disk < 0) {
            return "";
        }
        
        Process::Outcome outcome = runner.run({"powershell", "-NoProfile", "-NonInteractive", "-Command",
                                               "(Get-Partition -DiskNumber " + std::to_string(disk) + 
                                               " -PartitionNumber 1).DriveLetter"}, config.timeouts.probe);
        if (!outcome.ok()) {
            return "";
        }
        return normalizeDriveLetter(outcome.output);
    }
    
    std::string WindowsStrategy::resolveFirstPartition(const Media::Device& device) {
        return driveOf(device);
    }
    
    std::string WindowsStrategy::mountPartition(const std::string& partition) {
        // Volumes are mounted by drive letter as soon as they are assigned
        std::string drive = normalizeDriveLetter(partition);
        if (drive.empty() || !pathExists(driveRoot(drive))) {
            return "";
        }
        return drive;
    }
    
    void WindowsStrategy::unmountAll(const std::vector<std::string>& mountPoints) {
        for (const auto& mountPoint : mountPoints) {
            if (mountPoint.size() == 2 && mountPoint[1] == ':') {
                Logs::debug("Leaving drive " + mountPoint + " assigned");
                continue;
            }
            removeScratchDir(config.tempRoot, mountPoint);
        }
    }
    
    Fallback::Method WindowsStrategy::diskpartMethod(const std::string& name, 
                                                     const std::vector<std::string>& script,
                                                     std::chrono::seconds timeout) {
        Fallback::Method method;
        method.name = name;
        method.precondition = [this]() {
            return !runner.which("diskpart").empty();
        };
        method.action = [this, script, timeout]() {
            ScopedTempDir work(config.tempRoot, "bootforge_diskpart_");
            std::string scriptPath = work.path() + "/script.txt";
            
            std::ofstream file(scriptPath);
            if (!file) {
                throw FileError(scriptPath, "cannot write diskpart script");
            }
            for (const auto& line : script) {
                file << line << "\r\n";
            }
            file << "exit\r\n";
            file.close();
            
            return runTool(runner, {"diskpart", "/s", scriptPath}, timeout);
        };
        return method;
    }
    
    Fallback::Method WindowsStrategy::powershellMethod(const std::string& name, const std::string& command,
                                                       std::chrono::seconds timeout) {
        return toolMethod(name, runner, {"powershell", "-NoProfile", "-NonInteractive", "-Command", command}, 
                          timeout);
    }
    
    Fallback::Method WindowsStrategy::bootsectMethod(const std::string& name, const std::string& tool,
                                                     const std::string& drive) {
        Fallback::Method method;
        method.name = name;
        method.precondition = [this, tool]() {
            return pathExists(tool) || !runner.which(tool).empty();
        };
        method.action = [this, tool, drive]() {
            return runTool(runner, {tool, "/nt60", drive, "/force", "/mbr"}, config.timeouts.boot);
        };
        return method;
    }
    
    Fallback::Method WindowsStrategy::efiCopyMethod(const std::string& name, const std::string& source,
                                                    const std::string& drive) {
        Fallback::Method method = installedLoaderMethod(driveRoot(drive), {source});
        method.name = name;
        return method;
    }
    
    Media::Result WindowsStrategy::markBootable(const Media::Device& device, TableType scheme,
                                                Progress::Reporter& progress) {
        if (scheme == TableType::GPT) {
            progress.update(100, "GPT partitions carry no active flag");
            return Media::Result::ok("GPT partitions carry no active flag");
        }
        
        int disk = diskNumber(device);
        if (disk < 0) {
            return Media::Result::fail("Mark bootable failed: no disk number for " + device.name);
        }
        
        std::vector<Fallback::Method> methods = {
            diskpartMethod("diskpart active", {"select disk " + std::to_string(disk), 
                                               "select partition 1", "active"}, config.timeouts.partition),
            powershellMethod("Set-Partition -IsActive", "Set-Partition -DiskNumber " + std::to_string(disk) + 
                             " -PartitionNumber 1 -IsActive $true", config.timeouts.partition)
        };
        
        return Fallback::runChain("Mark bootable", methods, progress);
    }
    
    Media::Result WindowsStrategy::writeBiosBoot(const Media::Device& device, const Media::BootSpec& boot,
                                                 Progress::Reporter& progress) {
        Progress::Reporter markProgress(progress, 0, 20);
        Media::Result marked = markBootable(device, boot.scheme, markProgress);
        if (!marked.success) {
            Logs::warning(marked.message);
        }
        
        std::string drive = driveOf(device);
        if (drive.empty()) {
            return Media::Result::fail("BootSectorWriteError: no drive letter for " + device.name);
        }
        
        std::vector<Fallback::Method> methods = {
            bootsectMethod("bootsect /nt60", "bootsect", drive),
            toolMethod("syslinux.exe", runner, {"syslinux", "-maf", drive}, config.timeouts.boot)
        };
        
        if (boot.imageType == Media::ImageType::WINDOWS) {
            Fallback::Method bcdboot = toolMethod("bcdboot", runner, {"bcdboot", drive + "\\Windows", "/s", drive,
                                                                      "/f", "BIOS"}, config.timeouts.boot);
            std::function<bool()> onPath = bcdboot.precondition;
            bcdboot.precondition = [onPath, drive]() {
                return onPath() && !findPathIgnoreCase(driveRoot(drive), "Windows").empty();
            };
            methods.push_back(bcdboot);
        }
        
        methods.push_back(ddBootCodeMethod(runner, rawDevicePath(device), config, boot.scheme));
        
        Progress::Reporter chainProgress(progress, 20, 100);
        Media::Result result = Fallback::runChain("BIOS boot", methods, chainProgress);
        if (!result.success) {
            result.message = "BootSectorWriteError: " + result.message;
        }
        return result;
    }
    
    Media::Result WindowsStrategy::writeUefiBoot(const Media::Device& device, const Media::BootSpec& boot,
                                                 Progress::Reporter& progress) {
        (void)boot;
        std::string drive = driveOf(device);
        if (drive.empty()) {
            return Media::Result::fail("BootSectorWriteError: no drive letter for " + device.name);
        }
        
        std::string root = driveRoot(drive);
        const char* windir = std::getenv("WINDIR");
        std::string systemLoader = std::string(windir ? windir : "C:\\Windows") + "\\Boot\\EFI\\bootmgfw.efi";
        
        Fallback::Method bcdboot = toolMethod("bcdboot /f UEFI", runner, {"bcdboot", drive + "\\Windows", "/s", 
                                                                         drive, "/f", "UEFI"}, config.timeouts.boot);
        std::function<bool()> onPath = bcdboot.precondition;
        bcdboot.precondition = [onPath, root]() {
            return onPath() && !findPathIgnoreCase(root, "Windows").empty();
        };
        
        std::vector<Fallback::Method> methods = {
            imageLoaderMethod(root),
            efiCopyMethod("bootmgfw.efi from the drive", 
                          findPathIgnoreCase(root, "efi/microsoft/boot/bootmgfw.efi"), drive),
            efiCopyMethod("bootmgfw.efi from %WINDIR%", systemLoader, drive),
            bcdboot,
            installedLoaderMethod(root, config.efiLoaderPaths)
        };
        
        Media::Result result = Fallback::runChain("UEFI boot", methods, progress);
        if (!result.success) {
            result.message = "BootSectorWriteError: " + result.message;
        }
        return result;
    }
    
    Media::Result WindowsStrategy::writeFreeDosBoot(const Media::Device& device, const Media::BootSpec& boot,
                                                    Progress::Reporter& progress) {
        (void)boot;
        Progress::Reporter markProgress(progress, 0, 20);
        Media::Result marked = markBootable(device, TableType::MBR, markProgress);
        if (!marked.success) {
            Logs::warning(marked.message);
        }
        
        std::string drive = driveOf(device);
        if (drive.empty()) {
            return Media::Result::fail("BootSectorWriteError: no drive letter for " + device.name);
        }
        
        std::vector<Fallback::Method> methods = {
            bootsectMethod("bootsect /nt60", "bootsect", drive),
            toolMethod("syslinux.exe", runner, {"syslinux", "-maf", drive}, config.timeouts.boot),
            ddBootCodeMethod(runner, rawDevicePath(device), config, TableType::MBR)
        };
        
        Progress::Reporter chainProgress(progress, 20, 100);
        Media::Result result = Fallback::runChain("FreeDOS boot", methods, chainProgress);
        if (!result.success) {
            result.message = "BootSectorWriteError: " + result.message;
        }
        return result;
    }
    
    bool WindowsStrategy::supportsFilesystem(FSType fs) const {
        return FilesystemSupport::isSupported(fs, Host::Platform::WINDOWS);
    }
    
    void WindowsStrategy::dismountDevice(const Media::Device& device) {
        std::string drive = device.mountPoint.empty() ? "" : normalizeDriveLetter(device.mountPoint);
        if (drive.empty()) {
            return;
        }
        
        Process::Outcome outcome = runner.run({"mountvol", drive, "/p"}, config.timeouts.partition);
        if (!outcome.ok()) {
            Logs::warning("Could not dismount " + drive + ": " + Process::summarize(outcome));
        }
    }
    
    std::vector<Fallback::Method> WindowsStrategy::partitionTableMethods(const Media::Device& device,
                                                                         const Media::FormatSpec& spec) {
        int disk = diskNumber(device);
        if (disk < 0) {
            throw DeviceError(device.name, "no disk number");
        }
        
        std::string number = std::to_string(disk);
        std::string style = spec.scheme == TableType::GPT ? "GPT" : "MBR";
        
        return {
            powershellMethod("Initialize-Disk", 
                             "$d = Get-Disk -Number " + number + "; "
                             "if ($d.PartitionStyle -ne 'RAW') { Clear-Disk -Number " + number + 
                             " -RemoveData -RemoveOEM -Confirm:$false }; "
                             "Initialize-Disk -Number " + number + " -PartitionStyle " + style,
                             config.timeouts.partition),
            diskpartMethod("diskpart convert", {"select disk " + number, "clean", 
                                                "convert " + std::string(spec.scheme == TableType::GPT ? "gpt" : "mbr")},
                           config.timeouts.partition)
        };
    }
    
    std::vector<Fallback::Method> WindowsStrategy::partitionMethods(const Media::Device& device,
                                                                    const Media::FormatSpec& spec) {
        std::string number = std::to_string(diskNumber(device));
        bool mbr = spec.scheme == TableType::MBR;
        
        std::vector<std::string> script = {"select disk " + number, "create partition primary"};
        if (mbr) script.push_back("active");
        script.push_back("assign");
        Fallback::Method diskpart = diskpartMethod("diskpart create partition", script, config.timeouts.partition);
        
        // The storage cmdlets refuse FAT32 volumes above 32 GiB
        if (spec.filesystem == FSType::FAT32 && device.sizeBytes > FAT32_FORMAT_LIMIT) {
            return {diskpart};
        }
        
        return {
            powershellMethod("New-Partition", "New-Partition -DiskNumber " + number + 
                             " -UseMaximumSize -AssignDriveLetter" + (mbr ? " -IsActive" : ""),
                             config.timeouts.partition),
            diskpart
        };
    }
    
    std::vector<Fallback::Method> WindowsStrategy::formatMethods(const Media::Device& device,
                                                                 const Media::FormatSpec& spec) {
        std::string fsName = diskpartFsName(spec.filesystem);
        if (fsName.empty()) {
            throw UnsupportedFilesystemError(FilesystemSupport::getFSName(spec.filesystem) + 
                                             " cannot be created on Windows");
        }
        
        std::string number = std::to_string(diskNumber(device));
        std::string label = FilesystemSupport::normalizeLabel(spec.label, spec.filesystem);
        std::chrono::seconds timeout = spec.quick ? config.timeouts.quickFormat : config.timeouts.fullFormat;
        
        std::string formatLine = "format fs=" + fsName + " label=\"" + label + "\"" + (spec.quick ? " quick" : "");
        Fallback::Method diskpart = diskpartMethod("diskpart format", {"select disk " + number, "select partition 1",
                                                                       formatLine, "assign"}, timeout);
        
        if (spec.filesystem == FSType::FAT32 && device.sizeBytes > FAT32_FORMAT_LIMIT) {
            return {diskpart};
        }
        
        std::string formatName = FilesystemSupport::getFSName(spec.filesystem);
        return {
            powershellMethod("Format-Volume", "Get-Partition -DiskNumber " + number + " -PartitionNumber 1 | "
                             "Format-Volume -FileSystem " + formatName + " -NewFileSystemLabel " + psQuote(label) + 
                             (spec.quick ? "" : " -Full") + " -Confirm:$false", timeout),
            diskpart
        };
    }
    
    MountHandle WindowsStrategy::resolveMountHandle(const Media::Device& device,
                                                    const Media::FormatSpec& spec) {
        (void)spec;
        Media::Device probe = device;
        probe.mountPoint.clear();
        
        MountHandle handle;
        handle.path = driveOf(probe);
        handle.scratch = false;
        return handle;
    }
    
    std::string WindowsStrategy::rawDevicePath(const Media::Device& device) const {
        return "\\\\.\\PhysicalDrive" + std::to_string(diskNumber(device));
    }
    
    std::vector<Fallback::Method> WindowsStrategy::extractionMethods(const std::string& image,
                                                                     const std::string& staging) {
        std::vector<Fallback::Method> methods = {
            toolMethod("7z", runner, {"7z", "x", "-y", "-o" + staging, image}, config.timeouts.extract)
        };
        
        Fallback::Method mounted;
        mounted.name = "Mount-DiskImage and copy";
        mounted.precondition = [this]() {
            return !runner.which("powershell").empty();
        };
        mounted.action = [this, image, staging]() {
            Process::Outcome outcome = runner.run({"powershell", "-NoProfile", "-NonInteractive", "-Command",
                                                   "(Mount-DiskImage -ImagePath " + psQuote(image) + 
                                                   " -PassThru | Get-Volume).DriveLetter"}, config.timeouts.partition);
            if (!outcome.ok()) {
                return Media::Result::fail("Mount-DiskImage " + Process::summarize(outcome));
            }
            
            MountedDiskImage guard(runner, image, config.timeouts.partition);
            
            std::string drive = normalizeDriveLetter(outcome.output);
            if (drive.empty()) {
                return Media::Result::fail("Mount-DiskImage assigned no drive letter");
            }
            return copyTree(driveRoot(drive), staging, nullptr);
        };
        methods.push_back(mounted);
        
        return methods;
    }
    
    std::vector<Fallback::Method> WindowsStrategy::windowsBootSectorMethods(const Media::Device& device,
                                                                            const std::string& staging) {
        std::string drive = driveOf(device);
        std::vector<Fallback::Method> methods;
        
        std::string shipped = findPathIgnoreCase(staging, "boot/bootsect.exe");
        if (!shipped.empty()) {
            methods.push_back(bootsectMethod("bootsect from the image", shipped, drive));
        }
        methods.push_back(bootsectMethod("bootsect on PATH", "bootsect", drive));
        if (!config.bootsectPath.empty()) {
            methods.push_back(bootsectMethod("bootsect from BOOTSECT_PATH", config.bootsectPath, drive));
        }
        methods.push_back(bootsectMethod("bootsect from " + config.hardcodedBootsectPath, 
                                         config.hardcodedBootsectPath, drive));
        return methods;
    }
    
    std::vector<Fallback::Method> WindowsStrategy::dosSystemTransferMethods(const Media::Device& device,
                                                                            const std::string& staging) {
        std::string drive = driveOf(device);
        std::string sys = findFileIgnoreCase(staging, "sys.com");
        
        Fallback::Method method;
        method.name = "sys.com";
        method.precondition = [sys, drive]() {
            return !sys.empty() && !drive.empty();
        };
        method.action = [this, sys, drive]() {
            return runTool(runner, {"cmd", "/c", sys, drive}, config.timeouts.boot);
        };
        return {method};
    }
}
