#include "lib/config.hpp"
#include "lib/dev_handler.hpp"
#include "lib/errors.hpp"
#include "lib/fs_supports.hpp"
#include "lib/host.hpp"
#include "lib/image_inspector.hpp"
#include "lib/media_types.hpp"
#include "lib/orchestrator.hpp"
#include "lib/platform/strategy.hpp"
#include "utils/colors.hpp"
#include "utils/logs.hpp"
#include "utils/process.hpp"
#include "utils/progress_bar.hpp"
#include "misc/version.hpp"
#include <iostream>
#include <string>
#include <thread>
#include <csignal>
#include <getopt.h>
#include <unistd.h>

struct Options {
    std::string imagePath;
    std::string device;
    FilesystemSupport::FSType fsType = FilesystemSupport::FSType::FAT32;
    BootStructures::TableType tableType = BootStructures::TableType::MBR;
    Media::BootType bootType = Media::BootType::BIOS;
    Media::ImageType imageType = Media::ImageType::AUTO;
    std::string label = "BOOTFORGE";
    bool raw = false;
    bool fullFormat = false;
    bool dryRun = false;
    bool forceOperation = false;
    bool verbose = false;
    std::string logFile;
};

static volatile std::sig_atomic_t interrupted = 0;

static void onInterrupt(int) {
    interrupted = 1;
}

void printUsage() {
    std::cout << Colors::bold("Usage:") << " bootforge [OPTIONS]\n\n";
    std::cout << Colors::cyan("Options:") << "\n";
    std::cout << "  -i <file>        Input image (ISO, or .img/.gz/.xz/.bz2 with --raw)\n";
    std::cout << "  -o <device>      Output device (/dev/sdX, disk2, PhysicalDrive1)\n";
    std::cout << "  -f <fs>          Filesystem (fat32, ntfs, exfat, udf, ext2, ext3, ext4, hfs+, apfs)\n";
    std::cout << "  -t <type>        Partition table type (mbr or gpt)\n";
    std::cout << "  -b <boot>        Boot type (bios, uefi, dual, freedos)\n";
    std::cout << "  -l <label>       Volume label\n";
    std::cout << "  -T <type>        Image type (windows, linux, freedos, generic, auto)\n";
    std::cout << "  --raw            Write the image block by block instead of extracting it\n";
    std::cout << "  --full-format    Full instead of quick format\n";
    std::cout << "  --dry-run        Show the planned operation without changing anything\n";
    std::cout << "  --force          Skip the confirmation prompt\n";
    std::cout << "  --verbose        Show debug output\n";
    std::cout << "  --log-file <f>   Mirror all output into a log file\n";
    std::cout << "  -v               Show version information\n";
    std::cout << "  -h               Show this help message\n\n";
    
    std::cout << Colors::bold("Examples:") << "\n";
    std::cout << "  bootforge -i ubuntu.iso -o /dev/sdb\n";
    std::cout << "  bootforge -i Win11.iso -o /dev/sdb -f ntfs -t gpt -b uefi\n";
    std::cout << "  bootforge -i FD13-LiveCD.iso -o /dev/sdc -b freedos --force\n";
    std::cout << "  bootforge -i raspios.img.xz -o /dev/sdb --raw\n\n";
    
    std::cout << Colors::yellow("Note: ") << "This tool requires administrator privileges\n";
    std::cout << Colors::yellow("      Device must be a whole disk (e.g., /dev/sdb), not a partition (e.g., /dev/sdb1)\n");
}

bool parseArguments(int argc, char* argv[], Options& opts) {
    int opt;
    
    static struct option long_options[] = {
        {"raw", no_argument, 0, 'r'},
        {"full-format", no_argument, 0, 'F'},
        {"dry-run", no_argument, 0, 'd'},
        {"force", no_argument, 0, 'y'},
        {"verbose", no_argument, 0, 'V'},
        {"log-file", required_argument, 0, 'L'},
        {"version", no_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };
    
    int option_index = 0;
    
    while ((opt = getopt_long(argc, argv, "i:o:f:t:b:l:T:vh", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'i':
                opts.imagePath = optarg;
                break;
            case 'o':
                opts.device = optarg;
                break;
            case 'f':
                opts.fsType = FilesystemSupport::parseFSType(optarg);
                if (opts.fsType == FilesystemSupport::FSType::UNKNOWN) {
                    Logs::error("Unknown filesystem: " + std::string(optarg));
                    return false;
                }
                break;
            case 't': {
                bool ok = false;
                opts.tableType = BootStructures::parseTableType(optarg, &ok);
                if (!ok) {
                    Logs::error("Invalid partition table type. Use 'mbr' or 'gpt'");
                    return false;
                }
                break;
            }
            case 'b': {
                bool ok = false;
                opts.bootType = Media::parseBootType(optarg, &ok);
                if (!ok) {
                    Logs::error("Invalid boot type. Use 'bios', 'uefi', 'dual' or 'freedos'");
                    return false;
                }
                break;
            }
            case 'l':
                opts.label = optarg;
                break;
            case 'T': {
                bool ok = false;
                opts.imageType = Media::parseImageType(optarg, &ok);
                if (!ok) {
                    Logs::error("Invalid image type. Use 'windows', 'linux', 'freedos', 'generic' or 'auto'");
                    return false;
                }
                break;
            }
            case 'r':
                opts.raw = true;
                break;
            case 'F':
                opts.fullFormat = true;
                break;
            case 'd':
                opts.dryRun = true;
                break;
            case 'y':
                opts.forceOperation = true;
                break;
            case 'V':
                opts.verbose = true;
                break;
            case 'L':
                opts.logFile = optarg;
                break;
            case 'v':
                Version::printVersion();
                exit(0);
            case 'h':
                printUsage();
                exit(0);
            default:
                printUsage();
                return false;
        }
    }
    
    if (opts.imagePath.empty() || opts.device.empty()) {
        Logs::error("Both -i (input image) and -o (output device) are required");
        printUsage();
        return false;
    }
    
    return true;
}

std::string getBaseDevice(const std::string& device) {
    std::string base = device;
    while (!base.empty() && base.back() >= '0' && base.back() <= '9') {
        base.pop_back();
    }
    if (base.size() > 1 && base.back() == 'p' && 
        (base.find("nvme") != std::string::npos || base.find("mmcblk") != std::string::npos)) {
        base.pop_back();
    }
    return base;
}

Media::Device resolveDevice(const std::string& name, Host::Platform host) {
    if (host == Host::Platform::LINUX) {
        return DeviceHandler::describeDevice(name);
    }
    
    Media::Device device;
    device.name = name;
    return device;
}

void showDryRunInfo(const Options& opts, const Media::Device& device, const Media::ImageMetadata& metadata,
                    Host::Platform host) {
    std::string scheme = BootStructures::getTableName(opts.tableType);
    
    std::cout << "\n" << Colors::bold(Colors::cyan("=== DRY RUN MODE - NO CHANGES WILL BE MADE ===")) << "\n\n";
    
    std::cout << Colors::bold("Input Information:") << "\n";
    std::cout << "  Image File: " << opts.imagePath << "\n";
    std::cout << "  Image Size: " << ProgressBar::formatSize(metadata.sizeBytes) << "\n";
    std::cout << "  Image Type: " << Media::getImageTypeName(opts.imageType == Media::ImageType::AUTO ? 
                                                             metadata.type : opts.imageType) << "\n";
    std::cout << "  Hybrid: " << (metadata.hybrid ? "Yes" : "No") << "\n";
    std::cout << "  Target Device: " << device.name << "\n";
    if (!device.label.empty()) {
        std::cout << "  Device Model: " << device.label << "\n";
    }
    std::cout << "  Device Size: " << ProgressBar::formatSize(device.sizeBytes) << "\n";
    std::cout << "  Host: " << Host::getPlatformName(host) << "\n\n";
    
    std::cout << Colors::bold("Planned Operations:") << "\n";
    std::cout << "  1. Dismount " << device.name << "\n";
    std::cout << "  2. Create " << scheme << " partition table and one primary partition\n";
    std::cout << "  3. " << (opts.fullFormat ? "Full" : "Quick") << " format as " 
              << FilesystemSupport::getFSName(opts.fsType) << " labelled " 
              << FilesystemSupport::normalizeLabel(opts.label, opts.fsType) << "\n";
    if (opts.raw) {
        std::cout << "  4. Write the image block by block (boot records come from the image)\n";
    } else {
        std::cout << "  4. Extract the image and copy its files\n";
        std::cout << "  5. Install " << Media::getBootTypeName(opts.bootType) << " boot code\n";
    }
    
    std::cout << "\n" << Colors::green("All checks passed. Ready to proceed with actual operation.") << "\n";
    std::cout << Colors::yellow("Remove --dry-run flag to perform the actual operation.") << "\n\n";
}

int main(int argc, char* argv[]) {
    Options opts;
    
    try {
        Colors::setEnabled(isatty(STDOUT_FILENO));
        Version::printBanner();
        
        if (argc < 2) {
            printUsage();
            return 1;
        }
        
        if (!parseArguments(argc, argv, opts)) {
            return 1;
        }
        
        Settings::Config config = Settings::fromEnvironment();
        if (!opts.logFile.empty()) config.logFile = opts.logFile;
        config.verbose = config.verbose || opts.verbose;
        
        Logs::setVerbose(config.verbose);
        if (!config.logFile.empty() && !Logs::setLogFile(config.logFile)) {
            Logs::warning("Cannot open log file " + config.logFile);
        }
        
        Host::Platform host = Host::detect();
        if (host == Host::Platform::UNSUPPORTED) {
            throw UnsupportedPlatformError("this operating system is not supported");
        }
        
        if (!FilesystemSupport::isSupported(opts.fsType, host)) {
            Logs::error(FilesystemSupport::getFSName(opts.fsType) + " is not supported on " + 
                        Host::getPlatformName(host));
            std::cout << "Supported filesystems: ";
            for (const auto& fs : FilesystemSupport::getSupportedFilesystems(host)) {
                std::cout << FilesystemSupport::getFSName(fs) << " ";
            }
            std::cout << std::endl;
            return 1;
        }
        
        Pipeline::Request request;
        request.image = opts.imagePath;
        request.extractFiles = !opts.raw;
        request.format.filesystem = opts.fsType;
        request.format.label = FilesystemSupport::normalizeLabel(opts.label, opts.fsType);
        request.format.scheme = opts.tableType;
        request.format.quick = !opts.fullFormat;
        request.boot.bootType = opts.bootType;
        request.boot.imageType = opts.imageType;
        request.boot.scheme = opts.tableType;
        
        Media::Result specs = Media::validateSpecs(request.format, request.boot);
        if (!specs.success) {
            Logs::error(specs.message);
            return 1;
        }
        
        Logs::info("Image File: " + opts.imagePath);
        Logs::info("Target Device: " + opts.device);
        
        if (host == Host::Platform::LINUX && DeviceHandler::isPartitionDevice(opts.device)) {
            std::string baseDevice = getBaseDevice(opts.device);
            Logs::fatal("Fatal Error: The target device is incomplete.");
            std::cerr << Colors::red("  You specified: " + opts.device) << std::endl;
            std::cerr << Colors::green("  Try instead: " + baseDevice) << std::endl;
            std::cerr << Colors::yellow("  Just remove the partition number at the end.") << std::endl;
            return 1;
        }
        
        request.device = resolveDevice(opts.device, host);
        if (!request.device.error.empty()) {
            ErrorHandler::handleFatalError(opts.device, request.device.error);
            return 1;
        }
        
        request.metadata = ImageInspector::inspect(opts.imagePath);
        if (request.metadata.sizeBytes == 0) {
            throw FileError(opts.imagePath, "missing or empty image");
        }
        if (!request.metadata.valid) {
            Logs::warning("Image has neither an ISO 9660 descriptor nor a boot signature");
        }
        if (request.metadata.compressed && !opts.raw) {
            Logs::error("Compressed images can only be written with --raw");
            return 1;
        }
        
        Logs::info("Image size: " + ProgressBar::formatSize(request.metadata.sizeBytes));
        if (request.device.sizeBytes > 0) {
            Logs::info("Device size: " + ProgressBar::formatSize(request.device.sizeBytes));
            
            if (!request.metadata.compressed && request.metadata.sizeBytes > request.device.sizeBytes) {
                throw DeviceError(opts.device, "Device too small for image");
            }
        }
        
        if (opts.dryRun) {
            showDryRunInfo(opts, request.device, request.metadata, host);
            return 0;
        }
        
        if (!opts.forceOperation) {
            std::cout << Colors::yellow("\nWARNING: All data on " + opts.device + 
                         " will be destroyed!") << std::endl;
            std::cout << "Continue? (yes/no): ";
            
            std::string confirm;
            std::cin >> confirm;
            
            if (confirm != "yes") {
                Logs::info("Operation cancelled by user");
                return 2;
            }
        } else {
            Logs::warning("Proceeding with --force flag");
        }
        
        Process::SystemRunner runner;
        std::unique_ptr<Platform::PlatformStrategy> strategy = Platform::create(host, runner, config);
        
        ProgressBar bar;
        Media::Stage shownStage = Media::Stage::IDLE;
        
        Progress::Sink sink = [&bar, &shownStage](const Media::ProgressEvent& event) {
            if (event.terminal != Media::Terminal::NONE) {
                bar.finish(event.terminal == Media::Terminal::SUCCESS);
                return;
            }
            
            if (event.stage != shownStage) {
                bar.finish();
                bar.restart(Media::getStageName(event.stage));
                shownStage = event.stage;
            }
            bar.update(static_cast<size_t>(event.percent), event.message);
        };
        
        Pipeline::Orchestrator orchestrator(*strategy, runner, config, sink);
        Pipeline::Worker worker(orchestrator, request);
        
        std::signal(SIGINT, onInterrupt);
        worker.start();
        
        while (!worker.finished()) {
            if (interrupted && !worker.cancelled()) {
                std::cout << std::endl;
                Logs::warning("Interrupt received, stopping after the current stage");
                worker.cancel();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        
        Media::PipelineResult result = worker.wait();
        std::signal(SIGINT, SIG_DFL);
        
        if (result.state == Media::Stage::CANCELLED) {
            Logs::warning("Operation cancelled during " + Media::getStageName(result.lastStage));
            if (!result.mountHandle.empty()) {
                Logs::info("Partially prepared volume: " + result.mountHandle);
            }
            return 2;
        }
        
        if (!result.success) {
            ErrorHandler::handleFatalError(opts.device, result.message);
            return 1;
        }
        
        std::cout << "\n" << Colors::green(Colors::bold("✓ SUCCESS!")) << std::endl;
        Logs::success("Bootable media created successfully!");
        Logs::info("You can now safely remove " + opts.device);
        
        return 0;
        
    } catch (const DeviceError& e) {
        std::string device = opts.device.empty() ? "unknown" : opts.device;
        ErrorHandler::handleFatalError(device, e.what());
        return 1;
    } catch (const BootForgeException& e) {
        Logs::fatal(ErrorHandler::describe(e));
        return 1;
    } catch (const std::exception& e) {
        Logs::fatal("Unexpected error: " + std::string(e.what()));
        return 1;
    }
}
