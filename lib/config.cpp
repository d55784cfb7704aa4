#include "lib/config.hpp"
#include "utils/logs.hpp"
#include <cstdlib>
#include <filesystem>

namespace Settings {
    
    static std::string readEnv(const char* name) {
        const char* value = getenv(name);
        return value ? value : "";
    }
    
    Config defaults() {
        Config config;
        
        std::error_code ec;
        std::filesystem::path tmp = std::filesystem::temp_directory_path(ec);
        config.tempRoot = ec ? "/tmp" : tmp.string();
        
        config.mbrSearchPaths = {
            "/usr/lib/syslinux/mbr/mbr.bin",
            "/usr/lib/syslinux/mbr.bin",
            "/usr/share/syslinux/mbr.bin",
            "/usr/lib/syslinux/bios/mbr.bin",
            "/usr/local/share/syslinux/mbr.bin",
            "/opt/homebrew/share/syslinux/mbr.bin",
            "C:\\syslinux\\bios\\mbr\\mbr.bin"
        };
        
        config.efiLoaderPaths = {
            "/usr/lib/systemd/boot/efi/systemd-bootx64.efi",
            "/usr/share/efi/systemd-boot/systemd-bootx64.efi",
            "/usr/lib/grub/x86_64-efi/grubx64.efi",
            "/usr/share/efi-x86_64/grub/grubx64.efi",
            "/usr/lib/syslinux/efi64/syslinux.efi",
            "/usr/lib/SYSLINUX.EFI/efi64/syslinux.efi",
            "/usr/share/refind/refind/refind_x64.efi",
            "/usr/standalone/i386/boot.efi",
            "C:\\syslinux\\efi64\\syslinux.efi"
        };
        
        config.efiScanDirs = {
            "/boot/efi",
            "/usr/share/efi",
            "/usr/lib/efi"
        };
        
        return config;
    }
    
    Config fromEnvironment() {
        Config config = defaults();
        
        std::string tempRoot = readEnv("BOOTFORGE_TMPDIR");
        if (!tempRoot.empty()) {
            config.tempRoot = tempRoot;
        }
        
        config.bootsectPath = readEnv("BOOTSECT_PATH");
        
        std::string mbrPath = readEnv("BOOTFORGE_MBR_PATH");
        if (!mbrPath.empty()) {
            config.mbrSearchPaths.insert(config.mbrSearchPaths.begin(), mbrPath);
        }
        
        config.logFile = readEnv("BOOTFORGE_LOG_FILE");
        
        std::string timeout = readEnv("BOOTFORGE_TOOL_TIMEOUT");
        if (!timeout.empty()) {
            try {
                long seconds = std::stol(timeout);
                if (seconds > 0) {
                    config.timeouts.boot = std::chrono::seconds(seconds);
                } else {
                    Logs::warning("Ignoring non-positive BOOTFORGE_TOOL_TIMEOUT");
                }
            } catch (const std::exception&) {
                Logs::warning("Ignoring invalid BOOTFORGE_TOOL_TIMEOUT: " + timeout);
            }
        }
        
        return config;
    }
}
