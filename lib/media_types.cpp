#include "lib/media_types.hpp"
#include <algorithm>
#include <cctype>

namespace Media {
    
    static std::string toLower(const std::string& text) {
        std::string lower = text;
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return lower;
    }
    
    BootType parseBootType(const std::string& name, bool* ok) {
        std::string lower = toLower(name);
        if (ok) *ok = true;
        
        if (lower == "bios" || lower == "legacy") return BootType::BIOS;
        if (lower == "uefi" || lower == "efi") return BootType::UEFI;
        if (lower == "dual" || lower == "both") return BootType::DUAL;
        if (lower == "freedos" || lower == "dos") return BootType::FREEDOS;
        
        if (ok) *ok = false;
        return BootType::BIOS;
    }
    
    std::string getBootTypeName(BootType type) {
        switch (type) {
            case BootType::BIOS: return "BIOS";
            case BootType::UEFI: return "UEFI";
            case BootType::DUAL: return "Dual";
            case BootType::FREEDOS: return "FreeDOS";
        }
        return "unknown";
    }
    
    ImageType parseImageType(const std::string& name, bool* ok) {
        std::string lower = toLower(name);
        if (ok) *ok = true;
        
        if (lower == "windows") return ImageType::WINDOWS;
        if (lower == "linux") return ImageType::LINUX;
        if (lower == "freedos") return ImageType::FREEDOS;
        if (lower == "generic") return ImageType::GENERIC;
        if (lower == "auto" || lower.empty()) return ImageType::AUTO;
        
        if (ok) *ok = false;
        return ImageType::AUTO;
    }
    
    std::string getImageTypeName(ImageType type) {
        switch (type) {
            case ImageType::WINDOWS: return "windows";
            case ImageType::LINUX: return "linux";
            case ImageType::FREEDOS: return "freedos";
            case ImageType::GENERIC: return "generic";
            case ImageType::AUTO: return "auto";
        }
        return "generic";
    }
    
    std::string getStageName(Stage stage) {
        switch (stage) {
            case Stage::IDLE: return "Idle";
            case Stage::FORMATTING: return "Formatting";
            case Stage::DEPLOYING: return "Deploying";
            case Stage::INSTALLING_BOOT: return "InstallingBoot";
            case Stage::DONE: return "Done";
            case Stage::FAILED: return "Failed";
            case Stage::CANCELLED: return "Cancelled";
        }
        return "unknown";
    }
    
    bool isTerminal(Stage stage) {
        return stage == Stage::DONE || stage == Stage::FAILED || stage == Stage::CANCELLED;
    }
    
    Result validateSpecs(const FormatSpec& format, const BootSpec& boot) {
        if (format.scheme != boot.scheme) {
            return Result::fail("Partition scheme mismatch: format uses " + 
                                BootStructures::getTableName(format.scheme) + 
                                ", boot uses " + BootStructures::getTableName(boot.scheme));
        }
        
        if (boot.bootType == BootType::UEFI && boot.scheme != BootStructures::TableType::GPT) {
            return Result::fail("UEFI boot requires a GPT partition scheme");
        }
        
        if (boot.bootType == BootType::FREEDOS && boot.scheme != BootStructures::TableType::MBR) {
            return Result::fail("FreeDOS boot requires an MBR partition scheme");
        }
        
        if (format.filesystem == FilesystemSupport::FSType::UNKNOWN) {
            return Result::fail("No filesystem selected");
        }
        
        return Result::ok();
    }
}
