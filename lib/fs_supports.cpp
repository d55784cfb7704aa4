#include "lib/fs_supports.hpp"
#include <algorithm>
#include <cctype>

namespace FilesystemSupport {
    
    FSType parseFSType(const std::string& fsName) {
        std::string lower = fsName;
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        
        if (lower == "fat32" || lower == "vfat") return FSType::FAT32;
        if (lower == "ntfs") return FSType::NTFS;
        if (lower == "exfat") return FSType::EXFAT;
        if (lower == "udf") return FSType::UDF;
        if (lower == "ext2") return FSType::EXT2;
        if (lower == "ext3") return FSType::EXT3;
        if (lower == "ext4") return FSType::EXT4;
        if (lower == "hfs+" || lower == "hfsplus") return FSType::HFSPLUS;
        if (lower == "apfs") return FSType::APFS;
        
        return FSType::UNKNOWN;
    }
    
    std::string getFSName(FSType fs) {
        switch (fs) {
            case FSType::FAT32: return "FAT32";
            case FSType::NTFS: return "NTFS";
            case FSType::EXFAT: return "exFAT";
            case FSType::UDF: return "UDF";
            case FSType::EXT2: return "ext2";
            case FSType::EXT3: return "ext3";
            case FSType::EXT4: return "ext4";
            case FSType::HFSPLUS: return "HFS+";
            case FSType::APFS: return "APFS";
            default: return "unknown";
        }
    }
    
    std::vector<FSType> getSupportedFilesystems(Host::Platform platform) {
        switch (platform) {
            case Host::Platform::LINUX:
                return {FSType::FAT32, FSType::NTFS, FSType::EXFAT, FSType::UDF,
                        FSType::EXT2, FSType::EXT3, FSType::EXT4};
            case Host::Platform::WINDOWS:
                return {FSType::FAT32, FSType::NTFS, FSType::EXFAT, FSType::UDF};
            case Host::Platform::MACOS:
                return {FSType::FAT32, FSType::EXFAT, FSType::HFSPLUS, FSType::APFS};
            default:
                return {};
        }
    }
    
    bool isSupported(FSType fs, Host::Platform platform) {
        if (fs == FSType::UNKNOWN) {
            return false;
        }
        
        std::vector<FSType> supported = getSupportedFilesystems(platform);
        return std::find(supported.begin(), supported.end(), fs) != supported.end();
    }
    
    size_t maxLabelLength(FSType fs) {
        switch (fs) {
            case FSType::FAT32: return 11;
            case FSType::EXFAT: return 15;
            case FSType::EXT2:
            case FSType::EXT3:
            case FSType::EXT4: return 16;
            case FSType::NTFS: return 32;
            default: return 63;
        }
    }
    
    std::string normalizeLabel(const std::string& label, FSType fs) {
        std::string result;
        for (char c : label) {
            if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-') {
                result += c;
            } else if (c == ' ') {
                result += '_';
            }
        }
        
        if (fs == FSType::FAT32) {
            std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
                return static_cast<char>(std::toupper(c));
            });
        }
        
        if (result.size() > maxLabelLength(fs)) {
            result.resize(maxLabelLength(fs));
        }
        
        return result.empty() ? "BOOTFORGE" : result;
    }
}
