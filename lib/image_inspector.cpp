#include "lib/image_inspector.hpp"
#include "lib/image_writer.hpp"
#include "lib/mbr_gpt.hpp"
#include "utils/logs.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <regex>
#include <sstream>
#include <sys/stat.h>

namespace ImageInspector {
    
    static const std::regex WINDOWS_NAME("(^|[^a-z])(windows|win(\\d+|xp|vista)?|microsoft)([^a-z]|$)");
    static const std::regex FREEDOS_NAME("freedos|(^|[^a-z])fd\\d{2}");
    static const std::regex LINUX_NAME("(^|[^a-z])(ubuntu|kubuntu|xubuntu|lubuntu|debian|fedora|centos|rhel|"
                                       "rocky|almalinux|opensuse|suse|archlinux|arch|manjaro|gentoo|linuxmint|"
                                       "mint|kali|parrot|zorin|elementary|slackware|puppy|tails|knoppix|bodhi|"
                                       "deepin|pop-os|popos|endeavouros|elementaryos|alpine|void|nixos|linux)([^a-z]|$)");
    
    static const std::vector<std::string> WINDOWS_MARKERS = {
        "sources/install.wim", "sources/install.esd", "sources/boot.wim", "bootmgr"
    };
    static const std::vector<std::string> LINUX_MARKERS = {
        "casper", "live", "arch", "images/pxeboot", "install.amd", "boot/grub", "liveos"
    };
    // isolinux also ships on FreeDOS and rescue images, so it only decides when nothing else matched
    static const std::vector<std::string> WEAK_LINUX_MARKERS = {
        "isolinux"
    };
    static const std::vector<std::string> FREEDOS_MARKERS = {
        "freedos", "fdconfig.sys", "kernel.sys", "command.com"
    };
    
    static std::string toLower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return text;
    }
    
    static std::string baseName(const std::string& path) {
        size_t slash = path.find_last_of("/\\");
        return slash == std::string::npos ? path : path.substr(slash + 1);
    }
    
    Media::ImageType typeFromFileName(const std::string& fileName) {
        std::string name = toLower(baseName(fileName));
        
        if (std::regex_search(name, WINDOWS_NAME)) return Media::ImageType::WINDOWS;
        if (std::regex_search(name, LINUX_NAME)) return Media::ImageType::LINUX;
        if (std::regex_search(name, FREEDOS_NAME)) return Media::ImageType::FREEDOS;
        return Media::ImageType::GENERIC;
    }
    
    std::string normalizeEntry(const std::string& entry) {
        std::string path = toLower(entry);
        std::replace(path.begin(), path.end(), '\\', '/');
        
        while (path.compare(0, 2, "./") == 0) path.erase(0, 2);
        while (!path.empty() && path.front() == '/') path.erase(0, 1);
        while (!path.empty() && (path.back() == '/' || path.back() == '\r')) path.pop_back();
        
        return path;
    }
    
    static bool matchesAny(const std::vector<std::string>& entries, const std::vector<std::string>& markers) {
        for (const auto& raw : entries) {
            std::string entry = normalizeEntry(raw);
            for (const auto& marker : markers) {
                if (entry == marker || entry.compare(0, marker.size() + 1, marker + "/") == 0) {
                    return true;
                }
            }
        }
        return false;
    }
    
    Media::ImageType typeFromEntries(const std::vector<std::string>& entries) {
        std::vector<Media::ImageType> families;
        
        if (matchesAny(entries, WINDOWS_MARKERS)) families.push_back(Media::ImageType::WINDOWS);
        if (matchesAny(entries, LINUX_MARKERS)) families.push_back(Media::ImageType::LINUX);
        if (matchesAny(entries, FREEDOS_MARKERS)) families.push_back(Media::ImageType::FREEDOS);
        
        if (families.empty() && matchesAny(entries, WEAK_LINUX_MARKERS)) {
            return Media::ImageType::LINUX;
        }
        if (families.size() != 1) {
            return Media::ImageType::GENERIC;
        }
        return families.front();
    }
    
    Media::ImageType detectImageType(const std::string& fileName, const std::vector<std::string>& entries) {
        Media::ImageType byName = typeFromFileName(fileName);
        if (byName != Media::ImageType::GENERIC) {
            return byName;
        }
        return typeFromEntries(entries);
    }
    
    static std::vector<std::string> splitLines(const std::string& output) {
        std::vector<std::string> lines;
        std::istringstream stream(output);
        std::string line;
        while (std::getline(stream, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (!line.empty()) lines.push_back(line);
        }
        return lines;
    }
    
    std::vector<std::string> listEntries(const std::string& image, Process::ToolRunner& runner,
                                         std::chrono::seconds timeout) {
        if (!runner.which("bsdtar").empty()) {
            Process::Outcome outcome = runner.run({"bsdtar", "-t", "-f", image}, timeout);
            if (outcome.ok()) {
                return splitLines(outcome.output);
            }
            Logs::debug("bsdtar listing failed: " + Process::summarize(outcome));
        }
        
        if (!runner.which("7z").empty()) {
            Process::Outcome outcome = runner.run({"7z", "l", "-slt", image}, timeout);
            if (outcome.ok()) {
                std::vector<std::string> entries;
                for (const auto& line : splitLines(outcome.output)) {
                    // The first "Path = " line names the archive itself
                    if (line.compare(0, 7, "Path = ") == 0 && line.substr(7) != image) {
                        entries.push_back(line.substr(7));
                    }
                }
                return entries;
            }
            Logs::debug("7z listing failed: " + Process::summarize(outcome));
        }
        
        if (!runner.which("isoinfo").empty()) {
            Process::Outcome outcome = runner.run({"isoinfo", "-R", "-f", "-i", image}, timeout);
            if (outcome.ok()) {
                return splitLines(outcome.output);
            }
            Logs::debug("isoinfo listing failed: " + Process::summarize(outcome));
        }
        
        Logs::warning("Could not list the contents of " + image);
        return {};
    }
    
    bool hasIso9660Signature(const std::string& image) {
        std::ifstream file(image, std::ios::binary);
        if (!file.is_open()) return false;
        
        // Primary volume descriptor: type byte, then "CD001"
        char descriptor[6] = {};
        file.seekg(ISO9660_DESCRIPTOR_OFFSET);
        file.read(descriptor, sizeof(descriptor));
        
        return file.gcount() == sizeof(descriptor) && std::memcmp(descriptor + 1, "CD001", 5) == 0;
    }
    
    bool hasHybridMBR(const std::string& image) {
        std::ifstream file(image, std::ios::binary);
        if (!file.is_open()) return false;
        
        BootStructures::MBR mbr;
        file.read(reinterpret_cast<char*>(&mbr), sizeof(mbr));
        if (file.gcount() != sizeof(mbr) || mbr.signature != BootStructures::BOOT_SIGNATURE) {
            return false;
        }
        
        for (const auto& entry : mbr.partitions) {
            if (entry.partitionType != 0 && entry.sectorCount != 0) {
                return hasIso9660Signature(image);
            }
        }
        return false;
    }
    
    Media::ImageMetadata inspect(const std::string& image) {
        Media::ImageMetadata metadata;
        
        struct stat st;
        if (stat(image.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
            Logs::warning(image + " is not a readable image file");
            return metadata;
        }
        
        metadata.sizeBytes = static_cast<uint64_t>(st.st_size);
        metadata.compressed = ImageWriter::detectCompression(image) != ImageWriter::Compression::NONE;
        
        if (metadata.compressed) {
            metadata.valid = metadata.sizeBytes > 0;
        } else {
            bool iso = hasIso9660Signature(image);
            metadata.hybrid = iso && hasHybridMBR(image);
            
            BootStructures::MBR mbr;
            std::ifstream file(image, std::ios::binary);
            file.read(reinterpret_cast<char*>(&mbr), sizeof(mbr));
            bool diskImage = file.gcount() == sizeof(mbr) && mbr.signature == BootStructures::BOOT_SIGNATURE;
            
            metadata.valid = iso || diskImage;
        }
        
        Media::ImageType byName = typeFromFileName(image);
        metadata.type = byName == Media::ImageType::GENERIC ? Media::ImageType::AUTO : byName;
        
        Logs::debug("Image " + image + ": " + std::to_string(metadata.sizeBytes) + " bytes" +
                    (metadata.hybrid ? ", hybrid" : "") + (metadata.compressed ? ", compressed" : "") +
                    (metadata.valid ? "" : ", unrecognised layout"));
        return metadata;
    }
}
