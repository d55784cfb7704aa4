#ifndef MEDIA_TYPES_HPP
#define MEDIA_TYPES_HPP

#include "lib/fs_supports.hpp"
#include "lib/mbr_gpt.hpp"
#include <cstdint>
#include <string>

namespace Media {
    
    struct Result {
        bool success = false;
        std::string message;
        
        static Result ok(const std::string& msg = "") { return {true, msg}; }
        static Result fail(const std::string& msg) { return {false, msg}; }
    };
    
    struct Device {
        std::string name;           // /dev/sdb, disk2, PhysicalDrive1
        int index = -1;             // Windows disk number
        std::string label;
        uint64_t sizeBytes = 0;
        std::string filesystem;
        std::string mountPoint;     // mount path or drive letter
        std::string error;
    };
    
    enum class BootType {
        BIOS,
        UEFI,
        DUAL,
        FREEDOS
    };
    
    enum class ImageType {
        WINDOWS,
        LINUX,
        FREEDOS,
        GENERIC,
        AUTO
    };
    
    struct FormatSpec {
        FilesystemSupport::FSType filesystem = FilesystemSupport::FSType::FAT32;
        std::string label = "BOOTFORGE";
        BootStructures::TableType scheme = BootStructures::TableType::MBR;
        bool quick = true;
    };
    
    struct BootSpec {
        BootType bootType = BootType::BIOS;
        ImageType imageType = ImageType::AUTO;
        BootStructures::TableType scheme = BootStructures::TableType::MBR;
    };
    
    struct ImageMetadata {
        ImageType type = ImageType::AUTO;
        uint64_t sizeBytes = 0;
        bool valid = false;
        bool hybrid = false;
        bool compressed = false;
    };
    
    enum class Stage {
        IDLE,
        FORMATTING,
        DEPLOYING,
        INSTALLING_BOOT,
        DONE,
        FAILED,
        CANCELLED
    };
    
    enum class Terminal {
        NONE,
        SUCCESS,
        FAILURE,
        CANCELLED
    };
    
    struct ProgressEvent {
        Stage stage = Stage::IDLE;
        int percent = 0;
        std::string message;
        Terminal terminal = Terminal::NONE;
    };
    
    struct PipelineResult {
        Stage state = Stage::IDLE;          // DONE, FAILED or CANCELLED
        Stage lastStage = Stage::IDLE;      // last working stage entered
        bool success = false;
        std::string message;
        std::string mountHandle;
    };
    
    BootType parseBootType(const std::string& name, bool* ok = nullptr);
    std::string getBootTypeName(BootType type);
    ImageType parseImageType(const std::string& name, bool* ok = nullptr);
    std::string getImageTypeName(ImageType type);
    std::string getStageName(Stage stage);
    bool isTerminal(Stage stage);
    
    // Scheme agreement between the two specs, checked before a run starts
    Result validateSpecs(const FormatSpec& format, const BootSpec& boot);
}

#endif // MEDIA_TYPES_HPP
