#include "lib/mbr_gpt.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <filesystem>
#ifdef __linux__
#include <linux/fs.h>
#endif

namespace BootStructures {
    
    TableType parseTableType(const std::string& name, bool* ok) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        
        if (ok) *ok = (lower == "mbr" || lower == "gpt" || lower == "msdos" || lower == "dos");
        
        if (lower == "gpt") return TableType::GPT;
        return TableType::MBR;
    }
    
    std::string getTableName(TableType type) {
        return type == TableType::GPT ? "GPT" : "MBR";
    }
    
    PartitionTable::PartitionTable(const std::string& dev)
        : device(dev), deviceFd(-1) {
    }
    
    PartitionTable::~PartitionTable() {
        if (deviceFd >= 0) {
            close(deviceFd);
        }
    }
    
    void PartitionTable::open() {
        if (deviceFd >= 0) {
            return;
        }
        
        deviceFd = ::open(device.c_str(), O_RDWR | O_SYNC);
        if (deviceFd < 0) {
            throw DeviceError(device, std::string("Cannot open device: ") + strerror(errno));
        }
    }
    
    MBR PartitionTable::readMBR() {
        open();
        
        MBR mbr;
        if (pread(deviceFd, &mbr, sizeof(MBR), 0) != static_cast<ssize_t>(sizeof(MBR))) {
            throw DeviceError(device, "Failed to read MBR");
        }
        
        return mbr;
    }
    
    void PartitionTable::writeMBR(const MBR& mbr) {
        if (pwrite(deviceFd, &mbr, sizeof(MBR), 0) != static_cast<ssize_t>(sizeof(MBR))) {
            throw BootSectorWriteError("Failed to write MBR to " + device);
        }
        
        fsync(deviceFd);
    }
    
    bool PartitionTable::hasBootSignature() {
        return readMBR().signature == BOOT_SIGNATURE;
    }
    
    bool PartitionTable::isProtectiveMBR() {
        MBR mbr = readMBR();
        return mbr.signature == BOOT_SIGNATURE && mbr.partitions[0].partitionType == 0xEE;
    }
    
    void PartitionTable::makeBootable(int partitionIndex) {
        if (partitionIndex < 0 || partitionIndex > 3) {
            throw PartitionError("Invalid MBR partition index " + std::to_string(partitionIndex));
        }
        
        MBR mbr = readMBR();
        
        if (mbr.signature != BOOT_SIGNATURE) {
            throw PartitionError(device + " has no MBR partition table");
        }
        
        if (mbr.partitions[partitionIndex].partitionType == 0x00) {
            throw PartitionError("Partition " + std::to_string(partitionIndex + 1) + 
                                 " on " + device + " is empty");
        }
        
        for (int i = 0; i < 4; i++) {
            mbr.partitions[i].status = (i == partitionIndex) ? 0x80 : 0x00;
        }
        
        writeMBR(mbr);
        Logs::debug("Active flag set on partition " + std::to_string(partitionIndex + 1));
    }
    
    void PartitionTable::writeBootCode(const std::vector<uint8_t>& bootCode) {
        if (bootCode.size() < BOOT_CODE_SIZE) {
            throw BootSectorWriteError("Boot code is " + std::to_string(bootCode.size()) + 
                                       " bytes, expected " + std::to_string(BOOT_CODE_SIZE));
        }
        
        // Disk signature and partition entries stay untouched
        MBR mbr = readMBR();
        memcpy(mbr.bootCode, bootCode.data(), BOOT_CODE_SIZE);
        mbr.signature = BOOT_SIGNATURE;
        
        writeMBR(mbr);
        Logs::debug("Wrote " + std::to_string(BOOT_CODE_SIZE) + " bytes of boot code to " + device);
    }
    
    bool PartitionTable::commit() {
        if (deviceFd < 0) {
            return false;
        }
        
        fsync(deviceFd);
        
        struct stat st;
        if (fstat(deviceFd, &st) != 0 || !S_ISBLK(st.st_mode)) {
            return true;
        }
        
#ifdef BLKRRPART
        if (ioctl(deviceFd, BLKRRPART) < 0) {
            Logs::warning("Kernel did not re-read the partition table of " + device);
            return false;
        }
#endif
        return true;
    }
    
    std::vector<uint8_t> loadBootCode(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            throw FileError(path, "Cannot open boot code");
        }
        
        std::vector<uint8_t> code(BOOT_CODE_SIZE);
        file.read(reinterpret_cast<char*>(code.data()), BOOT_CODE_SIZE);
        
        if (file.gcount() != static_cast<std::streamsize>(BOOT_CODE_SIZE)) {
            throw FileError(path, "Boot code shorter than " + std::to_string(BOOT_CODE_SIZE) + " bytes");
        }
        
        return code;
    }
    
    std::string findBootCode(const std::vector<std::string>& searchPaths) {
        std::error_code ec;
        for (const auto& path : searchPaths) {
            if (std::filesystem::is_regular_file(path, ec) &&
                std::filesystem::file_size(path, ec) >= BOOT_CODE_SIZE) {
                return path;
            }
        }
        return "";
    }
}
