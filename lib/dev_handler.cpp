#include "lib/dev_handler.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"
#include <algorithm>
#include <fstream>
#include <thread>
#include <sys/stat.h>
#include <cctype>
#include <cstring>
#ifdef __linux__
#include <mntent.h>
#endif

namespace DeviceHandler {
    
    static const std::chrono::seconds UMOUNT_TIMEOUT(30);
    
    static std::string baseName(const std::string& device) {
        return device.substr(device.find_last_of('/') + 1);
    }
    
    std::string devicePath(const std::string& name) {
        if (name.empty() || name[0] == '/') {
            return name;
        }
        return "/dev/" + name;
    }
    
    std::string partitionPath(const std::string& device, int number) {
        std::string path = devicePath(device);
        
        // Kernel names ending in a digit take a "p" separator
        if (!path.empty() && std::isdigit(static_cast<unsigned char>(path.back()))) {
            return path + "p" + std::to_string(number);
        }
        return path + std::to_string(number);
    }
    
    bool validateDevice(const std::string& device) {
        struct stat st;
        if (stat(devicePath(device).c_str(), &st) != 0) {
            return false;
        }
        
        return S_ISBLK(st.st_mode);
    }
    
    bool isPartitionDevice(const std::string& device) {
        std::string name = baseName(devicePath(device));
        std::ifstream partition("/sys/class/block/" + name + "/partition");
        return partition.is_open();
    }
    
    static std::vector<std::pair<std::string, std::string>> readMounts() {
        std::vector<std::pair<std::string, std::string>> mounts;
#ifdef __linux__
        FILE* table = setmntent("/proc/mounts", "r");
        if (!table) return mounts;
        
        struct mntent* entry;
        while ((entry = getmntent(table)) != nullptr) {
            mounts.emplace_back(entry->mnt_fsname, entry->mnt_dir);
        }
        
        endmntent(table);
#endif
        return mounts;
    }
    
    bool isPartitionOf(const std::string& device, const std::string& node) {
        std::string path = devicePath(device);
        if (path.empty() || node.compare(0, path.size(), path) != 0) {
            return false;
        }
        
        std::string suffix = node.substr(path.size());
        if (suffix.empty()) {
            return true;
        }
        
        // nvme0n1 -> nvme0n1p1, sdb -> sdb1
        if (std::isdigit(static_cast<unsigned char>(path.back()))) {
            if (suffix[0] != 'p') {
                return false;
            }
            suffix.erase(0, 1);
        }
        
        return !suffix.empty() && std::all_of(suffix.begin(), suffix.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        });
    }
    
    bool isDeviceMounted(const std::string& device) {
        return !mountedPartitions(device).empty();
    }
    
    bool isMountPoint(const std::string& path) {
        if (path.empty()) {
            return false;
        }
        
        std::string wanted = path;
        while (wanted.size() > 1 && wanted.back() == '/') {
            wanted.pop_back();
        }
        
        for (const auto& mount : readMounts()) {
            if (mount.second == wanted) {
                return true;
            }
        }
        return false;
    }
    
    std::vector<std::string> mountedPartitions(const std::string& device) {
        std::string path = devicePath(device);
        std::vector<std::string> dirs;
        
        for (const auto& mount : readMounts()) {
            if (isPartitionOf(path, mount.first)) {
                dirs.push_back(mount.second);
            }
        }
        return dirs;
    }
    
    bool unmountDevice(const std::string& device, Process::ToolRunner& runner) {
        std::vector<std::string> dirs = mountedPartitions(device);
        if (dirs.empty()) {
            return true;
        }
        
        Logs::info("Unmounting " + devicePath(device));
        
        for (const auto& dir : dirs) {
            Process::Outcome outcome = runner.run({"umount", dir}, UMOUNT_TIMEOUT);
            if (!outcome.ok()) {
                Logs::warning("Failed to unmount " + dir + " cleanly, forcing...");
                runner.run({"umount", "-l", dir}, UMOUNT_TIMEOUT);
            }
        }
        
        return !isDeviceMounted(device);
    }
    
    uint64_t getDeviceSize(const std::string& device) {
        std::string sizeFile = "/sys/class/block/" + baseName(devicePath(device)) + "/size";
        
        std::ifstream file(sizeFile);
        if (!file.is_open()) {
            throw DeviceError(device, "Cannot read device size");
        }
        
        uint64_t sectors = 0;
        file >> sectors;
        
        return sectors * 512;
    }
    
    std::string getDeviceModel(const std::string& device) {
        std::string name = baseName(devicePath(device));
        std::string model;
        
        for (const char* field : {"/device/vendor", "/device/model"}) {
            std::ifstream file("/sys/class/block/" + name + field);
            std::string value;
            if (file.is_open() && std::getline(file, value)) {
                size_t end = value.find_last_not_of(" \t\n");
                if (end == std::string::npos) continue;
                if (!model.empty()) model += " ";
                model += value.substr(0, end + 1);
            }
        }
        
        return model.empty() ? name : model;
    }
    
    bool waitForNode(const std::string& path, int attempts, 
                     std::chrono::milliseconds interval,
                     const std::function<void()>& between) {
        struct stat st;
        for (int attempt = 0; attempt < attempts; attempt++) {
            if (stat(path.c_str(), &st) == 0) {
                return true;
            }
            if (between) between();
            std::this_thread::sleep_for(interval);
        }
        return stat(path.c_str(), &st) == 0;
    }
    
    Media::Device describeDevice(const std::string& device) {
        Media::Device record;
        record.name = devicePath(device);
        
        if (!validateDevice(record.name)) {
            record.error = record.name + " is not a block device";
            return record;
        }
        
        if (isPartitionDevice(record.name)) {
            record.error = record.name + " is a partition, not a whole disk";
            return record;
        }
        
        try {
            record.sizeBytes = getDeviceSize(record.name);
        } catch (const DeviceError& e) {
            record.error = e.what();
            return record;
        }
        
        if (record.sizeBytes == 0) {
            record.error = "No medium present in " + record.name;
            return record;
        }
        
        record.label = getDeviceModel(record.name);
        
        std::vector<std::string> dirs = mountedPartitions(record.name);
        if (!dirs.empty()) {
            record.mountPoint = dirs.front();
        }
        
        return record;
    }
}
