#ifndef DEV_HANDLER_HPP
#define DEV_HANDLER_HPP

#include "lib/media_types.hpp"
#include "utils/process.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace DeviceHandler {
    std::string devicePath(const std::string& name);
    std::string partitionPath(const std::string& device, int number);
    
    bool validateDevice(const std::string& device);
    bool isPartitionDevice(const std::string& device);
    // True for the disk itself and its partition nodes, never for a longer disk name
    bool isPartitionOf(const std::string& device, const std::string& node);
    bool isDeviceMounted(const std::string& device);
    bool isMountPoint(const std::string& path);
    std::vector<std::string> mountedPartitions(const std::string& device);
    bool unmountDevice(const std::string& device, Process::ToolRunner& runner);
    
    uint64_t getDeviceSize(const std::string& device);
    std::string getDeviceModel(const std::string& device);
    
    // Polls for a device node, calling between() after every miss
    bool waitForNode(const std::string& path, int attempts, 
                     std::chrono::milliseconds interval,
                     const std::function<void()>& between);
    
    // Device record for the CLI; problems land in the error field
    Media::Device describeDevice(const std::string& device);
}

#endif // DEV_HANDLER_HPP
