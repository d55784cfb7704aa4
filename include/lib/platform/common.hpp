#ifndef PLATFORM_COMMON_HPP
#define PLATFORM_COMMON_HPP

#include "lib/config.hpp"
#include "lib/fallback_chain.hpp"
#include "lib/mbr_gpt.hpp"
#include "utils/process.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace Platform {
    
    using CopyProgress = std::function<void(uint64_t copiedBytes, uint64_t totalBytes)>;
    
    Media::Result runTool(Process::ToolRunner& runner, const std::vector<std::string>& argv,
                          std::chrono::seconds timeout, const std::string& input = "");
    
    // Applicable when argv[0] resolves on PATH
    Fallback::Method toolMethod(const std::string& name, Process::ToolRunner& runner,
                                const std::vector<std::string>& argv, std::chrono::seconds timeout,
                                const std::string& input = "");
    
    bool pathExists(const std::string& path);
    std::string findPathIgnoreCase(const std::string& root, const std::string& relative);
    std::string findFileIgnoreCase(const std::string& root, const std::string& fileName);
    
    Media::Result copyTree(const std::string& source, const std::string& destination,
                           const CopyProgress& onProgress);
    
    // Scratch directories live under the configured temp root
    std::string createScratchDir(const std::string& root, const std::string& prefix);
    void removeScratchDir(const std::string& root, const std::string& path);
    
    // mbr.bin for MBR disks, gptmbr.bin for GPT disks
    std::vector<std::string> bootCodeSearchPaths(const Settings::Config& config,
                                                 BootStructures::TableType scheme);
    
    Fallback::Method directBootCodeMethod(const std::string& rawDevice, const Settings::Config& config,
                                          BootStructures::TableType scheme);
    
    // Sector-aligned read-patch-write of sector 0 with dd, for raw devices that
    // refuse partial-sector writes
    Fallback::Method ddBootCodeMethod(Process::ToolRunner& runner, const std::string& rawDevice,
                                      const Settings::Config& config, BootStructures::TableType scheme);
    
    std::string efiBootFile(const std::string& mountPoint);
    Fallback::Method imageLoaderMethod(const std::string& mountPoint);
    Fallback::Method installedLoaderMethod(const std::string& mountPoint,
                                           const std::vector<std::string>& candidates);
    Fallback::Method scanLoaderMethod(const std::string& mountPoint,
                                      const std::vector<std::string>& directories);
    
    std::vector<Fallback::Method> archiveExtractionMethods(Process::ToolRunner& runner,
                                                           const std::string& image,
                                                           const std::string& staging,
                                                           std::chrono::seconds timeout);
    
    // Points syslinux at an image's isolinux configuration when the image
    // ships none of its own. Returns false when nothing was written.
    bool writeSyslinuxBridge(const std::string& mountPoint);
    
    Fallback::Method msSysMethod(const std::string& name, Process::ToolRunner& runner,
                                 const std::string& option, const std::string& target,
                                 std::chrono::seconds timeout);
}

#endif // PLATFORM_COMMON_HPP
