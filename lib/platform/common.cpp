#include "lib/platform/common.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"
#include "utils/temp_dir.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace Platform {
    
    static std::string toLower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return text;
    }
    
    Media::Result runTool(Process::ToolRunner& runner, const std::vector<std::string>& argv,
                          std::chrono::seconds timeout, const std::string& input) {
        Process::Outcome outcome = runner.run(argv, timeout, input);
        
        if (outcome.ok()) {
            return Media::Result::ok(argv.front() + " succeeded");
        }
        
        if (outcome.timedOut) {
            return Media::Result::fail(argv.front() + " timed out after " + 
                                       std::to_string(timeout.count()) + "s");
        }
        
        return Media::Result::fail(argv.front() + " " + Process::summarize(outcome));
    }
    
    Fallback::Method toolMethod(const std::string& name, Process::ToolRunner& runner,
                                const std::vector<std::string>& argv, std::chrono::seconds timeout,
                                const std::string& input) {
        Fallback::Method method;
        method.name = name;
        method.precondition = [&runner, argv]() {
            return !argv.empty() && !runner.which(argv.front()).empty();
        };
        method.action = [&runner, argv, timeout, input]() {
            return runTool(runner, argv, timeout, input);
        };
        return method;
    }
    
    bool pathExists(const std::string& path) {
        std::error_code ec;
        return !path.empty() && fs::exists(path, ec);
    }
    
    std::string findPathIgnoreCase(const std::string& root, const std::string& relative) {
        std::error_code ec;
        fs::path current(root);
        
        if (!fs::is_directory(current, ec)) {
            return "";
        }
        
        for (const auto& part : fs::path(relative)) {
            std::string wanted = toLower(part.string());
            if (wanted.empty() || wanted == "/") continue;
            
            bool found = false;
            for (const auto& entry : fs::directory_iterator(current, ec)) {
                if (toLower(entry.path().filename().string()) == wanted) {
                    current = entry.path();
                    found = true;
                    break;
                }
            }
            
            if (!found) {
                return "";
            }
        }
        
        return current.string();
    }
    
    std::string findFileIgnoreCase(const std::string& root, const std::string& fileName) {
        std::error_code ec;
        std::string wanted = toLower(fileName);
        std::vector<std::string> matches;
        
        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file(ec) && toLower(it->path().filename().string()) == wanted) {
                matches.push_back(it->path().string());
            }
        }
        
        if (matches.empty()) {
            return "";
        }
        
        // Shallowest match wins, ties broken alphabetically
        std::sort(matches.begin(), matches.end(), [](const std::string& a, const std::string& b) {
            auto depthA = std::count(a.begin(), a.end(), '/');
            auto depthB = std::count(b.begin(), b.end(), '/');
            return depthA != depthB ? depthA < depthB : a < b;
        });
        return matches.front();
    }
    
    Media::Result copyTree(const std::string& source, const std::string& destination,
                           const CopyProgress& onProgress) {
        std::error_code ec;
        
        if (!fs::is_directory(source, ec)) {
            return Media::Result::fail(source + " is not a directory");
        }
        
        fs::create_directories(destination, ec);
        if (ec) {
            return Media::Result::fail("Cannot create " + destination + ": " + ec.message());
        }
        
        uint64_t totalBytes = 0;
        size_t fileCount = 0;
        
        fs::recursive_directory_iterator scan(source, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && scan != fs::recursive_directory_iterator(); scan.increment(ec)) {
            std::error_code statError;
            if (!scan->is_symlink(statError) && scan->is_regular_file(statError)) {
                totalBytes += scan->file_size(statError);
                fileCount++;
            }
        }
        if (ec) {
            return Media::Result::fail("Cannot scan " + source + ": " + ec.message());
        }
        
        Logs::debug("Copying " + std::to_string(fileCount) + " files (" + 
                    std::to_string(totalBytes / (1024 * 1024)) + " MB) to " + destination);
        
        uint64_t copiedBytes = 0;
        size_t skippedLinks = 0;
        
        fs::recursive_directory_iterator it(source, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            fs::path relative = it->path().lexically_relative(source);
            fs::path target = fs::path(destination) / relative;
            std::error_code opError;
            
            if (it->is_symlink(opError)) {
                skippedLinks++;
                continue;
            }
            
            if (it->is_directory(opError)) {
                fs::create_directories(target, opError);
                if (opError) {
                    return Media::Result::fail("Cannot create " + target.string() + ": " + opError.message());
                }
                continue;
            }
            
            if (!it->is_regular_file(opError)) {
                continue;
            }
            
            fs::create_directories(target.parent_path(), opError);
            fs::copy_file(it->path(), target, fs::copy_options::overwrite_existing, opError);
            if (opError) {
                return Media::Result::fail("Cannot copy " + relative.string() + ": " + opError.message());
            }
            
            copiedBytes += it->file_size(opError);
            if (onProgress) {
                onProgress(copiedBytes, totalBytes);
            }
        }
        
        if (ec) {
            return Media::Result::fail("Copy of " + source + " interrupted: " + ec.message());
        }
        
        if (skippedLinks > 0) {
            Logs::warning("Skipped " + std::to_string(skippedLinks) + " symbolic links");
        }
        
        return Media::Result::ok("Copied " + std::to_string(fileCount) + " files");
    }
    
    std::string createScratchDir(const std::string& root, const std::string& prefix) {
        try {
            ScopedTempDir dir(root, prefix);
            // Ownership moves to the caller's mount tracking
            return dir.release();
        } catch (const FileError& e) {
            Logs::warning(e.what());
            return "";
        }
    }
    
    void removeScratchDir(const std::string& root, const std::string& path) {
        if (path.empty() || root.empty() || path.compare(0, root.size(), root) != 0) {
            return;
        }
        
        std::error_code ec;
        if (fs::is_directory(path, ec) && fs::is_empty(path, ec)) {
            fs::remove(path, ec);
        }
        if (ec) {
            Logs::warning("Could not remove scratch directory " + path + ": " + ec.message());
        }
    }
    
    std::vector<std::string> bootCodeSearchPaths(const Settings::Config& config,
                                                 BootStructures::TableType scheme) {
        if (scheme == BootStructures::TableType::MBR) {
            return config.mbrSearchPaths;
        }
        
        std::vector<std::string> paths;
        for (const auto& path : config.mbrSearchPaths) {
            size_t pos = path.rfind("mbr.bin");
            if (pos != std::string::npos && pos + 7 == path.size()) {
                paths.push_back(path.substr(0, pos) + "gptmbr.bin");
            }
        }
        return paths;
    }
    
    Fallback::Method directBootCodeMethod(const std::string& rawDevice, const Settings::Config& config,
                                          BootStructures::TableType scheme) {
        std::vector<std::string> searchPaths = bootCodeSearchPaths(config, scheme);
        
        Fallback::Method method;
        method.name = "direct boot code write";
        method.precondition = [searchPaths]() {
            return !BootStructures::findBootCode(searchPaths).empty();
        };
        method.action = [rawDevice, searchPaths]() {
            std::string source = BootStructures::findBootCode(searchPaths);
            std::vector<uint8_t> code = BootStructures::loadBootCode(source);
            
            BootStructures::PartitionTable table(rawDevice);
            table.writeBootCode(code);
            table.commit();
            
            return Media::Result::ok("Boot code from " + source + " written to " + rawDevice);
        };
        return method;
    }
    
    Fallback::Method ddBootCodeMethod(Process::ToolRunner& runner, const std::string& rawDevice,
                                      const Settings::Config& config, BootStructures::TableType scheme) {
        std::vector<std::string> searchPaths = bootCodeSearchPaths(config, scheme);
        std::string tempRoot = config.tempRoot;
        std::chrono::seconds timeout = config.timeouts.boot;
        
        Fallback::Method method;
        method.name = "dd boot code write";
        method.precondition = [&runner, searchPaths]() {
            return !runner.which("dd").empty() && !BootStructures::findBootCode(searchPaths).empty();
        };
        method.action = [&runner, rawDevice, searchPaths, tempRoot, timeout]() {
            std::string source = BootStructures::findBootCode(searchPaths);
            std::vector<uint8_t> code = BootStructures::loadBootCode(source);
            
            ScopedTempDir work(tempRoot, "bootforge_mbr_");
            std::string sectorFile = work.path() + "/sector0.bin";
            
            Media::Result read = runTool(runner, {"dd", "if=" + rawDevice, "of=" + sectorFile, 
                                                  "bs=512", "count=1"}, timeout);
            if (!read.success) {
                return read;
            }
            
            BootStructures::PartitionTable sector(sectorFile);
            sector.writeBootCode(code);
            
            return runTool(runner, {"dd", "if=" + sectorFile, "of=" + rawDevice, 
                                    "bs=512", "count=1", "conv=notrunc"}, timeout);
        };
        return method;
    }
    
    std::string efiBootFile(const std::string& mountPoint) {
        return (fs::path(mountPoint) / "EFI" / "BOOT" / "BOOTX64.EFI").string();
    }
    
    static Media::Result installLoader(const std::string& source, const std::string& mountPoint) {
        std::error_code ec;
        fs::path target(efiBootFile(mountPoint));
        
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return Media::Result::fail("Cannot create " + target.parent_path().string() + ": " + ec.message());
        }
        
        fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            return Media::Result::fail("Cannot copy " + source + ": " + ec.message());
        }
        
        return Media::Result::ok("UEFI loader installed from " + source);
    }
    
    Fallback::Method imageLoaderMethod(const std::string& mountPoint) {
        Fallback::Method method;
        method.name = "image-supplied loader";
        method.precondition = [mountPoint]() {
            return !findPathIgnoreCase(mountPoint, "EFI/BOOT/BOOTX64.EFI").empty();
        };
        method.action = []() {
            return Media::Result::ok("UEFI loader supplied by the image");
        };
        return method;
    }
    
    Fallback::Method installedLoaderMethod(const std::string& mountPoint,
                                           const std::vector<std::string>& candidates) {
        Fallback::Method method;
        method.name = "installed loader copy";
        method.precondition = [candidates]() {
            return std::any_of(candidates.begin(), candidates.end(), pathExists);
        };
        method.action = [mountPoint, candidates]() {
            std::string diagnostics;
            for (const auto& candidate : candidates) {
                if (!pathExists(candidate)) continue;
                
                Media::Result result = installLoader(candidate, mountPoint);
                if (result.success) {
                    return result;
                }
                diagnostics += (diagnostics.empty() ? "" : "; ") + result.message;
            }
            return Media::Result::fail(diagnostics);
        };
        return method;
    }
    
    static std::string scanForLoader(const std::vector<std::string>& directories) {
        std::vector<std::string> found;
        std::error_code ec;
        
        for (const auto& dir : directories) {
            if (!fs::is_directory(dir, ec)) continue;
            
            fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
            for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
                std::string name = toLower(it->path().filename().string());
                if (it->is_regular_file(ec) && name.size() > 4 && 
                    name.compare(name.size() - 4, 4, ".efi") == 0) {
                    found.push_back(it->path().string());
                }
            }
            ec.clear();
        }
        
        std::sort(found.begin(), found.end(), [](const std::string& a, const std::string& b) {
            bool a64 = toLower(a).find("x64") != std::string::npos;
            bool b64 = toLower(b).find("x64") != std::string::npos;
            return a64 != b64 ? a64 : a < b;
        });
        
        return found.empty() ? "" : found.front();
    }
    
    Fallback::Method scanLoaderMethod(const std::string& mountPoint,
                                      const std::vector<std::string>& directories) {
        Fallback::Method method;
        method.name = "system EFI scan";
        method.precondition = [directories]() {
            return std::any_of(directories.begin(), directories.end(), pathExists);
        };
        method.action = [mountPoint, directories]() {
            std::string loader = scanForLoader(directories);
            if (loader.empty()) {
                return Media::Result::fail("no .efi loader found");
            }
            return installLoader(loader, mountPoint);
        };
        return method;
    }
    
    std::vector<Fallback::Method> archiveExtractionMethods(Process::ToolRunner& runner,
                                                           const std::string& image,
                                                           const std::string& staging,
                                                           std::chrono::seconds timeout) {
        return {
            toolMethod("7z", runner, {"7z", "x", "-y", "-o" + staging, image}, timeout),
            toolMethod("bsdtar", runner, {"bsdtar", "-x", "-f", image, "-C", staging}, timeout),
            toolMethod("xorriso", runner, {"xorriso", "-osirrox", "on", "-indev", image, 
                                           "-extract", "/", staging}, timeout)
        };
    }
    
    bool writeSyslinuxBridge(const std::string& mountPoint) {
        for (const char* existing : {"syslinux.cfg", "syslinux/syslinux.cfg", "boot/syslinux/syslinux.cfg"}) {
            if (!findPathIgnoreCase(mountPoint, existing).empty()) {
                return false;
            }
        }
        
        for (const char* isolinuxDir : {"isolinux", "boot/isolinux"}) {
            std::string config = findPathIgnoreCase(mountPoint, std::string(isolinuxDir) + "/isolinux.cfg");
            if (config.empty()) continue;
            
            std::ofstream cfg(fs::path(mountPoint) / "syslinux.cfg");
            if (!cfg.is_open()) {
                Logs::warning("Cannot write syslinux.cfg on " + mountPoint);
                return false;
            }
            
            cfg << "CONFIG /" << isolinuxDir << "/isolinux.cfg\n";
            cfg << "APPEND /" << isolinuxDir << "/\n";
            Logs::debug("syslinux.cfg redirects to /" + std::string(isolinuxDir) + "/isolinux.cfg");
            return true;
        }
        
        return false;
    }
    
    Fallback::Method msSysMethod(const std::string& name, Process::ToolRunner& runner,
                                 const std::string& option, const std::string& target,
                                 std::chrono::seconds timeout) {
        return toolMethod(name, runner, {"ms-sys", option, target}, timeout);
    }
}
