#include "utils/temp_dir.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"
#include <filesystem>
#include <vector>
#include <cerrno>
#include <cstdlib>
#include <cstring>

ScopedTempDir::ScopedTempDir(const std::string& root, const std::string& prefix) {
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    
    std::string pattern = (std::filesystem::path(root) / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    
    if (mkdtemp(buffer.data()) == nullptr) {
        throw FileError(pattern, std::string("Cannot create temporary directory: ") + strerror(errno));
    }
    
    dirPath = buffer.data();
    Logs::debug("Created temporary directory " + dirPath);
}

ScopedTempDir::~ScopedTempDir() {
    remove();
}

void ScopedTempDir::remove() {
    if (dirPath.empty()) {
        return;
    }
    
    std::error_code ec;
    
    // Extracted image trees keep read-only directory modes
    std::filesystem::recursive_directory_iterator it(dirPath, ec);
    for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code permError;
        if (it->is_directory(permError) && !it->is_symlink(permError)) {
            std::filesystem::permissions(it->path(), std::filesystem::perms::owner_all,
                                         std::filesystem::perm_options::add, permError);
        }
    }
    ec.clear();
    
    std::filesystem::remove_all(dirPath, ec);
    if (ec) {
        Logs::warning("Could not remove " + dirPath + ": " + ec.message());
    } else {
        Logs::debug("Removed temporary directory " + dirPath);
    }
    dirPath.clear();
}

std::string ScopedTempDir::release() {
    std::string released = dirPath;
    dirPath.clear();
    return released;
}
