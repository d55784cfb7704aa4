#ifndef IMAGE_INSPECTOR_HPP
#define IMAGE_INSPECTOR_HPP

#include "lib/media_types.hpp"
#include "utils/process.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace ImageInspector {
    
    const uint64_t ISO9660_DESCRIPTOR_OFFSET = 32768;
    
    // Keyword match on the file name only; GENERIC when nothing matches
    Media::ImageType typeFromFileName(const std::string& fileName);
    
    // Marker paths in the image; GENERIC when none match or several families do
    Media::ImageType typeFromEntries(const std::vector<std::string>& entries);
    
    // File name keywords first, then content markers
    Media::ImageType detectImageType(const std::string& fileName, const std::vector<std::string>& entries);
    
    // Lowercase, forward slashes, no leading "./" or "/"
    std::string normalizeEntry(const std::string& entry);
    
    std::vector<std::string> listEntries(const std::string& image, Process::ToolRunner& runner,
                                         std::chrono::seconds timeout);
    
    bool hasIso9660Signature(const std::string& image);
    bool hasHybridMBR(const std::string& image);
    
    Media::ImageMetadata inspect(const std::string& image);
}

#endif // IMAGE_INSPECTOR_HPP
