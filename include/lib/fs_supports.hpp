#ifndef FS_SUPPORTS_HPP
#define FS_SUPPORTS_HPP

#include "lib/host.hpp"
#include <string>
#include <vector>

namespace FilesystemSupport {
    enum class FSType {
        FAT32,
        NTFS,
        EXFAT,
        UDF,
        EXT2,
        EXT3,
        EXT4,
        HFSPLUS,
        APFS,
        UNKNOWN
    };
    
    FSType parseFSType(const std::string& fsName);
    std::string getFSName(FSType fs);
    bool isSupported(FSType fs, Host::Platform platform);
    std::vector<FSType> getSupportedFilesystems(Host::Platform platform);
    
    // Volume labels are truncated to what the filesystem accepts
    size_t maxLabelLength(FSType fs);
    std::string normalizeLabel(const std::string& label, FSType fs);
}

#endif // FS_SUPPORTS_HPP
