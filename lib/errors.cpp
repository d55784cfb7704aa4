#include "lib/errors.hpp"
#include "lib/media_types.hpp"
#include "utils/logs.hpp"

BootForgeException::BootForgeException(const std::string& kind, const std::string& msg)
    : errorKind(kind), message(msg) {}

const char* BootForgeException::what() const noexcept {
    return message.c_str();
}

const std::string& BootForgeException::kind() const noexcept {
    return errorKind;
}

PrivilegeError::PrivilegeError(const std::string& msg)
    : BootForgeException("PrivilegeError", msg) {}

DeviceError::DeviceError(const std::string& device, const std::string& cause)
    : BootForgeException("DeviceError", "Device error on " + device + ": " + cause) {}

PartitionError::PartitionError(const std::string& msg)
    : BootForgeException("PartitionError", msg) {}

FormatError::FormatError(const std::string& msg)
    : BootForgeException("FormatError", msg) {}

MountResolutionError::MountResolutionError(const std::string& msg)
    : BootForgeException("MountResolutionError", msg) {}

ExtractionError::ExtractionError(const std::string& msg)
    : BootForgeException("ExtractionError", msg) {}

BootSectorWriteError::BootSectorWriteError(const std::string& msg)
    : BootForgeException("BootSectorWriteError", msg) {}

UnsupportedPlatformError::UnsupportedPlatformError(const std::string& msg)
    : BootForgeException("UnsupportedPlatformError", msg) {}

UnsupportedFilesystemError::UnsupportedFilesystemError(const std::string& msg)
    : BootForgeException("UnsupportedFilesystemError", msg) {}

CancelledError::CancelledError(const std::string& msg)
    : BootForgeException("CancelledError", msg) {}

FileError::FileError(const std::string& file, const std::string& cause)
    : BootForgeException("FileError", "File error with " + file + ": " + cause) {}

namespace ErrorHandler {
    void handleFatalError(const std::string& device, const std::string& cause) {
        std::string devName = device;
        if (devName.find("/dev/") == 0) {
            devName = devName.substr(5);
        }
        
        Logs::fatal("Fatal Error: Fail writing at " + devName + ", cause: " + cause);
    }
    
    std::string describe(const std::exception& error) {
        const auto* typed = dynamic_cast<const BootForgeException*>(&error);
        if (typed) {
            return typed->kind() + ": " + typed->what();
        }
        return error.what();
    }
    
    Media::Result toResult(const std::exception& error) {
        return Media::Result::fail(describe(error));
    }
}
