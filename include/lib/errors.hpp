#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <string>
#include <exception>

namespace Media {
    struct Result;
}

class BootForgeException : public std::exception {
private:
    std::string errorKind;
    std::string message;
    
public:
    BootForgeException(const std::string& kind, const std::string& msg);
    const char* what() const noexcept override;
    const std::string& kind() const noexcept;
};

class PrivilegeError : public BootForgeException {
public:
    explicit PrivilegeError(const std::string& msg);
};

class DeviceError : public BootForgeException {
public:
    DeviceError(const std::string& device, const std::string& cause);
};

class PartitionError : public BootForgeException {
public:
    explicit PartitionError(const std::string& msg);
};

class FormatError : public BootForgeException {
public:
    explicit FormatError(const std::string& msg);
};

class MountResolutionError : public BootForgeException {
public:
    explicit MountResolutionError(const std::string& msg);
};

class ExtractionError : public BootForgeException {
public:
    explicit ExtractionError(const std::string& msg);
};

class BootSectorWriteError : public BootForgeException {
public:
    explicit BootSectorWriteError(const std::string& msg);
};

class UnsupportedPlatformError : public BootForgeException {
public:
    explicit UnsupportedPlatformError(const std::string& msg);
};

class UnsupportedFilesystemError : public BootForgeException {
public:
    explicit UnsupportedFilesystemError(const std::string& msg);
};

class CancelledError : public BootForgeException {
public:
    explicit CancelledError(const std::string& msg);
};

class FileError : public BootForgeException {
public:
    FileError(const std::string& file, const std::string& cause);
};

namespace ErrorHandler {
    void handleFatalError(const std::string& device, const std::string& cause);
    
    // "<Kind>: <message>" for typed errors, plain what() otherwise
    std::string describe(const std::exception& error);
    Media::Result toResult(const std::exception& error);
}

#endif // ERRORS_HPP
