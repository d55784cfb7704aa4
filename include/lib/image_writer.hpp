#ifndef IMAGE_WRITER_HPP
#define IMAGE_WRITER_HPP

#include "lib/progress.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace ImageWriter {
    
    enum class Compression {
        NONE,
        GZIP,
        XZ,
        BZIP2
    };
    
    const size_t CHUNK_SIZE = 4 * 1024 * 1024;
    const size_t BUFFER_ALIGNMENT = 4096;
    
    // Chosen by extension: .gz, .xz, .bz2 (case-insensitive)
    Compression detectCompression(const std::string& path);
    std::string getCompressionName(Compression compression);
    
    // Decompressed byte stream over an image file
    class ImageSource {
    public:
        virtual ~ImageSource() = default;
        
        // Fills up to length bytes; returns 0 only at end of stream
        virtual size_t read(char* buffer, size_t length) = 0;
        
        // Bytes of the underlying file consumed so far
        virtual uint64_t consumed() const = 0;
    };
    
    std::unique_ptr<ImageSource> openSource(const std::string& path, Compression compression);
    
    // Streams the image onto target in CHUNK_SIZE blocks and returns the
    // number of bytes written. Throws FileError for the image and
    // DeviceError for the target.
    uint64_t writeRaw(const std::string& image, const std::string& target, Progress::Reporter& progress);
}

#endif // IMAGE_WRITER_HPP
