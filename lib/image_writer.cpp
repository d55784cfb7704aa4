#include "lib/image_writer.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <new>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <zlib.h>
#include <lzma.h>
#include <bzlib.h>

namespace ImageWriter {
    
    static const size_t INPUT_BUFFER_SIZE = 256 * 1024;
    
    static bool endsWith(const std::string& text, const std::string& suffix) {
        if (text.size() < suffix.size()) {
            return false;
        }
        
        return std::equal(suffix.rbegin(), suffix.rend(), text.rbegin(), [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
        });
    }
    
    Compression detectCompression(const std::string& path) {
        if (endsWith(path, ".gz")) return Compression::GZIP;
        if (endsWith(path, ".xz")) return Compression::XZ;
        if (endsWith(path, ".bz2")) return Compression::BZIP2;
        return Compression::NONE;
    }
    
    std::string getCompressionName(Compression compression) {
        switch (compression) {
            case Compression::GZIP: return "gzip";
            case Compression::XZ: return "xz";
            case Compression::BZIP2: return "bzip2";
            default: return "none";
        }
    }
    
    class PlainSource : public ImageSource {
    private:
        std::string path;
        int fd;
        uint64_t total;
        
    public:
        explicit PlainSource(const std::string& imagePath) : path(imagePath), total(0) {
            fd = open(path.c_str(), O_RDONLY);
            if (fd < 0) {
                throw FileError(path, std::strerror(errno));
            }
        }
        
        ~PlainSource() override {
            close(fd);
        }
        
        size_t read(char* buffer, size_t length) override {
            size_t filled = 0;
            while (filled < length) {
                ssize_t n = ::read(fd, buffer + filled, length - filled);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    throw FileError(path, std::string("read failed: ") + std::strerror(errno));
                }
                if (n == 0) break;
                filled += n;
            }
            total += filled;
            return filled;
        }
        
        uint64_t consumed() const override {
            return total;
        }
    };
    
    class GzipSource : public ImageSource {
    private:
        std::string path;
        gzFile file;
        
    public:
        explicit GzipSource(const std::string& imagePath) : path(imagePath) {
            file = gzopen(path.c_str(), "rb");
            if (!file) {
                throw FileError(path, "cannot open gzip stream");
            }
            gzbuffer(file, INPUT_BUFFER_SIZE);
        }
        
        ~GzipSource() override {
            gzclose(file);
        }
        
        size_t read(char* buffer, size_t length) override {
            size_t filled = 0;
            while (filled < length) {
                unsigned int want = static_cast<unsigned int>(std::min<size_t>(length - filled, 1u << 30));
                int n = gzread(file, buffer + filled, want);
                if (n < 0) {
                    int code = 0;
                    const char* message = gzerror(file, &code);
                    throw FileError(path, std::string("gzip: ") + (message ? message : "corrupt stream"));
                }
                if (n == 0) break;
                filled += n;
            }
            return filled;
        }
        
        uint64_t consumed() const override {
            z_off_t offset = gzoffset(file);
            return offset < 0 ? 0 : static_cast<uint64_t>(offset);
        }
    };
    
    class XzSource : public ImageSource {
    private:
        std::string path;
        FILE* file;
        lzma_stream stream;
        std::vector<uint8_t> input;
        bool finished;
        uint64_t total;
        
    public:
        explicit XzSource(const std::string& imagePath) 
            : path(imagePath), input(INPUT_BUFFER_SIZE), finished(false), total(0) {
            lzma_stream blank = LZMA_STREAM_INIT;
            stream = blank;
            
            file = std::fopen(path.c_str(), "rb");
            if (!file) {
                throw FileError(path, std::strerror(errno));
            }
            
            if (lzma_stream_decoder(&stream, UINT64_MAX, LZMA_CONCATENATED) != LZMA_OK) {
                std::fclose(file);
                throw FileError(path, "cannot initialise the xz decoder");
            }
        }
        
        ~XzSource() override {
            lzma_end(&stream);
            std::fclose(file);
        }
        
        size_t read(char* buffer, size_t length) override {
            if (finished) {
                return 0;
            }
            
            stream.next_out = reinterpret_cast<uint8_t*>(buffer);
            stream.avail_out = length;
            
            while (stream.avail_out > 0) {
                lzma_action action = LZMA_RUN;
                
                if (stream.avail_in == 0) {
                    size_t n = std::fread(input.data(), 1, input.size(), file);
                    if (std::ferror(file)) {
                        throw FileError(path, "read failed");
                    }
                    total += n;
                    stream.next_in = input.data();
                    stream.avail_in = n;
                    if (std::feof(file)) {
                        action = LZMA_FINISH;
                    }
                } else if (std::feof(file)) {
                    action = LZMA_FINISH;
                }
                
                lzma_ret ret = lzma_code(&stream, action);
                if (ret == LZMA_STREAM_END) {
                    finished = true;
                    break;
                }
                if (ret != LZMA_OK) {
                    throw FileError(path, "xz: corrupt stream (code " + std::to_string(ret) + ")");
                }
            }
            
            return length - stream.avail_out;
        }
        
        uint64_t consumed() const override {
            return total;
        }
    };
    
    class Bzip2Source : public ImageSource {
    private:
        std::string path;
        FILE* file;
        BZFILE* bz;
        bool finished;
        
        void openStream(void* unused, int unusedCount) {
            int error = BZ_OK;
            bz = BZ2_bzReadOpen(&error, file, 0, 0, unused, unusedCount);
            if (error != BZ_OK) {
                BZ2_bzReadClose(&error, bz);
                bz = nullptr;
                throw FileError(path, "cannot open bzip2 stream");
            }
        }
        
        // Concatenated .bz2 files hold one stream per part
        bool nextStream() {
            int error = BZ_OK;
            void* unusedPtr = nullptr;
            int unusedCount = 0;
            BZ2_bzReadGetUnused(&error, bz, &unusedPtr, &unusedCount);
            
            std::vector<char> unused(static_cast<char*>(unusedPtr), static_cast<char*>(unusedPtr) + unusedCount);
            BZ2_bzReadClose(&error, bz);
            bz = nullptr;
            
            if (unused.empty()) {
                int c = std::fgetc(file);
                if (c == EOF) {
                    return false;
                }
                std::ungetc(c, file);
            }
            
            openStream(unused.empty() ? nullptr : unused.data(), static_cast<int>(unused.size()));
            return true;
        }
        
    public:
        explicit Bzip2Source(const std::string& imagePath) : path(imagePath), bz(nullptr), finished(false) {
            file = std::fopen(path.c_str(), "rb");
            if (!file) {
                throw FileError(path, std::strerror(errno));
            }
            
            try {
                openStream(nullptr, 0);
            } catch (...) {
                std::fclose(file);
                throw;
            }
        }
        
        ~Bzip2Source() override {
            if (bz) {
                int error = BZ_OK;
                BZ2_bzReadClose(&error, bz);
            }
            std::fclose(file);
        }
        
        size_t read(char* buffer, size_t length) override {
            size_t filled = 0;
            
            while (!finished && filled < length) {
                int error = BZ_OK;
                int want = static_cast<int>(std::min<size_t>(length - filled, 1 << 30));
                int n = BZ2_bzRead(&error, bz, buffer + filled, want);
                
                if (error != BZ_OK && error != BZ_STREAM_END) {
                    throw FileError(path, "bzip2: corrupt stream (code " + std::to_string(error) + ")");
                }
                filled += n;
                
                if (error == BZ_STREAM_END && !nextStream()) {
                    finished = true;
                }
            }
            
            return filled;
        }
        
        uint64_t consumed() const override {
            long offset = std::ftell(file);
            return offset < 0 ? 0 : static_cast<uint64_t>(offset);
        }
    };
    
    std::unique_ptr<ImageSource> openSource(const std::string& path, Compression compression) {
        switch (compression) {
            case Compression::GZIP:
                return std::unique_ptr<ImageSource>(new GzipSource(path));
            case Compression::XZ:
                return std::unique_ptr<ImageSource>(new XzSource(path));
            case Compression::BZIP2:
                return std::unique_ptr<ImageSource>(new Bzip2Source(path));
            default:
                return std::unique_ptr<ImageSource>(new PlainSource(path));
        }
    }
    
    struct AlignedFree {
        void operator()(char* buffer) const { std::free(buffer); }
    };
    
    static int openTarget(const std::string& target, bool& direct) {
        struct stat st;
        bool blockDevice = stat(target.c_str(), &st) == 0 && S_ISBLK(st.st_mode);
        direct = false;
        
        if (!blockDevice) {
            return open(target.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        }
        
#ifdef O_DIRECT
        int fd = open(target.c_str(), O_WRONLY | O_SYNC | O_DIRECT);
        if (fd >= 0) {
            direct = true;
            return fd;
        }
#endif
        return open(target.c_str(), O_WRONLY | O_SYNC);
    }
    
    static void writeAll(int fd, const char* data, size_t length, const std::string& target) {
        size_t written = 0;
        while (written < length) {
            ssize_t n = write(fd, data + written, length - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                throw DeviceError(target, std::string("write failed: ") + std::strerror(errno));
            }
            written += n;
        }
    }
    
    uint64_t writeRaw(const std::string& image, const std::string& target, Progress::Reporter& progress) {
        struct stat st;
        if (stat(image.c_str(), &st) != 0) {
            throw FileError(image, "cannot stat image");
        }
        uint64_t sourceSize = static_cast<uint64_t>(st.st_size);
        
        Compression compression = detectCompression(image);
        std::unique_ptr<ImageSource> source = openSource(image, compression);
        
        void* raw = nullptr;
        if (posix_memalign(&raw, BUFFER_ALIGNMENT, CHUNK_SIZE) != 0) {
            throw std::bad_alloc();
        }
        std::unique_ptr<char, AlignedFree> buffer(static_cast<char*>(raw));
        
        bool direct = false;
        int fd = openTarget(target, direct);
        if (fd < 0) {
            throw DeviceError(target, std::string("cannot open for writing: ") + std::strerror(errno));
        }
        
        Logs::info("Writing " + image + " to " + target + 
                   (compression == Compression::NONE ? "" : " (" + getCompressionName(compression) + ")"));
        
        uint64_t written = 0;
        
        try {
            size_t length;
            while ((length = source->read(buffer.get(), CHUNK_SIZE)) > 0) {
#ifdef O_DIRECT
                // O_DIRECT needs aligned lengths; the unaligned tail goes through the page cache
                if (direct && length % BUFFER_ALIGNMENT != 0) {
                    int flags = fcntl(fd, F_GETFL);
                    fcntl(fd, F_SETFL, flags & ~O_DIRECT);
                    direct = false;
                }
#endif
                writeAll(fd, buffer.get(), length, target);
                written += length;
                
                int percent = sourceSize > 0 ? static_cast<int>(source->consumed() * 100 / sourceSize) : 0;
                progress.update(std::min(percent, 99), "Written " + std::to_string(written / (1024 * 1024)) + " MB");
            }
            
            if (fsync(fd) != 0 && errno != EINVAL) {
                throw DeviceError(target, std::string("fsync failed: ") + std::strerror(errno));
            }
        } catch (...) {
            close(fd);
            throw;
        }
        
        close(fd);
        progress.update(100, "Wrote " + std::to_string(written) + " bytes");
        
        Logs::success("Image written to " + target);
        return written;
    }
}
