#include <gtest/gtest.h>

#include <fstream>
#include <iterator>
#include <memory>
#include <vector>

#include <bzlib.h>
#include <lzma.h>
#include <zlib.h>

#include "lib/errors.hpp"
#include "lib/image_writer.hpp"
#include "misc/version.hpp"
#include "utils/temp_dir.hpp"

using namespace testing;

using ImageWriter::Compression;

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class ImageWriterTest : public Test {
public:
    void SetUp() override
    {
        mTempDir.reset(new ScopedTempDir(::testing::TempDir(), "writer_"));
        mTarget = mTempDir->path() + "/target.img";
        
        // Spans two chunks and ends off a sector boundary
        mPayload.resize(ImageWriter::CHUNK_SIZE + 3 * 512 + 77);
        for (size_t i = 0; i < mPayload.size(); i++) {
            mPayload[i] = static_cast<char>((i * 31 + i / 4096) & 0xFF);
        }
    }
    
    void TearDown() override { mTempDir.reset(); }
    
protected:
    std::string WritePlain(const std::string& name)
    {
        std::string path = mTempDir->path() + "/" + name;
        std::ofstream file(path, std::ios::binary);
        file.write(mPayload.data(), mPayload.size());
        return path;
    }
    
    std::string WriteGzip(const std::string& name)
    {
        std::string path = mTempDir->path() + "/" + name;
        gzFile file = gzopen(path.c_str(), "wb");
        EXPECT_NE(file, nullptr);
        EXPECT_EQ(gzwrite(file, mPayload.data(), static_cast<unsigned>(mPayload.size())),
                  static_cast<int>(mPayload.size()));
        gzclose(file);
        return path;
    }
    
    std::string WriteXz(const std::string& name)
    {
        std::vector<uint8_t> out(mPayload.size() + mPayload.size() / 2 + 4096);
        size_t outPos = 0;
        
        lzma_ret ret = lzma_easy_buffer_encode(1, LZMA_CHECK_CRC64, nullptr,
                                               reinterpret_cast<const uint8_t*>(mPayload.data()), mPayload.size(),
                                               out.data(), &outPos, out.size());
        EXPECT_EQ(ret, LZMA_OK);
        
        return WriteBytes(name, reinterpret_cast<const char*>(out.data()), outPos);
    }
    
    std::string WriteBzip2(const std::string& name, int streams)
    {
        std::string compressed;
        size_t part = mPayload.size() / streams;
        
        for (int i = 0; i < streams; i++) {
            size_t begin = i * part;
            size_t length = (i == streams - 1) ? mPayload.size() - begin : part;
            
            std::vector<char> out(length + length / 100 + 1024);
            unsigned int outLength = static_cast<unsigned int>(out.size());
            int ret = BZ2_bzBuffToBuffCompress(out.data(), &outLength, mPayload.data() + begin,
                                               static_cast<unsigned int>(length), 9, 0, 0);
            EXPECT_EQ(ret, BZ_OK);
            compressed.append(out.data(), outLength);
        }
        
        return WriteBytes(name, compressed.data(), compressed.size());
    }
    
    std::string WriteBytes(const std::string& name, const char* data, size_t length)
    {
        std::string path = mTempDir->path() + "/" + name;
        std::ofstream file(path, std::ios::binary);
        file.write(data, length);
        return path;
    }
    
    std::vector<char> ReadTarget()
    {
        std::ifstream file(mTarget, std::ios::binary);
        return std::vector<char>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }
    
    std::unique_ptr<ScopedTempDir> mTempDir;
    std::string mTarget;
    std::vector<char> mPayload;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(ImageWriterTest, DetectCompressionByExtension)
{
    EXPECT_EQ(ImageWriter::detectCompression("disk.img"), Compression::NONE);
    EXPECT_EQ(ImageWriter::detectCompression("disk.img.gz"), Compression::GZIP);
    EXPECT_EQ(ImageWriter::detectCompression("DISK.IMG.XZ"), Compression::XZ);
    EXPECT_EQ(ImageWriter::detectCompression("disk.img.bz2"), Compression::BZIP2);
    EXPECT_EQ(ImageWriter::detectCompression("gz"), Compression::NONE);
}

TEST_F(ImageWriterTest, PlainImage)
{
    std::vector<Media::ProgressEvent> events;
    Progress::Reporter progress([&events](const Media::ProgressEvent& event) { events.push_back(event); });
    
    uint64_t written = ImageWriter::writeRaw(WritePlain("plain.img"), mTarget, progress);
    
    EXPECT_EQ(written, mPayload.size());
    EXPECT_EQ(ReadTarget(), mPayload);
    
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().percent, 100);
    for (size_t i = 1; i < events.size(); i++) {
        EXPECT_GE(events[i].percent, events[i - 1].percent);
    }
}

TEST_F(ImageWriterTest, ExistingTargetIsTruncated)
{
    WriteBytes("target.img", std::string(mPayload.size() * 2, 'x').data(), mPayload.size() * 2);
    Progress::Reporter progress(nullptr);
    
    ImageWriter::writeRaw(WritePlain("plain.img"), mTarget, progress);
    
    EXPECT_EQ(ReadTarget().size(), mPayload.size());
}

TEST_F(ImageWriterTest, GzipImage)
{
    Progress::Reporter progress(nullptr);
    
    uint64_t written = ImageWriter::writeRaw(WriteGzip("disk.img.gz"), mTarget, progress);
    
    EXPECT_EQ(written, mPayload.size());
    EXPECT_EQ(ReadTarget(), mPayload);
}

TEST_F(ImageWriterTest, XzImage)
{
    Progress::Reporter progress(nullptr);
    
    uint64_t written = ImageWriter::writeRaw(WriteXz("disk.img.xz"), mTarget, progress);
    
    EXPECT_EQ(written, mPayload.size());
    EXPECT_EQ(ReadTarget(), mPayload);
}

TEST_F(ImageWriterTest, MultiStreamBzip2Image)
{
    Progress::Reporter progress(nullptr);
    
    uint64_t written = ImageWriter::writeRaw(WriteBzip2("disk.img.bz2", 3), mTarget, progress);
    
    EXPECT_EQ(written, mPayload.size());
    EXPECT_EQ(ReadTarget(), mPayload);
}

TEST_F(ImageWriterTest, CorruptXzIsFileError)
{
    std::string garbage(4096, 'z');
    std::string image = WriteBytes("broken.img.xz", garbage.data(), garbage.size());
    Progress::Reporter progress(nullptr);
    
    EXPECT_THROW(ImageWriter::writeRaw(image, mTarget, progress), FileError);
}

TEST_F(ImageWriterTest, MissingImageIsFileError)
{
    Progress::Reporter progress(nullptr);
    
    EXPECT_THROW(ImageWriter::writeRaw(mTempDir->path() + "/none.img", mTarget, progress), FileError);
}

TEST_F(ImageWriterTest, UnwritableTargetIsDeviceError)
{
    Progress::Reporter progress(nullptr);
    std::string image = WritePlain("plain.img");
    
    EXPECT_THROW(ImageWriter::writeRaw(image, mTempDir->path() + "/missing/dir/target.img", progress), DeviceError);
}

TEST_F(ImageWriterTest, CodecVersionsNameLinkedLibraries)
{
    std::string versions = Version::codecVersions();
    
    EXPECT_NE(versions.find(std::string("zlib ") + zlibVersion()), std::string::npos);
    EXPECT_NE(versions.find(std::string("liblzma ") + lzma_version_string()), std::string::npos);
    
    std::string bzip2 = BZ2_bzlibVersion();
    EXPECT_NE(versions.find(", bzip2 " + bzip2.substr(0, bzip2.find(','))), std::string::npos);
}
