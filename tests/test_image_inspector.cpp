#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>
#include <memory>
#include <vector>

#include "lib/image_inspector.hpp"
#include "lib/mbr_gpt.hpp"
#include "utils/temp_dir.hpp"

#include "mocks/mock_runner.hpp"

using namespace testing;

using Media::ImageType;

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class ImageInspectorTest : public Test {
public:
    void SetUp() override
    {
        mTempDir.reset(new ScopedTempDir(::testing::TempDir(), "inspector_"));
    }
    
    void TearDown() override { mTempDir.reset(); }
    
protected:
    std::string WriteImage(const std::string& name, bool isoSignature, bool mbrSignature)
    {
        std::vector<char> data(64 * 1024, 0);
        
        if (isoSignature) {
            data[ImageInspector::ISO9660_DESCRIPTOR_OFFSET] = 1;
            std::copy_n("CD001", 5, data.begin() + ImageInspector::ISO9660_DESCRIPTOR_OFFSET + 1);
        }
        
        if (mbrSignature) {
            BootStructures::MBR mbr {};
            mbr.partitions[0].partitionType = 0x17;
            mbr.partitions[0].firstLBA = 0;
            mbr.partitions[0].sectorCount = 128;
            mbr.signature = BootStructures::BOOT_SIGNATURE;
            std::copy_n(reinterpret_cast<const char*>(&mbr), sizeof(mbr), data.begin());
        }
        
        std::string path = mTempDir->path() + "/" + name;
        std::ofstream file(path, std::ios::binary);
        file.write(data.data(), data.size());
        return path;
    }
    
    std::unique_ptr<ScopedTempDir> mTempDir;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(ImageInspectorTest, FileNameKeywords)
{
    EXPECT_EQ(ImageInspector::typeFromFileName("Win10_22H2_English_x64.iso"), ImageType::WINDOWS);
    EXPECT_EQ(ImageInspector::typeFromFileName("/isos/en_windows_server_2022.iso"), ImageType::WINDOWS);
    EXPECT_EQ(ImageInspector::typeFromFileName("ubuntu-24.04-desktop-amd64.iso"), ImageType::LINUX);
    EXPECT_EQ(ImageInspector::typeFromFileName("archlinux-2024.06.01-x86_64.iso"), ImageType::LINUX);
    EXPECT_EQ(ImageInspector::typeFromFileName("FreeDOS-1.3-LiveCD.iso"), ImageType::FREEDOS);
    EXPECT_EQ(ImageInspector::typeFromFileName("FD13LIVE.iso"), ImageType::FREEDOS);
    EXPECT_EQ(ImageInspector::typeFromFileName("recovery.img"), ImageType::GENERIC);
}

TEST_F(ImageInspectorTest, KeywordsInsideWordsDoNotMatch)
{
    EXPECT_EQ(ImageInspector::typeFromFileName("twinkle.iso"), ImageType::GENERIC);
    EXPECT_EQ(ImageInspector::typeFromFileName("darwin.iso"), ImageType::GENERIC);
}

TEST_F(ImageInspectorTest, LinuxKeywordsNeedTrailingBoundary)
{
    EXPECT_EQ(ImageInspector::typeFromFileName("backup-archive.iso"), ImageType::GENERIC);
    EXPECT_EQ(ImageInspector::typeFromFileName("mintleaf-photos.iso"), ImageType::GENERIC);
    EXPECT_EQ(ImageInspector::typeFromFileName("elementaryos-7.1-stable.iso"), ImageType::LINUX);
    EXPECT_EQ(ImageInspector::typeFromFileName("kali-linux-2024.2-live-amd64.iso"), ImageType::LINUX);
}

TEST_F(ImageInspectorTest, NonAsciiFileNames)
{
    EXPECT_EQ(ImageInspector::typeFromFileName("ubuntu-\xC3\xA9" "dition.iso"), ImageType::LINUX);
    EXPECT_EQ(ImageInspector::typeFromFileName("\xD0\x9E\xD0\xB1\xD1\x80\xD0\xB0\xD0\xB7.iso"), ImageType::GENERIC);
    EXPECT_EQ(ImageInspector::normalizeEntry("\xC3\x89" "FI/BOOT"), "\xC3\x89" "fi/boot");
}

TEST_F(ImageInspectorTest, DirectoryNameIsIgnored)
{
    EXPECT_EQ(ImageInspector::typeFromFileName("/home/ubuntu/images/tools.iso"), ImageType::GENERIC);
}

TEST_F(ImageInspectorTest, ContentMarkers)
{
    EXPECT_EQ(ImageInspector::typeFromEntries({"setup.exe", "sources/install.wim", "boot/bcd"}), ImageType::WINDOWS);
    EXPECT_EQ(ImageInspector::typeFromEntries({"./casper/vmlinuz", "./isolinux/isolinux.cfg"}), ImageType::LINUX);
    EXPECT_EQ(ImageInspector::typeFromEntries({"/FREEDOS/BIN/COMMAND.COM"}), ImageType::FREEDOS);
    EXPECT_EQ(ImageInspector::typeFromEntries({"KERNEL.SYS", "AUTOEXEC.BAT"}), ImageType::FREEDOS);
    EXPECT_EQ(ImageInspector::typeFromEntries({"docs/readme.txt"}), ImageType::GENERIC);
    EXPECT_EQ(ImageInspector::typeFromEntries({}), ImageType::GENERIC);
}

TEST_F(ImageInspectorTest, IsolinuxDecidesOnlyAlone)
{
    EXPECT_EQ(ImageInspector::typeFromEntries({"isolinux/isolinux.bin", "isolinux/isolinux.cfg"}), ImageType::LINUX);
    EXPECT_EQ(ImageInspector::typeFromEntries({"isolinux/isolinux.bin", "freedos/setup.bat"}), ImageType::FREEDOS);
    EXPECT_EQ(ImageInspector::typeFromEntries({"isolinuxtools/readme"}), ImageType::GENERIC);
}

TEST_F(ImageInspectorTest, MarkerPrefixesStopAtPathBoundary)
{
    EXPECT_EQ(ImageInspector::typeFromEntries({"liveupdate/notes.txt", "archive/data.bin"}), ImageType::GENERIC);
}

TEST_F(ImageInspectorTest, MixedFamiliesAreGeneric)
{
    EXPECT_EQ(ImageInspector::typeFromEntries({"bootmgr", "casper/vmlinuz"}), ImageType::GENERIC);
}

TEST_F(ImageInspectorTest, FileNameWinsOverContent)
{
    EXPECT_EQ(ImageInspector::detectImageType("debian-12.iso", {"sources/install.wim"}), ImageType::LINUX);
    EXPECT_EQ(ImageInspector::detectImageType("rescue.iso", {"sources\\boot.wim"}), ImageType::WINDOWS);
}

TEST_F(ImageInspectorTest, NormalizeEntry)
{
    EXPECT_EQ(ImageInspector::normalizeEntry("./EFI/Boot/"), "efi/boot");
    EXPECT_EQ(ImageInspector::normalizeEntry("\\Sources\\Install.WIM"), "sources/install.wim");
    EXPECT_EQ(ImageInspector::normalizeEntry("/casper\r"), "casper");
}

TEST_F(ImageInspectorTest, ListEntriesFallsBackTo7z)
{
    StrictMock<Process::MockToolRunner> runner;
    std::string image = "/isos/unknown.iso";
    
    EXPECT_CALL(runner, which("bsdtar")).WillOnce(Return(""));
    EXPECT_CALL(runner, which("7z")).WillOnce(Return("/usr/bin/7z"));
    EXPECT_CALL(runner, run(ElementsAre("7z", "l", "-slt", image), _, _))
        .WillOnce(Return(Process::succeeded("Listing archive: /isos/unknown.iso\n"
                                            "\n"
                                            "Path = /isos/unknown.iso\n"
                                            "Type = Iso\n"
                                            "----------\n"
                                            "Path = sources\n"
                                            "Folder = +\n"
                                            "\n"
                                            "Path = sources/install.wim\n"
                                            "Size = 4096\n")));
    
    auto entries = ImageInspector::listEntries(image, runner, std::chrono::seconds(10));
    
    EXPECT_THAT(entries, ElementsAre("sources", "sources/install.wim"));
    EXPECT_EQ(ImageInspector::typeFromEntries(entries), ImageType::WINDOWS);
}

TEST_F(ImageInspectorTest, ListEntriesWithoutToolsIsEmpty)
{
    NiceMock<Process::MockToolRunner> runner;
    
    ON_CALL(runner, which(_)).WillByDefault(Return(""));
    EXPECT_CALL(runner, run(_, _, _)).Times(0);
    
    EXPECT_TRUE(ImageInspector::listEntries("/isos/a.iso", runner, std::chrono::seconds(10)).empty());
}

TEST_F(ImageInspectorTest, InspectIsoImage)
{
    std::string image = WriteImage("ubuntu-server.iso", true, false);
    
    auto metadata = ImageInspector::inspect(image);
    
    EXPECT_TRUE(metadata.valid);
    EXPECT_FALSE(metadata.hybrid);
    EXPECT_FALSE(metadata.compressed);
    EXPECT_EQ(metadata.sizeBytes, 64u * 1024);
    EXPECT_EQ(metadata.type, ImageType::LINUX);
}

TEST_F(ImageInspectorTest, InspectHybridImage)
{
    std::string image = WriteImage("live.iso", true, true);
    
    auto metadata = ImageInspector::inspect(image);
    
    EXPECT_TRUE(metadata.valid);
    EXPECT_TRUE(metadata.hybrid);
    EXPECT_EQ(metadata.type, ImageType::AUTO);
}

TEST_F(ImageInspectorTest, InspectUnrecognisedLayout)
{
    std::string image = WriteImage("blob.bin", false, false);
    
    auto metadata = ImageInspector::inspect(image);
    
    EXPECT_FALSE(metadata.valid);
    EXPECT_EQ(metadata.sizeBytes, 64u * 1024);
}

TEST_F(ImageInspectorTest, InspectMissingFile)
{
    auto metadata = ImageInspector::inspect(mTempDir->path() + "/absent.iso");
    
    EXPECT_FALSE(metadata.valid);
    EXPECT_EQ(metadata.sizeBytes, 0u);
}
