#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <vector>

#include "lib/mbr_gpt.hpp"
#include "lib/platform/common.hpp"
#include "utils/temp_dir.hpp"

#include "mocks/mock_runner.hpp"

using namespace testing;

namespace fs = std::filesystem;

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class PlatformCommonTest : public Test {
public:
    void SetUp() override
    {
        mTempDir.reset(new ScopedTempDir(::testing::TempDir(), "common_"));
        mRoot = mTempDir->path();
    }
    
    void TearDown() override { mTempDir.reset(); }
    
protected:
    std::string Touch(const std::string& relative, const std::string& content = "data")
    {
        fs::path path = fs::path(mRoot) / relative;
        fs::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path.string();
    }
    
    static std::string Slurp(const std::string& path)
    {
        std::ifstream file(path, std::ios::binary);
        std::stringstream content;
        content << file.rdbuf();
        return content.str();
    }
    
    std::unique_ptr<ScopedTempDir> mTempDir;
    std::string mRoot;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(PlatformCommonTest, RunToolReportsOutcome)
{
    StrictMock<Process::MockToolRunner> runner;
    
    EXPECT_CALL(runner, run(ElementsAre("parted", "-s", "/dev/sdx", "mklabel", "gpt"), std::chrono::seconds(60), ""))
        .WillOnce(Return(Process::failed(1, "Error: /dev/sdx: unrecognised disk label\n")));
    
    auto result = Platform::runTool(runner, {"parted", "-s", "/dev/sdx", "mklabel", "gpt"}, std::chrono::seconds(60));
    
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "parted exit 1: Error: /dev/sdx: unrecognised disk label");
}

TEST_F(PlatformCommonTest, RunToolTimeout)
{
    NiceMock<Process::MockToolRunner> runner;
    Process::Outcome outcome;
    outcome.launched = true;
    outcome.timedOut = true;
    
    ON_CALL(runner, run(_, _, _)).WillByDefault(Return(outcome));
    
    auto result = Platform::runTool(runner, {"mkfs.ntfs", "/dev/sdx1"}, std::chrono::seconds(5));
    
    EXPECT_EQ(result.message, "mkfs.ntfs timed out after 5s");
}

TEST_F(PlatformCommonTest, ToolMethodNeedsToolOnPath)
{
    StrictMock<Process::MockToolRunner> runner;
    auto method = Platform::toolMethod("sgdisk zap", runner, {"sgdisk", "-o", "/dev/sdx"}, std::chrono::seconds(60));
    
    EXPECT_CALL(runner, which("sgdisk")).WillOnce(Return("")).WillOnce(Return("/usr/sbin/sgdisk"));
    
    EXPECT_EQ(method.name, "sgdisk zap");
    EXPECT_FALSE(method.precondition());
    EXPECT_TRUE(method.precondition());
    
    EXPECT_CALL(runner, run(ElementsAre("sgdisk", "-o", "/dev/sdx"), _, _)).WillOnce(Return(Process::succeeded()));
    EXPECT_TRUE(method.action().success);
}

TEST_F(PlatformCommonTest, FindPathIgnoresCase)
{
    std::string loader = Touch("EFI/Boot/bootx64.efi");
    
    EXPECT_EQ(fs::path(Platform::findPathIgnoreCase(mRoot, "efi/BOOT/BOOTX64.EFI")), fs::path(loader));
    EXPECT_TRUE(Platform::findPathIgnoreCase(mRoot, "efi/boot/bootia32.efi").empty());
    EXPECT_TRUE(Platform::findPathIgnoreCase(mRoot + "/absent", "efi").empty());
}

TEST_F(PlatformCommonTest, FindFilePrefersShallowestMatch)
{
    Touch("a/b/SYS.COM");
    std::string shallow = Touch("freedos/sys.com");
    
    EXPECT_EQ(Platform::findFileIgnoreCase(mRoot, "sys.com"), shallow);
    EXPECT_TRUE(Platform::findFileIgnoreCase(mRoot, "command.com").empty());
}

TEST_F(PlatformCommonTest, CopyTreeCopiesEverything)
{
    Touch("src/casper/vmlinuz", "kernel");
    Touch("src/boot/grub/grub.cfg", "menuentry");
    Touch("src/README", "hello");
    fs::create_directories(fs::path(mRoot) / "src/empty");
    
    std::vector<uint64_t> progress;
    auto result = Platform::copyTree(mRoot + "/src", mRoot + "/dst",
                                     [&progress](uint64_t copied, uint64_t total) {
                                         EXPECT_LE(copied, total);
                                         progress.push_back(copied);
                                     });
    
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.message, "Copied 3 files");
    EXPECT_EQ(Slurp(mRoot + "/dst/casper/vmlinuz"), "kernel");
    EXPECT_EQ(Slurp(mRoot + "/dst/boot/grub/grub.cfg"), "menuentry");
    EXPECT_TRUE(fs::is_directory(mRoot + "/dst/empty"));
    ASSERT_EQ(progress.size(), 3u);
    EXPECT_EQ(progress.back(), 6u + 9u + 5u);
}

TEST_F(PlatformCommonTest, CopyTreeNeedsSourceDirectory)
{
    EXPECT_FALSE(Platform::copyTree(mRoot + "/absent", mRoot + "/dst", nullptr).success);
}

TEST_F(PlatformCommonTest, ScratchDirsStayUnderRoot)
{
    std::string scratch = Platform::createScratchDir(mRoot, "bootforge_mount_");
    
    ASSERT_FALSE(scratch.empty());
    EXPECT_EQ(scratch.compare(0, mRoot.size(), mRoot), 0);
    EXPECT_TRUE(fs::is_directory(scratch));
    
    Platform::removeScratchDir("/elsewhere", scratch);
    EXPECT_TRUE(fs::is_directory(scratch));
    
    Platform::removeScratchDir(mRoot, scratch);
    EXPECT_FALSE(fs::exists(scratch));
}

TEST_F(PlatformCommonTest, ScratchDirWithContentIsKept)
{
    std::string scratch = Platform::createScratchDir(mRoot, "bootforge_mount_");
    std::ofstream(scratch + "/file") << "still mounted";
    
    Platform::removeScratchDir(mRoot, scratch);
    
    EXPECT_TRUE(fs::exists(scratch + "/file"));
}

TEST_F(PlatformCommonTest, ScopedTempDirRemovesContents)
{
    std::string path;
    {
        ScopedTempDir dir(mRoot, "bootforge_stage_");
        path = dir.path();
        std::ofstream(path + "/install.wim") << "wim";
        fs::create_directories(path + "/sources");
        fs::permissions(path + "/sources", fs::perms::owner_read | fs::perms::owner_exec);
    }
    
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(PlatformCommonTest, GptBootCodeSearchPaths)
{
    Settings::Config config;
    config.mbrSearchPaths = {"/usr/lib/syslinux/mbr/mbr.bin", "/opt/custom/boot.bin"};
    
    EXPECT_EQ(Platform::bootCodeSearchPaths(config, BootStructures::TableType::MBR), config.mbrSearchPaths);
    EXPECT_THAT(Platform::bootCodeSearchPaths(config, BootStructures::TableType::GPT),
                ElementsAre("/usr/lib/syslinux/mbr/gptmbr.bin"));
}

TEST_F(PlatformCommonTest, DirectBootCodeMethod)
{
    Settings::Config config;
    config.mbrSearchPaths = {mRoot + "/none/mbr.bin"};
    
    std::string disk = Touch("disk.img", std::string(2048, '\0'));
    auto method = Platform::directBootCodeMethod(disk, config, BootStructures::TableType::MBR);
    EXPECT_FALSE(method.precondition());
    
    config.mbrSearchPaths.push_back(Touch("syslinux/mbr.bin", std::string(440, '\x42')));
    method = Platform::directBootCodeMethod(disk, config, BootStructures::TableType::MBR);
    ASSERT_TRUE(method.precondition());
    ASSERT_TRUE(method.action().success);
    
    BootStructures::PartitionTable table(disk);
    auto mbr = table.readMBR();
    EXPECT_EQ(mbr.bootCode[0], 0x42);
    EXPECT_TRUE(table.hasBootSignature());
}

TEST_F(PlatformCommonTest, ImageSuppliedLoader)
{
    auto method = Platform::imageLoaderMethod(mRoot);
    EXPECT_FALSE(method.precondition());
    
    Touch("efi/boot/BOOTX64.efi");
    EXPECT_TRUE(method.precondition());
    EXPECT_TRUE(method.action().success);
}

TEST_F(PlatformCommonTest, InstalledLoaderCopiesFirstExisting)
{
    std::string loader = Touch("system/grubx64.efi", "grub");
    std::string target = mRoot + "/usb";
    fs::create_directories(target);
    
    auto method = Platform::installedLoaderMethod(target, {mRoot + "/system/missing.efi", loader});
    
    ASSERT_TRUE(method.precondition());
    ASSERT_TRUE(method.action().success);
    EXPECT_EQ(Slurp(Platform::efiBootFile(target)), "grub");
}

TEST_F(PlatformCommonTest, ScanLoaderPrefersX64)
{
    Touch("efi/ia32/loader.efi", "ia32");
    Touch("efi/x64/loader.efi", "x64");
    std::string target = mRoot + "/usb";
    fs::create_directories(target);
    
    auto method = Platform::scanLoaderMethod(target, {mRoot + "/efi"});
    
    ASSERT_TRUE(method.precondition());
    ASSERT_TRUE(method.action().success);
    EXPECT_EQ(Slurp(Platform::efiBootFile(target)), "x64");
}

TEST_F(PlatformCommonTest, SyslinuxBridgeRedirectsToIsolinux)
{
    Touch("isolinux/isolinux.cfg", "default live");
    
    ASSERT_TRUE(Platform::writeSyslinuxBridge(mRoot));
    
    EXPECT_EQ(Slurp(mRoot + "/syslinux.cfg"), "CONFIG /isolinux/isolinux.cfg\nAPPEND /isolinux/\n");
}

TEST_F(PlatformCommonTest, SyslinuxBridgeKeepsExistingConfig)
{
    Touch("isolinux/isolinux.cfg", "default live");
    Touch("boot/syslinux/syslinux.cfg", "default own");
    
    EXPECT_FALSE(Platform::writeSyslinuxBridge(mRoot));
    EXPECT_FALSE(fs::exists(mRoot + "/syslinux.cfg"));
}

TEST_F(PlatformCommonTest, SyslinuxBridgeWithoutIsolinux)
{
    EXPECT_FALSE(Platform::writeSyslinuxBridge(mRoot));
}

TEST_F(PlatformCommonTest, ArchiveExtractionOrder)
{
    NiceMock<Process::MockToolRunner> runner;
    
    auto methods = Platform::archiveExtractionMethods(runner, "/isos/a.iso", "/tmp/stage", std::chrono::seconds(60));
    
    ASSERT_EQ(methods.size(), 3u);
    EXPECT_EQ(methods[0].name, "7z");
    EXPECT_EQ(methods[1].name, "bsdtar");
    EXPECT_EQ(methods[2].name, "xorriso");
}
