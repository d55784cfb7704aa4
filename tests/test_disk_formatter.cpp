#include <gtest/gtest.h>

#include "lib/disk_formatter.hpp"
#include "lib/errors.hpp"

#include "mocks/mock_platform.hpp"

using namespace testing;

using FilesystemSupport::FSType;

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class DiskFormatterTest : public Test {
public:
    void SetUp() override
    {
        mConfig = Settings::defaults();
        mConfig.mountPollAttempts = 3;
        mConfig.mountPollInterval = std::chrono::milliseconds(0);
        
        mDevice.name = "/dev/sdx";
        mSpec.filesystem = FSType::FAT32;
        
        ON_CALL(mStrategy, platform()).WillByDefault(Return(Host::Platform::LINUX));
        ON_CALL(mStrategy, supportsFilesystem(_)).WillByDefault(Return(true));
        ON_CALL(mStrategy, checkPrivileges()).WillByDefault(Return(true));
        ON_CALL(mStrategy, partitionTableMethods(_, _))
            .WillByDefault(Return(std::vector<Fallback::Method> {Platform::succeedingMethod("label")}));
        ON_CALL(mStrategy, partitionMethods(_, _))
            .WillByDefault(Return(std::vector<Fallback::Method> {Platform::succeedingMethod("mkpart")}));
        ON_CALL(mStrategy, formatMethods(_, _))
            .WillByDefault(Return(std::vector<Fallback::Method> {Platform::succeedingMethod("mkfs")}));
        ON_CALL(mStrategy, resolveMountHandle(_, _))
            .WillByDefault(Return(Platform::MountHandle {"/tmp/bootforge_mount_1", true}));
    }
    
protected:
    Progress::Sink Collect()
    {
        return [this](const Media::ProgressEvent& event) { mEvents.push_back(event); };
    }
    
    NiceMock<Platform::MockPlatformStrategy> mStrategy;
    Settings::Config mConfig;
    Media::Device mDevice;
    Media::FormatSpec mSpec;
    std::vector<Media::ProgressEvent> mEvents;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(DiskFormatterTest, SuccessYieldsMountHandle)
{
    Progress::Reporter progress(Collect());
    progress.beginStage(Media::Stage::FORMATTING, "format");
    
    {
        InSequence sequence;
        
        EXPECT_CALL(mStrategy, dismountDevice(_));
        EXPECT_CALL(mStrategy, checkPrivileges());
        EXPECT_CALL(mStrategy, partitionTableMethods(_, _));
        EXPECT_CALL(mStrategy, partitionMethods(_, _));
        EXPECT_CALL(mStrategy, formatMethods(_, _));
        EXPECT_CALL(mStrategy, resolveMountHandle(_, _));
    }
    
    DiskFormatter::Formatter formatter(mStrategy, mConfig);
    auto result = formatter.format(mDevice, mSpec, progress);
    
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.mountHandle, "/tmp/bootforge_mount_1");
    EXPECT_TRUE(result.scratch);
    EXPECT_EQ(mDevice.mountPoint, "/tmp/bootforge_mount_1");
    
    ASSERT_FALSE(mEvents.empty());
    EXPECT_EQ(mEvents.back().percent, 100);
    for (size_t i = 1; i < mEvents.size(); i++) {
        EXPECT_GE(mEvents[i].percent, mEvents[i - 1].percent);
    }
}

TEST_F(DiskFormatterTest, UnsupportedFilesystemTouchesNothing)
{
    Progress::Reporter progress(nullptr);
    mSpec.filesystem = FSType::APFS;
    
    EXPECT_CALL(mStrategy, supportsFilesystem(FSType::APFS)).WillOnce(Return(false));
    EXPECT_CALL(mStrategy, dismountDevice(_)).Times(0);
    EXPECT_CALL(mStrategy, partitionTableMethods(_, _)).Times(0);
    EXPECT_CALL(mStrategy, formatMethods(_, _)).Times(0);
    
    DiskFormatter::Formatter formatter(mStrategy, mConfig);
    auto result = formatter.format(mDevice, mSpec, progress);
    
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.mountHandle.empty());
    EXPECT_EQ(result.message, "UnsupportedFilesystemError: APFS is not supported on Linux");
    EXPECT_TRUE(mDevice.mountPoint.empty());
}

TEST_F(DiskFormatterTest, MissingPrivileges)
{
    Progress::Reporter progress(nullptr);
    
    EXPECT_CALL(mStrategy, checkPrivileges()).WillOnce(Return(false));
    EXPECT_CALL(mStrategy, partitionTableMethods(_, _)).Times(0);
    
    DiskFormatter::Formatter formatter(mStrategy, mConfig);
    auto result = formatter.format(mDevice, mSpec, progress);
    
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message.rfind("PrivilegeError: ", 0), 0u);
}

TEST_F(DiskFormatterTest, PartitionFailureStopsBeforeFormatting)
{
    Progress::Reporter progress(nullptr);
    
    EXPECT_CALL(mStrategy, partitionMethods(_, _))
        .WillOnce(Return(std::vector<Fallback::Method> {Platform::failingMethod("parted", "exit 1"),
                                                        Platform::failingMethod("sfdisk", "exit 1")}));
    EXPECT_CALL(mStrategy, formatMethods(_, _)).Times(0);
    
    DiskFormatter::Formatter formatter(mStrategy, mConfig);
    auto result = formatter.format(mDevice, mSpec, progress);
    
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "PartitionError: Create partition failed: parted: exit 1; sfdisk: exit 1");
}

TEST_F(DiskFormatterTest, FormatFailure)
{
    Progress::Reporter progress(nullptr);
    
    EXPECT_CALL(mStrategy, formatMethods(_, _))
        .WillOnce(Return(std::vector<Fallback::Method> {Platform::failingMethod("mkfs.vfat", "exit 1")}));
    EXPECT_CALL(mStrategy, resolveMountHandle(_, _)).Times(0);
    
    DiskFormatter::Formatter formatter(mStrategy, mConfig);
    auto result = formatter.format(mDevice, mSpec, progress);
    
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "FormatError: Create FAT32 filesystem failed: mkfs.vfat: exit 1");
}

TEST_F(DiskFormatterTest, CatalogueErrorsAreReported)
{
    Progress::Reporter progress(nullptr);
    
    EXPECT_CALL(mStrategy, partitionTableMethods(_, _)).WillOnce(Throw(DeviceError("/dev/sdx", "no disk number")));
    
    DiskFormatter::Formatter formatter(mStrategy, mConfig);
    auto result = formatter.format(mDevice, mSpec, progress);
    
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "DeviceError: Device error on /dev/sdx: no disk number");
}

TEST_F(DiskFormatterTest, MountHandleIsPolled)
{
    Progress::Reporter progress(nullptr);
    
    EXPECT_CALL(mStrategy, resolveMountHandle(_, _))
        .WillOnce(Return(Platform::MountHandle()))
        .WillOnce(Return(Platform::MountHandle {"E:", false}));
    
    DiskFormatter::Formatter formatter(mStrategy, mConfig);
    auto result = formatter.format(mDevice, mSpec, progress);
    
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.mountHandle, "E:");
    EXPECT_FALSE(result.scratch);
}

TEST_F(DiskFormatterTest, MountHandleNeverAppears)
{
    Progress::Reporter progress(nullptr);
    
    EXPECT_CALL(mStrategy, resolveMountHandle(_, _)).Times(3).WillRepeatedly(Return(Platform::MountHandle()));
    
    DiskFormatter::Formatter formatter(mStrategy, mConfig);
    auto result = formatter.format(mDevice, mSpec, progress);
    
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.mountHandle.empty());
    EXPECT_EQ(result.message.rfind("MountResolutionError: ", 0), 0u);
}
