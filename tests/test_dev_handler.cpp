#include <gtest/gtest.h>

#include "lib/dev_handler.hpp"

using namespace testing;

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST(DeviceHandlerTest, PartitionsOfScsiDisk)
{
    EXPECT_TRUE(DeviceHandler::isPartitionOf("/dev/sda", "/dev/sda"));
    EXPECT_TRUE(DeviceHandler::isPartitionOf("/dev/sda", "/dev/sda1"));
    EXPECT_TRUE(DeviceHandler::isPartitionOf("sda", "/dev/sda12"));
    
    EXPECT_FALSE(DeviceHandler::isPartitionOf("/dev/sda", "/dev/sdab1"));
    EXPECT_FALSE(DeviceHandler::isPartitionOf("/dev/sda", "/dev/sdab"));
    EXPECT_FALSE(DeviceHandler::isPartitionOf("/dev/sda", "/dev/sd"));
    EXPECT_FALSE(DeviceHandler::isPartitionOf("/dev/sda", "tmpfs"));
}

TEST(DeviceHandlerTest, PartitionsOfDiskEndingInDigit)
{
    EXPECT_TRUE(DeviceHandler::isPartitionOf("/dev/nvme0n1", "/dev/nvme0n1p1"));
    EXPECT_TRUE(DeviceHandler::isPartitionOf("/dev/mmcblk0", "/dev/mmcblk0p2"));
    
    EXPECT_FALSE(DeviceHandler::isPartitionOf("/dev/nvme0n1", "/dev/nvme0n10p1"));
    EXPECT_FALSE(DeviceHandler::isPartitionOf("/dev/nvme0n1", "/dev/nvme0n10"));
    EXPECT_FALSE(DeviceHandler::isPartitionOf("/dev/nvme0n1", "/dev/nvme0n1p"));
    EXPECT_FALSE(DeviceHandler::isPartitionOf("/dev/mmcblk0", "/dev/mmcblk0boot0"));
}

TEST(DeviceHandlerTest, PartitionPathMatchesKernelNaming)
{
    EXPECT_EQ(DeviceHandler::partitionPath("/dev/sdb", 1), "/dev/sdb1");
    EXPECT_EQ(DeviceHandler::partitionPath("nvme0n1", 1), "/dev/nvme0n1p1");
    EXPECT_TRUE(DeviceHandler::isPartitionOf("/dev/mmcblk0", DeviceHandler::partitionPath("/dev/mmcblk0", 3)));
}

TEST(DeviceHandlerTest, NothingIsMountedFromMissingDisk)
{
    EXPECT_TRUE(DeviceHandler::mountedPartitions("/dev/bootforge-no-such-disk").empty());
    EXPECT_FALSE(DeviceHandler::isDeviceMounted("/dev/bootforge-no-such-disk"));
}
