#include <gtest/gtest.h>

#include "lib/fs_supports.hpp"
#include "lib/media_types.hpp"

using namespace testing;

using FilesystemSupport::FSType;

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST(MediaTypesTest, ParseBootType)
{
    bool ok = false;
    
    EXPECT_EQ(Media::parseBootType("UEFI", &ok), Media::BootType::UEFI);
    EXPECT_TRUE(ok);
    EXPECT_EQ(Media::parseBootType("legacy", &ok), Media::BootType::BIOS);
    EXPECT_EQ(Media::parseBootType("both", &ok), Media::BootType::DUAL);
    EXPECT_EQ(Media::parseBootType("FreeDOS", &ok), Media::BootType::FREEDOS);
    
    Media::parseBootType("coreboot", &ok);
    EXPECT_FALSE(ok);
}

TEST(MediaTypesTest, ParseImageType)
{
    bool ok = false;
    
    EXPECT_EQ(Media::parseImageType("", &ok), Media::ImageType::AUTO);
    EXPECT_TRUE(ok);
    EXPECT_EQ(Media::parseImageType("Windows", &ok), Media::ImageType::WINDOWS);
    EXPECT_EQ(Media::parseImageType("generic", &ok), Media::ImageType::GENERIC);
    
    Media::parseImageType("bsd", &ok);
    EXPECT_FALSE(ok);
}

TEST(MediaTypesTest, TerminalStages)
{
    EXPECT_TRUE(Media::isTerminal(Media::Stage::DONE));
    EXPECT_TRUE(Media::isTerminal(Media::Stage::FAILED));
    EXPECT_TRUE(Media::isTerminal(Media::Stage::CANCELLED));
    EXPECT_FALSE(Media::isTerminal(Media::Stage::DEPLOYING));
    EXPECT_EQ(Media::getStageName(Media::Stage::INSTALLING_BOOT), "InstallingBoot");
}

TEST(MediaTypesTest, SchemesMustAgree)
{
    Media::FormatSpec format;
    Media::BootSpec boot;
    format.scheme = BootStructures::TableType::GPT;
    boot.scheme = BootStructures::TableType::MBR;
    
    Media::Result result = Media::validateSpecs(format, boot);
    
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("mismatch"), std::string::npos);
}

TEST(MediaTypesTest, UefiNeedsGpt)
{
    Media::FormatSpec format;
    Media::BootSpec boot;
    boot.bootType = Media::BootType::UEFI;
    
    EXPECT_FALSE(Media::validateSpecs(format, boot).success);
    
    format.scheme = BootStructures::TableType::GPT;
    boot.scheme = BootStructures::TableType::GPT;
    EXPECT_TRUE(Media::validateSpecs(format, boot).success);
}

TEST(MediaTypesTest, FreeDosNeedsMbr)
{
    Media::FormatSpec format;
    Media::BootSpec boot;
    boot.bootType = Media::BootType::FREEDOS;
    format.scheme = BootStructures::TableType::GPT;
    boot.scheme = BootStructures::TableType::GPT;
    
    EXPECT_FALSE(Media::validateSpecs(format, boot).success);
}

TEST(MediaTypesTest, DualAcceptsEitherScheme)
{
    Media::FormatSpec format;
    Media::BootSpec boot;
    boot.bootType = Media::BootType::DUAL;
    
    EXPECT_TRUE(Media::validateSpecs(format, boot).success);
    
    format.scheme = BootStructures::TableType::GPT;
    boot.scheme = BootStructures::TableType::GPT;
    EXPECT_TRUE(Media::validateSpecs(format, boot).success);
}

TEST(FilesystemSupportTest, ParseNames)
{
    EXPECT_EQ(FilesystemSupport::parseFSType("vfat"), FSType::FAT32);
    EXPECT_EQ(FilesystemSupport::parseFSType("exFAT"), FSType::EXFAT);
    EXPECT_EQ(FilesystemSupport::parseFSType("hfs+"), FSType::HFSPLUS);
    EXPECT_EQ(FilesystemSupport::parseFSType("zfs"), FSType::UNKNOWN);
}

TEST(FilesystemSupportTest, PlatformMatrix)
{
    EXPECT_TRUE(FilesystemSupport::isSupported(FSType::EXT4, Host::Platform::LINUX));
    EXPECT_FALSE(FilesystemSupport::isSupported(FSType::EXT4, Host::Platform::WINDOWS));
    EXPECT_TRUE(FilesystemSupport::isSupported(FSType::UDF, Host::Platform::WINDOWS));
    EXPECT_FALSE(FilesystemSupport::isSupported(FSType::NTFS, Host::Platform::MACOS));
    EXPECT_TRUE(FilesystemSupport::isSupported(FSType::APFS, Host::Platform::MACOS));
    EXPECT_FALSE(FilesystemSupport::isSupported(FSType::FAT32, Host::Platform::UNSUPPORTED));
    EXPECT_FALSE(FilesystemSupport::isSupported(FSType::UNKNOWN, Host::Platform::LINUX));
}

TEST(FilesystemSupportTest, LabelsAreTruncatedPerFilesystem)
{
    EXPECT_EQ(FilesystemSupport::normalizeLabel("my usb stick", FSType::FAT32), "MY_USB_STIC");
    EXPECT_EQ(FilesystemSupport::normalizeLabel("Ubuntu 24.04 LTS", FSType::EXT4), "Ubuntu_2404_LTS");
    EXPECT_EQ(FilesystemSupport::normalizeLabel("***", FSType::NTFS), "BOOTFORGE");
}
