#include <gtest/gtest.h>

#include <cstdlib>

#include "lib/config.hpp"

using namespace testing;

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class ConfigTest : public Test {
public:
    void SetUp() override { Clear(); }
    void TearDown() override { Clear(); }
    
private:
    void Clear()
    {
        for (const char* name : {"BOOTFORGE_TMPDIR", "BOOTSECT_PATH", "BOOTFORGE_MBR_PATH", "BOOTFORGE_LOG_FILE",
                                 "BOOTFORGE_TOOL_TIMEOUT"}) {
            unsetenv(name);
        }
    }
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(ConfigTest, Defaults)
{
    Settings::Config config = Settings::fromEnvironment();
    
    EXPECT_FALSE(config.tempRoot.empty());
    EXPECT_TRUE(config.bootsectPath.empty());
    EXPECT_EQ(config.hardcodedBootsectPath, "C:\\tools\\bootsect.exe");
    EXPECT_EQ(config.timeouts.boot, std::chrono::seconds(30));
    EXPECT_EQ(config.timeouts.partition, std::chrono::seconds(60));
    EXPECT_EQ(config.timeouts.quickFormat, std::chrono::seconds(300));
    EXPECT_EQ(config.timeouts.extract, std::chrono::seconds(3600));
    EXPECT_EQ(config.mountPollAttempts, 10);
    EXPECT_FALSE(config.mbrSearchPaths.empty());
}

TEST_F(ConfigTest, EnvironmentOverrides)
{
    setenv("BOOTFORGE_TMPDIR", "/var/tmp/bootforge", 1);
    setenv("BOOTSECT_PATH", "D:\\bootsect.exe", 1);
    setenv("BOOTFORGE_MBR_PATH", "/opt/mbr.bin", 1);
    setenv("BOOTFORGE_LOG_FILE", "/var/log/bootforge.log", 1);
    setenv("BOOTFORGE_TOOL_TIMEOUT", "45", 1);
    
    Settings::Config config = Settings::fromEnvironment();
    
    EXPECT_EQ(config.tempRoot, "/var/tmp/bootforge");
    EXPECT_EQ(config.bootsectPath, "D:\\bootsect.exe");
    ASSERT_FALSE(config.mbrSearchPaths.empty());
    EXPECT_EQ(config.mbrSearchPaths.front(), "/opt/mbr.bin");
    EXPECT_EQ(config.logFile, "/var/log/bootforge.log");
    EXPECT_EQ(config.timeouts.boot, std::chrono::seconds(45));
}

TEST_F(ConfigTest, InvalidTimeoutIsIgnored)
{
    setenv("BOOTFORGE_TOOL_TIMEOUT", "soon", 1);
    EXPECT_EQ(Settings::fromEnvironment().timeouts.boot, std::chrono::seconds(30));
    
    setenv("BOOTFORGE_TOOL_TIMEOUT", "-5", 1);
    EXPECT_EQ(Settings::fromEnvironment().timeouts.boot, std::chrono::seconds(30));
}
