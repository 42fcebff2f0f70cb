#include "fan/fan_monitor.hpp"
#include "test_utils.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace platmon;
using platmon::fan::FanMonitor;
using platmon::fan::FanStatus;
using platmon::log::Level;
using ::testing::ElementsAre;
using ::testing::Pair;

class FanMonitorTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        cfg.path = dir.path().string();
        cfg.faultNodes = {"fan1_fault", "fan2_fault", "fan3_fault",
                          "fan4_fault", "fan5_fault"};
        for (const auto& n : cfg.faultNodes)
            dir.write(n, "0\n");
    }

    void setFault(int fanNumber, const std::string& value)
    {
        dir.write("fan" + std::to_string(fanNumber) + "_fault", value);
    }

    test::TempDir dir;
    test::LogCapture logs;
    FanMonitorCfg cfg;
};

TEST_F(FanMonitorTest, StartsUninitialized)
{
    FanMonitor mon(cfg);
    ASSERT_EQ(mon.numFans(), 5u);
    for (size_t i = 0; i < mon.numFans(); ++i)
        EXPECT_EQ(mon.status(i), FanStatus::Uninitialized);
    EXPECT_EQ(mon.faultPath(2), cfg.path + "/fan3_fault");
}

TEST_F(FanMonitorTest, FirstReadLogsNormalOncePerFan)
{
    FanMonitor mon(cfg);
    EXPECT_TRUE(mon.manageFans());

    EXPECT_EQ(logs.count(Level::Info), 5u);
    EXPECT_EQ(logs.count(Level::Warning), 0u);
    EXPECT_EQ(logs.records.front().message, "FAN-1 normal is detected");
    EXPECT_EQ(logs.records.back().message, "FAN-5 normal is detected");
    EXPECT_EQ(mon.state().status,
              std::vector<FanStatus>(5, FanStatus::Normal));
}

TEST_F(FanMonitorTest, FaultLogsOneWarningAndRepeatsAreSilent)
{
    FanMonitor mon(cfg);
    ASSERT_TRUE(mon.manageFans());
    logs.clear();

    setFault(3, "1\n");
    EXPECT_TRUE(mon.manageFans());
    ASSERT_EQ(logs.records.size(), 1u);
    EXPECT_EQ(logs.records[0].level, Level::Warning);
    EXPECT_EQ(logs.records[0].message, "Alarm for FAN-3 fault is detected");
    EXPECT_EQ(mon.status(2), FanStatus::Fault);

    logs.clear();
    EXPECT_TRUE(mon.manageFans());
    EXPECT_TRUE(mon.manageFans());
    EXPECT_TRUE(logs.records.empty());
}

TEST_F(FanMonitorTest, RecoveryLogsOneInfo)
{
    setFault(2, "1");
    FanMonitor mon(cfg);
    ASSERT_TRUE(mon.manageFans());
    EXPECT_EQ(mon.status(1), FanStatus::Fault);
    logs.clear();

    // anything other than "1" is normal
    setFault(2, "2\n");
    EXPECT_TRUE(mon.manageFans());
    ASSERT_EQ(logs.records.size(), 1u);
    EXPECT_EQ(logs.records[0].level, Level::Info);
    EXPECT_EQ(logs.records[0].message, "FAN-2 normal is detected");

    logs.clear();
    setFault(2, "0\n");
    EXPECT_TRUE(mon.manageFans());
    EXPECT_TRUE(logs.records.empty());
}

TEST_F(FanMonitorTest, TrailingWhitespaceIsIgnored)
{
    setFault(1, "1 \t\n");
    FanMonitor mon(cfg);
    mon.manageFans();
    EXPECT_EQ(mon.status(0), FanStatus::Fault);
}

TEST_F(FanMonitorTest, EmptyNodeCountsAsNormal)
{
    setFault(4, "");
    FanMonitor mon(cfg);
    EXPECT_TRUE(mon.manageFans());
    EXPECT_EQ(mon.status(3), FanStatus::Normal);
}

TEST_F(FanMonitorTest, MissingNodeIsIsolated)
{
    std::filesystem::remove(dir.path() / "fan2_fault");
    setFault(4, "1");

    FanMonitor mon(cfg);
    EXPECT_FALSE(mon.manageFans());

    EXPECT_EQ(mon.status(1), FanStatus::Uninitialized);
    EXPECT_EQ(mon.status(0), FanStatus::Normal);
    EXPECT_EQ(mon.status(2), FanStatus::Normal);
    EXPECT_EQ(mon.status(3), FanStatus::Fault);
    EXPECT_EQ(mon.status(4), FanStatus::Normal);
    EXPECT_EQ(logs.count(Level::Error), 1u);
    EXPECT_EQ(logs.count(Level::Warning), 1u);

    // Node comes back: first real reading logs.
    setFault(2, "1");
    logs.clear();
    EXPECT_TRUE(mon.manageFans());
    ASSERT_EQ(logs.records.size(), 1u);
    EXPECT_EQ(logs.records[0].message, "Alarm for FAN-2 fault is detected");
}

TEST_F(FanMonitorTest, MissingNodeKeepsLastKnownState)
{
    setFault(5, "1");
    FanMonitor mon(cfg);
    mon.manageFans();
    ASSERT_EQ(mon.status(4), FanStatus::Fault);

    std::filesystem::remove(dir.path() / "fan5_fault");
    logs.clear();
    EXPECT_FALSE(mon.manageFans());
    EXPECT_EQ(mon.status(4), FanStatus::Fault);
    EXPECT_EQ(logs.count(Level::Error), 1u);
    EXPECT_EQ(logs.count(Level::Info), 0u);
}

TEST_F(FanMonitorTest, ReadErrorAfterOpenIsNotNormal)
{
    setFault(1, "1\n");
    FanMonitor mon(cfg);
    ASSERT_TRUE(mon.manageFans());
    ASSERT_EQ(mon.status(0), FanStatus::Fault);

    // A directory opens fine but read(2) fails with EISDIR.
    std::filesystem::remove(dir.path() / "fan1_fault");
    std::filesystem::create_directory(dir.path() / "fan1_fault");
    logs.clear();

    EXPECT_FALSE(mon.manageFans());
    EXPECT_EQ(mon.status(0), FanStatus::Fault);
    ASSERT_EQ(logs.records.size(), 1u);
    EXPECT_EQ(logs.records[0].level, Level::Error);
    EXPECT_EQ(logs.records[0].message,
              "unable to read file: " + mon.faultPath(0));
    EXPECT_EQ(logs.count(Level::Info), 0u);
}

TEST_F(FanMonitorTest, TransitionCallbackSeesEveryChange)
{
    FanMonitor mon(cfg);
    std::vector<std::pair<size_t, FanStatus>> seen;
    mon.onTransition(
        [&seen](size_t idx, FanStatus s) { seen.emplace_back(idx, s); });

    setFault(1, "1");
    mon.manageFans();
    seen.clear();

    mon.manageFans();
    EXPECT_TRUE(seen.empty());

    setFault(1, "0");
    setFault(5, "1");
    mon.manageFans();
    EXPECT_THAT(seen, ElementsAre(Pair(0u, FanStatus::Normal),
                                  Pair(4u, FanStatus::Fault)));
}

TEST(FanMonitorCfgTest, RejectsEmptyNodeList)
{
    FanMonitorCfg cfg;
    cfg.path = "/tmp";
    EXPECT_THROW(FanMonitor{cfg}, std::invalid_argument);
}

TEST(FanMonitorCfgTest, DefaultLayoutIsAs5712)
{
    FanMonitor mon(defaultFanMonitorCfg());
    ASSERT_EQ(mon.numFans(), 5u);
    EXPECT_EQ(mon.faultPath(0),
              "/sys/devices/platform/as5712_54x_fan/fan1_fault");
    EXPECT_EQ(mon.faultPath(4),
              "/sys/devices/platform/as5712_54x_fan/fan5_fault");
}
