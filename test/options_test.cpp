#include "fan/options.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace platmon;

namespace
{

// getopt permutes argv, so keep mutable copies alive.
fan::Options parse(std::vector<std::string> args)
{
    args.insert(args.begin(), "accton-fan-monitor");
    std::vector<char*> argv;
    for (auto& a : args)
        argv.push_back(a.data());
    argv.push_back(nullptr);
    return fan::parseOptions(static_cast<int>(args.size()), argv.data());
}

} // namespace

TEST(OptionsTest, Defaults)
{
    auto o = parse({});
    EXPECT_FALSE(o.showUsage);
    EXPECT_EQ(o.level, log::Level::Info);
    EXPECT_EQ(o.logFile, "/usr/local/bin/accton_as5712_monitor_fan.log");
}

TEST(OptionsTest, Help)
{
    EXPECT_TRUE(parse({"-h"}).showUsage);
}

TEST(OptionsTest, DebugShortAndLong)
{
    EXPECT_EQ(parse({"-d"}).level, log::Level::Debug);
    EXPECT_EQ(parse({"--debug"}).level, log::Level::Debug);
}

TEST(OptionsTest, LogFileForms)
{
    EXPECT_EQ(parse({"-l", "/tmp/a.log"}).logFile, "/tmp/a.log");
    EXPECT_EQ(parse({"--lfile", "/tmp/b.log"}).logFile, "/tmp/b.log");
    EXPECT_EQ(parse({"--lfile=/tmp/c.log"}).logFile, "/tmp/c.log");

    auto o = parse({"-d", "-l", "/tmp/d.log"});
    EXPECT_EQ(o.level, log::Level::Debug);
    EXPECT_EQ(o.logFile, "/tmp/d.log");
}

TEST(OptionsTest, InvalidFlagShowsUsage)
{
    EXPECT_TRUE(parse({"-x"}).showUsage);
    EXPECT_TRUE(parse({"--verbose"}).showUsage);
    EXPECT_TRUE(parse({"-l"}).showUsage);
}

TEST(OptionsTest, UsageText)
{
    EXPECT_EQ(fan::usage("prog"), "Usage: prog [-d] [-l <log_file>]");
}
