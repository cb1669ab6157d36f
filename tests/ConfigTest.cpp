#include <gtest/gtest.h>

#include "core/Config.hpp"

namespace {

bool Parse(std::vector<const char*> args, AppConfig& cfg, std::string& err)
{
    args.insert(args.begin(), "perfectmaze");
    return ParseArgs((int)args.size(), args.data(), cfg, err);
}

} // namespace

TEST(ConfigTest, Defaults)
{
    AppConfig cfg;
    std::string err;
    ASSERT_TRUE(Parse({}, cfg, err));

    EXPECT_EQ(cfg.rows, 10);
    EXPECT_EQ(cfg.cols, 14);
    EXPECT_EQ(cfg.layout.cellWidth, 50);
    EXPECT_EQ(cfg.layout.cellHeight, 50);
    EXPECT_EQ(cfg.layout.originX, 50);
    EXPECT_EQ(cfg.layout.originY, 50);
    EXPECT_EQ(cfg.windowWidth, 800);
    EXPECT_EQ(cfg.windowHeight, 600);
    EXPECT_FALSE(cfg.seed.has_value());
    EXPECT_FALSE(cfg.headless);
    EXPECT_EQ(cfg.stepDelayMs(), 20);
}

TEST(ConfigTest, ParsesAllOptions)
{
    AppConfig cfg;
    std::string err;
    ASSERT_TRUE(Parse({ "--rows", "7", "--cols", "9", "--seed", "4000000000",
                        "--cell-size", "30", "--cell-height", "25",
                        "--offset-x", "10", "--offset-y", "-4",
                        "--width", "1024", "--height", "768",
                        "--delay-ms", "5", "--headless" }, cfg, err)) << err;

    EXPECT_EQ(cfg.rows, 7);
    EXPECT_EQ(cfg.cols, 9);
    ASSERT_TRUE(cfg.seed.has_value());
    EXPECT_EQ(*cfg.seed, 4000000000u);
    EXPECT_EQ(cfg.layout.cellWidth, 30);
    EXPECT_EQ(cfg.layout.cellHeight, 25);
    EXPECT_EQ(cfg.layout.originX, 10);
    EXPECT_EQ(cfg.layout.originY, -4);
    EXPECT_EQ(cfg.windowWidth, 1024);
    EXPECT_EQ(cfg.windowHeight, 768);
    EXPECT_TRUE(cfg.headless);
    EXPECT_EQ(cfg.stepDelayMs(), 5);
}

TEST(ConfigTest, HeadlessDefaultsToNoDelay)
{
    AppConfig cfg;
    std::string err;
    ASSERT_TRUE(Parse({ "--headless" }, cfg, err));
    EXPECT_EQ(cfg.stepDelayMs(), 0);
}

TEST(ConfigTest, LeavesDimensionCheckToGrid)
{
    AppConfig cfg;
    std::string err;
    ASSERT_TRUE(Parse({ "--rows", "0", "--cols", "-2" }, cfg, err));
    EXPECT_EQ(cfg.rows, 0);
    EXPECT_EQ(cfg.cols, -2);
}

TEST(ConfigTest, Help)
{
    AppConfig cfg;
    std::string err;
    ASSERT_TRUE(Parse({ "--help" }, cfg, err));
    EXPECT_TRUE(cfg.showHelp);
    EXPECT_NE(UsageText("perfectmaze").find("--seed"), std::string::npos);
}

TEST(ConfigTest, RejectsBadInput)
{
    const std::vector<std::vector<const char*>> bad = {
        { "--rows" },
        { "--rows", "abc" },
        { "--rows", "5x" },
        { "--rows", "" },
        { "--seed", "-1" },
        { "--seed", "99999999999" },
        { "--cell-size", "0" },
        { "--delay-ms", "-3" },
        { "--frobnicate", "1" },
    };

    for (const auto& args : bad)
    {
        AppConfig cfg;
        std::string err;
        EXPECT_FALSE(Parse(args, cfg, err)) << args[0];
        EXPECT_FALSE(err.empty());
    }
}
