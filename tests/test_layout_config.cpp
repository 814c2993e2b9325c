#include <gtest/gtest.h>

#include "layout/LayoutConfig.hpp"
#include "core/Config.hpp"

using namespace lintel;

TEST(LayoutConfigTest, FlowDefaultsWhenKeysMissing) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({})"));

    auto flow = FlowWrapConfig::fromConfig(cfg);
    EXPECT_FLOAT_EQ(flow.horizontalSpacing, 8.0f);
    EXPECT_FLOAT_EQ(flow.verticalSpacing, 8.0f);
    EXPECT_FALSE(flow.maxRows.has_value());
    EXPECT_TRUE(flow.validate());
}

TEST(LayoutConfigTest, FlowReadsAllKeys) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({
        "flow": { "horizontal_spacing": 4, "vertical_spacing": 2.5, "max_rows": 3 }
    })"));

    auto flow = FlowWrapConfig::fromConfig(cfg);
    EXPECT_FLOAT_EQ(flow.horizontalSpacing, 4.0f);
    EXPECT_FLOAT_EQ(flow.verticalSpacing, 2.5f);
    ASSERT_TRUE(flow.maxRows.has_value());
    EXPECT_EQ(*flow.maxRows, 3);
}

TEST(LayoutConfigTest, FlowZeroMaxRowsMeansUnlimited) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"flow": {"max_rows": 0}})"));
    EXPECT_FALSE(FlowWrapConfig::fromConfig(cfg).maxRows.has_value());
}

TEST(LayoutConfigTest, FlowOutOfRangeMaxRowsIsNotTruncated) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"flow": {"max_rows": 4294967298}})"));

    auto flow = FlowWrapConfig::fromConfig(cfg);
    EXPECT_FALSE(flow.maxRows.has_value());
    EXPECT_TRUE(flow.validate());
}

TEST(LayoutConfigTest, FlowCustomPrefix) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"toolbar": {"tags": {"horizontal_spacing": 12}}})"));

    auto flow = FlowWrapConfig::fromConfig(cfg, "toolbar.tags");
    EXPECT_FLOAT_EQ(flow.horizontalSpacing, 12.0f);
    EXPECT_FLOAT_EQ(flow.verticalSpacing, 8.0f);
}

TEST(LayoutConfigTest, FlowValidation) {
    FlowWrapConfig ok;
    ok.horizontalSpacing = 0.0f;
    ok.verticalSpacing = 0.0f;
    ok.maxRows = 1;
    EXPECT_TRUE(ok.validate());

    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"flow": {"vertical_spacing": -3, "max_rows": -1}})"));
    auto bad = FlowWrapConfig::fromConfig(cfg);
    EXPECT_FALSE(bad.validate());

    FlowWrapConfig badRows;
    badRows.maxRows = -1;
    EXPECT_FALSE(badRows.validate());
}

TEST(LayoutConfigTest, CenteredReadsSpacing) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"centered": {"spacing": 10}})"));

    auto centered = CenteredDistributionConfig::fromConfig(cfg);
    EXPECT_FLOAT_EQ(centered.spacing, 10.0f);
    EXPECT_TRUE(centered.validate());
}

TEST(LayoutConfigTest, CenteredDefaultsAndValidation) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"centered": {"spacing": "wide"}})"));
    EXPECT_FLOAT_EQ(CenteredDistributionConfig::fromConfig(cfg).spacing, 0.0f);

    CenteredDistributionConfig negative;
    negative.spacing = -1.0f;
    EXPECT_FALSE(negative.validate());
}
