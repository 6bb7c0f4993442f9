#include <gtest/gtest.h>
#include "overlay/core/config.h"

#include <limits>

TEST(ConfigTest, DefaultsPassUnchanged) {
    OverlayConfig config;
    EXPECT_FALSE(sanitizeConfig(config));
    EXPECT_EQ(config.maxDepth, defaultIndexMaxDepth);
    EXPECT_EQ(config.leafCapacity, defaultIndexLeafCapacity);
    EXPECT_FLOAT_EQ(config.minPixelSize, defaultMinPixelSize);
}

TEST(ConfigTest, ClampsIndexLimits) {
    OverlayConfig config;
    config.maxDepth = 0;
    config.leafCapacity = 1000;
    EXPECT_TRUE(sanitizeConfig(config));
    EXPECT_EQ(config.maxDepth, 1u);
    EXPECT_EQ(config.leafCapacity, 256u);

    config.maxDepth = 40;
    config.leafCapacity = 0;
    EXPECT_TRUE(sanitizeConfig(config));
    EXPECT_EQ(config.maxDepth, 16u);
    EXPECT_EQ(config.leafCapacity, 1u);
}

TEST(ConfigTest, NonFiniteOrNonPositiveSizesFallBackToDefaults) {
    OverlayConfig config;
    config.viewportWidth = std::numeric_limits<float>::quiet_NaN();
    config.viewportHeight = -5.0f;
    config.rootHalfExtent = 0.0f;
    EXPECT_TRUE(sanitizeConfig(config));
    EXPECT_FLOAT_EQ(config.viewportWidth, defaultViewportWidth);
    EXPECT_FLOAT_EQ(config.viewportHeight, defaultViewportHeight);
    EXPECT_FLOAT_EQ(config.rootHalfExtent, defaultIndexRootHalfExtent);
}

TEST(ConfigTest, LodBandsAreReordered) {
    OverlayConfig config;
    config.lodFullScale = 0.3f;
    config.lodReducedScale = 0.9f;
    EXPECT_TRUE(sanitizeConfig(config));
    EXPECT_FLOAT_EQ(config.lodFullScale, 0.9f);
    EXPECT_FLOAT_EQ(config.lodReducedScale, 0.3f);
}

TEST(ConfigTest, InvertedMarginScalesReset) {
    OverlayConfig config;
    config.marginLowZoomScale = 3.0f;
    config.marginHighZoomScale = 1.0f;
    EXPECT_TRUE(sanitizeConfig(config));
    EXPECT_FLOAT_EQ(config.marginLowZoomScale, defaultMarginLowZoomScale);
    EXPECT_FLOAT_EQ(config.marginHighZoomScale, defaultMarginHighZoomScale);
}

TEST(ConfigTest, ZeroMinPixelSizeIsAllowed) {
    OverlayConfig config;
    config.minPixelSize = 0.0f;
    EXPECT_FALSE(sanitizeConfig(config));
    EXPECT_FLOAT_EQ(config.minPixelSize, 0.0f);
}
