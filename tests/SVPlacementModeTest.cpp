//
//  SVPlacementModeTest.cpp
//  SceneViewAR
//
//  Copyright © 2025 Viro Media. All rights reserved.
//
//  Permission is hereby granted, free of charge, to any person obtaining
//  a copy of this software and associated documentation files (the
//  "Software"), to deal in the Software without restriction, including
//  without limitation the rights to use, copy, modify, merge, publish,
//  distribute, sublicense, and/or sell copies of the Software, and to
//  permit persons to whom the Software is furnished to do so, subject to
//  the following conditions:
//
//  The above copyright notice and this permission notice shall be included
//  in all copies or substantial portions of the Software.
//
//  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
//  EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
//  MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.
//  IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY
//  CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT,
//  TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE
//  SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include <gtest/gtest.h>
#include "SVPlacementMode.h"

TEST(SVPlacementModeTest, FeatureSetPerMode) {
    SVPlacementMode disabled(SVPlacementModeType::Disabled);
    EXPECT_FALSE(disabled.isPlaneEnabled());
    EXPECT_FALSE(disabled.isDepthEnabled());
    EXPECT_FALSE(disabled.isInstantPlacementEnabled());

    SVPlacementMode horizontal(SVPlacementModeType::PlaneHorizontal);
    EXPECT_EQ(SVARPlaneFindingMode::Horizontal, horizontal.getPlaneFindingMode());
    EXPECT_FALSE(horizontal.isDepthEnabled());
    EXPECT_FALSE(horizontal.isInstantPlacementEnabled());

    SVPlacementMode vertical(SVPlacementModeType::PlaneVertical);
    EXPECT_EQ(SVARPlaneFindingMode::Vertical, vertical.getPlaneFindingMode());

    SVPlacementMode depth(SVPlacementModeType::Depth);
    EXPECT_FALSE(depth.isPlaneEnabled());
    EXPECT_TRUE(depth.isDepthEnabled());

    SVPlacementMode instant(SVPlacementModeType::Instant);
    EXPECT_FALSE(instant.isPlaneEnabled());
    EXPECT_TRUE(instant.isInstantPlacementEnabled());

    SVPlacementMode best(SVPlacementModeType::BestAvailable);
    EXPECT_EQ(SVARPlaneFindingMode::HorizontalAndVertical, best.getPlaneFindingMode());
    EXPECT_TRUE(best.isDepthEnabled());
    EXPECT_TRUE(best.isInstantPlacementEnabled());
}

TEST(SVPlacementModeTest, InstantFallbackCanBeAddedToPlaneModes) {
    SVPlacementMode mode(SVPlacementModeType::PlaneHorizontalAndVertical);
    EXPECT_FALSE(mode.isInstantPlacementEnabled());

    mode.setInstantPlacementFallback(true);
    EXPECT_TRUE(mode.isInstantPlacementEnabled());
    EXPECT_TRUE(mode.isPlaneEnabled());
}

TEST(SVPlacementModeTest, ApplyToWritesSessionFeatures) {
    SVARSessionConfig config;
    config.cloudAnchorEnabled = true;

    SVPlacementMode(SVPlacementModeType::PlaneVertical).applyTo(config);
    EXPECT_EQ(SVARPlaneFindingMode::Vertical, config.planeFindingMode);
    EXPECT_EQ(SVARDepthMode::Disabled, config.depthMode);
    EXPECT_FALSE(config.instantPlacementEnabled);

    // Settings unrelated to placement are left alone
    EXPECT_TRUE(config.cloudAnchorEnabled);

    SVPlacementMode(SVPlacementModeType::Depth).applyTo(config);
    EXPECT_EQ(SVARPlaneFindingMode::Disabled, config.planeFindingMode);
    EXPECT_EQ(SVARDepthMode::Automatic, config.depthMode);
}

TEST(SVPlacementModeTest, EqualityIncludesOptions) {
    SVPlacementMode a(SVPlacementModeType::Instant);
    SVPlacementMode b(SVPlacementModeType::Instant);
    EXPECT_EQ(a, b);

    b.setInstantPlacementDistance(4.0f);
    EXPECT_NE(a, b);
    EXPECT_EQ("INSTANT", a.toString());
}
