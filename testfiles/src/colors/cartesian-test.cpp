// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for the hexagon projection of RGB
 *
 * Copyright (C) 2024 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "colors/cartesian.h"

#include <gtest/gtest.h>

#include "test-utils.h"

using namespace Paintmix::Colors;

namespace {

using RGB16 = RGB<BPC16>;
using RGBP = RGB<Proportion>;

TEST(ColorsCartesian, projectPrimaries)
{
    auto red = Cartesian::from_rgb(RGBP::red());
    EXPECT_TRUE(IsNear(red.x(), 1.0));
    EXPECT_TRUE(IsNear(red.y(), 0.0));
    EXPECT_TRUE(IsNear(red.angle(), 0.0));
    EXPECT_TRUE(IsNear(red.hypot(), 1.0));

    auto green = Cartesian::from_rgb(RGBP::green());
    EXPECT_TRUE(IsNear(green.x(), -0.5));
    EXPECT_TRUE(IsNear(green.y(), std::sqrt(3.0) / 2));
    EXPECT_TRUE(IsNear(green.angle(), 2 * M_PI / 3));

    auto blue = Cartesian::from_rgb(RGBP::blue());
    EXPECT_TRUE(IsNear(blue.angle(), -2 * M_PI / 3));

    EXPECT_TRUE(IsNear(Cartesian::from_rgb(RGBP::yellow()).angle(), M_PI / 3));
    EXPECT_TRUE(IsNear(Cartesian::from_rgb(RGBP::cyan()).angle(), M_PI));
    EXPECT_TRUE(IsNear(Cartesian::from_rgb(RGBP::magenta()).angle(), -M_PI / 3));
}

TEST(ColorsCartesian, greysHaveNoAngle)
{
    EXPECT_TRUE(std::isnan(Cartesian::from_rgb(RGB16::black()).angle()));
    EXPECT_TRUE(std::isnan(Cartesian::from_rgb(RGB16::white()).angle()));
    EXPECT_TRUE(std::isnan(Cartesian::from_rgb(RGB16(777, 777, 777)).angle()));
    EXPECT_EQ(Cartesian::from_rgb(RGB16(777, 777, 777)).hypot(), 0.0);
}

TEST(ColorsCartesian, scale)
{
    auto xy = Cartesian(3.0, -4.0) * 0.5;
    EXPECT_EQ(xy.x(), 1.5);
    EXPECT_EQ(xy.y(), -2.0);
    EXPECT_EQ(xy.hypot(), 2.5);
}

TEST(ColorsCartesian, simplestRgbOfCorners)
{
    for (auto rgb : RGB16::ideal_colours()) {
        auto expected = rgb;
        if (rgb == RGB16::white()) {
            expected = RGB16::black();
        }
        EXPECT_EQ(Cartesian::from_rgb(rgb).simplest_rgb<BPC16>(), expected) << rgb;
    }
}

TEST(ColorsCartesian, simplestRgbRemovesGrey)
{
    // (a, b, c) with grey g added projects to the same point as (a, b, c)
    EXPECT_EQ(Cartesian::from_rgb(RGB16(40000, 30000, 10000)).simplest_rgb<BPC16>(), RGB16(30000, 20000, 0));
    EXPECT_EQ(Cartesian::from_rgb(RGB16(10000, 10000, 60000)).simplest_rgb<BPC16>(), RGB16(0, 0, 50000));
    EXPECT_EQ(Cartesian::from_rgb(RGB16(5000, 25000, 45000)).simplest_rgb<BPC16>(), RGB16(0, 20000, 40000));
    EXPECT_EQ(Cartesian::from_rgb(RGB16(65535, 100, 60000)).simplest_rgb<BPC16>(), RGB16(65435, 0, 59900));
}

TEST(ColorsCartesian, simplestRgbHasAZeroChannel)
{
    std::srand(7);
    for (unsigned i = 0; i < 200; i++) {
        auto rgb = random_rgb<Proportion>();
        auto xy = Cartesian::from_rgb(rgb);
        auto simplest = xy.simplest_rgb<Proportion>();
        EXPECT_LE(simplest.non_zero_components(), 2) << rgb;
        auto back = Cartesian::from_rgb(simplest);
        EXPECT_TRUE(IsNear(back.x(), xy.x(), 1e-9));
        EXPECT_TRUE(IsNear(back.y(), xy.y(), 1e-9));
    }
}

} // namespace
