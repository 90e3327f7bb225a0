// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for the hue, chroma and value view of RGB
 *
 * Copyright (C) 2024 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "colors/hcv.h"

#include <sstream>
#include <gtest/gtest.h>

#include "test-utils.h"

using namespace Paintmix::Colors;

namespace {

using RGB16 = RGB<BPC16>;
using RGBP = RGB<Proportion>;
using HCV16 = HCV<BPC16>;
using HCVW16 = HCVW<BPC16>;
using HCVP = HCV<Proportion>;
using Hue16 = Hue<BPC16>;
using HueP = Hue<Proportion>;

TEST(ColorsHcv, primaries)
{
    auto red = HCV16(RGB16::red());
    EXPECT_TRUE(IsNear(red.value(), 1.0 / 3.0));
    EXPECT_TRUE(IsNear(red.chroma(), 1.0));
    EXPECT_TRUE(IsNear(red.hue().angle(), 0.0));
    EXPECT_EQ(red.hue_rgb(), RGB16::red());

    auto yellow = HCV16(RGB16::yellow());
    EXPECT_TRUE(IsNear(yellow.value(), 2.0 / 3.0));
    EXPECT_TRUE(IsNear(yellow.chroma(), 1.0, 1e-6));
}

TEST(ColorsHcv, greys)
{
    for (auto rgb : {RGB16::black(), RGB16(32768, 32768, 32768), RGB16::white()}) {
        auto hcv = HCV16(rgb);
        EXPECT_TRUE(hcv.hue().is_grey());
        EXPECT_EQ(hcv.chroma(), 0.0);
        EXPECT_EQ(hcv.zero_chroma_rgb(), hcv.value_rgb());
        EXPECT_EQ(hcv.value_rgb(), rgb);
    }
}

TEST(ColorsHcv, pinkHasTwoThirdsValue)
{
    auto pink = HCV16(RGB16(65535, 32768, 32768));
    EXPECT_TRUE(IsNear(pink.value(), 2.0 / 3.0, 1e-5));
    EXPECT_TRUE(IsNear(pink.chroma(), 32767.0 / 65535.0));
    EXPECT_EQ(pink.hue_rgb(), RGB16::red());
    EXPECT_EQ(pink.zero_chroma_rgb(), RGB16::white());
    EXPECT_EQ(pink.chroma_side(), RGB16::white());
}

TEST(ColorsHcv, chromaSide)
{
    EXPECT_EQ(HCV16(RGB16(32768, 0, 0)).chroma_side(), RGB16::black());
    EXPECT_EQ(HCV16(RGB16(65535, 20000, 20000)).chroma_side(), RGB16::white());
}

TEST(ColorsHcv, zeroChromaOfSaturatedColours)
{
    EXPECT_EQ(HCV16(RGB16::red()).zero_chroma_rgb(), RGB16::black());
    EXPECT_EQ(HCV16(RGB16::cyan()).zero_chroma_rgb(), RGB16::white());
}

TEST(ColorsHcv, hueRgbForValue)
{
    auto dark = HCV16(RGB16(32768, 0, 0));
    EXPECT_EQ(dark.hue_rgb_for_value(), RGB16(32768, 0, 0));
    EXPECT_EQ(dark.hue_rgb_for_value(1.0 / 3.0), RGB16::red());

    // the grey is replaced by more of the hue
    auto greyish = HCV16(RGB16(40000, 10000, 10000));
    auto simplest = greyish.hue_rgb_for_value();
    EXPECT_EQ(simplest[1], 0);
    EXPECT_EQ(simplest[2], 0);
    EXPECT_EQ(simplest[0], 60000);
}

TEST(ColorsHcv, rotate)
{
    // one non zero channel
    EXPECT_EQ(HCV16(RGB16::red()).get_rotated_rgb(2 * M_PI / 3), RGB16::green());
    // two non zero channels go through the hue
    EXPECT_EQ(HCV16(RGB16::yellow()).get_rotated_rgb(2 * M_PI / 3), RGB16::cyan());

    auto greyish = RGB16(50000, 20000, 20000);
    auto rotated = HCV16(greyish).get_rotated_rgb(1.0);
    EXPECT_EQ(rotated.sum(), greyish.sum());
}

TEST(ColorsHcv, rotationKeepsValue)
{
    std::srand(11);
    for (unsigned i = 0; i < 200; i++) {
        auto rgb = random_rgb<BPC16>();
        double angle = (static_cast<double>(std::rand()) / RAND_MAX - 0.5) * 2 * M_PI;
        auto hcv = HCV16(rgb);
        auto rotated = HCV16(hcv.get_rotated_rgb(angle));
        EXPECT_TRUE(IsNear(rotated.value(), hcv.value(), 1.0 / 65535)) << rgb << " by " << angle;
    }
}

TEST(ColorsHcv, rotationByWholeTurns)
{
    auto hcv = HCV16(RGB16(40000, 0, 0));
    EXPECT_EQ(hcv.get_rotated_rgb(2 * M_PI), hcv.rgb());
    EXPECT_EQ(hcv.get_rotated_rgb(5.0), hcv.get_rotated_rgb(5.0 - 2 * M_PI));
    EXPECT_EQ(hcv.get_rotated_rgb(5.0).sum(), 40000);
}

TEST(ColorsHcv, chromaAndValueInRange)
{
    std::srand(17);
    for (unsigned i = 0; i < 1000; i++) {
        auto hcv = HCV16(random_rgb<BPC16>());
        EXPECT_GE(hcv.chroma(), 0.0) << hcv.rgb();
        EXPECT_LE(hcv.chroma(), 1.0) << hcv.rgb();
        EXPECT_GE(hcv.value(), 0.0) << hcv.rgb();
        EXPECT_LE(hcv.value(), 1.0) << hcv.rgb();
    }
}

TEST(ColorsHcv, pureHuesHaveFullChroma)
{
    for (int step = 1; step <= 72; step++) {
        double angle = -M_PI + step * M_PI / 36;
        auto hue = HueP::from_angle(angle);
        auto hcv = HCVP(hue.rgb());
        EXPECT_TRUE(IsNear(hcv.chroma(), 1.0, 1e-9)) << angle;
        EXPECT_TRUE(IsNear(hcv.hue().difference(hue), 0.0, 1e-9)) << angle;

        // the minor channel is rounded at 16 bits
        auto hue16 = Hue16::from_angle(angle);
        auto hcv16 = HCV16(hue16.rgb());
        EXPECT_TRUE(IsNear(hcv16.chroma(), 1.0, 1e-4)) << angle;
        EXPECT_TRUE(IsNear(hcv16.hue().difference(hue16), 0.0, 1e-4)) << angle;
    }
}

TEST(ColorsHcv, warmth)
{
    EXPECT_EQ(HCVW16(RGB16::red()).warmth(), 1.0);
    EXPECT_EQ(HCVW16(RGB16::cyan()).warmth(), -1.0);
    EXPECT_EQ(HCVW16(RGB16(1000, 1000, 1000)).warmth(), 0.0);
    EXPECT_TRUE(IsNear(HCVW<Proportion>(RGBP::yellow()).warmth(), 0.5));

    EXPECT_EQ(HCVW16(RGB16::red()).warmth_rgb(), RGB16::red());
    EXPECT_EQ(HCVW16(RGB16::cyan()).warmth_rgb(), RGB16::cyan());
    EXPECT_EQ(HCVW16(RGB16::white()).warmth_rgb(), RGB16(32768, 32768, 32768));
}

TEST(ColorsHcv, print)
{
    std::ostringstream oss;
    oss << HCV16(RGB16::red());
    EXPECT_EQ(oss.str().rfind("(HUE = RGB(65535, 0, 0), VALUE = ", 0), 0);
}

} // namespace
