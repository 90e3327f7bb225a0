// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for hues
 *
 * Copyright (C) 2024 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "colors/hue.h"

#include <algorithm>
#include <gtest/gtest.h>

#include "test-utils.h"

using namespace Paintmix::Colors;

namespace {

using RGB16 = RGB<BPC16>;
using Hue16 = Hue<BPC16>;
using HueP = Hue<Proportion>;

TEST(ColorsHue, grey)
{
    auto grey = Hue16::grey();
    EXPECT_TRUE(grey.is_grey());
    EXPECT_EQ(grey.other(), BPC16::ONE);
    EXPECT_EQ(grey.chroma_correction(), 1.0);
    EXPECT_EQ(grey.rgb(), RGB16::white());
    EXPECT_TRUE(Hue16::from_rgb(RGB16(100, 100, 100)).is_grey());
    EXPECT_TRUE(Hue16::from_rgb(RGB16::black()).is_grey());

    EXPECT_TRUE(IsNear(grey.max_chroma_for_value(0.3), 0.3));
    EXPECT_EQ(grey.max_chroma_for_value(1.5), 1.0);
    EXPECT_EQ(grey.rgb_with_value(0.5), RGB16(32768, 32768, 32768));
    EXPECT_EQ(grey.xy_for_chroma(0.5).hypot(), 0.0);
}

TEST(ColorsHue, primaries)
{
    auto red = Hue16::from_angle(0.0);
    EXPECT_FALSE(red.is_grey());
    EXPECT_EQ(red.io(), (std::array<unsigned int, 3>{0, 1, 2}));
    EXPECT_EQ(red.other(), 0);
    EXPECT_EQ(red.chroma_correction(), 1.0);
    EXPECT_EQ(red.rgb(), RGB16::red());

    EXPECT_EQ(Hue16::from_angle(M_PI / 3).rgb(), RGB16::yellow());
    EXPECT_EQ(Hue16::from_angle(2 * M_PI / 3).rgb(), RGB16::green());
    EXPECT_EQ(Hue16::from_angle(M_PI).rgb(), RGB16::cyan());
    EXPECT_EQ(Hue16::from_angle(-2 * M_PI / 3).rgb(), RGB16::blue());
    EXPECT_EQ(Hue16::from_angle(-M_PI / 3).rgb(), RGB16::magenta());
}

TEST(ColorsHue, sectors)
{
    EXPECT_EQ(Hue16::from_angle(0.5).io(), (std::array<unsigned int, 3>{0, 1, 2}));
    EXPECT_EQ(Hue16::from_angle(-0.5).io(), (std::array<unsigned int, 3>{0, 2, 1}));
    EXPECT_EQ(Hue16::from_angle(1.5).io(), (std::array<unsigned int, 3>{1, 0, 2}));
    EXPECT_EQ(Hue16::from_angle(-1.5).io(), (std::array<unsigned int, 3>{2, 0, 1}));
    EXPECT_EQ(Hue16::from_angle(2.5).io(), (std::array<unsigned int, 3>{1, 2, 0}));
    EXPECT_EQ(Hue16::from_angle(-2.5).io(), (std::array<unsigned int, 3>{2, 1, 0}));
}

TEST(ColorsHue, fromRgbFindsOther)
{
    auto hue = Hue16::from_rgb(RGB16(65535, 32768, 0));
    EXPECT_TRUE(IsNear(hue.other(), 32768, 1));
    EXPECT_EQ(hue.io(), (std::array<unsigned int, 3>{0, 1, 2}));

    // adding grey does not change the hue
    EXPECT_EQ(Hue16::from_rgb(RGB16(40000, 20000, 0)), Hue16::from_rgb(RGB16(50000, 30000, 10000)));
}

TEST(ColorsHue, saturatedColourSpansTheChannels)
{
    for (double angle = -M_PI + 0.01; angle <= M_PI; angle += 0.05) {
        auto rgb = Hue16::from_angle(angle).rgb();
        EXPECT_EQ(std::max({rgb[0], rgb[1], rgb[2]}), BPC16::ONE) << angle;
        EXPECT_EQ(std::min({rgb[0], rgb[1], rgb[2]}), 0) << angle;
    }
}

TEST(ColorsHue, maxChroma)
{
    auto red = HueP::from_angle(0.0);
    EXPECT_TRUE(IsNear(red.max_chroma_value(), 1.0 / 3.0));
    EXPECT_TRUE(IsNear(red.max_chroma_for_total(0.5), 0.5));
    EXPECT_TRUE(IsNear(red.max_chroma_for_total(1.0), 1.0));
    EXPECT_TRUE(IsNear(red.max_chroma_for_total(2.0), 0.5));
    EXPECT_TRUE(IsNear(red.max_chroma_for_total(3.0), 0.0));

    auto yellow = HueP::from_angle(M_PI / 3);
    EXPECT_TRUE(IsNear(yellow.max_chroma_value(), 2.0 / 3.0));
    EXPECT_TRUE(IsNear(yellow.max_chroma_for_value(1.0 / 3.0), 0.5));
    EXPECT_TRUE(IsNear(yellow.max_chroma_for_value(2.0 / 3.0), 1.0));
    EXPECT_TRUE(IsNear(yellow.max_chroma_for_value(5.0 / 6.0), 0.5));
}

TEST(ColorsHue, rgbWithValue)
{
    auto red = Hue16::from_angle(0.0);
    EXPECT_EQ(red.rgb_with_value(1.0 / 3.0), RGB16::red());
    EXPECT_EQ(red.rgb_with_value(0.25), RGB16(49151, 0, 0));
    EXPECT_EQ(red.rgb_with_value(0.0), RGB16::black());
    EXPECT_EQ(red.rgb_with_value(1.0), RGB16::white());
    EXPECT_EQ(red.rgb_with_value(1.5), RGB16::white());

    auto light = red.rgb_with_value(2.0 / 3.0);
    EXPECT_EQ(light[0], BPC16::ONE);
    EXPECT_EQ(light.sum(), 2 * 65535);
}

TEST(ColorsHue, rgbWithValueKeepsValue)
{
    std::srand(3);
    for (unsigned i = 0; i < 200; i++) {
        double angle = (static_cast<double>(std::rand()) / RAND_MAX - 0.5) * 2 * M_PI;
        double value = static_cast<double>(std::rand()) / RAND_MAX;
        auto rgb = Hue16::from_angle(angle).rgb_with_value(value);
        EXPECT_TRUE(IsNear(rgb.value(), value, 2.0 / (3 * 65535))) << angle << " " << value;
    }
}

TEST(ColorsHue, rotate)
{
    auto hue = HueP::from_angle(M_PI - 0.1).rotated_by(0.2);
    EXPECT_TRUE(IsNear(hue.angle(), -M_PI + 0.1));
    EXPECT_TRUE(HueP::grey().rotated_by(1.0).is_grey());
}

TEST(ColorsHue, xyForChroma)
{
    EXPECT_EQ(Hue16::from_angle(0.0).xy_for_chroma(1.0).simplest_rgb<BPC16>(), RGB16::red());
    EXPECT_EQ(Hue16::from_angle(M_PI / 3).xy_for_chroma(1.0).simplest_rgb<BPC16>(), RGB16::yellow());
    EXPECT_EQ(Hue16::from_angle(0.0).xy_for_chroma(0.5).simplest_rgb<BPC16>(), RGB16(32768, 0, 0));

    // the correction makes chroma 1 reach the edge of the hexagon
    auto hue = HueP::from_angle(0.4);
    auto rgb = hue.xy_for_chroma(1.0).simplest_rgb<Proportion>();
    EXPECT_TRUE(IsNear(rgb[0], 1.0, 1e-6));
}

TEST(ColorsHue, difference)
{
    EXPECT_TRUE(IsNear(HueP::from_angle(0.5).difference(HueP::from_angle(-0.5)), 1.0));
    EXPECT_TRUE(IsNear(HueP::from_angle(3.0).difference(HueP::from_angle(-3.0)), 6.0 - 2 * M_PI));
    EXPECT_TRUE(IsNear(HueP::from_angle(-3.0).difference(HueP::from_angle(3.0)), 2 * M_PI - 6.0));
}

TEST(ColorsHue, ordering)
{
    auto grey = HueP::grey();
    auto low = HueP::from_angle(0.1);
    auto high = HueP::from_angle(0.2);

    EXPECT_EQ(grey, HueP::grey());
    EXPECT_NE(grey, low);
    EXPECT_EQ(low, HueP::from_angle(0.1));
    EXPECT_LT(grey, low);
    EXPECT_FALSE(low < grey);
    EXPECT_FALSE(grey < HueP::grey());
    EXPECT_LT(low, high);
    EXPECT_GT(high, low);
    EXPECT_LE(grey, grey);
    EXPECT_GE(high, grey);
}

} // namespace
