// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for RGB triples
 *
 * Copyright (C) 2024 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "colors/rgb.h"

#include <sstream>
#include <gtest/gtest.h>

#include "test-utils.h"

using namespace Paintmix::Colors;

namespace {

using RGB8 = RGB<BPC8>;
using RGB16 = RGB<BPC16>;
using RGBP = RGB<Proportion>;

TEST(ColorsRgb, constants)
{
    EXPECT_EQ(RGB16::white(), RGB16(65535, 65535, 65535));
    EXPECT_EQ(RGB16::black(), RGB16(0, 0, 0));
    EXPECT_EQ(RGB8::yellow(), RGB8(255, 255, 0));
    EXPECT_EQ(RGBP::cyan(), RGBP(0.0, 1.0, 1.0));

    auto ideal = RGB8::ideal_colours();
    ASSERT_EQ(ideal.size(), 8);
    EXPECT_EQ(ideal[0], RGB8::white());
    EXPECT_EQ(ideal[1], RGB8::magenta());
    EXPECT_EQ(ideal[2], RGB8::red());
    EXPECT_EQ(ideal[3], RGB8::yellow());
    EXPECT_EQ(ideal[4], RGB8::green());
    EXPECT_EQ(ideal[5], RGB8::cyan());
    EXPECT_EQ(ideal[6], RGB8::blue());
    EXPECT_EQ(ideal[7], RGB8::black());
}

TEST(ColorsRgb, validChannels)
{
    EXPECT_TRUE(RGB8::is_valid_channel(0));
    EXPECT_TRUE(RGB8::is_valid_channel(255));
    EXPECT_FALSE(RGB8::is_valid_channel(256));
    EXPECT_FALSE(RGBP::is_valid_channel(-0.1));
    EXPECT_FALSE(RGBP::is_valid_channel(1.1));

    EXPECT_EQ(RGBP::from_clamped(1.2, -0.1, 0.5), RGBP(1.0, 0.0, 0.5));
    EXPECT_EQ(RGB8::from_clamped(300.0, -2.0, 127.6), RGB8(255, 0, 128));
}

TEST(ColorsRgb, arithmetic)
{
    EXPECT_EQ(RGB8(100, 100, 100) + RGB8(50, 0, 10), RGB8(150, 100, 110));
    EXPECT_EQ(RGB8(100, 100, 100) - RGB8(50, 0, 10), RGB8(50, 100, 90));
    EXPECT_EQ(RGB8(101, 100, 0) * 0.5, RGB8(51, 50, 0));
    EXPECT_EQ(RGB8(200, 99, 3) / 2, RGB8(100, 50, 2));
    EXPECT_EQ(RGBP(0.5, 0.25, 1.0) * 0.5, RGBP(0.25, 0.125, 0.5));
    EXPECT_EQ(RGB16(30000, 0, 65535) + RGB16(35535, 0, 0), RGB16::magenta());
    EXPECT_EQ(RGB16::white() * 1.0, RGB16::white());
}

TEST(ColorsRgb, arithmeticOutOfRange)
{
    EXPECT_DEBUG_DEATH({ auto sum = RGB16::white() + RGB16::red(); (void)sum; }, ".*");
    EXPECT_DEBUG_DEATH({ auto product = RGB8(200, 0, 0) * 2.0; (void)product; }, ".*");
}

TEST(ColorsRgb, conversion)
{
    EXPECT_EQ(RGB8(255, 128, 0).converted<BPC16>(), RGB16(65535, 32896, 0));
    EXPECT_EQ(RGB16(65535, 32896, 0).converted<BPC8>(), RGB8(255, 128, 0));
    EXPECT_EQ(RGB8(255, 0, 51).converted<Proportion>(), RGBP(1.0, 0.0, 0.2));
    EXPECT_EQ(RGBP(1.0, 0.5, 0.0).converted<BPC16>(), RGB16(65535, 32768, 0));
}

TEST(ColorsRgb, conversionRoundTrips)
{
    std::srand(3);
    for (unsigned i = 0; i < 500; i++) {
        auto rgb8 = random_rgb<BPC8>();
        EXPECT_EQ(rgb8.converted<BPC16>().converted<BPC8>(), rgb8);
        EXPECT_EQ(rgb8.converted<Proportion>().converted<BPC8>(), rgb8);

        auto rgb16 = random_rgb<BPC16>();
        EXPECT_EQ(rgb16.converted<Proportion>().converted<BPC16>(), rgb16);
        // one step of the coarser precision
        EXPECT_TRUE(ChannelsNear(rgb16.converted<BPC8>().converted<BPC16>(), rgb16, 257.0 / 2)) << rgb16;

        auto rgbp = random_rgb<Proportion>();
        EXPECT_TRUE(ChannelsNear(rgbp.converted<BPC16>().converted<Proportion>(), rgbp, 1.0 / 65535)) << rgbp;
        EXPECT_TRUE(ChannelsNear(rgbp.converted<BPC8>().converted<Proportion>(), rgbp, 1.0 / 255)) << rgbp;
    }
}

TEST(ColorsRgb, valueAndSum)
{
    EXPECT_EQ(RGB16::white().sum(), 3 * 65535);
    EXPECT_EQ(RGB16::white().value(), 1.0);
    EXPECT_EQ(RGB16::black().value(), 0.0);
    EXPECT_TRUE(IsNear(RGB16::red().value(), 1.0 / 3.0));
    EXPECT_TRUE(IsNear(RGB16(65535, 32768, 32768).value(), 2.0 / 3.0, 1e-5));
    EXPECT_TRUE(IsNear(RGBP(0.2, 0.4, 0.6).value(), 0.4));
}

TEST(ColorsRgb, nonZeroComponents)
{
    EXPECT_EQ(RGB8::black().non_zero_components(), 0);
    EXPECT_EQ(RGB8::red().non_zero_components(), 1);
    EXPECT_EQ(RGB8(3, 0, 9).non_zero_components(), 2);
    EXPECT_EQ(RGB8::white().non_zero_components(), 3);
}

TEST(ColorsRgb, indicesValueOrder)
{
    EXPECT_EQ(RGB8(200, 100, 50).indices_value_order(), (std::array<unsigned int, 3>{0, 1, 2}));
    EXPECT_EQ(RGB8(200, 50, 100).indices_value_order(), (std::array<unsigned int, 3>{0, 2, 1}));
    EXPECT_EQ(RGB8(100, 200, 50).indices_value_order(), (std::array<unsigned int, 3>{1, 0, 2}));
    EXPECT_EQ(RGB8(50, 200, 100).indices_value_order(), (std::array<unsigned int, 3>{1, 2, 0}));
    EXPECT_EQ(RGB8(100, 50, 200).indices_value_order(), (std::array<unsigned int, 3>{2, 0, 1}));
    EXPECT_EQ(RGB8(50, 100, 200).indices_value_order(), (std::array<unsigned int, 3>{2, 1, 0}));
}

TEST(ColorsRgb, bestForeground)
{
    EXPECT_TRUE(RGB8::white().best_foreground_is_black());
    EXPECT_TRUE(RGB8::yellow().best_foreground_is_black());
    EXPECT_FALSE(RGB8::black().best_foreground_is_black());
    EXPECT_FALSE(RGB8::blue().best_foreground_is_black());
    EXPECT_EQ(RGB16::blue().best_foreground(), RGB16::white());
    EXPECT_EQ(RGB16::green().best_foreground(), RGB16::black());
    EXPECT_EQ(RGB16::green().best_foreground(0.9), RGB16::white());
}

TEST(ColorsRgb, rotatePrimaries)
{
    EXPECT_EQ(RGB16::red().rotated(0.0), RGB16::red());
    EXPECT_EQ(RGB16::red().rotated(2 * M_PI / 3), RGB16::green());
    EXPECT_EQ(RGB16::red().rotated(-2 * M_PI / 3), RGB16::blue());
    EXPECT_EQ(RGB16::green().rotated(2 * M_PI / 3), RGB16::blue());
    EXPECT_EQ(RGB8::blue().rotated(-2 * M_PI / 3), RGB8::green());
    EXPECT_TRUE(ChannelsNear(RGBP::red().rotated(2 * M_PI / 3), RGBP::green(), 1e-12));
}

TEST(ColorsRgb, rotateHalfWay)
{
    auto rgb = RGB16::red().rotated(M_PI / 3);
    EXPECT_EQ(rgb.sum(), 65535);
    EXPECT_EQ(rgb[2], 0);
    EXPECT_TRUE(IsNear(rgb[0], 32767.5, 0.5));
    EXPECT_TRUE(IsNear(rgb[1], 32767.5, 0.5));

    rgb = RGB16::red().rotated(M_PI);
    EXPECT_EQ(rgb.sum(), 65535);
    EXPECT_EQ(rgb[0], 0);
}

TEST(ColorsRgb, rotateGreyIsUnchanged)
{
    auto grey = RGB16(1234, 1234, 1234);
    for (double angle : {-3.0, -2.5, -1.0, 0.3, 1.7, 2.2, 3.1}) {
        EXPECT_EQ(grey.rotated(angle), grey);
    }
}

TEST(ColorsRgb, rotationKeepsValue)
{
    std::srand(1);
    for (unsigned i = 0; i < 200; i++) {
        auto base = random_rgb<BPC16>();
        // one non zero channel, or three
        for (auto rgb : {RGB16(base[0], 0, 0), RGB16(0, 0, base[2]), base}) {
            if (rgb.non_zero_components() == 2) {
                continue;
            }
            double angle = (static_cast<double>(std::rand()) / RAND_MAX - 0.5) * 2 * M_PI;
            auto rotated = rgb.rotated(angle);
            EXPECT_EQ(rotated.sum(), rgb.sum()) << rgb << " rotated by " << angle;
            EXPECT_EQ(rotated.value(), rgb.value());
        }
    }
}

TEST(ColorsRgb, rotateWholeTurns)
{
    EXPECT_EQ(RGB16::red().rotated(2 * M_PI), RGB16::red());
    EXPECT_EQ(RGB16::red().rotated(-2 * M_PI), RGB16::red());

    auto rgb = RGB16(40000, 0, 0);
    auto rotated = rgb.rotated(5.0);
    EXPECT_EQ(rotated.sum(), 40000);
    EXPECT_EQ(rotated, rgb.rotated(5.0 - 2 * M_PI));
    EXPECT_EQ(rgb.rotated(-5.0), rgb.rotated(2 * M_PI - 5.0));
}

TEST(ColorsRgb, print)
{
    std::ostringstream oss;
    oss << RGB8(255, 128, 0);
    EXPECT_EQ(oss.str(), "RGB(255, 128, 0)");
}

} // namespace
