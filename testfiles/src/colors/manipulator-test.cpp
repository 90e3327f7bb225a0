// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for the interactive RGB manipulator
 *
 * Copyright (C) 2024 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "colors/manipulator.h"

#include <gtest/gtest.h>
#include <sigc++/scoped_connection.h>

#include "test-utils.h"

using namespace Paintmix::Colors;

namespace {

using RGB8 = RGB<BPC8>;
using RGBP = RGB<Proportion>;

class ColorsManipulator : public ::testing::Test
{
protected:
    void SetUp() override
    {
        connection = manipulator.signal_changed.connect([this]() { changes++; });
    }

    RGBManipulator manipulator;
    sigc::scoped_connection connection;
    int changes = 0;
};

TEST_F(ColorsManipulator, startsBlack)
{
    EXPECT_EQ(manipulator.get_rgb<BPC8>(), RGB8::black());
    EXPECT_EQ(manipulator.value(), 0.0);
    EXPECT_EQ(manipulator.chroma(), 0.0);
    EXPECT_TRUE(manipulator.hue().is_grey());
    EXPECT_TRUE(manipulator.last_hue().is_grey());
    EXPECT_EQ(manipulator.reference_hue(), RGBManipulator::DEFAULT_REFERENCE_HUE);
}

TEST_F(ColorsManipulator, setRgb)
{
    manipulator.set_rgb(RGB8(255, 0, 0));
    EXPECT_EQ(changes, 1);
    EXPECT_EQ(manipulator.get_rgb<BPC8>(), RGB8::red());
    EXPECT_TRUE(IsNear(manipulator.value(), 1.0 / 3.0));
    EXPECT_TRUE(IsNear(manipulator.chroma(), 1.0));
    EXPECT_TRUE(IsNear(manipulator.hue().angle(), 0.0));
    EXPECT_EQ(manipulator.last_hue(), manipulator.hue());

    RGBManipulator other(RGB<BPC16>::cyan());
    EXPECT_EQ(other.get_rgb<BPC8>(), RGB8::cyan());
}

TEST_F(ColorsManipulator, valueBounds)
{
    EXPECT_FALSE(manipulator.decr_value(0.1));
    EXPECT_EQ(manipulator.get_rgb<BPC8>(), RGB8::black());

    manipulator.set_rgb(RGB8::white());
    changes = 0;
    EXPECT_FALSE(manipulator.incr_value(0.1));
    EXPECT_EQ(manipulator.get_rgb<BPC8>(), RGB8::white());
    EXPECT_EQ(changes, 0);
}

TEST_F(ColorsManipulator, valueReachesTheEnds)
{
    manipulator.set_rgb(RGBP(0.6, 0.3, 0.3));
    EXPECT_TRUE(manipulator.incr_value(1.0));
    EXPECT_EQ(manipulator.get_rgb<BPC8>(), RGB8::white());
    EXPECT_TRUE(manipulator.decr_value(2.0));
    EXPECT_EQ(manipulator.get_rgb<BPC8>(), RGB8::black());
    EXPECT_FALSE(manipulator.decr_value(0.1));
}

TEST_F(ColorsManipulator, valueChangesTheGrey)
{
    manipulator.set_rgb(RGBP(0.8, 0.4, 0.4));
    EXPECT_TRUE(manipulator.decr_value(0.1));
    auto rgb = manipulator.get_rgb<Proportion>();
    EXPECT_TRUE(ChannelsNear(rgb, RGBP(0.7, 0.3, 0.3), 1e-9));
    EXPECT_TRUE(IsNear(manipulator.value(), 13.0 / 30.0));
    EXPECT_TRUE(IsNear(manipulator.hue().angle(), 0.0));
}

TEST_F(ColorsManipulator, valueBeyondTheHueLimitsChroma)
{
    manipulator.set_rgb(RGBP::red());
    EXPECT_TRUE(manipulator.incr_value(0.1));
    auto rgb = manipulator.get_rgb<Proportion>();
    EXPECT_TRUE(IsNear(manipulator.value(), 1.0 / 3.0 + 0.1));
    EXPECT_TRUE(IsNear(rgb[0], 1.0));
    EXPECT_TRUE(IsNear(rgb[1], rgb[2]));
    EXPECT_TRUE(IsNear(manipulator.hue().angle(), 0.0));
    EXPECT_TRUE(IsNear(manipulator.chroma(), 0.85));
}

TEST_F(ColorsManipulator, chromaBounds)
{
    manipulator.set_rgb(RGB8(100, 100, 100));
    changes = 0;
    EXPECT_FALSE(manipulator.decr_chroma(0.1));
    EXPECT_EQ(changes, 0);

    manipulator.set_rgb(RGB8::red());
    changes = 0;
    EXPECT_FALSE(manipulator.incr_chroma(0.1));
    EXPECT_EQ(changes, 0);
    EXPECT_EQ(manipulator.get_rgb<BPC8>(), RGB8::red());
}

TEST_F(ColorsManipulator, chromaKeepsValue)
{
    manipulator.set_rgb(RGBP(0.8, 0.4, 0.4));
    double value = manipulator.value();
    EXPECT_TRUE(manipulator.decr_chroma(0.2));
    EXPECT_TRUE(IsNear(manipulator.value(), value));
    EXPECT_TRUE(IsNear(manipulator.chroma(), 0.2));
    EXPECT_TRUE(IsNear(manipulator.hue().angle(), 0.0));
}

TEST_F(ColorsManipulator, greyRemembersTheLastHue)
{
    manipulator.set_rgb(RGBP::red());
    EXPECT_TRUE(manipulator.decr_chroma(1.0));
    EXPECT_TRUE(manipulator.hue().is_grey());
    EXPECT_TRUE(IsNear(manipulator.value(), 1.0 / 3.0));
    EXPECT_FALSE(manipulator.last_hue().is_grey());
    EXPECT_TRUE(IsNear(manipulator.last_hue().angle(), 0.0));

    EXPECT_TRUE(manipulator.incr_chroma(1.0));
    EXPECT_TRUE(ChannelsNear(manipulator.get_rgb<Proportion>(), RGBP::red(), 1e-9));
}

TEST_F(ColorsManipulator, midGreyLeavesTowardsTheReferenceHue)
{
    manipulator.set_rgb(RGB8(128, 128, 128));
    EXPECT_TRUE(manipulator.hue().is_grey());
    EXPECT_TRUE(manipulator.last_hue().is_grey());

    changes = 0;
    EXPECT_TRUE(manipulator.incr_chroma(0.005));
    EXPECT_EQ(changes, 1);
    EXPECT_FALSE(manipulator.hue().is_grey());
    EXPECT_TRUE(IsNear(manipulator.hue().angle(), M_PI / 2, 1e-6));
    EXPECT_TRUE(IsNear(manipulator.value(), 128.0 / 255.0));
    EXPECT_TRUE(IsNear(manipulator.chroma(), 0.005));
}

TEST_F(ColorsManipulator, leavingBlackAndWhite)
{
    manipulator.set_reference_hue(0.0);
    EXPECT_TRUE(manipulator.incr_chroma(0.1));
    EXPECT_TRUE(ChannelsNear(manipulator.get_rgb<Proportion>(), RGBP(0.1, 0.0, 0.0), 1e-9));

    manipulator.set_rgb(RGBP::white());
    manipulator.set_reference_hue(0.0);
    EXPECT_TRUE(manipulator.incr_chroma(0.1));
    EXPECT_TRUE(ChannelsNear(manipulator.get_rgb<Proportion>(), RGBP(1.0, 0.9, 0.9), 1e-9));
}

TEST_F(ColorsManipulator, referenceHueIsNormalised)
{
    manipulator.set_reference_hue(3 * M_PI / 2);
    EXPECT_TRUE(IsNear(manipulator.reference_hue(), -M_PI / 2));
}

TEST_F(ColorsManipulator, rotate)
{
    EXPECT_FALSE(manipulator.rotate_hue(0.5));

    manipulator.set_rgb(RGBP::red());
    EXPECT_TRUE(manipulator.rotate_hue(2 * M_PI / 3));
    EXPECT_TRUE(ChannelsNear(manipulator.get_rgb<Proportion>(), RGBP::green(), 1e-9));

    manipulator.set_rgb(RGBP(0.7, 0.3, 0.3));
    double value = manipulator.value();
    double chroma = manipulator.chroma();
    EXPECT_TRUE(manipulator.rotate_hue(-M_PI / 2));
    EXPECT_TRUE(IsNear(manipulator.value(), value));
    EXPECT_TRUE(IsNear(manipulator.chroma(), chroma));
    EXPECT_TRUE(IsNear(manipulator.hue().angle(), -M_PI / 2));
    EXPECT_TRUE(IsNear(manipulator.last_hue().angle(), -M_PI / 2));
}

TEST_F(ColorsManipulator, staysInRange)
{
    std::srand(5);
    manipulator.set_rgb(random_rgb<BPC8>());
    for (unsigned i = 0; i < 500; i++) {
        double delta = static_cast<double>(std::rand()) / RAND_MAX * 0.2;
        switch (std::rand() % 5) {
            case 0:
                manipulator.incr_value(delta);
                break;
            case 1:
                manipulator.decr_value(delta);
                break;
            case 2:
                manipulator.incr_chroma(delta);
                break;
            case 3:
                manipulator.decr_chroma(delta);
                break;
            default:
                manipulator.rotate_hue(delta * 10 - 1);
        }
        ASSERT_GE(manipulator.value(), 0.0);
        ASSERT_LE(manipulator.value(), 1.0);
        ASSERT_GE(manipulator.chroma(), 0.0);
        ASSERT_LE(manipulator.chroma(), 1.0);
    }
}

} // namespace
