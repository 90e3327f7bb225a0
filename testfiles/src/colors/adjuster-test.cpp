// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for adjusting colours in configured steps
 *
 * Copyright (C) 2024 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "colors/adjuster.h"

#include <gtest/gtest.h>

#include "test-utils.h"

using namespace Paintmix::Colors;
using Paintmix::Util::Settings;
using Paintmix::Util::StepSize;

namespace {

using RGBP = RGB<Proportion>;

class ColorsAdjuster : public ::testing::Test
{
protected:
    Settings settings;
    ColourAdjuster adjuster{settings};
};

TEST_F(ColorsAdjuster, valueSteps)
{
    adjuster.set_rgb(RGBP(0.5, 0.5, 0.5));
    EXPECT_TRUE(adjuster.darken(StepSize::Fine));
    EXPECT_TRUE(IsNear(adjuster.manipulator().value(), 0.4975));
    EXPECT_TRUE(adjuster.lighten(StepSize::Coarse));
    EXPECT_TRUE(IsNear(adjuster.manipulator().value(), 0.5075));

    adjuster.set_rgb(RGBP::white());
    EXPECT_FALSE(adjuster.lighten());
}

TEST_F(ColorsAdjuster, greyness)
{
    adjuster.set_rgb(RGBP(0.8, 0.4, 0.4));
    EXPECT_TRUE(adjuster.increase_greyness());
    EXPECT_TRUE(IsNear(adjuster.manipulator().chroma(), 0.395));
    EXPECT_TRUE(adjuster.decrease_greyness(StepSize::Coarse));
    EXPECT_TRUE(IsNear(adjuster.manipulator().chroma(), 0.405));

    adjuster.set_rgb(RGBP(0.3, 0.3, 0.3));
    EXPECT_FALSE(adjuster.increase_greyness());
}

TEST_F(ColorsAdjuster, rotationDirection)
{
    adjuster.set_rgb(RGBP::red());
    EXPECT_TRUE(adjuster.rotate_anticlockwise());
    EXPECT_TRUE(IsNear(adjuster.manipulator().hue().angle(), M_PI / 100));

    adjuster.set_rgb(RGBP::red());
    EXPECT_TRUE(adjuster.rotate_clockwise(StepSize::Coarse));
    EXPECT_TRUE(IsNear(adjuster.manipulator().hue().angle(), -M_PI / 50));

    settings.set_red_to_yellow_clockwise(true);
    adjuster.set_rgb(RGBP::red());
    EXPECT_TRUE(adjuster.rotate_clockwise(StepSize::Fine));
    EXPECT_TRUE(IsNear(adjuster.manipulator().hue().angle(), M_PI / 200));
}

TEST_F(ColorsAdjuster, followsReferenceHue)
{
    EXPECT_TRUE(IsNear(adjuster.manipulator().reference_hue(), M_PI / 2));
    settings.set_reference_hue_degrees(0.0);
    EXPECT_EQ(adjuster.manipulator().reference_hue(), 0.0);

    adjuster.set_rgb(RGBP(0.5, 0.5, 0.5));
    EXPECT_TRUE(adjuster.decrease_greyness());
    EXPECT_TRUE(IsNear(adjuster.manipulator().hue().angle(), 0.0));
    EXPECT_TRUE(IsNear(adjuster.manipulator().value(), 0.5));
}

TEST_F(ColorsAdjuster, stepsFromSettings)
{
    settings.set_value_steps({0.1, 0.2, 0.3});
    adjuster.set_rgb(RGBP(0.5, 0.5, 0.5));
    EXPECT_TRUE(adjuster.lighten(StepSize::Coarse));
    EXPECT_TRUE(IsNear(adjuster.get_rgb<Proportion>()[0], 0.8));
}

} // namespace
