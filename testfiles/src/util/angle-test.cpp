// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for angle helpers
 *
 * Copyright (C) 2024 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "util/angle.h"

#include <gtest/gtest.h>

using namespace Paintmix::Util;

namespace {

TEST(UtilAngle, normalize)
{
    EXPECT_DOUBLE_EQ(normalize_angle(0.5), 0.5);
    EXPECT_DOUBLE_EQ(normalize_angle(-0.5), -0.5);
    EXPECT_DOUBLE_EQ(normalize_angle(M_PI), M_PI);
    EXPECT_DOUBLE_EQ(normalize_angle(-M_PI), M_PI);
    EXPECT_DOUBLE_EQ(normalize_angle(3 * M_PI / 2), -M_PI / 2);
    EXPECT_DOUBLE_EQ(normalize_angle(-3 * M_PI / 2), M_PI / 2);
    EXPECT_NEAR(normalize_angle(5 * M_PI + 0.25), -M_PI + 0.25, 1e-12);
    EXPECT_TRUE(std::isnan(normalize_angle(NAN)));
}

TEST(UtilAngle, difference)
{
    EXPECT_DOUBLE_EQ(angle_difference(0.75, 0.25), 0.5);
    EXPECT_DOUBLE_EQ(angle_difference(0.25, 0.75), -0.5);
    EXPECT_NEAR(angle_difference(3.0, -3.0), 6.0 - 2 * M_PI, 1e-12);
    EXPECT_TRUE(std::isnan(angle_difference(NAN, 1.0)));
}

TEST(UtilAngle, constants)
{
    EXPECT_DOUBLE_EQ(PI_60 * 2, PI_120);
    EXPECT_NEAR(COS_120, std::cos(PI_120), 1e-15);
    EXPECT_DOUBLE_EQ(SIN_120, SIN_60);
}

} // namespace
