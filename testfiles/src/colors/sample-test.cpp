// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Unit tests for averaging sampled pixels
 *
 * Copyright (C) 2024 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "colors/sample.h"

#include <gtest/gtest.h>

using namespace Paintmix::Colors;

namespace {

using RGB16 = RGB<BPC16>;

PixelSample solid(std::uint8_t r, std::uint8_t g, std::uint8_t b, unsigned width, unsigned height)
{
    PixelSample sample;
    sample.width = width;
    sample.height = height;
    sample.rowstride = width * 3;
    for (unsigned i = 0; i < width * height; i++) {
        sample.pixels.insert(sample.pixels.end(), {r, g, b});
    }
    return sample;
}

TEST(ColorsSample, empty)
{
    EXPECT_FALSE(average_samples({}).has_value());
    EXPECT_FALSE(average_samples({solid(1, 2, 3, 0, 0)}).has_value());
}

TEST(ColorsSample, whiteIsShifted)
{
    auto rgb = average_samples({solid(255, 255, 255, 2, 2)});
    ASSERT_TRUE(rgb.has_value());
    EXPECT_EQ(*rgb, RGB16(0xFF00, 0xFF00, 0xFF00));
}

TEST(ColorsSample, averageOfSamples)
{
    auto rgb = average_samples({solid(200, 0, 100, 1, 1), solid(100, 0, 0, 3, 1)});
    ASSERT_TRUE(rgb.has_value());
    // (200 + 300) / 4, 0, 100 / 4
    EXPECT_EQ(*rgb, RGB16(125 << 8, 0, 25 << 8));
}

TEST(ColorsSample, rowstridePadding)
{
    PixelSample sample;
    sample.width = 1;
    sample.height = 2;
    sample.n_channels = 4;
    sample.rowstride = 8;
    sample.pixels = {10, 20, 30, 255, 99, 99, 99, 99, 30, 40, 50, 255};
    auto rgb = average_samples({sample});
    ASSERT_TRUE(rgb.has_value());
    EXPECT_EQ(*rgb, RGB16(20 << 8, 30 << 8, 40 << 8));
}

TEST(ColorsSample, hueOnly)
{
    auto rgb = average_samples({solid(100, 50, 50, 2, 2)}, false);
    ASSERT_TRUE(rgb.has_value());
    // the grey is replaced by the hue at the same value
    EXPECT_EQ((*rgb)[1], 0);
    EXPECT_EQ((*rgb)[2], 0);
    EXPECT_EQ((*rgb)[0], 200 << 8);
}

} // namespace
