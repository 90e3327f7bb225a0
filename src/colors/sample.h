// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Average colour of captured 8 bit pixel samples.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_COLORS_SAMPLE_H
#define SEEN_COLORS_SAMPLE_H

#include <cstdint>
#include <optional>
#include <vector>

#include "colors/rgb.h"

namespace Paintmix::Colors {

/**
 * A block of 8 bit per channel pixels laid out in rows, as delivered by image buffers.
 * The first three channels of each pixel are red, green and blue.
 */
struct PixelSample
{
    std::vector<std::uint8_t> pixels;
    unsigned n_channels = 3;
    unsigned rowstride = 0;
    unsigned width = 0;
    unsigned height = 0;
};

std::optional<RGB<BPC16>> average_samples(std::vector<PixelSample> const &samples, bool raw = true);

} // namespace Paintmix::Colors

#endif // SEEN_COLORS_SAMPLE_H
