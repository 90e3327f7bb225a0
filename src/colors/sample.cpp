// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Average colour of captured 8 bit pixel samples.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "sample.h"

#include <array>

#include "colors/hcv.h"

namespace Paintmix::Colors {

/**
 * Average every pixel of every sample into a 16 bit colour.
 *
 * Channel totals are promoted with a shift of 8 bits, so full 8 bit white averages to 0xFF00.
 * Unless raw is set the result is replaced by the greyless colour of the same hue and value.
 *
 * @returns nothing if the samples hold no pixels.
 */
std::optional<RGB<BPC16>> average_samples(std::vector<PixelSample> const &samples, bool raw)
{
    std::array<std::uint64_t, 3> total = {0, 0, 0};
    std::uint64_t npixels = 0;
    for (auto const &sample : samples) {
        if (sample.n_channels < 3) {
            continue;
        }
        for (unsigned row = 0; row < sample.height; row++) {
            std::size_t row_start = static_cast<std::size_t>(row) * sample.rowstride;
            for (unsigned col = 0; col < sample.width; col++) {
                std::size_t offset = row_start + static_cast<std::size_t>(col) * sample.n_channels;
                if (offset + 2 >= sample.pixels.size()) {
                    break;
                }
                for (unsigned i = 0; i < 3; i++) {
                    total[i] += sample.pixels[offset + i];
                }
                npixels++;
            }
        }
    }
    if (!npixels) {
        return {};
    }
    auto average = [&](unsigned i) { return BPC16::round(static_cast<double>(total[i] << 8) / npixels); };
    auto rgb = RGB<BPC16>(average(0), average(1), average(2));
    if (raw) {
        return rgb;
    }
    return HCV<BPC16>(rgb).hue_rgb_for_value();
}

} // namespace Paintmix::Colors
