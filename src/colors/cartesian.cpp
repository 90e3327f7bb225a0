// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Projection of RGB onto the plane of the colour hexagon.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "cartesian.h"

#include <cmath>
#include <limits>

#include "util/angle.h"

namespace Paintmix::Colors {

using Util::COS_120;
using Util::SIN_120;

template <ChannelPrecision P>
Cartesian Cartesian::from_rgb(RGB<P> const &rgb)
{
    double r = rgb[0];
    double g = rgb[1];
    double b = rgb[2];
    return {r + (g + b) * COS_120, (g - b) * SIN_120};
}

/**
 * The angle of the point from the red axis, NaN at the origin where there is no hue.
 */
double Cartesian::angle() const
{
    if (_point.isZero()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return Geom::atan2(_point);
}

/**
 * Return the RGB with at most two non zero channels which projects onto this point.
 */
template <ChannelPrecision P>
RGB<P> Cartesian::simplest_rgb() const
{
    double const a = x() / COS_120;
    double const b = y() / SIN_120;
    if (y() > 0.0) {
        if (a > b) {
            return RGB<P>::from_clamped(0.0, (a + b) / 2, (a - b) / 2);
        }
        return RGB<P>::from_clamped(x() - b * COS_120, b, 0.0);
    }
    if (y() < 0.0) {
        if (a > -b) {
            return RGB<P>::from_clamped(0.0, (a + b) / 2, (a - b) / 2);
        }
        return RGB<P>::from_clamped(x() + b * COS_120, 0.0, -b);
    }
    if (x() < 0.0) {
        return RGB<P>::from_clamped(0.0, a / 2, a / 2);
    }
    return RGB<P>::from_clamped(x(), 0.0, 0.0);
}

template Cartesian Cartesian::from_rgb(RGB<BPC8> const &);
template Cartesian Cartesian::from_rgb(RGB<BPC16> const &);
template Cartesian Cartesian::from_rgb(RGB<Proportion> const &);
template RGB<BPC8> Cartesian::simplest_rgb<BPC8>() const;
template RGB<BPC16> Cartesian::simplest_rgb<BPC16>() const;
template RGB<Proportion> Cartesian::simplest_rgb<Proportion>() const;

} // namespace Paintmix::Colors
