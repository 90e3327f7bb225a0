// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Projection of RGB onto the plane of the colour hexagon.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_COLORS_CARTESIAN_H
#define SEEN_COLORS_CARTESIAN_H

#include <2geom/point.h>

#include "colors/channel.h"
#include "colors/rgb.h"

namespace Paintmix::Colors {

/**
 * A point in the hexagon plane, red along the positive x axis and green at +120 degrees.
 *
 * Coordinates are in the channel units of the RGB the point was made from.
 */
class Cartesian
{
public:
    Cartesian(double x, double y)
        : _point(x, y)
    {}
    explicit Cartesian(Geom::Point point)
        : _point(point)
    {}

    template <ChannelPrecision P>
    static Cartesian from_rgb(RGB<P> const &rgb);

    double x() const { return _point.x(); }
    double y() const { return _point.y(); }
    Geom::Point const &point() const { return _point; }

    double angle() const;
    double hypot() const { return _point.length(); }

    Cartesian operator*(double factor) const { return Cartesian(_point * factor); }

    template <ChannelPrecision P>
    RGB<P> simplest_rgb() const;

private:
    Geom::Point _point;
};

} // namespace Paintmix::Colors

#endif // SEEN_COLORS_CARTESIAN_H
