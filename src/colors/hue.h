// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * The hue of a colour as an angle on the colour hexagon.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_COLORS_HUE_H
#define SEEN_COLORS_HUE_H

#include <array>
#include <cmath>

#include "colors/cartesian.h"
#include "colors/channel.h"
#include "colors/rgb.h"

namespace Paintmix::Colors {

/**
 * A hue knows the channel order of its fully saturated colour and the magnitude of the
 * secondary channel. Greys have no hue, they are represented by a NaN angle and sort
 * before every real hue.
 */
template <ChannelPrecision P>
class Hue
{
public:
    using value_type = typename P::value_type;

    static Hue from_angle(double angle);
    static Hue from_rgb(RGB<P> const &rgb) { return from_angle(Cartesian::from_rgb(rgb).angle()); }
    static Hue grey() { return from_angle(NAN); }

    bool is_grey() const { return std::isnan(_angle); }
    double angle() const { return _angle; }
    value_type other() const { return _other; }
    double chroma_correction() const { return _chroma_correction; }
    std::array<unsigned int, 3> const &io() const { return _io; }

    RGB<P> rgb() const;
    double max_chroma_value() const;
    double max_chroma_for_total(double total) const;
    double max_chroma_for_value(double value) const { return max_chroma_for_total(value * 3.0 * P::ONE); }
    RGB<P> rgb_with_total(double total) const;
    RGB<P> rgb_with_value(double value) const;

    Hue rotated_by(double delta) const;
    Cartesian xy_for_chroma(double chroma) const;
    double difference(Hue const &other) const;

    bool operator==(Hue const &other) const;
    bool operator<(Hue const &other) const;
    bool operator!=(Hue const &other) const { return !(*this == other); }
    bool operator>(Hue const &other) const { return other < *this; }
    bool operator<=(Hue const &other) const { return !(other < *this); }
    bool operator>=(Hue const &other) const { return !(*this < other); }

private:
    Hue(std::array<unsigned int, 3> io, value_type other, double angle, double chroma_correction)
        : _io(io)
        , _other(other)
        , _angle(angle)
        , _chroma_correction(chroma_correction)
    {}

    std::array<unsigned int, 3> _io = {0, 1, 2};
    value_type _other = P::ONE;
    double _angle = NAN;
    double _chroma_correction = 1.0;
};

extern template class Hue<BPC8>;
extern template class Hue<BPC16>;
extern template class Hue<Proportion>;

} // namespace Paintmix::Colors

#endif // SEEN_COLORS_HUE_H
