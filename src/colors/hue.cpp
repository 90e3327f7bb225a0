// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * The hue of a colour as an angle on the colour hexagon.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "hue.h"

#include <algorithm>
#include <cassert>

#include "util/angle.h"

namespace Paintmix::Colors {

namespace {

// Channel totals run to 3 * ONE and do not fit a channel value_type.
template <ChannelPrecision P>
double round_total(double total)
{
    if constexpr (P::integral) {
        return std::floor(total + 0.5);
    } else {
        return total;
    }
}

} // namespace

template <ChannelPrecision P>
Hue<P> Hue<P>::from_angle(double angle)
{
    if (std::isnan(angle)) {
        return Hue({0, 1, 2}, P::ONE, angle, 1.0);
    }
    assert(std::fabs(angle) <= M_PI + 1e-9);

    auto calc_other = [](double oa) {
        double scale = std::sin(oa) / std::sin(Util::PI_120 - oa);
        return P::round(std::clamp(P::ONE * scale, 0.0, static_cast<double>(P::ONE)));
    };
    double const aha = std::fabs(angle);
    value_type other;
    std::array<unsigned int, 3> io;
    if (aha <= Util::PI_60) {
        other = calc_other(aha);
        io = angle >= 0 ? std::array<unsigned int, 3>{0, 1, 2} : std::array<unsigned int, 3>{0, 2, 1};
    } else if (aha <= Util::PI_120) {
        other = calc_other(Util::PI_120 - aha);
        io = angle >= 0 ? std::array<unsigned int, 3>{1, 0, 2} : std::array<unsigned int, 3>{2, 0, 1};
    } else {
        other = calc_other(aha - Util::PI_120);
        io = angle >= 0 ? std::array<unsigned int, 3>{1, 2, 0} : std::array<unsigned int, 3>{2, 1, 0};
    }
    double const a = P::ONE;
    double const b = other;
    // exact at the corners, the formula drifts near 1
    double cc = (other == P::ONE || other == P::ZERO) ? 1.0 : a / std::sqrt(a * a + b * b - a * b);
    return Hue(io, other, angle, cc);
}

/**
 * The fully saturated colour of this hue, white for grey.
 */
template <ChannelPrecision P>
RGB<P> Hue<P>::rgb() const
{
    if (is_grey()) {
        return RGB<P>::white();
    }
    std::array<value_type, 3> result = {P::ZERO, P::ZERO, P::ZERO};
    result[_io[0]] = P::ONE;
    result[_io[1]] = _other;
    return RGB<P>(result[0], result[1], result[2]);
}

/**
 * The value of the fully saturated colour of this hue.
 */
template <ChannelPrecision P>
double Hue<P>::max_chroma_value() const
{
    return (static_cast<double>(P::ONE) + _other) / (3.0 * P::ONE);
}

/**
 * The highest chroma a colour of this hue can have when its channels add up to total.
 */
template <ChannelPrecision P>
double Hue<P>::max_chroma_for_total(double total) const
{
    if (is_grey()) {
        return std::min(1.0, total / (3.0 * P::ONE));
    }
    double const mct = static_cast<double>(P::ONE) + _other;
    if (mct > total) {
        return total / mct;
    }
    return (3.0 * P::ONE - total) / (2.0 * P::ONE - _other);
}

/**
 * Return the RGB of this hue with the given channel total.
 *
 * Totals above the saturated colour move towards white through the weakest channel.
 */
template <ChannelPrecision P>
RGB<P> Hue<P>::rgb_with_total(double total) const
{
    double const req_total = std::clamp(total, 0.0, 3.0 * P::ONE);
    if (is_grey()) {
        double val = req_total / 3.0;
        return RGB<P>::from_clamped(val, val, val);
    }
    double const cur_total = static_cast<double>(P::ONE) + _other;
    double const shortfall = req_total - cur_total;
    std::array<double, 3> result = {0.0, 0.0, 0.0};
    if (shortfall == 0) {
        return rgb();
    } else if (shortfall < 0) {
        result[_io[0]] = P::round(P::ONE * req_total / cur_total);
        result[_io[1]] = P::round(_other * req_total / cur_total);
    } else {
        result[_io[0]] = P::ONE;
        // the weakest channel is the simpler one to work out
        result[_io[2]] = P::round((shortfall * P::ONE) / (2.0 * P::ONE - _other));
        result[_io[1]] = _other + shortfall - result[_io[2]];
    }
    return RGB<P>::from_clamped(result[0], result[1], result[2]);
}

template <ChannelPrecision P>
RGB<P> Hue<P>::rgb_with_value(double value) const
{
    return rgb_with_total(round_total<P>(value * 3.0 * P::ONE));
}

template <ChannelPrecision P>
Hue<P> Hue<P>::rotated_by(double delta) const
{
    return from_angle(Util::normalize_angle(_angle + delta));
}

/**
 * The hexagon point of this hue at the given chroma, 0 < chroma <= 1.
 */
template <ChannelPrecision P>
Cartesian Hue<P>::xy_for_chroma(double chroma) const
{
    if (is_grey()) {
        return {0.0, 0.0};
    }
    double hypot = chroma * P::ONE / _chroma_correction;
    return Cartesian(Geom::Point::polar(_angle, hypot));
}

/**
 * Signed angle from other to this hue, NaN if either is grey.
 */
template <ChannelPrecision P>
double Hue<P>::difference(Hue const &other) const
{
    return Util::angle_difference(_angle, other._angle);
}

template <ChannelPrecision P>
bool Hue<P>::operator==(Hue const &other) const
{
    if (is_grey() || other.is_grey()) {
        return is_grey() && other.is_grey();
    }
    return _angle == other._angle;
}

template <ChannelPrecision P>
bool Hue<P>::operator<(Hue const &other) const
{
    if (is_grey()) {
        return !other.is_grey();
    }
    if (other.is_grey()) {
        return false;
    }
    return _angle < other._angle;
}

template class Hue<BPC8>;
template class Hue<BPC16>;
template class Hue<Proportion>;

} // namespace Paintmix::Colors
