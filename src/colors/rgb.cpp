// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Arithmetic on red, green, blue triples.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "rgb.h"

#include <algorithm>
#include <cassert>
#include <cmath>

#include "util/angle.h"

namespace Paintmix::Colors {

namespace {

/**
 * Round three channel values of a convex combination so that the total is kept.
 *
 * Each channel is floored and the remaining units are handed to the channels with
 * the largest fractions, this is what keeps the value exact under hue rotation.
 */
template <ChannelPrecision P>
RGB<P> round_preserving_sum(std::array<double, 3> raw, typename P::wide_type total)
{
    std::array<typename P::wide_type, 3> floors;
    std::array<double, 3> fractions;
    typename P::wide_type floor_total = 0;
    for (unsigned i = 0; i < 3; i++) {
        raw[i] = std::clamp(raw[i], 0.0, static_cast<double>(P::ONE));
        floors[i] = static_cast<typename P::wide_type>(std::floor(raw[i]));
        fractions[i] = raw[i] - floors[i];
        floor_total += floors[i];
    }
    std::array<unsigned, 3> order = {0, 1, 2};
    std::stable_sort(order.begin(), order.end(), [&](unsigned a, unsigned b) { return fractions[a] > fractions[b]; });
    auto remainder = total - floor_total;
    for (unsigned i : order) {
        if (remainder <= 0) {
            break;
        }
        if (floors[i] < P::ONE) {
            floors[i] += 1;
            remainder -= 1;
        }
    }
    return RGB<P>(floors[0], floors[1], floors[2]);
}

/**
 * Round a channel computed in double, which must already lie in the channel range.
 */
template <ChannelPrecision P>
typename P::value_type round_channel(double x)
{
    if constexpr (P::integral) {
        assert(x > -0.5 && x < P::ONE + 0.5);
    } else {
        assert(x >= P::ZERO && x <= P::ONE);
    }
    return P::round(std::clamp(x, 0.0, static_cast<double>(P::ONE)));
}

} // namespace

template <ChannelPrecision P>
RGB<P> RGB<P>::from_clamped(double r, double g, double b)
{
    auto clamp = [](double x) { return P::round(std::clamp(x, 0.0, static_cast<double>(P::ONE))); };
    return RGB(clamp(r), clamp(g), clamp(b));
}

template <ChannelPrecision P>
RGB<P> RGB<P>::operator+(RGB const &other) const
{
    return RGB(round_channel<P>(static_cast<double>(_values[0]) + other._values[0]),
               round_channel<P>(static_cast<double>(_values[1]) + other._values[1]),
               round_channel<P>(static_cast<double>(_values[2]) + other._values[2]));
}

template <ChannelPrecision P>
RGB<P> RGB<P>::operator-(RGB const &other) const
{
    assert(_values[0] >= other._values[0] && _values[1] >= other._values[1] && _values[2] >= other._values[2]);
    return RGB(round_channel<P>(static_cast<double>(_values[0]) - other._values[0]),
               round_channel<P>(static_cast<double>(_values[1]) - other._values[1]),
               round_channel<P>(static_cast<double>(_values[2]) - other._values[2]));
}

template <ChannelPrecision P>
RGB<P> RGB<P>::operator*(double scalar) const
{
    assert(scalar >= 0.0);
    return RGB(round_channel<P>(_values[0] * scalar), round_channel<P>(_values[1] * scalar),
               round_channel<P>(_values[2] * scalar));
}

template <ChannelPrecision P>
RGB<P> RGB<P>::operator/(double scalar) const
{
    assert(scalar > 0.0);
    return RGB(round_channel<P>(_values[0] / scalar), round_channel<P>(_values[1] / scalar),
               round_channel<P>(_values[2] / scalar));
}

/**
 * The exact total of the three channels.
 */
template <ChannelPrecision P>
typename RGB<P>::wide_type RGB<P>::sum() const
{
    return static_cast<wide_type>(_values[0]) + _values[1] + _values[2];
}

/**
 * Mean of the three channels as a proportion of ONE.
 */
template <ChannelPrecision P>
double RGB<P>::value() const
{
    return static_cast<double>(sum()) / (3.0 * P::ONE);
}

template <ChannelPrecision P>
unsigned int RGB<P>::non_zero_components() const
{
    return std::count_if(_values.begin(), _values.end(), [](value_type v) { return v != P::ZERO; });
}

/**
 * Return the channel indices ordered by descending channel value.
 */
template <ChannelPrecision P>
std::array<unsigned int, 3> RGB<P>::indices_value_order() const
{
    auto const &[r, g, b] = _values;
    if (r > g) {
        if (r > b) {
            return g > b ? std::array<unsigned int, 3>{0, 1, 2} : std::array<unsigned int, 3>{0, 2, 1};
        }
        return {2, 0, 1};
    }
    if (g > b) {
        return r > b ? std::array<unsigned int, 3>{1, 0, 2} : std::array<unsigned int, 3>{1, 2, 0};
    }
    return {2, 1, 0};
}

/**
 * Is black text more readable than white on this colour.
 */
template <ChannelPrecision P>
bool RGB<P>::best_foreground_is_black(double threshold) const
{
    return (_values[0] * 0.299 + _values[1] * 0.587 + _values[2] * 0.114) > P::ONE * threshold;
}

template <ChannelPrecision P>
RGB<P> RGB<P>::best_foreground(double threshold) const
{
    return best_foreground_is_black(threshold) ? black() : white();
}

/**
 * Return a copy with the hue angle rotated by delta radians.
 *
 * The value is unchanged. Chroma is only kept when one or three channels are non zero,
 * colours with two non zero channels should be rotated through their Hue instead.
 */
template <ChannelPrecision P>
RGB<P> RGB<P>::rotated(double delta) const
{
    delta = Util::normalize_angle(delta);
    if (delta == 0.0) {
        return *this;
    }
    double k1 = 0.0;
    double k2 = 0.0;
    auto calc_ks = [&](double angle) {
        double a = std::sin(angle);
        double b = std::sin(Util::PI_120 - angle);
        k1 = b / (a + b);
        k2 = a / (a + b);
    };
    auto f = [&](unsigned c1, unsigned c2) { return _values[c1] * k1 + _values[c2] * k2; };

    std::array<double, 3> raw;
    if (delta > 0) {
        if (delta > Util::PI_120) {
            calc_ks(delta - Util::PI_120);
            raw = {f(2, 1), f(0, 2), f(1, 0)};
        } else {
            calc_ks(delta);
            raw = {f(0, 2), f(1, 0), f(2, 1)};
        }
    } else {
        if (delta < -Util::PI_120) {
            calc_ks(std::fabs(delta) - Util::PI_120);
            raw = {f(1, 2), f(2, 0), f(0, 1)};
        } else {
            calc_ks(std::fabs(delta));
            raw = {f(0, 1), f(1, 2), f(2, 0)};
        }
    }
    if constexpr (P::integral) {
        return round_preserving_sum<P>(raw, sum());
    } else {
        return from_clamped(raw[0], raw[1], raw[2]);
    }
}

/**
 * The eight corners of the RGB cube, ordered for display around a wheel.
 */
template <ChannelPrecision P>
std::vector<RGB<P>> RGB<P>::ideal_colours()
{
    return {white(), magenta(), red(), yellow(), green(), cyan(), blue(), black()};
}

template class RGB<BPC8>;
template class RGB<BPC16>;
template class RGB<Proportion>;

} // namespace Paintmix::Colors

/*
  Local Variables:
  mode:c++
  c-file-style:"stroustrup"
  c-file-offsets:((innamespace . 0)(inline-open . 0)(cpp-macro . 0))
  indent-tabs-mode:nil
  fill-column:99
  End:
*/
// vim: filetype=cpp:expandtab:shiftwidth=4:tabstop=8:softtabstop=4:fileencoding=utf-8:textwidth=99 :
