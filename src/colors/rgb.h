// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * An additive red, green, blue triple in one channel precision.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_COLORS_RGB_H
#define SEEN_COLORS_RGB_H

#include <array>
#include <cassert>
#include <ostream>
#include <vector>

#include "colors/channel.h"

namespace Paintmix::Colors {

template <ChannelPrecision P>
class RGB
{
public:
    using value_type = typename P::value_type;
    using wide_type = typename P::wide_type;

    RGB() = default;
    RGB(value_type r, value_type g, value_type b)
        : _values{r, g, b}
    {
        assert(is_valid_channel(r) && is_valid_channel(g) && is_valid_channel(b));
    }

    static RGB from_clamped(double r, double g, double b);
    static bool is_valid_channel(double value) { return value >= P::ZERO && value <= P::ONE; }

    bool operator==(RGB const &other) const = default;
    value_type operator[](unsigned int index) const { return _values[index]; }
    std::array<value_type, 3> const &getValues() const { return _values; }

    // Every resulting channel must lie within ZERO to ONE.
    RGB operator+(RGB const &other) const;
    RGB operator-(RGB const &other) const;
    RGB operator*(double scalar) const;
    RGB operator/(double scalar) const;

    template <ChannelPrecision Q>
    RGB<Q> converted() const
    {
        return RGB<Q>(convert_channel<P, Q>(_values[0]), convert_channel<P, Q>(_values[1]),
                      convert_channel<P, Q>(_values[2]));
    }

    wide_type sum() const;
    double value() const;
    unsigned int non_zero_components() const;
    std::array<unsigned int, 3> indices_value_order() const;

    bool best_foreground_is_black(double threshold = 0.5) const;
    RGB best_foreground(double threshold = 0.5) const;

    RGB rotated(double delta) const;

    static RGB black() { return {P::ZERO, P::ZERO, P::ZERO}; }
    static RGB white() { return {P::ONE, P::ONE, P::ONE}; }
    static RGB red() { return {P::ONE, P::ZERO, P::ZERO}; }
    static RGB green() { return {P::ZERO, P::ONE, P::ZERO}; }
    static RGB blue() { return {P::ZERO, P::ZERO, P::ONE}; }
    static RGB cyan() { return {P::ZERO, P::ONE, P::ONE}; }
    static RGB magenta() { return {P::ONE, P::ZERO, P::ONE}; }
    static RGB yellow() { return {P::ONE, P::ONE, P::ZERO}; }
    static std::vector<RGB> ideal_colours();

private:
    std::array<value_type, 3> _values = {P::ZERO, P::ZERO, P::ZERO};
};

template <ChannelPrecision P>
std::ostream &operator<<(std::ostream &os, RGB<P> const &rgb)
{
    if constexpr (P::integral) {
        return os << "RGB(" << +rgb[0] << ", " << +rgb[1] << ", " << +rgb[2] << ")";
    } else {
        return os << "RGB(" << rgb[0] << ", " << rgb[1] << ", " << rgb[2] << ")";
    }
}

extern template class RGB<BPC8>;
extern template class RGB<BPC16>;
extern template class RGB<Proportion>;

} // namespace Paintmix::Colors

#endif // SEEN_COLORS_RGB_H
