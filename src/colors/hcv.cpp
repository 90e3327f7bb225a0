// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Painterly views of an RGB colour: hue, chroma, value and warmth.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "hcv.h"

#include <algorithm>
#include <2geom/coord.h>

#include "colors/cartesian.h"

namespace Paintmix::Colors {

template <ChannelPrecision P>
HCV<P>::HCV(RGB<P> const &rgb)
    : _rgb(rgb)
    , _value(rgb.value())
    , _hue(Hue<P>::from_rgb(rgb))
{
    auto xy = Cartesian::from_rgb(rgb);
    _chroma = std::min(1.0, xy.hypot() * _hue.chroma_correction() / P::ONE);
    _x = xy.x();
}

/**
 * The colour of this hue at the given value, our own value if none.
 */
template <ChannelPrecision P>
RGB<P> HCV<P>::hue_rgb_for_value(std::optional<double> value) const
{
    return _hue.rgb_with_value(value.value_or(_value));
}

/**
 * The grey reached by adding white or black, whichever is quicker, until no chroma is left.
 */
template <ChannelPrecision P>
RGB<P> HCV<P>::zero_chroma_rgb() const
{
    if (_hue.is_grey()) {
        return value_rgb();
    }
    double const mcv = _hue.max_chroma_value();
    double const dc = 1.0 - _chroma;
    if (dc != 0.0) {
        return RGB<P>::white() * std::clamp((_value - mcv * _chroma) / dc, 0.0, 1.0);
    }
    return mcv < 0.5 ? RGB<P>::black() : RGB<P>::white();
}

/**
 * Whether this colour is lighter (white) or darker (black) than the pure colour of its hue.
 */
template <ChannelPrecision P>
RGB<P> HCV<P>::chroma_side() const
{
    return _rgb.sum() > _hue.rgb().sum() ? RGB<P>::white() : RGB<P>::black();
}

/**
 * Rotate the hue keeping value, and chroma where the hue allows it.
 */
template <ChannelPrecision P>
RGB<P> HCV<P>::get_rotated_rgb(double delta) const
{
    if (_rgb.non_zero_components() == 2) {
        // no grey here, only add what keeping the value needs
        return _hue.rotated_by(delta).rgb_with_value(_value);
    }
    return _rgb.rotated(delta);
}

template <ChannelPrecision P>
HCVW<P>::HCVW(RGB<P> const &rgb)
    : HCV<P>(rgb)
{
    if constexpr (P::integral) {
        _warmth = std::floor(this->_x + 0.5) / P::ONE;
    } else {
        _warmth = this->_x / P::ONE;
    }
}

template <ChannelPrecision P>
RGB<P> HCVW<P>::warmth_rgb() const
{
    double const t = (1.0 + _warmth) / 2.0;
    auto const cyan = RGB<P>::cyan();
    auto const red = RGB<P>::red();
    return RGB<P>::from_clamped(Geom::lerp(t, static_cast<double>(cyan[0]), static_cast<double>(red[0])),
                                Geom::lerp(t, static_cast<double>(cyan[1]), static_cast<double>(red[1])),
                                Geom::lerp(t, static_cast<double>(cyan[2]), static_cast<double>(red[2])));
}

template class HCV<BPC8>;
template class HCV<BPC16>;
template class HCV<Proportion>;
template class HCVW<BPC8>;
template class HCVW<BPC16>;
template class HCVW<Proportion>;

} // namespace Paintmix::Colors
