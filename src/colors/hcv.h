// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Painterly views of an RGB colour: hue, chroma, value and warmth.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_COLORS_HCV_H
#define SEEN_COLORS_HCV_H

#include <optional>
#include <ostream>

#include "colors/hue.h"
#include "colors/rgb.h"

namespace Paintmix::Colors {

/**
 * Hue, chroma and value of an RGB, worked out once on construction.
 */
template <ChannelPrecision P>
class HCV
{
public:
    explicit HCV(RGB<P> const &rgb);
    virtual ~HCV() = default;

    bool operator==(HCV const &other) const { return _rgb == other._rgb; }

    RGB<P> const &rgb() const { return _rgb; }
    double value() const { return _value; }
    Hue<P> const &hue() const { return _hue; }
    double chroma() const { return _chroma; }

    RGB<P> hue_rgb() const { return _hue.rgb(); }
    RGB<P> value_rgb() const { return RGB<P>::white() * _value; }
    RGB<P> hue_rgb_for_value(std::optional<double> value = {}) const;
    RGB<P> zero_chroma_rgb() const;
    RGB<P> chroma_side() const;
    RGB<P> get_rotated_rgb(double delta) const;

protected:
    RGB<P> _rgb;
    double _value = 0.0;
    Hue<P> _hue;
    double _chroma = 0.0;
    double _x = 0.0;
};

/**
 * Adds warmth, the position of the colour along the cyan to red axis, -1 to 1.
 */
template <ChannelPrecision P>
class HCVW : public HCV<P>
{
public:
    explicit HCVW(RGB<P> const &rgb);

    double warmth() const { return _warmth; }
    RGB<P> warmth_rgb() const;

private:
    double _warmth = 0.0;
};

template <ChannelPrecision P>
std::ostream &operator<<(std::ostream &os, HCV<P> const &hcv)
{
    return os << "(HUE = " << hcv.hue_rgb() << ", VALUE = " << hcv.value() << ", CHROMA = " << hcv.chroma() << ")";
}

extern template class HCV<BPC8>;
extern template class HCV<BPC16>;
extern template class HCV<Proportion>;
extern template class HCVW<BPC8>;
extern template class HCVW<BPC16>;
extern template class HCVW<Proportion>;

} // namespace Paintmix::Colors

#endif // SEEN_COLORS_HCV_H
