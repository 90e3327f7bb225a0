// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Stepwise editing of a colour by value, chroma and hue.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_COLORS_MANIPULATOR_H
#define SEEN_COLORS_MANIPULATOR_H

#include <sigc++/signal.h>

#include "colors/cartesian.h"
#include "colors/hue.h"
#include "colors/rgb.h"

namespace Paintmix::Colors {

/**
 * A mutable colour cursor. Each edit keeps the other attributes as close to unchanged as
 * the RGB cube allows and returns false, without touching the colour, when it is already
 * at the limit it was asked to move past.
 *
 * The last real hue is remembered so that a colour which passed through grey can regain it.
 */
class RGBManipulator
{
public:
    static constexpr double DEFAULT_REFERENCE_HUE = M_PI / 2.0;

    RGBManipulator();
    template <ChannelPrecision P>
    explicit RGBManipulator(RGB<P> const &rgb)
        : RGBManipulator()
    {
        set_rgb(rgb);
    }

    // Copying would duplicate the connections of signal_changed
    RGBManipulator(RGBManipulator const &) = delete;
    RGBManipulator &operator=(RGBManipulator const &) = delete;

    template <ChannelPrecision P>
    void set_rgb(RGB<P> const &rgb)
    {
        _set_rgb(rgb.template converted<Proportion>());
        _last_hue = _hue;
        signal_changed.emit();
    }

    template <ChannelPrecision P>
    RGB<P> get_rgb() const
    {
        return _rgb.template converted<P>();
    }

    double value() const { return _value; }
    double chroma() const { return _chroma; }
    Hue<Proportion> const &hue() const { return _hue; }
    Hue<Proportion> const &last_hue() const { return _last_hue; }

    double reference_hue() const { return _reference_hue; }
    void set_reference_hue(double angle);

    bool decr_value(double delta);
    bool incr_value(double delta);
    bool decr_chroma(double delta);
    bool incr_chroma(double delta);
    bool rotate_hue(double delta);

    sigc::signal<void()> signal_changed;

private:
    void _set_rgb(RGB<Proportion> const &rgb);
    void _set_from_value(double new_value);
    void _set_from_chroma(double new_chroma);
    void _set_base_plus_grey(RGB<Proportion> const &base, double grey);
    void _changed();

    double _min_value_for_current_hc() const { return _base_rgb.value(); }
    double _max_value_for_current_hc() const;

    RGB<Proportion> _rgb;
    RGB<Proportion> _base_rgb;
    Cartesian _xy = {0.0, 0.0};
    Hue<Proportion> _hue = Hue<Proportion>::grey();
    Hue<Proportion> _last_hue = Hue<Proportion>::grey();
    double _value = 0.0;
    double _chroma = 0.0;
    double _reference_hue = DEFAULT_REFERENCE_HUE;
};

} // namespace Paintmix::Colors

#endif // SEEN_COLORS_MANIPULATOR_H
