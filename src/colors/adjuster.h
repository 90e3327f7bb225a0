// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Colour editing in user sized steps.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_COLORS_ADJUSTER_H
#define SEEN_COLORS_ADJUSTER_H

#include <sigc++/scoped_connection.h>

#include "colors/manipulator.h"
#include "util/settings.h"

namespace Paintmix::Colors {

/**
 * Drives an RGBManipulator with the step sizes and colour wheel direction of the settings.
 *
 * Every action returns false when the colour is already at the limit, so the caller can
 * tell the user nothing happened.
 */
class ColourAdjuster
{
public:
    using StepSize = Util::StepSize;

    explicit ColourAdjuster(Util::Settings &settings = Util::Settings::get());

    RGBManipulator &manipulator() { return _manipulator; }
    RGBManipulator const &manipulator() const { return _manipulator; }

    template <ChannelPrecision P>
    void set_rgb(RGB<P> const &rgb)
    {
        _manipulator.set_rgb(rgb);
    }
    template <ChannelPrecision P>
    RGB<P> get_rgb() const
    {
        return _manipulator.get_rgb<P>();
    }

    bool lighten(StepSize size = StepSize::Normal);
    bool darken(StepSize size = StepSize::Normal);
    bool increase_greyness(StepSize size = StepSize::Normal);
    bool decrease_greyness(StepSize size = StepSize::Normal);
    bool rotate_clockwise(StepSize size = StepSize::Normal);
    bool rotate_anticlockwise(StepSize size = StepSize::Normal);

private:
    Util::Settings &_settings;
    RGBManipulator _manipulator;
    sigc::scoped_connection _settings_changed;
};

} // namespace Paintmix::Colors

#endif // SEEN_COLORS_ADJUSTER_H
