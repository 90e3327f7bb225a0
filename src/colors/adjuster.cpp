// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Colour editing in user sized steps.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "adjuster.h"

namespace Paintmix::Colors {

ColourAdjuster::ColourAdjuster(Util::Settings &settings)
    : _settings(settings)
{
    _manipulator.set_reference_hue(_settings.reference_hue());
    _settings_changed = _settings.signal_changed.connect(
        [this]() { _manipulator.set_reference_hue(_settings.reference_hue()); });
}

bool ColourAdjuster::lighten(StepSize size)
{
    return _manipulator.incr_value(_settings.value_step(size));
}

bool ColourAdjuster::darken(StepSize size)
{
    return _manipulator.decr_value(_settings.value_step(size));
}

bool ColourAdjuster::increase_greyness(StepSize size)
{
    return _manipulator.decr_chroma(_settings.chroma_step(size));
}

bool ColourAdjuster::decrease_greyness(StepSize size)
{
    return _manipulator.incr_chroma(_settings.chroma_step(size));
}

/**
 * Positive angles run from red towards yellow, which is anticlockwise unless the wheel is flipped.
 */
bool ColourAdjuster::rotate_clockwise(StepSize size)
{
    double delta = _settings.hue_step(size);
    return _manipulator.rotate_hue(_settings.red_to_yellow_clockwise() ? delta : -delta);
}

bool ColourAdjuster::rotate_anticlockwise(StepSize size)
{
    double delta = _settings.hue_step(size);
    return _manipulator.rotate_hue(_settings.red_to_yellow_clockwise() ? -delta : delta);
}

} // namespace Paintmix::Colors
