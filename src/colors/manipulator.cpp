// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Stepwise editing of a colour by value, chroma and hue.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "manipulator.h"

#include <algorithm>

#include "util/angle.h"

namespace Paintmix::Colors {

namespace {

double max_channel(RGB<Proportion> const &rgb)
{
    return std::max({rgb[0], rgb[1], rgb[2]});
}

} // namespace

RGBManipulator::RGBManipulator()
{
    _set_rgb(RGB<Proportion>::black());
}

/**
 * Set the hue used to leave grey when no real hue has been seen yet.
 */
void RGBManipulator::set_reference_hue(double angle)
{
    _reference_hue = Util::normalize_angle(angle);
}

void RGBManipulator::_set_rgb(RGB<Proportion> const &rgb)
{
    _rgb = rgb;
    _value = rgb.value();
    _xy = Cartesian::from_rgb(rgb);
    _base_rgb = _xy.simplest_rgb<Proportion>();
    _hue = Hue<Proportion>::from_angle(_xy.angle());
    _chroma = std::min(_xy.hypot() * _hue.chroma_correction(), 1.0);
}

void RGBManipulator::_changed()
{
    if (!_hue.is_grey()) {
        _last_hue = _hue;
    }
    signal_changed.emit();
}

/**
 * Add the same amount of grey to every channel of base.
 */
void RGBManipulator::_set_base_plus_grey(RGB<Proportion> const &base, double grey)
{
    _set_rgb(RGB<Proportion>::from_clamped(base[0] + grey, base[1] + grey, base[2] + grey));
}

double RGBManipulator::_max_value_for_current_hc() const
{
    return _base_rgb.value() + 1.0 - max_channel(_base_rgb);
}

/**
 * Move to the highest chroma the current hue supports at new_value.
 */
void RGBManipulator::_set_from_value(double new_value)
{
    double new_chroma = _hue.max_chroma_for_value(new_value);
    auto new_base = _hue.xy_for_chroma(new_chroma).simplest_rgb<Proportion>();
    _set_base_plus_grey(new_base, new_value - new_base.value());
}

/**
 * Scale the chroma keeping the hue, and the value where the hue allows it.
 */
void RGBManipulator::_set_from_chroma(double new_chroma)
{
    auto new_base = (_xy * (new_chroma / _chroma)).simplest_rgb<Proportion>();
    double delta = std::min(1.0 - max_channel(new_base), _value - new_base.value());
    if (delta > 0.0) {
        _set_base_plus_grey(new_base, delta);
    } else {
        _set_rgb(new_base);
    }
}

bool RGBManipulator::decr_value(double delta)
{
    if (_value <= 0.0) {
        return false;
    }
    double new_value = std::max(0.0, _value - delta);
    double min_value = _min_value_for_current_hc();
    if (new_value == 0.0) {
        _set_rgb(RGB<Proportion>::black());
    } else if (new_value < min_value) {
        _set_from_value(new_value);
    } else {
        _set_base_plus_grey(_base_rgb, new_value - min_value);
    }
    _changed();
    return true;
}

bool RGBManipulator::incr_value(double delta)
{
    if (_value >= 1.0) {
        return false;
    }
    double new_value = std::min(1.0, _value + delta);
    double max_value = _max_value_for_current_hc();
    if (new_value >= 1.0) {
        _set_rgb(RGB<Proportion>::white());
    } else if (new_value > max_value) {
        _set_from_value(new_value);
    } else {
        _set_base_plus_grey(_base_rgb, new_value - _min_value_for_current_hc());
    }
    _changed();
    return true;
}

bool RGBManipulator::decr_chroma(double delta)
{
    if (_chroma <= 0.0) {
        return false;
    }
    _set_from_chroma(std::max(0.0, _chroma - delta));
    _changed();
    return true;
}

bool RGBManipulator::incr_chroma(double delta)
{
    if (_chroma >= 1.0) {
        return false;
    }
    if (!_hue.is_grey()) {
        _set_from_chroma(std::min(1.0, _chroma + delta));
        _changed();
        return true;
    }

    auto const hue = _last_hue.is_grey() ? Hue<Proportion>::from_angle(_reference_hue) : _last_hue;
    if (_value <= 0.0 || _value >= 1.0) {
        auto new_base = hue.xy_for_chroma(std::min(1.0, delta)).simplest_rgb<Proportion>();
        if (_value <= 0.0) {
            _set_rgb(new_base);
        } else {
            _set_base_plus_grey(new_base, 1.0 - max_channel(new_base));
        }
    } else {
        double new_chroma = std::min(delta, hue.max_chroma_for_value(_value));
        auto new_base = hue.xy_for_chroma(new_chroma).simplest_rgb<Proportion>();
        _set_base_plus_grey(new_base, std::max(0.0, _value - new_base.value()));
    }
    _changed();
    return true;
}

bool RGBManipulator::rotate_hue(double delta)
{
    if (_hue.is_grey()) {
        return false;
    }
    auto new_base = _hue.rotated_by(delta).xy_for_chroma(_chroma).simplest_rgb<Proportion>();
    double grey = std::min(1.0 - max_channel(new_base), _value - new_base.value());
    if (grey > 0.0) {
        _set_base_plus_grey(new_base, grey);
    } else {
        _set_rgb(new_base);
    }
    _changed();
    return true;
}

} // namespace Paintmix::Colors
