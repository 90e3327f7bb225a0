// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * User options for colour editing and collection loading, kept in a key file.
 *
 * Copyright (C) 2024 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef PAINTMIX_UTIL_SETTINGS_H
#define PAINTMIX_UTIL_SETTINGS_H

#include <array>
#include <string>
#include <vector>

#include <sigc++/signal.h>

namespace Paintmix::Util {

enum class StepSize
{
    Fine,
    Normal,
    Coarse,
};

/**
 * Settings are read from and written to a GLib key file:
 *
 * \code
 * [manipulator]
 * value_steps=0.0025;0.005;0.01;
 * chroma_steps=0.0025;0.005;0.01;
 * hue_step_divisors=200;100;50;
 * reference_hue=90
 *
 * [colour_wheel]
 * red_to_yellow_clockwise=false
 *
 * [collections]
 * series_files=...
 * standard_files=...
 * \endcode
 *
 * Keys that are missing keep their defaults.
 */
class Settings
{
public:
    Settings() = default;
    Settings(Settings const &) = delete;
    Settings &operator=(Settings const &) = delete;

    static Settings &get();

    bool load(std::string const &filename);
    bool save(std::string const &filename) const;
    void reset();

    double value_step(StepSize size) const { return _value_steps[index(size)]; }
    double chroma_step(StepSize size) const { return _chroma_steps[index(size)]; }
    double hue_step(StepSize size) const;

    void set_value_steps(std::array<double, 3> const &steps);
    void set_chroma_steps(std::array<double, 3> const &steps);
    void set_hue_step_divisors(std::array<double, 3> const &divisors);

    /// Angle in radians a grey colour leaves towards when no hue is known.
    double reference_hue() const;
    double reference_hue_degrees() const { return _reference_hue; }
    void set_reference_hue_degrees(double degrees);

    bool red_to_yellow_clockwise() const { return _red_to_yellow_clockwise; }
    void set_red_to_yellow_clockwise(bool clockwise);

    std::vector<std::string> const &series_files() const { return _series_files; }
    std::vector<std::string> const &standard_files() const { return _standard_files; }
    void set_series_files(std::vector<std::string> files);
    void set_standard_files(std::vector<std::string> files);

    sigc::signal<void()> signal_changed;

private:
    static unsigned index(StepSize size) { return static_cast<unsigned>(size); }

    std::array<double, 3> _value_steps = {0.0025, 0.005, 0.01};
    std::array<double, 3> _chroma_steps = {0.0025, 0.005, 0.01};
    std::array<double, 3> _hue_step_divisors = {200.0, 100.0, 50.0};
    double _reference_hue = 90.0;
    bool _red_to_yellow_clockwise = false;
    std::vector<std::string> _series_files;
    std::vector<std::string> _standard_files;
};

} // namespace Paintmix::Util

#endif // PAINTMIX_UTIL_SETTINGS_H
