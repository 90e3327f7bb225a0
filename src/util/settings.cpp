// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * User options for colour editing and collection loading, kept in a key file.
 *
 * Copyright (C) 2024 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include "settings.h"

#include <algorithm>
#include <cmath>
#include <glib.h>
#include <glibmm/keyfile.h>
#include <glibmm/ustring.h>
#include <2geom/angle.h>

namespace Paintmix::Util {

namespace {

Glib::ustring const MANIPULATOR = "manipulator";
Glib::ustring const COLOUR_WHEEL = "colour_wheel";
Glib::ustring const COLLECTIONS = "collections";

bool read_triple(Glib::RefPtr<Glib::KeyFile> const &keyfile, Glib::ustring const &group, Glib::ustring const &key,
                 std::array<double, 3> &out)
{
    if (!keyfile->has_key(group, key)) {
        return false;
    }
    auto values = keyfile->get_double_list(group, key);
    if (values.size() != out.size() || std::any_of(values.begin(), values.end(), [](double v) { return v <= 0.0; })) {
        g_warning("Settings: ignoring '%s' in [%s], three positive numbers expected", key.c_str(), group.c_str());
        return false;
    }
    std::copy(values.begin(), values.end(), out.begin());
    return true;
}

std::vector<std::string> read_files(Glib::RefPtr<Glib::KeyFile> const &keyfile, Glib::ustring const &key)
{
    std::vector<std::string> files;
    if (keyfile->has_key(COLLECTIONS, key)) {
        for (auto const &file : keyfile->get_string_list(COLLECTIONS, key)) {
            files.emplace_back(file.raw());
        }
    }
    return files;
}

std::vector<double> to_list(std::array<double, 3> const &values)
{
    return std::vector<double>(values.begin(), values.end());
}

std::vector<Glib::ustring> to_ustrings(std::vector<std::string> const &files)
{
    return std::vector<Glib::ustring>(files.begin(), files.end());
}

} // namespace

Settings &Settings::get()
{
    static Settings instance;
    return instance;
}

/**
 * Read settings from filename, values missing from the file are left alone.
 *
 * @returns false if the file could not be read.
 */
bool Settings::load(std::string const &filename)
{
    try {
        auto keyfile = Glib::KeyFile::create();
        if (!keyfile->load_from_file(filename)) {
            return false;
        }
        if (keyfile->has_group(MANIPULATOR)) {
            read_triple(keyfile, MANIPULATOR, "value_steps", _value_steps);
            read_triple(keyfile, MANIPULATOR, "chroma_steps", _chroma_steps);
            read_triple(keyfile, MANIPULATOR, "hue_step_divisors", _hue_step_divisors);
            if (keyfile->has_key(MANIPULATOR, "reference_hue")) {
                _reference_hue = keyfile->get_double(MANIPULATOR, "reference_hue");
            }
        }
        if (keyfile->has_group(COLOUR_WHEEL) && keyfile->has_key(COLOUR_WHEEL, "red_to_yellow_clockwise")) {
            _red_to_yellow_clockwise = keyfile->get_boolean(COLOUR_WHEEL, "red_to_yellow_clockwise");
        }
        if (keyfile->has_group(COLLECTIONS)) {
            _series_files = read_files(keyfile, "series_files");
            _standard_files = read_files(keyfile, "standard_files");
        }
    } catch (Glib::Error const &error) {
        g_warning("Settings not loaded from '%s': %s", filename.c_str(), error.what());
        return false;
    }
    signal_changed.emit();
    return true;
}

bool Settings::save(std::string const &filename) const
{
    try {
        auto keyfile = Glib::KeyFile::create();
        keyfile->set_double_list(MANIPULATOR, "value_steps", to_list(_value_steps));
        keyfile->set_double_list(MANIPULATOR, "chroma_steps", to_list(_chroma_steps));
        keyfile->set_double_list(MANIPULATOR, "hue_step_divisors", to_list(_hue_step_divisors));
        keyfile->set_double(MANIPULATOR, "reference_hue", _reference_hue);
        keyfile->set_boolean(COLOUR_WHEEL, "red_to_yellow_clockwise", _red_to_yellow_clockwise);
        keyfile->set_string_list(COLLECTIONS, "series_files", to_ustrings(_series_files));
        keyfile->set_string_list(COLLECTIONS, "standard_files", to_ustrings(_standard_files));
        return keyfile->save_to_file(filename);
    } catch (Glib::Error const &error) {
        g_warning("Settings not saved to '%s': %s", filename.c_str(), error.what());
    }
    return false;
}

void Settings::reset()
{
    _value_steps = {0.0025, 0.005, 0.01};
    _chroma_steps = {0.0025, 0.005, 0.01};
    _hue_step_divisors = {200.0, 100.0, 50.0};
    _reference_hue = 90.0;
    _red_to_yellow_clockwise = false;
    _series_files.clear();
    _standard_files.clear();
    signal_changed.emit();
}

/**
 * Hue steps are fractions of half a turn.
 */
double Settings::hue_step(StepSize size) const
{
    return M_PI / _hue_step_divisors[index(size)];
}

void Settings::set_value_steps(std::array<double, 3> const &steps)
{
    _value_steps = steps;
    signal_changed.emit();
}

void Settings::set_chroma_steps(std::array<double, 3> const &steps)
{
    _chroma_steps = steps;
    signal_changed.emit();
}

void Settings::set_hue_step_divisors(std::array<double, 3> const &divisors)
{
    _hue_step_divisors = divisors;
    signal_changed.emit();
}

double Settings::reference_hue() const
{
    return Geom::rad_from_deg(_reference_hue);
}

void Settings::set_reference_hue_degrees(double degrees)
{
    _reference_hue = degrees;
    signal_changed.emit();
}

void Settings::set_red_to_yellow_clockwise(bool clockwise)
{
    _red_to_yellow_clockwise = clockwise;
    signal_changed.emit();
}

void Settings::set_series_files(std::vector<std::string> files)
{
    _series_files = std::move(files);
    signal_changed.emit();
}

void Settings::set_standard_files(std::vector<std::string> files)
{
    _standard_files = std::move(files);
    signal_changed.emit();
}

} // namespace Paintmix::Util
