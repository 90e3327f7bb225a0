// SPDX-License-Identifier: GPL-2.0-or-later
/**
 * Angle helpers for the colour hexagon.
 *
 * Copyright (C) 2024 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#ifndef PAINTMIX_UTIL_ANGLE_H
#define PAINTMIX_UTIL_ANGLE_H

#include <cmath>

namespace Paintmix::Util {

inline constexpr double PI_60 = M_PI / 3.0;
inline constexpr double PI_120 = 2.0 * M_PI / 3.0;
inline constexpr double PI_180 = M_PI;

// cos(120deg) computed by the library is slightly out, the exact value keeps the hexagon closed.
inline constexpr double COS_120 = -0.5;
inline double const SIN_60 = std::sin(PI_60);
inline double const SIN_120 = std::sin(PI_120);

/**
 * \return the angle normalised into the half open range (-pi, pi].
 *
 * NaN is passed through, it marks the hue of a grey.
 */
inline double normalize_angle(double angle)
{
    if (std::isnan(angle)) {
        return angle;
    }
    double result = std::remainder(angle, 2.0 * M_PI);
    if (result <= -M_PI) {
        result += 2.0 * M_PI;
    }
    return result;
}

/// Returns the signed difference \a a - \a b normalised into (-pi, pi].
inline double angle_difference(double a, double b)
{
    return normalize_angle(a - b);
}

} // namespace Paintmix::Util

#endif // PAINTMIX_UTIL_ANGLE_H

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
