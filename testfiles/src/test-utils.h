// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Shared test header for colour and paint tests
 *
 * Copyright (C) 2024 Authors
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <gtest/gtest.h>

#include "colors/rgb.h"

namespace {

/**
 * Allow the correct tracing of the file and line where data came from when using P_TESTs.
 */
struct traced_data
{
    const char *_file;
    const int _line;

    ::testing::ScopedTrace enable_scope() const { return ::testing::ScopedTrace(_file, _line, ""); }
};
// Macro for the above tracing in P Tests
#define _P(type, ...)                   \
    type                                \
    {                                   \
        __FILE__, __LINE__, __VA_ARGS__ \
    }

inline static ::testing::AssertionResult IsNear(double a, double b, double epsilon = 1e-9)
{
    if (std::fabs(a - b) <= epsilon) {
        return ::testing::AssertionSuccess();
    }
    return ::testing::AssertionFailure() << std::setprecision(12) << a << " != " << b << " (epsilon " << epsilon
                                         << ")";
}

/**
 * Test each channel of two colours is within a certain distance of the other.
 */
template <Paintmix::Colors::ChannelPrecision P>
inline static ::testing::AssertionResult ChannelsNear(Paintmix::Colors::RGB<P> const &a,
                                                      Paintmix::Colors::RGB<P> const &b, double epsilon)
{
    for (unsigned i = 0; i < 3; i++) {
        if (std::fabs(static_cast<double>(a[i]) - static_cast<double>(b[i])) > epsilon) {
            return ::testing::AssertionFailure() << "\n" << a << "\n != \n" << b;
        }
    }
    return ::testing::AssertionSuccess();
}

/**
 * Generate a random colour of the given precision.
 */
template <Paintmix::Colors::ChannelPrecision P>
inline static Paintmix::Colors::RGB<P> random_rgb()
{
    auto channel = [] { return P::round(static_cast<double>(std::rand()) / RAND_MAX * P::ONE); };
    auto r = channel();
    auto g = channel();
    auto b = channel();
    return {r, g, b};
}

} // namespace
