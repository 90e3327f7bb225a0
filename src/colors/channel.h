// SPDX-License-Identifier: GPL-2.0-or-later
/** @file
 * Numeric domains for a single colour channel.
 *//*
 * Copyright (C) 2024 Authors
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */
#ifndef SEEN_COLORS_CHANNEL_H
#define SEEN_COLORS_CHANNEL_H

#include <concepts>
#include <cstdint>

namespace Paintmix::Colors {

/**
 * An unsigned fixed width channel, 0 to 2^bits - 1.
 *
 * Arithmetic that may leave the channel range is done in wide_type.
 */
template <std::unsigned_integral T, unsigned BITS>
struct FixedChannel
{
    using value_type = T;
    using wide_type = std::int64_t;

    static constexpr bool integral = true;
    static constexpr unsigned bits = BITS;
    static constexpr value_type ZERO = 0;
    static constexpr value_type ONE = static_cast<value_type>((1u << BITS) - 1);

    static value_type round(double x) { return static_cast<value_type>(x + 0.5); }
};

/**
 * A real valued channel, 0.0 to 1.0, rounding is the identity.
 */
struct Proportion
{
    using value_type = double;
    using wide_type = double;

    static constexpr bool integral = false;
    static constexpr value_type ZERO = 0.0;
    static constexpr value_type ONE = 1.0;

    static value_type round(double x) { return x; }
};

using BPC8 = FixedChannel<std::uint8_t, 8>;
using BPC16 = FixedChannel<std::uint16_t, 16>;

template <typename P>
concept ChannelPrecision = requires(double x) {
    typename P::value_type;
    typename P::wide_type;
    { P::integral } -> std::convertible_to<bool>;
    { P::ZERO } -> std::convertible_to<typename P::value_type>;
    { P::ONE } -> std::convertible_to<typename P::value_type>;
    { P::round(x) } -> std::same_as<typename P::value_type>;
};

/**
 * Convert one channel value from precision P to precision Q.
 */
template <ChannelPrecision P, ChannelPrecision Q>
typename Q::value_type convert_channel(typename P::value_type value)
{
    return Q::round(static_cast<double>(value) * Q::ONE / P::ONE);
}

} // namespace Paintmix::Colors

#endif // SEEN_COLORS_CHANNEL_H
