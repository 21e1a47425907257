/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef PINWAVE_DIVISOR_HPP
#define PINWAVE_DIVISOR_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace Pinwave
{

/** Frequency in hertz. */
using Hertz = std::uint64_t;

// Without an exact match, oversampling is tried up to this factor...
constexpr std::uint64_t oversample_factor = 10;

// ...or further, as long as the oversampled frequency stays below this one
constexpr Hertz oversample_floor = 100000;

// Scale of the fixed-point arithmetic used by the approximate search
constexpr std::uint64_t fixed_point_scale = 100;

// Oversampling applied to the target of the approximate search
constexpr std::uint64_t fallback_oversample = 2;

/**
 * Pair of integer dividers reducing a reference clock.
 *
 * The reference is first divided by `x` in hardware, then by `y`, usually by
 * spending `y - 1` wait cycles per sample. All fields are zero for a
 * disabled clock.
 */
struct DivisorSolution
{
    int x = 0;
    int y = 0;

    // Frequency obtained from the reference, `reference / x / y`
    Hertz achieved_hz = 0;

    // Error of the achieved frequency relative to the searched target, zero
    // for an exact match
    Hertz residual_hz = 0;

    bool is_disabled() const;
    bool is_exact() const;
};

/**
 * Look for dividers reproducing a frequency exactly.
 *
 * Large `x` values are preferred over large `y` values, since they result
 * in a more stable clock: the smallest suitable `y` is returned, paired with
 * the only `x` in [y, x_max] that works for it.
 *
 * @param src_hz Reference frequency.
 * @param desired_hz Frequency to reproduce.
 * @param x_max Largest value allowed for the first divider.
 * @param y_max Largest value allowed for the second divider.
 * @return Exact dividers, or nothing if there are none.
 * @throws ConfigurationError If a divider range is empty or `x_max` is
 * smaller than `y_max`.
 * @throws RangeError If the reference frequency is zero.
 */
std::optional<DivisorSolution> find_divisor_exact(
    Hertz src_hz,
    Hertz desired_hz,
    int x_max,
    int y_max
);

/**
 * Find the best dividers reducing a reference clock to a frequency.
 *
 * An exact match is preferred, then an exact match on an oversampled
 * frequency. If neither exists, the pair closest to twice the desired
 * frequency without undershooting it is returned along with its error.
 * A zero frequency returns a disabled solution.
 *
 * The achieved frequency may therefore be a large multiple of the desired
 * one, in which case the caller is expected to oversample its data.
 *
 * @throws ConfigurationError If a divider range is empty or `x_max` is
 * smaller than `y_max`.
 * @throws RangeError If the reference frequency is zero or either frequency
 * is too large for the fixed-point search.
 */
DivisorSolution solve_divider(
    Hertz src_hz,
    Hertz desired_hz,
    int x_max,
    int y_max
);

/** Clock source selector, numbered as in bcm283x clock control registers. */
enum class ClockSource : std::uint8_t
{
    Ground = 0,

    // Crystal oscillator, 19.2 MHz
    Oscillator = 1,

    TestDebug0 = 2,
    TestDebug1 = 3,
    PLLA = 4,

    // 1000 MHz, changes with overclocking
    PLLC = 5,

    // 500 MHz
    PLLD = 6,

    // 216 MHz, may be disabled
    HDMI = 7,
};

/** Get a human-readable name for a clock source. */
std::string to_string(ClockSource);

/** Clock source paired with its frequency. */
struct ClockReference
{
    ClockSource source;
    Hertz hz;
};

/** Clock sources and divider limits of a chip. */
struct ClockProfile
{
    // Cleanest reference, tried first
    ClockReference clean;

    // Faster reference, used when it gives a better result
    ClockReference fast;

    // Largest value of the hardware divider
    int x_max;

    // Largest frequency the clocks may be set to
    Hertz ceiling_hz;

    /**
     * Profile of the bcm283x clock manager: 19.2 MHz oscillator, 500 MHz
     * PLLD, 12-bit integer divider, 25 MHz maximum output.
     */
    static ClockProfile bcm283x();
};

/** Divider pair applied to a given reference. */
struct ClockDivider
{
    ClockSource source = ClockSource::Ground;
    DivisorSolution solution;
};

/**
 * Choose the reference and dividers best suited to a frequency.
 *
 * @param profile Chip clock profile.
 * @param desired_hz Frequency to reproduce, or zero to disable the clock.
 * @param y_max Largest value allowed for the second divider.
 * @throws RangeError If the frequency exceeds the profile ceiling.
 * @throws ConfigurationError If `y_max` is out of range.
 */
ClockDivider select_clock(
    const ClockProfile& profile,
    Hertz desired_hz,
    int y_max
);

} // namespace Pinwave

#endif // PINWAVE_DIVISOR_HPP
