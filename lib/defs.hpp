/**
 * @file Shared definitions for pinwave.
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef PINWAVE_DEFS_HPP
#define PINWAVE_DEFS_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace Pinwave
{

/**
 * Time span used for stream resolutions and durations.
 *
 * All timing in pinwave is expressed in whole nanoseconds.
 */
using Duration = std::chrono::nanoseconds;

/** Level of a digital pin. */
enum class Level : bool
{
    // 0 V
    Low = false,

    // Vin, generally 3.3 V or 5 V
    High = true,
};

/** Internal pull resistor of a pin set as input. */
enum class Pull : std::uint8_t
{
    // Let the input float
    Float = 0,

    // Apply pull-down
    PullDown = 1,

    // Apply pull-up
    PullUp = 2,

    // Keep the previous setting, or the setting is unknown
    PullNoChange = 3,
};

/**
 * Edge detection on an input pin.
 *
 * Only enable it when needed, since it causes system interrupts.
 */
enum class Edge : int
{
    NoEdge = 0,
    RisingEdge = 1,
    FallingEdge = 2,
    BothEdges = 3,
};

/**
 * Duty cycle of a PWM output.
 *
 * Varies between 0 and `duty_max`. A PWM is the cheap equivalent of a looping
 * edge stream with two edges.
 */
using Duty = std::uint16_t;

// Duty cycle of 100%
constexpr Duty duty_max = 65535;

// Duty cycle of 50%, which boils down to a plain clock
constexpr Duty duty_half = duty_max / 2;

/**
 * Densely packed bit samples.
 *
 * The format is LSB-first: bit 0 of byte 0 is the first sample, bit 7 of
 * byte 0 the eighth. The number of samples is therefore always a multiple
 * of 8.
 */
using Bits = std::vector<std::uint8_t>;

/** Get a human-readable name for a level. */
std::string to_string(Level);

/** Get a human-readable name for a pull setting. */
std::string to_string(Pull);

/** Get a human-readable name for an edge detection setting. */
std::string to_string(Edge);

/** Format a duty cycle as a rounded percentage (e.g. "50%"). */
std::string duty_to_string(Duty);

/**
 * Parse a duty cycle.
 *
 * @param str Either a raw value between 0 and `duty_max`, or a percentage
 * between 0% and 100%.
 * @throws ConfigurationError If the value is malformed or out of range.
 */
Duty parse_duty(const std::string& str);

/**
 * Parse a duration such as "10ms", "1.5us" or "250ns".
 *
 * Accepted units are ns, us, ms and s. The result is truncated to whole
 * nanoseconds.
 *
 * @throws ConfigurationError If the value is malformed or negative.
 */
Duration parse_duration(const std::string& str);

/** Format a duration using the largest unit that keeps it exact. */
std::string duration_to_string(Duration);

} // namespace Pinwave

#endif // PINWAVE_DEFS_HPP
