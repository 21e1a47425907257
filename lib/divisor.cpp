/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "divisor.hpp"
#include "errors.hpp"
#include <algorithm>
#include <limits>
#include <sstream>

namespace Pinwave
{

namespace
{

void check_ranges(Hertz src_hz, int x_max, int y_max)
{
    if (x_max < 1 || y_max < 1) {
        std::ostringstream message;
        message << "Divider ranges must be non-empty, got x_max = "
            << x_max << " and y_max = " << y_max;
        throw ConfigurationError{message.str()};
    }

    if (x_max < y_max) {
        std::ostringstream message;
        message << "x_max (" << x_max << ") must be greater than or equal to "
            << "y_max (" << y_max << ")";
        throw ConfigurationError{message.str()};
    }

    if (src_hz == 0) {
        throw RangeError{"Reference frequency must be non-zero"};
    }
}

auto exact_search(Hertz src_hz, Hertz desired_hz, int x_max, int y_max)
-> std::optional<DivisorSolution>
{
    if (desired_hz == 0) {
        return {};
    }

    for (int y = 1; y <= y_max; ++y) {
        if (src_hz % y != 0) {
            continue;
        }

        auto divided = src_hz / y;

        if (divided < desired_hz) {
            break;
        }

        // divided / x == desired_hz with no remainder for a single x
        if (divided % desired_hz == 0) {
            auto x = divided / desired_hz;

            if (x >= static_cast<Hertz>(y) && x <= static_cast<Hertz>(x_max)) {
                return DivisorSolution{
                    /* x = */ static_cast<int>(x),
                    /* y = */ y,
                    /* achieved_hz = */ desired_hz,
                    /* residual_hz = */ 0
                };
            }
        }
    }

    return {};
}

auto approximate_search(Hertz src_hz, Hertz desired_hz, int x_max, int y_max)
-> DivisorSolution
{
    auto max = std::numeric_limits<Hertz>::max();

    if (src_hz > max / fixed_point_scale
            || desired_hz > max / (fixed_point_scale * fallback_oversample)) {
        std::ostringstream message;
        message << "Cannot approximate " << desired_hz << " Hz from "
            << src_hz << " Hz: frequencies too large";
        throw RangeError{message.str()};
    }

    auto source = src_hz * fixed_point_scale;
    auto target = desired_hz * fixed_point_scale * fallback_oversample;

    DivisorSolution above;
    Hertz above_error = max;
    Hertz above_actual = 0;

    DivisorSolution below;
    Hertz below_error = max;
    Hertz below_actual = 0;

    for (int x = 1; x <= x_max; ++x) {
        auto last_y = std::min(x, y_max);

        for (int y = 1; y <= last_y; ++y) {
            auto actual = source / x / y;

            if (actual >= target) {
                if (actual - target < above_error) {
                    above_error = actual - target;
                    above_actual = actual;
                    above.x = x;
                    above.y = y;
                }
            } else if (target - actual < below_error) {
                below_error = target - actual;
                below_actual = actual;
                below.x = x;
                below.y = y;
            }
        }
    }

    if (above.x != 0) {
        above.achieved_hz = above_actual / fixed_point_scale;
        above.residual_hz = above_error / fixed_point_scale;
        return above;
    }

    below.achieved_hz = below_actual / fixed_point_scale;
    below.residual_hz = below_error / fixed_point_scale;
    return below;
}

} // anonymous namespace

auto DivisorSolution::is_disabled() const -> bool
{
    return this->x == 0;
}

auto DivisorSolution::is_exact() const -> bool
{
    return !this->is_disabled() && this->residual_hz == 0;
}

auto find_divisor_exact(
    Hertz src_hz,
    Hertz desired_hz,
    int x_max,
    int y_max
) -> std::optional<DivisorSolution>
{
    check_ranges(src_hz, x_max, y_max);
    return exact_search(src_hz, desired_hz, x_max, y_max);
}

auto solve_divider(
    Hertz src_hz,
    Hertz desired_hz,
    int x_max,
    int y_max
) -> DivisorSolution
{
    check_ranges(src_hz, x_max, y_max);

    if (desired_hz == 0) {
        return DivisorSolution{};
    }

    if (auto exact = exact_search(src_hz, desired_hz, x_max, y_max)) {
        return *exact;
    }

    // Oversampling costs memory, so stop earlier for higher frequencies
    for (std::uint64_t factor = 2;; ++factor) {
        if (factor > oversample_factor
                && desired_hz * factor > oversample_floor) {
            break;
        }

        if (desired_hz > src_hz / factor) {
            // Any further multiple exceeds the reference
            break;
        }

        auto oversampled = desired_hz * factor;

        if (auto exact = exact_search(src_hz, oversampled, x_max, y_max)) {
            return *exact;
        }
    }

    return approximate_search(src_hz, desired_hz, x_max, y_max);
}

auto to_string(ClockSource source) -> std::string
{
    switch (source) {
    case ClockSource::Ground: return "GND(0Hz)";
    case ClockSource::Oscillator: return "19.2MHz";
    case ClockSource::TestDebug0: return "Debug0(0Hz)";
    case ClockSource::TestDebug1: return "Debug1(0Hz)";
    case ClockSource::PLLA: return "PLLA(0Hz)";
    case ClockSource::PLLC: return "PLLC(1000MHz)";
    case ClockSource::PLLD: return "PLLD(500MHz)";
    case ClockSource::HDMI: return "HDMI(216MHz)";
    }

    return "GND(" + std::to_string(static_cast<int>(source)) + ")";
}

auto ClockProfile::bcm283x() -> ClockProfile
{
    return ClockProfile{
        /* clean = */ ClockReference{ClockSource::Oscillator, 19200000},
        /* fast = */ ClockReference{ClockSource::PLLD, 500000000},
        /* x_max = */ 4095,
        /* ceiling_hz = */ 25000000
    };
}

auto select_clock(
    const ClockProfile& profile,
    Hertz desired_hz,
    int y_max
) -> ClockDivider
{
    if (desired_hz > profile.ceiling_hz) {
        std::ostringstream message;
        message << "Desired frequency " << desired_hz
            << " Hz is above the " << profile.ceiling_hz << " Hz ceiling";
        throw RangeError{message.str()};
    }

    if (desired_hz == 0) {
        check_ranges(profile.clean.hz, profile.x_max, y_max);
        return ClockDivider{};
    }

    // The clean reference is kept when exact, otherwise the fast one wins
    // unless the clean one is strictly closer
    auto clean = solve_divider(
        profile.clean.hz, desired_hz,
        profile.x_max, y_max
    );

    if (clean.residual_hz == 0) {
        return ClockDivider{profile.clean.source, clean};
    }

    auto fast = solve_divider(
        profile.fast.hz, desired_hz,
        profile.x_max, y_max
    );

    if (clean.residual_hz < fast.residual_hz) {
        return ClockDivider{profile.clean.source, clean};
    }

    return ClockDivider{profile.fast.source, fast};
}

} // namespace Pinwave
