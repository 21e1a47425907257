/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef PINWAVE_LED_STRIP_HPP
#define PINWAVE_LED_STRIP_HPP

#include "defs.hpp"
#include "divisor.hpp"
#include "pin.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Pinwave
{

/**
 * Addressable LED strip of the WS281x or SK6812 family.
 *
 * The strip is driven through a single data pin able to output streams.
 */
class LedStrip
{
public:
    // Fastest bit rate supported by the LEDs
    static constexpr Hertz max_speed_hz = 800000;

    struct Options
    {
        // Number of LEDs on the strip
        std::size_t light_count = 0;

        // Bytes per pixel, 3 for RGB or 4 for RGBW
        int channels = 3;

        // Data bit rate, 0 for the fastest supported
        Hertz speed_hz = 0;
    };

    /**
     * Open a strip.
     *
     * @param pin Data pin, must support `PinStreamer`. Must outlive the
     * strip.
     * @param options Strip geometry and speed.
     * @throws ConfigurationError If the pin cannot stream or the number of
     * channels is unsupported.
     * @throws RangeError If the speed is too high.
     */
    LedStrip(PinIO& pin, Options options);

    /**
     * Send pixels to the strip.
     *
     * @param pixels RGB (or RGBW) bytes for the first LEDs of the strip.
     * @throws ConfigurationError If the data is not a whole number of pixels
     * or does not fit the strip.
     */
    void write(const std::vector<std::uint8_t>& pixels);

    /** Get the duration of each slot of the output stream. */
    Duration get_resolution() const;

    /** Get the strip options, with the speed resolved. */
    const Options& get_options() const;

private:
    PinStreamer* streamer;
    Options options;
    Duration resolution;
}; // class LedStrip

} // namespace Pinwave

#endif // PINWAVE_LED_STRIP_HPP
