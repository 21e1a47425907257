/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "led_strip.hpp"
#include "errors.hpp"
#include "nrz.hpp"
#include "stream.hpp"
#include <iostream>
#include <sstream>

namespace Pinwave
{

LedStrip::LedStrip(PinIO& pin, Options options)
: streamer(capability<PinStreamer>(pin))
, options(options)
{
    if (this->streamer == nullptr) {
        throw ConfigurationError{
            "LED strip pin " + pin.to_string() + " cannot output streams"
        };
    }

    if (this->options.channels != 3 && this->options.channels != 4) {
        std::ostringstream message;
        message << "LED strips have 3 or 4 channels per light, not "
            << this->options.channels;
        throw ConfigurationError{message.str()};
    }

    if (this->options.speed_hz == 0) {
        this->options.speed_hz = max_speed_hz;
    }

    if (this->options.speed_hz > max_speed_hz) {
        std::ostringstream message;
        message << "LED strip speed " << this->options.speed_hz
            << " Hz is above the " << max_speed_hz << " Hz maximum";
        throw RangeError{message.str()};
    }

    constexpr Hertz ns_per_second = 1000000000;
    auto slot_hz = this->options.speed_hz * slots_per_bit;
    this->resolution = Duration(ns_per_second / slot_hz);

    if (ns_per_second % slot_hz != 0) {
        std::cerr << "[strip] Slot length for " << this->options.speed_hz
            << " Hz rounded down to "
            << duration_to_string(this->resolution) << '\n';
    }
}

void LedStrip::write(const std::vector<std::uint8_t>& pixels)
{
    auto capacity = this->options.light_count * this->options.channels;

    if (pixels.size() > capacity) {
        std::ostringstream message;
        message << "Cannot send " << pixels.size() << " bytes to a strip of "
            << this->options.light_count << " lights";
        throw ConfigurationError{message.str()};
    }

    BitStream stream{
        encode_pixels(pixels, this->options.channels),
        this->resolution
    };

    this->streamer->stream(stream);
}

auto LedStrip::get_resolution() const -> Duration
{
    return this->resolution;
}

auto LedStrip::get_options() const -> const Options&
{
    return this->options;
}

} // namespace Pinwave
