/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef PINWAVE_NRZ_HPP
#define PINWAVE_NRZ_HPP

#include "defs.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Pinwave
{

// Number of output slots spent on each data bit
constexpr std::size_t slots_per_bit = 3;

/**
 * Expand a channel intensity into its self-clocking wire pattern.
 *
 * Each input bit, most significant first, becomes the three slots `1, b, 0`,
 * which is the encoding addressable LEDs of the WS281x and SK6812 families
 * expect. The pattern occupies the 24 low bits of the result, first slot in
 * bit 23.
 */
std::uint32_t encode_symbol(std::uint8_t value);

/**
 * Encode pixels into the bit stream sent to an LED strip.
 *
 * Pixels are read as RGB (or RGBW) and sent in GRB (or GRBW) order. Each
 * input byte produces 3 output bytes, stored LSB-first as in `Bits` so that
 * the order of the samples is the order of the bits on the wire.
 *
 * @param in Pixel bytes.
 * @param size Number of bytes in `in`.
 * @param channels Bytes per pixel, 3 or 4.
 * @param out Buffer receiving `size * 3` bytes.
 * @throws ConfigurationError If `channels` is unsupported or `size` is not
 * a whole number of pixels.
 */
void encode_pixels(
    const std::uint8_t* in,
    std::size_t size,
    int channels,
    std::uint8_t* out
);

/** @overload */
Bits encode_pixels(const std::vector<std::uint8_t>& in, int channels);

} // namespace Pinwave

#endif // PINWAVE_NRZ_HPP
