/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "nrz.hpp"
#include "errors.hpp"
#include <array>
#include <sstream>

namespace Pinwave
{

namespace
{

// Pattern of a zero byte: 100 repeated eight times
constexpr std::uint32_t symbol_base = 0x924924;

// Position, in each pixel, of the channels sent in wire order
constexpr std::array<int, 4> wire_order{1, 0, 2, 3};

constexpr auto reverse_bits(std::uint8_t byte) -> std::uint8_t
{
    std::uint8_t result = 0;

    for (int i = 0; i < 8; ++i) {
        result = (result << 1) | ((byte >> i) & 1);
    }

    return result;
}

} // anonymous namespace

auto encode_symbol(std::uint8_t value) -> std::uint32_t
{
    auto result = symbol_base;

    for (int bit = 0; bit < 8; ++bit) {
        // Data bit `bit` sits in the middle slot of its group
        result |= static_cast<std::uint32_t>((value >> bit) & 1)
            << (slots_per_bit * bit + 1);
    }

    return result;
}

void encode_pixels(
    const std::uint8_t* in,
    std::size_t size,
    int channels,
    std::uint8_t* out
)
{
    if (channels != 3 && channels != 4) {
        std::ostringstream message;
        message << "Unsupported number of channels per pixel: " << channels;
        throw ConfigurationError{message.str()};
    }

    if (size % channels != 0) {
        std::ostringstream message;
        message << "Pixel data length " << size
            << " is not a multiple of " << channels;
        throw ConfigurationError{message.str()};
    }

    for (std::size_t pixel = 0; pixel < size; pixel += channels) {
        for (int channel = 0; channel < channels; ++channel) {
            auto symbol = encode_symbol(in[pixel + wire_order[channel]]);

            *out++ = reverse_bits(static_cast<std::uint8_t>(symbol >> 16));
            *out++ = reverse_bits(static_cast<std::uint8_t>(symbol >> 8));
            *out++ = reverse_bits(static_cast<std::uint8_t>(symbol));
        }
    }
}

auto encode_pixels(const std::vector<std::uint8_t>& in, int channels) -> Bits
{
    Bits result(in.size() * slots_per_bit);
    encode_pixels(in.data(), in.size(), channels, result.data());
    return result;
}

} // namespace Pinwave
