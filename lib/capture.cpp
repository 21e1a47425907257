/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "capture.hpp"
#include "errors.hpp"
#include <sstream>
#include <utility>

namespace Pinwave
{

namespace
{

template<typename Word>
auto pack_lane(const std::vector<Word>& samples, unsigned offset) -> Bits
{
    constexpr unsigned width = sizeof(Word) * 8;

    if (offset >= width) {
        std::ostringstream message;
        message << "Pin offset " << offset << " does not fit in a "
            << width << "-bit register";
        throw ConfigurationError{message.str()};
    }

    if (samples.size() % 8 != 0) {
        std::ostringstream message;
        message << "Sample count " << samples.size()
            << " is not a multiple of 8";
        throw ConfigurationError{message.str()};
    }

    Bits result(samples.size() / 8);

    for (std::size_t i = 0; i < result.size(); ++i) {
        std::uint8_t byte = 0;

        for (unsigned bit = 0; bit < 8; ++bit) {
            byte |= static_cast<std::uint8_t>(
                ((samples[8 * i + bit] >> offset) & 1) << bit
            );
        }

        result[i] = byte;
    }

    return result;
}

} // anonymous namespace

auto pack_samples(const std::vector<std::uint8_t>& samples, unsigned offset)
-> Bits
{
    return pack_lane(samples, offset);
}

auto pack_samples(const std::vector<std::uint32_t>& samples, unsigned offset)
-> Bits
{
    return pack_lane(samples, offset);
}

auto to_edges(const BitStream& stream) -> EdgeStream
{
    auto resolution = stream.get_resolution();
    auto count = stream.get_sample_count();
    std::vector<Duration> edges;

    if (count == 0) {
        return EdgeStream{std::move(edges), resolution};
    }

    auto level = Level::High;
    std::size_t run = 0;

    if (stream.at(0) == Level::Low) {
        edges.push_back(Duration::zero());
        level = Level::Low;
    }

    for (std::size_t i = 0; i < count; ++i) {
        if (stream.at(i) != level) {
            edges.push_back(resolution * static_cast<Duration::rep>(run));
            level = stream.at(i);
            run = 0;
        }

        ++run;
    }

    edges.push_back(resolution * static_cast<Duration::rep>(run));
    return EdgeStream{std::move(edges), resolution};
}

} // namespace Pinwave
