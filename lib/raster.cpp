/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "raster.hpp"
#include "errors.hpp"
#include <limits>
#include <sstream>

namespace Pinwave
{

namespace
{

auto bits_slot_count(const BitStream& stream, Duration resolution)
-> std::size_t
{
    if (stream.get_resolution() != resolution) {
        std::ostringstream message;
        message << "Cannot rasterize a bit stream of resolution "
            << duration_to_string(stream.get_resolution())
            << " at resolution " << duration_to_string(resolution)
            << ", resampling is not supported";
        throw ConfigurationError{message.str()};
    }

    return stream.get_sample_count();
}

auto edges_slot_count(const EdgeStream& stream, Duration resolution)
-> std::size_t
{
    if (resolution > stream.get_resolution()) {
        std::ostringstream message;
        message << "Resolution " << duration_to_string(resolution)
            << " is too coarse for an edge stream of resolution "
            << duration_to_string(stream.get_resolution());
        throw ConfigurationError{message.str()};
    }

    Duration total{0};
    const auto& edges = stream.get_edges();

    for (std::size_t i = 0; i < edges.size(); ++i) {
        if (edges[i] < Duration::zero()) {
            std::ostringstream message;
            message << "Edge " << i << " has negative duration "
                << edges[i].count() << "ns";
            throw ConfigurationError{message.str()};
        }

        if (total > Duration::max() - edges[i]) {
            throw ConfigurationError{"Edge stream duration overflows"};
        }

        total += edges[i];
    }

    return to_slot(total, resolution);
}

auto program_slot_count(const Program& program, Duration resolution)
-> std::size_t
{
    if (!program.is_bounded()) {
        std::ostringstream message;
        message << "Cannot rasterize a program with loop count "
            << program.get_loops();
        throw ConfigurationError{message.str()};
    }

    std::size_t once = 0;
    const auto& parts = program.get_parts();

    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (!parts[i]) {
            std::ostringstream message;
            message << "Part " << i << " of program is missing";
            throw ConfigurationError{message.str()};
        }

        auto count = slot_count(*parts[i], resolution);

        if (once > std::numeric_limits<std::size_t>::max() - count) {
            throw ConfigurationError{"Program length overflows"};
        }

        once += count;
    }

    auto loops = static_cast<std::size_t>(program.get_loops());

    if (once != 0 && loops > std::numeric_limits<std::size_t>::max() / once) {
        throw ConfigurationError{"Program length overflows"};
    }

    return once * loops;
}

} // anonymous namespace

auto to_slot(Duration time, Duration resolution) -> std::size_t
{
    auto whole = time / resolution;
    auto rest = time % resolution;

    if (rest >= resolution - rest) {
        ++whole;
    }

    return static_cast<std::size_t>(whole);
}

auto slot_count(const Stream& stream, Duration resolution) -> std::size_t
{
    if (resolution <= Duration::zero()) {
        std::ostringstream message;
        message << "Resolution must be positive, got "
            << resolution.count() << "ns";
        throw ConfigurationError{message.str()};
    }

    if (const auto* bits = dynamic_cast<const BitStream*>(&stream)) {
        return bits_slot_count(*bits, resolution);
    }

    if (const auto* edges = dynamic_cast<const EdgeStream*>(&stream)) {
        return edges_slot_count(*edges, resolution);
    }

    if (const auto* program = dynamic_cast<const Program*>(&stream)) {
        return program_slot_count(*program, resolution);
    }

    throw ConfigurationError{"Unknown stream type"};
}

} // namespace Pinwave
