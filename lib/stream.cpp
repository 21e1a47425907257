/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "stream.hpp"
#include <utility>

namespace Pinwave
{

namespace
{

/** Add two durations, saturating at `Duration::max()`. */
auto saturating_add(Duration a, Duration b) -> Duration
{
    if (b > Duration::zero() && a > Duration::max() - b) {
        return Duration::max();
    }

    return a + b;
}

} // anonymous namespace

Stream::~Stream()
{}

BitStream::BitStream(Bits bits, Duration resolution)
: bits(std::move(bits))
, resolution(resolution)
{}

auto BitStream::get_resolution() const -> Duration
{
    return this->resolution;
}

auto BitStream::get_duration() const -> Duration
{
    return this->resolution * static_cast<Duration::rep>(
        this->get_sample_count()
    );
}

auto BitStream::get_bits() const -> const Bits&
{
    return this->bits;
}

auto BitStream::get_sample_count() const -> std::size_t
{
    return this->bits.size() * 8;
}

auto BitStream::at(std::size_t index) const -> Level
{
    return (this->bits[index / 8] >> (index % 8)) & 1
        ? Level::High
        : Level::Low;
}

EdgeStream::EdgeStream(std::vector<Duration> edges, Duration resolution)
: edges(std::move(edges))
, resolution(resolution)
{}

auto EdgeStream::get_resolution() const -> Duration
{
    return this->resolution;
}

auto EdgeStream::get_duration() const -> Duration
{
    Duration total{0};

    for (const auto& edge : this->edges) {
        total = saturating_add(total, edge);
    }

    return total;
}

auto EdgeStream::get_edges() const -> const std::vector<Duration>&
{
    return this->edges;
}

auto EdgeStream::level_of(std::size_t edge) -> Level
{
    return edge % 2 == 0 ? Level::High : Level::Low;
}

Program::Program(std::vector<Part> parts, Duration resolution, int loops)
: parts(std::move(parts))
, resolution(resolution)
, loops(loops)
{}

auto Program::get_resolution() const -> Duration
{
    return this->resolution;
}

auto Program::get_duration() const -> Duration
{
    if (!this->is_bounded()) {
        return Duration::max();
    }

    Duration once{0};

    for (const auto& part : this->parts) {
        if (part) {
            once = saturating_add(once, part->get_duration());
        }
    }

    if (once.count() > Duration::max().count() / this->loops) {
        return Duration::max();
    }

    return once * this->loops;
}

auto Program::get_parts() const -> const std::vector<Part>&
{
    return this->parts;
}

auto Program::get_loops() const -> int
{
    return this->loops;
}

auto Program::is_bounded() const -> bool
{
    return this->loops > 0;
}

} // namespace Pinwave
