/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef PINWAVE_STREAM_HPP
#define PINWAVE_STREAM_HPP

#include "defs.hpp"
#include <cstddef>
#include <memory>
#include <vector>

namespace Pinwave
{

/**
 * Digital waveform described as data.
 *
 * A stream describes what a pin should output (or what was captured from it),
 * never the state of any hardware. Streams are immutable once constructed and
 * construction never fails: inconsistencies are only reported when a stream
 * is rasterized.
 */
class Stream
{
public:
    virtual ~Stream();

    /** Time span represented by one discrete unit of the stream. */
    virtual Duration get_resolution() const = 0;

    /** Exact playback time of the whole stream. */
    virtual Duration get_duration() const = 0;
}; // class Stream

/**
 * Dense stream of bits sampled at a fixed period.
 *
 * Useful for protocols that need arbitrary bit patterns, like driving an
 * addressable LED strip, or for sampling a pin as a binary oscilloscope.
 */
class BitStream : public Stream
{
public:
    /**
     * Create a bit stream.
     *
     * @param bits Samples, packed LSB-first (see `Bits`).
     * @param resolution Time span of each sample.
     */
    BitStream(Bits bits, Duration resolution);

    Duration get_resolution() const override;
    Duration get_duration() const override;

    /** Get the packed samples. */
    const Bits& get_bits() const;

    /** Get the number of samples, always a multiple of 8. */
    std::size_t get_sample_count() const;

    /** Get the level of the sample at the given index. */
    Level at(std::size_t index) const;

private:
    Bits bits;
    Duration resolution;
}; // class BitStream

/**
 * Stream of level changes.
 *
 * More compact than a bit stream for sparse or repetitive signals such as
 * servo pulses. Levels alternate starting with High; use a zero-length first
 * edge to start Low.
 */
class EdgeStream : public Stream
{
public:
    /**
     * Create an edge stream.
     *
     * @param edges Time spent at each level, starting with High.
     * @param resolution Coarsest resolution the edges may be rasterized at.
     * Finer resolutions use more memory but stay accurate.
     */
    EdgeStream(std::vector<Duration> edges, Duration resolution);

    /** Minimum grain the edges must be honored at. */
    Duration get_resolution() const override;
    Duration get_duration() const override;

    /** Get the edge durations. */
    const std::vector<Duration>& get_edges() const;

    /** Level held during the edge at the given index. */
    static Level level_of(std::size_t edge);

private:
    std::vector<Duration> edges;
    Duration resolution;
}; // class EdgeStream

/**
 * Sequence of streams played back to back, optionally looped.
 *
 * Reduces memory use when a pattern repeats.
 */
class Program : public Stream
{
public:
    using Part = std::shared_ptr<const Stream>;

    // Loop count value for a program that repeats until stopped
    static constexpr int loop_forever = -1;

    /**
     * Create a program.
     *
     * @param parts Streams to play, in order.
     * @param resolution Resolution advertised for the whole program.
     * @param loops Number of times to play the sequence of parts, or
     * `loop_forever`. Programs with a non-positive loop count cannot be
     * rasterized.
     */
    Program(std::vector<Part> parts, Duration resolution, int loops = 1);

    Duration get_resolution() const override;

    /**
     * Sum of the part durations, times the loop count.
     *
     * Returns `Duration::max()` if the program never ends.
     */
    Duration get_duration() const override;

    /** Get the streams making up one iteration. */
    const std::vector<Part>& get_parts() const;

    /** Get the loop count. */
    int get_loops() const;

    /** Check whether the program has a finite duration. */
    bool is_bounded() const;

private:
    std::vector<Part> parts;
    Duration resolution;
    int loops;
}; // class Program

} // namespace Pinwave

#endif // PINWAVE_STREAM_HPP
