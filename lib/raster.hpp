/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef PINWAVE_RASTER_HPP
#define PINWAVE_RASTER_HPP

#include "defs.hpp"
#include "stream.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Pinwave
{

/**
 * Pair of equal-length mask arrays for simultaneous multi-pin output.
 *
 * Each slot of `set` holds the pins to drive High during that sample and each
 * slot of `clear` the pins to drive Low, in the layout of a GPIO set/clear
 * register pair. The buffer is owned by the caller, rasterizing a stream only
 * ORs bits into it.
 */
template<typename Word>
struct RasterBuffer
{
    std::vector<Word> clear;
    std::vector<Word> set;

    /** Allocate a zeroed buffer of the given number of slots. */
    explicit RasterBuffer(std::size_t size);

    /** Number of slots. */
    std::size_t size() const;

    /** Zero all slots. */
    void reset();
};

/**
 * Compute the number of slots a stream covers at the given resolution.
 *
 * This also checks that the stream can be rasterized at that resolution.
 *
 * @param stream Stream to measure.
 * @param resolution Duration of one output slot.
 * @return Number of slots the stream covers.
 * @throws ConfigurationError If the resolution is not positive, does not
 * suit the stream (a bit stream needs exactly its own resolution, an edge
 * stream its minimum resolution or finer), an edge is negative, a program
 * loops forever or the stream type is unknown.
 */
std::size_t slot_count(const Stream& stream, Duration resolution);

/**
 * Round a time offset to the nearest slot boundary, halves rounding up.
 *
 * Edge streams are discretized by rounding their cumulative edge times with
 * this function, so that rounding errors do not accumulate along the stream.
 */
std::size_t to_slot(Duration time, Duration resolution);

/**
 * Rasterize a stream into a set/clear buffer pair.
 *
 * For each slot covered by the stream, `set_mask` is ORed into `set` if the
 * stream is High during that slot, otherwise `clear_mask` is ORed into
 * `clear`. Slots past the end of the stream are left untouched, so that
 * several streams can share one buffer on distinct pins.
 *
 * Either the whole stream is written or nothing is: all checks happen before
 * the first write. This function never allocates.
 *
 * @param stream Stream to rasterize.
 * @param resolution Duration of one output slot.
 * @param clear Buffer receiving the clear masks.
 * @param set Buffer receiving the set masks.
 * @param size Number of slots in each buffer.
 * @param set_mask Bits to set in `set` for High slots.
 * @param clear_mask Bits to set in `clear` for Low slots.
 * @throws ConfigurationError If a mask is zero, the buffers are empty, the
 * stream does not fit into the buffers, or `slot_count()` rejects the stream.
 */
template<typename Word>
void raster(
    const Stream& stream,
    Duration resolution,
    Word* clear,
    Word* set,
    std::size_t size,
    Word set_mask,
    Word clear_mask
);

/**
 * @overload
 * @throws ConfigurationError If the buffers have different lengths, or for
 * any of the reasons listed above.
 */
template<typename Word>
void raster(
    const Stream& stream,
    Duration resolution,
    std::vector<Word>& clear,
    std::vector<Word>& set,
    Word set_mask,
    Word clear_mask
);

/** @overload */
template<typename Word>
void raster(
    const Stream& stream,
    Duration resolution,
    RasterBuffer<Word>& buffer,
    Word set_mask,
    Word clear_mask
);

// Word sizes of the supported GPIO register layouts: 8 pins per register
// group (one byte lane per sample) and 32 pins per register
using RasterBuffer8 = RasterBuffer<std::uint8_t>;
using RasterBuffer32 = RasterBuffer<std::uint32_t>;

} // namespace Pinwave

#include "raster.tpp"

#endif // PINWAVE_RASTER_HPP
