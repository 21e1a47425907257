/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef PINWAVE_CAPTURE_HPP
#define PINWAVE_CAPTURE_HPP

#include "defs.hpp"
#include "stream.hpp"
#include <cstdint>
#include <vector>

namespace Pinwave
{

/**
 * Extract the samples of one pin from a capture of a whole register.
 *
 * When capturing, the data register of a GPIO group is sampled at each tick,
 * so that each sampled word holds the state of every pin of the group. This
 * packs the bit of a single pin back into a dense bit stream.
 *
 * @param samples Captured register values, one per tick. The number of
 * samples must be a multiple of 8.
 * @param offset Position of the pin in the register.
 * @return Samples of the pin, packed LSB-first.
 * @throws ConfigurationError If the sample count is not a multiple of 8 or
 * the offset does not fit the register width.
 */
Bits pack_samples(const std::vector<std::uint8_t>& samples, unsigned offset);

/** @overload */
Bits pack_samples(const std::vector<std::uint32_t>& samples, unsigned offset);

/**
 * Convert a captured bit stream into the equivalent edge stream.
 *
 * Each run of identical samples becomes one edge. The result starts with a
 * zero-length High edge if the capture starts Low.
 */
EdgeStream to_edges(const BitStream& stream);

} // namespace Pinwave

#endif // PINWAVE_CAPTURE_HPP
