/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "raster.hpp"
#include "errors.hpp"
#include <algorithm>
#include <sstream>

namespace Pinwave
{

template<typename Word>
RasterBuffer<Word>::RasterBuffer(std::size_t size)
: clear(size, 0)
, set(size, 0)
{}

template<typename Word>
std::size_t RasterBuffer<Word>::size() const
{
    return this->set.size();
}

template<typename Word>
void RasterBuffer<Word>::reset()
{
    std::fill(this->clear.begin(), this->clear.end(), 0);
    std::fill(this->set.begin(), this->set.end(), 0);
}

namespace detail
{

template<typename Word>
void raster_slots(
    Level level,
    std::size_t begin,
    std::size_t end,
    Word* clear,
    Word* set,
    Word set_mask,
    Word clear_mask
)
{
    if (level == Level::High) {
        for (auto i = begin; i < end; ++i) {
            set[i] |= set_mask;
        }
    } else {
        for (auto i = begin; i < end; ++i) {
            clear[i] |= clear_mask;
        }
    }
}

/**
 * Write a stream that was already checked by `slot_count()`.
 *
 * @return Number of slots written.
 */
template<typename Word>
std::size_t raster_unchecked(
    const Stream& stream,
    Duration resolution,
    Word* clear,
    Word* set,
    Word set_mask,
    Word clear_mask
)
{
    if (const auto* bits = dynamic_cast<const BitStream*>(&stream)) {
        auto count = bits->get_sample_count();

        for (std::size_t i = 0; i < count; ++i) {
            if (bits->at(i) == Level::High) {
                set[i] |= set_mask;
            } else {
                clear[i] |= clear_mask;
            }
        }

        return count;
    }

    if (const auto* edges = dynamic_cast<const EdgeStream*>(&stream)) {
        Duration time{0};
        std::size_t begin = 0;
        const auto& list = edges->get_edges();

        for (std::size_t k = 0; k < list.size(); ++k) {
            time += list[k];
            auto end = to_slot(time, resolution);
            raster_slots(
                EdgeStream::level_of(k),
                begin, end,
                clear, set,
                set_mask, clear_mask
            );
            begin = end;
        }

        return begin;
    }

    const auto& program = dynamic_cast<const Program&>(stream);
    std::size_t offset = 0;

    for (int loop = 0; loop < program.get_loops(); ++loop) {
        for (const auto& part : program.get_parts()) {
            offset += raster_unchecked(
                *part, resolution,
                clear + offset, set + offset,
                set_mask, clear_mask
            );
        }
    }

    return offset;
}

} // namespace detail

template<typename Word>
void raster(
    const Stream& stream,
    Duration resolution,
    Word* clear,
    Word* set,
    std::size_t size,
    Word set_mask,
    Word clear_mask
)
{
    if (set_mask == 0 || clear_mask == 0) {
        throw ConfigurationError{"Set and clear masks must be non-zero"};
    }

    if (size == 0 || clear == nullptr || set == nullptr) {
        throw ConfigurationError{"Raster buffers must be non-empty"};
    }

    auto needed = slot_count(stream, resolution);

    if (needed > size) {
        std::ostringstream message;
        message << "Stream needs " << needed
            << " slots but the raster buffers only hold " << size;
        throw ConfigurationError{message.str()};
    }

    detail::raster_unchecked(
        stream, resolution,
        clear, set,
        set_mask, clear_mask
    );
}

template<typename Word>
void raster(
    const Stream& stream,
    Duration resolution,
    std::vector<Word>& clear,
    std::vector<Word>& set,
    Word set_mask,
    Word clear_mask
)
{
    if (clear.size() != set.size()) {
        std::ostringstream message;
        message << "Clear buffer holds " << clear.size()
            << " slots but set buffer holds " << set.size();
        throw ConfigurationError{message.str()};
    }

    raster(
        stream, resolution,
        clear.data(), set.data(), set.size(),
        set_mask, clear_mask
    );
}

template<typename Word>
void raster(
    const Stream& stream,
    Duration resolution,
    RasterBuffer<Word>& buffer,
    Word set_mask,
    Word clear_mask
)
{
    raster(
        stream, resolution,
        buffer.clear, buffer.set,
        set_mask, clear_mask
    );
}

} // namespace Pinwave
