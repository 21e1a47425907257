/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "errors.hpp"
#include "raster.hpp"
#include <doctest/doctest.h>
#include <cstdint>
#include <memory>
#include <vector>

using namespace Pinwave;
using namespace std::chrono_literals;

namespace
{

constexpr std::uint32_t pin_a = 1u << 4;
constexpr std::uint32_t pin_b = 1u << 17;

class OpaqueStream : public Stream
{
public:
    Duration get_resolution() const override
    {
        return 1us;
    }

    Duration get_duration() const override
    {
        return 8us;
    }
};

bool is_high(const RasterBuffer32& buffer, std::size_t slot)
{
    return (buffer.set[slot] & pin_a) != 0;
}

bool is_low(const RasterBuffer32& buffer, std::size_t slot)
{
    return (buffer.clear[slot] & pin_a) != 0;
}

bool is_untouched(const RasterBuffer32& buffer, std::size_t slot)
{
    return buffer.set[slot] == 0 && buffer.clear[slot] == 0;
}

} // anonymous namespace

TEST_CASE("raster - slot boundaries round half up") {
    CHECK(to_slot(0ns, 10ns) == 0);
    CHECK(to_slot(4ns, 10ns) == 0);
    CHECK(to_slot(5ns, 10ns) == 1);
    CHECK(to_slot(15ns, 10ns) == 2);
    CHECK(to_slot(30ns, 10ns) == 3);

    SUBCASE("resolution near the duration limit") {
        CHECK(to_slot(Duration(1), Duration::max()) == 0);
        CHECK(to_slot(Duration::max() - Duration(1), Duration::max()) == 1);
        CHECK(to_slot(Duration::max(), Duration::max()) == 1);
    }
}

TEST_CASE("raster - bit stream reproduces its pattern") {
    Bits pattern{0xA5, 0x3C};
    BitStream bits{pattern, 1us};
    RasterBuffer32 buffer{20};

    raster(bits, 1us, buffer, pin_a, pin_a);

    for (std::size_t i = 0; i < 16; ++i) {
        bool expected = (pattern[i / 8] >> (i % 8)) & 1;
        CHECK(((buffer.set[i] & pin_a) != 0) == expected);
        CHECK(((buffer.clear[i] & pin_a) != 0) == !expected);
    }

    for (std::size_t i = 16; i < 20; ++i) {
        CHECK(is_untouched(buffer, i));
    }
}

TEST_CASE("raster - streams share a buffer on distinct pins") {
    BitStream first{{0x0F}, 1us};
    BitStream second{{0xF0}, 1us};
    RasterBuffer32 buffer{8};

    raster(first, 1us, buffer, pin_a, pin_a);
    raster(second, 1us, buffer, pin_b, pin_b);

    CHECK(buffer.set[0] == pin_a);
    CHECK(buffer.clear[0] == pin_b);
    CHECK(buffer.set[7] == pin_b);
    CHECK(buffer.clear[7] == pin_a);

    buffer.reset();
    CHECK(is_untouched(buffer, 0));
    CHECK(buffer.size() == 8);
}

TEST_CASE("raster - set and clear masks may differ") {
    constexpr std::uint32_t set_mask = 1u << 2;
    constexpr std::uint32_t clear_mask = 1u << 9;

    BitStream bits{{0x01}, 1us};
    std::vector<std::uint32_t> clear(8, 0);
    std::vector<std::uint32_t> set(8, 0);

    raster(bits, 1us, clear, set, set_mask, clear_mask);

    CHECK(set[0] == set_mask);
    CHECK(clear[0] == 0);
    CHECK(set[1] == 0);
    CHECK(clear[1] == clear_mask);
}

TEST_CASE("raster - byte-wide buffers") {
    constexpr std::uint8_t mask = 1u << 3;
    BitStream bits{{0x81}, 1us};
    RasterBuffer8 buffer{8};

    raster(bits, 1us, buffer, mask, mask);

    CHECK(buffer.set[0] == mask);
    CHECK(buffer.clear[1] == mask);
    CHECK(buffer.set[7] == mask);
}

TEST_CASE("raster - edge streams") {
    SUBCASE("cumulative rounding") {
        EdgeStream edges{{15ns, 15ns}, 10ns};
        RasterBuffer32 buffer{4};

        raster(edges, 10ns, buffer, pin_a, pin_a);

        CHECK(is_high(buffer, 0));
        CHECK(is_high(buffer, 1));
        CHECK(is_low(buffer, 2));
        CHECK(is_untouched(buffer, 3));
    }

    SUBCASE("short edges do not drift") {
        EdgeStream edges{{4ns, 4ns, 4ns, 4ns, 4ns}, 10ns};
        RasterBuffer32 buffer{4};

        CHECK(slot_count(edges, 10ns) == 2);
        raster(edges, 10ns, buffer, pin_a, pin_a);

        CHECK(is_low(buffer, 0));
        CHECK(is_low(buffer, 1));
        CHECK(buffer.set[0] == 0);
        CHECK(buffer.set[1] == 0);
        CHECK(is_untouched(buffer, 2));
    }

    SUBCASE("leading empty edge starts Low") {
        EdgeStream edges{{0ns, 2us, 1us}, 1us};
        RasterBuffer32 buffer{3};

        raster(edges, 1us, buffer, pin_a, pin_a);

        CHECK(is_low(buffer, 0));
        CHECK(is_low(buffer, 1));
        CHECK(is_high(buffer, 2));
    }

    SUBCASE("finer resolution") {
        EdgeStream edges{{1us, 1us}, 1us};
        RasterBuffer32 buffer{4};

        raster(edges, 500ns, buffer, pin_a, pin_a);

        CHECK(is_high(buffer, 0));
        CHECK(is_high(buffer, 1));
        CHECK(is_low(buffer, 2));
        CHECK(is_low(buffer, 3));
    }
}

TEST_CASE("raster - programs play parts back to back") {
    auto bits = std::make_shared<BitStream>(Bits{0x0F}, 1us);
    auto edges = std::make_shared<EdgeStream>(
        std::vector<Duration>{2us, 1us},
        1us
    );
    Program program{{bits, edges}, 1us, 2};
    RasterBuffer32 buffer{24};

    CHECK(slot_count(program, 1us) == 22);
    raster(program, 1us, buffer, pin_a, pin_a);

    for (std::size_t loop = 0; loop < 2; ++loop) {
        auto base = loop * 11;

        for (std::size_t i = 0; i < 4; ++i) {
            CHECK(is_high(buffer, base + i));
        }

        for (std::size_t i = 4; i < 8; ++i) {
            CHECK(is_low(buffer, base + i));
        }

        CHECK(is_high(buffer, base + 8));
        CHECK(is_high(buffer, base + 9));
        CHECK(is_low(buffer, base + 10));
    }

    CHECK(is_untouched(buffer, 22));
    CHECK(is_untouched(buffer, 23));
}

TEST_CASE("raster - invalid arguments") {
    BitStream bits{{0xFF}, 1us};
    RasterBuffer32 buffer{8};

    SUBCASE("zero masks") {
        CHECK_THROWS_AS(
            raster(bits, 1us, buffer, std::uint32_t{0}, pin_a),
            ConfigurationError
        );
        CHECK_THROWS_AS(
            raster(bits, 1us, buffer, pin_a, std::uint32_t{0}),
            ConfigurationError
        );
    }

    SUBCASE("empty buffers") {
        std::vector<std::uint32_t> clear;
        std::vector<std::uint32_t> set;
        CHECK_THROWS_AS(
            raster(bits, 1us, clear, set, pin_a, pin_a),
            ConfigurationError
        );
    }

    SUBCASE("mismatched buffers") {
        std::vector<std::uint32_t> clear(8, 0);
        std::vector<std::uint32_t> set(9, 0);
        CHECK_THROWS_AS(
            raster(bits, 1us, clear, set, pin_a, pin_a),
            ConfigurationError
        );
    }

    SUBCASE("non-positive resolution") {
        CHECK_THROWS_AS(
            raster(bits, 0ns, buffer, pin_a, pin_a),
            ConfigurationError
        );
        CHECK_THROWS_AS(
            raster(bits, -1ns, buffer, pin_a, pin_a),
            ConfigurationError
        );
    }

    SUBCASE("bit stream resampling") {
        CHECK_THROWS_AS(
            raster(bits, 500ns, buffer, pin_a, pin_a),
            ConfigurationError
        );
    }

    SUBCASE("edge stream resolution too coarse") {
        EdgeStream edges{{1us}, 1us};
        CHECK_THROWS_AS(
            raster(edges, 2us, buffer, pin_a, pin_a),
            ConfigurationError
        );
    }

    SUBCASE("negative edge") {
        EdgeStream edges{{2us, -1us}, 1us};
        CHECK_THROWS_AS(
            raster(edges, 1us, buffer, pin_a, pin_a),
            ConfigurationError
        );
    }

    SUBCASE("unbounded program") {
        Program forever{
            {std::make_shared<BitStream>(bits)},
            1us,
            Program::loop_forever
        };
        CHECK_THROWS_AS(
            raster(forever, 1us, buffer, pin_a, pin_a),
            ConfigurationError
        );
    }

    SUBCASE("missing program part") {
        Program program{{nullptr}, 1us};
        CHECK_THROWS_AS(
            raster(program, 1us, buffer, pin_a, pin_a),
            ConfigurationError
        );
    }

    SUBCASE("buffer too short") {
        BitStream longer{{0xFF, 0xFF}, 1us};
        CHECK_THROWS_AS(
            raster(longer, 1us, buffer, pin_a, pin_a),
            ConfigurationError
        );
    }

    SUBCASE("unknown stream type") {
        OpaqueStream opaque;
        CHECK_THROWS_AS(
            raster(opaque, 1us, buffer, pin_a, pin_a),
            ConfigurationError
        );
    }

    for (std::size_t i = 0; i < buffer.size(); ++i) {
        CHECK(is_untouched(buffer, i));
    }
}

TEST_CASE("raster - nothing is written when a later part is invalid") {
    auto valid = std::make_shared<BitStream>(Bits{0xFF}, 1us);
    auto invalid = std::make_shared<BitStream>(Bits{0xFF}, 2us);
    Program program{{valid, invalid}, 1us};
    RasterBuffer32 buffer{16};

    CHECK_THROWS_AS(
        raster(program, 1us, buffer, pin_a, pin_a),
        ConfigurationError
    );

    for (std::size_t i = 0; i < buffer.size(); ++i) {
        CHECK(is_untouched(buffer, i));
    }
}
