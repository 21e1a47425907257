/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "errors.hpp"
#include "fake_pin.hpp"
#include "pin.hpp"
#include <doctest/doctest.h>

using namespace Pinwave;
using namespace std::chrono_literals;

TEST_CASE("pin - invalid pin") {
    auto& pin = invalid_pin();

    CHECK(pin.get_number() == -1);
    CHECK(pin.get_name() == "INVALID");
    CHECK(pin.to_string() == "INVALID");
    CHECK(pin.get_function() == "");
    CHECK(pin.read() == Level::Low);
    CHECK_FALSE(pin.wait_for_edge(1ms));
    CHECK(pin.get_pull() == Pull::PullNoChange);
    CHECK_THROWS_AS(pin.in(Pull::PullUp, Edge::NoEdge), PinError);
    CHECK_THROWS_AS(pin.out(Level::High), PinError);
    CHECK(&invalid_pin() == &pin);
}

TEST_CASE("pin - optional capabilities") {
    FakePin plain{4};
    RecordingPin streaming{18};

    CHECK(capability<PinStreamer>(plain) == nullptr);
    CHECK(capability<PWMer>(plain) == nullptr);
    CHECK(capability<PinStreamReader>(streaming) == nullptr);
    CHECK(capability<PinStreamer>(invalid_pin()) == nullptr);

    auto* pwm = capability<PWMer>(streaming);
    REQUIRE(pwm != nullptr);
    pwm->pwm(duty_half, 20ms);
    CHECK(streaming.duty == duty_half);
    CHECK(streaming.period == 20ms);

    auto* streamer = capability<PinStreamer>(streaming);
    REQUIRE(streamer != nullptr);
    streamer->stream(BitStream{{0xAA}, 1us});
    REQUIRE(streaming.streams.size() == 1);
    CHECK(streaming.streams[0].get_bits()[0] == 0xAA);
}

TEST_CASE("pin - aliases forward to the real pin") {
    FakePin real{10};
    PinAlias alias{"SPI0_MOSI", real};

    CHECK(alias.get_name() == "SPI0_MOSI");
    CHECK(alias.get_number() == 10);
    CHECK(alias.to_string() == "SPI0_MOSI(GPIO10)");
    CHECK(&alias.get_real() == &real);

    alias.out(Level::High);
    CHECK(real.output);
    CHECK(real.level == Level::High);
    CHECK(alias.read() == Level::High);
    CHECK(alias.get_function() == "Out/High");

    alias.in(Pull::PullDown, Edge::BothEdges);
    CHECK_FALSE(real.output);
    CHECK(alias.get_pull() == Pull::PullDown);
    CHECK_FALSE(alias.wait_for_edge(0ns));

    auto* behind = capability<RealPin>(alias);
    REQUIRE(behind != nullptr);
    CHECK(&behind->get_real() == &real);
    CHECK(capability<RealPin>(real) == nullptr);
}

TEST_CASE("pin - aliases of the invalid pin") {
    PinAlias alias{"UNUSED", invalid_pin()};

    CHECK(alias.get_number() == -1);
    CHECK(alias.to_string() == "UNUSED(INVALID)");
    CHECK_THROWS_AS(alias.out(Level::Low), PinError);
}
