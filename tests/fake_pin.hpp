/**
 * @file Pin double recording what it is asked to do.
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef PINWAVE_TESTS_FAKE_PIN_HPP
#define PINWAVE_TESTS_FAKE_PIN_HPP

#include "pin.hpp"
#include "stream.hpp"
#include <string>
#include <vector>

namespace Pinwave
{

/** Pin that can only be used for plain input and output. */
class FakePin : public PinIO
{
public:
    explicit FakePin(int number)
    : number(number)
    {}

    int get_number() const override
    {
        return this->number;
    }

    std::string get_name() const override
    {
        return "GPIO" + std::to_string(this->number);
    }

    std::string get_function() const override
    {
        if (this->output) {
            return "Out/" + Pinwave::to_string(this->level);
        }

        return "In/" + Pinwave::to_string(this->level);
    }

    void in(Pull pull, Edge) override
    {
        this->output = false;
        this->pull = pull;
    }

    Level read() override
    {
        return this->level;
    }

    bool wait_for_edge(Duration) override
    {
        return false;
    }

    Pull get_pull() const override
    {
        return this->pull;
    }

    void out(Level level) override
    {
        this->output = true;
        this->level = level;
    }

    int number;
    bool output = false;
    Level level = Level::Low;
    Pull pull = Pull::Float;
}; // class FakePin

/** Pin recording the streams it is asked to output. */
class RecordingPin : public FakePin, public PinStreamer, public PWMer
{
public:
    using FakePin::FakePin;

    void stream(const Stream& stream) override
    {
        const auto* bits = dynamic_cast<const BitStream*>(&stream);

        if (bits != nullptr) {
            this->streams.push_back(*bits);
        }
    }

    void pwm(Duty duty, Duration period) override
    {
        this->duty = duty;
        this->period = period;
    }

    std::vector<BitStream> streams;
    Duty duty = 0;
    Duration period{0};
}; // class RecordingPin

} // namespace Pinwave

#endif // PINWAVE_TESTS_FAKE_PIN_HPP
