/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "pin.hpp"
#include "errors.hpp"
#include <utility>

namespace Pinwave
{

Pin::~Pin()
{}

auto Pin::to_string() const -> std::string
{
    return this->get_name();
}

PinStreamer::~PinStreamer()
{}

PinStreamReader::~PinStreamReader()
{}

PWMer::~PWMer()
{}

DefaultPuller::~DefaultPuller()
{}

RealPin::~RealPin()
{}

namespace
{

class InvalidPin : public PinIO
{
public:
    int get_number() const override
    {
        return -1;
    }

    std::string get_name() const override
    {
        return "INVALID";
    }

    std::string get_function() const override
    {
        return "";
    }

    void in(Pull, Edge) override
    {
        throw PinError{"Invalid pin"};
    }

    Level read() override
    {
        return Level::Low;
    }

    bool wait_for_edge(Duration) override
    {
        return false;
    }

    Pull get_pull() const override
    {
        return Pull::PullNoChange;
    }

    void out(Level) override
    {
        throw PinError{"Invalid pin"};
    }
}; // class InvalidPin

} // anonymous namespace

auto invalid_pin() -> PinIO&
{
    static InvalidPin pin;
    return pin;
}

PinAlias::PinAlias(std::string name, PinIO& real)
: name(std::move(name))
, real(&real)
{}

auto PinAlias::get_number() const -> int
{
    return this->real->get_number();
}

auto PinAlias::get_name() const -> std::string
{
    return this->name;
}

auto PinAlias::get_function() const -> std::string
{
    return this->real->get_function();
}

auto PinAlias::to_string() const -> std::string
{
    return this->name + "(" + this->real->get_name() + ")";
}

void PinAlias::in(Pull pull, Edge edge)
{
    this->real->in(pull, edge);
}

auto PinAlias::read() -> Level
{
    return this->real->read();
}

auto PinAlias::wait_for_edge(Duration timeout) -> bool
{
    return this->real->wait_for_edge(timeout);
}

auto PinAlias::get_pull() const -> Pull
{
    return this->real->get_pull();
}

void PinAlias::out(Level level)
{
    this->real->out(level);
}

auto PinAlias::get_real() const -> PinIO&
{
    return *this->real;
}

} // namespace Pinwave
