/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef PINWAVE_PIN_HPP
#define PINWAVE_PIN_HPP

#include "defs.hpp"
#include "stream.hpp"
#include <string>

namespace Pinwave
{

/** Identity of a pin of a board or chip. */
class Pin
{
public:
    virtual ~Pin();

    /** Logical pin number, or -1 if not applicable. */
    virtual int get_number() const = 0;

    /** Name of the pin, e.g. "GPIO4". */
    virtual std::string get_name() const = 0;

    /** Function the pin is currently muxed to, e.g. "In/High", "PWM0". */
    virtual std::string get_function() const = 0;

    /** Description of the pin for display, its name by default. */
    virtual std::string to_string() const;
}; // class Pin

/** Digital pin that can be used as an input or an output. */
class PinIO : public Pin
{
public:
    /**
     * Set the pin as an input.
     *
     * @param pull Pull resistor to apply.
     * @param edge Edge detection to enable, for `wait_for_edge()`.
     * @throws PinError If the pin cannot be configured.
     */
    virtual void in(Pull pull, Edge edge) = 0;

    /** Get the current level of the pin. */
    virtual Level read() = 0;

    /**
     * Wait for the edge configured by `in()`.
     *
     * @param timeout Time to wait for, negative to wait forever.
     * @return True if an edge happened, false on timeout.
     */
    virtual bool wait_for_edge(Duration timeout) = 0;

    /** Get the pull resistor currently applied. */
    virtual Pull get_pull() const = 0;

    /**
     * Set the pin as an output at the given level.
     *
     * @throws PinError If the pin cannot be configured.
     */
    virtual void out(Level level) = 0;
}; // class PinIO

/**
 * Pin able to output a stream.
 *
 * Use `capability<PinStreamer>()` to check whether a pin supports this.
 */
class PinStreamer
{
public:
    virtual ~PinStreamer();

    /**
     * Output a stream, blocking until it has been fully sent.
     *
     * @throws ConfigurationError If the stream cannot be rasterized for this
     * pin.
     * @throws PinError If the pin refuses to stream.
     */
    virtual void stream(const Stream& stream) = 0;
}; // class PinStreamer

/** Pin able to sample its input at a fixed rate. */
class PinStreamReader
{
public:
    virtual ~PinStreamReader();

    /**
     * Set the pin as an input and sample it.
     *
     * @param pull Pull resistor to apply.
     * @param resolution Sampling period.
     * @param bits Buffer receiving the samples, LSB-first. Its size
     * determines the number of samples taken.
     * @throws PinError If the pin cannot be sampled.
     */
    virtual void read_stream(Pull pull, Duration resolution, Bits& bits) = 0;
}; // class PinStreamReader

/** Pin able to generate a PWM signal in hardware. */
class PWMer
{
public:
    virtual ~PWMer();

    /**
     * Output a PWM signal.
     *
     * @param duty Proportion of each period spent High.
     * @param period Duration of each period, zero for the pin default.
     * @throws PinError If the pin cannot generate the signal.
     */
    virtual void pwm(Duty duty, Duration period) = 0;
}; // class PWMer

/** Pin which knows the pull resistor it has at power on. */
class DefaultPuller
{
public:
    virtual ~DefaultPuller();
    virtual Pull get_default_pull() const = 0;
}; // class DefaultPuller

/** Alias of another pin. */
class RealPin
{
public:
    virtual ~RealPin();

    /** Get the pin behind the alias. */
    virtual PinIO& get_real() const = 0;
}; // class RealPin

/**
 * Access an optional capability of a pin.
 *
 * @return The same pin through the capability interface, or a null pointer
 * if the pin does not have it.
 */
template<typename Capability>
Capability* capability(PinIO& pin)
{
    return dynamic_cast<Capability*>(&pin);
}

/**
 * Get the invalid pin.
 *
 * It stands for a missing pin: it reads Low, never sees edges and refuses to
 * be configured by throwing `PinError`.
 */
PinIO& invalid_pin();

/** Pin known by another name. */
class PinAlias : public PinIO, public RealPin
{
public:
    /**
     * Create an alias.
     *
     * @param name Name of the alias, e.g. "SPI0_MOSI".
     * @param real Pin behind the alias. Must outlive the alias.
     */
    PinAlias(std::string name, PinIO& real);

    int get_number() const override;
    std::string get_name() const override;
    std::string get_function() const override;

    /** Formatted as `alias(REAL)`. */
    std::string to_string() const override;

    void in(Pull pull, Edge edge) override;
    Level read() override;
    bool wait_for_edge(Duration timeout) override;
    Pull get_pull() const override;
    void out(Level level) override;

    PinIO& get_real() const override;

private:
    std::string name;
    PinIO* real;
}; // class PinAlias

} // namespace Pinwave

#endif // PINWAVE_PIN_HPP
