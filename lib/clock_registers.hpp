/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef PINWAVE_CLOCK_REGISTERS_HPP
#define PINWAVE_CLOCK_REGISTERS_HPP

#include "divisor.hpp"
#include "file_descriptor.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <sys/types.h>

namespace Pinwave
{

/**
 * View over a block of memory-mapped registers.
 *
 * Registers are addressed by their byte offset from the start of the block
 * and stored little-endian. The window does not own the memory it views.
 */
class RegisterWindow
{
public:
    /**
     * Create a window.
     *
     * @param base Start of the block, aligned on 4 bytes.
     * @param size Size of the block in bytes.
     */
    RegisterWindow(void* base, std::size_t size);

    /**
     * Read a 32-bit register.
     *
     * @throws RangeError If the offset is misaligned or out of the window.
     */
    std::uint32_t read32(std::size_t offset) const;

    /**
     * Write a 32-bit register.
     *
     * @throws RangeError If the offset is misaligned or out of the window.
     */
    void write32(std::size_t offset, std::uint32_t value);

    /** Get the size of the window in bytes. */
    std::size_t get_size() const;

private:
    volatile std::uint32_t* base;
    std::size_t size;

    volatile std::uint32_t* at(std::size_t offset) const;
}; // class RegisterWindow

/** Shared mapping of a file or device into memory, e.g. `/dev/mem`. */
class MemoryMap
{
public:
    /**
     * Map a file.
     *
     * @param path Path of the file to map.
     * @param size Number of bytes to map.
     * @param offset Offset of the mapping in the file, multiple of the page
     * size.
     * @throws std::system_error If opening or mapping fails.
     */
    MemoryMap(const std::string& path, std::size_t size, off_t offset = 0);

    // No copies, only allow moves
    MemoryMap(const MemoryMap&) = delete;
    MemoryMap& operator=(const MemoryMap&) = delete;
    MemoryMap(MemoryMap&& other) noexcept;
    MemoryMap& operator=(MemoryMap&& other) noexcept;

    /** Unmap the file. */
    ~MemoryMap();

    /** Get a register window spanning the whole mapping. */
    RegisterWindow get_window() const;

    /** Get the number of mapped bytes. */
    std::size_t get_size() const;

private:
    FileDescriptor fd;
    void* data;
    std::size_t size;

    void unmap() noexcept;
}; // class MemoryMap

/**
 * Clock control register (CM_xxCTL) flags.
 *
 * The control register must not be changed while the clock is busy or a
 * glitch may occur.
 */
namespace ClockControl
{

// Must be written in bits 31:24 for any write to be accepted
constexpr std::uint32_t password = 0x5Au << 24;
constexpr std::uint32_t password_mask = 0xFFu << 24;

// Noise shaping of the fractional divider, MASH 3 has the highest spread
constexpr std::uint32_t mash_mask = 3u << 9;
constexpr std::uint32_t mash1 = 1u << 9;
constexpr std::uint32_t mash2 = 2u << 9;
constexpr std::uint32_t mash3 = 3u << 9;

constexpr std::uint32_t flip = 1u << 8;
constexpr std::uint32_t busy = 1u << 7;
constexpr std::uint32_t kill = 1u << 5;
constexpr std::uint32_t enable = 1u << 4;
constexpr std::uint32_t source_mask = 0xFu;

} // namespace ClockControl

/** Clock divisor register (CM_xxDIV) fields, 12.12 fixed point. */
namespace ClockDivisor
{

constexpr std::uint32_t password = 0x5Au << 24;
constexpr unsigned integer_shift = 12;
constexpr int integer_max = (1 << 12) - 1;
constexpr std::uint32_t integer_mask =
    static_cast<std::uint32_t>(integer_max) << integer_shift;
constexpr std::uint32_t fraction_mask = (1u << 12) - 1;

} // namespace ClockDivisor

/**
 * Build a control register value.
 *
 * @param source Clock source to select.
 * @param enable Whether to start the clock.
 */
std::uint32_t encode_control(ClockSource source, bool enable);

/**
 * Build a divisor register value.
 *
 * The fractional part adds a significant amount of noise and should be
 * avoided.
 *
 * @param integer Integer part of the divisor.
 * @param fraction Fractional part of the divisor, in 4096ths.
 * @throws RangeError If a part does not fit its field.
 */
std::uint32_t encode_divisor(int integer, int fraction = 0);

/** Describe a control register value, e.g. "PWD|Enable|19.2MHz". */
std::string control_to_string(std::uint32_t control);

/** Describe a divisor register value, e.g. "12.0" or "12.(5/4095)". */
std::string divisor_to_string(std::uint32_t divisor);

/** General-purpose and peripheral clocks of the clock manager. */
enum class ClockID
{
    GP0,

    // Used by the Ethernet controller, never touched
    GP1,

    GP2,
    PCM,
    PWM,
};

/** Get a human-readable name for a clock. */
std::string to_string(ClockID);

/**
 * Get the offset of the control register of a clock.
 *
 * The divisor register follows at the next word.
 *
 * @throws ConfigurationError For GP1, which is reserved.
 */
std::size_t control_offset(ClockID clock);

/**
 * Programs the clocks of a bcm283x-style clock manager.
 *
 * Concurrent streams must not share a clock; use a `ResourceRegistry` to
 * coordinate users.
 */
class ClockRegisters
{
public:
    // Number of polls of the busy flag before giving up on stopping a clock
    static constexpr int default_busy_polls = 100000;

    /**
     * Wrap the registers of a clock manager.
     *
     * @param window Window starting at the clock manager base.
     * @param profile Sources and limits of the clocks.
     * @param busy_polls Number of polls of the busy flag before giving up
     * on stopping a clock.
     */
    explicit ClockRegisters(
        RegisterWindow window,
        ClockProfile profile = ClockProfile::bcm283x(),
        int busy_polls = default_busy_polls
    );

    /**
     * Set a clock to a frequency, or the closest one possible.
     *
     * @param clock Clock to change.
     * @param hz Desired frequency, zero to stop the clock.
     * @param y_max Largest oversampling divider the caller can apply.
     * @return Applied source and dividers. The clock runs at
     * `achieved_hz * y`, the caller divides it further by `y`.
     * @throws RangeError If the frequency is too high.
     * @throws ConfigurationError If the clock is reserved.
     * @throws std::runtime_error If the clock could not be stopped or the
     * divisor could not be written.
     */
    ClockDivider set(ClockID clock, Hertz hz, int y_max);

    /**
     * Set a clock to a source and integer divisor.
     *
     * @throws RangeError If the divisor does not fit the register.
     * @throws ConfigurationError If the source is not one of the profile
     * sources, or the clock is reserved.
     * @throws std::runtime_error If the clock could not be stopped or the
     * divisor could not be written.
     */
    void set_raw(ClockID clock, ClockSource source, int divisor);

    /**
     * Stop a clock and wait for it to be idle.
     *
     * @throws std::runtime_error If the clock stays busy.
     */
    void stop(ClockID clock);

    /** Get the current value of the control register of a clock. */
    std::uint32_t get_control(ClockID clock) const;

    /** Get the current value of the divisor register of a clock. */
    std::uint32_t get_divisor(ClockID clock) const;

    /** Describe the registers of a clock, e.g. "{PWD|19.2MHz, 12.0}". */
    std::string describe(ClockID clock) const;

private:
    RegisterWindow window;
    ClockProfile profile;
    int busy_polls;

    void write_register(ClockID clock, std::size_t offset, std::uint32_t value);
}; // class ClockRegisters

} // namespace Pinwave

#endif // PINWAVE_CLOCK_REGISTERS_HPP
