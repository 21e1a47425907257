/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "clock_registers.hpp"
#include "errors.hpp"
#include <cerrno>
#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>
#include <endian.h>
#include <fcntl.h>
#include <sys/mman.h>

namespace Pinwave
{

namespace
{

// Time given to the clock manager to latch a register write
constexpr auto settle_time = std::chrono::nanoseconds(10);

auto join(const std::vector<std::string>& parts) -> std::string
{
    std::string result;

    for (const auto& part : parts) {
        if (!result.empty()) {
            result += '|';
        }

        result += part;
    }

    return result;
}

} // anonymous namespace

RegisterWindow::RegisterWindow(void* base, std::size_t size)
: base(static_cast<volatile std::uint32_t*>(base))
, size(size)
{}

auto RegisterWindow::at(std::size_t offset) const -> volatile std::uint32_t*
{
    if (offset % sizeof(std::uint32_t) != 0) {
        std::ostringstream message;
        message << "Register offset 0x" << std::hex << offset
            << " is not aligned on a 32-bit word";
        throw RangeError{message.str()};
    }

    if (offset >= this->size
            || this->size - offset < sizeof(std::uint32_t)) {
        std::ostringstream message;
        message << "Register offset 0x" << std::hex << offset
            << " is outside of the 0x" << this->size << "-byte window";
        throw RangeError{message.str()};
    }

    return this->base + offset / sizeof(std::uint32_t);
}

auto RegisterWindow::read32(std::size_t offset) const -> std::uint32_t
{
    return le32toh(*this->at(offset));
}

void RegisterWindow::write32(std::size_t offset, std::uint32_t value)
{
    *this->at(offset) = htole32(value);
}

auto RegisterWindow::get_size() const -> std::size_t
{
    return this->size;
}

MemoryMap::MemoryMap(const std::string& path, std::size_t size, off_t offset)
: fd(path, O_RDWR | O_SYNC)
, data(nullptr)
, size(size)
{
    void* mmap_res = mmap(
        /* addr = */ nullptr,
        /* len = */ size,
        /* prot = */ PROT_READ | PROT_WRITE,
        /* flags = */ MAP_SHARED,
        /* fd = */ this->fd,
        /* offset = */ offset
    );

    if (mmap_res == MAP_FAILED) {
        throw std::system_error(
            errno,
            std::generic_category(),
            "Map " + path + " to memory"
        );
    }

    this->data = mmap_res;
}

MemoryMap::MemoryMap(MemoryMap&& other) noexcept
: fd(std::move(other.fd))
, data(std::exchange(other.data, nullptr))
, size(std::exchange(other.size, 0))
{}

auto MemoryMap::operator=(MemoryMap&& other) noexcept -> MemoryMap&
{
    if (this != &other) {
        this->unmap();
        this->fd = std::move(other.fd);
        this->data = std::exchange(other.data, nullptr);
        this->size = std::exchange(other.size, 0);
    }

    return *this;
}

MemoryMap::~MemoryMap()
{
    this->unmap();
}

void MemoryMap::unmap() noexcept
{
    if (this->data != nullptr) {
        munmap(this->data, this->size);
        this->data = nullptr;
    }
}

auto MemoryMap::get_window() const -> RegisterWindow
{
    return RegisterWindow{this->data, this->size};
}

auto MemoryMap::get_size() const -> std::size_t
{
    return this->size;
}

auto encode_control(ClockSource source, bool enable) -> std::uint32_t
{
    auto result = ClockControl::password
        | (static_cast<std::uint32_t>(source) & ClockControl::source_mask);

    if (enable) {
        result |= ClockControl::enable;
    }

    return result;
}

auto encode_divisor(int integer, int fraction) -> std::uint32_t
{
    if (integer < 1 || integer > ClockDivisor::integer_max) {
        std::ostringstream message;
        message << "Clock divisor " << integer << " is outside of [1, "
            << ClockDivisor::integer_max << "]";
        throw RangeError{message.str()};
    }

    if (fraction < 0
            || static_cast<std::uint32_t>(fraction)
                > ClockDivisor::fraction_mask) {
        std::ostringstream message;
        message << "Clock divisor fraction " << fraction
            << " is outside of [0, " << ClockDivisor::fraction_mask << "]";
        throw RangeError{message.str()};
    }

    return ClockDivisor::password
        | (static_cast<std::uint32_t>(integer) << ClockDivisor::integer_shift)
        | static_cast<std::uint32_t>(fraction);
}

auto control_to_string(std::uint32_t control) -> std::string
{
    std::vector<std::string> parts;

    if ((control & ClockControl::password_mask) == ClockControl::password) {
        parts.emplace_back("PWD");
        control &= ~ClockControl::password_mask;
    }

    switch (control & ClockControl::mash_mask) {
    case ClockControl::mash1: parts.emplace_back("Mash1"); break;
    case ClockControl::mash2: parts.emplace_back("Mash2"); break;
    case ClockControl::mash3: parts.emplace_back("Mash3"); break;
    default: break;
    }

    control &= ~ClockControl::mash_mask;

    constexpr std::pair<std::uint32_t, const char*> flags[] = {
        {ClockControl::flip, "Flip"},
        {ClockControl::busy, "Busy"},
        {ClockControl::kill, "Kill"},
        {ClockControl::enable, "Enable"},
    };

    for (const auto& flag : flags) {
        if (control & flag.first) {
            parts.emplace_back(flag.second);
            control &= ~flag.first;
        }
    }

    parts.push_back(to_string(
        static_cast<ClockSource>(control & ClockControl::source_mask)
    ));
    control &= ~ClockControl::source_mask;

    if (control != 0) {
        parts.push_back("ClockControl(" + std::to_string(control) + ")");
    }

    return join(parts);
}

auto divisor_to_string(std::uint32_t divisor) -> std::string
{
    auto integer = (divisor & ClockDivisor::integer_mask)
        >> ClockDivisor::integer_shift;
    auto rest = divisor & ~ClockDivisor::integer_mask
        & ~ClockControl::password_mask;

    std::ostringstream result;
    result << integer << '.';

    if (rest == 0) {
        result << '0';
    } else {
        result << '(' << rest << '/' << ClockDivisor::integer_max << ')';
    }

    return result.str();
}

auto to_string(ClockID clock) -> std::string
{
    switch (clock) {
    case ClockID::GP0: return "GP0";
    case ClockID::GP1: return "GP1";
    case ClockID::GP2: return "GP2";
    case ClockID::PCM: return "PCM";
    case ClockID::PWM: return "PWM";
    }

    return "Clock(" + std::to_string(static_cast<int>(clock)) + ")";
}

auto control_offset(ClockID clock) -> std::size_t
{
    switch (clock) {
    case ClockID::GP0: return 0x70;
    case ClockID::GP2: return 0x80;
    case ClockID::PCM: return 0x98;
    case ClockID::PWM: return 0xA0;
    case ClockID::GP1: break;
    }

    throw ConfigurationError{
        "Clock " + to_string(clock) + " is reserved and cannot be changed"
    };
}

ClockRegisters::ClockRegisters(
    RegisterWindow window,
    ClockProfile profile,
    int busy_polls
)
: window(window)
, profile(profile)
, busy_polls(busy_polls)
{}

auto ClockRegisters::set(ClockID clock, Hertz hz, int y_max) -> ClockDivider
{
    if (hz == 0) {
        this->stop(clock);
        return ClockDivider{};
    }

    auto divider = select_clock(this->profile, hz, y_max);
    this->set_raw(clock, divider.source, divider.solution.x);

    if (divider.solution.residual_hz != 0) {
        std::cerr << "[clock] " << to_string(clock) << " set to "
            << divider.solution.achieved_hz << " Hz for a requested "
            << hz << " Hz (off by " << divider.solution.residual_hz
            << " Hz)\n";
    }

    return divider;
}

void ClockRegisters::set_raw(ClockID clock, ClockSource source, int divisor)
{
    auto offset = control_offset(clock);
    auto divisor_word = encode_divisor(divisor);

    if (source != this->profile.clean.source
            && source != this->profile.fast.source) {
        throw ConfigurationError{
            "Clock source " + to_string(source) + " cannot be used"
        };
    }

    // TODO: Skip stopping the clock when it already runs at the right rate
    this->stop(clock);

    this->write_register(clock, offset + 4, divisor_word);
    std::this_thread::sleep_for(settle_time);

    this->write_register(clock, offset, encode_control(source, false));
    std::this_thread::sleep_for(settle_time);

    this->write_register(clock, offset, encode_control(source, true));

    auto readback = this->window.read32(offset + 4)
        & ~ClockControl::password_mask;

    if (readback != (divisor_word & ~ClockControl::password_mask)) {
        throw std::runtime_error{
            "Cannot write to the divisor register of clock "
            + to_string(clock)
        };
    }
}

void ClockRegisters::stop(ClockID clock)
{
    auto offset = control_offset(clock);
    this->write_register(
        clock, offset,
        ClockControl::password | ClockControl::kill
    );

    for (int poll = 0; poll < this->busy_polls; ++poll) {
        if (!(this->window.read32(offset) & ClockControl::busy)) {
            return;
        }

        this->write_register(
            clock, offset,
            ClockControl::password | ClockControl::kill
        );
    }

    throw std::runtime_error{
        "Clock " + to_string(clock) + " is still busy after being killed"
    };
}

auto ClockRegisters::get_control(ClockID clock) const -> std::uint32_t
{
    return this->window.read32(control_offset(clock));
}

auto ClockRegisters::get_divisor(ClockID clock) const -> std::uint32_t
{
    return this->window.read32(control_offset(clock) + 4);
}

auto ClockRegisters::describe(ClockID clock) const -> std::string
{
    return "{" + control_to_string(this->get_control(clock))
        + ", " + divisor_to_string(this->get_divisor(clock)) + "}";
}

void ClockRegisters::write_register(
    ClockID clock,
    std::size_t offset,
    std::uint32_t value
)
{
#ifdef ENABLE_CLOCK_TRACE
    std::cerr << "[clock] " << to_string(clock) << " +0x" << std::hex
        << offset << " <- 0x" << value << std::dec << '\n';
#else
    (void) clock;
#endif // ENABLE_CLOCK_TRACE

    this->window.write32(offset, value);
}

} // namespace Pinwave
