/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "defs.hpp"
#include "errors.hpp"
#include <array>
#include <cctype>
#include <cstdint>
#include <limits>
#include <sstream>
#include <utility>

namespace Pinwave
{

auto to_string(Level level) -> std::string
{
    if (level == Level::Low) {
        return "Low";
    }

    return "High";
}

auto to_string(Pull pull) -> std::string
{
    switch (pull) {
    case Pull::Float:
        return "Float";

    case Pull::PullDown:
        return "PullDown";

    case Pull::PullUp:
        return "PullUp";

    case Pull::PullNoChange:
        return "PullNoChange";

    default:
        return "Pull(" + std::to_string(static_cast<int>(pull)) + ")";
    }
}

auto to_string(Edge edge) -> std::string
{
    switch (edge) {
    case Edge::NoEdge:
        return "NoEdge";

    case Edge::RisingEdge:
        return "RisingEdge";

    case Edge::FallingEdge:
        return "FallingEdge";

    case Edge::BothEdges:
        return "BothEdges";

    default:
        return "Edge(" + std::to_string(static_cast<int>(edge)) + ")";
    }
}

auto duty_to_string(Duty duty) -> std::string
{
    constexpr std::uint32_t per_percent = duty_max / 100;
    return std::to_string((static_cast<std::uint32_t>(duty) + 50) / per_percent)
        + "%";
}

namespace
{

/**
 * Parse a decimal integer that spans the whole string.
 *
 * @return False if the string contains anything else than an optional sign
 * followed by digits, or if the value does not fit.
 */
auto parse_integer(const std::string& str, long long& value) -> bool
{
    if (str.empty()) {
        return false;
    }

    std::size_t consumed = 0;

    try {
        value = std::stoll(str, &consumed, 10);
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }

    return consumed == str.size();
}

} // anonymous namespace

auto parse_duty(const std::string& str) -> Duty
{
    auto digits = str;
    bool percent = !digits.empty() && digits.back() == '%';

    if (percent) {
        digits.pop_back();
    }

    long long value = 0;

    if (!parse_integer(digits, value)) {
        throw ConfigurationError("Invalid duty cycle '" + str + "'");
    }

    if (percent) {
        if (value < 0) {
            throw ConfigurationError("Duty must be >= 0%");
        }

        if (value > 100) {
            throw ConfigurationError("Duty must be <= 100%");
        }

        return static_cast<Duty>((value * duty_max + 49) / 100);
    }

    if (value < 0) {
        throw ConfigurationError("Duty must be >= 0");
    }

    if (value > duty_max) {
        std::ostringstream message;
        message << "Duty must be <= " << duty_max;
        throw ConfigurationError(message.str());
    }

    return static_cast<Duty>(value);
}

namespace
{

// Units accepted by parse_duration, two-letter suffixes before "s"
const std::array<std::pair<const char*, std::int64_t>, 4> duration_units{{
    {"ns", 1},
    {"us", 1000},
    {"ms", 1000000},
    {"s", 1000000000},
}};

} // anonymous namespace

auto parse_duration(const std::string& str) -> Duration
{
    if (str == "0") {
        return Duration{0};
    }

    std::int64_t unit = 0;
    std::string number;

    for (const auto& entry : duration_units) {
        std::string suffix_str{entry.first};

        if (
            str.size() > suffix_str.size()
            && str.compare(
                str.size() - suffix_str.size(),
                suffix_str.size(),
                suffix_str
            ) == 0
        ) {
            unit = entry.second;
            number = str.substr(0, str.size() - suffix_str.size());
            break;
        }
    }

    if (unit == 0) {
        throw ConfigurationError(
            "Missing or unknown unit in duration '" + str + "'"
        );
    }

    auto dot = number.find('.');
    std::string whole = number.substr(0, dot);
    std::string fraction = dot == std::string::npos
        ? std::string{}
        : number.substr(dot + 1);

    auto all_digits = [](const std::string& part) {
        for (unsigned char c : part) {
            if (!std::isdigit(c)) {
                return false;
            }
        }

        return true;
    };

    if (
        (whole.empty() && fraction.empty())
        || !all_digits(whole)
        || !all_digits(fraction)
        || (dot != std::string::npos && fraction.empty())
    ) {
        throw ConfigurationError("Invalid duration '" + str + "'");
    }

    long long whole_value = 0;

    if (!whole.empty() && !parse_integer(whole, whole_value)) {
        throw ConfigurationError("Duration '" + str + "' is out of range");
    }

    if (
        whole_value > std::numeric_limits<std::int64_t>::max() / unit
    ) {
        throw ConfigurationError("Duration '" + str + "' is out of range");
    }

    std::int64_t total = whole_value * unit;
    std::int64_t scale = unit;

    // Digits beyond nanosecond precision are dropped
    for (unsigned char c : fraction) {
        scale /= 10;

        if (scale == 0) {
            break;
        }

        total += (c - '0') * scale;
    }

    return Duration{total};
}

auto duration_to_string(Duration duration) -> std::string
{
    auto count = duration.count();

    if (count == 0) {
        return "0s";
    }

    for (auto it = duration_units.crbegin(); it != duration_units.crend(); ++it) {
        if (count % it->second == 0) {
            return std::to_string(count / it->second) + it->first;
        }
    }

    return std::to_string(count) + "ns";
}

} // namespace Pinwave
