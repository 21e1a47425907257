/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef PINWAVE_ERRORS_HPP
#define PINWAVE_ERRORS_HPP

#include <stdexcept>

namespace Pinwave
{

/**
 * Malformed input: zero mask, empty or mismatched buffers, unbounded loop,
 * incompatible resolution, etc.
 *
 * Always raised synchronously and before any output is written. Retrying the
 * same call can never succeed.
 */
class ConfigurationError : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

/** A value, typically a frequency, lies outside the representable range. */
class RangeError : public std::out_of_range
{
public:
    using std::out_of_range::out_of_range;
};

/** A pin refused an operation. */
class PinError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace Pinwave

#endif // PINWAVE_ERRORS_HPP
