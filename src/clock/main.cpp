/**
 * @file Compute the clock settings reproducing a frequency.
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "clock_registers.hpp"
#include "divisor.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>

void print_help(std::ostream& out, const char* name)
{
    out << "Usage: " << name << " [-h|--help] FREQ [YMAX]\n";
    out << "Compute the bcm283x clock settings reproducing FREQ hertz.\n";
    out << "YMAX is the largest oversampling divider allowed (default 32).\n";
}

bool is_index(const char* arg)
{
    return *arg != '\0' && std::all_of(
        arg,
        arg + std::strlen(arg),
        [](unsigned char c){ return std::isdigit(c); }
    );
}

inline void next_arg(int& argc, const char**& argv)
{
    --argc;
    ++argv;
}

void print_word(const char* label, std::uint32_t word, const std::string& text)
{
    std::cout << label << ": 0x" << std::hex << std::setw(8)
        << std::setfill('0') << word << std::dec << std::setfill(' ')
        << " (" << text << ")\n";
}

int main(int argc, const char** argv)
{
    const char* name = argv[0];
    next_arg(argc, argv);

    if (argc == 0) {
        print_help(std::cerr, name);
        return EXIT_FAILURE;
    }

    if (argv[0] == std::string("-h") || argv[0] == std::string("--help")) {
        print_help(std::cout, name);
        return EXIT_SUCCESS;
    }

    if (!is_index(argv[0])) {
        std::cerr << "Error: Invalid frequency '" << argv[0] << "'\n";
        return EXIT_FAILURE;
    }

    Pinwave::Hertz hz = 0;
    int y_max = 32;

    try {
        hz = std::stoull(argv[0]);
        next_arg(argc, argv);

        if (argc > 0) {
            if (!is_index(argv[0])) {
                std::cerr << "Error: Invalid divider '" << argv[0] << "'\n";
                return EXIT_FAILURE;
            }

            y_max = std::stoi(argv[0]);
        }
    } catch (const std::out_of_range&) {
        std::cerr << "Error: Value '" << argv[0] << "' is too large\n";
        return EXIT_FAILURE;
    }

    auto profile = Pinwave::ClockProfile::bcm283x();
    Pinwave::ClockDivider divider;

    try {
        divider = Pinwave::select_clock(profile, hz, y_max);
    } catch (const Pinwave::RangeError& err) {
        std::cerr << "Error: " << err.what() << '\n';
        return EXIT_FAILURE;
    } catch (const Pinwave::ConfigurationError& err) {
        std::cerr << "Error: " << err.what() << '\n';
        return EXIT_FAILURE;
    }

    const auto& solution = divider.solution;

    if (solution.is_disabled()) {
        auto control = Pinwave::ClockControl::password
            | Pinwave::ClockControl::kill;

        std::cout << "Clock disabled\n";
        print_word("Control", control, Pinwave::control_to_string(control));
        return EXIT_SUCCESS;
    }

    std::cout << "Source: " << Pinwave::to_string(divider.source) << '\n';
    std::cout << "Divisors: x = " << solution.x
        << ", y = " << solution.y << '\n';
    std::cout << "Achieved: " << solution.achieved_hz << " Hz\n";
    std::cout << "Residual: " << solution.residual_hz << " Hz\n";

    auto control = Pinwave::encode_control(divider.source, true);
    auto divisor = Pinwave::encode_divisor(solution.x);

    print_word("Control", control, Pinwave::control_to_string(control));
    print_word("Divisor", divisor, Pinwave::divisor_to_string(divisor));

    if (solution.residual_hz == 0 && solution.achieved_hz != hz) {
        std::cerr << "\nNo exact divisors for " << hz << " Hz, samples are "
            "oversampled " << solution.achieved_hz / hz << " times.\n";
    }

    return EXIT_SUCCESS;
}
