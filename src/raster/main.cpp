/**
 * @file Print the set/clear masks produced by rasterizing a stream.
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "defs.hpp"
#include "errors.hpp"
#include "raster.hpp"
#include "stream.hpp"
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <stdexcept>
#include <utility>
#include <vector>

void print_help(std::ostream& out, const char* name)
{
    out << "Usage: " << name << " [-h|--help] [--edges] RES PIN [FILE]\n";
    out << "Rasterize a stream at resolution RES onto pin PIN (0-31) of a\n";
    out << "32-pin GPIO group and print the set/clear mask of each slot.\n";
    out << "FILE holds raw LSB-first bits, or whitespace-separated edge\n";
    out << "durations starting High with --edges. Standard input is read\n";
    out << "if FILE is missing or '-'.\n";
}

inline void next_arg(int& argc, const char**& argv)
{
    --argc;
    ++argv;
}

std::unique_ptr<Pinwave::Stream> read_bits(
    std::istream& in,
    Pinwave::Duration resolution
)
{
    Pinwave::Bits bits{
        std::istreambuf_iterator<char>(in),
        std::istreambuf_iterator<char>()
    };

    return std::make_unique<Pinwave::BitStream>(std::move(bits), resolution);
}

std::unique_ptr<Pinwave::Stream> read_edges(
    std::istream& in,
    Pinwave::Duration resolution
)
{
    std::vector<Pinwave::Duration> edges;
    std::string word;

    while (in >> word) {
        edges.push_back(Pinwave::parse_duration(word));
    }

    return std::make_unique<Pinwave::EdgeStream>(std::move(edges), resolution);
}

int main(int argc, const char** argv)
{
    const char* name = argv[0];
    next_arg(argc, argv);

    if (argc > 0
            && (argv[0] == std::string("-h")
                || argv[0] == std::string("--help"))) {
        print_help(std::cout, name);
        return EXIT_SUCCESS;
    }

    bool edges = false;

    if (argc > 0 && argv[0] == std::string("--edges")) {
        edges = true;
        next_arg(argc, argv);
    }

    if (argc < 2) {
        print_help(std::cerr, name);
        return EXIT_FAILURE;
    }

    Pinwave::Duration resolution{0};
    int pin = 0;

    try {
        resolution = Pinwave::parse_duration(argv[0]);
        next_arg(argc, argv);
        pin = std::stoi(argv[0]);
        next_arg(argc, argv);
    } catch (const Pinwave::ConfigurationError& err) {
        std::cerr << "Error: " << err.what() << '\n';
        return EXIT_FAILURE;
    } catch (const std::invalid_argument&) {
        std::cerr << "Error: Invalid pin '" << argv[0] << "'\n";
        return EXIT_FAILURE;
    } catch (const std::out_of_range&) {
        std::cerr << "Error: Invalid pin '" << argv[0] << "'\n";
        return EXIT_FAILURE;
    }

    if (pin < 0 || pin > 31) {
        std::cerr << "Error: Pin " << pin << " is outside of [0, 31]\n";
        return EXIT_FAILURE;
    }

    std::unique_ptr<Pinwave::Stream> stream;

    try {
        if (argc == 0 || argv[0] == std::string("-")) {
            stream = edges
                ? read_edges(std::cin, resolution)
                : read_bits(std::cin, resolution);
        } else {
            std::ifstream file;
            file.exceptions(std::ifstream::badbit);
            file.open(argv[0], std::ios::binary);

            if (!file) {
                std::cerr << "I/O error: Cannot open '" << argv[0] << "'\n";
                return EXIT_FAILURE;
            }

            stream = edges
                ? read_edges(file, resolution)
                : read_bits(file, resolution);
        }
    } catch (const Pinwave::ConfigurationError& err) {
        std::cerr << "Parse error: " << err.what() << '\n';
        return EXIT_FAILURE;
    } catch (const std::ios_base::failure& err) {
        std::cerr << "I/O error: " << err.what() << '\n';
        return EXIT_FAILURE;
    }

    auto mask = static_cast<std::uint32_t>(1) << pin;

    try {
        Pinwave::RasterBuffer32 buffer{
            std::max<std::size_t>(
                Pinwave::slot_count(*stream, resolution),
                1
            )
        };

        Pinwave::raster(*stream, resolution, buffer, mask, mask);
        std::cerr << "Rasterized " << Pinwave::duration_to_string(
            stream->get_duration()
        ) << " into " << buffer.size() << " slots of "
            << Pinwave::duration_to_string(resolution) << '\n';

        std::cout << std::hex << std::setfill('0');

        for (std::size_t i = 0; i < buffer.size(); ++i) {
            std::cout << std::dec << i << std::hex
                << ": set=0x" << std::setw(8) << buffer.set[i]
                << " clear=0x" << std::setw(8) << buffer.clear[i] << '\n';
        }
    } catch (const Pinwave::ConfigurationError& err) {
        std::cerr << "Error: " << err.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
