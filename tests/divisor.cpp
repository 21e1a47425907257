/**
 * @file
 * SPDX-FileCopyrightText: 2026 The pinwave authors
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "divisor.hpp"
#include "errors.hpp"
#include <doctest/doctest.h>

using namespace Pinwave;

namespace
{

constexpr Hertz oscillator = 19200000;
constexpr Hertz plld = 500000000;
constexpr Hertz src_192mhz = 192000000;
constexpr int x_max = 4095;

void check_solution(
    const DivisorSolution& solution,
    int x,
    int y,
    Hertz achieved_hz,
    Hertz residual_hz
)
{
    CHECK(solution.x == x);
    CHECK(solution.y == y);
    CHECK(solution.achieved_hz == achieved_hz);
    CHECK(solution.residual_hz == residual_hz);
}

} // anonymous namespace

TEST_CASE("divisor - exact search prefers large first dividers") {
    auto solution = find_divisor_exact(src_192mhz, 6000000, x_max, 32);
    REQUIRE(solution.has_value());
    check_solution(*solution, 32, 1, 6000000, 0);

    solution = find_divisor_exact(oscillator, 1000, x_max, 32);
    REQUIRE(solution.has_value());
    check_solution(*solution, 3840, 5, 1000, 0);

    solution = find_divisor_exact(plld, 1000000, x_max, 32);
    REQUIRE(solution.has_value());
    check_solution(*solution, 500, 1, 1000000, 0);
}

TEST_CASE("divisor - exact search fails without an exact pair") {
    CHECK_FALSE(find_divisor_exact(src_192mhz, 216 * 7, x_max, 32));
    CHECK_FALSE(find_divisor_exact(src_192mhz, 1, x_max, 32));
    CHECK_FALSE(find_divisor_exact(src_192mhz, 0, x_max, 32));
}

TEST_CASE("divisor - exact matches") {
    check_solution(
        solve_divider(src_192mhz, 6000000, x_max, 32),
        32, 1, 6000000, 0
    );
    check_solution(
        solve_divider(plld, 1000000, x_max, 32),
        500, 1, 1000000, 0
    );
    check_solution(
        solve_divider(oscillator, 2400000, x_max, 32),
        8, 1, 2400000, 0
    );
    check_solution(
        solve_divider(oscillator, 1000, x_max, 32),
        3840, 5, 1000, 0
    );
    check_solution(
        solve_divider(src_192mhz, 100000, x_max, 32),
        1920, 1, 100000, 0
    );
    check_solution(
        solve_divider(src_192mhz, 120000, x_max, 32),
        1600, 1, 120000, 0
    );
    check_solution(
        solve_divider(src_192mhz, 125000, x_max, 32),
        1536, 1, 125000, 0
    );
}

TEST_CASE("divisor - oversampled matches") {
    SUBCASE("low frequencies are oversampled") {
        check_solution(
            solve_divider(src_192mhz, 1465, x_max, 32),
            2427, 27, 2930, 0
        );
        check_solution(
            solve_divider(src_192mhz, 1000, x_max, 32),
            4000, 24, 2000, 0
        );
        check_solution(
            solve_divider(src_192mhz, 1, x_max, 32),
            4000, 32, 1500, 0
        );
        check_solution(
            solve_divider(src_192mhz, 1, x_max, 33),
            4000, 32, 1500, 0
        );
        check_solution(
            solve_divider(oscillator, 3, x_max, 32),
            4000, 32, 150, 0
        );
    }

    SUBCASE("frequencies with a direct match are not oversampled") {
        check_solution(
            solve_divider(src_192mhz, 1500, x_max, 32),
            4000, 32, 1500, 0
        );
        check_solution(
            solve_divider(src_192mhz, 2000, x_max, 32),
            4000, 24, 2000, 0
        );
        check_solution(
            solve_divider(src_192mhz, 2500, x_max, 32),
            3840, 20, 2500, 0
        );
        check_solution(
            solve_divider(src_192mhz, 3000, x_max, 32),
            4000, 16, 3000, 0
        );
        check_solution(
            solve_divider(src_192mhz, 10000, x_max, 32),
            3840, 5, 10000, 0
        );
    }
}

TEST_CASE("divisor - approximate matches") {
    SUBCASE("slowest clock") {
        check_solution(
            solve_divider(src_192mhz, src_192mhz / 4095, x_max, 33),
            89, 23, 93795, 23
        );
        check_solution(
            solve_divider(src_192mhz, src_192mhz / 4095, x_max, 32),
            89, 23, 93795, 23
        );
    }

    SUBCASE("never undershoots twice the target") {
        auto solution = solve_divider(plld, 2400000, x_max, 32);
        check_solution(solution, 13, 8, 4807692, 7692);
        CHECK(solution.achieved_hz >= 2 * 2400000);
        CHECK_FALSE(solution.is_exact());
    }

    SUBCASE("closest pair below when nothing reaches the target") {
        auto solution = solve_divider(1000, 600, 4, 2);
        check_solution(solution, 1, 1, 1000, 200);
    }
}

TEST_CASE("divisor - solutions are deterministic") {
    auto first = solve_divider(plld, 46886, x_max, 32);
    auto second = solve_divider(plld, 46886, x_max, 32);
    CHECK(first.x == second.x);
    CHECK(first.y == second.y);
    CHECK(first.achieved_hz == second.achieved_hz);
    CHECK(first.residual_hz == second.residual_hz);
}

TEST_CASE("divisor - zero frequency disables the clock") {
    auto solution = solve_divider(src_192mhz, 0, x_max, 32);
    CHECK(solution.is_disabled());
    check_solution(solution, 0, 0, 0, 0);
}

TEST_CASE("divisor - invalid ranges") {
    CHECK_THROWS_AS(solve_divider(src_192mhz, 1000, 10, 32), ConfigurationError);
    CHECK_THROWS_AS(solve_divider(src_192mhz, 1000, 0, 0), ConfigurationError);
    CHECK_THROWS_AS(solve_divider(src_192mhz, 1000, x_max, 0), ConfigurationError);
    CHECK_THROWS_AS(solve_divider(0, 1000, x_max, 32), RangeError);
    CHECK_THROWS_AS(find_divisor_exact(src_192mhz, 1000, 8, 9), ConfigurationError);
}

TEST_CASE("divisor - clock selection") {
    auto profile = ClockProfile::bcm283x();

    SUBCASE("clean reference when exact") {
        auto divider = select_clock(profile, 2400000, 32);
        CHECK(divider.source == ClockSource::Oscillator);
        check_solution(divider.solution, 8, 1, 2400000, 0);
    }

    SUBCASE("fast reference when only it is exact") {
        auto divider = select_clock(profile, 1000000, 32);
        CHECK(divider.source == ClockSource::PLLD);
        check_solution(divider.solution, 500, 1, 1000000, 0);
    }

    SUBCASE("fast reference on equal residuals") {
        auto divider = select_clock(profile, 3867, 32);
        CHECK(divider.source == ClockSource::PLLD);
        check_solution(divider.solution, 2229, 29, 7735, 1);
    }

    SUBCASE("clean reference when strictly closer") {
        auto divider = select_clock(profile, 95983, 32);
        CHECK(divider.source == ClockSource::Oscillator);
        check_solution(divider.solution, 10, 10, 192000, 34);
    }

    SUBCASE("fast reference when strictly closer") {
        auto divider = select_clock(profile, 4252, 32);
        CHECK(divider.source == ClockSource::PLLD);
        check_solution(divider.solution, 2556, 23, 8505, 1);
    }

    SUBCASE("disabled") {
        auto divider = select_clock(profile, 0, 32);
        CHECK(divider.source == ClockSource::Ground);
        CHECK(divider.solution.is_disabled());
    }

    SUBCASE("above the ceiling") {
        CHECK_THROWS_AS(select_clock(profile, 25000001, 32), RangeError);
    }
}

TEST_CASE("divisor - clock source names") {
    CHECK(to_string(ClockSource::Oscillator) == "19.2MHz");
    CHECK(to_string(ClockSource::PLLD) == "PLLD(500MHz)");
    CHECK(to_string(static_cast<ClockSource>(12)) == "GND(12)");
}
