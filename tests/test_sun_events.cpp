/// @file test_sun_events.cpp
/// @brief Unit tests for the equation of time and the rise/transit/set solver.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/geocentric_sun.hpp"
#include "astro/sun_events.hpp"
#include "astro/time_scale.hpp"
#include "core/types.hpp"

#include <cmath>

using namespace helios;
using namespace helios::astro;

// =================================================================
// Sites
// =================================================================

/// NREL SPA report example: Golden, Colorado, 2003-10-17, ΔT = 67 s
static constexpr EventSite kGolden{
    .longitude             = -105.1786,
    .latitude              = 39.742476,
    .timezone_h            = -7.0,
    .delta_t               = 67.0,
    .refraction_at_horizon = 0.5667,
};

static constexpr EventSite kDetroit{
    .longitude             = -83.045753,
    .latitude              = 42.331429,
    .timezone_h            = -4.0,
    .delta_t               = 69.184,
    .refraction_at_horizon = 0.5667,
};

static constexpr f64 kSecondInHours = 1.0 / 3600.0;

// =================================================================
// Three-day interpolation
// =================================================================

TEST_CASE("Interpolation at n = 0 returns the current sample")
{
    const DaySamples s{.previous = 10.0, .current = 11.0, .next = 12.0};
    CHECK(interpolate_day_samples(s, 0.0) == 11.0);
}

TEST_CASE("Interpolation of a linear series is linear")
{
    const DaySamples s{.previous = 10.0, .current = 11.0, .next = 12.0};
    CHECK(interpolate_day_samples(s, 0.5) == doctest::Approx(11.5));
    CHECK(interpolate_day_samples(s, -0.25) == doctest::Approx(10.75));
}

TEST_CASE("Interpolation follows the curvature of the samples")
{
    const DaySamples s{.previous = -0.5, .current = 0.0, .next = 0.7};
    // y = y2 + n/2 (a + b + n c) with a = 0.5, b = 0.7, c = 0.2
    CHECK(interpolate_day_samples(s, 0.5) == doctest::Approx(0.325));
}

TEST_CASE("Right ascension wrapping through 360 interpolates across the wrap")
{
    const DaySamples s{.previous = 359.5, .current = 0.48, .next = 1.46};
    CHECK(interpolate_day_samples(s, 0.5) == doctest::Approx(0.97));
}

TEST_CASE("interpolate_rts advances sidereal time at the sidereal rate")
{
    const DaySamples alpha{.previous = 201.0, .current = 202.0, .next = 203.0};
    const DaySamples delta{.previous = -9.0, .current = -9.4, .next = -9.8};

    const RtsSample sample = interpolate_rts(alpha, delta, 25.0, 0.5, -105.0, 40.0, 0.0);

    CHECK(sample.sidereal_time == doctest::Approx(25.0 + 360.985647 * 0.5));
    CHECK(sample.right_ascension == doctest::Approx(202.5));
    CHECK(sample.declination == doctest::Approx(-9.6));
    CHECK(sample.hour_angle > -180.0);
    CHECK(sample.hour_angle <= 180.0);
}

// =================================================================
// Equation of time
// =================================================================

TEST_CASE("Equation of time at the NREL reference instant")
{
    const f64 eot = SunEventSolver::equation_of_time(
        0.0037927819922933584, 202.22740782720712, -0.003998404303332777, 23.440464519617525);

    CHECK(std::abs(eot - 14.641511) < 1e-6);
}

TEST_CASE("Equation of time follows its yearly extremes")
{
    const auto eot_on = [](i32 month, i32 day) {
        const DateTime date{.year = 2019, .month = month, .day = day, .hour = 12};
        const GeocentricSolution g = GeocentricSun::solve(TimeScale::julian_day(date, 0.0, 0.0), 69.0);
        return SunEventSolver::equation_of_time(
            g.time.jme, g.right_ascension, g.nutation.longitude, g.true_obliquity);
    };

    CHECK(eot_on(2, 11) < -14.0);
    CHECK(eot_on(11, 3) > 16.0);

    for (i32 month = 1; month <= 12; ++month)
    {
        for (i32 day = 1; day <= 28; day += 3)
        {
            const f64 eot = eot_on(month, day);
            CHECK(eot > -20.0);
            CHECK(eot < 20.0);
        }
    }
}

TEST_CASE("Sun mean longitude at J2000.0")
{
    CHECK(SunEventSolver::sun_mean_longitude(0.0) == doctest::Approx(280.4664567));
}

// =================================================================
// Rise/set hour angle
// =================================================================

TEST_CASE("Rise/set hour angle on the equator at equinox")
{
    const auto h0 = SunEventSolver::rise_set_hour_angle(0.0, 0.0, 0.0);
    REQUIRE(h0.has_value());
    CHECK(*h0 == doctest::Approx(90.0));

    const auto refracted = SunEventSolver::rise_set_hour_angle(0.0, 0.0, -0.83337);
    REQUIRE(refracted.has_value());
    CHECK(*refracted == doctest::Approx(90.83337));
}

TEST_CASE("Rise/set hour angle is absent during polar night and polar day")
{
    CHECK_FALSE(SunEventSolver::rise_set_hour_angle(89.0, -23.4, -0.83337).has_value());
    CHECK_FALSE(SunEventSolver::rise_set_hour_angle(89.0, 23.4, -0.83337).has_value());
    CHECK_FALSE(SunEventSolver::rise_set_hour_angle(-80.0, -23.4, -0.83337).has_value());
}

// =================================================================
// Sunrise / transit / sunset
// =================================================================

TEST_CASE("Events at the NREL reference site")
{
    const DateTime date{.year = 2003, .month = 10, .day = 17, .hour = 12, .minute = 30, .second = 30.0};
    const SunEvents events = SunEventSolver::solve(date, kGolden);

    // Published as 06:12:43, 11:46:04 and 17:20:19 local time (truncated seconds)
    const f64 sunrise = 6.0 + 12.0 / 60.0 + 43.0 / 3600.0;
    const f64 transit = 11.0 + 46.0 / 60.0 + 4.0 / 3600.0;
    const f64 sunset  = 17.0 + 20.0 / 60.0 + 19.0 / 3600.0;

    CHECK(events.sunrise >= sunrise);
    CHECK(events.sunrise < sunrise + kSecondInHours);
    CHECK(events.transit >= transit);
    CHECK(events.transit < transit + kSecondInHours);
    CHECK(events.sunset >= sunset);
    CHECK(events.sunset < sunset + kSecondInHours);

    CHECK(std::abs(events.sunrise_hour_angle - (-83.496338)) < 1e-5);
    CHECK(std::abs(events.sunset_hour_angle - 83.524274) < 1e-5);
    CHECK(std::abs(events.transit_altitude - 40.954407) < 1e-5);
}

TEST_CASE("Events only depend on the calendar date, not the time of day")
{
    const DateTime morning{.year = 2019, .month = 7, .day = 2, .hour = 1};
    const DateTime evening{.year = 2019, .month = 7, .day = 2, .hour = 22};

    const SunEvents a = SunEventSolver::solve(morning, kDetroit);
    const SunEvents b = SunEventSolver::solve(evening, kDetroit);

    CHECK(a.transit == b.transit);
    CHECK(a.sunrise == b.sunrise);
    CHECK(a.sunset == b.sunset);
}

TEST_CASE("Detroit, 2019-07-02")
{
    const DateTime date{.year = 2019, .month = 7, .day = 2, .hour = 22};
    const SunEvents events = SunEventSolver::solve(date, kDetroit);

    CHECK(std::abs(events.transit - 13.604236) < 1e-5);
    CHECK(std::abs(events.sunrise - 5.994654) < 1e-5);
    CHECK(std::abs(events.sunset - 21.212728) < 1e-5);
    CHECK(events.sunrise < events.transit);
    CHECK(events.transit < events.sunset);
}

TEST_CASE("Polar night and polar day report the sentinel for every event")
{
    const EventSite arctic{
        .longitude             = 0.0,
        .latitude              = 89.0,
        .timezone_h            = 0.0,
        .delta_t               = 0.0,
        .refraction_at_horizon = 0.5667,
    };

    for (const DateTime& date : {DateTime{.year = 2019, .month = 12, .day = 21},
                                 DateTime{.year = 2019, .month = 6, .day = 21}})
    {
        const SunEvents events = SunEventSolver::solve(date, arctic);

        CHECK(events.transit == astro_constants::kEventSentinel);
        CHECK(events.sunrise == astro_constants::kEventSentinel);
        CHECK(events.sunset == astro_constants::kEventSentinel);
        CHECK(events.sunrise_hour_angle == astro_constants::kEventSentinel);
        CHECK(events.sunset_hour_angle == astro_constants::kEventSentinel);
        CHECK(events.transit_altitude == astro_constants::kEventSentinel);
    }
}
