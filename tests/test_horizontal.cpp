/// @file test_horizontal.cpp
/// @brief Unit tests for the topocentric, refraction and surface-angle stages.
///
/// Geocentric inputs are those of the NREL SPA report example
/// (2003-10-17 12:30:30 UTC-7, Golden, Colorado).

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/refraction.hpp"
#include "astro/surface_angles.hpp"
#include "astro/topocentric.hpp"
#include "core/types.hpp"

#include <cmath>
#include <random>

using namespace helios;
using namespace helios::astro;

// =================================================================
// Reference geocentric state and site
// =================================================================

static constexpr f64 kNu     = 318.5119098411589;
static constexpr f64 kAlpha  = 202.22740782720712;
static constexpr f64 kDelta  = -9.314340090849058;
static constexpr f64 kRadius = 0.9965422973539708;

static constexpr ObserverSite kGolden{
    .longitude = -105.1786,
    .latitude  = 39.742476,
    .elevation = 1830.14,
};

static constexpr AtmosphericConditions kGoldenAir{
    .pressure_mbar         = 820.0,
    .temperature_c         = 11.0,
    .refraction_at_horizon = 0.5667,
};

static TopocentricPosition golden_topocentric()
{
    return TopocentricCorrection::apply(kGolden, kNu, kAlpha, kDelta, kRadius);
}

// =================================================================
// Topocentric correction
// =================================================================

TEST_CASE("Observer hour angle and horizontal parallax")
{
    CHECK(std::abs(TopocentricCorrection::observer_hour_angle(kNu, kGolden.longitude, kAlpha)
                   - 11.105902) < 1e-6);
    CHECK(std::abs(TopocentricCorrection::equatorial_horizontal_parallax(kRadius) - 0.002451) < 1e-6);
}

TEST_CASE("Observer hour angle wraps into [0, 360)")
{
    const f64 h = TopocentricCorrection::observer_hour_angle(10.0, -20.0, 30.0);
    CHECK(h == doctest::Approx(320.0));
}

TEST_CASE("Parallax correction at the reference site")
{
    const TopocentricPosition t = golden_topocentric();

    CHECK(std::abs(t.ra_parallax - (-0.000369)) < 1e-6);
    CHECK(std::abs(t.right_ascension - 202.227039) < 1e-6);
    CHECK(std::abs(t.declination - (-9.316179)) < 1e-6);
    CHECK(std::abs(t.hour_angle - 11.106271) < 1e-6);
    CHECK(t.hour_angle == doctest::Approx(t.observer_hour_angle - t.ra_parallax));
}

TEST_CASE("Parallax pulls the sun towards the observer's horizon")
{
    // For a northern site, topocentric declination is south of geocentric
    const TopocentricPosition north = golden_topocentric();
    CHECK(north.declination < kDelta);

    const ObserverSite south{.longitude = kGolden.longitude, .latitude = -39.742476, .elevation = 0.0};
    const TopocentricPosition t = TopocentricCorrection::apply(south, kNu, kAlpha, kDelta, kRadius);
    CHECK(t.declination > kDelta);
}

// =================================================================
// Refraction
// =================================================================

TEST_CASE("Elevation with refraction at the reference site")
{
    const TopocentricPosition t = golden_topocentric();
    const Elevation e = RefractionModel::apply(kGoldenAir, kGolden.latitude, t.declination, t.hour_angle);

    CHECK(std::abs(e.uncorrected - 39.872046) < 1e-6);
    CHECK(std::abs(e.refraction - 0.016332) < 1e-6);
    CHECK(std::abs(e.corrected - 39.888378) < 1e-6);
}

TEST_CASE("No refraction once the sun is well below the horizon")
{
    const AtmosphericConditions standard{};
    const f64 threshold = -(astro_constants::kSunRadiusDeg + standard.refraction_at_horizon);

    CHECK(RefractionModel::correction(standard, threshold - 0.01) == 0.0);
    CHECK(RefractionModel::correction(standard, -30.0) == 0.0);
    CHECK(RefractionModel::correction(standard, threshold + 0.01) > 0.0);
}

TEST_CASE("Refraction grows towards the horizon and with air density")
{
    const AtmosphericConditions standard{};
    const AtmosphericConditions dense{.pressure_mbar = 1050.0, .temperature_c = -10.0};

    CHECK(RefractionModel::correction(standard, 0.0) > RefractionModel::correction(standard, 10.0));
    CHECK(RefractionModel::correction(standard, 10.0) > RefractionModel::correction(standard, 45.0));
    CHECK(RefractionModel::correction(dense, 10.0) > RefractionModel::correction(standard, 10.0));

    // About 0.476° at the horizon under standard conditions
    CHECK(RefractionModel::correction(standard, 0.0) == doctest::Approx(0.476056).epsilon(1e-5));
}

TEST_CASE("Topocentric elevation at the meridian is 90 − |φ − δ|")
{
    CHECK(RefractionModel::topocentric_elevation(40.0, 10.0, 0.0) == doctest::Approx(60.0));
    CHECK(RefractionModel::topocentric_elevation(-33.0, -23.0, 0.0) == doctest::Approx(80.0));
}

// =================================================================
// Zenith, azimuth, incidence
// =================================================================

TEST_CASE("Zenith and azimuths at the reference site")
{
    const TopocentricPosition t = golden_topocentric();
    const Elevation e = RefractionModel::apply(kGoldenAir, kGolden.latitude, t.declination, t.hour_angle);
    const HorizontalAngles a = SurfaceAngles::horizontal(e.corrected, kGolden.latitude, t.declination, t.hour_angle);

    CHECK(std::abs(a.zenith - 50.111622) < 1e-6);
    CHECK(std::abs(a.azimuth_astro - 14.340241) < 1e-6);
    CHECK(std::abs(a.azimuth - 194.340241) < 1e-6);
}

TEST_CASE("Incidence on the reference surface")
{
    const SurfaceOrientation surface{.slope = 30.0, .azimuth_rotation = -10.0};
    const f64 incidence = SurfaceAngles::incidence(50.11162202403697, 14.34024051024001, surface);

    CHECK(std::abs(incidence - 25.187000) < 1e-6);
}

TEST_CASE("Incidence on a horizontal surface equals the zenith angle")
{
    const SurfaceOrientation flat{};
    CHECK(SurfaceAngles::incidence(50.0, 14.0, flat) == doctest::Approx(50.0));
    CHECK(SurfaceAngles::incidence(97.8, 131.2, flat) == doctest::Approx(97.8));
}

TEST_CASE("Zenith and elevation sum to 90, navigator azimuth is astronomer's + 180")
{
    std::mt19937 rng(42);
    std::uniform_real_distribution<f64> lat_dist(-90.0, 90.0);
    std::uniform_real_distribution<f64> dec_dist(-23.5, 23.5);
    std::uniform_real_distribution<f64> ha_dist(-180.0, 180.0);

    for (int i = 0; i < 500; ++i)
    {
        const f64 lat = lat_dist(rng);
        const f64 dec = dec_dist(rng);
        const f64 ha  = ha_dist(rng);

        const f64 e = RefractionModel::apply(AtmosphericConditions{}, lat, dec, ha).corrected;
        const HorizontalAngles a = SurfaceAngles::horizontal(e, lat, dec, ha);

        CHECK(a.zenith + e == doctest::Approx(90.0));
        CHECK(a.azimuth == SurfaceAngles::azimuth_navigator(a.azimuth_astro));
        CHECK(a.azimuth_astro >= 0.0);
        CHECK(a.azimuth_astro < 360.0);
        CHECK(a.azimuth >= 0.0);
        CHECK(a.azimuth < 360.0);
    }
}

TEST_CASE("Morning sun is east, afternoon sun is west")
{
    // Negative hour angle: before the meridian
    const f64 morning = SurfaceAngles::azimuth_navigator(SurfaceAngles::azimuth_astro(-45.0, 40.0, 10.0));
    const f64 afternoon = SurfaceAngles::azimuth_navigator(SurfaceAngles::azimuth_astro(45.0, 40.0, 10.0));

    CHECK(morning > 0.0);
    CHECK(morning < 180.0);
    CHECK(afternoon > 180.0);
    CHECK(afternoon < 360.0);
}
