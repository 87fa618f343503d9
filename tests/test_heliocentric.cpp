/// @file test_heliocentric.cpp
/// @brief Unit tests for the heliocentric, nutation and geocentric stages.
///
/// Reference values are the intermediate results published with the NREL
/// SPA report (Reda & Andreas, Table A5.1) for 2003-10-17 12:30:30 UTC-7
/// with ΔT = 67 s.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/coefficient_tables.hpp"
#include "astro/geocentric_sun.hpp"
#include "astro/heliocentric.hpp"
#include "astro/nutation.hpp"
#include "core/types.hpp"

#include <cmath>

using namespace helios;
using namespace helios::astro;

// =================================================================
// Reference instant
// =================================================================

static constexpr f64 kJd     = 2452930.312847222;
static constexpr f64 kDeltaT = 67.0;

static JulianTimes reference_times()
{
    return TimeScale::from_julian_day_and_delta_t(kJd, kDeltaT);
}

// =================================================================
// Coefficient tables
// =================================================================

TEST_CASE("Series tables have the published group sizes")
{
    CHECK(kEarthLongitudeTerms[0].size() == 64);
    CHECK(kEarthLongitudeTerms[1].size() == 34);
    CHECK(kEarthLongitudeTerms[2].size() == 20);
    CHECK(kEarthLongitudeTerms[3].size() == 7);
    CHECK(kEarthLongitudeTerms[4].size() == 3);
    CHECK(kEarthLongitudeTerms[5].size() == 1);

    CHECK(kEarthLatitudeTerms[0].size() == 5);
    CHECK(kEarthLatitudeTerms[1].size() == 2);

    CHECK(kEarthRadiusTerms[0].size() == 40);
    CHECK(kEarthRadiusTerms[1].size() == 10);
    CHECK(kEarthRadiusTerms[2].size() == 6);
    CHECK(kEarthRadiusTerms[3].size() == 2);
    CHECK(kEarthRadiusTerms[4].size() == 1);

    CHECK(kNutationTerms.size() == 63);
}

TEST_CASE("Leading terms match the VSOP87 and IAU 1980 tables")
{
    CHECK(kEarthLongitudeTerms[0][0].amplitude == 175347046.0);
    CHECK(kEarthRadiusTerms[0][0].amplitude == 100013989.0);

    const NutationTerm& first = kNutationTerms[0];
    CHECK(first.multipliers.ascending_node == 1);
    CHECK(first.multipliers.elongation == 0);
    CHECK(first.coefficients.psi == -171996.0);
    CHECK(first.coefficients.eps == 92025.0);
}

// =================================================================
// Heliocentric position
// =================================================================

TEST_CASE("Earth heliocentric position at the reference instant")
{
    const HeliocentricPosition earth = HeliocentricModel::earth_position(reference_times().jme);

    CHECK(std::abs(earth.longitude - 24.0182616917) < 1e-8);
    CHECK(std::abs(earth.latitude - (-0.0001011219)) < 1e-10);
    CHECK(std::abs(earth.radius - 0.9965422974) < 1e-9);
}

TEST_CASE("Geocentric ecliptic position mirrors the heliocentric one")
{
    const HeliocentricPosition earth = HeliocentricModel::earth_position(reference_times().jme);
    const GeocentricEcliptic sun = HeliocentricModel::to_geocentric(earth);

    CHECK(sun.longitude == doctest::Approx(204.0182616917));
    CHECK(sun.latitude == -earth.latitude);
}

TEST_CASE("Geocentric longitude wraps into [0, 360)")
{
    const HeliocentricPosition earth{.longitude = 200.0, .latitude = 0.0, .radius = 1.0};
    const GeocentricEcliptic sun = HeliocentricModel::to_geocentric(earth);

    CHECK(sun.longitude == doctest::Approx(20.0));
}

TEST_CASE("Heliocentric longitude stays in [0, 360) across millennia")
{
    for (f64 jme = -0.4; jme <= 0.4; jme += 0.013)
    {
        const f64 l = HeliocentricModel::earth_longitude(jme);
        CHECK(l >= 0.0);
        CHECK(l < 360.0);
    }
}

// =================================================================
// Nutation and obliquity
// =================================================================

TEST_CASE("Fundamental arguments at the reference instant")
{
    const FundamentalArguments x = NutationModel::fundamental_arguments(reference_times().jce);

    CHECK(std::abs(x.elongation - 17185.861179) < 1e-6);
    CHECK(std::abs(x.anomaly_sun - 1722.893218) < 1e-6);
    CHECK(std::abs(x.anomaly_moon - 18234.075703) < 1e-6);
    CHECK(std::abs(x.latitude_moon - 18420.071012) < 1e-6);
    CHECK(std::abs(x.ascending_node - 51.686951) < 1e-6);
}

TEST_CASE("Nutation in longitude and obliquity")
{
    const JulianTimes t = reference_times();
    const Nutation n = NutationModel::nutation(t.jce, NutationModel::fundamental_arguments(t.jce));

    CHECK(std::abs(n.longitude - (-0.00399840)) < 1e-8);
    CHECK(std::abs(n.obliquity - 0.00166657) < 1e-8);
}

TEST_CASE("Mean and true obliquity of the ecliptic")
{
    const JulianTimes t = reference_times();
    const Nutation n = NutationModel::nutation(t.jce, NutationModel::fundamental_arguments(t.jce));

    const f64 eps0 = NutationModel::mean_obliquity_arcsec(t.jme);
    CHECK(std::abs(eps0 - 84379.672625) < 1e-5);

    const f64 eps = NutationModel::true_obliquity(n.obliquity, eps0);
    CHECK(std::abs(eps - 23.440465) < 1e-6);
}

TEST_CASE("Mean obliquity at J2000.0 is 23°26'21.448\"")
{
    CHECK(NutationModel::mean_obliquity_arcsec(0.0) == 84381.448);
}

// =================================================================
// Geocentric apparent position
// =================================================================

TEST_CASE("GeocentricSun::solve reproduces the published intermediates")
{
    const GeocentricSolution g = GeocentricSun::solve(kJd, kDeltaT);

    CHECK(g.time.jd == kJd);
    CHECK(std::abs(g.ecliptic.longitude - 204.0182616917) < 1e-8);
    CHECK(std::abs(g.ecliptic.latitude - 0.0001011219) < 1e-10);
    CHECK(std::abs(g.aberration - (-0.005711359)) < 1e-9);
    CHECK(std::abs(g.apparent_longitude - 204.0085519281) < 1e-8);
    CHECK(std::abs(g.mean_sidereal_time - 318.515578) < 1e-5);
    CHECK(std::abs(g.apparent_sidereal_time - 318.511910) < 1e-5);
    CHECK(std::abs(g.right_ascension - 202.227408) < 1e-5);
    CHECK(std::abs(g.declination - (-9.314340)) < 1e-5);
}

TEST_CASE("Aberration and sidereal corrections")
{
    CHECK(GeocentricSun::aberration_correction(1.0) == doctest::Approx(-20.4898 / 3600.0));
    CHECK(GeocentricSun::apparent_longitude(100.0, 0.5, -0.25) == doctest::Approx(100.25));
    CHECK(GeocentricSun::apparent_sidereal_time(10.0, 0.0, 23.44) == 10.0);
}

TEST_CASE("Greenwich mean sidereal time at J2000.0")
{
    CHECK(GeocentricSun::mean_sidereal_time(2451545.0, 0.0) == doctest::Approx(280.46061837));
}

TEST_CASE("Sun on the equinox point has zero right ascension and declination")
{
    CHECK(std::abs(GeocentricSun::right_ascension(0.0, 23.44, 0.0)) < 1e-12);
    CHECK(std::abs(GeocentricSun::declination(0.0, 23.44, 0.0)) < 1e-12);
    CHECK(GeocentricSun::declination(0.0, 23.44, 90.0) == doctest::Approx(23.44));
}
