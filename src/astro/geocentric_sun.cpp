/// @file geocentric_sun.cpp
/// @brief Implementation of the geocentric solar reduction.

#include "astro/geocentric_sun.hpp"

#include "astro/angles.hpp"

#include <glm/trigonometric.hpp>

#include <cmath>

namespace helios::astro
{

GeocentricSolution GeocentricSun::solve(f64 jd, f64 delta_t)
{
    GeocentricSolution sun{};

    sun.time = TimeScale::from_julian_day_and_delta_t(jd, delta_t);

    sun.earth = HeliocentricModel::earth_position(sun.time.jme);
    sun.ecliptic = HeliocentricModel::to_geocentric(sun.earth);

    sun.arguments = NutationModel::fundamental_arguments(sun.time.jce);
    sun.nutation = NutationModel::nutation(sun.time.jce, sun.arguments);

    sun.mean_obliquity_arcsec = NutationModel::mean_obliquity_arcsec(sun.time.jme);
    sun.true_obliquity = NutationModel::true_obliquity(
        sun.nutation.obliquity, sun.mean_obliquity_arcsec);

    sun.aberration = aberration_correction(sun.earth.radius);
    sun.apparent_longitude = apparent_longitude(
        sun.ecliptic.longitude, sun.nutation.longitude, sun.aberration);

    sun.mean_sidereal_time = mean_sidereal_time(jd, sun.time.jc);
    sun.apparent_sidereal_time = apparent_sidereal_time(
        sun.mean_sidereal_time, sun.nutation.longitude, sun.true_obliquity);

    sun.right_ascension = right_ascension(
        sun.apparent_longitude, sun.true_obliquity, sun.ecliptic.latitude);
    sun.declination = declination(
        sun.ecliptic.latitude, sun.true_obliquity, sun.apparent_longitude);

    return sun;
}

f64 GeocentricSun::aberration_correction(f64 radius_au)
{
    return -20.4898 / (3600.0 * radius_au);
}

f64 GeocentricSun::apparent_longitude(f64 theta, f64 delta_psi, f64 delta_tau)
{
    return theta + delta_psi + delta_tau;
}

// -----------------------------------------------------------------
// GMST: IAU 1982 formula
//
// ν0 = 280.46061837 + 360.98564736629 × (JD − 2451545.0)
//    + T² × (0.000387933 − T / 38710000)
// -----------------------------------------------------------------

f64 GeocentricSun::mean_sidereal_time(f64 jd, f64 jc)
{
    return limit_degrees(280.46061837
                         + 360.98564736629 * (jd - astro_constants::kJ2000)
                         + jc * jc * (0.000387933 - jc / 38710000.0));
}

f64 GeocentricSun::apparent_sidereal_time(f64 nu0, f64 delta_psi, f64 epsilon)
{
    return nu0 + delta_psi * std::cos(glm::radians(epsilon));
}

f64 GeocentricSun::right_ascension(f64 lambda, f64 epsilon, f64 beta)
{
    const f64 lambda_rad = glm::radians(lambda);
    const f64 epsilon_rad = glm::radians(epsilon);

    return limit_degrees(glm::degrees(std::atan2(
        std::sin(lambda_rad) * std::cos(epsilon_rad)
            - std::tan(glm::radians(beta)) * std::sin(epsilon_rad),
        std::cos(lambda_rad))));
}

f64 GeocentricSun::declination(f64 beta, f64 epsilon, f64 lambda)
{
    const f64 beta_rad = glm::radians(beta);
    const f64 epsilon_rad = glm::radians(epsilon);

    return glm::degrees(std::asin(
        std::sin(beta_rad) * std::cos(epsilon_rad)
            + std::cos(beta_rad) * std::sin(epsilon_rad) * std::sin(glm::radians(lambda))));
}

} // namespace helios::astro
