/// @file heliocentric.cpp
/// @brief Implementation of the Earth heliocentric series.

#include "astro/heliocentric.hpp"

#include "astro/angles.hpp"

#include <glm/trigonometric.hpp>

#include <cmath>

namespace helios::astro
{

namespace
{

// Series amplitudes are stored in units of 1e-8 radian (or AU)
constexpr f64 kSeriesScale = 1.0e8;

} // anonymous namespace

f64 HeliocentricModel::evaluate_series(
    std::span<const std::span<const PeriodicTerm>> series, f64 jme)
{
    f64 sum = 0.0;
    f64 power = 1.0;

    for (const auto& group : series)
    {
        f64 group_sum = 0.0;
        for (const PeriodicTerm& term : group)
        {
            group_sum += term.amplitude * std::cos(term.phase + term.frequency * jme);
        }
        sum += group_sum * power;
        power *= jme;
    }

    return sum / kSeriesScale;
}

f64 HeliocentricModel::earth_longitude(f64 jme)
{
    return limit_degrees(glm::degrees(evaluate_series(kEarthLongitudeTerms, jme)));
}

f64 HeliocentricModel::earth_latitude(f64 jme)
{
    return glm::degrees(evaluate_series(kEarthLatitudeTerms, jme));
}

f64 HeliocentricModel::earth_radius(f64 jme)
{
    return evaluate_series(kEarthRadiusTerms, jme);
}

HeliocentricPosition HeliocentricModel::earth_position(f64 jme)
{
    return HeliocentricPosition{
        .longitude = earth_longitude(jme),
        .latitude  = earth_latitude(jme),
        .radius    = earth_radius(jme),
    };
}

GeocentricEcliptic HeliocentricModel::to_geocentric(const HeliocentricPosition& earth)
{
    f64 theta = earth.longitude + 180.0;
    if (theta >= 360.0)
    {
        theta -= 360.0;
    }

    return GeocentricEcliptic{
        .longitude = theta,
        .latitude  = -earth.latitude,
    };
}

} // namespace helios::astro
