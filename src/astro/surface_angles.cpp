/// @file surface_angles.cpp
/// @brief Implementation of the topocentric horizontal and surface angles.

#include "astro/surface_angles.hpp"

#include "astro/angles.hpp"

#include <glm/trigonometric.hpp>

#include <cmath>

namespace helios::astro
{

HorizontalAngles SurfaceAngles::horizontal(
    f64 elevation, f64 latitude, f64 declination, f64 hour_angle)
{
    const f64 gamma = azimuth_astro(hour_angle, latitude, declination);

    return HorizontalAngles{
        .zenith        = zenith(elevation),
        .azimuth_astro = gamma,
        .azimuth       = azimuth_navigator(gamma),
    };
}

f64 SurfaceAngles::zenith(f64 elevation)
{
    return 90.0 - elevation;
}

// -----------------------------------------------------------------
// Astronomer's azimuth, measured westward from south:
//   tan Γ = sin H' / (cos H' sin φ − tan δ' cos φ)
// -----------------------------------------------------------------

f64 SurfaceAngles::azimuth_astro(f64 hour_angle, f64 latitude, f64 declination)
{
    const f64 ha_rad  = glm::radians(hour_angle);
    const f64 lat_rad = glm::radians(latitude);

    return limit_degrees(glm::degrees(std::atan2(
        std::sin(ha_rad),
        std::cos(ha_rad) * std::sin(lat_rad)
            - std::tan(glm::radians(declination)) * std::cos(lat_rad))));
}

f64 SurfaceAngles::azimuth_navigator(f64 azimuth_astro)
{
    return limit_degrees(azimuth_astro + 180.0);
}

f64 SurfaceAngles::incidence(f64 zenith, f64 azimuth_astro, const SurfaceOrientation& surface)
{
    const f64 zenith_rad = glm::radians(zenith);
    const f64 slope_rad  = glm::radians(surface.slope);

    return glm::degrees(std::acos(
        std::cos(zenith_rad) * std::cos(slope_rad)
            + std::sin(slope_rad) * std::sin(zenith_rad)
                * std::cos(glm::radians(azimuth_astro - surface.azimuth_rotation))));
}

} // namespace helios::astro
