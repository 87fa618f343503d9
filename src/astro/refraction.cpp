/// @file refraction.cpp
/// @brief Implementation of the refraction model.

#include "astro/refraction.hpp"

#include <glm/trigonometric.hpp>

#include <cmath>

namespace helios::astro
{

f64 RefractionModel::topocentric_elevation(f64 latitude, f64 declination, f64 hour_angle)
{
    const f64 lat_rad = glm::radians(latitude);
    const f64 dec_rad = glm::radians(declination);

    return glm::degrees(std::asin(
        std::sin(lat_rad) * std::sin(dec_rad)
            + std::cos(lat_rad) * std::cos(dec_rad) * std::cos(glm::radians(hour_angle))));
}

// -----------------------------------------------------------------
// Saemundsson (1986):
//   R [arcmin] = 1.02 / tan(e0 + 10.3 / (e0 + 5.11))
// scaled by (P / 1010) × (283 / (273 + T)), then converted to degrees.
// -----------------------------------------------------------------

f64 RefractionModel::correction(const AtmosphericConditions& atmosphere, f64 e0)
{
    if (e0 < -(astro_constants::kSunRadiusDeg + atmosphere.refraction_at_horizon))
    {
        return 0.0;
    }

    return (atmosphere.pressure_mbar / 1010.0)
         * (283.0 / (273.0 + atmosphere.temperature_c))
         * 1.02 / (60.0 * std::tan(glm::radians(e0 + 10.3 / (e0 + 5.11))));
}

Elevation RefractionModel::apply(
    const AtmosphericConditions& atmosphere,
    f64 latitude,
    f64 declination,
    f64 hour_angle)
{
    const f64 e0 = topocentric_elevation(latitude, declination, hour_angle);
    const f64 delta_e = correction(atmosphere, e0);

    return Elevation{
        .uncorrected = e0,
        .refraction  = delta_e,
        .corrected   = e0 + delta_e,
    };
}

} // namespace helios::astro
