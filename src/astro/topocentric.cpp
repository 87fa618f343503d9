/// @file topocentric.cpp
/// @brief Implementation of the topocentric parallax correction.

#include "astro/topocentric.hpp"

#include "astro/angles.hpp"

#include <glm/trigonometric.hpp>

#include <cmath>

namespace helios::astro
{

namespace
{

constexpr f64 kPolarToEquatorialRadius = 0.99664719;  // b/a of the Earth ellipsoid
constexpr f64 kEquatorialRadiusM = 6378140.0;

} // anonymous namespace

// -----------------------------------------------------------------
// Parallax in right ascension and topocentric declination
//
// u  = atan(0.99664719 tan φ)
// x  = cos u + E/a cos φ
// y  = 0.99664719 sin u + E/a sin φ
//
// Δα = atan2(−x sin ξ sin H, cos δ − x sin ξ cos H)
// δ' = atan2((sin δ − y sin ξ) cos Δα, cos δ − x sin ξ cos H)
// -----------------------------------------------------------------

TopocentricPosition TopocentricCorrection::apply(
    const ObserverSite& site,
    f64 apparent_sidereal_time,
    f64 right_ascension,
    f64 declination,
    f64 radius_au)
{
    const f64 h = observer_hour_angle(apparent_sidereal_time, site.longitude, right_ascension);
    const f64 xi = equatorial_horizontal_parallax(radius_au);

    const f64 lat_rad   = glm::radians(site.latitude);
    const f64 xi_rad    = glm::radians(xi);
    const f64 h_rad     = glm::radians(h);
    const f64 delta_rad = glm::radians(declination);

    const f64 u = std::atan(kPolarToEquatorialRadius * std::tan(lat_rad));
    const f64 y = kPolarToEquatorialRadius * std::sin(u)
                + site.elevation * std::sin(lat_rad) / kEquatorialRadiusM;
    const f64 x = std::cos(u) + site.elevation * std::cos(lat_rad) / kEquatorialRadiusM;

    const f64 denominator = std::cos(delta_rad) - x * std::sin(xi_rad) * std::cos(h_rad);

    const f64 delta_alpha_rad = std::atan2(-x * std::sin(xi_rad) * std::sin(h_rad), denominator);
    const f64 delta_prime_rad = std::atan2(
        (std::sin(delta_rad) - y * std::sin(xi_rad)) * std::cos(delta_alpha_rad),
        denominator);

    const f64 delta_alpha = glm::degrees(delta_alpha_rad);

    return TopocentricPosition{
        .observer_hour_angle = h,
        .horizontal_parallax = xi,
        .ra_parallax         = delta_alpha,
        .declination         = glm::degrees(delta_prime_rad),
        .right_ascension     = right_ascension + delta_alpha,
        .hour_angle          = h - delta_alpha,
    };
}

f64 TopocentricCorrection::observer_hour_angle(f64 nu, f64 longitude, f64 alpha)
{
    return limit_degrees(nu + longitude - alpha);
}

f64 TopocentricCorrection::equatorial_horizontal_parallax(f64 radius_au)
{
    return 8.794 / (3600.0 * radius_au);
}

} // namespace helios::astro
