#pragma once

/// @file topocentric.hpp
/// @brief Parallax correction from the Earth's centre to the observer's site.

#include "core/types.hpp"

namespace helios::astro
{
    /// @brief Observer site on the reference ellipsoid.
    struct ObserverSite
    {
        f64 longitude;  ///< Degrees, east positive
        f64 latitude;   ///< Degrees, north positive
        f64 elevation;  ///< Metres above sea level
    };

    /// @brief Topocentric equatorial position. All angles in degrees.
    struct TopocentricPosition
    {
        f64 observer_hour_angle;    ///< H, [0, 360)
        f64 horizontal_parallax;    ///< ξ
        f64 ra_parallax;            ///< Δα
        f64 declination;            ///< δ'
        f64 right_ascension;        ///< α' = α + Δα
        f64 hour_angle;             ///< H' = H − Δα
    };

    class TopocentricCorrection
    {
    public:
        TopocentricCorrection() = delete;

        /// @brief Shift a geocentric position to the observer's site.
        /// @param site Observer location.
        /// @param apparent_sidereal_time ν, degrees.
        /// @param right_ascension Geocentric α, degrees.
        /// @param declination Geocentric δ, degrees.
        /// @param radius_au Earth-sun distance R.
        [[nodiscard]] static TopocentricPosition apply(
            const ObserverSite& site,
            f64 apparent_sidereal_time,
            f64 right_ascension,
            f64 declination,
            f64 radius_au);

        /// @brief H = ν + longitude − α, degrees [0, 360).
        [[nodiscard]] static f64 observer_hour_angle(f64 nu, f64 longitude, f64 alpha);

        /// @brief ξ = 8.794″ / R.
        [[nodiscard]] static f64 equatorial_horizontal_parallax(f64 radius_au);
    };

} // namespace helios::astro
