#pragma once

/// @file surface_angles.hpp
/// @brief Zenith, azimuth and surface incidence from topocentric coordinates.

#include "core/types.hpp"

namespace helios::astro
{
    /// @brief Orientation of a receiving surface.
    struct SurfaceOrientation
    {
        f64 slope = 0.0;            ///< Tilt from horizontal, degrees
        f64 azimuth_rotation = 0.0; ///< From south to the surface normal's projection, east negative
    };

    /// @brief Topocentric horizontal angles of the sun. All in degrees.
    struct HorizontalAngles
    {
        f64 zenith;         ///< 90 − e
        f64 azimuth_astro;  ///< Westward from south, [0, 360)
        f64 azimuth;        ///< Eastward from north, [0, 360)
    };

    class SurfaceAngles
    {
    public:
        SurfaceAngles() = delete;

        /// @param elevation Refraction-corrected topocentric elevation e.
        /// @param latitude Observer latitude.
        /// @param declination Topocentric δ'.
        /// @param hour_angle Topocentric H'.
        [[nodiscard]] static HorizontalAngles horizontal(
            f64 elevation, f64 latitude, f64 declination, f64 hour_angle);

        [[nodiscard]] static f64 zenith(f64 elevation);

        /// @brief Γ = atan2(sin H', cos H' sin φ − tan δ' cos φ), [0, 360).
        [[nodiscard]] static f64 azimuth_astro(f64 hour_angle, f64 latitude, f64 declination);

        /// @brief Φ = Γ + 180, [0, 360).
        [[nodiscard]] static f64 azimuth_navigator(f64 azimuth_astro);

        /// @brief I = acos(cos θ cos ω + sin ω sin θ cos(Γ − γ)), degrees.
        [[nodiscard]] static f64 incidence(
            f64 zenith, f64 azimuth_astro, const SurfaceOrientation& surface);
    };

} // namespace helios::astro
