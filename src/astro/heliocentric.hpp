#pragma once

/// @file heliocentric.hpp
/// @brief Earth's heliocentric position from the truncated VSOP87 series, and
/// the matching geocentric position of the sun.

#include "astro/coefficient_tables.hpp"
#include "core/types.hpp"

#include <span>

namespace helios::astro
{
    /// @brief Earth's position as seen from the sun.
    struct HeliocentricPosition
    {
        f64 longitude;  ///< L, degrees [0, 360)
        f64 latitude;   ///< B, degrees
        f64 radius;     ///< R, astronomical units
    };

    /// @brief The sun as seen from the Earth's centre (before nutation and aberration).
    struct GeocentricEcliptic
    {
        f64 longitude;  ///< Θ, degrees [0, 360)
        f64 latitude;   ///< β, degrees
    };

    class HeliocentricModel
    {
    public:
        HeliocentricModel() = delete;

        /// @brief Σ_i τ^i · Σ_k A_k cos(B_k + C_k τ), over every group of a series.
        /// @param jme Julian Ephemeris Millennium (τ).
        [[nodiscard]] static f64 evaluate_series(
            std::span<const std::span<const PeriodicTerm>> series, f64 jme);

        [[nodiscard]] static f64 earth_longitude(f64 jme);
        [[nodiscard]] static f64 earth_latitude(f64 jme);
        [[nodiscard]] static f64 earth_radius(f64 jme);

        [[nodiscard]] static HeliocentricPosition earth_position(f64 jme);

        /// @brief Θ = L + 180°, β = −B.
        [[nodiscard]] static GeocentricEcliptic to_geocentric(const HeliocentricPosition& earth);
    };

} // namespace helios::astro
