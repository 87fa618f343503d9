#pragma once

/// @file refraction.hpp
/// @brief Topocentric elevation and its atmospheric refraction correction.

#include "core/types.hpp"

namespace helios::astro
{
    /// @brief Pressure/temperature snapshot used by the refraction term.
    struct AtmosphericConditions
    {
        f64 pressure_mbar = 1013.0;
        f64 temperature_c = 15.0;
        f64 refraction_at_horizon = 0.5667;  ///< Degrees
    };

    struct Elevation
    {
        f64 uncorrected;    ///< e0, degrees
        f64 refraction;     ///< Δe, degrees
        f64 corrected;      ///< e = e0 + Δe, degrees
    };

    class RefractionModel
    {
    public:
        RefractionModel() = delete;

        /// @brief e0 = asin(sin φ sin δ' + cos φ cos δ' cos H'), degrees.
        [[nodiscard]] static f64 topocentric_elevation(f64 latitude, f64 declination, f64 hour_angle);

        /// @brief Refraction correction (Saemundsson), degrees.
        ///
        /// Zero once the sun's upper limb is more than the horizon refraction
        /// below the horizon: e0 < −(sun radius + refraction_at_horizon).
        [[nodiscard]] static f64 correction(const AtmosphericConditions& atmosphere, f64 e0);

        [[nodiscard]] static Elevation apply(
            const AtmosphericConditions& atmosphere,
            f64 latitude,
            f64 declination,
            f64 hour_angle);
    };

} // namespace helios::astro
