#pragma once

/// @file coefficient_tables.hpp
/// @brief Periodic-term tables for the Earth's heliocentric position (VSOP87
/// truncation) and the 63-term IAU 1980 nutation series.
///
/// All tables are immutable, have static storage duration and are safe to read
/// concurrently from any number of threads.

#include "core/types.hpp"

#include <array>
#include <span>

namespace helios::astro
{
    /// @brief One term of a periodic series: amplitude × cos(phase + frequency × τ).
    struct PeriodicTerm
    {
        f64 amplitude;
        f64 phase;      ///< Radians
        f64 frequency;  ///< Radians per Julian millennium
    };

    /// @brief Multipliers of the five fundamental lunar/solar arguments.
    struct NutationMultipliers
    {
        i32 elongation;         ///< Mean elongation of the moon from the sun (D)
        i32 anomaly_sun;        ///< Mean anomaly of the sun (M)
        i32 anomaly_moon;       ///< Mean anomaly of the moon (M')
        i32 latitude_moon;      ///< Moon's argument of latitude (F)
        i32 ascending_node;     ///< Longitude of the moon's ascending node (Ω)
    };

    /// @brief Sine/cosine coefficients of one nutation term, in 0.0001 arcsec.
    struct NutationCoefficients
    {
        f64 psi;        ///< Longitude, constant part
        f64 psi_rate;   ///< Longitude, per Julian century
        f64 eps;        ///< Obliquity, constant part
        f64 eps_rate;   ///< Obliquity, per Julian century
    };

    struct NutationTerm
    {
        NutationMultipliers multipliers;
        NutationCoefficients coefficients;
    };

    /// Earth heliocentric longitude series L0..L5 (index = power of τ).
    extern const std::array<std::span<const PeriodicTerm>, 6> kEarthLongitudeTerms;

    /// Earth heliocentric latitude series B0..B1.
    extern const std::array<std::span<const PeriodicTerm>, 2> kEarthLatitudeTerms;

    /// Earth radius vector series R0..R4.
    extern const std::array<std::span<const PeriodicTerm>, 5> kEarthRadiusTerms;

    extern const std::array<NutationTerm, 63> kNutationTerms;

} // namespace helios::astro
