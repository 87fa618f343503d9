#pragma once

/// @file nutation.hpp
/// @brief IAU 1980 nutation in longitude and obliquity, and the obliquity of the ecliptic.

#include "core/types.hpp"

namespace helios::astro
{
    /// @brief Fundamental lunar/solar arguments, degrees.
    struct FundamentalArguments
    {
        f64 elongation;         ///< X0: mean elongation of the moon from the sun
        f64 anomaly_sun;        ///< X1: mean anomaly of the sun
        f64 anomaly_moon;       ///< X2: mean anomaly of the moon
        f64 latitude_moon;      ///< X3: moon's argument of latitude
        f64 ascending_node;     ///< X4: longitude of the moon's ascending node
    };

    struct Nutation
    {
        f64 longitude;  ///< Δψ, degrees
        f64 obliquity;  ///< Δε, degrees
    };

    class NutationModel
    {
    public:
        NutationModel() = delete;

        /// @param jce Julian Ephemeris Century.
        [[nodiscard]] static FundamentalArguments fundamental_arguments(f64 jce);

        [[nodiscard]] static Nutation nutation(f64 jce, const FundamentalArguments& x);

        /// @brief Mean obliquity ε0 in arc seconds (Laskar's 10th-degree polynomial).
        /// @param jme Julian Ephemeris Millennium.
        [[nodiscard]] static f64 mean_obliquity_arcsec(f64 jme);

        /// @brief True obliquity ε = Δε + ε0 / 3600, degrees.
        [[nodiscard]] static f64 true_obliquity(f64 delta_eps, f64 mean_obliquity_arcsec);
    };

} // namespace helios::astro
