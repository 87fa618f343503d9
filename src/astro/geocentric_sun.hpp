#pragma once

/// @file geocentric_sun.hpp
/// @brief Apparent geocentric right ascension/declination of the sun and
/// Greenwich apparent sidereal time for one instant.

#include "astro/heliocentric.hpp"
#include "astro/nutation.hpp"
#include "astro/time_scale.hpp"
#include "core/types.hpp"

namespace helios::astro
{
    /// @brief Every quantity produced while reducing the sun to geocentric
    /// apparent coordinates. All angles in degrees.
    struct GeocentricSolution
    {
        JulianTimes time;
        HeliocentricPosition earth;
        GeocentricEcliptic ecliptic;
        FundamentalArguments arguments;
        Nutation nutation;

        f64 mean_obliquity_arcsec;  ///< ε0
        f64 true_obliquity;         ///< ε
        f64 aberration;             ///< Δτ
        f64 apparent_longitude;     ///< λ
        f64 mean_sidereal_time;     ///< ν0, [0, 360)
        f64 apparent_sidereal_time; ///< ν
        f64 right_ascension;        ///< α, [0, 360)
        f64 declination;            ///< δ
    };

    class GeocentricSun
    {
    public:
        GeocentricSun() = delete;

        /// @brief Run the full geocentric reduction.
        /// @param jd Julian Day (UT).
        /// @param delta_t TT − UT1, seconds.
        [[nodiscard]] static GeocentricSolution solve(f64 jd, f64 delta_t);

        /// @brief Δτ = −20.4898″ / R.
        [[nodiscard]] static f64 aberration_correction(f64 radius_au);

        /// @brief λ = Θ + Δψ + Δτ.
        [[nodiscard]] static f64 apparent_longitude(f64 theta, f64 delta_psi, f64 delta_tau);

        /// @brief Greenwich mean sidereal time ν0, degrees [0, 360).
        [[nodiscard]] static f64 mean_sidereal_time(f64 jd, f64 jc);

        /// @brief ν = ν0 + Δψ cos ε.
        [[nodiscard]] static f64 apparent_sidereal_time(f64 nu0, f64 delta_psi, f64 epsilon);

        /// @brief α = atan2(sin λ cos ε − tan β sin ε, cos λ), degrees [0, 360).
        [[nodiscard]] static f64 right_ascension(f64 lambda, f64 epsilon, f64 beta);

        /// @brief δ = asin(sin β cos ε + cos β sin ε sin λ), degrees.
        [[nodiscard]] static f64 declination(f64 beta, f64 epsilon, f64 lambda);
    };

} // namespace helios::astro
