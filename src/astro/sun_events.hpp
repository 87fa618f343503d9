#pragma once

/// @file sun_events.hpp
/// @brief Equation of time and sunrise / transit / sunset for one calendar day.
///
/// Rise, transit and set follow Meeus (Astronomical Algorithms, Ch. 15): the
/// geocentric sun is sampled at 0h UT on the previous, current and next day,
/// and right ascension/declination are interpolated to each event's day fraction.

#include "astro/time_scale.hpp"
#include "core/types.hpp"

#include <optional>

namespace helios::astro
{
    /// @brief One quantity sampled at 0h UT on three consecutive days.
    struct DaySamples
    {
        f64 previous;
        f64 current;
        f64 next;
    };

    /// @brief Interpolated sun state at a day fraction. All angles in degrees.
    struct RtsSample
    {
        f64 sidereal_time;      ///< ν at the day fraction
        f64 right_ascension;    ///< α'
        f64 declination;        ///< δ'
        f64 hour_angle;         ///< H', (−180, 180]
        f64 altitude;           ///< h
    };

    /// @brief Where and how to look for the day's events.
    struct EventSite
    {
        f64 longitude;              ///< Degrees, east positive
        f64 latitude;               ///< Degrees
        f64 timezone_h;             ///< Offset of the reported local times from UTC
        f64 delta_t;                ///< TT − UT1, seconds
        f64 refraction_at_horizon;  ///< Degrees
    };

    /// @brief Event times (local decimal hours) and the angles behind them.
    ///
    /// Every field holds astro_constants::kEventSentinel when the sun does not
    /// cross the refraction-adjusted horizon that day.
    struct SunEvents
    {
        f64 transit;
        f64 sunrise;
        f64 sunset;
        f64 sunrise_hour_angle;     ///< H' at sunrise, degrees
        f64 sunset_hour_angle;      ///< H' at sunset, degrees
        f64 transit_altitude;       ///< Altitude at transit, degrees
    };

    /// @brief Quadratic interpolation across three daily samples at n days
    /// from the current sample. A first difference of 2° or more is taken as
    /// a wrap through 0/360 and reduced to [0, 1) first.
    [[nodiscard]] f64 interpolate_day_samples(const DaySamples& samples, f64 n);

    /// @brief Sun state at day fraction @p m of the current day.
    /// @param alpha Geocentric right ascension samples.
    /// @param delta Geocentric declination samples.
    /// @param nu Apparent sidereal time at 0h UT of the current day.
    [[nodiscard]] RtsSample interpolate_rts(
        const DaySamples& alpha,
        const DaySamples& delta,
        f64 nu,
        f64 m,
        f64 longitude,
        f64 latitude,
        f64 delta_t);

    class SunEventSolver
    {
    public:
        SunEventSolver() = delete;

        /// @brief Sun mean longitude M, degrees [0, 360).
        [[nodiscard]] static f64 sun_mean_longitude(f64 jme);

        /// @brief Equation of time, minutes, within (−20, 20).
        [[nodiscard]] static f64 equation_of_time(f64 jme, f64 alpha, f64 delta_psi, f64 epsilon);

        /// @brief Local hour angle H0 at which the sun's centre reaches @p h0_prime.
        /// @return H0 in [0, 180), or std::nullopt when the sun stays above or
        ///         below that altitude all day.
        [[nodiscard]] static std::optional<f64> rise_set_hour_angle(
            f64 latitude, f64 declination, f64 h0_prime);

        /// @brief Sunrise, transit and sunset on the calendar day of @p date.
        [[nodiscard]] static SunEvents solve(const DateTime& date, const EventSite& site);
    };

} // namespace helios::astro
