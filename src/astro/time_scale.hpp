#pragma once

/// @file time_scale.hpp
/// @brief Julian Day and the century/millennium time scales used by the solar reduction.

#include "core/types.hpp"

namespace helios::astro
{
    /// @brief Civil date/time, in the time zone given alongside it.
    struct DateTime
    {
        i32 year   = 2000;
        i32 month  = 1;
        i32 day    = 1;
        i32 hour   = 0;
        i32 minute = 0;
        f64 second = 0.0;
    };

    /// @brief All time arguments of the periodic series for one instant.
    struct JulianTimes
    {
        f64 jd;     ///< Julian Day (UT)
        f64 jc;     ///< Julian Century
        f64 jde;    ///< Julian Ephemeris Day (TT)
        f64 jce;    ///< Julian Ephemeris Century
        f64 jme;    ///< Julian Ephemeris Millennium
    };

    /// @brief Static utility class for astronomical time scales.
    ///
    /// Julian Day follows Meeus (Astronomical Algorithms, Ch. 7) with the
    /// Gregorian correction applied only after the 1582 calendar reform.
    class TimeScale
    {
    public:
        TimeScale() = delete;

        /// @brief Convert a civil date/time to Julian Day (UT).
        /// @param dt Civil date/time in the zone given by @p timezone_h.
        /// @param timezone_h Offset of that zone from UTC, hours (west negative).
        /// @param delta_ut1 UT1 − UTC, seconds.
        [[nodiscard]] static f64 julian_day(const DateTime& dt, f64 timezone_h, f64 delta_ut1);

        /// @brief Convert Julian Day back to a civil date/time (UTC).
        [[nodiscard]] static DateTime from_julian_day(f64 jd);

        [[nodiscard]] static f64 julian_century(f64 jd);

        /// @param delta_t TT − UT1, seconds.
        [[nodiscard]] static f64 julian_ephemeris_day(f64 jd, f64 delta_t);

        [[nodiscard]] static f64 julian_ephemeris_century(f64 jde);

        [[nodiscard]] static f64 julian_ephemeris_millennium(f64 jce);

        /// @brief Derive every scale from a Julian Day and ΔT.
        [[nodiscard]] static JulianTimes from_julian_day_and_delta_t(f64 jd, f64 delta_t);

        /// @brief Current system time as a Julian Day.
        [[nodiscard]] static f64 now_as_julian_day();
    };

} // namespace helios::astro
