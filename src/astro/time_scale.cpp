/// @file time_scale.cpp
/// @brief Implementation of astronomical time scales.

#include "astro/time_scale.hpp"

#include <chrono>
#include <cmath>

namespace helios::astro
{

// -----------------------------------------------------------------
// Julian Day: Meeus algorithm (Astronomical Algorithms, Ch. 7)
//
// JD = INT(365.25 (Y + 4716)) + INT(30.6001 (M + 1)) + D + B − 1524.5
//
// B = 2 − A + INT(A / 4), A = INT(Y / 100), only for Gregorian dates.
// D carries the UT time of day, shifted by the zone offset and DUT1.
// -----------------------------------------------------------------

f64 TimeScale::julian_day(const DateTime& dt, f64 timezone_h, f64 delta_ut1)
{
    i32 y = dt.year;
    i32 m = dt.month;

    // Jan and Feb are treated as months 13 and 14 of the previous year
    if (m < 3)
    {
        m += 12;
        y -= 1;
    }

    const f64 day_decimal = static_cast<f64>(dt.day)
        + (static_cast<f64>(dt.hour) - timezone_h
           + (static_cast<f64>(dt.minute) + (dt.second + delta_ut1) / 60.0) / 60.0) / 24.0;

    f64 jd = std::floor(365.25 * (static_cast<f64>(y) + 4716.0))
           + std::floor(30.6001 * static_cast<f64>(m + 1))
           + day_decimal
           - 1524.5;

    if (jd > astro_constants::kGregorianReform)
    {
        const i32 a = y / 100;
        jd += static_cast<f64>(2 - a + a / 4);
    }

    return jd;
}

// -----------------------------------------------------------------
// Julian Day → civil date/time (Meeus, Ch. 7)
// -----------------------------------------------------------------

DateTime TimeScale::from_julian_day(f64 jd)
{
    // Add 0.5 to shift from noon-based to midnight-based
    const f64 jd_plus = jd + 0.5;
    const i32 z = static_cast<i32>(std::floor(jd_plus));
    const f64 f = jd_plus - static_cast<f64>(z);

    i32 a = z;
    if (z >= 2299161)
    {
        const i32 alpha = static_cast<i32>(std::floor(
            (static_cast<f64>(z) - 1867216.25) / 36524.25));
        a = z + 1 + alpha - (alpha / 4);
    }

    const i32 b = a + 1524;
    const i32 c = static_cast<i32>(std::floor((static_cast<f64>(b) - 122.1) / 365.25));
    const i32 d = static_cast<i32>(std::floor(365.25 * static_cast<f64>(c)));
    const i32 e = static_cast<i32>(std::floor(static_cast<f64>(b - d) / 30.6001));

    const f64 day_with_fraction = static_cast<f64>(b - d)
                                - std::floor(30.6001 * static_cast<f64>(e))
                                + f;

    const i32 day = static_cast<i32>(std::floor(day_with_fraction));
    const f64 day_frac = day_with_fraction - static_cast<f64>(day);

    const i32 month = (e < 14) ? (e - 1) : (e - 13);
    const i32 year = (month > 2) ? (c - 4716) : (c - 4715);

    const f64 hours_total = day_frac * 24.0;
    const i32 hour = static_cast<i32>(std::floor(hours_total));

    const f64 minutes_total = (hours_total - static_cast<f64>(hour)) * 60.0;
    const i32 minute = static_cast<i32>(std::floor(minutes_total));

    const f64 second = (minutes_total - static_cast<f64>(minute)) * 60.0;

    return DateTime{
        .year   = year,
        .month  = month,
        .day    = day,
        .hour   = hour,
        .minute = minute,
        .second = second,
    };
}

// -----------------------------------------------------------------
// Century / millennium scales since J2000.0
// -----------------------------------------------------------------

f64 TimeScale::julian_century(f64 jd)
{
    return (jd - astro_constants::kJ2000) / astro_constants::kDaysPerCentury;
}

f64 TimeScale::julian_ephemeris_day(f64 jd, f64 delta_t)
{
    return jd + delta_t / astro_constants::kSecondsPerDay;
}

f64 TimeScale::julian_ephemeris_century(f64 jde)
{
    return (jde - astro_constants::kJ2000) / astro_constants::kDaysPerCentury;
}

f64 TimeScale::julian_ephemeris_millennium(f64 jce)
{
    return jce / 10.0;
}

JulianTimes TimeScale::from_julian_day_and_delta_t(f64 jd, f64 delta_t)
{
    const f64 jde = julian_ephemeris_day(jd, delta_t);
    const f64 jce = julian_ephemeris_century(jde);

    return JulianTimes{
        .jd  = jd,
        .jc  = julian_century(jd),
        .jde = jde,
        .jce = jce,
        .jme = julian_ephemeris_millennium(jce),
    };
}

// -----------------------------------------------------------------
// Current system time → Julian Day
// -----------------------------------------------------------------

f64 TimeScale::now_as_julian_day()
{
    using namespace std::chrono;

    const auto since_epoch = system_clock::now().time_since_epoch();
    const auto total_seconds = duration_cast<duration<f64>>(since_epoch).count();

    // Unix epoch (1970-01-01 00:00 UTC) as Julian Day
    constexpr f64 kUnixEpochJd = 2440587.5;

    return kUnixEpochJd + total_seconds / astro_constants::kSecondsPerDay;
}

} // namespace helios::astro
