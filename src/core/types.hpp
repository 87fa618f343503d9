#pragma once

#include <cstdint>

namespace helios
{
    // Precision aliases
    using f64 = double;
    using i32 = int32_t;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kJ2000           = 2451545.0;  // Julian Date of J2000.0 epoch
        constexpr f64 kDaysPerCentury  = 36525.0;
        constexpr f64 kSecondsPerDay   = 86400.0;
        constexpr f64 kGregorianReform = 2299160.0;  // Last Julian-calendar JD (1582-10-04)

        constexpr f64 kSunRadiusDeg    = 0.26667;    // Apparent angular radius of the sun
        constexpr f64 kEventSentinel   = -99999.0;   // Sun does not rise or set that day
    }
}
