#pragma once

/// @file angles.hpp
/// @brief Angle and day-fraction normalization used throughout the solar reduction.
///
/// Every routine returns a value inside a documented half-open range and is
/// idempotent: normalizing an already-normalized value returns it unchanged.

#include "core/types.hpp"

#include <cmath>

namespace helios::astro
{
    /// @brief Normalize degrees to [0, 360).
    [[nodiscard]] inline f64 limit_degrees(f64 deg)
    {
        deg = std::fmod(deg, 360.0);
        if (deg < 0.0)
        {
            deg += 360.0;
        }
        // -1e-20 + 360 rounds to 360
        if (deg >= 360.0)
        {
            deg -= 360.0;
        }
        return deg;
    }

    /// @brief Normalize degrees to (-180, 180].
    [[nodiscard]] inline f64 limit_degrees_180pm(f64 deg)
    {
        deg = std::fmod(deg, 360.0);
        if (deg <= -180.0)
        {
            deg += 360.0;
        }
        if (deg > 180.0)
        {
            deg -= 360.0;
        }
        return deg;
    }

    /// @brief Normalize degrees to [0, 180).
    [[nodiscard]] inline f64 limit_degrees_180(f64 deg)
    {
        deg = std::fmod(deg, 180.0);
        if (deg < 0.0)
        {
            deg += 180.0;
        }
        if (deg >= 180.0)
        {
            deg -= 180.0;
        }
        return deg;
    }

    /// @brief Normalize a day fraction to [0, 1).
    [[nodiscard]] inline f64 limit_zero_to_one(f64 value)
    {
        value = std::fmod(value, 1.0);
        if (value < 0.0)
        {
            value += 1.0;
        }
        if (value >= 1.0)
        {
            value -= 1.0;
        }
        return value;
    }

    /// @brief Fold an equation-of-time value that wrapped a whole day back
    /// into the (-20, 20) minute window.
    [[nodiscard]] inline f64 limit_minutes(f64 minutes)
    {
        if (minutes < -20.0)
        {
            minutes += 1440.0;
        }
        else if (minutes > 20.0)
        {
            minutes -= 1440.0;
        }
        return minutes;
    }

    /// @brief Convert a UTC day fraction to local decimal hours in [0, 24).
    [[nodiscard]] inline f64 day_fraction_to_local_hours(f64 day_fraction, f64 timezone_h)
    {
        return 24.0 * limit_zero_to_one(day_fraction + timezone_h / 24.0);
    }

} // namespace helios::astro
