/// @file sun_events.cpp
/// @brief Implementation of the equation of time and the rise/transit/set solver.

#include "astro/sun_events.hpp"

#include "astro/angles.hpp"
#include "astro/geocentric_sun.hpp"
#include "core/logger.hpp"

#include <glm/trigonometric.hpp>

#include <cmath>

namespace helios::astro
{

namespace
{

// Sidereal degrees per solar day
constexpr f64 kSiderealRate = 360.985647;

f64 altitude(f64 latitude, f64 declination, f64 hour_angle)
{
    const f64 lat_rad = glm::radians(latitude);
    const f64 dec_rad = glm::radians(declination);

    return glm::degrees(std::asin(
        std::sin(lat_rad) * std::sin(dec_rad)
            + std::cos(lat_rad) * std::cos(dec_rad) * std::cos(glm::radians(hour_angle))));
}

/// First-order correction of a rise/set day fraction towards altitude h0'.
f64 refine_rise_set(f64 m, const RtsSample& sample, f64 latitude, f64 h0_prime)
{
    return m + (sample.altitude - h0_prime)
             / (360.0 * std::cos(glm::radians(sample.declination))
                      * std::cos(glm::radians(latitude))
                      * std::sin(glm::radians(sample.hour_angle)));
}

SunEvents no_events()
{
    return SunEvents{
        .transit            = astro_constants::kEventSentinel,
        .sunrise            = astro_constants::kEventSentinel,
        .sunset             = astro_constants::kEventSentinel,
        .sunrise_hour_angle = astro_constants::kEventSentinel,
        .sunset_hour_angle  = astro_constants::kEventSentinel,
        .transit_altitude   = astro_constants::kEventSentinel,
    };
}

} // anonymous namespace

// -----------------------------------------------------------------
// Interpolation (Meeus 3.3): y = y2 + n/2 (a + b + n c), c = b − a
// -----------------------------------------------------------------

f64 interpolate_day_samples(const DaySamples& samples, f64 n)
{
    f64 a = samples.current - samples.previous;
    f64 b = samples.next - samples.current;

    if (std::abs(a) >= 2.0)
    {
        a = limit_zero_to_one(a);
    }
    if (std::abs(b) >= 2.0)
    {
        b = limit_zero_to_one(b);
    }

    return samples.current + n * (a + b + (b - a) * n) / 2.0;
}

RtsSample interpolate_rts(
    const DaySamples& alpha,
    const DaySamples& delta,
    f64 nu,
    f64 m,
    f64 longitude,
    f64 latitude,
    f64 delta_t)
{
    const f64 nu_rts = nu + kSiderealRate * m;
    const f64 n = m + delta_t / astro_constants::kSecondsPerDay;

    const f64 alpha_prime = interpolate_day_samples(alpha, n);
    const f64 delta_prime = interpolate_day_samples(delta, n);
    const f64 h_prime = limit_degrees_180pm(nu_rts + longitude - alpha_prime);

    return RtsSample{
        .sidereal_time   = nu_rts,
        .right_ascension = alpha_prime,
        .declination     = delta_prime,
        .hour_angle      = h_prime,
        .altitude        = altitude(latitude, delta_prime, h_prime),
    };
}

// -----------------------------------------------------------------
// Equation of time
// -----------------------------------------------------------------

f64 SunEventSolver::sun_mean_longitude(f64 jme)
{
    return limit_degrees(280.4664567 + jme * (360007.6982779 + jme * (0.03032028
         + jme * (1.0 / 49931.0 + jme * (-1.0 / 15300.0 + jme * (-1.0 / 2000000.0))))));
}

f64 SunEventSolver::equation_of_time(f64 jme, f64 alpha, f64 delta_psi, f64 epsilon)
{
    const f64 m = sun_mean_longitude(jme);
    return limit_minutes(4.0 * (m - 0.0057183 - alpha + delta_psi * std::cos(glm::radians(epsilon))));
}

// -----------------------------------------------------------------
// Rise/set hour angle
//   cos H0 = (sin h0' − sin φ sin δ) / (cos φ cos δ)
// -----------------------------------------------------------------

std::optional<f64> SunEventSolver::rise_set_hour_angle(f64 latitude, f64 declination, f64 h0_prime)
{
    const f64 lat_rad = glm::radians(latitude);
    const f64 dec_rad = glm::radians(declination);

    const f64 argument = (std::sin(glm::radians(h0_prime)) - std::sin(lat_rad) * std::sin(dec_rad))
                       / (std::cos(lat_rad) * std::cos(dec_rad));

    if (std::abs(argument) > 1.0)
    {
        return std::nullopt;
    }

    return limit_degrees_180(glm::degrees(std::acos(argument)));
}

// -----------------------------------------------------------------
// Sunrise / transit / sunset
// -----------------------------------------------------------------

SunEvents SunEventSolver::solve(const DateTime& date, const EventSite& site)
{
    // 0h UT of the calendar day, without ΔT
    const DateTime midnight{.year = date.year, .month = date.month, .day = date.day};
    const f64 jd0 = TimeScale::julian_day(midnight, 0.0, 0.0);

    const GeocentricSolution yesterday = GeocentricSun::solve(jd0 - 1.0, 0.0);
    const GeocentricSolution today     = GeocentricSun::solve(jd0, 0.0);
    const GeocentricSolution tomorrow  = GeocentricSun::solve(jd0 + 1.0, 0.0);

    const f64 nu = today.apparent_sidereal_time;

    const DaySamples alpha{
        .previous = yesterday.right_ascension,
        .current  = today.right_ascension,
        .next     = tomorrow.right_ascension,
    };
    const DaySamples delta{
        .previous = yesterday.declination,
        .current  = today.declination,
        .next     = tomorrow.declination,
    };

    const f64 m_transit = (alpha.current - site.longitude - nu) / 360.0;
    const f64 h0_prime = -(astro_constants::kSunRadiusDeg + site.refraction_at_horizon);

    const std::optional<f64> h0 = rise_set_hour_angle(site.latitude, delta.current, h0_prime);
    if (!h0)
    {
        HLS_CORE_DEBUG("SunEventSolver: no sunrise/sunset on {:04}-{:02}-{:02} at latitude {}",
                       date.year, date.month, date.day, site.latitude);
        return no_events();
    }

    const f64 h0_day_fraction = *h0 / 360.0;
    const f64 m_transit_0 = limit_zero_to_one(m_transit);
    const f64 m_rise      = limit_zero_to_one(m_transit - h0_day_fraction);
    const f64 m_set       = limit_zero_to_one(m_transit + h0_day_fraction);

    const RtsSample transit = interpolate_rts(
        alpha, delta, nu, m_transit_0, site.longitude, site.latitude, site.delta_t);
    const RtsSample rise = interpolate_rts(
        alpha, delta, nu, m_rise, site.longitude, site.latitude, site.delta_t);
    const RtsSample set = interpolate_rts(
        alpha, delta, nu, m_set, site.longitude, site.latitude, site.delta_t);

    return SunEvents{
        .transit = day_fraction_to_local_hours(
            m_transit_0 - transit.hour_angle / 360.0, site.timezone_h),
        .sunrise = day_fraction_to_local_hours(
            refine_rise_set(m_rise, rise, site.latitude, h0_prime), site.timezone_h),
        .sunset = day_fraction_to_local_hours(
            refine_rise_set(m_set, set, site.latitude, h0_prime), site.timezone_h),
        .sunrise_hour_angle = rise.hour_angle,
        .sunset_hour_angle  = set.hour_angle,
        .transit_altitude   = transit.altitude,
    };
}

} // namespace helios::astro
