/// @file spa.cpp
/// @brief Solar position pipeline and input validation.

#include "astro/spa.hpp"

#include "astro/sun_events.hpp"
#include "astro/surface_angles.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <utility>

namespace helios::astro
{

namespace
{

void require(bool in_range, const char* field, f64 value, const char* range)
{
    if (!in_range)
    {
        InputRangeError error(field, value, range);
        HLS_CORE_ERROR("SPA: rejected input: {}", error.what());
        throw error;
    }
}

} // anonymous namespace

InputRangeError::InputRangeError(std::string field, f64 value, std::string range)
    : std::out_of_range(fmt::format("{} = {} is outside {}", field, value, range))
    , m_field{std::move(field)}
    , m_value{value}
    , m_range{std::move(range)}
{
}

// -----------------------------------------------------------------
// Validation
// -----------------------------------------------------------------

void validate_input(const SpaInput& input, const SpaOptions& options)
{
    const DateTime& t = input.time;

    require(t.year >= -2000 && t.year <= 6000, "year", t.year, "[-2000, 6000]");
    require(t.month >= 1 && t.month <= 12, "month", t.month, "[1, 12]");
    require(t.day >= 1 && t.day <= 31, "day", t.day, "[1, 31]");
    require(t.hour >= 0 && t.hour <= 24, "hour", t.hour, "[0, 24]");
    require(t.minute >= 0 && t.minute <= 59, "minute", t.minute, "[0, 59]");
    require(t.second >= 0.0 && t.second < 60.0, "second", t.second, "[0, 60)");
    require(t.hour != 24 || (t.minute == 0 && t.second == 0.0),
            "hour", t.hour, "[0, 24) unless the time is exactly 24:00:00");

    require(input.pressure >= 0.0 && input.pressure <= 5000.0,
            "pressure", input.pressure, "[0, 5000] mbar");
    require(input.temperature > -273.0 && input.temperature <= 6000.0,
            "temperature", input.temperature, "(-273, 6000] °C");
    require(input.delta_ut1 > -1.0 && input.delta_ut1 < 1.0,
            "delta_ut1", input.delta_ut1, "(-1, 1) s");
    require(input.delta_t >= -8000.0 && input.delta_t <= 8000.0,
            "delta_t", input.delta_t, "[-8000, 8000] s");
    require(input.timezone >= -18.0 && input.timezone <= 18.0,
            "timezone", input.timezone, "[-18, 18] h");
    require(input.longitude >= -180.0 && input.longitude <= 180.0,
            "longitude", input.longitude, "[-180, 180]°");
    require(input.latitude >= -90.0 && input.latitude <= 90.0,
            "latitude", input.latitude, "[-90, 90]°");
    require(input.refraction_at_horizon >= -5.0 && input.refraction_at_horizon <= 5.0,
            "refraction_at_horizon", input.refraction_at_horizon, "[-5, 5]°");
    require(input.elevation >= -6500000.0,
            "elevation", input.elevation, "[-6500000, ∞) m");

    if (options.compute_incidence)
    {
        require(input.slope >= -360.0 && input.slope <= 360.0,
                "slope", input.slope, "[-360, 360]°");
        require(input.azimuth_rotation >= -360.0 && input.azimuth_rotation <= 360.0,
                "azimuth_rotation", input.azimuth_rotation, "[-360, 360]°");
    }
}

// -----------------------------------------------------------------
// Pipeline
// -----------------------------------------------------------------

SpaOutput calculate(const SpaInput& input, const SpaOptions& options)
{
    SpaIntermediate scratch;
    return calculate(input, options, scratch);
}

SpaOutput calculate(const SpaInput& input, const SpaOptions& options, SpaIntermediate& intermediate)
{
    if (options.validate_inputs)
    {
        validate_input(input, options);
    }

    intermediate = SpaIntermediate{};
    SpaIntermediate& it = intermediate;

    // 1. Geocentric apparent position at the requested instant
    const f64 jd = TimeScale::julian_day(input.time, input.timezone, input.delta_ut1);
    it.geocentric = GeocentricSun::solve(jd, input.delta_t);

    // 2. Parallax to the observer's site
    const ObserverSite site{
        .longitude = input.longitude,
        .latitude  = input.latitude,
        .elevation = input.elevation,
    };
    it.topocentric = TopocentricCorrection::apply(
        site,
        it.geocentric.apparent_sidereal_time,
        it.geocentric.right_ascension,
        it.geocentric.declination,
        it.geocentric.earth.radius);

    // 3. Elevation with refraction
    const AtmosphericConditions atmosphere{
        .pressure_mbar         = input.pressure,
        .temperature_c         = input.temperature,
        .refraction_at_horizon = input.refraction_at_horizon,
    };
    it.elevation = RefractionModel::apply(
        atmosphere, input.latitude, it.topocentric.declination, it.topocentric.hour_angle);

    // 4. Zenith, azimuth, incidence
    const HorizontalAngles angles = SurfaceAngles::horizontal(
        it.elevation.corrected, input.latitude, it.topocentric.declination, it.topocentric.hour_angle);

    SpaOutput out;
    out.zenith        = angles.zenith;
    out.azimuth_astro = angles.azimuth_astro;
    out.azimuth       = angles.azimuth;

    if (options.compute_incidence)
    {
        const SurfaceOrientation surface{
            .slope            = input.slope,
            .azimuth_rotation = input.azimuth_rotation,
        };
        out.incidence = SurfaceAngles::incidence(angles.zenith, angles.azimuth_astro, surface);
    }

    // 5. Equation of time and the day's events
    if (options.compute_sun_events)
    {
        it.equation_of_time = SunEventSolver::equation_of_time(
            it.geocentric.time.jme,
            it.geocentric.right_ascension,
            it.geocentric.nutation.longitude,
            it.geocentric.true_obliquity);

        const EventSite event_site{
            .longitude             = input.longitude,
            .latitude              = input.latitude,
            .timezone_h            = input.timezone,
            .delta_t               = input.delta_t,
            .refraction_at_horizon = input.refraction_at_horizon,
        };
        const SunEvents events = SunEventSolver::solve(input.time, event_site);

        it.sunrise_hour_angle = events.sunrise_hour_angle;
        it.sunset_hour_angle  = events.sunset_hour_angle;
        it.transit_altitude   = events.transit_altitude;

        out.sun_transit = events.transit;
        out.sunrise     = events.sunrise;
        out.sunset      = events.sunset;
    }

    HLS_CORE_TRACE("SPA: jd={:.6f} zenith={:.6f} azimuth={:.6f}", jd, out.zenith, out.azimuth);

    return out;
}

} // namespace helios::astro
