#pragma once

/// @file spa.hpp
/// @brief Solar Position Algorithm (Reda & Andreas, NREL 2008): topocentric
/// zenith, azimuth, surface incidence and sunrise/transit/sunset for one
/// observer and instant.
///
/// calculate() is a pure function. Concurrent calls need no synchronization
/// as long as each uses its own SpaIntermediate.

#include "astro/geocentric_sun.hpp"
#include "astro/refraction.hpp"
#include "astro/time_scale.hpp"
#include "astro/topocentric.hpp"
#include "core/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace helios::astro
{
    /// @brief Observer instant, site and atmosphere.
    struct SpaInput
    {
        DateTime time;                      ///< Local civil time at @ref timezone
        f64 timezone = 0.0;                 ///< Hours from UTC, west negative [-18, 18]
        f64 delta_ut1 = 0.0;                ///< UT1 − UTC, seconds (-1, 1)
        f64 delta_t = 0.0;                  ///< TT − UT1, seconds [-8000, 8000]

        f64 longitude = 0.0;                ///< Degrees, east positive [-180, 180]
        f64 latitude = 0.0;                 ///< Degrees, north positive [-90, 90]
        f64 elevation = 0.0;                ///< Metres, >= -6500000

        f64 pressure = 1013.0;              ///< Annual average, mbar [0, 5000]
        f64 temperature = 15.0;             ///< Annual average, °C (-273, 6000]

        f64 slope = 0.0;                    ///< Surface tilt, degrees [-360, 360]
        f64 azimuth_rotation = 0.0;         ///< Surface azimuth from south, east negative [-360, 360]
        f64 refraction_at_horizon = 0.5667; ///< Degrees [-5, 5]
    };

    /// @brief Independent switches for one calculation.
    struct SpaOptions
    {
        bool compute_incidence = true;      ///< Fill SpaOutput::incidence
        bool compute_sun_events = true;     ///< Fill transit/sunrise/sunset
        bool validate_inputs = true;        ///< Throw InputRangeError on out-of-range input
    };

    struct SpaOutput
    {
        f64 zenith = 0.0;                   ///< Topocentric zenith angle, degrees
        f64 azimuth_astro = 0.0;            ///< Westward from south, degrees [0, 360)
        f64 azimuth = 0.0;                  ///< Eastward from north, degrees [0, 360)

        std::optional<f64> incidence;       ///< Surface incidence angle, degrees

        /// Local decimal hours, or astro_constants::kEventSentinel on polar day/night.
        std::optional<f64> sun_transit;
        std::optional<f64> sunrise;
        std::optional<f64> sunset;
    };

    /// @brief Every intermediate value of the last calculation, in pipeline order.
    struct SpaIntermediate
    {
        GeocentricSolution geocentric{};
        TopocentricPosition topocentric{};
        Elevation elevation{};

        // Only set when sun events are computed
        f64 equation_of_time = 0.0;     ///< Minutes
        f64 sunrise_hour_angle = 0.0;   ///< Degrees
        f64 sunset_hour_angle = 0.0;    ///< Degrees
        f64 transit_altitude = 0.0;     ///< Degrees
    };

    /// @brief An input parameter outside its documented range.
    class InputRangeError : public std::out_of_range
    {
    public:
        InputRangeError(std::string field, f64 value, std::string range);

        [[nodiscard]] const std::string& field() const noexcept { return m_field; }
        [[nodiscard]] f64 value() const noexcept { return m_value; }
        [[nodiscard]] const std::string& range() const noexcept { return m_range; }

    private:
        std::string m_field;
        f64 m_value;
        std::string m_range;
    };

    /// @brief Check every input against its documented range.
    /// Surface slope and rotation are only checked when incidence is requested.
    /// @throws InputRangeError for the first field out of range.
    void validate_input(const SpaInput& input, const SpaOptions& options = {});

    /// @brief Compute the sun's position for @p input.
    /// @throws InputRangeError when options.validate_inputs is set and an input
    ///         is out of range; nothing is computed in that case.
    [[nodiscard]] SpaOutput calculate(const SpaInput& input, const SpaOptions& options = {});

    /// @brief As above, also returning every intermediate value through
    /// @p intermediate, which may be reused across calls.
    [[nodiscard]] SpaOutput calculate(
        const SpaInput& input, const SpaOptions& options, SpaIntermediate& intermediate);

} // namespace helios::astro
