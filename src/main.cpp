/// @file main.cpp
/// @brief helios command line tool.
///
/// Without arguments, prints the current sun position and today's events for
/// a list of cities. With `<latitude> <longitude> [utc_offset_h]`, prints the
/// full solution for that one site.

#include "astro/spa.hpp"
#include "astro/time_scale.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <charconv>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace helios;
using namespace helios::astro;

namespace
{

struct City
{
    std::string name;
    f64 utc_offset_h;   ///< Standard time; no daylight saving
    f64 latitude;
    f64 longitude;
};

const std::vector<City>& cities()
{
    static const std::vector<City> list{
        {"Anchorage",     -9.0, 61.2181, -149.9003},
        {"Mountain View", -8.0, 37.3861, -122.0839},
        {"Detroit",       -5.0, 42.3314,  -83.0458},
        {"New York City", -5.0, 40.7128,  -74.0060},
        {"Reykjavik",      0.0, 64.9631,  -19.0208},
        {"Frankfurt",      1.0, 50.1109,    8.6821},
        {"Moscow",         3.0, 55.7558,   37.6173},
        {"New Delhi",      5.5, 28.6139,   77.2090},
        {"Hong Kong",      8.0, 22.3193,  114.1694},
        {"Tokyo",          9.0, 35.6804,  139.7690},
        {"Melbourne",     10.0, -37.8136, 144.9631},
    };
    return list;
}

std::optional<f64> parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

/// Local civil time now, at a fixed offset from UTC.
DateTime local_now(f64 utc_offset_h)
{
    DateTime dt = TimeScale::from_julian_day(TimeScale::now_as_julian_day() + utc_offset_h / 24.0);
    dt.second = std::floor(dt.second);
    return dt;
}

std::string format_hhmm(const std::optional<f64>& hours)
{
    if (!hours || *hours == astro_constants::kEventSentinel)
    {
        return "--:--";
    }

    const i32 total_minutes = static_cast<i32>(std::floor(*hours * 60.0));
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(2) << (total_minutes / 60) % 24
       << ':' << std::setw(2) << total_minutes % 60;
    return ss.str();
}

std::string format_hhmm(const DateTime& dt)
{
    return format_hhmm(static_cast<f64>(dt.hour) + static_cast<f64>(dt.minute) / 60.0);
}

void print_usage()
{
    std::cout << "Usage: helios                               sun table for built-in cities\n"
              << "       helios <lat> <lon> [utc_offset_h]   full solution for one site\n";
}

int print_city_table()
{
    std::cout << "City          | Local | Zenith  | Azimuth | Sunrise | Transit | Sunset\n"
              << "--------------+-------+---------+---------+---------+---------+-------\n";

    for (const City& city : cities())
    {
        const SpaInput input{
            .time      = local_now(city.utc_offset_h),
            .timezone  = city.utc_offset_h,
            .longitude = city.longitude,
            .latitude  = city.latitude,
        };

        const SpaOutput out = calculate(input);

        std::cout << std::left << std::setw(13) << city.name << std::right
                  << " | " << format_hhmm(input.time)
                  << " | " << std::fixed << std::setprecision(2) << std::setw(6) << out.zenith << "°"
                  << " | " << std::setw(6) << out.azimuth << "°"
                  << " |  " << format_hhmm(out.sunrise)
                  << "  |  " << format_hhmm(out.sun_transit)
                  << "  | " << format_hhmm(out.sunset) << "\n";
    }

    return 0;
}

int print_site(f64 latitude, f64 longitude, f64 utc_offset_h)
{
    const SpaInput input{
        .time      = local_now(utc_offset_h),
        .timezone  = utc_offset_h,
        .longitude = longitude,
        .latitude  = latitude,
    };

    SpaIntermediate it;
    const SpaOutput out = calculate(input, SpaOptions{}, it);

    std::cout << std::fixed << std::setprecision(6)
              << "Julian Day:       " << it.geocentric.time.jd << "\n"
              << "Right ascension:  " << it.geocentric.right_ascension << "°\n"
              << "Declination:      " << it.geocentric.declination << "°\n"
              << "Hour angle:       " << it.topocentric.observer_hour_angle << "°\n"
              << "Zenith:           " << out.zenith << "°\n"
              << "Azimuth:          " << out.azimuth << "°\n"
              << "Incidence:        " << out.incidence.value_or(0.0) << "°\n"
              << "Equation of time: " << it.equation_of_time << " min\n"
              << "Sunrise:          " << format_hhmm(out.sunrise) << "\n"
              << "Transit:          " << format_hhmm(out.sun_transit) << "\n"
              << "Sunset:           " << format_hhmm(out.sunset) << "\n";

    return 0;
}

int run(const std::vector<std::string_view>& args)
{
    if (args.empty())
    {
        return print_city_table();
    }

    if (args.size() < 2 || args.size() > 3)
    {
        print_usage();
        return 1;
    }

    const auto latitude  = parse_f64(args[0]);
    const auto longitude = parse_f64(args[1]);
    const auto offset    = args.size() == 3 ? parse_f64(args[2]) : std::optional<f64>{0.0};

    if (!latitude || !longitude || !offset)
    {
        HLS_ERROR("Arguments must be decimal numbers");
        print_usage();
        return 1;
    }

    return print_site(*latitude, *longitude, *offset);
}

} // anonymous namespace

int main(int argc, char** argv)
{
    core::Logger::init();

    const std::vector<std::string_view> args(argv + 1, argv + argc);

    int status = 1;
    try
    {
        status = run(args);
    }
    catch (const InputRangeError& e)
    {
        HLS_ERROR("Invalid site: {}", e.what());
        status = 1;
    }

    core::Logger::shutdown();
    return status;
}
