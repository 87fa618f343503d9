/// @file nutation.cpp
/// @brief Implementation of the nutation series.

#include "astro/nutation.hpp"

#include "astro/coefficient_tables.hpp"

#include <glm/trigonometric.hpp>

#include <cmath>

namespace helios::astro
{

namespace
{

/// a·x³ + b·x² + c·x + d
f64 third_order_polynomial(f64 a, f64 b, f64 c, f64 d, f64 x)
{
    return ((a * x + b) * x + c) * x + d;
}

f64 argument_sum(const NutationMultipliers& y, const FundamentalArguments& x)
{
    return x.elongation     * static_cast<f64>(y.elongation)
         + x.anomaly_sun    * static_cast<f64>(y.anomaly_sun)
         + x.anomaly_moon   * static_cast<f64>(y.anomaly_moon)
         + x.latitude_moon  * static_cast<f64>(y.latitude_moon)
         + x.ascending_node * static_cast<f64>(y.ascending_node);
}

// Coefficients are in 0.0001 arcsec: 3600 × 10000
constexpr f64 kCoefficientToDeg = 36000000.0;

} // anonymous namespace

// -----------------------------------------------------------------
// Fundamental arguments (Meeus, Ch. 22), cubic in T
// -----------------------------------------------------------------

FundamentalArguments NutationModel::fundamental_arguments(f64 jce)
{
    return FundamentalArguments{
        .elongation     = third_order_polynomial(1.0 / 189474.0, -0.0019142, 445267.11148, 297.85036, jce),
        .anomaly_sun    = third_order_polynomial(-1.0 / 300000.0, -0.0001603, 35999.05034, 357.52772, jce),
        .anomaly_moon   = third_order_polynomial(1.0 / 56250.0, 0.0086972, 477198.867398, 134.96298, jce),
        .latitude_moon  = third_order_polynomial(1.0 / 327270.0, -0.0036825, 483202.017538, 93.27191, jce),
        .ascending_node = third_order_polynomial(1.0 / 450000.0, 0.0020708, -1934.136261, 125.04452, jce),
    };
}

Nutation NutationModel::nutation(f64 jce, const FundamentalArguments& x)
{
    f64 sum_psi = 0.0;
    f64 sum_eps = 0.0;

    for (const NutationTerm& term : kNutationTerms)
    {
        const f64 arg = glm::radians(argument_sum(term.multipliers, x));
        const NutationCoefficients& c = term.coefficients;

        sum_psi += (c.psi + jce * c.psi_rate) * std::sin(arg);
        sum_eps += (c.eps + jce * c.eps_rate) * std::cos(arg);
    }

    return Nutation{
        .longitude = sum_psi / kCoefficientToDeg,
        .obliquity = sum_eps / kCoefficientToDeg,
    };
}

f64 NutationModel::mean_obliquity_arcsec(f64 jme)
{
    const f64 u = jme / 10.0;

    return 84381.448 + u * (-4680.93 + u * (-1.55 + u * (1999.25 + u * (-51.38
         + u * (-249.67 + u * (-39.05 + u * (7.12 + u * (27.87 + u * (5.79
         + u * 2.45)))))))));
}

f64 NutationModel::true_obliquity(f64 delta_eps, f64 mean_obliquity_arcsec)
{
    return delta_eps + mean_obliquity_arcsec / 3600.0;
}

} // namespace helios::astro
