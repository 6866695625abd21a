/**
 * @file stull.cpp
 * @brief Implementation for the wet-bulb module.
 *
 * Evaluates the Stull (2011) fit with the configured RH units,
 * validity-range rejection and air-temperature cap.
 * This file is part of the src/wetbulb subsystem.
 */

#include "stull.hpp"
#include "log_profile.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

StullWetBulbScheme::StullWetBulbScheme()
    : rh_is_fraction_(false), restrict_to_valid_range_(false), cap_at_air_temperature_(true)
{}

/**
 * @brief Copies method-selection flags from the configuration.
 */
void StullWetBulbScheme::initialize(const WetBulbConfig& cfg)
{
    rh_is_fraction_ = cfg.rh_is_fraction;
    restrict_to_valid_range_ = cfg.restrict_to_valid_range;
    cap_at_air_temperature_ = cfg.cap_at_air_temperature;

    if (log_normal_enabled())
    {
        std::cout << "Initialized Stull wet-bulb scheme:" << std::endl;
        std::cout << "  RH units: " << (rh_is_fraction_ ? "fraction" : "percent") << std::endl;
        std::cout << "  Restrict to fit range: " << (restrict_to_valid_range_ ? "yes" : "no") << std::endl;
        std::cout << "  Cap at air temperature: " << (cap_at_air_temperature_ ? "yes" : "no") << std::endl;
    }
}

/**
 * @brief Computes Tw from T [C] and RH [%].
 */
double StullWetBulbScheme::stull_formula(double t_c, double rh_pct)
{
    return t_c * std::atan(0.151977 * std::sqrt(rh_pct + 8.313659)) +
           std::atan(t_c + rh_pct) -
           std::atan(rh_pct - 1.676331) +
           0.00391838 * std::pow(rh_pct, 1.5) * std::atan(0.023101 * rh_pct) -
           4.686035;
}

/**
 * @brief Computes the wet-bulb temperature of one point.
 */
double StullWetBulbScheme::compute_point(double air_temperature_c, double relative_humidity) const
{
    if (!std::isfinite(air_temperature_c) || !std::isfinite(relative_humidity))
    {
        return std::numeric_limits<double>::quiet_NaN();
    }

    double rh_pct = rh_is_fraction_ ? relative_humidity * 100.0 : relative_humidity;

    if (restrict_to_valid_range_ &&
        (rh_pct < stull_constants::rh_min_pct || rh_pct > stull_constants::rh_max_pct ||
         air_temperature_c < stull_constants::t_min_c || air_temperature_c > stull_constants::t_max_c))
    {
        return std::numeric_limits<double>::quiet_NaN();
    }

    rh_pct = std::clamp(rh_pct, 0.0, 100.0);
    double tw = stull_formula(air_temperature_c, rh_pct);
    if (cap_at_air_temperature_)
    {
        tw = std::min(tw, air_temperature_c);
    }
    return tw;
}
