/**
 * @file energy_balance.cpp
 * @brief Implementation for the globe module.
 *
 * Evaluates the radiative-convective balance terms of a black globe.
 * This file is part of the src/globe subsystem.
 */

#include "energy_balance.hpp"
#include <cmath>
#include <limits>

namespace energy_balance
{

/**
 * @brief Computes h_c = 0.0014 Re^0.6 k_air / D.
 */
double convective_coefficient(double reynolds, const GlobeConstants& c)
{
    if (reynolds <= 0.0)
    {
        return 0.0;
    }
    return 0.0014 * std::pow(reynolds, 0.6) * (c.air_conductivity_wmk / c.diameter_m);
}

/**
 * @brief Computes alpha_sp SW + eps eps_a sigma Ta^4.
 */
double absorbed_flux(double air_temperature_k, double shortwave_wm2, const GlobeConstants& c)
{
    const double t2 = air_temperature_k * air_temperature_k;
    return c.solar_absorptivity * shortwave_wm2 +
           c.emissivity * c.atmospheric_emissivity * c.stefan_boltzmann_wm2k4 * t2 * t2;
}

} // namespace energy_balance

EnergyBalanceEquation::EnergyBalanceEquation(double air_temperature_k,
                                             double shortwave_wm2,
                                             double wind_speed_ms,
                                             const GlobeConstants& constants)
    : air_temperature_k_(air_temperature_k),
      reynolds_(energy_balance::reynolds_number(wind_speed_ms, constants)),
      h_c_(0.0),
      absorbed_(energy_balance::absorbed_flux(air_temperature_k, shortwave_wm2, constants)),
      eps_sigma_(constants.emissivity * constants.stefan_boltzmann_wm2k4)
{
    h_c_ = energy_balance::convective_coefficient(reynolds_, constants);
}

/**
 * @brief Computes the zero-convection equilibrium temperature.
 */
double EnergyBalanceEquation::radiative_equilibrium_k() const
{
    if (eps_sigma_ <= 0.0 || absorbed_ < 0.0)
    {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return std::pow(absorbed_ / eps_sigma_, 0.25);
}
