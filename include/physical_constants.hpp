#pragma once

/**
 * @file physical_constants.hpp
 * @brief Shared physical constants used across heat-stress components.
 *
 * Centralizes thermodynamic and radiative constants so the globe solver,
 * wet-bulb schemes and validation bounds agree on unit conversions.
 */

namespace physical_constants
{
inline constexpr double freezing_temperature_k = 273.15;
inline constexpr double stefan_boltzmann_wm2k4 = 5.67e-8;

// Reference globe parameters (small black globe, dry air near 300 K).
inline constexpr double globe_diameter_m = 0.05;
inline constexpr double air_thermal_conductivity_wmk = 0.025;
inline constexpr double air_kinematic_viscosity_m2s = 1.5e-5;
inline constexpr double globe_solar_absorptivity = 0.95;
inline constexpr double globe_longwave_emissivity = 0.95;
inline constexpr double atmospheric_emissivity = 0.8;
} // namespace physical_constants
