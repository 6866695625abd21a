/**
 * @file stull.hpp
 * @brief Declarations for the wet-bulb module.
 *
 * Empirical wet-bulb fit of Stull (2011, J. Appl. Meteor. Climatol.)
 * at standard sea-level pressure.
 * This file is part of the src/wetbulb subsystem.
 */

#pragma once
#include "wetbulb_base.hpp"

namespace stull_constants
{
    inline constexpr double rh_min_pct = 5.0;
    inline constexpr double rh_max_pct = 99.0;
    inline constexpr double t_min_c = -20.0;
    inline constexpr double t_max_c = 50.0;
}

/**
 * @brief Implements the Stull (2011) wet-bulb approximation.
 */
class StullWetBulbScheme : public WetBulbSchemeBase
{
private:
    bool rh_is_fraction_;
    bool restrict_to_valid_range_;
    bool cap_at_air_temperature_;

public:
    StullWetBulbScheme();

    std::string name() const override { return "stull"; }

    void initialize(const WetBulbConfig& cfg) override;

    double compute_point(double air_temperature_c, double relative_humidity) const override;

    /**
     * @brief Raw Stull formula, T in C and RH in percent, without flags.
     */
    static double stull_formula(double t_c, double rh_pct);
};
