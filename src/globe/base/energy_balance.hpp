#pragma once
#include "globe_base.hpp"

/*This file contains the steady-state energy balance of a black globe.
The balance is absorbed solar plus atmospheric longwave on one side, and
emitted longwave plus forced convection on the other.*/
namespace energy_balance
{

/*This function computes the Reynolds number of the flow around the globe.
Takes in the wind speed and the globe constants; negative wind is treated as calm.*/
inline double reynolds_number(double wind_speed_ms, const GlobeConstants& c)
{
    const double ws = wind_speed_ms > 0.0 ? wind_speed_ms : 0.0;
    return ws * c.diameter_m / c.kinematic_viscosity_m2s;
}

/*This function computes the forced-convection heat transfer coefficient [W/m²/K].*/
double convective_coefficient(double reynolds, const GlobeConstants& c);

/*This function computes the absorbed energy input [W/m²]:
solar absorption plus absorbed downward atmospheric longwave.*/
double absorbed_flux(double air_temperature_k, double shortwave_wm2, const GlobeConstants& c);

} // namespace energy_balance

/**
 * @brief Energy balance residual of one cell, f(Tg) = emitted + convected - absorbed.
 *
 * Derived quantities are fixed at construction; residual() and derivative()
 * are pure functions of the trial globe temperature and accept any real Tg.
 */
class EnergyBalanceEquation
{
private:
    double air_temperature_k_;
    double reynolds_;
    double h_c_;
    double absorbed_;
    double eps_sigma_;

public:
    /**
     * @brief Builds the balance for one cell.
     * @param air_temperature_k Air temperature [K].
     * @param shortwave_wm2 Incoming shortwave [W/m²], used as given.
     * @param wind_speed_ms Wind speed [m/s], clamped to zero when negative.
     * @param constants Globe and air constants.
     */
    EnergyBalanceEquation(double air_temperature_k,
                          double shortwave_wm2,
                          double wind_speed_ms,
                          const GlobeConstants& constants);

    double residual(double tg_k) const
    {
        const double tg2 = tg_k * tg_k;
        return eps_sigma_ * tg2 * tg2 + h_c_ * (tg_k - air_temperature_k_) - absorbed_;
    }

    double derivative(double tg_k) const
    {
        return 4.0 * eps_sigma_ * tg_k * tg_k * tg_k + h_c_;
    }

    double air_temperature_k() const { return air_temperature_k_; }
    double reynolds_number() const { return reynolds_; }
    double convective_coefficient() const { return h_c_; }
    double absorbed_flux() const { return absorbed_; }

    /**
     * @brief Closed-form root with convection switched off, (left/(eps*sigma))^0.25 [K].
     *
     * Equals the solver root when wind is calm and bounds it from above
     * whenever the globe runs warmer than the air.
     */
    double radiative_equilibrium_k() const;
};
