#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "field2d.hpp"
#include "physical_constants.hpp"

/*This header file contains the configuration and result structures for the globe module.
The globe module solves the radiative-convective energy balance of a black globe
for every grid cell and converts the equilibrium temperature to Celsius.
The physical constants and the Newton-Raphson limits are chosen by the user in the
configuration file; the solver only reads them.*/

// Immutable physical constants of the globe and the surrounding air
struct GlobeConstants
{
    double diameter_m = physical_constants::globe_diameter_m;
    double air_conductivity_wmk = physical_constants::air_thermal_conductivity_wmk;
    double kinematic_viscosity_m2s = physical_constants::air_kinematic_viscosity_m2s;
    double solar_absorptivity = physical_constants::globe_solar_absorptivity;
    double emissivity = physical_constants::globe_longwave_emissivity;
    double atmospheric_emissivity = physical_constants::atmospheric_emissivity;
    double stefan_boltzmann_wm2k4 = physical_constants::stefan_boltzmann_wm2k4;
};

// Newton-Raphson limits
struct GlobeSolverConfig
{
    int max_iterations = 100;
    double tolerance_k = 0.01;        // |Tg_next - Tg_prev| accepted as converged
    double derivative_floor = 1.0e-7; // |f'| below this aborts the cell
};

// Per-cell outcome; values are stable and exported in status grids
enum class CellStatus : std::uint8_t
{
    Converged = 0,
    BestEffort = 1,
    MissingInput = 2,
    DegenerateDerivative = 3,
    NonFinite = 4
};

// Result of one cell solve
struct CellSolution
{
    CellStatus status = CellStatus::MissingInput;
    double value_c = 0.0;  // globe temperature [C], meaningful when has_value()
    int iterations = 0;

    bool has_value() const
    {
        return status == CellStatus::Converged || status == CellStatus::BestEffort;
    }
};

// Aggregate counts for one grid solve
struct GlobeSolveStats
{
    std::size_t total_cells = 0;
    std::size_t converged = 0;
    std::size_t best_effort = 0;
    std::size_t missing_input = 0;
    std::size_t degenerate_derivative = 0;
    std::size_t non_finite = 0;
    int max_iterations_used = 0;
    double mean_iterations = 0.0;  // over converged and best-effort cells
};

// Globe temperature field plus per-cell status of the same shape
struct GlobeFieldResult
{
    Field2D globe_c;
    std::vector<CellStatus> status;  // row-major, globe_c.size() entries
    GlobeSolveStats stats;

    CellStatus status_at(int i, int j) const
    {
        return status[static_cast<std::size_t>(i) * static_cast<std::size_t>(globe_c.size_x()) +
                      static_cast<std::size_t>(j)];
    }
};

/**
 * @brief Returns a stable text label for a cell status.
 */
const char* to_string(CellStatus status);

/**
 * @brief Checks solver limits.
 * @throws std::invalid_argument on a non-positive iteration count or a
 *         non-positive / non-finite tolerance or derivative floor.
 */
void validate_solver_config(const GlobeSolverConfig& cfg);

/**
 * @brief Checks globe constants: geometry, viscosity, emissivity and sigma strictly positive,
 *        the remaining coefficients non-negative.
 * @throws std::invalid_argument on invalid values.
 */
void validate_globe_constants(const GlobeConstants& constants);

/**
 * @brief Converts a status grid into a float field of status codes.
 */
Field2D status_field(const GlobeFieldResult& result);
