/**
 * @file globe_solver.hpp
 * @brief Declarations for the globe module.
 *
 * Newton-Raphson solution of the globe energy balance for single cells and
 * for whole 2D fields with missing-value propagation.
 * This file is part of the src/globe subsystem.
 */

#pragma once
#include "globe_base.hpp"

namespace globe_solver
{

/**
 * @brief Solves one cell from finite inputs.
 * @param air_temperature_c Air temperature [C].
 * @param shortwave_wm2 Incoming shortwave [W/m²].
 * @param wind_speed_ms Wind speed [m/s]; negative values act as calm air.
 * @param constants Globe constants.
 * @param cfg Iteration limits (assumed valid).
 * @return Tagged result: Converged, BestEffort, DegenerateDerivative or NonFinite.
 */
CellSolution solve_cell(double air_temperature_c,
                        double shortwave_wm2,
                        double wind_speed_ms,
                        const GlobeConstants& constants,
                        const GlobeSolverConfig& cfg);

/**
 * @brief Solves every cell of co-registered air temperature, shortwave and wind fields.
 *
 * Cells missing in any input stay missing in the output. Output missing cells
 * carry NaN. The traversal runs under OpenMP with disjoint writes.
 *
 * @throws std::invalid_argument on shape mismatch or invalid limits/constants.
 */
GlobeFieldResult solve_field(const Field2D& air_temperature_c,
                             const Field2D& shortwave_wm2,
                             const Field2D& wind_speed_ms,
                             const GlobeConstants& constants,
                             const GlobeSolverConfig& cfg);

/**
 * @brief Prints the numerical-stability summary of a grid solve.
 * @param result Completed grid solve.
 * @param context Label for the log line (e.g. time-step name).
 */
void log_solve_summary(const GlobeFieldResult& result, const std::string& context);

} // namespace globe_solver
