/**
 * @file globe_solver.cpp
 * @brief Implementation for the globe module.
 *
 * Provides the per-cell Newton-Raphson iteration, the OpenMP grid map,
 * solver-limit checks and numerical-stability reporting.
 * This file is part of the src/globe subsystem.
 */

#include "globe_solver.hpp"
#include "base/energy_balance.hpp"
#include "log_profile.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <utility>

namespace
{
constexpr std::size_t k_max_logged_cells = 8;

bool is_abnormal(CellStatus status)
{
    return status == CellStatus::DegenerateDerivative ||
           status == CellStatus::NonFinite ||
           status == CellStatus::BestEffort;
}
}

/**
 * @brief Returns stable labels used in logs and summaries.
 */
const char* to_string(CellStatus status)
{
    switch (status)
    {
        case CellStatus::Converged:
            return "converged";
        case CellStatus::BestEffort:
            return "best_effort";
        case CellStatus::MissingInput:
            return "missing_input";
        case CellStatus::DegenerateDerivative:
            return "degenerate_derivative";
        case CellStatus::NonFinite:
            return "non_finite";
        default:
            return "unknown";
    }
}

/**
 * @brief Rejects iteration limits the Newton loop cannot honour.
 */
void validate_solver_config(const GlobeSolverConfig& cfg)
{
    if (cfg.max_iterations < 1)
    {
        throw std::invalid_argument("globe solver max_iterations must be at least 1");
    }
    if (!std::isfinite(cfg.tolerance_k) || cfg.tolerance_k <= 0.0)
    {
        throw std::invalid_argument("globe solver tolerance_k must be positive and finite");
    }
    if (!std::isfinite(cfg.derivative_floor) || cfg.derivative_floor <= 0.0)
    {
        throw std::invalid_argument("globe solver derivative_floor must be positive and finite");
    }
}

/**
 * @brief Rejects constants that make Re, h_c or the radiative term undefined.
 */
void validate_globe_constants(const GlobeConstants& c)
{
    const auto require_positive = [](double value, const char* name)
    {
        if (!std::isfinite(value) || value <= 0.0)
        {
            throw std::invalid_argument(std::string("globe constant ") + name + " must be positive and finite");
        }
    };
    const auto require_non_negative = [](double value, const char* name)
    {
        if (!std::isfinite(value) || value < 0.0)
        {
            throw std::invalid_argument(std::string("globe constant ") + name + " must be non-negative and finite");
        }
    };

    require_positive(c.diameter_m, "diameter_m");
    require_positive(c.kinematic_viscosity_m2s, "kinematic_viscosity_m2s");
    require_non_negative(c.air_conductivity_wmk, "air_conductivity_wmk");
    require_non_negative(c.solar_absorptivity, "solar_absorptivity");
    require_positive(c.emissivity, "emissivity");
    require_non_negative(c.atmospheric_emissivity, "atmospheric_emissivity");
    require_positive(c.stefan_boltzmann_wm2k4, "stefan_boltzmann_wm2k4");
}

/**
 * @brief Converts the status grid to a float field of status codes.
 */
Field2D status_field(const GlobeFieldResult& result)
{
    Field2D out(result.globe_c.size_y(), result.globe_c.size_x(), 0.0f);
    float* dst = out.data();
    for (std::size_t n = 0; n < result.status.size(); ++n)
    {
        dst[n] = static_cast<float>(static_cast<int>(result.status[n]));
    }
    return out;
}

namespace globe_solver
{

/**
 * @brief Runs Newton-Raphson from Tg = Ta for one cell.
 */
CellSolution solve_cell(double air_temperature_c,
                        double shortwave_wm2,
                        double wind_speed_ms,
                        const GlobeConstants& constants,
                        const GlobeSolverConfig& cfg)
{
    const double ta_k = air_temperature_c + physical_constants::freezing_temperature_k;
    const EnergyBalanceEquation eq(ta_k, shortwave_wm2, wind_speed_ms, constants);

    CellSolution out;
    double tg_prev = ta_k;

    for (int iter = 0; iter < cfg.max_iterations; ++iter)
    {
        const double f_val = eq.residual(tg_prev);
        const double f_prime = eq.derivative(tg_prev);

        if (std::abs(f_prime) < cfg.derivative_floor)
        {
            out.status = CellStatus::DegenerateDerivative;
            out.iterations = iter + 1;
            return out;
        }

        const double tg_next = tg_prev - f_val / f_prime;
        if (!std::isfinite(tg_next))
        {
            out.status = CellStatus::NonFinite;
            out.iterations = iter + 1;
            return out;
        }

        if (std::abs(tg_next - tg_prev) < cfg.tolerance_k)
        {
            out.status = CellStatus::Converged;
            out.value_c = tg_next - physical_constants::freezing_temperature_k;
            out.iterations = iter + 1;
            return out;
        }

        tg_prev = tg_next;

        // Out of iterations: keep the last estimate
        if (iter == cfg.max_iterations - 1)
        {
            out.status = CellStatus::BestEffort;
            out.value_c = tg_next - physical_constants::freezing_temperature_k;
            out.iterations = iter + 1;
        }
    }

    return out;
}

namespace
{
/**
 * @brief Solves cell (i,j) unless any input marks it missing.
 */
CellSolution solve_masked_cell(const Field2D& ta_c,
                               const Field2D& sw_wm2,
                               const Field2D& ws_ms,
                               int i,
                               int j,
                               const GlobeConstants& constants,
                               const GlobeSolverConfig& cfg)
{
    const float ta = ta_c(i, j);
    const float sw = sw_wm2(i, j);
    const float ws = ws_ms(i, j);
    if (ta_c.is_missing_value(ta) || sw_wm2.is_missing_value(sw) || ws_ms.is_missing_value(ws) ||
        !std::isfinite(ta) || !std::isfinite(sw) || !std::isfinite(ws))
    {
        return CellSolution{};
    }
    return solve_cell(ta, sw, ws, constants, cfg);
}
}

/**
 * @brief Maps solve_cell over the grid.
 */
GlobeFieldResult solve_field(const Field2D& air_temperature_c,
                             const Field2D& shortwave_wm2,
                             const Field2D& wind_speed_ms,
                             const GlobeConstants& constants,
                             const GlobeSolverConfig& cfg)
{
    if (!air_temperature_c.same_shape(shortwave_wm2) || !air_temperature_c.same_shape(wind_speed_ms))
    {
        throw std::invalid_argument(
            "globe solver input shape mismatch: ta(" +
            std::to_string(air_temperature_c.size_y()) + "x" + std::to_string(air_temperature_c.size_x()) +
            ") sw(" + std::to_string(shortwave_wm2.size_y()) + "x" + std::to_string(shortwave_wm2.size_x()) +
            ") ws(" + std::to_string(wind_speed_ms.size_y()) + "x" + std::to_string(wind_speed_ms.size_x()) + ")");
    }
    validate_solver_config(cfg);
    validate_globe_constants(constants);

    const int ny = air_temperature_c.size_y();
    const int nx = air_temperature_c.size_x();

    GlobeFieldResult result;
    result.globe_c = Field2D::missing_like(air_temperature_c);
    result.status.assign(air_temperature_c.size(), CellStatus::MissingInput);
    std::vector<int> iterations(air_temperature_c.size(), 0);

    #pragma omp parallel for collapse(2) schedule(static)
    for (int i = 0; i < ny; ++i)
    {
        for (int j = 0; j < nx; ++j)
        {
            const CellSolution cell = solve_masked_cell(air_temperature_c, shortwave_wm2, wind_speed_ms,
                                                        i, j, constants, cfg);
            const std::size_t idx = static_cast<std::size_t>(i) * static_cast<std::size_t>(nx) +
                                    static_cast<std::size_t>(j);
            result.status[idx] = cell.status;
            iterations[idx] = cell.iterations;
            if (cell.has_value())
            {
                result.globe_c(i, j) = static_cast<float>(cell.value_c);
            }
        }
    }

    GlobeSolveStats& stats = result.stats;
    stats.total_cells = result.status.size();
    long long solved_iterations = 0;
    for (std::size_t n = 0; n < result.status.size(); ++n)
    {
        switch (result.status[n])
        {
            case CellStatus::Converged:
                ++stats.converged;
                break;
            case CellStatus::BestEffort:
                ++stats.best_effort;
                break;
            case CellStatus::MissingInput:
                ++stats.missing_input;
                break;
            case CellStatus::DegenerateDerivative:
                ++stats.degenerate_derivative;
                break;
            case CellStatus::NonFinite:
                ++stats.non_finite;
                break;
        }
        if (result.status[n] == CellStatus::Converged || result.status[n] == CellStatus::BestEffort)
        {
            solved_iterations += iterations[n];
            stats.max_iterations_used = std::max(stats.max_iterations_used, iterations[n]);
        }
    }
    const std::size_t solved = stats.converged + stats.best_effort;
    if (solved > 0)
    {
        stats.mean_iterations = static_cast<double>(solved_iterations) / static_cast<double>(solved);
    }

    return result;
}

/**
 * @brief Logs best-effort, degenerate and non-finite cell counts.
 */
void log_solve_summary(const GlobeFieldResult& result, const std::string& context)
{
    const GlobeSolveStats& s = result.stats;
    const bool abnormal = s.best_effort > 0 || s.degenerate_derivative > 0 || s.non_finite > 0;

    if (log_debug_enabled())
    {
        std::cout << "[GLOBE SOLVER] " << context
                  << ": cells=" << s.total_cells
                  << " converged=" << s.converged
                  << " missing_input=" << s.missing_input
                  << " mean_iter=" << s.mean_iterations
                  << " max_iter=" << s.max_iterations_used << std::endl;
    }

    if (!abnormal || !log_normal_enabled())
    {
        return;
    }

    std::cerr << "[GLOBE SOLVER] " << context
              << ": best_effort=" << s.best_effort
              << " degenerate_derivative=" << s.degenerate_derivative
              << " non_finite=" << s.non_finite
              << " (of " << s.total_cells << " cells)" << std::endl;

    if (!log_debug_enabled())
    {
        return;
    }

    const int nx = result.globe_c.size_x();
    std::size_t logged = 0;
    for (std::size_t n = 0; n < result.status.size() && logged < k_max_logged_cells; ++n)
    {
        if (!is_abnormal(result.status[n]) || nx == 0)
        {
            continue;
        }
        std::cerr << "  cell (" << n / static_cast<std::size_t>(nx) << ", "
                  << n % static_cast<std::size_t>(nx) << "): " << to_string(result.status[n]) << std::endl;
        ++logged;
    }
}

} // namespace globe_solver
