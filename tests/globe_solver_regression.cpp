#include "globe/globe_solver.hpp"
#include "globe/base/energy_balance.hpp"

#include <cmath>
#include <cstring>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

constexpr float kNaN = std::numeric_limits<float>::quiet_NaN();

bool nearly_equal(double a, double b, double tol = 1.0e-12)
{
    return std::abs(a - b) <= tol;
}

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[globe-solver-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

int expect_close(double actual, double expected, const std::string& label, double tol = 1.0e-12)
{
    if (!nearly_equal(actual, expected, tol))
    {
        std::cerr << "[globe-solver-regression] FAIL: " << label
                  << " actual=" << actual
                  << " expected=" << expected
                  << " tol=" << tol << std::endl;
        return 1;
    }
    return 0;
}

int test_missing_propagation()
{
    int failures = 0;
    const GlobeConstants constants;
    const GlobeSolverConfig cfg;

    Field2D ta(3, 4, 25.0f);
    Field2D sw(3, 4, 600.0f, -9999.0f);
    Field2D ws(3, 4, 2.0f);
    ta(0, 1) = kNaN;
    sw(1, 2) = -9999.0f;
    ws(2, 3) = kNaN;

    const GlobeFieldResult result = globe_solver::solve_field(ta, sw, ws, constants, cfg);

    failures += expect_true(result.globe_c.size_y() == 3 && result.globe_c.size_x() == 4,
                            "output shape must match inputs");
    failures += expect_true(result.status.size() == 12, "status grid must cover every cell");

    for (int i = 0; i < 3; ++i)
    {
        for (int j = 0; j < 4; ++j)
        {
            const bool masked = (i == 0 && j == 1) || (i == 1 && j == 2) || (i == 2 && j == 3);
            const std::string where = " at (" + std::to_string(i) + "," + std::to_string(j) + ")";
            if (masked)
            {
                failures += expect_true(std::isnan(result.globe_c(i, j)), "missing input must stay missing" + where);
                failures += expect_true(result.status_at(i, j) == CellStatus::MissingInput,
                                        "missing input status" + where);
            }
            else
            {
                failures += expect_true(std::isfinite(result.globe_c(i, j)), "valid cell must be solved" + where);
                failures += expect_true(result.status_at(i, j) == CellStatus::Converged, "converged status" + where);
            }
        }
    }

    failures += expect_true(result.stats.missing_input == 3, "three missing cells counted");
    failures += expect_true(result.stats.converged == 9, "nine converged cells counted");
    return failures;
}

int test_shape_mismatch_throws()
{
    int failures = 0;
    const GlobeConstants constants;
    const GlobeSolverConfig cfg;

    const Field2D ta(3, 4, 20.0f);
    const Field2D sw(3, 4, 500.0f);
    const Field2D ws(4, 3, 1.0f);

    bool threw = false;
    try
    {
        (void)globe_solver::solve_field(ta, sw, ws, constants, cfg);
    }
    catch (const std::invalid_argument&)
    {
        threw = true;
    }
    failures += expect_true(threw, "shape mismatch must raise invalid_argument");
    return failures;
}

int test_zero_wind_closed_form()
{
    int failures = 0;
    const GlobeConstants constants;
    const GlobeSolverConfig cfg;

    const CellSolution cell = globe_solver::solve_cell(30.0, 800.0, 0.0, constants, cfg);
    failures += expect_true(cell.status == CellStatus::Converged, "zero-wind cell must converge");

    const double ta_k = 30.0 + physical_constants::freezing_temperature_k;
    const double left = constants.solar_absorptivity * 800.0 +
                        constants.emissivity * constants.atmospheric_emissivity *
                        constants.stefan_boltzmann_wm2k4 * std::pow(ta_k, 4.0);
    const double expected_c = std::pow(left / (constants.emissivity * constants.stefan_boltzmann_wm2k4), 0.25) -
                              physical_constants::freezing_temperature_k;

    failures += expect_close(cell.value_c, expected_c, "zero-wind closed form", 0.01);
    failures += expect_true(cell.value_c > 30.0, "globe must be hotter than air under sunshine");
    return failures;
}

int test_monotonic_in_shortwave()
{
    int failures = 0;
    const GlobeConstants constants;
    const GlobeSolverConfig cfg;

    const std::vector<double> air = {-10.0, 15.0, 35.0};
    const std::vector<double> wind = {0.0, 2.0, 10.0};
    for (const double ta : air)
    {
        for (const double ws : wind)
        {
            double previous = -std::numeric_limits<double>::infinity();
            for (double sw = 0.0; sw <= 1200.0; sw += 100.0)
            {
                const CellSolution cell = globe_solver::solve_cell(ta, sw, ws, constants, cfg);
                failures += expect_true(cell.status == CellStatus::Converged, "sweep cell must converge");
                failures += expect_true(cell.value_c >= previous,
                                        "Tg must be non-decreasing in SW (ta=" + std::to_string(ta) +
                                        ", ws=" + std::to_string(ws) + ", sw=" + std::to_string(sw) + ")");
                previous = cell.value_c;
            }
        }
    }
    return failures;
}

int test_convergence_count_bound()
{
    int failures = 0;
    const GlobeConstants constants;
    const GlobeSolverConfig cfg;

    std::size_t total = 0;
    std::size_t fast = 0;
    for (double ta = -20.0; ta <= 50.0; ta += 5.0)
    {
        for (double sw = 0.0; sw <= 1200.0; sw += 100.0)
        {
            for (double ws = 0.0; ws <= 20.0; ws += 2.0)
            {
                const CellSolution cell = globe_solver::solve_cell(ta, sw, ws, constants, cfg);
                ++total;
                if (cell.status == CellStatus::Converged && cell.iterations <= 20)
                {
                    ++fast;
                }
            }
        }
    }

    failures += expect_true(total > 0, "sweep must visit cells");
    failures += expect_true(static_cast<double>(fast) >= 0.99 * static_cast<double>(total),
                            "at least 99% of cells converge within 20 iterations (" +
                            std::to_string(fast) + "/" + std::to_string(total) + ")");
    return failures;
}

int test_idempotence()
{
    int failures = 0;
    const GlobeConstants constants;
    const GlobeSolverConfig cfg;

    const int ny = 16;
    const int nx = 24;
    Field2D ta(ny, nx);
    Field2D sw(ny, nx);
    Field2D ws(ny, nx);
    for (int i = 0; i < ny; ++i)
    {
        for (int j = 0; j < nx; ++j)
        {
            ta(i, j) = -15.0f + 4.0f * static_cast<float>(i);
            sw(i, j) = 50.0f * static_cast<float>(j);
            ws(i, j) = 0.5f * static_cast<float>((i + j) % 12);
        }
    }
    ta(3, 5) = kNaN;

    const GlobeFieldResult first = globe_solver::solve_field(ta, sw, ws, constants, cfg);
    const GlobeFieldResult second = globe_solver::solve_field(ta, sw, ws, constants, cfg);

    failures += expect_true(std::memcmp(first.globe_c.data(), second.globe_c.data(),
                                        first.globe_c.size() * sizeof(float)) == 0,
                            "repeated solves must be bit-identical");
    failures += expect_true(first.status == second.status, "repeated solves must give identical status");
    return failures;
}

int test_concrete_scenario()
{
    int failures = 0;
    const GlobeConstants constants;
    const GlobeSolverConfig cfg;

    const double ta_k = 35.0 + physical_constants::freezing_temperature_k;
    const EnergyBalanceEquation eq(ta_k, 1000.0, 1.0, constants);
    failures += expect_close(eq.reynolds_number(), 3333.33, "scenario Re", 0.01);
    failures += expect_close(eq.convective_coefficient(),
                             0.0014 * std::pow(eq.reynolds_number(), 0.6) * 0.5,
                             "scenario h_c", 1.0e-12);

    const CellSolution cell = globe_solver::solve_cell(35.0, 1000.0, 1.0, constants, cfg);
    failures += expect_true(cell.status == CellStatus::Converged, "scenario must converge");
    failures += expect_true(cell.iterations <= 100, "scenario converges within 100 iterations");
    failures += expect_true(cell.value_c > 35.0, "scenario Tg above air temperature");

    const double bound_c = eq.radiative_equilibrium_k() - physical_constants::freezing_temperature_k;
    failures += expect_true(cell.value_c <= bound_c + 0.01, "scenario Tg bounded by radiative equilibrium");
    failures += expect_close(eq.residual(cell.value_c + physical_constants::freezing_temperature_k), 0.0,
                             "scenario residual at root", 1.0e-3);
    return failures;
}

int test_negative_wind_clamp()
{
    int failures = 0;
    const GlobeConstants constants;
    const GlobeSolverConfig cfg;

    const CellSolution negative = globe_solver::solve_cell(28.0, 700.0, -5.0, constants, cfg);
    const CellSolution calm = globe_solver::solve_cell(28.0, 700.0, 0.0, constants, cfg);
    failures += expect_true(negative.status == calm.status, "negative wind status equals calm");
    failures += expect_true(negative.value_c == calm.value_c, "negative wind result bit-identical to calm");
    failures += expect_true(negative.iterations == calm.iterations, "negative wind iterations equal calm");
    return failures;
}

int test_degenerate_derivative()
{
    int failures = 0;
    const GlobeConstants constants;
    const GlobeSolverConfig cfg;

    // Ta = 0 K, no sun, calm air: f'(Ta) = 0.
    const CellSolution cell = globe_solver::solve_cell(-physical_constants::freezing_temperature_k,
                                                       0.0, 0.0, constants, cfg);
    failures += expect_true(cell.status == CellStatus::DegenerateDerivative, "zero derivative must be detected");
    failures += expect_true(!cell.has_value(), "degenerate cell carries no value");

    Field2D ta(1, 2, 20.0f);
    Field2D sw(1, 2, 0.0f);
    Field2D ws(1, 2, 0.0f);
    ta(0, 0) = static_cast<float>(-physical_constants::freezing_temperature_k);
    const GlobeFieldResult result = globe_solver::solve_field(ta, sw, ws, constants, cfg);
    failures += expect_true(std::isnan(result.globe_c(0, 0)), "degenerate cell is missing in the field");
    failures += expect_true(result.status_at(0, 0) == CellStatus::DegenerateDerivative, "degenerate status in field");
    failures += expect_true(result.status_at(0, 1) == CellStatus::Converged, "neighbour still solved");
    failures += expect_true(result.stats.degenerate_derivative == 1, "degenerate cell counted");
    return failures;
}

int test_best_effort_fallback()
{
    int failures = 0;
    const GlobeConstants constants;
    GlobeSolverConfig cfg;
    cfg.max_iterations = 1;

    const CellSolution cell = globe_solver::solve_cell(35.0, 1000.0, 1.0, constants, cfg);
    failures += expect_true(cell.status == CellStatus::BestEffort, "exhausted iterations give best effort");
    failures += expect_true(cell.has_value(), "best effort keeps the last estimate");
    failures += expect_true(std::isfinite(cell.value_c) && cell.value_c > 35.0, "best effort estimate is usable");
    failures += expect_true(cell.iterations == 1, "best effort used every iteration");

    const Field2D ta(2, 2, 35.0f);
    const Field2D sw(2, 2, 1000.0f);
    const Field2D ws(2, 2, 1.0f);
    const GlobeFieldResult result = globe_solver::solve_field(ta, sw, ws, constants, cfg);
    failures += expect_true(result.stats.best_effort == 4, "best-effort cells counted");
    failures += expect_true(std::isfinite(result.globe_c(1, 1)), "best-effort value written to field");

    const Field2D codes = status_field(result);
    failures += expect_close(codes(0, 0), static_cast<double>(static_cast<int>(CellStatus::BestEffort)), "status code export");
    return failures;
}

int test_invalid_config_throws()
{
    int failures = 0;
    const GlobeConstants constants;
    const Field2D ta(1, 1, 20.0f);
    const Field2D sw(1, 1, 100.0f);
    const Field2D ws(1, 1, 1.0f);

    const auto throws_with = [&](const GlobeSolverConfig& cfg, const GlobeConstants& c)
    {
        try
        {
            (void)globe_solver::solve_field(ta, sw, ws, c, cfg);
        }
        catch (const std::invalid_argument&)
        {
            return true;
        }
        return false;
    };

    GlobeSolverConfig zero_iterations;
    zero_iterations.max_iterations = 0;
    failures += expect_true(throws_with(zero_iterations, constants), "max_iterations = 0 must raise");

    GlobeSolverConfig bad_tolerance;
    bad_tolerance.tolerance_k = -1.0;
    failures += expect_true(throws_with(bad_tolerance, constants), "negative tolerance must raise");

    GlobeSolverConfig bad_floor;
    bad_floor.derivative_floor = std::numeric_limits<double>::quiet_NaN();
    failures += expect_true(throws_with(bad_floor, constants), "NaN derivative floor must raise");

    GlobeConstants bad_diameter = constants;
    bad_diameter.diameter_m = 0.0;
    failures += expect_true(throws_with(GlobeSolverConfig{}, bad_diameter), "zero diameter must raise");

    GlobeConstants no_emission = constants;
    no_emission.emissivity = 0.0;
    failures += expect_true(throws_with(GlobeSolverConfig{}, no_emission), "zero emissivity must raise");

    GlobeConstants no_sigma = constants;
    no_sigma.stefan_boltzmann_wm2k4 = 0.0;
    failures += expect_true(throws_with(GlobeSolverConfig{}, no_sigma), "zero Stefan-Boltzmann constant must raise");

    GlobeConstants transparent_air = constants;
    transparent_air.atmospheric_emissivity = 0.0;
    failures += expect_true(!throws_with(GlobeSolverConfig{}, transparent_air), "zero atmospheric emissivity is allowed");

    return failures;
}

}

int main()
{
    int failures = 0;
    failures += test_missing_propagation();
    failures += test_shape_mismatch_throws();
    failures += test_zero_wind_closed_form();
    failures += test_monotonic_in_shortwave();
    failures += test_convergence_count_bound();
    failures += test_idempotence();
    failures += test_concrete_scenario();
    failures += test_negative_wind_clamp();
    failures += test_degenerate_derivative();
    failures += test_best_effort_fallback();
    failures += test_invalid_config_throws();

    if (failures > 0)
    {
        std::cerr << "[globe-solver-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[globe-solver-regression] all checks passed" << std::endl;
    return 0;
}
