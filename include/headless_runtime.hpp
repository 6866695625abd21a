#pragma once

#include <string>
#include <vector>

#include "runtime_config.hpp"

/**
 * @file headless_runtime.hpp
 * @brief Batch pipeline entry points for gridded WBGT computation.
 *
 * Exposes step discovery and the pipeline runner used by the CLI,
 * tests and batch jobs.
 */

/**
 * @brief Lists time-step names that have an air temperature file.
 * @param input_directory Directory scanned for `<step>_ta.npy`.
 * @param error Output message when the directory cannot be read.
 * @return Step names in lexical order; empty on error.
 */
std::vector<std::string> discover_pipeline_steps(const std::string& input_directory, std::string& error);

/**
 * @brief Runs the full pipeline over every discovered step.
 * @param cfg Effective run configuration.
 * @return Zero on success, 1 on I/O or configuration failure,
 *         2 on strict validation failure.
 */
int run_wbgt_pipeline(const WbgtRunConfig& cfg);
