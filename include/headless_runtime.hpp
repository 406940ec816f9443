#pragma once

#include <string>

#include "runtime_config.hpp"

/**
 * @file headless_runtime.hpp
 * @brief Options for non-interactive simulation runs.
 *
 * Defines the option bundle consumed by the headless runner and
 * exposes the entry point used by the CLI, scripts, and batch jobs.
 */

namespace solarosc
{

struct HeadlessRunOptions
{
    SimulationSetup setup;
    bool write_summary = true;
};

/**
 * @brief Runs one realization and exports the series.
 * @param options Setup plus export switches.
 * @return Process-style status code where zero indicates success.
 */
int run_headless_simulation(const HeadlessRunOptions& options);

}
