/**
 * @file headless_runtime.cpp
 * @brief Core runtime implementation for the oscillation simulator.
 *
 * Runs one realization from a setup, rescales it to flux and
 * writes the series and run summary.
 * This file belongs to the primary src/core execution layer.
 */

#include "headless_runtime.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "oscillation.hpp"
#include "series_export.hpp"
#include "simulation.hpp"

namespace solarosc
{

/**
 * @brief Executes one simulation and exports the requested files.
 * @param options Headless runtime options from CLI/config integration.
 * @return Zero on success, non-zero on invalid input or export failure.
 */
int run_headless_simulation(const HeadlessRunOptions& options)
{
    const SimulationSetup& setup = options.setup;
    const std::filesystem::path outdir(setup.outdir);
    const std::vector<double> time = build_time_grid(setup.time);

    const ProgressObserver observer = [](ProgressStage stage, const std::string& detail)
    {
        if (log_debug_enabled())
        {
            std::cout << "[" << progress_stage_name(stage) << "] " << detail << std::endl;
        }
        else if (log_normal_enabled())
        {
            std::cout << detail << std::endl;
        }
    };

    RunSummary summary;
    summary.seed = setup.oscillation.seed;
    summary.member_id = setup.oscillation.member_id;
    summary.mean_flux = setup.mean_flux;
    summary.modes = setup.modes;

    std::vector<double> signal;
    try
    {
        signal = simulate(time, setup.modes, setup.oscillation, &summary.diagnostics, observer);
    }
    catch (const ShapeError& e)
    {
        std::cerr << "Invalid mode arrays: " << e.what() << std::endl;
        return 1;
    }
    catch (const DomainError& e)
    {
        std::cerr << "Invalid simulation input: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::runtime_error& e)
    {
        std::cerr << "Simulation failed: " << e.what() << std::endl;
        return 1;
    }

    const std::vector<double> flux = to_flux(signal, setup.mean_flux);
    summarize_signal(signal, summary);

    std::string error;
    auto record = [&](const std::filesystem::path& path, bool ok) -> bool
    {
        if (!ok)
        {
            std::cerr << "Export failed: " << error << std::endl;
            return false;
        }
        summary.files.push_back(path.filename().string());
        if (log_debug_enabled())
        {
            std::cout << "Wrote " << path.string() << std::endl;
        }
        return true;
    };

    if (setup.format == ExportFormat::csv || setup.format == ExportFormat::both)
    {
        const auto path = outdir / "signal.csv";
        if (!record(path, write_series_csv(time, signal, flux, path, error)))
        {
            return 1;
        }
    }

    if (setup.format == ExportFormat::npy || setup.format == ExportFormat::both)
    {
        const std::pair<const char*, const std::vector<double>*> arrays[] =
        {
            {"time.npy", &time},
            {"signal.npy", &signal},
            {"flux.npy", &flux},
        };
        for (const auto& entry : arrays)
        {
            const auto path = outdir / entry.first;
            if (!record(path, write_npy_1d(*entry.second, path, error)))
            {
                return 1;
            }
        }
    }

    if (options.write_summary)
    {
        const auto path = outdir / "summary.json";
        summary.files.push_back(path.filename().string());
        if (!write_run_summary_json(summary, path, error))
        {
            std::cerr << "Export failed: " << error << std::endl;
            return 1;
        }
    }

    if (log_normal_enabled())
    {
        std::cout << "Simulated " << summary.diagnostics.output_count << " samples of "
                  << summary.diagnostics.mode_count << " modes (scheme "
                  << summary.diagnostics.scheme << ", rms " << summary.signal_rms
                  << ") into " << outdir.string() << std::endl;
    }
    return 0;
}

}
