#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "oscillation_base.hpp"

/**
 * @file series_export.hpp
 * @brief Writers for simulated time series and run summaries.
 *
 * NumPy v1.0 arrays (little-endian float64, 1-D), CSV tables and a JSON
 * summary of the run diagnostics. Every writer reports failures through
 * its error string and returns false; nothing throws.
 */

namespace solarosc
{

/**
 * @brief Inputs and results of one run, as recorded in summary.json
 */
struct RunSummary
{
    uint64_t seed = 0;
    int member_id = 0;
    double mean_flux = 0.0;
    ModeParameters modes;
    SimulationDiagnostics diagnostics;
    double signal_min = 0.0;
    double signal_max = 0.0;
    double signal_rms = 0.0;
    std::vector<std::string> files;
};

/**
 * @brief Builds the NumPy v1.0 header for a 1-D little-endian float64 array.
 * @param length Number of elements.
 * @return Magic, version, header length and padded dictionary (multiple of 16 bytes).
 */
std::string npy_header_1d(std::size_t length);

/**
 * @brief Writes a 1-D float64 array in .npy format.
 */
bool write_npy_1d(const std::vector<double>& values,
                  const std::filesystem::path& path,
                  std::string& error);

/**
 * @brief Writes time, signal and flux columns as CSV with a header row.
 */
bool write_series_csv(const std::vector<double>& time,
                      const std::vector<double>& signal,
                      const std::vector<double>& flux,
                      const std::filesystem::path& path,
                      std::string& error);

/**
 * @brief Fills min, max and rms of the signal.
 */
void summarize_signal(const std::vector<double>& signal, RunSummary& summary);

/**
 * @brief Serializes a run summary to JSON.
 */
std::string run_summary_to_json(const RunSummary& summary);

/**
 * @brief Writes a run summary as JSON.
 */
bool write_run_summary_json(const RunSummary& summary,
                            const std::filesystem::path& path,
                            std::string& error);

}
