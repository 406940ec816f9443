#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "oscillation_base.hpp"
#include "simulation.hpp"

/**
 * @file runtime_config.hpp
 * @brief Runtime configuration structures and parsing helpers.
 *
 * Declares the setup consumed by the headless driver and the helpers used
 * while reading YAML-like configuration inputs and command-line overrides.
 */

namespace solarosc
{

enum class ExportFormat : int
{
    csv = 0,
    npy = 1,
    both = 2
};

/**
 * @brief Output time grid: an explicit list, or an inclusive linear grid.
 */
struct TimeGridConfig
{
    bool use_values = false;
    std::vector<double> values;
    double start = 0.0;
    double stop = 40.0;
    int count = 100;
};

/**
 * @brief Everything one headless run needs.
 *
 * Defaults reproduce the reference two-mode example: time in Ms,
 * frequencies in microHz, amplitudes in ppm, damping rates in 1/Ms.
 */
struct SimulationSetup
{
    OscillationConfig oscillation;
    TimeGridConfig time;
    ModeParameters modes;

    std::string outdir = "data/exports";
    ExportFormat format = ExportFormat::both;
    double mean_flux = 1000000.0;

    SimulationSetup()
    {
        modes.freq = {23.0, 23.5};
        modes.ampl = {100.0, 110.0};
        modes.eta = {1.0e-6, 3.0e-6};
    }
};

/**
 * @brief Returns a lowercased copy of the input.
 * @param value Input string.
 * @return Lowercased string.
 */
std::string to_lower_copy(std::string value);

/**
 * @brief Removes matching single or double quotes around a value.
 */
std::string strip_wrapping_quotes(std::string value);

/**
 * @brief Parses common truthy boolean spellings.
 * @param value Input string.
 * @return Parsed boolean value.
 */
bool parse_bool_value(const std::string& value);

/**
 * @brief Parses an integer value.
 * @param value Input string.
 * @param out Parsed integer output.
 * @return True on successful parse.
 */
bool try_parse_int_value(const std::string& value, int& out);

/**
 * @brief Parses a non-negative integer value.
 * @param value Input string.
 * @param out Parsed integer output.
 * @return True on successful parse and non-negative result.
 */
bool try_parse_non_negative_int_value(const std::string& value, int& out);

/**
 * @brief Parses an unsigned 64-bit integer value.
 * @param value Input string.
 * @param out Parsed unsigned output.
 * @return True on successful parse.
 */
bool try_parse_uint64_value(const std::string& value, std::uint64_t& out);

/**
 * @brief Parses a floating-point value.
 * @param value Input string.
 * @param out Parsed double output.
 * @return True on successful parse.
 */
bool try_parse_double_value(const std::string& value, double& out);

/**
 * @brief Parses a comma-separated (or YAML-like bracketed) string list.
 */
std::vector<std::string> parse_string_list(const std::string& value);

/**
 * @brief Parses a list of finite floating-point values.
 * @param value Input such as "[23.0, 23.5]" or "23.0, 23.5".
 * @param out Parsed values; untouched on failure.
 * @return True when every item parsed.
 */
bool try_parse_double_list(const std::string& value, std::vector<double>& out);

/**
 * @brief Returns `count` evenly spaced values over [start, stop], endpoints included.
 */
std::vector<double> linspace(double start, double stop, int count);

/**
 * @brief Materializes the configured output time grid.
 */
std::vector<double> build_time_grid(const TimeGridConfig& grid);

/**
 * @brief Returns a string label for a log profile.
 * @param profile Log profile enum value.
 * @return Profile name string.
 */
const char* log_profile_name(LogProfile profile);

/**
 * @brief Parses a log profile string.
 * @param value Input profile string.
 * @param valid Optional parse-success output flag.
 * @return Parsed log profile.
 */
LogProfile parse_log_profile(const std::string& value, bool* valid = nullptr);

/**
 * @brief Returns a string label for an export format.
 */
const char* export_format_name(ExportFormat format);

/**
 * @brief Parses an export format string ("csv", "npy", "both").
 */
bool parse_export_format(const std::string& value, ExportFormat& out);

/**
 * @brief Parses a simple key-value YAML file.
 * @param filename Input file path.
 * @return Parsed key-value map with dotted section keys.
 */
std::unordered_map<std::string, std::string> parse_yaml_simple(const std::string& filename);

/**
 * @brief Applies parsed key-value pairs to a setup.
 *
 * Invalid values emit a warning and keep the previous value.
 * @param config Flattened key-value map.
 * @param setup Setup updated in place.
 */
void apply_config(const std::unordered_map<std::string, std::string>& config,
                  SimulationSetup& setup);

/**
 * @brief Loads runtime configuration from disk.
 * @param config_path Path to configuration file.
 * @param setup Setup updated in place.
 * @return False when the file could not be opened.
 */
bool load_config(const std::string& config_path, SimulationSetup& setup);

}
