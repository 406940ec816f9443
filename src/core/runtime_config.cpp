/**
 * @file runtime_config.cpp
 * @brief Core runtime implementation for the oscillation simulator.
 *
 * Provides configuration parsing and the mapping from flattened
 * YAML keys onto the simulation setup.
 * This file belongs to the primary src/core execution layer.
 */

#include "runtime_config.hpp"

#include <algorithm>
#include <cmath>
#include <cctype>
#include <fstream>
#include <iostream>
#include <limits>
#include <utility>
#include <vector>

#include "oscillation/factory.hpp"
#include "string_utils.hpp"

namespace solarosc
{

LogProfile global_log_profile = LogProfile::normal;

/**
 * @brief Returns a lowercase copy of the input string.
 */
std::string to_lower_copy(std::string value)
{
    return strutil::lower_copy(value);
}

/**
 * @brief Removes matching single or double quotes around a string value.
 */
std::string strip_wrapping_quotes(std::string value)
{
    if (value.size() >= 2)
    {
        const char first = value.front();
        const char last = value.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\''))
        {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

/**
 * @brief Parses boolean-like configuration values.
 */
bool parse_bool_value(const std::string& value)
{
    return strutil::parse_bool(value);
}

/**
 * @brief Parses an integer value.
 */
bool try_parse_int_value(const std::string& value, int& out)
{
    try
    {
        size_t consumed = 0;
        const long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size() ||
            parsed < static_cast<long long>(std::numeric_limits<int>::min()) ||
            parsed > static_cast<long long>(std::numeric_limits<int>::max()))
        {
            return false;
        }
        out = static_cast<int>(parsed);
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

/**
 * @brief Parses a non-negative integer value.
 */
bool try_parse_non_negative_int_value(const std::string& value, int& out)
{
    int parsed = 0;
    if (!try_parse_int_value(value, parsed))
    {
        return false;
    }
    if (parsed < 0)
    {
        return false;
    }
    out = parsed;
    return true;
}

/**
 * @brief Parses an unsigned 64-bit integer value.
 */
bool try_parse_uint64_value(const std::string& value, std::uint64_t& out)
{
    if (!value.empty() && value.front() == '-')
    {
        return false;
    }
    try
    {
        size_t consumed = 0;
        const unsigned long long parsed = std::stoull(value, &consumed);
        if (consumed != value.size())
        {
            return false;
        }
        out = static_cast<std::uint64_t>(parsed);
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

/**
 * @brief Parses a finite floating-point value.
 */
bool try_parse_double_value(const std::string& value, double& out)
{
    try
    {
        size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(parsed))
        {
            return false;
        }
        out = parsed;
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

/**
 * @brief Emits a standardized warning for invalid configuration values.
 */
void warn_invalid_config_value(const std::string& key,
                               const std::string& value,
                               const char* expected)
{
    std::cerr << "Warning: Invalid " << key << " '" << value
              << "'; expected " << expected
              << ". Keeping previous/default value." << std::endl;
}

/**
 * @brief Parses a comma-separated (or YAML-like bracketed) string list.
 */
std::vector<std::string> parse_string_list(const std::string& value)
{
    return strutil::split_list(value);
}

/**
 * @brief Parses a list of finite doubles.
 */
bool try_parse_double_list(const std::string& value, std::vector<double>& out)
{
    std::vector<double> parsed;
    for (const std::string& item : parse_string_list(value))
    {
        double number = 0.0;
        if (!try_parse_double_value(item, number))
        {
            return false;
        }
        parsed.push_back(number);
    }
    out = std::move(parsed);
    return true;
}

/**
 * @brief Evenly spaced samples with both endpoints, numpy.linspace style.
 */
std::vector<double> linspace(double start, double stop, int count)
{
    std::vector<double> values;
    if (count <= 0)
    {
        return values;
    }
    values.resize(static_cast<size_t>(count));
    if (count == 1)
    {
        values[0] = start;
        return values;
    }

    const double step = (stop - start) / static_cast<double>(count - 1);
    for (int i = 0; i < count; ++i)
    {
        values[static_cast<size_t>(i)] = start + static_cast<double>(i) * step;
    }
    values.back() = stop;
    return values;
}

/**
 * @brief Builds the output time grid.
 */
std::vector<double> build_time_grid(const TimeGridConfig& grid)
{
    if (grid.use_values)
    {
        return grid.values;
    }
    return linspace(grid.start, grid.stop, grid.count);
}

/**
 * @brief Returns string label for runtime logging profile.
 */
const char* log_profile_name(LogProfile profile)
{
    switch (profile)
    {
        case LogProfile::quiet:
            return "quiet";
        case LogProfile::debug:
            return "debug";
        case LogProfile::normal:
        default:
            return "normal";
    }
}

/**
 * @brief Parses runtime logging profile from text.
 */
LogProfile parse_log_profile(const std::string& value, bool* valid)
{
    const std::string normalized = to_lower_copy(value);
    if (normalized == "quiet")
    {
        if (valid) *valid = true;
        return LogProfile::quiet;
    }
    if (normalized == "normal")
    {
        if (valid) *valid = true;
        return LogProfile::normal;
    }
    if (normalized == "debug")
    {
        if (valid) *valid = true;
        return LogProfile::debug;
    }

    if (valid) *valid = false;
    return LogProfile::normal;
}

const char* export_format_name(ExportFormat format)
{
    switch (format)
    {
        case ExportFormat::csv:
            return "csv";
        case ExportFormat::npy:
            return "npy";
        case ExportFormat::both:
        default:
            return "both";
    }
}

bool parse_export_format(const std::string& value, ExportFormat& out)
{
    const std::string normalized = to_lower_copy(value);
    if (normalized == "csv")
    {
        out = ExportFormat::csv;
        return true;
    }
    if (normalized == "npy" || normalized == "numpy")
    {
        out = ExportFormat::npy;
        return true;
    }
    if (normalized == "both" || normalized == "all")
    {
        out = ExportFormat::both;
        return true;
    }
    return false;
}

/**
 * @brief Parses an indented key/value file into dotted keys.
 */
std::unordered_map<std::string, std::string> parse_yaml_simple(const std::string& filename)
{
    std::unordered_map<std::string, std::string> config;
    std::ifstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Could not open config file: " << filename << std::endl;
        return config;
    }

    std::string line;
    std::vector<std::string> section_stack;

    while (std::getline(file, line))
    {
        line = strutil::strip_comment(line);

        size_t indent = 0;
        while (indent < line.size() && line[indent] == ' ') indent++;

        size_t indent_level = indent / 2;

        line = strutil::trim_copy(line);
        if (line.empty()) continue;

        if (line.back() == ':')
        {
            std::string section_name = line.substr(0, line.size() - 1);

            while (section_stack.size() > indent_level)
            {
                section_stack.pop_back();
            }

            if (section_stack.size() == indent_level)
            {
                section_stack.push_back(section_name);
            }
            else
            {
                section_stack[indent_level] = section_name;
            }

            continue;
        }

        size_t colon_pos = line.find(':');

        if (colon_pos != std::string::npos)
        {
            while (section_stack.size() > indent_level)
            {
                section_stack.pop_back();
            }

            const std::string key = strutil::trim_copy(line.substr(0, colon_pos));
            const std::string value = strip_wrapping_quotes(strutil::trim_copy(line.substr(colon_pos + 1)));

            std::string full_key;
            for (const auto& section : section_stack)
            {
                if (!full_key.empty()) full_key += ".";
                full_key += section;
            }
            if (!full_key.empty()) full_key += ".";
            full_key += key;
            config[full_key] = value;
        }
    }

    return config;
}

/**
 * @brief Maps flattened configuration keys onto the setup.
 */
void apply_config(const std::unordered_map<std::string, std::string>& config,
                  SimulationSetup& setup)
{
    auto lookup = [&](const char* key, std::string& value) -> bool
    {
        auto it = config.find(key);
        if (it == config.end())
        {
            return false;
        }
        value = it->second;
        return true;
    };

    std::string value;

    if (lookup("logging.profile", value))
    {
        bool valid = false;
        const LogProfile parsed = parse_log_profile(value, &valid);
        if (valid)
        {
            global_log_profile = parsed;
        }
        else
        {
            warn_invalid_config_value("logging.profile", value, "quiet, normal, or debug");
        }
    }

    if (lookup("simulation.scheme", value))
    {
        const std::string normalized = normalize_scheme_name(value);
        const auto available = get_available_oscillation_schemes();
        if (std::find(available.begin(), available.end(), normalized) != available.end())
        {
            setup.oscillation.scheme_id = normalized;
        }
        else
        {
            warn_invalid_config_value("simulation.scheme", value, "serial or parallel");
        }
    }

    if (lookup("simulation.seed", value))
    {
        std::uint64_t parsed = 0;
        if (try_parse_uint64_value(value, parsed))
        {
            setup.oscillation.seed = parsed;
        }
        else
        {
            warn_invalid_config_value("simulation.seed", value, "an unsigned 64-bit integer");
        }
    }

    if (lookup("simulation.member_id", value))
    {
        int parsed = 0;
        if (try_parse_non_negative_int_value(value, parsed))
        {
            setup.oscillation.member_id = parsed;
        }
        else
        {
            warn_invalid_config_value("simulation.member_id", value, "a non-negative integer");
        }
    }

    if (lookup("simulation.kicks_per_damping_time", value))
    {
        double parsed = 0.0;
        if (try_parse_double_value(value, parsed) && parsed > 0.0)
        {
            setup.oscillation.kicks_per_damping_time = parsed;
        }
        else
        {
            warn_invalid_config_value("simulation.kicks_per_damping_time", value, "a positive number");
        }
    }

    if (lookup("simulation.max_warmup_kicks", value))
    {
        int parsed = 0;
        if (try_parse_non_negative_int_value(value, parsed))
        {
            setup.oscillation.max_warmup_kicks = parsed;
        }
        else
        {
            warn_invalid_config_value("simulation.max_warmup_kicks", value, "a non-negative integer");
        }
    }

    if (lookup("simulation.warmup", value))
    {
        setup.oscillation.warmup_enabled = parse_bool_value(value);
    }

    if (lookup("simulation.threads", value))
    {
        int parsed = 0;
        if (try_parse_non_negative_int_value(value, parsed))
        {
            setup.oscillation.num_threads = parsed;
        }
        else
        {
            warn_invalid_config_value("simulation.threads", value, "a non-negative integer");
        }
    }

    if (lookup("time.values", value))
    {
        std::vector<double> parsed;
        if (try_parse_double_list(value, parsed))
        {
            setup.time.values = parsed;
            setup.time.use_values = true;
        }
        else
        {
            warn_invalid_config_value("time.values", value, "a list of numbers");
        }
    }

    if (lookup("time.start", value))
    {
        if (!try_parse_double_value(value, setup.time.start))
        {
            warn_invalid_config_value("time.start", value, "a number");
        }
    }

    if (lookup("time.stop", value))
    {
        if (!try_parse_double_value(value, setup.time.stop))
        {
            warn_invalid_config_value("time.stop", value, "a number");
        }
    }

    if (lookup("time.count", value))
    {
        if (!try_parse_non_negative_int_value(value, setup.time.count))
        {
            warn_invalid_config_value("time.count", value, "a non-negative integer");
        }
    }

    const std::pair<const char*, std::vector<double>*> mode_lists[] =
    {
        {"modes.freq", &setup.modes.freq},
        {"modes.ampl", &setup.modes.ampl},
        {"modes.eta", &setup.modes.eta},
    };
    for (const auto& binding : mode_lists)
    {
        if (lookup(binding.first, value))
        {
            if (!try_parse_double_list(value, *binding.second))
            {
                warn_invalid_config_value(binding.first, value, "a list of numbers");
            }
        }
    }

    if (lookup("output.outdir", value))
    {
        setup.outdir = value;
    }

    if (lookup("output.format", value))
    {
        if (!parse_export_format(value, setup.format))
        {
            warn_invalid_config_value("output.format", value, "csv, npy, or both");
        }
    }

    if (lookup("output.flux", value))
    {
        if (!try_parse_double_value(value, setup.mean_flux))
        {
            warn_invalid_config_value("output.flux", value, "a number");
        }
    }
}

/**
 * @brief Loads the configuration from a YAML file.
 */
bool load_config(const std::string& config_path, SimulationSetup& setup)
{
    if (config_path.empty())
    {
        return true;
    }

    {
        std::ifstream probe(config_path);
        if (!probe.is_open())
        {
            std::cerr << "Could not open config file: " << config_path << std::endl;
            return false;
        }
    }

    const auto config = parse_yaml_simple(config_path);
    apply_config(config, setup);

    if (log_normal_enabled())
    {
        std::cout << "Loaded config with " << config.size() << " keys" << std::endl;
    }
    return true;
}

}
