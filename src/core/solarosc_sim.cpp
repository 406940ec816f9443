/**
 * @file solarosc_sim.cpp
 * @brief Command-line entry point for the oscillation simulator.
 *
 * Resolves logging profile, configuration file and command-line
 * overrides, then hands off to the headless runner.
 * This file belongs to the primary src/core execution layer.
 */

#include <cstdlib>
#include <iostream>
#include <string>

#include "headless_runtime.hpp"
#include "oscillation/factory.hpp"
#include "runtime_config.hpp"
#include "simulation.hpp"

namespace
{

void print_usage(const char* program)
{
    std::cout << "Usage: " << program << " [options]\n"
              << "  --config <path>        YAML-like configuration file\n"
              << "  --outdir <dir>         output directory (default data/exports)\n"
              << "  --seed <n>             base random seed\n"
              << "  --member <n>           ensemble member id\n"
              << "  --scheme <name>        serial or parallel\n"
              << "  --threads <n>          worker threads for the parallel scheme\n"
              << "  --format <fmt>         csv, npy, or both\n"
              << "  --log-profile <level>  quiet, normal, or debug\n"
              << "  --no-summary           skip summary.json\n"
              << "Options also accept the --name=value form." << std::endl;
}

/**
 * @brief Splits "--name=value" or "--name value" into a value.
 */
bool take_value(const std::string& arg, const std::string& name, int& i, int argc, char** argv,
                std::string& value)
{
    const std::string prefix = name + "=";
    if (arg.rfind(prefix, 0) == 0)
    {
        value = arg.substr(prefix.size());
        return true;
    }
    if (arg == name && i + 1 < argc)
    {
        value = argv[++i];
        return true;
    }
    return false;
}

}

/**
 * @brief Program entry point.
 * @param argc CLI argument count.
 * @param argv CLI argument vector.
 * @return Zero on success, non-zero on configuration/runtime failure.
 */
int main(int argc, char** argv)
{
    using namespace solarosc;

    if (const char* env_log_profile = std::getenv("SOLAROSC_LOG_PROFILE"))
    {
        bool valid = false;
        const LogProfile parsed = parse_log_profile(env_log_profile, &valid);
        if (valid)
        {
            global_log_profile = parsed;
        }
        else
        {
            std::cerr << "Warning: Invalid SOLAROSC_LOG_PROFILE '" << env_log_profile
                      << "'. Valid values: quiet, normal, debug." << std::endl;
        }
    }

    // Config file first, so command-line flags can override it.
    std::string config_path;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return 0;
        }
        std::string value;
        if (take_value(arg, "--config", i, argc, argv, value))
        {
            config_path = value;
        }
    }

    HeadlessRunOptions options;
    if (!load_config(config_path, options.setup))
    {
        return 1;
    }

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        std::string value;
        if (take_value(arg, "--config", i, argc, argv, value))
        {
            continue;
        }
        else if (take_value(arg, "--outdir", i, argc, argv, value))
        {
            options.setup.outdir = value;
        }
        else if (take_value(arg, "--seed", i, argc, argv, value))
        {
            if (!try_parse_uint64_value(value, options.setup.oscillation.seed))
            {
                std::cerr << "Invalid --seed value '" << value
                          << "'. Expected an unsigned integer." << std::endl;
                return 1;
            }
        }
        else if (take_value(arg, "--member", i, argc, argv, value))
        {
            if (!try_parse_non_negative_int_value(value, options.setup.oscillation.member_id))
            {
                std::cerr << "Invalid --member value '" << value
                          << "'. Expected a non-negative integer." << std::endl;
                return 1;
            }
        }
        else if (take_value(arg, "--scheme", i, argc, argv, value))
        {
            options.setup.oscillation.scheme_id = normalize_scheme_name(value);
        }
        else if (take_value(arg, "--threads", i, argc, argv, value))
        {
            if (!try_parse_non_negative_int_value(value, options.setup.oscillation.num_threads))
            {
                std::cerr << "Invalid --threads value '" << value
                          << "'. Expected a non-negative integer." << std::endl;
                return 1;
            }
        }
        else if (take_value(arg, "--format", i, argc, argv, value))
        {
            if (!parse_export_format(value, options.setup.format))
            {
                std::cerr << "Invalid --format value '" << value
                          << "'. Use csv, npy, or both." << std::endl;
                return 1;
            }
        }
        else if (take_value(arg, "--log-profile", i, argc, argv, value))
        {
            bool valid = false;
            const LogProfile parsed = parse_log_profile(value, &valid);
            if (!valid)
            {
                std::cerr << "Invalid --log-profile value. Use quiet, normal, or debug." << std::endl;
                return 1;
            }
            global_log_profile = parsed;
        }
        else if (arg == "--no-summary")
        {
            options.write_summary = false;
        }
        else
        {
            std::cerr << "Unknown argument '" << arg << "'." << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (log_debug_enabled())
    {
        std::cout << "Log profile: " << log_profile_name(global_log_profile)
                  << ", scheme: " << options.setup.oscillation.scheme_id
                  << ", seed: " << options.setup.oscillation.seed
                  << ", format: " << export_format_name(options.setup.format) << std::endl;
    }

    return run_headless_simulation(options);
}
