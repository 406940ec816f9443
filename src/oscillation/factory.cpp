/**
 * @file factory.cpp
 * @brief Implementation for the oscillation module.
 *
 * Resolves configured scheme names to scheme instances.
 * This file is part of the src/oscillation subsystem.
 */

#include "factory.hpp"
#include "string_utils.hpp"
#include <stdexcept>

namespace solarosc
{

std::string normalize_scheme_name(std::string scheme_name)
{
    scheme_name = strutil::lower_copy(strutil::trim_copy(scheme_name));

    if (scheme_name == "sequential" ||
        scheme_name == "reference")
    {
        return "serial";
    }
    if (scheme_name == "openmp" ||
        scheme_name == "per_mode" ||
        scheme_name == "per_mode_streams")
    {
        return "parallel";
    }
    return scheme_name;
}

std::unique_ptr<OscillationScheme> create_oscillation_scheme(const std::string& scheme_name)
{
    const std::string normalized_name = normalize_scheme_name(scheme_name);

    if (normalized_name == "serial")
    {
        return std::make_unique<SerialScheme>();
    }

    else if (normalized_name == "parallel")
    {
        return std::make_unique<ParallelScheme>();
    }

    else
    {
        throw std::runtime_error("Unknown oscillation scheme: " + scheme_name +
                                 " (normalized: " + normalized_name + ")");
    }
}

/**
 * @brief Gets the available excitation schemes.
 */
std::vector<std::string> get_available_oscillation_schemes()
{
    return {"serial", "parallel"};
}

}
