#pragma once

/**
 * @file factory.hpp
 * @brief Declarations for the oscillation module.
 *
 * Scheme registration and lookup by configured name.
 * This file is part of the src/oscillation subsystem.
 */

#include "oscillation_base.hpp"
#include <vector>
#include <string>
#include <memory>

#include "schemes/serial/serial.hpp"
#include "schemes/parallel/parallel.hpp"

namespace solarosc
{

/**
 * @brief Maps aliases onto canonical scheme names.
 */
std::string normalize_scheme_name(std::string scheme_name);

/**
 * @brief Returns names of available excitation schemes.
 */
std::vector<std::string> get_available_oscillation_schemes();

}
