/**
 * @file mode_state.cpp
 * @brief Implementation for the oscillation module.
 *
 * Provides the per-mode kick/damp recurrence shared by every
 * excitation scheme. This file is part of the src/oscillation subsystem.
 */

#include "mode_state.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <string>

namespace {

std::string indexed_value(const char* name, std::size_t index, double value)
{
    std::ostringstream oss;
    oss << name << "[" << index << "] = " << value;
    return oss.str();
}

}

namespace solarosc
{

const char* progress_stage_name(ProgressStage stage)
{
    switch (stage)
    {
        case ProgressStage::setup:
            return "setup";
        case ProgressStage::kick_timestep:
            return "kick_timestep";
        case ProgressStage::warm_up:
            return "warm_up";
        case ProgressStage::evolution:
            return "evolution";
        case ProgressStage::complete:
        default:
            return "complete";
    }
}

void notify_progress(const ProgressObserver& observer, ProgressStage stage, const std::string& detail)
{
    if (observer)
    {
        observer(stage, detail);
    }
}

/**
 * @brief Validates array shapes and value domains.
 */
void validate_inputs(const std::vector<double>& time, const ModeParameters& modes)
{
    const std::size_t n_modes = modes.freq.size();
    if (modes.ampl.size() != n_modes || modes.eta.size() != n_modes)
    {
        std::ostringstream oss;
        oss << "Mode arrays must have equal length: freq=" << modes.freq.size()
            << " ampl=" << modes.ampl.size()
            << " eta=" << modes.eta.size();
        throw ShapeError(oss.str());
    }

    for (std::size_t i = 0; i < n_modes; ++i)
    {
        const double eta = modes.eta[i];
        if (!std::isfinite(eta) || eta <= 0.0)
        {
            throw DomainError(indexed_value("eta", i, eta) +
                              ": damping rates must be strictly positive and finite");
        }
        const double ampl = modes.ampl[i];
        if (!std::isfinite(ampl) || ampl < 0.0)
        {
            throw DomainError(indexed_value("ampl", i, ampl) +
                              ": amplitudes must be non-negative and finite");
        }
        if (!std::isfinite(modes.freq[i]))
        {
            throw DomainError(indexed_value("freq", i, modes.freq[i]) +
                              ": frequencies must be finite");
        }
    }

    for (std::size_t j = 0; j < time.size(); ++j)
    {
        if (!std::isfinite(time[j]))
        {
            throw DomainError(indexed_value("time", j, time[j]) + ": output times must be finite");
        }
        if (j > 0 && time[j] < time[j - 1])
        {
            throw DomainError(indexed_value("time", j, time[j]) +
                              " precedes the previous output time; output times must be non-decreasing");
        }
    }
}

/**
 * @brief Derives the per-run excitation constants.
 */
ExcitationConstants derive_excitation_constants(const ModeParameters& modes,
                                                const OscillationConfig& cfg)
{
    if (!std::isfinite(cfg.kicks_per_damping_time) || cfg.kicks_per_damping_time <= 0.0)
    {
        throw DomainError("kicks_per_damping_time must be strictly positive and finite");
    }
    if (cfg.max_warmup_kicks < 0)
    {
        throw DomainError("max_warmup_kicks must be non-negative");
    }

    ExcitationConstants constants;
    if (modes.empty())
    {
        return constants;
    }

    const double max_eta = *std::max_element(modes.eta.begin(), modes.eta.end());
    const double min_eta = *std::min_element(modes.eta.begin(), modes.eta.end());

    // Kick once per 1/kicks_per_damping_time of the shortest damping time.
    constants.kick_timestep = (1.0 / max_eta) / cfg.kicks_per_damping_time;
    if (!std::isfinite(constants.kick_timestep) || constants.kick_timestep <= 0.0)
    {
        std::ostringstream oss;
        oss << "kick timestep (1 / max(eta)) / kicks_per_damping_time = " << constants.kick_timestep
            << " is not a positive finite number (max(eta) = " << max_eta << ")";
        throw DomainError(oss.str());
    }

    const std::size_t n_modes = modes.size();
    constants.kick_amplitude.resize(n_modes);
    constants.kick_damping.resize(n_modes);
    for (std::size_t i = 0; i < n_modes; ++i)
    {
        constants.kick_amplitude[i] = modes.ampl[i] * std::sqrt(constants.kick_timestep * modes.eta[i]);
        constants.kick_damping[i] = std::exp(-modes.eta[i] * constants.kick_timestep);
        if (!std::isfinite(constants.kick_amplitude[i]))
        {
            throw DomainError(indexed_value("ampl", i, modes.ampl[i]) +
                              ": kick amplitude overflows for this damping rate");
        }
    }

    if (cfg.warmup_enabled)
    {
        const double longest = std::floor(1.0 / min_eta / constants.kick_timestep);
        if (std::isnan(longest))
        {
            throw DomainError("warm-up length is undefined for min(eta) = " + std::to_string(min_eta));
        }
        const double cap = static_cast<double>(cfg.max_warmup_kicks);
        constants.warmup_kicks = (longest >= cap) ? cfg.max_warmup_kicks : static_cast<int>(longest);
    }

    return constants;
}

/**
 * @brief Guards against kick clocks that cannot advance.
 */
void check_time_resolution(const std::vector<double>& time, double kick_timestep)
{
    if (time.empty())
    {
        return;
    }
    const double first = time.front();
    const double last = time.back();
    if (!(first - kick_timestep < first) || !(last + kick_timestep > last))
    {
        std::ostringstream oss;
        oss << "kick timestep " << kick_timestep
            << " is below the floating-point resolution of the output times ["
            << first << ", " << last << "]";
        throw DomainError(oss.str());
    }
}

/**
 * @brief Runs warm-up kicks on one mode.
 */
void warm_up_mode(ModeState& state, double damp, double kick_amplitude, int kicks,
                  OscillationRNG& rng)
{
    for (int k = 0; k < kicks; ++k)
    {
        state.ampl_sin = damp * state.ampl_sin + kick_amplitude * rng.normal();
        state.ampl_cos = damp * state.ampl_cos + kick_amplitude * rng.normal();
    }
}

/**
 * @brief Randomizes the kick phase of one mode.
 */
void initialize_kick_phase(ModeState& state, double first_time, double kick_timestep,
                           OscillationRNG& rng)
{
    state.last_kick_time = rng.uniform(first_time - kick_timestep, first_time);
    state.next_kick_time = state.last_kick_time + kick_timestep;
}

/**
 * @brief Lets the oscillator evolve until right before target_time.
 */
ModeState advance_to(ModeState state, double eta, double kick_amplitude, double kick_timestep,
                     double target_time, OscillationRNG& rng, uint64_t* kicks_applied)
{
    while (state.next_kick_time <= target_time)
    {
        const double deltatime = state.next_kick_time - state.last_kick_time;
        const double damp = std::exp(-eta * deltatime);
        state.ampl_sin = damp * state.ampl_sin + kick_amplitude * rng.normal();
        state.ampl_cos = damp * state.ampl_cos + kick_amplitude * rng.normal();
        state.last_kick_time = state.next_kick_time;
        state.next_kick_time = state.last_kick_time + kick_timestep;
        if (kicks_applied)
        {
            ++(*kicks_applied);
        }
    }
    return state;
}

/**
 * @brief Makes the last small step until time and projects on the phase.
 */
double sample_contribution(const ModeState& state, double freq, double eta, double time)
{
    const double deltatime = time - state.last_kick_time;
    const double damp = std::exp(-eta * deltatime);
    const double phase = 2.0 * M_PI * freq * time;
    return damp * (state.ampl_sin * std::sin(phase) + state.ampl_cos * std::cos(phase));
}

/**
 * @brief Checks the monotonic clock invariant.
 */
bool clock_invariant_holds(const ModeState& state, double time, double kick_timestep)
{
    if (!(state.last_kick_time <= time && time < state.next_kick_time))
    {
        return false;
    }
    const double scale = std::max({std::abs(state.last_kick_time),
                                   std::abs(state.next_kick_time),
                                   kick_timestep});
    const double tol = 4.0 * std::numeric_limits<double>::epsilon() * scale;
    return std::abs((state.next_kick_time - state.last_kick_time) - kick_timestep) <= tol;
}

}
