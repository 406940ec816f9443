#pragma once

/**
 * @file mode_state.hpp
 * @brief Declarations for the oscillation module.
 *
 * Per-mode recurrence of the stochastic excitation model: input
 * validation, derived constants, warm-up, kick-phase initialization,
 * the advance_to step function and the damp-to-sample read.
 * This file is part of the src/oscillation subsystem.
 */

#include <cstdint>
#include <string>
#include <vector>
#include "oscillation_base.hpp"
#include "random_generator.hpp"

namespace solarosc
{

/**
 * @brief Forwards a stage message to the observer when one is installed.
 */
void notify_progress(const ProgressObserver& observer, ProgressStage stage, const std::string& detail);

/**
 * @brief Rejects inconsistent or out-of-domain simulator inputs
 * @param time Output times
 * @param modes Mode parameters
 * @throws ShapeError if freq, ampl and eta differ in length
 * @throws DomainError for eta <= 0, ampl < 0, non-finite values or decreasing times
 */
void validate_inputs(const std::vector<double>& time, const ModeParameters& modes);

/**
 * @brief Derives the kick timestep, kick amplitudes, per-kick damping and warm-up length
 * @param modes Validated, non-empty mode parameters
 * @param cfg Simulator configuration
 * @throws DomainError for a non-positive kick density or negative warm-up cap
 */
ExcitationConstants derive_excitation_constants(const ModeParameters& modes,
                                                const OscillationConfig& cfg);

/**
 * @brief Rejects output grids whose magnitude swallows the kick timestep
 *
 * When t + kicktimestep rounds back to t the kick clock cannot advance.
 */
void check_time_resolution(const std::vector<double>& time, double kick_timestep);

/**
 * @brief Applies `kicks` damped Gaussian kicks to one mode without moving its clock
 * @param state Mode state (modified in-place)
 * @param damp Per-kick damping factor exp(-eta * kicktimestep)
 * @param kick_amplitude Standard deviation of each increment
 * @param kicks Number of kicks
 * @param rng Random source; draws sine then cosine per kick
 */
void warm_up_mode(ModeState& state, double damp, double kick_amplitude, int kicks,
                  OscillationRNG& rng);

/**
 * @brief Places the mode's last kick uniformly in [first_time - kicktimestep, first_time)
 */
void initialize_kick_phase(ModeState& state, double first_time, double kick_timestep,
                           OscillationRNG& rng);

/**
 * @brief Applies every pending kick with next_kick_time <= target_time
 * @param state Mode state before the step
 * @param eta Damping rate of the mode
 * @param kick_amplitude Standard deviation of each increment
 * @param kick_timestep Shared kick cadence
 * @param target_time Output time to advance to
 * @param rng Random source; draws sine then cosine per kick
 * @param kicks_applied Optional counter incremented per kick
 * @return State with last_kick_time <= target_time < next_kick_time
 */
ModeState advance_to(ModeState state, double eta, double kick_amplitude, double kick_timestep,
                     double target_time, OscillationRNG& rng, uint64_t* kicks_applied = nullptr);

/**
 * @brief Damps the quadrature pair from the last kick to `time` and projects it on the phase
 *
 * Leaves the clock untouched.
 */
double sample_contribution(const ModeState& state, double freq, double eta, double time);

/**
 * @brief Checks last_kick_time <= time < next_kick_time and the kicktimestep spacing
 */
bool clock_invariant_holds(const ModeState& state, double time, double kick_timestep);

}
