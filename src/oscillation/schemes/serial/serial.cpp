/**
 * @file serial.cpp
 * @brief Implementation for the oscillation module.
 *
 * Evolves all modes on one shared random stream.
 * This file is part of the src/oscillation subsystem.
 */

#include "serial.hpp"
#include "oscillation/base/mode_state.hpp"
#include <chrono>
#include <string>

namespace solarosc {

void SerialScheme::initialize(const OscillationConfig& cfg) {
    (void)cfg;
}

/**
 * @brief Warms up, staggers and evolves every mode through the output grid.
 */
std::vector<double> SerialScheme::run(
    const std::vector<double>& time,
    const ModeParameters& modes,
    const ExcitationConstants& constants,
    OscillationRNG& rng,
    SimulationDiagnostics* diag,
    const ProgressObserver& observer
) {
    const std::size_t n_modes = modes.size();
    const std::size_t n_time = time.size();
    std::vector<ModeState> states(n_modes);

    notify_progress(observer, ProgressStage::warm_up,
                    std::to_string(constants.warmup_kicks) + " kicks for warm up for oscillation signal");

    auto t0 = std::chrono::high_resolution_clock::now();
    for (int k = 0; k < constants.warmup_kicks; ++k)
    {
        for (std::size_t i = 0; i < n_modes; ++i)
        {
            states[i].ampl_sin = constants.kick_damping[i] * states[i].ampl_sin +
                                 constants.kick_amplitude[i] * rng.normal();
        }
        for (std::size_t i = 0; i < n_modes; ++i)
        {
            states[i].ampl_cos = constants.kick_damping[i] * states[i].ampl_cos +
                                 constants.kick_amplitude[i] * rng.normal();
        }
    }

    // Stagger the kick clocks so modes are not kicked in lockstep.
    for (std::size_t i = 0; i < n_modes; ++i)
    {
        initialize_kick_phase(states[i], time.front(), constants.kick_timestep, rng);
    }
    auto t1 = std::chrono::high_resolution_clock::now();

    notify_progress(observer, ProgressStage::evolution, "Simulating stochastic oscillations");

    std::vector<double> signal(n_time, 0.0);
    uint64_t kicks = 0;
    for (std::size_t j = 0; j < n_time; ++j)
    {
        for (std::size_t i = 0; i < n_modes; ++i)
        {
            states[i] = advance_to(states[i], modes.eta[i], constants.kick_amplitude[i],
                                   constants.kick_timestep, time[j], rng, &kicks);
            signal[j] += sample_contribution(states[i], modes.freq[i], modes.eta[i], time[j]);
        }
    }
    auto t2 = std::chrono::high_resolution_clock::now();

    if (diag)
    {
        diag->evolution_kicks += kicks;
        diag->threads_used = 1;
        diag->time_warm_up += std::chrono::duration<double>(t1 - t0).count();
        diag->time_evolution += std::chrono::duration<double>(t2 - t1).count();
    }
    return signal;
}

}
