/**
 * @file oscillation.cpp
 * @brief Implementation for the oscillation module.
 *
 * Entry point of the stochastic mode simulator: validation,
 * parameter derivation and scheme dispatch.
 * This file is part of the src/oscillation subsystem.
 */

#include "oscillation.hpp"
#include "factory.hpp"
#include "base/mode_state.hpp"
#include "base/random_generator.hpp"

#include <cstdio>
#include <string>

namespace solarosc
{

std::vector<double> simulate(const std::vector<double>& time,
                             const std::vector<double>& freq,
                             const std::vector<double>& ampl,
                             const std::vector<double>& eta,
                             OscillationRNG& rng,
                             const OscillationConfig& cfg,
                             SimulationDiagnostics* diag,
                             const ProgressObserver& observer)
{
    ModeParameters modes;
    modes.freq = freq;
    modes.ampl = ampl;
    modes.eta = eta;

    validate_inputs(time, modes);
    const ExcitationConstants constants = derive_excitation_constants(modes, cfg);
    std::unique_ptr<OscillationScheme> scheme = create_oscillation_scheme(cfg.scheme_id);

    if (diag)
    {
        *diag = SimulationDiagnostics();
        diag->scheme = scheme->name();
        diag->mode_count = modes.size();
        diag->output_count = time.size();
        diag->kick_timestep = constants.kick_timestep;
        diag->warmup_kicks = constants.warmup_kicks;
    }

    notify_progress(observer, ProgressStage::setup,
                    "Simulating " + std::to_string(modes.size()) + " modes");

    // Nothing to evolve: the superposition of zero modes is identically zero.
    if (modes.empty() || time.empty())
    {
        notify_progress(observer, ProgressStage::complete, "Returning the resulting signal");
        return std::vector<double>(time.size(), 0.0);
    }

    check_time_resolution(time, constants.kick_timestep);

    char kick_message[64];
    std::snprintf(kick_message, sizeof(kick_message), "Oscillation kicktimestep: %f",
                  constants.kick_timestep);
    notify_progress(observer, ProgressStage::kick_timestep, kick_message);

    scheme->initialize(cfg);
    std::vector<double> signal = scheme->run(time, modes, constants, rng, diag, observer);

    notify_progress(observer, ProgressStage::complete, "Returning the resulting signal");
    return signal;
}

std::vector<double> simulate(const std::vector<double>& time,
                             const ModeParameters& modes,
                             const OscillationConfig& cfg,
                             SimulationDiagnostics* diag,
                             const ProgressObserver& observer)
{
    OscillationRNG rng(cfg.seed, cfg.member_id);
    return simulate(time, modes.freq, modes.ampl, modes.eta, rng, cfg, diag, observer);
}

std::vector<double> to_flux(const std::vector<double>& signal, double mean_flux)
{
    std::vector<double> flux(signal.size());
    for (std::size_t j = 0; j < signal.size(); ++j)
    {
        flux[j] = mean_flux * (1.0 + signal[j]);
    }
    return flux;
}

}
