#pragma once

#include <cstdint>
#include <vector>

#include "oscillation_base.hpp"

/**
 * @file oscillation.hpp
 * @brief Public entry points of the stochastic mode simulator.
 *
 * simulate() validates inputs, derives the excitation constants, runs the
 * configured scheme and returns one signal value per output time. Time,
 * frequency and damping units are the caller's: 2*pi*freq*time must be a
 * phase in radians and eta*time dimensionless (e.g. time in Ms, freq in
 * microHz, eta in 1/Ms).
 *
 * Example:
 *   time = linspace(0, 40, 100)   // Ms
 *   freq = {23.0, 23.5}           // microHz
 *   ampl = {100.0, 110.0}         // ppm
 *   eta  = {1.e-6, 3.e-6}         // 1/Ms
 */

namespace solarosc
{

/**
 * @brief Computes a time series of stochastically excited damped modes
 * @param time Output times, non-decreasing
 * @param freq Mode frequencies
 * @param ampl Mode amplitudes (rms amplitude = ampl / sqrt(2))
 * @param eta Mode damping rates, strictly positive
 * @param rng Random source; advanced by the run
 * @param cfg Scheme and excitation settings (cfg.seed is not used by this overload)
 * @param diag Optional run metadata
 * @param observer Optional stage observer
 * @return signal[0..Ntime-1]
 * @throws ShapeError, DomainError on invalid input, std::runtime_error on an unknown scheme
 */
std::vector<double> simulate(const std::vector<double>& time,
                             const std::vector<double>& freq,
                             const std::vector<double>& ampl,
                             const std::vector<double>& eta,
                             OscillationRNG& rng,
                             const OscillationConfig& cfg = OscillationConfig(),
                             SimulationDiagnostics* diag = nullptr,
                             const ProgressObserver& observer = ProgressObserver());

/**
 * @brief Same as above with a random source seeded from cfg.seed and cfg.member_id
 */
std::vector<double> simulate(const std::vector<double>& time,
                             const ModeParameters& modes,
                             const OscillationConfig& cfg = OscillationConfig(),
                             SimulationDiagnostics* diag = nullptr,
                             const ProgressObserver& observer = ProgressObserver());

/**
 * @brief Rescales a relative signal to flux units: flux * (1 + signal)
 */
std::vector<double> to_flux(const std::vector<double>& signal, double mean_flux);

}
