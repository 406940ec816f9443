#pragma once
#include "oscillation_base.hpp"

namespace solarosc {

/**
 * @brief Single-stream excitation scheme
 *
 * Consumes one shared random stream in a fixed order: per warm-up kick all
 * sine increments then all cosine increments, one uniform draw per mode for
 * the kick phase, then per output time and mode a sine/cosine pair per kick.
 * Bit reproducible for a given seed.
 */
class SerialScheme : public OscillationScheme {
public:
    std::string name() const override { return "serial"; }

    void initialize(const OscillationConfig& cfg) override;

    std::vector<double> run(
        const std::vector<double>& time,
        const ModeParameters& modes,
        const ExcitationConstants& constants,
        OscillationRNG& rng,
        SimulationDiagnostics* diag = nullptr,
        const ProgressObserver& observer = ProgressObserver()
    ) override;
};

} // namespace solarosc
