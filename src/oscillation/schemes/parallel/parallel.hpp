#pragma once
#include "oscillation_base.hpp"

namespace solarosc {

/**
 * @brief Per-mode stream excitation scheme
 *
 * Every mode draws from its own stream spawned from (seed, member_id, mode
 * index), so a mode's sample path does not depend on the other modes or on
 * thread scheduling. Modes are evolved concurrently with OpenMP; the
 * cross-mode sum is reproducible only up to floating-point summation order
 * when the thread count changes.
 */
class ParallelScheme : public OscillationScheme {
public:
    std::string name() const override { return "parallel"; }

    void initialize(const OscillationConfig& cfg) override;

    std::vector<double> run(
        const std::vector<double>& time,
        const ModeParameters& modes,
        const ExcitationConstants& constants,
        OscillationRNG& rng,
        SimulationDiagnostics* diag = nullptr,
        const ProgressObserver& observer = ProgressObserver()
    ) override;

private:
    int num_threads_ = 0;
};

} // namespace solarosc
