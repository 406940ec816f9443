#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @file oscillation_base.hpp
 * @brief Base definitions for stochastically excited, damped oscillation modes
 *
 * Each mode carries two quadrature amplitudes that are damped exponentially
 * and re-excited ("kicked") by Gaussian increments at a fixed internal
 * cadence. The observable signal at an output time is the superposition of
 * every mode's damped quadrature pair projected on sin/cos of its phase.
 *
 * See De Ridder et al., 2006, MNRAS 365, pp. 595-605.
 *
 * Notes: for a peak FWHM linewidth Delta and damping rate eta in the same
 * frequency unit, Delta = eta / pi.
 */

namespace solarosc
{

class OscillationRNG;

//==============================================================================
// Errors
//==============================================================================

/**
 * @brief Input value outside the domain of the recurrence
 *
 * Raised for non-positive damping rates, negative amplitudes, non-finite
 * inputs and decreasing output times.
 */
class DomainError : public std::domain_error
{
public:
    using std::domain_error::domain_error;
};

/**
 * @brief Mode parameter arrays of mismatched length
 */
class ShapeError : public std::length_error
{
public:
    using std::length_error::length_error;
};

//==============================================================================
// Configuration structures
//==============================================================================

/**
 * @brief Configuration for the stochastic mode simulator
 */
struct OscillationConfig
{
    // Scheme selection
    std::string scheme_id = "serial";   // "serial", "parallel"

    // Reproducibility
    uint64_t seed = 42;                 // Base random seed
    int member_id = 0;                  // Ensemble member ID (for stream separation)

    // Kick cadence: kicktimestep = 1 / (kicks_per_damping_time * max(eta))
    double kicks_per_damping_time = 100.0;

    // Warm-up spans one longest damping time, capped for near-undamped modes
    int max_warmup_kicks = 20000;
    bool warmup_enabled = true;

    // Worker threads for the parallel scheme (0 = OpenMP runtime default)
    int num_threads = 0;
};

/**
 * @brief Mode parameters, one entry per mode in every array
 */
struct ModeParameters
{
    std::vector<double> freq;  // cycles per unit time
    std::vector<double> ampl;  // characteristic amplitude, rms = ampl / sqrt(2)
    std::vector<double> eta;   // damping rate, inverse time

    std::size_t size() const { return freq.size(); }
    bool empty() const { return freq.empty(); }
};

/**
 * @brief Evolving state of one mode
 *
 * The quadrature pair is valid at last_kick_time; between kicks it decays
 * as exp(-eta * (t - last_kick_time)). next_kick_time == last_kick_time +
 * kicktimestep whenever the state is observed outside a kick step.
 */
struct ModeState
{
    double ampl_sin = 0.0;
    double ampl_cos = 0.0;
    double last_kick_time = 0.0;
    double next_kick_time = 0.0;
};

/**
 * @brief Constants derived once per run from the mode parameters
 */
struct ExcitationConstants
{
    double kick_timestep = 0.0;           // shared by all modes
    std::vector<double> kick_amplitude;   // stdev of the per-kick increment
    std::vector<double> kick_damping;     // exp(-eta * kick_timestep)
    int warmup_kicks = 0;
};

//==============================================================================
// Diagnostics and progress reporting
//==============================================================================

enum class ProgressStage : int
{
    setup = 0,
    kick_timestep = 1,
    warm_up = 2,
    evolution = 3,
    complete = 4
};

/**
 * @brief Optional observer for stage transitions; the core never prints.
 */
using ProgressObserver = std::function<void(ProgressStage stage, const std::string& detail)>;

/**
 * @brief Auxiliary metadata describing one simulation run
 */
struct SimulationDiagnostics
{
    std::string scheme;
    std::size_t mode_count = 0;
    std::size_t output_count = 0;
    double kick_timestep = 0.0;
    int warmup_kicks = 0;
    uint64_t evolution_kicks = 0;   // kicks applied during the main pass
    int threads_used = 1;

    // Timing
    double time_warm_up = 0.0;      // seconds
    double time_evolution = 0.0;    // seconds
};

/**
 * @brief Returns a stable label for a progress stage.
 */
const char* progress_stage_name(ProgressStage stage);

//==============================================================================
// Base class for excitation schemes
//==============================================================================

/**
 * @brief Base class for all mode excitation schemes
 *
 * A scheme owns the order in which random draws are consumed and how
 * modes are scheduled; the recurrence itself is shared.
 */
class OscillationScheme
{
public:
    virtual ~OscillationScheme() = default;

    /**
     * @brief Get scheme name/identifier
     */
    virtual std::string name() const = 0;

    /**
     * @brief Initialize the scheme with configuration
     * @param cfg Simulator configuration
     */
    virtual void initialize(const OscillationConfig& cfg) = 0;

    /**
     * @brief Evolve all modes through the output grid and accumulate the signal
     * @param time Validated, non-decreasing output times (non-empty)
     * @param modes Validated mode parameters (non-empty)
     * @param constants Derived kick timestep, kick amplitudes and warm-up length
     * @param rng Random source consumed by the run
     * @param diag Optional diagnostics output
     * @param observer Optional stage observer
     * @return Signal, one value per output time
     */
    virtual std::vector<double> run(
        const std::vector<double>& time,
        const ModeParameters& modes,
        const ExcitationConstants& constants,
        OscillationRNG& rng,
        SimulationDiagnostics* diag = nullptr,
        const ProgressObserver& observer = ProgressObserver()
    ) = 0;
};

//==============================================================================
// Factory function declaration
//==============================================================================

/**
 * @brief Create an excitation scheme instance
 * @param scheme_name Name of the scheme ("serial", "parallel", or an alias)
 * @return Unique pointer to the scheme
 */
std::unique_ptr<OscillationScheme> create_oscillation_scheme(const std::string& scheme_name);

} // namespace solarosc
