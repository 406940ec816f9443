#include "oscillation/base/mode_state.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

namespace
{

bool nearly_equal(double a, double b, double tol = 1.0e-12)
{
    return std::abs(a - b) <= tol;
}

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[mode-state-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

int expect_close(double actual, double expected, const std::string& label, double tol = 1.0e-12)
{
    if (!nearly_equal(actual, expected, tol))
    {
        std::cerr << "[mode-state-regression] FAIL: " << label
                  << " actual=" << actual
                  << " expected=" << expected
                  << " tol=" << tol << std::endl;
        return 1;
    }
    return 0;
}

solarosc::ModeParameters make_modes(std::vector<double> freq,
                                    std::vector<double> ampl,
                                    std::vector<double> eta)
{
    solarosc::ModeParameters modes;
    modes.freq = std::move(freq);
    modes.ampl = std::move(ampl);
    modes.eta = std::move(eta);
    return modes;
}

template <typename Error>
bool throws(const std::vector<double>& time, const solarosc::ModeParameters& modes)
{
    try
    {
        solarosc::validate_inputs(time, modes);
    }
    catch (const Error&)
    {
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
    return false;
}

int test_validation_rejects_bad_inputs()
{
    int failures = 0;
    const std::vector<double> time = {0.0, 1.0, 2.0};
    const double nan = std::numeric_limits<double>::quiet_NaN();

    failures += expect_true(
        throws<solarosc::ShapeError>(time, make_modes({1.0, 2.0}, {1.0, 1.0, 1.0}, {1.0, 1.0})),
        "freq length 2 with ampl length 3 must be a shape error");
    failures += expect_true(
        throws<solarosc::ShapeError>(time, make_modes({1.0}, {1.0}, {})),
        "missing eta must be a shape error");
    failures += expect_true(
        throws<solarosc::DomainError>(time, make_modes({1.0}, {1.0}, {0.0})),
        "eta = 0 must be a domain error");
    failures += expect_true(
        throws<solarosc::DomainError>(time, make_modes({1.0}, {1.0}, {-1.0})),
        "eta = -1 must be a domain error");
    failures += expect_true(
        throws<solarosc::DomainError>(time, make_modes({1.0}, {1.0}, {nan})),
        "non-finite eta must be a domain error");
    failures += expect_true(
        throws<solarosc::DomainError>(time, make_modes({1.0}, {-0.5}, {1.0})),
        "negative amplitude must be a domain error");
    failures += expect_true(
        throws<solarosc::DomainError>({0.0, 2.0, 1.0}, make_modes({1.0}, {1.0}, {1.0})),
        "decreasing output times must be a domain error");
    failures += expect_true(
        throws<solarosc::DomainError>({0.0, nan}, make_modes({1.0}, {1.0}, {1.0})),
        "non-finite output time must be a domain error");

    bool accepted = true;
    try
    {
        solarosc::validate_inputs({0.0, 1.0, 1.0, 3.0}, make_modes({1.0}, {0.0}, {1.0}));
        solarosc::validate_inputs({}, make_modes({}, {}, {}));
    }
    catch (const std::exception&)
    {
        accepted = false;
    }
    failures += expect_true(accepted, "repeated times, zero amplitude and empty inputs must be accepted");
    return failures;
}

int test_derived_constants()
{
    int failures = 0;
    const solarosc::ModeParameters modes = make_modes({23.0, 23.5}, {100.0, 110.0}, {1.0e-6, 3.0e-6});
    const solarosc::OscillationConfig cfg;

    const solarosc::ExcitationConstants c = solarosc::derive_excitation_constants(modes, cfg);
    const double expected_dt = (1.0 / 3.0e-6) / 100.0;
    failures += expect_close(c.kick_timestep, expected_dt, "kick_timestep", 1.0e-9);
    failures += expect_true(c.warmup_kicks == 300, "warm-up spans the longest damping time (300 kicks)");
    failures += expect_true(c.kick_amplitude.size() == 2 && c.kick_damping.size() == 2,
                            "one kick amplitude and damping factor per mode");
    failures += expect_close(c.kick_amplitude[0], 100.0 * std::sqrt(expected_dt * 1.0e-6), "kick_amplitude[0]", 1.0e-9);
    failures += expect_close(c.kick_amplitude[1], 110.0 * std::sqrt(expected_dt * 3.0e-6), "kick_amplitude[1]", 1.0e-9);
    failures += expect_close(c.kick_damping[1], std::exp(-0.01), "kick_damping[1]");

    const solarosc::ModeParameters stiff = make_modes({1.0, 2.0}, {1.0, 1.0}, {1.0, 1.0e-6});
    failures += expect_true(solarosc::derive_excitation_constants(stiff, cfg).warmup_kicks == 20000,
                            "warm-up must be capped at 20000 kicks by default");

    solarosc::OscillationConfig capped;
    capped.max_warmup_kicks = 50;
    failures += expect_true(solarosc::derive_excitation_constants(modes, capped).warmup_kicks == 50,
                            "warm-up cap must be configurable");

    solarosc::OscillationConfig no_warmup;
    no_warmup.warmup_enabled = false;
    failures += expect_true(solarosc::derive_excitation_constants(modes, no_warmup).warmup_kicks == 0,
                            "disabled warm-up must run zero kicks");

    solarosc::OscillationConfig coarse;
    coarse.kicks_per_damping_time = 10.0;
    failures += expect_close(solarosc::derive_excitation_constants(modes, coarse).kick_timestep,
                             (1.0 / 3.0e-6) / 10.0, "kick_timestep with 10 kicks per damping time", 1.0e-6);

    bool rejected = false;
    try
    {
        solarosc::OscillationConfig bad;
        bad.kicks_per_damping_time = 0.0;
        solarosc::derive_excitation_constants(modes, bad);
    }
    catch (const solarosc::DomainError&)
    {
        rejected = true;
    }
    failures += expect_true(rejected, "non-positive kick density must be a domain error");

    // 1 / 1e-310 overflows: no finite kick timestep exists.
    bool tiny_rejected = false;
    try
    {
        solarosc::derive_excitation_constants(make_modes({1.0}, {1.0}, {1.0e-310}), cfg);
    }
    catch (const solarosc::DomainError&)
    {
        tiny_rejected = true;
    }
    failures += expect_true(tiny_rejected, "a damping rate too small for a finite kick timestep must be a domain error");

    const solarosc::ExcitationConstants wide =
        solarosc::derive_excitation_constants(make_modes({1.0, 2.0}, {1.0, 1.0}, {1.0e300, 1.0e-300}), cfg);
    failures += expect_true(std::isfinite(wide.kick_timestep) && wide.warmup_kicks == 20000,
                            "an unbounded longest damping time is capped, not undefined");

    const solarosc::ExcitationConstants none = solarosc::derive_excitation_constants(make_modes({}, {}, {}), cfg);
    failures += expect_true(none.kick_amplitude.empty() && none.warmup_kicks == 0,
                            "zero modes derive empty constants");
    return failures;
}

int test_kick_phase_initialization()
{
    int failures = 0;
    solarosc::OscillationRNG rng(11, 0);
    const double kts = 0.25;
    for (int trial = 0; trial < 100; ++trial)
    {
        solarosc::ModeState state;
        solarosc::initialize_kick_phase(state, 5.0, kts, rng);
        failures += expect_true(state.last_kick_time >= 5.0 - kts && state.last_kick_time <= 5.0,
                                "last kick must lie in [t0 - kicktimestep, t0]");
        failures += expect_true(solarosc::clock_invariant_holds(state, 5.0, kts),
                                "clock invariant must hold at the first output time");
    }
    return failures;
}

int test_advance_keeps_clock_invariant()
{
    int failures = 0;
    solarosc::OscillationRNG rng(2024, 0);
    const double eta = 2.0;
    const double kick_amplitude = 0.3;
    const double kts = 0.005;

    // Mix of sub-kick, single-kick and many-kick gaps, plus a repeated time.
    const std::vector<double> time = {0.0, 0.001, 0.002, 0.009, 0.009, 0.05, 0.051, 1.3, 1.3001, 7.0};

    solarosc::ModeState state;
    solarosc::initialize_kick_phase(state, time.front(), kts, rng);
    uint64_t kicks = 0;
    double previous_last = state.last_kick_time;
    for (double t : time)
    {
        const uint64_t before = kicks;
        state = solarosc::advance_to(state, eta, kick_amplitude, kts, t, rng, &kicks);
        failures += expect_true(solarosc::clock_invariant_holds(state, t, kts),
                                "last_kick_time <= t < next_kick_time after every step");
        failures += expect_true(state.last_kick_time >= previous_last, "kick clock must never rewind");

        const double expected_kicks = std::round((state.last_kick_time - previous_last) / kts);
        failures += expect_close(static_cast<double>(kicks - before), expected_kicks,
                                 "one kick per elapsed kicktimestep");
        previous_last = state.last_kick_time;
    }
    failures += expect_true(kicks > 1000, "coarse gaps must trigger many kicks");
    return failures;
}

int test_pure_damping_without_kicks()
{
    int failures = 0;
    solarosc::OscillationRNG rng(3, 0);
    const double eta = 0.5;
    const double kts = 0.1;

    solarosc::ModeState state;
    state.ampl_sin = 1.0;
    state.ampl_cos = -2.0;
    state.last_kick_time = -0.05;
    state.next_kick_time = state.last_kick_time + kts;

    const solarosc::ModeState start = state;
    state = solarosc::advance_to(state, eta, 0.0, kts, 1.0, rng);
    const double elapsed = state.last_kick_time - start.last_kick_time;
    failures += expect_close(state.ampl_sin, std::exp(-eta * elapsed), "ampl_sin decays exponentially", 1.0e-12);
    failures += expect_close(state.ampl_cos, -2.0 * std::exp(-eta * elapsed), "ampl_cos decays exponentially", 1.0e-12);

    // Sampling damps the rest of the way to t but leaves the clock alone.
    const double value = solarosc::sample_contribution(state, 0.0, eta, 1.0);
    failures += expect_close(value, -2.0 * std::exp(-eta * (1.0 + 0.05)), "damped cosine at zero frequency", 1.0e-12);
    failures += expect_close(state.last_kick_time, start.last_kick_time + elapsed, "sampling keeps last_kick_time");
    return failures;
}

int test_sample_contribution_matches_analytic_form()
{
    int failures = 0;
    solarosc::ModeState state;
    state.ampl_sin = 2.0;
    state.ampl_cos = 3.0;
    state.last_kick_time = 4.0;
    state.next_kick_time = 4.5;

    const double freq = 0.3;
    const double theta = 2.0 * M_PI * freq * 4.0;
    failures += expect_close(solarosc::sample_contribution(state, freq, 1.7, 4.0),
                             2.0 * std::sin(theta) + 3.0 * std::cos(theta),
                             "no damping at the kick instant");

    const double t = 4.2;
    const double theta_t = 2.0 * M_PI * freq * t;
    failures += expect_close(solarosc::sample_contribution(state, freq, 1.7, t),
                             std::exp(-1.7 * 0.2) * (2.0 * std::sin(theta_t) + 3.0 * std::cos(theta_t)),
                             "damped projection between kicks", 1.0e-12);
    return failures;
}

int test_time_resolution_guard()
{
    int failures = 0;
    bool rejected = false;
    try
    {
        solarosc::check_time_resolution({1.0e20, 1.0e20 + 1.0e5}, 1.0e-3);
    }
    catch (const solarosc::DomainError&)
    {
        rejected = true;
    }
    failures += expect_true(rejected, "a kick timestep below the time resolution must be rejected");

    bool accepted = true;
    try
    {
        solarosc::check_time_resolution({0.0, 40.0}, 3333.0);
        solarosc::check_time_resolution({}, 1.0e-3);
    }
    catch (const std::exception&)
    {
        accepted = false;
    }
    failures += expect_true(accepted, "resolvable grids must be accepted");
    return failures;
}

} // namespace

int main()
{
    int failures = 0;
    failures += test_validation_rejects_bad_inputs();
    failures += test_derived_constants();
    failures += test_kick_phase_initialization();
    failures += test_advance_keeps_clock_invariant();
    failures += test_pure_damping_without_kicks();
    failures += test_sample_contribution_matches_analytic_form();
    failures += test_time_resolution_guard();

    if (failures > 0)
    {
        std::cerr << "[mode-state-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[mode-state-regression] all checks passed" << std::endl;
    return 0;
}
