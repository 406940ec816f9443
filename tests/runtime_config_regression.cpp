#include "runtime_config.hpp"
#include "string_utils.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace
{

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[runtime-config-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

int expect_close(double actual, double expected, const std::string& label, double tol = 1.0e-12)
{
    if (!(std::abs(actual - expected) <= tol))
    {
        std::cerr << "[runtime-config-regression] FAIL: " << label
                  << " actual=" << actual
                  << " expected=" << expected << std::endl;
        return 1;
    }
    return 0;
}

std::filesystem::path write_temp_file(const std::string& name, const std::string& contents)
{
    const std::filesystem::path path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << contents;
    return path;
}

int test_scalar_parsers()
{
    int failures = 0;
    int i = 7;
    failures += expect_true(solarosc::try_parse_int_value("-12", i) && i == -12, "signed integer parses");
    failures += expect_true(!solarosc::try_parse_int_value("12abc", i) && i == -12, "trailing junk rejected, output kept");
    failures += expect_true(!solarosc::try_parse_non_negative_int_value("-1", i), "negative rejected as non-negative");

    std::uint64_t seed = 0;
    failures += expect_true(solarosc::try_parse_uint64_value("18446744073709551615", seed) &&
                            seed == 18446744073709551615ULL, "full 64-bit seed parses");
    failures += expect_true(!solarosc::try_parse_uint64_value("-5", seed), "negative seed rejected");

    double d = 1.5;
    failures += expect_true(solarosc::try_parse_double_value("3e-6", d) && d == 3.0e-6, "scientific notation parses");
    failures += expect_true(!solarosc::try_parse_double_value("inf", d) && d == 3.0e-6, "non-finite rejected");

    failures += expect_true(solarosc::parse_bool_value("Yes") && solarosc::parse_bool_value("1") &&
                            !solarosc::parse_bool_value("off"), "boolean spellings");
    failures += expect_true(solarosc::strip_wrapping_quotes("\"serial\"") == "serial", "double quotes stripped");
    failures += expect_true(solarosc::strip_wrapping_quotes("'x") == "'x", "unbalanced quote kept");
    failures += expect_true(solarosc::strutil::strip_comment("outdir: 'runs/#3'  # scratch") == "outdir: 'runs/#3'  ",
                            "quoted '#' survives comment stripping");
    failures += expect_true(solarosc::parse_string_list("['serial', \"parallel\" ,, ]") ==
                            std::vector<std::string>{"serial", "parallel"}, "quoted list items, empty items dropped");
    return failures;
}

int test_lists_and_grids()
{
    int failures = 0;
    std::vector<double> values;
    failures += expect_true(solarosc::try_parse_double_list("[23.0, 23.5 , 1e-6]", values) &&
                            values.size() == 3 && values[2] == 1.0e-6, "bracketed list parses");
    failures += expect_true(!solarosc::try_parse_double_list("[1.0, x]", values) && values.size() == 3,
                            "bad list item keeps previous values");
    failures += expect_true(solarosc::try_parse_double_list("[]", values) && values.empty(), "empty list parses");

    const std::vector<double> grid = solarosc::linspace(0.0, 40.0, 100);
    failures += expect_true(grid.size() == 100, "linspace count");
    failures += expect_true(grid.front() == 0.0 && grid.back() == 40.0, "linspace includes both endpoints");
    failures += expect_close(grid[1], 40.0 / 99.0, "linspace step");
    failures += expect_true(solarosc::linspace(3.0, 9.0, 1) == std::vector<double>{3.0}, "single-sample linspace");
    failures += expect_true(solarosc::linspace(0.0, 1.0, 0).empty(), "zero-sample linspace");

    solarosc::TimeGridConfig explicit_grid;
    explicit_grid.use_values = true;
    explicit_grid.values = {0.0, 10.0, 20.0, 30.0};
    failures += expect_true(solarosc::build_time_grid(explicit_grid) == explicit_grid.values, "explicit grid wins");
    return failures;
}

int test_enum_parsers()
{
    int failures = 0;
    bool valid = true;
    failures += expect_true(solarosc::parse_log_profile("DEBUG", &valid) == solarosc::LogProfile::debug && valid,
                            "log profile is case-insensitive");
    solarosc::parse_log_profile("chatty", &valid);
    failures += expect_true(!valid, "unknown log profile flagged");
    failures += expect_true(std::string(solarosc::log_profile_name(solarosc::LogProfile::quiet)) == "quiet",
                            "log profile label");

    solarosc::ExportFormat format = solarosc::ExportFormat::both;
    failures += expect_true(solarosc::parse_export_format("NumPy", format) && format == solarosc::ExportFormat::npy,
                            "numpy alias");
    failures += expect_true(!solarosc::parse_export_format("hdf5", format) && format == solarosc::ExportFormat::npy,
                            "unknown format rejected, output kept");
    failures += expect_true(std::string(solarosc::export_format_name(solarosc::ExportFormat::csv)) == "csv",
                            "export format label");
    return failures;
}

int test_yaml_flattening_and_apply()
{
    int failures = 0;
    const std::filesystem::path path = write_temp_file(
        "solarosc_runtime_config_regression.yaml",
        "# demo\n"
        "logging:\n"
        "  profile: quiet\n"
        "simulation:\n"
        "  scheme: \"per_mode_streams\"   # alias\n"
        "  seed: 1234\n"
        "  member_id: 3\n"
        "  kicks_per_damping_time: 50\n"
        "  max_warmup_kicks: 500\n"
        "  warmup: false\n"
        "  threads: 2\n"
        "time:\n"
        "  values: [0.0, 10.0, 20.0, 30.0]\n"
        "modes:\n"
        "  freq: [23.0]\n"
        "  ampl: [100.0]\n"
        "  eta: [1.0e-6]\n"
        "output:\n"
        "  outdir: 'runs/a'\n"
        "  format: csv\n"
        "  flux: 2.5e5\n");

    const auto config = solarosc::parse_yaml_simple(path.string());
    failures += expect_true(config.count("simulation.seed") == 1 && config.at("simulation.seed") == "1234",
                            "nested keys flatten to dotted names");
    failures += expect_true(config.at("simulation.scheme") == "per_mode_streams", "comments and quotes stripped");
    failures += expect_true(config.at("output.outdir") == "runs/a", "single quotes stripped");

    const solarosc::LogProfile saved = solarosc::global_log_profile;
    solarosc::SimulationSetup setup;
    failures += expect_true(solarosc::load_config(path.string(), setup), "existing config loads");

    failures += expect_true(solarosc::global_log_profile == solarosc::LogProfile::quiet, "logging.profile applied");
    failures += expect_true(setup.oscillation.scheme_id == "parallel", "scheme alias normalized");
    failures += expect_true(setup.oscillation.seed == 1234 && setup.oscillation.member_id == 3, "seed and member");
    failures += expect_close(setup.oscillation.kicks_per_damping_time, 50.0, "kicks_per_damping_time");
    failures += expect_true(setup.oscillation.max_warmup_kicks == 500, "max_warmup_kicks");
    failures += expect_true(!setup.oscillation.warmup_enabled, "warmup switch");
    failures += expect_true(setup.oscillation.num_threads == 2, "threads");
    failures += expect_true(setup.time.use_values && setup.time.values.size() == 4, "explicit time values");
    failures += expect_true(setup.modes.size() == 1 && setup.modes.eta[0] == 1.0e-6, "mode lists");
    failures += expect_true(setup.outdir == "runs/a" && setup.format == solarosc::ExportFormat::csv, "output section");
    failures += expect_close(setup.mean_flux, 2.5e5, "mean flux");

    solarosc::global_log_profile = saved;
    std::filesystem::remove(path);
    return failures;
}

int test_invalid_values_keep_defaults()
{
    int failures = 0;
    const std::unordered_map<std::string, std::string> config =
    {
        {"simulation.scheme", "leapfrog"},
        {"simulation.seed", "-3"},
        {"simulation.kicks_per_damping_time", "0"},
        {"simulation.max_warmup_kicks", "-10"},
        {"time.count", "many"},
        {"modes.freq", "[1.0, oops]"},
        {"output.format", "parquet"},
        {"output.flux", "bright"},
    };

    solarosc::SimulationSetup setup;
    solarosc::apply_config(config, setup);

    const solarosc::SimulationSetup defaults;
    failures += expect_true(setup.oscillation.scheme_id == defaults.oscillation.scheme_id, "bad scheme ignored");
    failures += expect_true(setup.oscillation.seed == defaults.oscillation.seed, "bad seed ignored");
    failures += expect_close(setup.oscillation.kicks_per_damping_time, defaults.oscillation.kicks_per_damping_time,
                             "non-positive kick density ignored");
    failures += expect_true(setup.oscillation.max_warmup_kicks == defaults.oscillation.max_warmup_kicks,
                            "negative warm-up cap ignored");
    failures += expect_true(setup.time.count == defaults.time.count, "bad time count ignored");
    failures += expect_true(setup.modes.freq == defaults.modes.freq, "bad frequency list ignored");
    failures += expect_true(setup.format == defaults.format, "bad format ignored");
    failures += expect_close(setup.mean_flux, defaults.mean_flux, "bad flux ignored");
    return failures;
}

int test_missing_config()
{
    int failures = 0;
    solarosc::SimulationSetup setup;
    failures += expect_true(!solarosc::load_config("/nonexistent/solarosc/config.yaml", setup),
                            "missing config reports failure");
    failures += expect_true(solarosc::load_config("", setup), "empty path means defaults");
    failures += expect_true(setup.modes.size() == 2 && setup.time.count == 100, "defaults describe the two-mode demo");
    return failures;
}

} // namespace

int main()
{
    int failures = 0;
    failures += test_scalar_parsers();
    failures += test_lists_and_grids();
    failures += test_enum_parsers();
    failures += test_yaml_flattening_and_apply();
    failures += test_invalid_values_keep_defaults();
    failures += test_missing_config();

    if (failures > 0)
    {
        std::cerr << "[runtime-config-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[runtime-config-regression] all checks passed" << std::endl;
    return 0;
}
