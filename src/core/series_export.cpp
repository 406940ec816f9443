/**
 * @file series_export.cpp
 * @brief Core runtime implementation for the oscillation simulator.
 *
 * Writes simulated series to NumPy and CSV files and the run summary
 * to JSON. This file belongs to the primary src/core execution layer.
 */

#include "series_export.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

#include "string_utils.hpp"

namespace {

bool ensure_parent_directory(const std::filesystem::path& path, std::string& error)
{
    std::error_code ec;
    const auto parent = path.parent_path();
    if (!parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            error = "failed to create output directory '" + parent.string() + "': " + ec.message();
            return false;
        }
    }
    return true;
}

void write_json_array(std::ostringstream& oss, const std::vector<double>& values)
{
    oss << "[";
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        if (i > 0)
        {
            oss << ", ";
        }
        oss << values[i];
    }
    oss << "]";
}

}

namespace solarosc
{

std::string npy_header_1d(std::size_t length)
{
    const std::string header_dict = "{'descr': '<f8', 'fortran_order': False, 'shape': (" +
        std::to_string(length) + ",), }";
    std::size_t header_len = header_dict.size() + 1;

    const std::size_t preamble = 6 + 2 + 2;
    const std::size_t total = preamble + header_len;
    const std::size_t padding = (16 - (total % 16)) % 16;
    header_len += padding;

    std::string header;
    header.reserve(preamble + header_len);
    header.append("\x93NUMPY", 6);
    header.push_back(static_cast<char>(1));
    header.push_back(static_cast<char>(0));

    const uint16_t hl = static_cast<uint16_t>(header_len);
    header.push_back(static_cast<char>(hl & 0xFF));
    header.push_back(static_cast<char>((hl >> 8) & 0xFF));

    header += header_dict;
    header.append(padding, ' ');
    header.push_back('\n');
    return header;
}

bool write_npy_1d(const std::vector<double>& values,
                  const std::filesystem::path& path,
                  std::string& error)
{
    static_assert(std::numeric_limits<double>::is_iec559, "npy export assumes IEEE-754 doubles");

    if (!ensure_parent_directory(path, error))
    {
        return false;
    }

    std::ofstream out(path, std::ios::binary);
    if (!out)
    {
        error = "failed to open array file for writing: " + path.string();
        return false;
    }

    const std::string header = npy_header_1d(values.size());
    out.write(header.data(), static_cast<std::streamsize>(header.size()));

    // '<f8' is little-endian; serialize byte-wise so big-endian hosts agree.
    char bytes[sizeof(double)];
    for (const double value : values)
    {
        uint64_t bits = 0;
        std::memcpy(&bits, &value, sizeof(bits));
        for (std::size_t b = 0; b < sizeof(bits); ++b)
        {
            bytes[b] = static_cast<char>((bits >> (8 * b)) & 0xFF);
        }
        out.write(bytes, sizeof(bytes));
    }

    if (!out.good())
    {
        error = "failed to write array file: " + path.string();
        return false;
    }
    return true;
}

bool write_series_csv(const std::vector<double>& time,
                      const std::vector<double>& signal,
                      const std::vector<double>& flux,
                      const std::filesystem::path& path,
                      std::string& error)
{
    if (signal.size() != time.size() || flux.size() != time.size())
    {
        error = "series columns differ in length: time=" + std::to_string(time.size()) +
                " signal=" + std::to_string(signal.size()) +
                " flux=" + std::to_string(flux.size());
        return false;
    }

    if (!ensure_parent_directory(path, error))
    {
        return false;
    }

    std::ofstream out(path);
    if (!out)
    {
        error = "failed to open series file for writing: " + path.string();
        return false;
    }

    out << "time,signal,flux\n";
    out << std::setprecision(17);
    for (std::size_t j = 0; j < time.size(); ++j)
    {
        out << time[j] << "," << signal[j] << "," << flux[j] << "\n";
    }

    if (!out.good())
    {
        error = "failed to write series file: " + path.string();
        return false;
    }
    return true;
}

void summarize_signal(const std::vector<double>& signal, RunSummary& summary)
{
    if (signal.empty())
    {
        summary.signal_min = 0.0;
        summary.signal_max = 0.0;
        summary.signal_rms = 0.0;
        return;
    }

    const auto minmax = std::minmax_element(signal.begin(), signal.end());
    summary.signal_min = *minmax.first;
    summary.signal_max = *minmax.second;

    double sum_sq = 0.0;
    for (const double value : signal)
    {
        sum_sq += value * value;
    }
    summary.signal_rms = std::sqrt(sum_sq / static_cast<double>(signal.size()));
}

std::string run_summary_to_json(const RunSummary& summary)
{
    const SimulationDiagnostics& diag = summary.diagnostics;

    std::ostringstream oss;
    oss << std::setprecision(17);
    oss << "{\n";
    oss << "  \"scheme\": \"" << strutil::json_escape(diag.scheme) << "\",\n";
    oss << "  \"seed\": " << summary.seed << ",\n";
    oss << "  \"member_id\": " << summary.member_id << ",\n";
    oss << "  \"mode_count\": " << diag.mode_count << ",\n";
    oss << "  \"output_count\": " << diag.output_count << ",\n";
    oss << "  \"kick_timestep\": " << diag.kick_timestep << ",\n";
    oss << "  \"warmup_kicks\": " << diag.warmup_kicks << ",\n";
    oss << "  \"evolution_kicks\": " << diag.evolution_kicks << ",\n";
    oss << "  \"threads_used\": " << diag.threads_used << ",\n";
    oss << "  \"time_warm_up_s\": " << diag.time_warm_up << ",\n";
    oss << "  \"time_evolution_s\": " << diag.time_evolution << ",\n";
    oss << "  \"mean_flux\": " << summary.mean_flux << ",\n";

    oss << "  \"modes\": {\n";
    oss << "    \"freq\": ";
    write_json_array(oss, summary.modes.freq);
    oss << ",\n    \"ampl\": ";
    write_json_array(oss, summary.modes.ampl);
    oss << ",\n    \"eta\": ";
    write_json_array(oss, summary.modes.eta);
    oss << "\n  },\n";

    oss << "  \"signal\": {\"min\": " << summary.signal_min
        << ", \"max\": " << summary.signal_max
        << ", \"rms\": " << summary.signal_rms << "},\n";

    oss << "  \"files\": [";
    for (std::size_t i = 0; i < summary.files.size(); ++i)
    {
        if (i > 0)
        {
            oss << ", ";
        }
        oss << "\"" << strutil::json_escape(summary.files[i]) << "\"";
    }
    oss << "]\n";
    oss << "}\n";
    return oss.str();
}

bool write_run_summary_json(const RunSummary& summary,
                            const std::filesystem::path& path,
                            std::string& error)
{
    if (!ensure_parent_directory(path, error))
    {
        return false;
    }

    std::ofstream out(path);
    if (!out)
    {
        error = "failed to open summary file for writing: " + path.string();
        return false;
    }

    out << run_summary_to_json(summary);
    if (!out.good())
    {
        error = "failed to write summary file: " + path.string();
        return false;
    }
    return true;
}

}
