/// @file src/core/data_loader.cpp
/// @brief CSV EnvironmentLoader for environmental time series.

#include "divsim/data_loader.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace divsim {

// ─── EnvironmentLoader::parse_row ─────────────────────────────────────────────

std::optional<std::pair<double, double>>
EnvironmentLoader::parse_row(const std::string& line) noexcept {
    // Skip blank lines and comment lines.
    if (line.empty() || line[0] == '#') {
        return std::nullopt;
    }

    std::istringstream ss(line);
    std::string token;
    std::vector<double> fields;
    fields.reserve(2);

    while (std::getline(ss, token, ',')) {
        // Trim leading/trailing whitespace.
        const auto first = token.find_first_not_of(" \t\r\n");
        const auto last  = token.find_last_not_of(" \t\r\n");
        if (first == std::string::npos) {
            return std::nullopt;  // empty token
        }
        token = token.substr(first, last - first + 1);

        double val = 0.0;
        try {
            std::size_t pos = 0;
            val = std::stod(token, &pos);
            if (pos != token.size()) {
                return std::nullopt;  // trailing garbage
            }
        } catch (const std::exception&) {
            return std::nullopt;
        }

        if (!std::isfinite(val)) {
            return std::nullopt;
        }

        fields.push_back(val);
    }

    if (fields.size() != 2) {
        return std::nullopt;
    }

    return std::make_pair(fields[0], fields[1]);
}

// ─── EnvironmentLoader::parse_csv_string ──────────────────────────────────────

std::optional<EnvironmentTable>
EnvironmentLoader::parse_csv_string(const std::string& csv_content) noexcept {
    std::vector<std::pair<double, double>> rows;
    std::istringstream stream(csv_content);
    std::string line;
    bool header_skipped = false;

    while (std::getline(stream, line)) {
        // Trim carriage return.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (!header_skipped) {
            // First non-empty, non-comment line is the header.
            if (!line.empty() && line[0] != '#') {
                header_skipped = true;
            }
            continue;
        }

        auto row = parse_row(line);
        if (row) {
            rows.push_back(*row);
        }
    }

    if (rows.empty()) {
        return std::nullopt;
    }

    std::stable_sort(rows.begin(), rows.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<double> times;
    std::vector<double> values;
    times.reserve(rows.size());
    values.reserve(rows.size());
    for (const auto& [t, v] : rows) {
        times.push_back(t);
        values.push_back(v);
    }

    // Duplicate times are rejected here by the strict-ascending check.
    return EnvironmentTable::from_columns(std::move(times), std::move(values));
}

// ─── EnvironmentLoader::load_csv ──────────────────────────────────────────────

std::optional<EnvironmentTable>
EnvironmentLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string contents;
    std::string line;
    while (std::getline(file, line)) {
        contents += line;
        contents += '\n';
    }

    return parse_csv_string(contents);
}

} // namespace divsim
