#pragma once

/// @file include/divsim/data_loader.hpp
/// @brief CSV loader for environmental time series.
///
/// # Module: EnvironmentLoader
///
/// ## Responsibility
/// Parse CSV files holding an environmental variable into an
/// `EnvironmentTable`. Malformed or non-finite rows are skipped; the loader
/// never crashes on bad input.
///
/// ## Expected CSV Format
/// ```
/// time,temperature
/// 0.0,14.2
/// 0.5,14.6
/// ```
/// The first non-comment line is treated as a header and skipped. Rows may
/// appear in any time order; they are sorted before the table is built.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` on unrecoverable errors
/// - Skips individual bad rows rather than failing the entire load
/// - Duplicate time stamps fail the load (interpolation would be ambiguous)

#include "divsim/environment.hpp"

#include <optional>
#include <string>
#include <utility>

namespace divsim {

/// Loads environment tables from CSV files and strings.
class EnvironmentLoader {
public:
    /// Load an environment table from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - `nullopt` if no valid data row remains or two rows share a time
    /// - The sorted table otherwise
    [[nodiscard]] static std::optional<EnvironmentTable>
    load_csv(const std::string& filepath) noexcept;

    /// Parse an environment table from CSV-formatted text (useful for
    /// testing). Same format and failure modes as `load_csv`.
    [[nodiscard]] static std::optional<EnvironmentTable>
    parse_csv_string(const std::string& csv_content) noexcept;

private:
    /// Parse a single CSV data row into a (time, value) pair.
    /// Returns `nullopt` if the row is malformed or values are non-finite.
    [[nodiscard]] static std::optional<std::pair<double, double>>
    parse_row(const std::string& line) noexcept;
};

} // namespace divsim
