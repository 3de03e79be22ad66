#pragma once

#include "run_report.hpp"

#include <chrono>
#include <filesystem>
#include <ostream>
#include <string>

namespace calregress {

/**
 * \brief Emits machine-readable and human-friendly reports for regression runs.
 *
 * - write_summary(): JSON document with aggregate counts and per-case results, diffs included.
 * - write_detailed(): HTML report with a tabular view of the cases.
 * - print_console(): the end-of-run summary printed by the CLI.
 */
class ReportWriter {
public:
    ReportWriter() = default;

    void write_summary(const std::filesystem::path& destination, const RunReport& report) const;

    void write_detailed(const std::filesystem::path& destination, const RunReport& report) const;

    void print_console(std::ostream& out, const RunReport& report) const;

    /// JSON text of the summary document.
    [[nodiscard]] std::string summary_json(const RunReport& report) const;
};

/// `1hrs:2mins:3secs`
[[nodiscard]] std::string format_duration(std::chrono::milliseconds duration);

}  // namespace calregress
