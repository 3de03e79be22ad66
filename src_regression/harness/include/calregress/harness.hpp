#pragma once

#include "case_discoverer.hpp"
#include "comparator.hpp"
#include "dispatcher.hpp"
#include "run_context.hpp"
#include "run_report.hpp"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace calregress {

/// Unusable output, executable or diff tree paths. Raised before any case runs.
class HarnessError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ExecuteRequest {
    std::filesystem::path root;
    /// Must not exist yet; created together with its `logs` subdirectory.
    std::filesystem::path output;
    /// `commands.exec_dir` names the executable directory.
    DiscoveryOptions discovery{};
    /// `output_root` is taken from `output`.
    DispatchOptions dispatch{};
    /// Compare every finished case against this tree while the run continues.
    std::optional<std::filesystem::path> reference{};
    CompareOptions compare{};
    std::vector<std::string> suffixes{".fits"};
};

/**
 * \brief Discovers, runs and optionally compares every case under `request.root`.
 *
 * Throws DiscoveryError for a bad root and HarnessError for a bad output,
 * executable or reference path. Everything that goes wrong inside a case is
 * recorded in its CaseResult. A cancelled run returns the partial report
 * with `cancelled` set.
 */
[[nodiscard]] RunReport execute_and_report(RunContext& context, const ExecuteRequest& request);

struct DiffRequest {
    std::filesystem::path reference;
    std::filesystem::path candidate;
    CompareOptions compare{};
    std::vector<std::string> suffixes{".fits"};
};

/**
 * \brief Compares two existing output trees without running anything.
 *
 * Comparable files are grouped into one case per directory (relative path,
 * `.` for the top level). Reference files missing from the candidate make
 * the case an error, and so do candidate-only files, listed as unexpected. The
 * report carries a byte-level TreeSummary of all files.
 */
[[nodiscard]] RunReport diff_only(RunContext& context, const DiffRequest& request);

/// Byte-level file counts of two trees: differing, reference-only, candidate-only.
[[nodiscard]] TreeSummary summarize_trees(const std::filesystem::path& reference,
                                          const std::filesystem::path& candidate);

}  // namespace calregress
