#pragma once

#include "comparator.hpp"
#include "dispatcher.hpp"
#include "work_queue.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace calregress {

enum class CaseVerdict { Pass, Fail, Error };

const char* to_string(CaseVerdict verdict) noexcept;

/// A referenced artifact that is missing on one side or could not be read.
struct ArtifactIssue {
    std::filesystem::path path;
    std::string message;
};

/**
 * \brief Final record of one TestCase.
 *
 * `outcome` is empty in diff-only mode. `unexpected` lists comparable
 * candidate artifacts without a reference counterpart; in both modes they
 * make the case an error, like reference artifacts that were not produced.
 */
struct CaseResult {
    std::size_t index{0};
    std::string case_id;
    std::optional<ExecutionOutcome> outcome;
    std::vector<ArtifactDiff> diffs;
    std::vector<ArtifactIssue> issues;
    std::vector<std::filesystem::path> unexpected;
    CaseVerdict verdict{CaseVerdict::Error};
    std::string message;
};

/**
 * \brief Error when execution failed, an artifact issue exists or an
 * unexpected artifact was found, Fail when any diff is not identical, Pass
 * otherwise.
 */
[[nodiscard]] CaseVerdict derive_verdict(const CaseResult& result) noexcept;

/// Wraps an outcome that is not compared further.
[[nodiscard]] CaseResult make_result(ExecutionOutcome outcome);

/// File counts split by the suffixes the pipelines produce.
struct SuffixCounts {
    std::size_t total{0};
    std::size_t logs{0};      ///< `.log`
    std::size_t trailers{0};  ///< `.tra`
    std::size_t fits{0};      ///< `.fits`

    void count(const std::filesystem::path& file);
};

/// Byte-level comparison of two output trees (diff-only mode).
struct TreeSummary {
    SuffixCounts differing;
    SuffixCounts reference_only;  ///< orphaned: no longer produced
    SuffixCounts candidate_only;  ///< newly generated

    /// Only log files differ.
    [[nodiscard]] bool loosely_passed() const noexcept {
        return differing.total > 0 && differing.total == differing.logs;
    }
};

struct RunReport {
    std::vector<CaseResult> results;  ///< ordered by discovery index
    std::size_t passed{0};
    std::size_t failed{0};
    std::size_t errored{0};
    bool cancelled{false};
    std::chrono::milliseconds duration{0};
    std::optional<TreeSummary> tree;

    [[nodiscard]] std::size_t total() const noexcept { return results.size(); }
    [[nodiscard]] bool all_passed() const noexcept { return failed == 0 && errored == 0; }
};

/**
 * \brief Folds CaseResults into a RunReport.
 *
 * Results may arrive in any order. A second result for the same case id
 * replaces the first and is counted once. finalize() orders the report by
 * discovery index and can be called again after more results arrive.
 */
class RunAggregator {
public:
    RunAggregator();

    void add(CaseResult result);

    /// Adds everything popped from `queue` until it is closed and drained.
    void consume(BoundedQueue<CaseResult>& queue);
    void consume(std::vector<CaseResult> results);

    void mark_cancelled() noexcept { cancelled_ = true; }
    void set_tree_summary(TreeSummary summary) { tree_ = summary; }

    [[nodiscard]] std::size_t passed() const noexcept { return passed_; }
    [[nodiscard]] std::size_t failed() const noexcept { return failed_; }
    [[nodiscard]] std::size_t errored() const noexcept { return errored_; }
    [[nodiscard]] std::size_t size() const noexcept { return results_.size(); }

    [[nodiscard]] RunReport finalize() const;

private:
    void count(CaseVerdict verdict, int delta) noexcept;

    std::chrono::steady_clock::time_point started_;
    std::map<std::string, CaseResult> results_;
    std::size_t passed_{0};
    std::size_t failed_{0};
    std::size_t errored_{0};
    bool cancelled_{false};
    std::optional<TreeSummary> tree_;
};

}  // namespace calregress
