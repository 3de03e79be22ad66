#pragma once

#include "case_discoverer.hpp"
#include "run_context.hpp"
#include "test_case.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace calregress {

enum class ExecutionStatus { Success, NonZeroExit, Timeout, LaunchFailure, Cancelled };

const char* to_string(ExecutionStatus status) noexcept;

/**
 * \brief Result of running one TestCase's command.
 *
 * Produced exactly once per case by the Dispatcher. `artifacts` lists the
 * regular files found under `output_directory` after the run, relative to
 * it and sorted.
 */
struct ExecutionOutcome {
    std::string case_id;
    std::size_t index{0};
    ExecutionStatus status{ExecutionStatus::LaunchFailure};
    int exit_code{-1};
    std::string stderr_tail;
    std::chrono::milliseconds duration{0};
    std::filesystem::path output_directory;
    std::vector<std::filesystem::path> artifacts;
    std::filesystem::path log_file;
    std::string message;  ///< diagnostics (launch error, signal, log write failure)

    [[nodiscard]] bool succeeded() const noexcept { return status == ExecutionStatus::Success; }
};

struct DispatchOptions {
    std::size_t concurrency{1};
    std::chrono::milliseconds timeout{0};  ///< zero: no limit
    std::chrono::milliseconds grace{2000};
    /// Case `id` runs in `<output_root>/<id>`; logs go to `<output_root>/logs`.
    std::filesystem::path output_root;
    std::size_t stderr_tail_bytes{4096};
    /// Record `<exe> --version` in each case log.
    bool probe_versions{false};
};

/// Yields the next case, or nothing when the input is exhausted.
using CaseGenerator = std::function<std::optional<TestCase>()>;
using OutcomeSink = std::function<void(ExecutionOutcome)>;

/**
 * \brief Runs TestCases on a fixed pool of worker threads.
 *
 * A single producer thread pulls cases from the generator into a bounded
 * work queue; `concurrency` workers launch each case as a child process and
 * push the outcome to a result queue drained on the calling thread, so the
 * sink is never invoked concurrently. Every case pulled from the generator
 * produces exactly one outcome. After cancellation no new case is launched:
 * queued cases are reported as Cancelled and running children are
 * terminated. All threads are joined before run() returns.
 */
class Dispatcher {
public:
    /// Throws std::invalid_argument when `options.concurrency` is zero.
    Dispatcher(RunContext& context, DispatchOptions options);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /**
     * \brief Dispatches every generated case, delivering outcomes to `sink`.
     *
     * An exception thrown by the generator or the sink stops dispatch; it is
     * rethrown once all threads have been joined.
     */
    void run(const CaseGenerator& next, const OutcomeSink& sink);

    /// Walks `discoverer` lazily. The walk starts on the calling thread, so
    /// a vanished root surfaces as DiscoveryError before anything runs.
    void run(const CaseDiscoverer& discoverer, const OutcomeSink& sink);

    /// Convenience form returning the outcomes in completion order.
    [[nodiscard]] std::vector<ExecutionOutcome> run(const std::vector<TestCase>& cases);

    /// Runs one case on the calling thread.
    [[nodiscard]] ExecutionOutcome execute(const TestCase& test);

    [[nodiscard]] const DispatchOptions& options() const noexcept { return options_; }

    /// Log file name for a case id (`a/b/c_raw.fits` -> `a_b_c_raw.fits.log`).
    [[nodiscard]] static std::string log_name(const std::string& case_id);

private:
    [[nodiscard]] ExecutionOutcome cancelled_outcome(const TestCase& test) const;
    [[nodiscard]] std::string program_version(const std::string& executable);

    RunContext& context_;
    DispatchOptions options_;
    std::mutex versions_mutex_;
    std::map<std::string, std::string> versions_;
};

}  // namespace calregress
