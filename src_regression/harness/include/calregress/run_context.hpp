#pragma once

#include "cancellation.hpp"

#include <atomic>
#include <cstddef>
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

namespace calregress {

/**
 * \brief Line-oriented console output shared by all threads of a run.
 *
 * Informational lines go to `out`, warnings and errors to `err` with a
 * `WARNING:` / `ERROR:` prefix. Whole lines are written under one lock so
 * concurrent workers never interleave characters.
 */
class ConsoleLog {
public:
    explicit ConsoleLog(std::ostream& out = std::cout, std::ostream& err = std::cerr);

    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    /// Suppresses info() lines; warnings and errors are always written.
    void set_quiet(bool quiet) noexcept { quiet_.store(quiet); }

private:
    std::ostream& out_;
    std::ostream& err_;
    std::mutex mutex_;
    std::atomic<bool> quiet_{false};
};

/// Live counters of a run, readable from any thread.
struct RunProgress {
    std::atomic<std::size_t> discovered{0};
    std::atomic<std::size_t> started{0};
    std::atomic<std::size_t> completed{0};
};

/**
 * \brief Run-wide state handed explicitly to every stage.
 *
 * Owns the cancellation token, the console log and the progress counters.
 * Not copyable; one context per run.
 */
class RunContext {
public:
    explicit RunContext(std::ostream& out = std::cout, std::ostream& err = std::cerr);

    RunContext(const RunContext&) = delete;
    RunContext& operator=(const RunContext&) = delete;

    [[nodiscard]] ConsoleLog& log() noexcept { return log_; }
    [[nodiscard]] const CancellationToken& cancellation() const noexcept { return cancellation_; }
    [[nodiscard]] RunProgress& progress() noexcept { return progress_; }

    void cancel() noexcept { cancellation_.cancel(); }
    [[nodiscard]] bool cancelled() const noexcept { return cancellation_.cancelled(); }

private:
    ConsoleLog log_;
    CancellationToken cancellation_;
    RunProgress progress_;
};

}  // namespace calregress
