#pragma once

#include "cancellation.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace calregress {

enum class ProcessStatus { Exited, Signalled, TimedOut, Cancelled, LaunchFailed };

const char* to_string(ProcessStatus status) noexcept;

struct ProcessSpec {
    std::vector<std::string> argv;
    std::filesystem::path working_directory;
    std::chrono::milliseconds timeout{0};  ///< zero: no limit
    std::chrono::milliseconds grace{2000};  ///< SIGTERM to SIGKILL delay
    std::size_t capture_limit{1u << 20};    ///< bytes kept per stream (tail)
};

struct ProcessResult {
    ProcessStatus status{ProcessStatus::LaunchFailed};
    int exit_code{-1};
    int signal{0};
    std::string stdout_text;
    std::string stderr_text;
    std::string error;  ///< launch failure reason
    std::chrono::milliseconds duration{0};
};

/**
 * \brief Runs a child process to completion, enforcing timeout and cancellation.
 *
 * The child runs in its own process group with stdin on /dev/null and
 * stdout/stderr captured through pipes. On timeout or cancellation the whole
 * group receives SIGTERM, then SIGKILL once `grace` has elapsed. Failing to
 * start the program (missing executable, permission denied, bad working
 * directory) is reported as LaunchFailed, never thrown.
 */
[[nodiscard]] ProcessResult run_process(const ProcessSpec& spec, const CancellationToken& cancellation);

}  // namespace calregress
