#include "calregress/dispatcher.hpp"
#include "calregress/process.hpp"
#include "calregress/work_queue.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace {

constexpr std::chrono::milliseconds kVersionProbeTimeout{10000};

std::string tail(const std::string& text, std::size_t limit) {
    if (text.size() <= limit) {
        return text;
    }
    return text.substr(text.size() - limit);
}

std::string join_command(const std::vector<std::string>& argv) {
    std::string joined;
    for (const auto& arg : argv) {
        if (!joined.empty()) {
            joined.push_back(' ');
        }
        joined += arg;
    }
    return joined;
}

bool write_text(const fs::path& path, const std::string& text, std::string& diag) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    std::ofstream ofs(path);
    if (!ofs) { diag += "cannot write log file: " + path.string() + "\n"; return false; }
    ofs << text;
    if (!ofs) { diag += "write failed: " + path.string() + "\n"; return false; }
    return true;
}

std::vector<fs::path> list_artifacts(const fs::path& directory, std::string& diag) {
    std::vector<fs::path> artifacts;
    std::error_code ec;
    fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator{}; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            artifacts.push_back(it->path().lexically_relative(directory));
        }
    }
    if (ec) {
        diag += "artifact listing incomplete: " + ec.message() + "\n";
    }
    std::sort(artifacts.begin(), artifacts.end());
    return artifacts;
}

/// Closes both queues and joins every thread when the run scope is left.
class ThreadGroup {
public:
    ThreadGroup(calregress::BoundedQueue<calregress::TestCase>& work,
                calregress::BoundedQueue<calregress::ExecutionOutcome>& results)
        : work_{work}, results_{results} {}

    ThreadGroup(const ThreadGroup&) = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;

    ~ThreadGroup() {
        if (!joined_) {
            work_.close();
            results_.close();
            join();
        }
    }

    template <typename Fn>
    void spawn(Fn&& fn) { threads_.emplace_back(std::forward<Fn>(fn)); }

    void join() {
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        joined_ = true;
    }

private:
    calregress::BoundedQueue<calregress::TestCase>& work_;
    calregress::BoundedQueue<calregress::ExecutionOutcome>& results_;
    std::vector<std::thread> threads_;
    bool joined_{false};
};

}  // namespace

namespace calregress {

const char* to_string(ExecutionStatus status) noexcept {
    switch (status) {
        case ExecutionStatus::Success: return "success";
        case ExecutionStatus::NonZeroExit: return "non-zero";
        case ExecutionStatus::Timeout: return "timeout";
        case ExecutionStatus::LaunchFailure: return "launch-failure";
        case ExecutionStatus::Cancelled: return "cancelled";
    }
    return "launch-failure";
}

Dispatcher::Dispatcher(RunContext& context, DispatchOptions options)
    : context_{context}, options_{std::move(options)} {
    if (options_.concurrency == 0) {
        throw std::invalid_argument("Dispatcher concurrency must be at least 1");
    }
}

std::string Dispatcher::log_name(const std::string& case_id) {
    std::string name = case_id;
    std::replace(name.begin(), name.end(), '/', '_');
    return name + ".log";
}

void Dispatcher::run(const CaseGenerator& next, const OutcomeSink& sink) {
    const std::size_t workers = options_.concurrency;
    BoundedQueue<TestCase> work(workers * 2);
    BoundedQueue<ExecutionOutcome> results(workers * 2);

    std::atomic<bool> stop{false};
    std::atomic<std::size_t> workers_left{workers};
    std::exception_ptr generator_error;
    std::exception_ptr sink_error;

    const auto halted = [&] { return stop.load() || context_.cancelled(); };

    ThreadGroup group(work, results);

    group.spawn([&] {
        try {
            while (!halted()) {
                auto test = next();
                if (!test) {
                    break;
                }
                context_.progress().discovered.fetch_add(1);
                if (!work.push(std::move(*test))) {
                    break;
                }
            }
        } catch (...) {
            generator_error = std::current_exception();
            stop.store(true);
        }
        work.close();
    });

    for (std::size_t i = 0; i < workers; ++i) {
        group.spawn([&] {
            while (auto test = work.pop()) {
                ExecutionOutcome outcome;
                if (halted()) {
                    outcome = cancelled_outcome(*test);
                } else {
                    try {
                        outcome = execute(*test);
                    } catch (const std::exception& ex) {
                        outcome = cancelled_outcome(*test);
                        outcome.status = ExecutionStatus::LaunchFailure;
                        outcome.message = std::string{"internal error: "} + ex.what();
                        context_.log().error(test->id + ": " + outcome.message);
                    } catch (...) {
                        outcome = cancelled_outcome(*test);
                        outcome.status = ExecutionStatus::LaunchFailure;
                        outcome.message = "internal error: unknown exception";
                        context_.log().error(test->id + ": " + outcome.message);
                    }
                }
                if (!results.push(std::move(outcome))) {
                    break;
                }
            }
            if (workers_left.fetch_sub(1) == 1) {
                results.close();
            }
        });
    }

    while (auto outcome = results.pop()) {
        if (sink_error) {
            continue;
        }
        try {
            sink(std::move(*outcome));
        } catch (...) {
            sink_error = std::current_exception();
            stop.store(true);
            work.close();
        }
    }

    group.join();

    if (generator_error) {
        std::rethrow_exception(generator_error);
    }
    if (sink_error) {
        std::rethrow_exception(sink_error);
    }
}

void Dispatcher::run(const CaseDiscoverer& discoverer, const OutcomeSink& sink) {
    auto it = std::make_shared<CaseDiscoverer::Iterator>(discoverer.begin());
    run([&discoverer, it]() -> std::optional<TestCase> {
            if (*it == discoverer.end()) {
                return std::nullopt;
            }
            TestCase test = **it;
            ++*it;
            return test;
        },
        sink);
}

std::vector<ExecutionOutcome> Dispatcher::run(const std::vector<TestCase>& cases) {
    std::size_t position = 0;
    std::vector<ExecutionOutcome> outcomes;
    outcomes.reserve(cases.size());
    run([&]() -> std::optional<TestCase> {
            if (position >= cases.size()) {
                return std::nullopt;
            }
            return cases[position++];
        },
        [&](ExecutionOutcome outcome) { outcomes.push_back(std::move(outcome)); });
    return outcomes;
}

ExecutionOutcome Dispatcher::cancelled_outcome(const TestCase& test) const {
    ExecutionOutcome outcome;
    outcome.case_id = test.id;
    outcome.index = test.index;
    outcome.status = ExecutionStatus::Cancelled;
    outcome.output_directory = options_.output_root / test.id;
    outcome.message = "not started: run cancelled";
    return outcome;
}

ExecutionOutcome Dispatcher::execute(const TestCase& test) {
    auto& log = context_.log();
    context_.progress().started.fetch_add(1);

    ExecutionOutcome outcome;
    outcome.case_id = test.id;
    outcome.index = test.index;
    outcome.output_directory = options_.output_root / test.id;
    outcome.log_file = options_.output_root / "logs" / log_name(test.id);

    std::string diag;
    std::error_code ec;
    fs::create_directories(outcome.output_directory, ec);
    if (ec) {
        outcome.status = ExecutionStatus::LaunchFailure;
        outcome.message = "cannot create output directory " + outcome.output_directory.string() + ": " +
                          ec.message();
        log.error(outcome.message);
        context_.progress().completed.fetch_add(1);
        return outcome;
    }

    log.info("Processing \"" + test.primary_input.string() + "\"...");

    ProcessSpec spec;
    spec.argv = test.command;
    spec.working_directory = outcome.output_directory;
    spec.timeout = options_.timeout;
    spec.grace = options_.grace;
    spec.capture_limit = std::max<std::size_t>(spec.capture_limit, options_.stderr_tail_bytes);

    const auto result = run_process(spec, context_.cancellation());

    outcome.exit_code = result.exit_code;
    outcome.duration = result.duration;
    outcome.stderr_tail = tail(result.stderr_text, options_.stderr_tail_bytes);
    switch (result.status) {
        case ProcessStatus::Exited:
            outcome.status = result.exit_code == 0 ? ExecutionStatus::Success : ExecutionStatus::NonZeroExit;
            break;
        case ProcessStatus::Signalled:
            outcome.status = ExecutionStatus::NonZeroExit;
            diag += "terminated by signal " + std::to_string(result.signal) + "\n";
            break;
        case ProcessStatus::TimedOut:
            outcome.status = ExecutionStatus::Timeout;
            diag += "timed out after " + std::to_string(options_.timeout.count()) + " ms\n";
            break;
        case ProcessStatus::Cancelled:
            outcome.status = ExecutionStatus::Cancelled;
            diag += "terminated: run cancelled\n";
            break;
        case ProcessStatus::LaunchFailed:
            outcome.status = ExecutionStatus::LaunchFailure;
            diag += result.error + "\n";
            break;
    }

    outcome.artifacts = list_artifacts(outcome.output_directory, diag);

    std::string version;
    if (options_.probe_versions && !test.command.empty()) {
        version = program_version(test.command.front());
    }

    std::ostringstream text;
    text << "Input file: \"" << test.primary_input.string() << "\"\n"
         << "Program: \"" << join_command(test.command) << "\"\n"
         << "Version: " << (version.empty() ? "unknown" : version) << "\n"
         << "Status: " << to_string(outcome.status) << "\n"
         << "return code:" << outcome.exit_code << "\n\n"
         << "stdout results:\n " << result.stdout_text << "\n\n"
         << "stderr results:\n " << result.stderr_text << "\n\n";
    if (!write_text(outcome.log_file, text.str(), diag)) {
        log.error("Cannot write log file \"" + outcome.log_file.string() + "\"");
    }

    if (!diag.empty() && diag.back() == '\n') {
        diag.pop_back();
    }
    outcome.message = std::move(diag);

    if (outcome.succeeded()) {
        log.info("\"" + test.primary_input.string() + "\" succeeded");
    } else {
        log.warn("\"" + test.primary_input.string() + "\" failed (" + to_string(outcome.status) + ")");
    }
    context_.progress().completed.fetch_add(1);
    return outcome;
}

std::string Dispatcher::program_version(const std::string& executable) {
    {
        std::lock_guard<std::mutex> lock(versions_mutex_);
        if (auto it = versions_.find(executable); it != versions_.end()) {
            return it->second;
        }
    }

    // Probed unlocked; two workers may race on the same executable and the first entry wins.
    ProcessSpec spec;
    spec.argv = {executable, "--version"};
    spec.timeout = kVersionProbeTimeout;
    spec.grace = options_.grace;
    const auto result = run_process(spec, context_.cancellation());

    std::string version;
    if (result.status == ProcessStatus::Exited) {
        version = result.stdout_text;
        while (!version.empty() && (version.back() == '\n' || version.back() == '\r')) {
            version.pop_back();
        }
    }
    std::lock_guard<std::mutex> lock(versions_mutex_);
    return versions_.emplace(executable, std::move(version)).first->second;
}

}  // namespace calregress
