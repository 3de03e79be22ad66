#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <pthread.h>
#include <signal.h>

#include "calregress/case_discoverer.hpp"
#include "calregress/config.hpp"
#include "calregress/harness.hpp"
#include "calregress/housekeeping.hpp"
#include "calregress/report_writer.hpp"
#include "calregress/run_context.hpp"

using calregress::ConfigError;
using calregress::ConfigLoader;
using calregress::HarnessConfig;
using calregress::ReportWriter;
using calregress::RunContext;
using calregress::RunReport;

namespace {

constexpr int kExitAborted = 130;

struct Args {
    std::filesystem::path root{"./"};
    std::filesystem::path output{};
    std::filesystem::path exec_dir{};
    std::optional<std::pair<std::filesystem::path, std::filesystem::path>> diff_only{};
    std::optional<std::filesystem::path> reference{};
    std::optional<std::filesystem::path> config_file{};
    std::optional<long long> threads{};
    std::optional<long long> timeout{};
    std::filesystem::path summary_path{};
    std::filesystem::path html_path{};
    std::optional<std::filesystem::path> clean{};
    std::optional<std::pair<std::filesystem::path, std::filesystem::path>> move{};
    std::vector<std::string> find{};
    bool cte_only{false};
    bool help{false};
};

const std::set<std::string_view> kOptions = {
    "-h", "--help", "-r", "-o", "--outPath", "-e", "--execPath", "-D", "--diffOnly", "-d", "--diffOnTheFly",
    "--cte", "-n", "--maxThreads", "-t", "--timeout", "--config", "--summary", "--html", "--clean", "--move",
    "--find",
};

void print_usage(const char* argv0) {
    std::cerr
        << "Regression test harness for calibration pipelines\n"
        << "Usage:\n"
        << "  " << argv0 << " -r <root data path> -o <output path> [-e <exec path>] [-d <reference>]\n"
        << "                 [--cte] [-n <threads>] [-t <seconds>] [--config <file>]\n"
        << "                 [--summary <path>] [--html <path>]\n"
        << "  " << argv0 << " -D <reference dir> <candidate dir> [--summary <path>] [--html <path>]\n"
        << "  " << argv0 << " --clean <path>\n"
        << "  " << argv0 << " --move <src> <dst>\n"
        << "  " << argv0 << " --find <path> <keyword> <value> [and|or <keyword> <value>]...\n"
        << "\n"
        << "Options:\n"
        << "  -r             Root path to regression test data (default: ./).\n"
        << "  -o, --outPath  Root path for all output; must not exist yet.\n"
        << "  -e, --execPath Directory containing the pipeline executables (default: PATH lookup).\n"
        << "  -D, --diffOnly Do not run tests, only compare output in the first dir to that in the second.\n"
        << "  -d             Compare each finished test's output against this reference tree.\n"
        << "  --cte          Only run tests whose input has PCTECORR = PERFORM, with wf3cte.e.\n"
        << "  -n             Maximum number of worker threads (<= 0: one per core).\n"
        << "  -t, --timeout  Per-test timeout in seconds (0: unlimited, default 3600).\n"
        << "  --config       key=value configuration file.\n"
        << "  --summary      Write JSON summary to this path (default: <output>/summary.json).\n"
        << "  --html         Write HTML report to this path (default: <output>/report.html).\n"
        << "  --clean        Remove all non *raw.fits files below the path.\n"
        << "  --move         Move all non *raw.fits files below <src> to <dst>/results.\n"
        << "  --find         List *raw.fits files whose primary header matches.\n"
        << "  -h, --help     Show this help message.\n"
        << std::endl;
}

bool arg_eq(std::string_view a, std::string_view b) {
    return a == b;
}

long long parse_number(std::string_view flag, std::string_view raw) {
    long long value = 0;
    const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc{} || ptr != raw.data() + raw.size()) {
        throw ConfigError(std::string{flag} + " expects an integer, got '" + std::string{raw} + "'");
    }
    return value;
}

Args parse_args(int argc, char** argv) {
    Args args;
    const auto value = [&](int& i, std::string_view flag) -> std::string {
        if (i + 1 >= argc) {
            throw ConfigError(std::string{flag} + " expects a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (arg_eq(tok, "-h") || arg_eq(tok, "--help")) {
            args.help = true;
            break;
        } else if (arg_eq(tok, "-r")) {
            args.root = value(i, tok);
        } else if (arg_eq(tok, "-o") || arg_eq(tok, "--outPath")) {
            args.output = value(i, tok);
        } else if (arg_eq(tok, "-e") || arg_eq(tok, "--execPath")) {
            args.exec_dir = value(i, tok);
        } else if (arg_eq(tok, "-D") || arg_eq(tok, "--diffOnly")) {
            std::filesystem::path first = value(i, tok);
            std::filesystem::path second = value(i, tok);
            args.diff_only = std::make_pair(std::move(first), std::move(second));
        } else if (arg_eq(tok, "-d") || arg_eq(tok, "--diffOnTheFly")) {
            args.reference = std::filesystem::path(value(i, tok));
        } else if (arg_eq(tok, "--cte")) {
            args.cte_only = true;
        } else if (arg_eq(tok, "-n") || arg_eq(tok, "--maxThreads")) {
            args.threads = parse_number(tok, value(i, tok));
        } else if (arg_eq(tok, "-t") || arg_eq(tok, "--timeout")) {
            args.timeout = parse_number(tok, value(i, tok));
        } else if (arg_eq(tok, "--config")) {
            args.config_file = std::filesystem::path(value(i, tok));
        } else if (arg_eq(tok, "--summary")) {
            args.summary_path = value(i, tok);
        } else if (arg_eq(tok, "--html")) {
            args.html_path = value(i, tok);
        } else if (arg_eq(tok, "--clean")) {
            args.clean = std::filesystem::path(value(i, tok));
        } else if (arg_eq(tok, "--move")) {
            std::filesystem::path src = value(i, tok);
            std::filesystem::path dst = value(i, tok);
            args.move = std::make_pair(std::move(src), std::move(dst));
        } else if (arg_eq(tok, "--find")) {
            while (i + 1 < argc && kOptions.count(argv[i + 1]) == 0) {
                args.find.emplace_back(argv[++i]);
            }
            if (args.find.size() < 3) {
                throw ConfigError("incorrect number of arguments for --find");
            }
        } else {
            throw ConfigError("Unknown option '" + std::string{tok} + "'");
        }
    }
    return args;
}

/**
 * \brief Turns SIGINT/SIGTERM into a run cancellation.
 *
 * The signals are blocked in every thread (the mask is inherited, so this
 * must be constructed before any other thread starts) and collected by one
 * dedicated thread through sigwait().
 */
class SignalWatcher {
public:
    explicit SignalWatcher(RunContext& context) : context_{context} {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        sigaddset(&signals_, SIGUSR1);
        if (pthread_sigmask(SIG_BLOCK, &signals_, nullptr) != 0) {
            throw std::runtime_error("Unable to block termination signals");
        }
        thread_ = std::thread([this] { watch(); });
    }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    ~SignalWatcher() {
        // SIGUSR1 only wakes the watcher so that it can be joined.
        pthread_kill(thread_.native_handle(), SIGUSR1);
        thread_.join();
    }

    [[nodiscard]] int received() const noexcept { return received_; }

private:
    void watch() {
        int sig = 0;
        while (sigwait(&signals_, &sig) == 0) {
            if (sig == SIGUSR1) {
                return;
            }
            received_ = sig;
            context_.log().warn("Signal " + std::to_string(sig) + " received, aborting run");
            context_.cancel();
        }
    }

    RunContext& context_;
    sigset_t signals_{};
    std::thread thread_;
    std::atomic<int> received_{0};
};

int aggregate_exit_code(const RunReport& report, const SignalWatcher& signals) {
    if (report.cancelled || signals.received() != 0) {
        return kExitAborted;
    }
    return report.all_passed() ? 0 : 1;
}

void emit_reports(const RunReport& report, const std::filesystem::path& summary, const std::filesystem::path& html) {
    ReportWriter writer;
    writer.print_console(std::cout, report);
    if (!summary.empty() || !html.empty()) {
        std::cout << "Artifacts:\n";
    }
    if (!summary.empty()) {
        writer.write_summary(summary, report);
        std::cout << "  JSON: " << summary << "\n";
    }
    if (!html.empty()) {
        writer.write_detailed(html, report);
        std::cout << "  HTML: " << html << "\n";
    }
}

int run_find(const Args& args, RunContext& context, const HarnessConfig& config) {
    const std::vector<std::string> criteria(args.find.begin() + 1, args.find.end());
    const auto selector = calregress::Selector::from_arguments(criteria);
    const auto found = calregress::find_inputs(args.find.front(), calregress::suffix_predicate(config.primary_suffix),
                                               selector, context.log());
    for (const auto& path : found) {
        std::cout << path.string() << "\n";
    }
    std::cout << found.size() << " files found" << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        HarnessConfig config;
        if (args.config_file) {
            ConfigLoader{}.apply_file(config, *args.config_file);
        }
        if (args.threads) {
            config.threads = *args.threads <= 0 ? 0 : static_cast<std::size_t>(*args.threads);
        }
        if (args.timeout) {
            if (*args.timeout < 0) {
                throw ConfigError("-t expects a non-negative number of seconds");
            }
            config.timeout = std::chrono::seconds{*args.timeout};
        }
        if (!args.exec_dir.empty()) {
            config.commands.exec_dir = args.exec_dir;
        }
        config.cte_only = args.cte_only;

        RunContext context;
        SignalWatcher signals(context);
        const auto keep = calregress::suffix_predicate(config.primary_suffix);

        if (!args.find.empty()) {
            return run_find(args, context, config);
        }

        if (args.move) {
            const auto& [src, dst] = *args.move;
            std::cout << "Moving all non *" << config.primary_suffix << " files in \"" << src.string() << "\" to \""
                      << (dst / "results").string() << "\"." << std::endl;
            const auto moved = calregress::move_tree(src, dst, keep);
            std::cout << moved << " file(s) moved" << std::endl;
            return 0;
        }

        if (args.clean) {
            std::cout << "Cleaning: removing all non *" << config.primary_suffix << " files from \""
                      << args.clean->string() << "\"" << std::endl;
            const auto removed = calregress::clean_tree(*args.clean, keep);
            std::cout << removed << " file(s) removed" << std::endl;
            return 0;
        }

        if (args.diff_only) {
            calregress::DiffRequest request;
            request.reference = args.diff_only->first;
            request.candidate = args.diff_only->second;
            request.compare = config.compare;
            request.suffixes = config.suffixes;

            const auto report = calregress::diff_only(context, request);
            emit_reports(report, args.summary_path, args.html_path);
            return aggregate_exit_code(report, signals);
        }

        if (args.output.empty()) {
            throw ConfigError("-o <output path> is required to run tests");
        }

        calregress::ExecuteRequest request;
        request.root = args.root;
        request.output = args.output;
        request.discovery = config.discovery_options();
        request.dispatch = config.dispatch_options();
        request.reference = args.reference;
        request.compare = config.compare;
        request.suffixes = config.suffixes;

        const auto report = calregress::execute_and_report(context, request);

        const auto summary = args.summary_path.empty() ? args.output / "summary.json" : args.summary_path;
        const auto html = args.html_path.empty() ? args.output / "report.html" : args.html_path;
        emit_reports(report, summary, html);
        return aggregate_exit_code(report, signals);
    } catch (const ConfigError& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        print_usage(argv[0]);
        return 2;  // configuration issue
    } catch (const calregress::DiscoveryError& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        return 2;
    } catch (const calregress::HarnessError& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        return 2;
    } catch (const calregress::HousekeepingError& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        for (const auto& [path, reason] : ex.failures()) {
            std::cerr << "  " << path.string() << ": " << reason << "\n";
        }
        return 2;
    } catch (const std::invalid_argument& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        return 2;
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        return 3;  // internal error
    } catch (...) {
        std::cerr << "ERROR: Unknown exception\n";
        return 3;
    }
}
