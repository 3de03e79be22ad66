#include "calregress/harness.hpp"
#include "calregress/live_comparator.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {

void require_tree(const fs::path& path, const char* role) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw calregress::HarnessError(std::string{"The "} + role + " path \"" + path.string() + "\" does not exist");
    }
    if (!fs::is_directory(path, ec)) {
        throw calregress::HarnessError(std::string{"The "} + role + " path \"" + path.string() +
                                       "\" is not a directory");
    }
}

void make_output_dir(const fs::path& output) {
    std::error_code ec;
    if (fs::exists(output, ec)) {
        throw calregress::HarnessError("The output path \"" + output.string() +
                                       "\" already exists, please delete or use another path");
    }
    fs::create_directories(output / "logs", ec);
    if (ec) {
        throw calregress::HarnessError("Cannot create output path \"" + output.string() + "\": " + ec.message());
    }
}

std::set<fs::path> relative_files(const fs::path& root) {
    std::set<fs::path> files;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator{}; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            files.insert(it->path().lexically_relative(root));
        }
    }
    return files;
}

bool same_bytes(const fs::path& a, const fs::path& b) {
    std::error_code ec_a;
    std::error_code ec_b;
    const auto size_a = fs::file_size(a, ec_a);
    const auto size_b = fs::file_size(b, ec_b);
    if (ec_a || ec_b || size_a != size_b) {
        return false;
    }
    std::ifstream in_a(a, std::ios::binary);
    std::ifstream in_b(b, std::ios::binary);
    if (!in_a || !in_b) {
        return false;
    }
    std::array<char, 65536> buf_a{};
    std::array<char, 65536> buf_b{};
    while (in_a && in_b) {
        in_a.read(buf_a.data(), buf_a.size());
        in_b.read(buf_b.data(), buf_b.size());
        const auto got_a = in_a.gcount();
        if (got_a != in_b.gcount()) {
            return false;
        }
        if (!std::equal(buf_a.begin(), buf_a.begin() + got_a, buf_b.begin())) {
            return false;
        }
    }
    return in_a.eof() && in_b.eof();
}

std::string group_id(const fs::path& relative_file) {
    const auto parent = relative_file.parent_path();
    return parent.empty() ? std::string{"."} : parent.generic_string();
}

}  // namespace

namespace calregress {

TreeSummary summarize_trees(const fs::path& reference, const fs::path& candidate) {
    TreeSummary summary;
    const auto left = relative_files(reference);
    const auto right = relative_files(candidate);
    for (const auto& rel : left) {
        if (right.count(rel) == 0) {
            summary.reference_only.count(rel);
        } else if (!same_bytes(reference / rel, candidate / rel)) {
            summary.differing.count(rel);
        }
    }
    for (const auto& rel : right) {
        if (left.count(rel) == 0) {
            summary.candidate_only.count(rel);
        }
    }
    return summary;
}

RunReport execute_and_report(RunContext& context, const ExecuteRequest& request) {
    auto& log = context.log();

    log.info("Path containing test data: \"" + request.root.string() + "\"");
    CaseDiscoverer discoverer(request.root, request.discovery, log);

    const auto& exec_dir = request.discovery.commands.exec_dir;
    if (!exec_dir.empty()) {
        log.info("Path containing executables: \"" + exec_dir.string() + "\"");
        require_tree(exec_dir, "executable");
    }
    if (request.reference) {
        log.info("Path containing reference output: \"" + request.reference->string() + "\"");
        require_tree(*request.reference, "reference");
    }
    log.info("Path to dump all output: \"" + request.output.string() + "\"");
    make_output_dir(request.output);

    DispatchOptions dispatch = request.dispatch;
    dispatch.output_root = request.output;
    Dispatcher dispatcher(context, dispatch);
    log.info("Using " + std::to_string(dispatch.concurrency) + " thread(s) to spawn jobs.");

    ArtifactComparator comparator(request.compare);
    std::unique_ptr<LiveComparator> live;
    if (request.reference) {
        live = std::make_unique<LiveComparator>(context, comparator, *request.reference, request.suffixes);
    }

    RunAggregator aggregator;
    dispatcher.run(discoverer, [&](ExecutionOutcome outcome) {
        aggregator.add(live ? live->compare(std::move(outcome)) : make_result(std::move(outcome)));
    });

    if (context.cancelled()) {
        aggregator.mark_cancelled();
        log.warn("Run cancelled: " + std::to_string(aggregator.size()) + " case(s) reported");
    }
    return aggregator.finalize();
}

RunReport diff_only(RunContext& context, const DiffRequest& request) {
    require_tree(request.reference, "reference");
    require_tree(request.candidate, "candidate");

    auto& log = context.log();
    RunAggregator aggregator;
    aggregator.set_tree_summary(summarize_trees(request.reference, request.candidate));

    std::map<std::string, std::pair<std::vector<fs::path>, std::vector<fs::path>>> groups;
    for (auto& rel : comparable_files(request.reference, request.suffixes)) {
        groups[group_id(rel)].first.push_back(std::move(rel));
    }
    for (auto& rel : comparable_files(request.candidate, request.suffixes)) {
        groups[group_id(rel)].second.push_back(std::move(rel));
    }

    const ArtifactComparator comparator(request.compare);
    std::size_t index = 0;
    for (const auto& [id, files] : groups) {
        if (context.cancelled()) {
            aggregator.mark_cancelled();
            break;
        }
        const auto& [left, right] = files;
        const std::set<fs::path> left_set(left.begin(), left.end());
        const std::set<fs::path> right_set(right.begin(), right.end());

        CaseResult result;
        result.index = index++;
        result.case_id = id;
        for (const auto& rel : left) {
            if (right_set.count(rel) == 0) {
                result.issues.push_back({rel, "missing from candidate tree"});
                continue;
            }
            const auto a = request.reference / rel;
            const auto b = request.candidate / rel;
            try {
                auto diff = comparator.compare(a, b);
                if (diff.identical()) {
                    log.info("\"" + a.string() + "\" & \"" + b.string() + "\" are identical");
                } else {
                    log.warn("\"" + a.string() + "\" & \"" + b.string() + "\" differ");
                }
                result.diffs.push_back(std::move(diff));
            } catch (const UnreadableArtifact& ex) {
                result.issues.push_back({rel, ex.what()});
                log.error(ex.what());
            } catch (const std::exception& ex) {
                result.issues.push_back({rel, std::string{"cannot compare: "} + ex.what()});
                log.error(a.string() + ": cannot compare: " + ex.what());
            }
        }
        for (const auto& rel : right) {
            if (left_set.count(rel) == 0) {
                result.unexpected.push_back(rel);
            }
        }
        result.verdict = derive_verdict(result);
        aggregator.add(std::move(result));
    }
    return aggregator.finalize();
}

}  // namespace calregress
