#include "calregress/live_comparator.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace calregress {

bool has_suffix(const fs::path& file, const std::vector<std::string>& suffixes) {
    const auto name = file.filename().string();
    return std::any_of(suffixes.begin(), suffixes.end(), [&](const std::string& suffix) {
        return name.size() >= suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
    });
}

std::vector<fs::path> comparable_files(const fs::path& directory, const std::vector<std::string>& suffixes) {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return files;
    }
    fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator{}; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && has_suffix(it->path(), suffixes)) {
            files.push_back(it->path().lexically_relative(directory));
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

LiveComparator::LiveComparator(RunContext& context,
                               const ArtifactComparator& comparator,
                               fs::path reference_root,
                               std::vector<std::string> suffixes)
    : context_{context},
      comparator_{comparator},
      reference_root_{std::move(reference_root)},
      suffixes_{std::move(suffixes)} {}

CaseResult LiveComparator::compare(ExecutionOutcome outcome) const {
    if (!outcome.succeeded()) {
        return make_result(std::move(outcome));
    }

    CaseResult result;
    result.index = outcome.index;
    result.case_id = outcome.case_id;
    result.message = outcome.message;

    const fs::path reference_dir = reference_root_ / outcome.case_id;
    std::error_code ec;
    if (!fs::is_directory(reference_dir, ec)) {
        result.issues.push_back({reference_dir, "reference directory missing"});
    }

    std::set<fs::path> produced;
    for (const auto& artifact : outcome.artifacts) {
        if (has_suffix(artifact, suffixes_)) {
            produced.insert(artifact);
        }
    }
    std::set<fs::path> expected;
    for (auto& file : comparable_files(reference_dir, suffixes_)) {
        expected.insert(std::move(file));
    }

    for (const auto& rel : expected) {
        if (produced.count(rel) == 0) {
            result.issues.push_back({rel, "reference artifact not produced"});
            continue;
        }
        try {
            result.diffs.push_back(comparator_.compare(reference_dir / rel, outcome.output_directory / rel));
        } catch (const UnreadableArtifact& ex) {
            result.issues.push_back({rel, ex.what()});
        } catch (const std::exception& ex) {
            result.issues.push_back({rel, std::string{"cannot compare: "} + ex.what()});
        }
    }
    for (const auto& rel : produced) {
        if (expected.count(rel) == 0) {
            result.unexpected.push_back(rel);
        }
    }

    result.outcome = std::move(outcome);
    result.verdict = derive_verdict(result);

    auto& log = context_.log();
    if (result.verdict == CaseVerdict::Fail) {
        for (const auto& diff : result.diffs) {
            if (!diff.identical()) {
                log.warn("\"" + diff.reference.string() + "\" & \"" + diff.candidate.string() + "\" differ");
            }
        }
    } else if (result.verdict == CaseVerdict::Error) {
        for (const auto& issue : result.issues) {
            log.error(result.case_id + ": " + issue.path.string() + ": " + issue.message);
        }
        for (const auto& rel : result.unexpected) {
            log.error(result.case_id + ": " + rel.string() + ": missing from reference");
        }
    }
    return result;
}

}  // namespace calregress
