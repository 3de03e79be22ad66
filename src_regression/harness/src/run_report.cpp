#include "calregress/run_report.hpp"

#include <algorithm>
#include <utility>

namespace calregress {

const char* to_string(CaseVerdict verdict) noexcept {
    switch (verdict) {
        case CaseVerdict::Pass: return "PASS";
        case CaseVerdict::Fail: return "FAIL";
        case CaseVerdict::Error: return "ERROR";
    }
    return "ERROR";
}

CaseVerdict derive_verdict(const CaseResult& result) noexcept {
    if (result.outcome && !result.outcome->succeeded()) {
        return CaseVerdict::Error;
    }
    if (!result.issues.empty() || !result.unexpected.empty()) {
        return CaseVerdict::Error;
    }
    const bool differs = std::any_of(result.diffs.begin(), result.diffs.end(),
                                     [](const ArtifactDiff& diff) { return !diff.identical(); });
    return differs ? CaseVerdict::Fail : CaseVerdict::Pass;
}

CaseResult make_result(ExecutionOutcome outcome) {
    CaseResult result;
    result.index = outcome.index;
    result.case_id = outcome.case_id;
    result.message = outcome.message;
    result.outcome = std::move(outcome);
    result.verdict = derive_verdict(result);
    return result;
}

void SuffixCounts::count(const std::filesystem::path& file) {
    ++total;
    const auto ext = file.extension();
    if (ext == ".log") {
        ++logs;
    } else if (ext == ".tra") {
        ++trailers;
    } else if (ext == ".fits") {
        ++fits;
    }
}

RunAggregator::RunAggregator() : started_{std::chrono::steady_clock::now()} {}

void RunAggregator::count(CaseVerdict verdict, int delta) noexcept {
    auto& counter = verdict == CaseVerdict::Pass ? passed_ : verdict == CaseVerdict::Fail ? failed_ : errored_;
    counter = static_cast<std::size_t>(static_cast<long long>(counter) + delta);
}

void RunAggregator::add(CaseResult result) {
    auto it = results_.find(result.case_id);
    if (it != results_.end()) {
        count(it->second.verdict, -1);
        count(result.verdict, +1);
        it->second = std::move(result);
        return;
    }
    count(result.verdict, +1);
    auto id = result.case_id;
    results_.emplace(std::move(id), std::move(result));
}

void RunAggregator::consume(BoundedQueue<CaseResult>& queue) {
    while (auto result = queue.pop()) {
        add(std::move(*result));
    }
}

void RunAggregator::consume(std::vector<CaseResult> results) {
    for (auto& result : results) {
        add(std::move(result));
    }
}

RunReport RunAggregator::finalize() const {
    RunReport report;
    report.results.reserve(results_.size());
    for (const auto& [id, result] : results_) {
        report.results.push_back(result);
    }
    std::stable_sort(report.results.begin(), report.results.end(),
                     [](const CaseResult& a, const CaseResult& b) { return a.index < b.index; });
    report.passed = passed_;
    report.failed = failed_;
    report.errored = errored_;
    report.cancelled = cancelled_;
    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                             started_);
    report.tree = tree_;
    return report;
}

}  // namespace calregress
