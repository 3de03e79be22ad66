#pragma once

#include "comparator.hpp"
#include "dispatcher.hpp"
#include "run_context.hpp"
#include "run_report.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace calregress {

/// True when `file` ends with one of `suffixes`.
[[nodiscard]] bool has_suffix(const std::filesystem::path& file, const std::vector<std::string>& suffixes);

/// Regular files below `directory` matching `suffixes`, relative and sorted.
/// A missing directory yields an empty list.
[[nodiscard]] std::vector<std::filesystem::path> comparable_files(const std::filesystem::path& directory,
                                                                  const std::vector<std::string>& suffixes);

/**
 * \brief Compares a finished case's artifacts against a reference tree.
 *
 * The reference for case `id` lives in `<reference_root>/<id>`. Every
 * comparable artifact the run produced is paired with the same relative
 * path there. Artifacts present on only one side and unreadable artifacts
 * become issues, which make the case an error. Failures are logged as soon
 * as the case is compared.
 */
class LiveComparator {
public:
    LiveComparator(RunContext& context,
                   const ArtifactComparator& comparator,
                   std::filesystem::path reference_root,
                   std::vector<std::string> suffixes = {".fits"});

    [[nodiscard]] CaseResult compare(ExecutionOutcome outcome) const;

    [[nodiscard]] const std::filesystem::path& reference_root() const noexcept { return reference_root_; }

private:
    RunContext& context_;
    const ArtifactComparator& comparator_;
    std::filesystem::path reference_root_;
    std::vector<std::string> suffixes_;
};

}  // namespace calregress
