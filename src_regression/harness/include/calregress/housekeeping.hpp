#pragma once

#include "artifact.hpp"
#include "run_context.hpp"
#include "selector.hpp"
#include "test_case.hpp"

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace calregress {

/// One or more files could not be removed or moved. Raised after the whole walk.
class HousekeepingError : public std::runtime_error {
public:
    using Failure = std::pair<std::filesystem::path, std::string>;

    explicit HousekeepingError(std::vector<Failure> failures);

    [[nodiscard]] const std::vector<Failure>& failures() const noexcept { return failures_; }

private:
    std::vector<Failure> failures_;
};

/**
 * \brief Deletes every regular file under `root` that `keep` rejects.
 *
 * Directories are left in place. Returns the number of files removed.
 */
std::size_t clean_tree(const std::filesystem::path& root, const PrimaryInputPredicate& keep);

/**
 * \brief Moves every regular file under `source` that `keep` rejects into
 * `destination/results`, preserving the relative layout.
 *
 * Returns the number of files moved.
 */
std::size_t move_tree(const std::filesystem::path& source,
                      const std::filesystem::path& destination,
                      const PrimaryInputPredicate& keep);

/**
 * \brief Primary inputs under `root` whose primary header matches `selector`.
 *
 * Unreadable inputs are reported through `log` and skipped. The result is
 * sorted and free of duplicates.
 */
[[nodiscard]] std::vector<std::filesystem::path> find_inputs(const std::filesystem::path& root,
                                                             const PrimaryInputPredicate& is_primary,
                                                             const Selector& selector,
                                                             ConsoleLog& log);

}  // namespace calregress
