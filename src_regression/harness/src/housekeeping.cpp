#include "calregress/housekeeping.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {

std::string describe(const std::vector<calregress::HousekeepingError::Failure>& failures) {
    std::string text = std::to_string(failures.size()) + " file operation(s) failed";
    if (!failures.empty()) {
        text += ", first: " + failures.front().first.string() + ": " + failures.front().second;
    }
    return text;
}

[[noreturn]] void fail(const fs::path& path, const std::string& reason) {
    std::vector<calregress::HousekeepingError::Failure> failures;
    failures.emplace_back(path, reason);
    throw calregress::HousekeepingError(std::move(failures));
}

/// Regular files under `root` rejected by `keep`, collected before anything is touched.
std::vector<fs::path> rejected_files(const fs::path& root, const calregress::PrimaryInputPredicate& keep) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        fail(root, "not a directory");
    }
    std::vector<fs::path> files;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator{}; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && !keep(it->path())) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        fail(root, ec.message());
    }
    std::sort(files.begin(), files.end());
    return files;
}

}  // namespace

namespace calregress {

HousekeepingError::HousekeepingError(std::vector<Failure> failures)
    : std::runtime_error(describe(failures)), failures_{std::move(failures)} {}

std::size_t clean_tree(const fs::path& root, const PrimaryInputPredicate& keep) {
    std::vector<HousekeepingError::Failure> failures;
    std::size_t removed = 0;
    for (const auto& file : rejected_files(root, keep)) {
        std::error_code ec;
        if (fs::remove(file, ec)) {
            ++removed;
        } else if (ec) {
            failures.emplace_back(file, ec.message());
        }
    }
    if (!failures.empty()) {
        throw HousekeepingError(std::move(failures));
    }
    return removed;
}

std::size_t move_tree(const fs::path& source, const fs::path& destination, const PrimaryInputPredicate& keep) {
    const fs::path results = destination / "results";
    std::vector<HousekeepingError::Failure> failures;
    std::size_t moved = 0;
    for (const auto& file : rejected_files(source, keep)) {
        const auto target = results / file.lexically_relative(source);
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            failures.emplace_back(target.parent_path(), ec.message());
            continue;
        }
        fs::rename(file, target, ec);
        if (ec) {
            // Across file systems rename fails; copy, then remove the original.
            ec.clear();
            fs::copy_file(file, target, fs::copy_options::overwrite_existing, ec);
            if (!ec) {
                fs::remove(file, ec);
            }
        }
        if (ec) {
            failures.emplace_back(file, ec.message());
            continue;
        }
        ++moved;
    }
    if (!failures.empty()) {
        throw HousekeepingError(std::move(failures));
    }
    return moved;
}

std::vector<fs::path> find_inputs(const fs::path& root,
                                  const PrimaryInputPredicate& is_primary,
                                  const Selector& selector,
                                  ConsoleLog& log) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        fail(root, "not a directory");
    }

    const FileArtifactSource source{};
    std::vector<fs::path> found;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator{}; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || !is_primary(it->path())) {
            continue;
        }
        try {
            if (selector.matches(source.primary_header(it->path()))) {
                found.push_back(it->path());
            }
        } catch (const UnreadableArtifact& ex) {
            log.warn("Skipping unreadable input: " + std::string{ex.what()});
        }
    }
    if (ec) {
        log.warn("Search of " + root.string() + " incomplete: " + ec.message());
    }
    std::sort(found.begin(), found.end());
    found.erase(std::unique(found.begin(), found.end()), found.end());
    return found;
}

}  // namespace calregress
