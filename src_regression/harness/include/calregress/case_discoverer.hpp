#pragma once

#include "artifact.hpp"
#include "run_context.hpp"
#include "selector.hpp"
#include "test_case.hpp"

#include <cstddef>
#include <filesystem>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <vector>

namespace calregress {

/// The discovery root does not exist or is not a directory.
class DiscoveryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct DiscoveryOptions {
    PrimaryInputPredicate is_primary{suffix_predicate("raw.fits")};
    CommandTable commands{CommandTable::defaults()};
    Selector selector{};
    /// Directories deeper than this below the root are not entered.
    std::size_t max_depth{32};
    /// Header access for selection; nullptr means read files from disk.
    const ArtifactSource* source{nullptr};
};

/**
 * \brief Lazy, restartable walk of a test-data tree yielding TestCases.
 *
 * Every primary input accepted by `is_primary`, matching `selector` and
 * resolving to a command yields one TestCase. Directory entries are visited
 * in sorted order, so discovery order is stable between walks. Each begin()
 * starts a fresh walk; nothing is cached.
 *
 * Unreadable directories and unreadable primary inputs are reported through
 * the log and skipped.
 *
 * Usage:
 *   CaseDiscoverer discoverer(root, options, context.log());
 *   for (const TestCase& test : discoverer) { ... }
 */
class CaseDiscoverer {
public:
    /// Throws DiscoveryError when `root` is not an existing directory.
    CaseDiscoverer(std::filesystem::path root, DiscoveryOptions options, ConsoleLog& log);

    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = TestCase;
        using difference_type = std::ptrdiff_t;
        using pointer = const TestCase*;
        using reference = const TestCase&;

        reference operator*() const;
        pointer operator->() const;
        Iterator& operator++();
        bool operator==(const Iterator& other) const;
        bool operator!=(const Iterator& other) const { return !(*this == other); }

        ~Iterator();
        Iterator(const Iterator&) = delete;
        Iterator& operator=(const Iterator&) = delete;
        Iterator(Iterator&&) noexcept;
        Iterator& operator=(Iterator&&) noexcept;

    private:
        friend class CaseDiscoverer;
        class Impl;
        std::unique_ptr<Impl> impl_;
        explicit Iterator(std::unique_ptr<Impl> impl);
    };

    /// Starts a new walk. Throws DiscoveryError if the root has disappeared.
    [[nodiscard]] Iterator begin() const;
    [[nodiscard]] Iterator end() const;

    /// Runs one complete walk.
    [[nodiscard]] std::vector<TestCase> collect() const;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    [[nodiscard]] const DiscoveryOptions& options() const noexcept { return options_; }

private:
    std::filesystem::path root_;
    DiscoveryOptions options_;
    ConsoleLog& log_;
    FileArtifactSource file_source_;
};

}  // namespace calregress
