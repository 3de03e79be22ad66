#pragma once

#include "artifact.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace calregress {

/**
 * \brief Numeric tolerance: `|ref - cand| <= absolute + relative * |cand|`.
 *
 * The default (both zero) means exact equality.
 */
struct Tolerance {
    double absolute{0.0};
    double relative{0.0};
};

struct CompareOptions {
    Tolerance tolerance{};
    /// Header keywords excluded from metadata comparison (case-insensitive).
    std::set<std::string> ignore_keywords{};
};

enum class ChangeKind { Added, Removed, Changed };

const char* to_string(ChangeKind kind) noexcept;

/// One metadata difference. `reference` is empty for Added, `candidate` for Removed.
struct FieldChange {
    std::string key;
    ChangeKind kind{ChangeKind::Changed};
    std::optional<FieldValue> reference;
    std::optional<FieldValue> candidate;
};

/**
 * \brief Data-content difference of one unit, aggregated over its arrays.
 *
 * When `shape_mismatch` is set no element was compared and the counters are
 * zero; `shape_detail` names the first disagreement.
 */
struct DataDiff {
    bool shape_mismatch{false};
    std::string shape_detail;
    std::size_t compared_elements{0};
    std::size_t differing_elements{0};
    std::size_t tolerated_elements{0};  ///< differ, but within tolerance
    double max_absolute{0.0};
    double max_relative{0.0};
    std::vector<std::string> differing_arrays;

    [[nodiscard]] bool identical() const noexcept {
        return !shape_mismatch && differing_elements == 0;
    }
};

enum class UnitPresence { Both, ReferenceOnly, CandidateOnly };

const char* to_string(UnitPresence presence) noexcept;

struct UnitDiff {
    std::string unit_id;
    UnitPresence presence{UnitPresence::Both};
    std::vector<FieldChange> metadata;
    std::optional<DataDiff> data;  ///< absent when the unit is on one side only

    [[nodiscard]] bool empty() const noexcept {
        return presence == UnitPresence::Both && metadata.empty() && (!data || data->identical());
    }
};

enum class DiffVerdict { Identical, Differing, StructurallyIncompatible };

const char* to_string(DiffVerdict verdict) noexcept;

/**
 * \brief Structured comparison of one reference artifact against one candidate.
 *
 * `units` only carries non-empty unit diffs; an identical pair has none.
 */
struct ArtifactDiff {
    std::filesystem::path reference;
    std::filesystem::path candidate;
    DiffVerdict verdict{DiffVerdict::Identical};
    std::vector<UnitDiff> units;
    std::size_t units_compared{0};
    std::string detail;

    [[nodiscard]] bool identical() const noexcept { return verdict == DiffVerdict::Identical; }
};

/**
 * \brief Structural comparison of two artifacts.
 *
 * Units are paired by identifier. For shared units the metadata is compared
 * by key union and the data by shape first, then element by element. NaN in
 * the same position on both sides counts as equal. Neither file is modified.
 */
class ArtifactComparator {
public:
    /// Uses a FileArtifactSource.
    explicit ArtifactComparator(CompareOptions options = {});

    /// `source` must outlive the comparator.
    ArtifactComparator(const ArtifactSource& source, CompareOptions options);

    ArtifactComparator(const ArtifactComparator&) = delete;
    ArtifactComparator& operator=(const ArtifactComparator&) = delete;

    /// Throws UnreadableArtifact when either path cannot be opened.
    [[nodiscard]] ArtifactDiff compare(const std::filesystem::path& reference,
                                       const std::filesystem::path& candidate) const;

    /// Compares artifacts that are already in memory.
    [[nodiscard]] ArtifactDiff compare(const Artifact& reference, const Artifact& candidate) const;

    [[nodiscard]] const CompareOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] std::vector<FieldChange> compare_metadata(const FieldMap& reference,
                                                            const FieldMap& candidate) const;
    [[nodiscard]] DataDiff compare_data(const ArtifactUnit& reference,
                                        const ArtifactUnit& candidate) const;

    FileArtifactSource default_source_;
    const ArtifactSource* source_;
    CompareOptions options_;
};

}  // namespace calregress
