#include "calregress/comparator.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>
#include <string>
#include <utility>

namespace {

using calregress::ArtifactUnit;
using calregress::DataArray;
using calregress::DataDiff;
using calregress::Tolerance;

std::string to_upper_copy(const std::string& input) {
    std::string result;
    result.reserve(input.size());
    for (unsigned char ch : input) {
        result.push_back(static_cast<char>(std::toupper(ch)));
    }
    return result;
}

std::string shape_to_string(const std::vector<std::size_t>& shape) {
    std::ostringstream oss;
    oss << '[';
    for (std::size_t i = 0; i < shape.size(); ++i) {
        oss << (i ? "," : "") << shape[i];
    }
    oss << ']';
    return oss.str();
}

/// Returns a description of the first structural disagreement, or an empty string.
std::string find_shape_mismatch(const ArtifactUnit& reference, const ArtifactUnit& candidate) {
    if (reference.kind != candidate.kind) {
        return std::string{"unit kind "} + to_string(reference.kind) + " vs " + to_string(candidate.kind);
    }
    if (reference.arrays.size() != candidate.arrays.size()) {
        return "array count " + std::to_string(reference.arrays.size()) + " vs " +
               std::to_string(candidate.arrays.size());
    }
    for (std::size_t i = 0; i < reference.arrays.size(); ++i) {
        const auto& a = reference.arrays[i];
        const auto& b = candidate.arrays[i];
        if (a.name != b.name) {
            return "array " + std::to_string(i + 1) + " named '" + a.name + "' vs '" + b.name + "'";
        }
        if (a.is_text != b.is_text) {
            return "array '" + a.name + "' text vs numeric";
        }
        if (a.shape != b.shape || a.size() != b.size()) {
            return "array '" + a.name + "' shape " + shape_to_string(a.shape) + " vs " +
                   shape_to_string(b.shape);
        }
    }
    return {};
}

/// Element-wise comparison of two arrays of identical shape. Returns true if any element differs.
bool compare_elements(const DataArray& reference,
                      const DataArray& candidate,
                      const Tolerance& tolerance,
                      DataDiff& diff) {
    bool differs = false;
    if (reference.is_text) {
        for (std::size_t i = 0; i < reference.strings.size(); ++i) {
            ++diff.compared_elements;
            if (reference.strings[i] != candidate.strings[i]) {
                ++diff.differing_elements;
                differs = true;
            }
        }
        return differs;
    }

    for (std::size_t i = 0; i < reference.numbers.size(); ++i) {
        const double a = reference.numbers[i];
        const double b = candidate.numbers[i];
        ++diff.compared_elements;

        const bool a_nan = std::isnan(a);
        const bool b_nan = std::isnan(b);
        if (a_nan || b_nan) {
            if (!(a_nan && b_nan)) {
                ++diff.differing_elements;
                differs = true;
            }
            continue;
        }
        if (a == b) {
            continue;
        }

        const double absolute = std::fabs(a - b);
        const double relative =
            b != 0.0 ? absolute / std::fabs(b) : std::numeric_limits<double>::infinity();
        diff.max_absolute = std::max(diff.max_absolute, absolute);
        diff.max_relative = std::max(diff.max_relative, relative);

        if (absolute <= tolerance.absolute + tolerance.relative * std::fabs(b)) {
            ++diff.tolerated_elements;
        } else {
            ++diff.differing_elements;
            differs = true;
        }
    }
    return differs;
}

}  // namespace

namespace calregress {

const char* to_string(ChangeKind kind) noexcept {
    switch (kind) {
        case ChangeKind::Added: return "added";
        case ChangeKind::Removed: return "removed";
        case ChangeKind::Changed: return "changed";
    }
    return "changed";
}

const char* to_string(UnitPresence presence) noexcept {
    switch (presence) {
        case UnitPresence::Both: return "both";
        case UnitPresence::ReferenceOnly: return "reference-only";
        case UnitPresence::CandidateOnly: return "candidate-only";
    }
    return "both";
}

const char* to_string(DiffVerdict verdict) noexcept {
    switch (verdict) {
        case DiffVerdict::Identical: return "identical";
        case DiffVerdict::Differing: return "differing";
        case DiffVerdict::StructurallyIncompatible: return "structurally-incompatible";
    }
    return "differing";
}

ArtifactComparator::ArtifactComparator(CompareOptions options)
    : source_{&default_source_}, options_{std::move(options)} {
    std::set<std::string> normalised;
    for (const auto& key : options_.ignore_keywords) {
        normalised.insert(to_upper_copy(key));
    }
    options_.ignore_keywords = std::move(normalised);
}

ArtifactComparator::ArtifactComparator(const ArtifactSource& source, CompareOptions options)
    : ArtifactComparator(std::move(options)) {
    source_ = &source;
}

ArtifactDiff ArtifactComparator::compare(const std::filesystem::path& reference,
                                         const std::filesystem::path& candidate) const {
    const auto ref = source_->open(reference);
    const auto cand = source_->open(candidate);
    auto diff = compare(ref, cand);
    diff.reference = reference;
    diff.candidate = candidate;
    return diff;
}

ArtifactDiff ArtifactComparator::compare(const Artifact& reference, const Artifact& candidate) const {
    ArtifactDiff diff;
    diff.reference = reference.path;
    diff.candidate = candidate.path;

    if (reference.kind != candidate.kind) {
        diff.verdict = DiffVerdict::StructurallyIncompatible;
        diff.detail = std::string{"artifact kind "} + to_string(reference.kind) + " vs " +
                      to_string(candidate.kind);
        return diff;
    }

    for (const auto& unit : reference.units) {
        const auto* other = candidate.find(unit.id);
        if (other == nullptr) {
            diff.units.push_back(UnitDiff{unit.id, UnitPresence::ReferenceOnly, {}, std::nullopt});
            continue;
        }
        ++diff.units_compared;
        UnitDiff unit_diff;
        unit_diff.unit_id = unit.id;
        unit_diff.metadata = compare_metadata(unit.metadata, other->metadata);
        unit_diff.data = compare_data(unit, *other);
        if (!unit_diff.empty()) {
            diff.units.emplace_back(std::move(unit_diff));
        }
    }
    for (const auto& unit : candidate.units) {
        if (reference.find(unit.id) == nullptr) {
            diff.units.push_back(UnitDiff{unit.id, UnitPresence::CandidateOnly, {}, std::nullopt});
        }
    }

    diff.verdict = diff.units.empty() ? DiffVerdict::Identical : DiffVerdict::Differing;
    return diff;
}

std::vector<FieldChange> ArtifactComparator::compare_metadata(const FieldMap& reference,
                                                              const FieldMap& candidate) const {
    std::vector<FieldChange> changes;
    const auto ignored = [this](const std::string& key) {
        return options_.ignore_keywords.count(to_upper_copy(key)) > 0;
    };

    auto ref_it = reference.begin();
    auto cand_it = candidate.begin();
    while (ref_it != reference.end() || cand_it != candidate.end()) {
        if (cand_it == candidate.end() || (ref_it != reference.end() && ref_it->first < cand_it->first)) {
            if (!ignored(ref_it->first)) {
                changes.push_back(FieldChange{ref_it->first, ChangeKind::Removed, ref_it->second, std::nullopt});
            }
            ++ref_it;
        } else if (ref_it == reference.end() || cand_it->first < ref_it->first) {
            if (!ignored(cand_it->first)) {
                changes.push_back(FieldChange{cand_it->first, ChangeKind::Added, std::nullopt, cand_it->second});
            }
            ++cand_it;
        } else {
            if (!ignored(ref_it->first) && ref_it->second != cand_it->second) {
                changes.push_back(FieldChange{ref_it->first, ChangeKind::Changed, ref_it->second, cand_it->second});
            }
            ++ref_it;
            ++cand_it;
        }
    }
    return changes;
}

DataDiff ArtifactComparator::compare_data(const ArtifactUnit& reference,
                                          const ArtifactUnit& candidate) const {
    DataDiff diff;
    diff.shape_detail = find_shape_mismatch(reference, candidate);
    if (!diff.shape_detail.empty()) {
        diff.shape_mismatch = true;
        return diff;
    }
    for (std::size_t i = 0; i < reference.arrays.size(); ++i) {
        if (compare_elements(reference.arrays[i], candidate.arrays[i], options_.tolerance, diff)) {
            diff.differing_arrays.push_back(reference.arrays[i].name);
        }
    }
    return diff;
}

}  // namespace calregress
