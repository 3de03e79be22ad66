#pragma once

#include "artifact.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace calregress {

enum class ClauseOp { And, Or };

struct SelectorClause {
    ClauseOp op{ClauseOp::And};  ///< ignored for the first clause
    std::string keyword;
    std::string value;
};

/**
 * \brief Header-metadata predicate used to select test inputs.
 *
 * Clauses are evaluated left to right: `a or b and c` means `(a or b) and c`.
 * An empty selector matches everything; a missing keyword never matches.
 *
 * Textual form accepted by parse(): whitespace separated tokens
 * `KEY=VALUE [and|or KEY=VALUE]...`, operators case-insensitive.
 */
class Selector {
public:
    Selector() = default;

    Selector& and_where(std::string keyword, std::string value);
    Selector& or_where(std::string keyword, std::string value);

    [[nodiscard]] bool matches(const FieldMap& header) const;
    [[nodiscard]] bool empty() const noexcept { return clauses_.empty(); }
    [[nodiscard]] const std::vector<SelectorClause>& clauses() const noexcept { return clauses_; }
    [[nodiscard]] std::string describe() const;

    /// Throws std::invalid_argument on malformed input.
    [[nodiscard]] static Selector parse(std::string_view expression);

    /// Builds a selector from `KEY VALUE [op KEY VALUE]...` argument triples.
    [[nodiscard]] static Selector from_arguments(const std::vector<std::string>& args);

private:
    std::vector<SelectorClause> clauses_;
};

/**
 * \brief Compares a header value against a user-supplied textual value.
 *
 * `t`/`true`/`f`/`false` (any case) match logical fields, numbers compare
 * numerically, strings compare case-insensitively after trimming.
 */
[[nodiscard]] bool value_matches(const FieldValue& field, std::string_view expected);

}  // namespace calregress
