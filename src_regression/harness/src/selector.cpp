#include "calregress/selector.hpp"

#include <cctype>
#include <cstdlib>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

std::string trim_copy(std::string_view input) {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return std::string{input.substr(begin, end - begin + 1)};
}

std::string to_lower_copy(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (unsigned char ch : input) {
        result.push_back(static_cast<char>(std::tolower(ch)));
    }
    return result;
}

std::string to_upper_copy(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (unsigned char ch : input) {
        result.push_back(static_cast<char>(std::toupper(ch)));
    }
    return result;
}

std::optional<bool> parse_logical(std::string_view raw) {
    const auto lowered = to_lower_copy(trim_copy(raw));
    if (lowered == "t" || lowered == "true") {
        return true;
    }
    if (lowered == "f" || lowered == "false") {
        return false;
    }
    return std::nullopt;
}

std::optional<double> parse_number(std::string_view raw) {
    const auto text = trim_copy(raw);
    if (text.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return value;
}

calregress::ClauseOp parse_op(const std::string& token) {
    const auto lowered = to_lower_copy(token);
    if (lowered == "and") {
        return calregress::ClauseOp::And;
    }
    if (lowered == "or") {
        return calregress::ClauseOp::Or;
    }
    throw std::invalid_argument("Expected 'and' or 'or' but found '" + token + "'");
}

}  // namespace

namespace calregress {

bool value_matches(const FieldValue& field, std::string_view expected) {
    if (const auto* flag = std::get_if<bool>(&field)) {
        const auto wanted = parse_logical(expected);
        return wanted && *wanted == *flag;
    }
    if (const auto* number = std::get_if<double>(&field)) {
        const auto wanted = parse_number(expected);
        return wanted && *wanted == *number;
    }
    return to_lower_copy(trim_copy(std::get<std::string>(field))) == to_lower_copy(trim_copy(expected));
}

Selector& Selector::and_where(std::string keyword, std::string value) {
    clauses_.push_back(SelectorClause{ClauseOp::And, to_upper_copy(keyword), std::move(value)});
    return *this;
}

Selector& Selector::or_where(std::string keyword, std::string value) {
    clauses_.push_back(SelectorClause{ClauseOp::Or, to_upper_copy(keyword), std::move(value)});
    return *this;
}

bool Selector::matches(const FieldMap& header) const {
    bool result = true;
    for (std::size_t i = 0; i < clauses_.size(); ++i) {
        const auto& clause = clauses_[i];
        const auto it = header.find(clause.keyword);
        const bool hit = it != header.end() && value_matches(it->second, clause.value);
        if (i == 0) {
            result = hit;
        } else if (clause.op == ClauseOp::And) {
            result = result && hit;
        } else {
            result = result || hit;
        }
    }
    return result;
}

std::string Selector::describe() const {
    std::ostringstream oss;
    for (std::size_t i = 0; i < clauses_.size(); ++i) {
        if (i > 0) {
            oss << (clauses_[i].op == ClauseOp::And ? " and " : " or ");
        }
        oss << clauses_[i].keyword << '=' << clauses_[i].value;
    }
    return oss.str();
}

Selector Selector::parse(std::string_view expression) {
    std::istringstream tokens{std::string{expression}};
    std::string token;
    Selector selector;
    ClauseOp pending = ClauseOp::And;
    bool expect_clause = true;

    while (tokens >> token) {
        if (!expect_clause) {
            pending = parse_op(token);
            expect_clause = true;
            continue;
        }
        const auto eq = token.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw std::invalid_argument("Expected KEY=VALUE but found '" + token + "'");
        }
        auto keyword = token.substr(0, eq);
        auto value = token.substr(eq + 1);
        if (pending == ClauseOp::And) {
            selector.and_where(std::move(keyword), std::move(value));
        } else {
            selector.or_where(std::move(keyword), std::move(value));
        }
        expect_clause = false;
    }
    if (expect_clause && !selector.empty()) {
        throw std::invalid_argument("Selector ends with a dangling operator");
    }
    return selector;
}

Selector Selector::from_arguments(const std::vector<std::string>& args) {
    if (args.size() < 2 || (args.size() - 2) % 3 != 0) {
        throw std::invalid_argument("Expected KEYWORD VALUE [and|or KEYWORD VALUE]...");
    }
    Selector selector;
    selector.and_where(args[0], args[1]);
    for (std::size_t i = 2; i < args.size(); i += 3) {
        if (parse_op(args[i]) == ClauseOp::And) {
            selector.and_where(args[i + 1], args[i + 2]);
        } else {
            selector.or_where(args[i + 1], args[i + 2]);
        }
    }
    return selector;
}

}  // namespace calregress
