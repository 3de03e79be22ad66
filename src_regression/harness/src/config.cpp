#include "calregress/config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

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

std::vector<std::string> split(std::string_view input, char delimiter) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= input.size()) {
        const auto end = input.find(delimiter, start);
        const auto piece = trim_copy(input.substr(start, end == std::string_view::npos ? end : end - start));
        if (!piece.empty()) {
            parts.push_back(piece);
        }
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }
    return parts;
}

std::vector<std::string> split_whitespace(std::string_view input) {
    std::vector<std::string> parts;
    std::size_t pos = 0;
    while (true) {
        const auto begin = input.find_first_not_of(kWhitespace, pos);
        if (begin == std::string_view::npos) {
            break;
        }
        const auto end = input.find_first_of(kWhitespace, begin);
        parts.emplace_back(input.substr(begin, end == std::string_view::npos ? end : end - begin));
        if (end == std::string_view::npos) {
            break;
        }
        pos = end;
    }
    return parts;
}

long long parse_integer(const std::string& key, const std::string& raw, const std::string& where) {
    long long value = 0;
    const auto* first = raw.data();
    const auto* last = raw.data() + raw.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        throw calregress::ConfigError("Invalid integer '" + raw + "' for " + key + " at " + where);
    }
    return value;
}

std::size_t parse_count(const std::string& key, const std::string& raw, const std::string& where) {
    const auto value = parse_integer(key, raw, where);
    return value <= 0 ? 0 : static_cast<std::size_t>(value);
}

std::chrono::seconds parse_seconds(const std::string& key, const std::string& raw, const std::string& where) {
    const auto value = parse_integer(key, raw, where);
    if (value < 0) {
        throw calregress::ConfigError("Negative value '" + raw + "' for " + key + " at " + where);
    }
    return std::chrono::seconds{value};
}

double parse_tolerance(const std::string& key, const std::string& raw, const std::string& where) {
    try {
        std::size_t used = 0;
        const double value = std::stod(raw, &used);
        if (used == raw.size() && value >= 0.0) {
            return value;
        }
    } catch (const std::logic_error&) {
        // reported below
    }
    throw calregress::ConfigError("Invalid tolerance '" + raw + "' for " + key + " at " + where);
}

bool parse_boolean(const std::string& key, const std::string& raw, const std::string& where) {
    const auto lowered = to_lower_copy(raw);
    if (lowered == "true" || lowered == "yes" || lowered == "1") {
        return true;
    }
    if (lowered == "false" || lowered == "no" || lowered == "0") {
        return false;
    }
    throw calregress::ConfigError("Invalid boolean value '" + raw + "' for " + key + " at " + where);
}

}  // namespace

namespace calregress {

std::size_t HarnessConfig::effective_threads() const noexcept {
    if (threads > 0) {
        return threads;
    }
    return std::max(1u, std::thread::hardware_concurrency());
}

DiscoveryOptions HarnessConfig::discovery_options() const {
    DiscoveryOptions options;
    options.is_primary = suffix_predicate(primary_suffix);
    options.commands = commands;
    options.max_depth = max_depth;

    if (cte_only) {
        options.commands.executables.clear();
        for (const auto& instrument : cte_instruments) {
            options.commands.executables[instrument] = cte_executable;
        }
        options.commands.override_executable = cte_executable;
        options.selector.and_where(cte_keyword, cte_value);
    }
    for (const auto& clause : select.clauses()) {
        if (clause.op == ClauseOp::And || options.selector.empty()) {
            options.selector.and_where(clause.keyword, clause.value);
        } else {
            options.selector.or_where(clause.keyword, clause.value);
        }
    }
    return options;
}

DispatchOptions HarnessConfig::dispatch_options() const {
    DispatchOptions options;
    options.concurrency = effective_threads();
    options.timeout = timeout;
    options.grace = grace;
    options.probe_versions = probe_versions;
    return options;
}

HarnessConfig ConfigLoader::load(const std::filesystem::path& file) const {
    HarnessConfig config;
    apply_file(config, file);
    return config;
}

void ConfigLoader::apply_file(HarnessConfig& config, const std::filesystem::path& file) const {
    if (!std::filesystem::exists(file)) {
        throw ConfigError("Config file does not exist: " + file.string());
    }
    if (!std::filesystem::is_regular_file(file)) {
        throw ConfigError("Config path is not a regular file: " + file.string());
    }

    std::ifstream input(file);
    if (!input.is_open()) {
        throw ConfigError("Unable to open config file: " + file.string());
    }

    std::string raw_line;
    std::size_t line_no = 0;
    while (std::getline(input, raw_line)) {
        ++line_no;

        const auto trimmed = trim_copy(raw_line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }

        const auto where = file.string() + ":" + std::to_string(line_no);
        const auto delimiter = trimmed.find('=');
        if (delimiter == std::string::npos) {
            throw ConfigError("Expected 'key=value' entry at " + where);
        }

        const auto key = trim_copy(std::string_view{trimmed}.substr(0, delimiter));
        const auto value = trim_copy(std::string_view{trimmed}.substr(delimiter + 1));
        if (key.empty()) {
            throw ConfigError("Empty key at " + where);
        }
        apply(config, key, value, where);
    }
}

void ConfigLoader::apply(HarnessConfig& config, const std::string& key, const std::string& value,
                         const std::string& where) const {
    if (key == "threads") {
        config.threads = parse_count(key, value, where);
    } else if (key == "timeout") {
        config.timeout = parse_seconds(key, value, where);
    } else if (key == "grace") {
        config.grace = parse_seconds(key, value, where);
    } else if (key == "max_depth") {
        config.max_depth = parse_count(key, value, where);
    } else if (key == "primary_suffix") {
        if (value.empty()) {
            throw ConfigError("Empty primary_suffix at " + where);
        }
        config.primary_suffix = value;
    } else if (key == "command.keyword") {
        config.commands.keyword = to_upper_copy(value);
    } else if (key == "command.args") {
        config.commands.arguments = split_whitespace(value);
    } else if (key.rfind("command.map.", 0) == 0) {
        const auto mapped = to_upper_copy(key.substr(12));
        if (mapped.empty()) {
            throw ConfigError("Empty command.map value name at " + where);
        }
        if (value.empty()) {
            config.commands.executables.erase(mapped);
        } else {
            config.commands.executables[mapped] = value;
        }
    } else if (key == "cte.keyword") {
        config.cte_keyword = to_upper_copy(value);
    } else if (key == "cte.value") {
        config.cte_value = value;
    } else if (key == "cte.executable") {
        config.cte_executable = value;
    } else if (key == "cte.instruments") {
        config.cte_instruments = split(to_upper_copy(value), ',');
    } else if (key == "select") {
        try {
            config.select = Selector::parse(value);
        } catch (const std::invalid_argument& ex) {
            throw ConfigError(std::string{ex.what()} + " at " + where);
        }
    } else if (key == "compare.atol") {
        config.compare.tolerance.absolute = parse_tolerance(key, value, where);
    } else if (key == "compare.rtol") {
        config.compare.tolerance.relative = parse_tolerance(key, value, where);
    } else if (key == "compare.ignore_keywords") {
        const auto keywords = split(to_upper_copy(value), ',');
        config.compare.ignore_keywords = std::set<std::string>(keywords.begin(), keywords.end());
    } else if (key == "compare.suffixes") {
        config.suffixes = split(value, ',');
        if (config.suffixes.empty()) {
            throw ConfigError("compare.suffixes needs at least one suffix at " + where);
        }
    } else if (key == "probe_versions") {
        config.probe_versions = parse_boolean(key, value, where);
    } else {
        throw ConfigError("Unknown key '" + key + "' at " + where);
    }
}

}  // namespace calregress
