#include "calregress/test_case.hpp"

#include <cctype>
#include <string>
#include <utility>

namespace {

std::string normalise_key(const std::string& input) {
    std::string result;
    for (unsigned char ch : input) {
        if (!std::isspace(ch)) {
            result.push_back(static_cast<char>(std::toupper(ch)));
        }
    }
    return result;
}

}  // namespace

namespace calregress {

PrimaryInputPredicate suffix_predicate(std::string suffix) {
    return [suffix = std::move(suffix)](const std::filesystem::path& path) {
        const auto name = path.filename().string();
        return name.size() >= suffix.size() &&
               name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
}

std::optional<std::vector<std::string>> CommandTable::resolve(const FieldMap& header,
                                                              const std::filesystem::path& input) const {
    const auto field = header.find(normalise_key(keyword));
    if (field == header.end()) {
        return std::nullopt;
    }
    const auto* value = std::get_if<std::string>(&field->second);
    if (value == nullptr) {
        return std::nullopt;
    }

    const auto wanted = normalise_key(*value);
    std::optional<std::string> executable;
    for (const auto& [key, exe] : executables) {
        if (normalise_key(key) == wanted) {
            executable = exe;
            break;
        }
    }
    if (!executable) {
        return std::nullopt;
    }
    if (override_executable) {
        executable = *override_executable;
    }

    std::vector<std::string> command;
    command.reserve(arguments.size() + 2);
    command.push_back((exec_dir.empty() ? std::filesystem::path{*executable} : exec_dir / *executable).string());
    command.insert(command.end(), arguments.begin(), arguments.end());
    command.push_back(input.string());
    return command;
}

CommandTable CommandTable::defaults() {
    CommandTable table;
    table.executables = {
        {"ACS", "calacs.e"},
        {"STIS", "calstis.e"},
        {"WFC3", "calwf3.e"},
    };
    return table;
}

}  // namespace calregress
