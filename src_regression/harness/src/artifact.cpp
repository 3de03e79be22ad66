#include "calregress/artifact.hpp"
#include "calregress/fits_reader.hpp"
#include "calregress/text_reader.hpp"

#include <array>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>

namespace calregress {

std::string to_string(const FieldValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) {
        return *s;
    }
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? "T" : "F";
    }
    std::ostringstream oss;
    oss << std::setprecision(17) << std::get<double>(value);
    return oss.str();
}

const char* to_string(UnitKind kind) noexcept {
    switch (kind) {
        case UnitKind::Image: return "image";
        case UnitKind::BinaryTable: return "bintable";
        case UnitKind::AsciiTable: return "table";
        case UnitKind::Text: return "text";
        case UnitKind::Other: return "other";
    }
    return "other";
}

const char* to_string(ArtifactKind kind) noexcept {
    switch (kind) {
        case ArtifactKind::Fits: return "fits";
        case ArtifactKind::Text: return "text";
    }
    return "text";
}

const ArtifactUnit* Artifact::find(const std::string& id) const {
    for (const auto& unit : units) {
        if (unit.id == id) {
            return &unit;
        }
    }
    return nullptr;
}

UnreadableArtifact::UnreadableArtifact(const std::filesystem::path& path, const std::string& reason)
    : std::runtime_error("Unreadable artifact " + path.string() + ": " + reason), path_{path} {}

FieldMap ArtifactSource::primary_header(const std::filesystem::path& path) const {
    auto artifact = open(path);
    if (artifact.units.empty()) {
        return {};
    }
    return std::move(artifact.units.front().metadata);
}

ArtifactKind FileArtifactSource::sniff(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw UnreadableArtifact(path, "not a regular file");
    }
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw UnreadableArtifact(path, "cannot open for reading");
    }
    std::array<char, FitsReader::kCardSize> head{};
    input.read(head.data(), static_cast<std::streamsize>(head.size()));
    const auto got = static_cast<std::size_t>(input.gcount());
    return FitsReader::looks_like_fits(std::string_view{head.data(), got}) ? ArtifactKind::Fits
                                                                           : ArtifactKind::Text;
}

Artifact FileArtifactSource::open(const std::filesystem::path& path) const {
    switch (sniff(path)) {
        case ArtifactKind::Fits: return FitsReader{}.read(path);
        case ArtifactKind::Text: return TextReader{}.read(path);
    }
    throw UnreadableArtifact(path, "unknown artifact kind");
}

FieldMap FileArtifactSource::primary_header(const std::filesystem::path& path) const {
    if (sniff(path) == ArtifactKind::Fits) {
        return FitsReader{}.read_primary_header(path);
    }
    return {};
}

}  // namespace calregress
