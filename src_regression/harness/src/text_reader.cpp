#include "calregress/text_reader.hpp"

#include <fstream>
#include <string>
#include <utility>

namespace calregress {

Artifact TextReader::read(const std::filesystem::path& path) const {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw UnreadableArtifact(path, "cannot open for reading");
    }

    DataArray lines;
    lines.name = "lines";
    lines.is_text = true;

    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.strings.emplace_back(std::move(line));
    }
    if (input.bad()) {
        throw UnreadableArtifact(path, "read error");
    }
    lines.shape = {lines.strings.size()};

    ArtifactUnit unit;
    unit.id = "TEXT";
    unit.kind = UnitKind::Text;
    unit.arrays.emplace_back(std::move(lines));

    Artifact artifact;
    artifact.path = path;
    artifact.kind = ArtifactKind::Text;
    artifact.units.emplace_back(std::move(unit));
    return artifact;
}

}  // namespace calregress
