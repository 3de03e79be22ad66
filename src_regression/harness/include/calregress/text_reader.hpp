#pragma once

#include "artifact.hpp"

#include <filesystem>

namespace calregress {

/// Reads a plain text artifact (trailer, log) as a single `TEXT` unit of lines.
class TextReader {
public:
    [[nodiscard]] Artifact read(const std::filesystem::path& path) const;
};

}  // namespace calregress
