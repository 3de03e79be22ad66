#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace calregress {

/**
 * \brief Tagged header value: string, number or boolean.
 *
 * Integers and floats from a header are both held as double. Values of a
 * different alternative never compare equal.
 */
using FieldValue = std::variant<std::string, double, bool>;

std::string to_string(const FieldValue& value);

/// Ordered header metadata of one structural unit.
using FieldMap = std::map<std::string, FieldValue>;

/**
 * \brief One typed array of a structural unit (an image, or one table column).
 *
 * Exactly one of `numbers` / `strings` is populated, depending on `is_text`.
 * `shape` lists the dimensions; the element count is their product.
 */
struct DataArray {
    std::string name;
    std::vector<std::size_t> shape;
    bool is_text{false};
    std::vector<double> numbers;
    std::vector<std::string> strings;

    [[nodiscard]] std::size_t size() const noexcept {
        return is_text ? strings.size() : numbers.size();
    }
};

enum class UnitKind { Image, BinaryTable, AsciiTable, Text, Other };

const char* to_string(UnitKind kind) noexcept;

/**
 * \brief Named subdivision of an artifact (e.g. one FITS HDU).
 */
struct ArtifactUnit {
    std::string id;
    UnitKind kind{UnitKind::Other};
    FieldMap metadata;
    std::vector<DataArray> arrays;
};

enum class ArtifactKind { Fits, Text };

const char* to_string(ArtifactKind kind) noexcept;

struct Artifact {
    std::filesystem::path path;
    ArtifactKind kind{ArtifactKind::Text};
    std::vector<ArtifactUnit> units;

    /// Unit with the given identifier, or nullptr.
    [[nodiscard]] const ArtifactUnit* find(const std::string& id) const;
};

/**
 * \brief Thrown when a path cannot be opened or parsed as any artifact kind.
 */
class UnreadableArtifact : public std::runtime_error {
public:
    UnreadableArtifact(const std::filesystem::path& path, const std::string& reason);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * \brief Artifact access collaborator used by the comparator and the selector.
 */
class ArtifactSource {
public:
    virtual ~ArtifactSource() = default;

    /// Reads the whole artifact. Throws UnreadableArtifact.
    [[nodiscard]] virtual Artifact open(const std::filesystem::path& path) const = 0;

    /// Reads only the first unit's metadata (cheap header probe for selection).
    [[nodiscard]] virtual FieldMap primary_header(const std::filesystem::path& path) const;
};

/**
 * \brief Opens artifacts from disk, sniffing the kind from the file content.
 *
 * Files starting with the FITS `SIMPLE  =` card are read as FITS, anything
 * else readable is read as text.
 */
class FileArtifactSource final : public ArtifactSource {
public:
    [[nodiscard]] Artifact open(const std::filesystem::path& path) const override;
    [[nodiscard]] FieldMap primary_header(const std::filesystem::path& path) const override;

    [[nodiscard]] static ArtifactKind sniff(const std::filesystem::path& path);
};

}  // namespace calregress
