#pragma once

#include "artifact.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace calregress {

/**
 * \brief Reads FITS files into the generic Artifact model.
 *
 * Supported HDU types: primary array, IMAGE, BINTABLE and TABLE extensions.
 * Unknown extension types become metadata-only units so that they still take
 * part in header comparison.
 *
 * Header handling:
 *   - 80-column cards in 2880-byte blocks, terminated by `END`.
 *   - String values honour the `''` escape and drop trailing blanks; long
 *     strings continued with `CONTINUE` are joined.
 *   - `COMMENT` and `HISTORY` cards are joined per keyword with newlines.
 *   - Blank-keyword cards are ignored.
 *
 * Data is decoded from big-endian storage and scaled with BSCALE/BZERO
 * (images) or TSCALn/TZEROn (table columns).
 */
class FitsReader {
public:
    static constexpr std::size_t kBlockSize = 2880;
    static constexpr std::size_t kCardSize = 80;

    [[nodiscard]] Artifact read(const std::filesystem::path& path) const;

    /// Parses only the primary header; data is not touched.
    [[nodiscard]] FieldMap read_primary_header(const std::filesystem::path& path) const;

    /// True when the buffer starts with the mandatory primary `SIMPLE` card.
    [[nodiscard]] static bool looks_like_fits(std::string_view head) noexcept;
};

}  // namespace calregress
