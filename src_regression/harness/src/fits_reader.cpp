#include "calregress/fits_reader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

using calregress::DataArray;
using calregress::FieldMap;
using calregress::FieldValue;
using calregress::FitsReader;
using calregress::UnreadableArtifact;

constexpr std::string_view kWhitespace = " \t\n\r\f\v";
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
// Largest integer a header value can carry exactly.
constexpr double kMaxHeaderInteger = 9007199254740992.0;
constexpr std::size_t kMaxAxes = 999;
constexpr std::size_t kMaxFields = 999;
constexpr std::size_t kMaxSize = std::numeric_limits<std::size_t>::max();

std::string rtrim_copy(std::string_view input) {
    const auto end = input.find_last_not_of(kWhitespace);
    if (end == std::string_view::npos) {
        return {};
    }
    return std::string{input.substr(0, end + 1)};
}

std::string trim_copy(std::string_view input) {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return std::string{input.substr(begin, end - begin + 1)};
}

std::string to_upper_copy(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (unsigned char ch : input) {
        result.push_back(static_cast<char>(std::toupper(ch)));
    }
    return result;
}

std::optional<double> parse_number(std::string_view raw) {
    if (raw.empty()) {
        return std::nullopt;
    }
    std::string text{raw};
    // Fortran-style double precision exponents.
    std::replace(text.begin(), text.end(), 'D', 'E');
    std::replace(text.begin(), text.end(), 'd', 'e');
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return value;
}

/// Parses a quoted FITS string starting at the opening quote. Trailing blanks are dropped.
std::string parse_quoted(std::string_view text) {
    std::string out;
    for (std::size_t i = 1; i < text.size(); ++i) {
        if (text[i] == '\'') {
            if (i + 1 < text.size() && text[i + 1] == '\'') {
                out.push_back('\'');
                ++i;
                continue;
            }
            break;
        }
        out.push_back(text[i]);
    }
    return rtrim_copy(out);
}

FieldValue parse_value(std::string_view text) {
    const auto begin = text.find_first_not_of(' ');
    if (begin == std::string_view::npos) {
        return std::string{};
    }
    text.remove_prefix(begin);
    if (text.front() == '\'') {
        return parse_quoted(text);
    }

    const auto slash = text.find('/');
    const auto token = trim_copy(text.substr(0, slash));
    if (token == "T") {
        return true;
    }
    if (token == "F") {
        return false;
    }
    if (!token.empty() && token.front() != '(') {
        if (auto number = parse_number(token)) {
            return *number;
        }
    }
    // Complex pairs and anything unparsable are kept verbatim.
    return token;
}

void append_text(FieldMap& fields, const std::string& key, const std::string& text) {
    auto it = fields.find(key);
    if (it == fields.end()) {
        fields.emplace(key, text);
        return;
    }
    if (auto* existing = std::get_if<std::string>(&it->second)) {
        existing->append("\n").append(text);
    }
}

bool is_end_card(const unsigned char* card) {
    return std::memcmp(card, "END", 3) == 0 &&
           std::all_of(card + 3, card + 8, [](unsigned char c) { return c == ' '; });
}

/**
 * Parses one header starting at `offset`. Returns the header length in bytes,
 * padded to the block size.
 */
std::size_t parse_header(const std::vector<unsigned char>& bytes,
                         std::size_t offset,
                         FieldMap& fields,
                         const fs::path& path) {
    std::string continued_key;
    std::size_t pos = offset;
    while (true) {
        if (pos + FitsReader::kCardSize > bytes.size()) {
            throw UnreadableArtifact(path, "header without END card");
        }
        const unsigned char* raw = bytes.data() + pos;
        pos += FitsReader::kCardSize;
        if (is_end_card(raw)) {
            break;
        }

        const std::string_view card{reinterpret_cast<const char*>(raw), FitsReader::kCardSize};
        const auto keyword = to_upper_copy(rtrim_copy(card.substr(0, 8)));

        if (keyword.empty()) {
            continued_key.clear();
            continue;
        }
        if (keyword == "COMMENT" || keyword == "HISTORY") {
            append_text(fields, keyword, rtrim_copy(card.substr(8)));
            continue;
        }
        if (keyword == "CONTINUE") {
            if (continued_key.empty()) {
                continue;
            }
            auto& target = std::get<std::string>(fields[continued_key]);
            if (!target.empty() && target.back() == '&') {
                target.pop_back();
            }
            const auto rest = card.substr(8);
            const auto quote = rest.find('\'');
            const auto piece = quote == std::string_view::npos ? std::string{} : parse_quoted(rest.substr(quote));
            target += piece;
            if (piece.empty() || piece.back() != '&') {
                continued_key.clear();
            }
            continue;
        }

        continued_key.clear();
        if (card.substr(8, 2) != "= ") {
            fields[keyword] = rtrim_copy(card.substr(8));
            continue;
        }
        auto value = parse_value(card.substr(10));
        if (const auto* s = std::get_if<std::string>(&value); s && !s->empty() && s->back() == '&') {
            continued_key = keyword;
        }
        fields[keyword] = std::move(value);
    }

    const auto length = pos - offset;
    const auto blocks = (length + FitsReader::kBlockSize - 1) / FitsReader::kBlockSize;
    return blocks * FitsReader::kBlockSize;
}

std::optional<double> get_number(const FieldMap& fields, const std::string& key) {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return std::nullopt;
    }
    if (const auto* d = std::get_if<double>(&it->second)) {
        return *d;
    }
    return std::nullopt;
}

std::optional<std::string> get_string(const FieldMap& fields, const std::string& key) {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(&it->second)) {
        return *s;
    }
    return std::nullopt;
}

bool is_header_integer(double value) {
    return std::isfinite(value) && value == std::floor(value) && std::fabs(value) <= kMaxHeaderInteger;
}

long long require_int(const FieldMap& fields, const std::string& key, const fs::path& path) {
    const auto value = get_number(fields, key);
    if (!value || !is_header_integer(*value)) {
        throw UnreadableArtifact(path, "missing or invalid keyword " + key);
    }
    return static_cast<long long>(*value);
}

std::size_t require_dim(const FieldMap& fields, const std::string& key, const fs::path& path) {
    const auto value = require_int(fields, key, path);
    if (value < 0) {
        throw UnreadableArtifact(path, "negative " + key);
    }
    return static_cast<std::size_t>(value);
}

/// Like require_dim, but an absent keyword yields `fallback`.
std::size_t optional_dim(const FieldMap& fields, const std::string& key, std::size_t fallback, const fs::path& path) {
    if (fields.find(key) == fields.end()) {
        return fallback;
    }
    return require_dim(fields, key, path);
}

std::size_t checked_mul(std::size_t a, std::size_t b, const fs::path& path) {
    if (a != 0 && b > kMaxSize / a) {
        throw UnreadableArtifact(path, "data size overflows");
    }
    return a * b;
}

std::size_t checked_add(std::size_t a, std::size_t b, const fs::path& path) {
    if (b > kMaxSize - a) {
        throw UnreadableArtifact(path, "data size overflows");
    }
    return a + b;
}

/// Parses an unsigned decimal count; anything else is unreadable.
std::size_t parse_count(std::string_view digits, const std::string& context, const fs::path& path) {
    unsigned long long value = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size() || value > kMaxSize) {
        throw UnreadableArtifact(path, "invalid count in " + context);
    }
    return static_cast<std::size_t>(value);
}

template <typename T>
T load_be(const unsigned char* p) {
    using U = std::conditional_t<sizeof(T) == 1, std::uint8_t,
              std::conditional_t<sizeof(T) == 2, std::uint16_t,
              std::conditional_t<sizeof(T) == 4, std::uint32_t, std::uint64_t>>>;
    U bits = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        bits = static_cast<U>((bits << 8) | p[i]);
    }
    T value;
    std::memcpy(&value, &bits, sizeof(T));
    return value;
}

/// Decodes one element of the given binary type code (B I J K E D).
double load_element(char code, const unsigned char* p) {
    switch (code) {
        case 'B': return static_cast<double>(p[0]);
        case 'I': return static_cast<double>(load_be<std::int16_t>(p));
        case 'J': return static_cast<double>(load_be<std::int32_t>(p));
        case 'K': return static_cast<double>(load_be<std::int64_t>(p));
        case 'E': return static_cast<double>(load_be<float>(p));
        case 'D': return load_be<double>(p);
        default: return kNaN;
    }
}

std::size_t element_width(char code) {
    switch (code) {
        case 'L': case 'B': case 'A': return 1;
        case 'I': return 2;
        case 'J': case 'E': return 4;
        case 'K': case 'D': case 'C': case 'P': return 8;
        case 'M': case 'Q': return 16;
        default: return 0;
    }
}

double load_pixel(int bitpix, const unsigned char* p) {
    switch (bitpix) {
        case 8: return static_cast<double>(p[0]);
        case 16: return static_cast<double>(load_be<std::int16_t>(p));
        case 32: return static_cast<double>(load_be<std::int32_t>(p));
        case 64: return static_cast<double>(load_be<std::int64_t>(p));
        case -32: return static_cast<double>(load_be<float>(p));
        case -64: return load_be<double>(p);
        default: return kNaN;
    }
}

struct HduLayout {
    int bitpix{8};
    std::vector<std::size_t> axes;
    std::size_t elements{0};  ///< product of the axes
    std::size_t data_bytes{0};
};

HduLayout read_layout(const FieldMap& fields, const fs::path& path) {
    HduLayout layout;
    layout.bitpix = static_cast<int>(require_int(fields, "BITPIX", path));
    if (layout.bitpix != 8 && layout.bitpix != 16 && layout.bitpix != 32 && layout.bitpix != 64 &&
        layout.bitpix != -32 && layout.bitpix != -64) {
        throw UnreadableArtifact(path, "unsupported BITPIX " + std::to_string(layout.bitpix));
    }
    const auto naxis = require_dim(fields, "NAXIS", path);
    if (naxis > kMaxAxes) {
        throw UnreadableArtifact(path, "NAXIS " + std::to_string(naxis) + " out of range");
    }
    for (std::size_t i = 1; i <= naxis; ++i) {
        layout.axes.push_back(require_dim(fields, "NAXIS" + std::to_string(i), path));
    }

    if (!layout.axes.empty()) {
        layout.elements = 1;
        for (auto axis : layout.axes) {
            layout.elements = checked_mul(layout.elements, axis, path);
        }
    }
    const auto pcount = optional_dim(fields, "PCOUNT", 0, path);
    const auto gcount = optional_dim(fields, "GCOUNT", 1, path);
    if (layout.elements == 0 && pcount == 0) {
        layout.data_bytes = 0;
    } else {
        const auto width = static_cast<std::size_t>(std::abs(layout.bitpix) / 8);
        layout.data_bytes = checked_mul(checked_mul(width, gcount, path), checked_add(pcount, layout.elements, path), path);
    }
    return layout;
}

DataArray decode_image(const HduLayout& layout,
                       const FieldMap& fields,
                       const unsigned char* data,
                       const fs::path& path) {
    DataArray array;
    array.name = "DATA";
    array.shape = layout.axes;

    const auto count = layout.elements;
    if (checked_mul(count, static_cast<std::size_t>(std::abs(layout.bitpix) / 8), path) > layout.data_bytes) {
        throw UnreadableArtifact(path, "image larger than its data section");
    }
    const double bscale = get_number(fields, "BSCALE").value_or(1.0);
    const double bzero = get_number(fields, "BZERO").value_or(0.0);
    const bool scaled = bscale != 1.0 || bzero != 0.0;
    const auto width = static_cast<std::size_t>(std::abs(layout.bitpix) / 8);

    array.numbers.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const double raw = load_pixel(layout.bitpix, data + i * width);
        array.numbers.push_back(scaled ? raw * bscale + bzero : raw);
    }
    return array;
}

struct ColumnFormat {
    std::size_t repeat{1};
    char code{'\0'};
    char heap_code{'\0'};  // element type of P/Q descriptors
    std::size_t width{0};  // bytes per row
};

ColumnFormat parse_tform(const std::string& tform, const fs::path& path) {
    ColumnFormat format;
    std::size_t i = 0;
    while (i < tform.size() && std::isdigit(static_cast<unsigned char>(tform[i]))) {
        ++i;
    }
    if (i > 0) {
        format.repeat = parse_count(std::string_view{tform}.substr(0, i), "TFORM '" + tform + "'", path);
    }
    // Keeps every row width derived from the repeat count representable.
    if (format.repeat > kMaxSize / 16) {
        throw UnreadableArtifact(path, "repeat count too large in TFORM '" + tform + "'");
    }
    if (i >= tform.size()) {
        throw UnreadableArtifact(path, "invalid TFORM '" + tform + "'");
    }
    format.code = static_cast<char>(std::toupper(static_cast<unsigned char>(tform[i])));
    if (format.code == 'P' || format.code == 'Q') {
        if (i + 1 >= tform.size()) {
            throw UnreadableArtifact(path, "invalid TFORM '" + tform + "'");
        }
        format.heap_code = static_cast<char>(std::toupper(static_cast<unsigned char>(tform[i + 1])));
    }
    if (format.code == 'X') {
        format.width = (format.repeat + 7) / 8;
        return format;
    }
    const auto width = element_width(format.code);
    if (width == 0) {
        throw UnreadableArtifact(path, "unsupported TFORM '" + tform + "'");
    }
    format.width = width * format.repeat;
    return format;
}

std::string column_name(const FieldMap& fields, std::size_t index) {
    const auto name = get_string(fields, "TTYPE" + std::to_string(index));
    if (name && !name->empty()) {
        return trim_copy(*name);
    }
    return "COL" + std::to_string(index);
}

std::string fixed_string(const unsigned char* p, std::size_t n) {
    std::size_t len = 0;
    while (len < n && p[len] != '\0') {
        ++len;
    }
    return rtrim_copy(std::string_view{reinterpret_cast<const char*>(p), len});
}

std::vector<DataArray> decode_bintable(const HduLayout& layout,
                                       const FieldMap& fields,
                                       const unsigned char* data,
                                       const fs::path& path) {
    if (layout.axes.size() != 2) {
        throw UnreadableArtifact(path, "BINTABLE requires NAXIS = 2");
    }
    const auto row_bytes = layout.axes[0];
    const auto rows = layout.axes[1];
    const auto table_bytes = checked_mul(row_bytes, rows, path);
    if (table_bytes > layout.data_bytes) {
        throw UnreadableArtifact(path, "table larger than its data section");
    }
    const auto tfields = require_dim(fields, "TFIELDS", path);
    if (tfields > kMaxFields) {
        throw UnreadableArtifact(path, "TFIELDS " + std::to_string(tfields) + " out of range");
    }
    const auto theap = optional_dim(fields, "THEAP", table_bytes, path);
    if (theap > layout.data_bytes) {
        throw UnreadableArtifact(path, "THEAP beyond the data section");
    }
    const auto heap_bytes = layout.data_bytes - theap;
    const unsigned char* heap = data + theap;

    std::vector<DataArray> columns;
    columns.reserve(tfields);
    std::size_t column_offset = 0;

    for (std::size_t c = 1; c <= tfields; ++c) {
        const auto tform = get_string(fields, "TFORM" + std::to_string(c));
        if (!tform) {
            throw UnreadableArtifact(path, "missing TFORM" + std::to_string(c));
        }
        const auto format = parse_tform(trim_copy(*tform), path);
        if (format.width > row_bytes - column_offset) {
            throw UnreadableArtifact(path, "column " + std::to_string(c) + " exceeds row width");
        }

        DataArray column;
        column.name = column_name(fields, c);
        const double tscal = get_number(fields, "TSCAL" + std::to_string(c)).value_or(1.0);
        const double tzero = get_number(fields, "TZERO" + std::to_string(c)).value_or(0.0);
        const bool scaled = tscal != 1.0 || tzero != 0.0;

        const bool heap_text = (format.code == 'P' || format.code == 'Q') && format.heap_code == 'A';
        column.is_text = format.code == 'A' || heap_text;

        for (std::size_t r = 0; r < rows; ++r) {
            const unsigned char* cell = data + r * row_bytes + column_offset;
            switch (format.code) {
                case 'A':
                    column.strings.push_back(fixed_string(cell, format.repeat));
                    break;
                case 'L':
                    for (std::size_t k = 0; k < format.repeat; ++k) {
                        const auto flag = cell[k];
                        column.numbers.push_back(flag == 'T' ? 1.0 : (flag == 'F' ? 0.0 : kNaN));
                    }
                    break;
                case 'X':
                    for (std::size_t k = 0; k < format.repeat; ++k) {
                        const auto bit = (cell[k / 8] >> (7 - (k % 8))) & 0x1;
                        column.numbers.push_back(static_cast<double>(bit));
                    }
                    break;
                case 'C':
                case 'M': {
                    const char part = format.code == 'C' ? 'E' : 'D';
                    const auto part_width = element_width(part);
                    for (std::size_t k = 0; k < format.repeat * 2; ++k) {
                        column.numbers.push_back(load_element(part, cell + k * part_width));
                    }
                    break;
                }
                case 'P':
                case 'Q': {
                    const bool wide = format.code == 'Q';
                    const auto count = wide ? static_cast<std::size_t>(load_be<std::int64_t>(cell))
                                            : static_cast<std::size_t>(load_be<std::int32_t>(cell));
                    const auto offset = wide ? static_cast<std::size_t>(load_be<std::int64_t>(cell + 8))
                                             : static_cast<std::size_t>(load_be<std::int32_t>(cell + 4));
                    const auto width = element_width(format.heap_code);
                    if (width == 0 || offset > heap_bytes || count > (heap_bytes - offset) / width) {
                        throw UnreadableArtifact(path, "variable-length array outside heap in column " +
                                                           std::to_string(c));
                    }
                    if (heap_text) {
                        column.strings.push_back(fixed_string(heap + offset, count));
                        break;
                    }
                    for (std::size_t k = 0; k < count; ++k) {
                        const double raw = load_element(format.heap_code, heap + offset + k * width);
                        column.numbers.push_back(scaled ? raw * tscal + tzero : raw);
                    }
                    break;
                }
                default: {
                    const auto width = element_width(format.code);
                    for (std::size_t k = 0; k < format.repeat; ++k) {
                        const double raw = load_element(format.code, cell + k * width);
                        column.numbers.push_back(scaled ? raw * tscal + tzero : raw);
                    }
                    break;
                }
            }
        }

        if (column.is_text || format.code == 'P' || format.code == 'Q') {
            column.shape = {column.size()};
        } else if (format.code == 'C' || format.code == 'M') {
            column.shape = {rows, format.repeat * 2};
        } else if (format.repeat == 1) {
            column.shape = {rows};
        } else {
            column.shape = {rows, format.repeat};
        }

        column_offset += format.width;
        columns.emplace_back(std::move(column));
    }
    return columns;
}

std::vector<DataArray> decode_ascii_table(const HduLayout& layout,
                                          const FieldMap& fields,
                                          const unsigned char* data,
                                          const fs::path& path) {
    if (layout.axes.size() != 2) {
        throw UnreadableArtifact(path, "TABLE requires NAXIS = 2");
    }
    const auto row_bytes = layout.axes[0];
    const auto rows = layout.axes[1];
    if (checked_mul(row_bytes, rows, path) > layout.data_bytes) {
        throw UnreadableArtifact(path, "table larger than its data section");
    }
    const auto tfields = require_dim(fields, "TFIELDS", path);
    if (tfields > kMaxFields) {
        throw UnreadableArtifact(path, "TFIELDS " + std::to_string(tfields) + " out of range");
    }

    std::vector<DataArray> columns;
    columns.reserve(tfields);
    for (std::size_t c = 1; c <= tfields; ++c) {
        const auto tform = get_string(fields, "TFORM" + std::to_string(c));
        const auto tbcol = get_number(fields, "TBCOL" + std::to_string(c));
        if (!tform || !tbcol || !is_header_integer(*tbcol) || *tbcol < 1 ||
            *tbcol > static_cast<double>(row_bytes)) {
            throw UnreadableArtifact(path, "missing TFORM/TBCOL for field " + std::to_string(c));
        }
        const auto form = trim_copy(*tform);
        if (form.empty()) {
            throw UnreadableArtifact(path, "empty TFORM" + std::to_string(c));
        }
        const char code = static_cast<char>(std::toupper(static_cast<unsigned char>(form.front())));
        const auto dot = form.find('.');
        const auto width_text = form.substr(1, dot == std::string::npos ? std::string::npos : dot - 1);
        const auto width = width_text.empty() ? 0 : parse_count(width_text, "TFORM" + std::to_string(c), path);
        const auto start = static_cast<std::size_t>(*tbcol) - 1;
        if (width > row_bytes - start) {
            throw UnreadableArtifact(path, "field " + std::to_string(c) + " exceeds row width");
        }

        DataArray column;
        column.name = column_name(fields, c);
        column.is_text = code == 'A';
        column.shape = {rows};
        const double tscal = get_number(fields, "TSCAL" + std::to_string(c)).value_or(1.0);
        const double tzero = get_number(fields, "TZERO" + std::to_string(c)).value_or(0.0);

        for (std::size_t r = 0; r < rows; ++r) {
            const std::string_view field{reinterpret_cast<const char*>(data + r * row_bytes + start), width};
            if (column.is_text) {
                column.strings.push_back(rtrim_copy(field));
                continue;
            }
            const auto number = parse_number(trim_copy(field));
            column.numbers.push_back(number ? *number * tscal + tzero : kNaN);
        }
        columns.emplace_back(std::move(column));
    }
    return columns;
}

std::vector<unsigned char> read_all(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw UnreadableArtifact(path, "cannot open for reading");
    }
    input.seekg(0, std::ios::end);
    const auto end = input.tellg();
    if (end < 0) {
        throw UnreadableArtifact(path, "cannot determine size");
    }
    const auto size = static_cast<std::size_t>(end);
    input.seekg(0, std::ios::beg);
    std::vector<unsigned char> bytes(size);
    if (size > 0) {
        input.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(size));
        if (!input) {
            throw UnreadableArtifact(path, "short read");
        }
    }
    return bytes;
}

std::string unit_identifier(std::size_t index, const FieldMap& fields) {
    if (index == 0) {
        return "PRIMARY";
    }
    const auto extname = get_string(fields, "EXTNAME");
    if (!extname || trim_copy(*extname).empty()) {
        return "HDU" + std::to_string(index);
    }
    auto id = to_upper_copy(trim_copy(*extname));
    if (const auto extver = get_number(fields, "EXTVER"); extver && is_header_integer(*extver)) {
        id += "," + std::to_string(static_cast<long long>(*extver));
    }
    return id;
}

}  // namespace

namespace calregress {

bool FitsReader::looks_like_fits(std::string_view head) noexcept {
    return head.size() >= 30 && head.substr(0, 10) == "SIMPLE  = " &&
           head.substr(10, 20).find('T') != std::string_view::npos;
}

Artifact FitsReader::read(const std::filesystem::path& path) const {
    const auto bytes = read_all(path);
    const std::string_view head{reinterpret_cast<const char*>(bytes.data()), std::min<std::size_t>(bytes.size(), kCardSize)};
    if (!looks_like_fits(head)) {
        throw UnreadableArtifact(path, "missing SIMPLE card");
    }

    Artifact artifact;
    artifact.path = path;
    artifact.kind = ArtifactKind::Fits;

    std::map<std::string, std::size_t> seen;
    std::size_t offset = 0;
    std::size_t index = 0;
    while (offset < bytes.size()) {
        // Trailing zero padding after the last HDU is not another extension.
        if (index > 0 && std::all_of(bytes.begin() + static_cast<std::ptrdiff_t>(offset), bytes.end(),
                                     [](unsigned char b) { return b == 0 || b == ' '; })) {
            break;
        }

        ArtifactUnit unit;
        offset += parse_header(bytes, offset, unit.metadata, path);
        const auto layout = read_layout(unit.metadata, path);
        if (offset > bytes.size() || layout.data_bytes > bytes.size() - offset) {
            throw UnreadableArtifact(path, "truncated data in HDU " + std::to_string(index));
        }
        const unsigned char* data = bytes.data() + offset;

        const auto xtension = index == 0 ? std::string{"PRIMARY"}
                                         : to_upper_copy(trim_copy(get_string(unit.metadata, "XTENSION").value_or("")));
        if (index > 0 && xtension.empty()) {
            throw UnreadableArtifact(path, "extension " + std::to_string(index) + " without XTENSION");
        }
        const bool random_groups = index == 0 && !layout.axes.empty() && layout.axes.front() == 0;

        if ((xtension == "PRIMARY" && !random_groups) || xtension == "IMAGE") {
            unit.kind = UnitKind::Image;
            if (!layout.axes.empty()) {
                unit.arrays.push_back(decode_image(layout, unit.metadata, data, path));
            }
        } else if (xtension == "BINTABLE") {
            unit.kind = UnitKind::BinaryTable;
            unit.arrays = decode_bintable(layout, unit.metadata, data, path);
        } else if (xtension == "TABLE") {
            unit.kind = UnitKind::AsciiTable;
            unit.arrays = decode_ascii_table(layout, unit.metadata, data, path);
        } else {
            unit.kind = UnitKind::Other;
        }

        auto id = unit_identifier(index, unit.metadata);
        const auto occurrences = ++seen[id];
        if (occurrences > 1) {
            id += "#" + std::to_string(occurrences);
        }
        unit.id = std::move(id);
        artifact.units.emplace_back(std::move(unit));

        const auto padded = (layout.data_bytes + kBlockSize - 1) / kBlockSize * kBlockSize;
        offset = std::min(bytes.size(), offset + padded);
        ++index;
    }
    return artifact;
}

FieldMap FitsReader::read_primary_header(const std::filesystem::path& path) const {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw UnreadableArtifact(path, "cannot open for reading");
    }

    std::vector<unsigned char> bytes;
    bool found_end = false;
    while (!found_end) {
        const auto start = bytes.size();
        bytes.resize(start + kBlockSize);
        input.read(reinterpret_cast<char*>(bytes.data() + start), static_cast<std::streamsize>(kBlockSize));
        const auto got = static_cast<std::size_t>(input.gcount());
        bytes.resize(start + got);
        for (std::size_t card = start; card + kCardSize <= bytes.size(); card += kCardSize) {
            if (is_end_card(bytes.data() + card)) {
                found_end = true;
                break;
            }
        }
        if (got < kBlockSize) {
            break;
        }
    }

    const std::string_view head{reinterpret_cast<const char*>(bytes.data()), std::min<std::size_t>(bytes.size(), kCardSize)};
    if (!looks_like_fits(head)) {
        throw UnreadableArtifact(path, "missing SIMPLE card");
    }
    FieldMap fields;
    (void)parse_header(bytes, 0, fields, path);
    return fields;
}

}  // namespace calregress
