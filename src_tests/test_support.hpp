/**
 * @file test_support.hpp
 * @brief Shared fixtures for the calregress tests: scratch directories,
 *        a minimal FITS writer and small file helpers.
 *
 * The FITS writer emits 80-column header cards, pads every header and data
 * segment to 2880 bytes and stores numbers big-endian, which is all the
 * reader under test needs.
 */
#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace calregress::testing {

/// Unique scratch directory, removed with its contents on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<unsigned> counter{0};
        std::random_device rd;
        const auto name = "calregress-test-" + std::to_string(::getpid()) + "-" +
                          std::to_string(counter.fetch_add(1)) + "-" + std::to_string(rd());
        path_ = std::filesystem::temp_directory_path() / name;
        std::filesystem::create_directories(path_);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::filesystem::path operator/(const std::string& relative) const { return path_ / relative; }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        throw std::runtime_error("cannot write " + path.string());
    }
    ofs << content;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << ifs.rdbuf();
    return buffer.str();
}

/// Writes a /bin/sh script and marks it executable.
inline std::filesystem::path write_script(const std::filesystem::path& path, const std::string& body) {
    write_file(path, "#!/bin/sh\n" + body);
    ::chmod(path.c_str(), 0755);
    return path;
}

/// Header card value, preformatted the way it appears after "= ".
struct Card {
    std::string key;
    std::string value;
};

inline std::string quoted(const std::string& text) {
    std::string padded = text;
    if (padded.size() < 8) {
        padded.resize(8, ' ');
    }
    return "'" + padded + "'";
}

inline std::string card(const std::string& key, const std::string& value) {
    std::string line = key;
    line.resize(8, ' ');
    line += "= " + value;
    line.resize(80, ' ');
    return line;
}

inline std::string comment_card(const std::string& key, const std::string& text) {
    std::string line = key;
    line.resize(8, ' ');
    line += text;
    line.resize(80, ' ');
    return line;
}

template <typename T>
void put_be(std::string& out, T value) {
    std::uint64_t bits = 0;
    static_assert(sizeof(T) <= sizeof(bits));
    if constexpr (sizeof(T) == 1) {
        std::uint8_t raw;
        std::memcpy(&raw, &value, 1);
        bits = raw;
    } else if constexpr (sizeof(T) == 2) {
        std::uint16_t raw;
        std::memcpy(&raw, &value, 2);
        bits = raw;
    } else if constexpr (sizeof(T) == 4) {
        std::uint32_t raw;
        std::memcpy(&raw, &value, 4);
        bits = raw;
    } else {
        std::memcpy(&bits, &value, 8);
    }
    for (int shift = static_cast<int>(sizeof(T) - 1) * 8; shift >= 0; shift -= 8) {
        out.push_back(static_cast<char>((bits >> shift) & 0xFF));
    }
}

inline void put_element(std::string& out, int bitpix, double value) {
    switch (bitpix) {
        case 8: put_be(out, static_cast<std::uint8_t>(value)); break;
        case 16: put_be(out, static_cast<std::int16_t>(value)); break;
        case 32: put_be(out, static_cast<std::int32_t>(value)); break;
        case 64: put_be(out, static_cast<std::int64_t>(value)); break;
        case -32: put_be(out, static_cast<float>(value)); break;
        case -64: put_be(out, value); break;
        default: throw std::invalid_argument("unsupported BITPIX");
    }
}

inline void pad_to_block(std::string& out, char fill) {
    const auto rest = out.size() % 2880;
    if (rest != 0) {
        out.append(2880 - rest, fill);
    }
}

/// One binary table column. `code` is a TFORM letter; 'A' columns use `strings`.
struct Column {
    std::string name;
    char code{'D'};
    std::size_t width{1};  ///< repeat count, or character width for 'A'
    std::vector<double> numbers;
    std::vector<std::string> strings;
};

class FitsBuilder {
public:
    /// Primary HDU with an image (or no data when `axes` is empty).
    FitsBuilder& primary(const std::vector<Card>& extra = {},
                         int bitpix = 16,
                         const std::vector<std::size_t>& axes = {},
                         const std::vector<double>& values = {}) {
        std::vector<std::string> cards{card("SIMPLE", "T"), card("BITPIX", std::to_string(bitpix))};
        append_axes(cards, axes);
        cards.push_back(card("EXTEND", "T"));
        append(cards, extra);
        emit(cards, bitpix, values);
        return *this;
    }

    FitsBuilder& image(const std::string& extname,
                       int bitpix,
                       const std::vector<std::size_t>& axes,
                       const std::vector<double>& values,
                       const std::vector<Card>& extra = {}) {
        std::vector<std::string> cards{card("XTENSION", quoted("IMAGE")),
                                       card("BITPIX", std::to_string(bitpix))};
        append_axes(cards, axes);
        cards.push_back(card("PCOUNT", "0"));
        cards.push_back(card("GCOUNT", "1"));
        if (!extname.empty()) {
            cards.push_back(card("EXTNAME", quoted(extname)));
        }
        append(cards, extra);
        emit(cards, bitpix, values);
        return *this;
    }

    FitsBuilder& table(const std::string& extname,
                       const std::vector<Column>& columns,
                       const std::vector<Card>& extra = {}) {
        std::size_t rows = 0;
        std::size_t row_bytes = 0;
        for (const auto& column : columns) {
            if (column.code == 'A') {
                rows = std::max(rows, column.strings.size());
                row_bytes += column.width;
            } else {
                rows = std::max(rows, column.numbers.size() / column.width);
                row_bytes += column.width * element_size(column.code);
            }
        }

        std::vector<std::string> cards{card("XTENSION", quoted("BINTABLE")), card("BITPIX", "8"),
                                       card("NAXIS", "2"), card("NAXIS1", std::to_string(row_bytes)),
                                       card("NAXIS2", std::to_string(rows)), card("PCOUNT", "0"),
                                       card("GCOUNT", "1"),
                                       card("TFIELDS", std::to_string(columns.size()))};
        for (std::size_t c = 0; c < columns.size(); ++c) {
            const auto n = std::to_string(c + 1);
            cards.push_back(card("TTYPE" + n, quoted(columns[c].name)));
            cards.push_back(card("TFORM" + n, quoted(std::to_string(columns[c].width) + columns[c].code)));
        }
        if (!extname.empty()) {
            cards.push_back(card("EXTNAME", quoted(extname)));
        }
        append(cards, extra);
        write_header(cards);

        std::string data;
        for (std::size_t r = 0; r < rows; ++r) {
            for (const auto& column : columns) {
                if (column.code == 'A') {
                    std::string cell = r < column.strings.size() ? column.strings[r] : std::string{};
                    cell.resize(column.width, ' ');
                    data += cell;
                    continue;
                }
                for (std::size_t k = 0; k < column.width; ++k) {
                    const auto at = r * column.width + k;
                    const double value = at < column.numbers.size() ? column.numbers[at] : 0.0;
                    put_element(data, bitpix_of(column.code), value);
                }
            }
        }
        pad_to_block(data, '\0');
        bytes_ += data;
        return *this;
    }

    [[nodiscard]] const std::string& bytes() const noexcept { return bytes_; }

    void write(const std::filesystem::path& path) const { write_file(path, bytes_); }

private:
    static std::size_t element_size(char code) {
        switch (code) {
            case 'B': return 1;
            case 'I': return 2;
            case 'J':
            case 'E': return 4;
            case 'K':
            case 'D': return 8;
            default: throw std::invalid_argument("unsupported TFORM code");
        }
    }

    static int bitpix_of(char code) {
        switch (code) {
            case 'B': return 8;
            case 'I': return 16;
            case 'J': return 32;
            case 'K': return 64;
            case 'E': return -32;
            case 'D': return -64;
            default: throw std::invalid_argument("unsupported TFORM code");
        }
    }

    static void append_axes(std::vector<std::string>& cards, const std::vector<std::size_t>& axes) {
        cards.push_back(card("NAXIS", std::to_string(axes.size())));
        for (std::size_t i = 0; i < axes.size(); ++i) {
            cards.push_back(card("NAXIS" + std::to_string(i + 1), std::to_string(axes[i])));
        }
    }

    static void append(std::vector<std::string>& cards, const std::vector<Card>& extra) {
        for (const auto& c : extra) {
            cards.push_back(card(c.key, c.value));
        }
    }

    void write_header(const std::vector<std::string>& cards) {
        std::string header;
        for (const auto& c : cards) {
            header += c;
        }
        std::string end = "END";
        end.resize(80, ' ');
        header += end;
        pad_to_block(header, ' ');
        bytes_ += header;
    }

    void emit(const std::vector<std::string>& cards, int bitpix, const std::vector<double>& values) {
        write_header(cards);
        if (values.empty()) {
            return;
        }
        std::string data;
        for (double v : values) {
            put_element(data, bitpix, v);
        }
        pad_to_block(data, '\0');
        bytes_ += data;
    }

    std::string bytes_;
};

/// Smallest readable input: a primary header carrying `cards`.
inline void write_header_only(const std::filesystem::path& path, const std::vector<Card>& cards) {
    FitsBuilder{}.primary(cards).write(path);
}

}  // namespace calregress::testing
