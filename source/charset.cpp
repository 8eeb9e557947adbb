// charset.cpp

#include <algorithm>
#include <array>
#include <string_view>

#include "charset.hpp"

namespace fatxrec {

namespace {

using ByteTable = std::array<bool, 256>;

constexpr void mark(ByteTable &table, std::string_view chars) {
    for (char c : chars) {
        table[static_cast<uint8_t>(c)] = true;
    }
}

constexpr void mark_range(ByteTable &table, unsigned first, unsigned last) {
    for (unsigned c = first; c <= last; ++c) {
        table[c] = true;
    }
}

constexpr ByteTable make_valid_table() {
    ByteTable table{};

    // valid for both FATX and FAT16/FAT32
    mark_range(table, 'A', 'Z');
    mark_range(table, '0', '9');
    mark(table, "!#$%&'()-@[]^_`{}~ ");

    // valid for FATX but not in FAT16/FAT32 short names
    mark_range(table, 'a', 'z');
    mark(table, ".[]");

    // box drawing, accented and greek letters, math symbols
    mark_range(table, 0x80, 0xE4);
    mark_range(table, 0xE6, 0xFE);
    table[0xFF] = true;

    // validity unclear; sometimes reserved in FAT16/FAT32
    table[0x9D] = true;
    table[0xE5] = true;

    return table;
}

constexpr ByteTable make_reserved_table() {
    ByteTable table{};

    // invalid for FATX, valid in FAT16/FAT32 long names only
    mark(table, "+,;=");

    // invalid for both FATX and FAT16/FAT32
    mark(table, "\"*/:<>?\\|");

    table[0x00] = true;
    table[0x20] = true;
    table[0x7F] = true;

    return table;
}

constexpr ByteTable VALID_NAME_BYTES = make_valid_table();
constexpr ByteTable RESERVED_NAME_BYTES = make_reserved_table();

// Code points for bytes 0x80-0xFF.
constexpr std::array<char16_t, 128> CP437_HIGH = {
    0x00C7, 0x00FC, 0x00E9, 0x00E2, 0x00E4, 0x00E0, 0x00E5, 0x00E7,
    0x00EA, 0x00EB, 0x00E8, 0x00EF, 0x00EE, 0x00EC, 0x00C4, 0x00C5,
    0x00C9, 0x00E6, 0x00C6, 0x00F4, 0x00F6, 0x00F2, 0x00FB, 0x00F9,
    0x00FF, 0x00D6, 0x00DC, 0x00A2, 0x00A3, 0x00A5, 0x20A7, 0x0192,
    0x00E1, 0x00ED, 0x00F3, 0x00FA, 0x00F1, 0x00D1, 0x00AA, 0x00BA,
    0x00BF, 0x2310, 0x00AC, 0x00BD, 0x00BC, 0x00A1, 0x00AB, 0x00BB,
    0x2591, 0x2592, 0x2593, 0x2502, 0x2524, 0x2561, 0x2562, 0x2556,
    0x2555, 0x2563, 0x2551, 0x2557, 0x255D, 0x255C, 0x255B, 0x2510,
    0x2514, 0x2534, 0x252C, 0x251C, 0x2500, 0x253C, 0x255E, 0x255F,
    0x255A, 0x2554, 0x2569, 0x2566, 0x2560, 0x2550, 0x256C, 0x2567,
    0x2568, 0x2564, 0x2565, 0x2559, 0x2558, 0x2552, 0x2553, 0x256B,
    0x256A, 0x2518, 0x250C, 0x2588, 0x2584, 0x258C, 0x2590, 0x2580,
    0x03B1, 0x00DF, 0x0393, 0x03C0, 0x03A3, 0x03C3, 0x00B5, 0x03C4,
    0x03A6, 0x0398, 0x03A9, 0x03B4, 0x221E, 0x03C6, 0x03B5, 0x2229,
    0x2261, 0x00B1, 0x2265, 0x2264, 0x2320, 0x2321, 0x00F7, 0x2248,
    0x00B0, 0x2219, 0x00B7, 0x221A, 0x207F, 0x00B2, 0x25A0, 0x00A0,
};

} // namespace

bool is_valid_name_byte(uint8_t c) { return VALID_NAME_BYTES[c]; }

bool is_reserved_name_byte(uint8_t c) { return RESERVED_NAME_BYTES[c]; }

bool is_valid_name(std::span<const uint8_t> name) {
    return std::all_of(name.begin(), name.end(), is_valid_name_byte);
}

void append_utf8(std::string &out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string cp437_to_utf8(std::span<const uint8_t> bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (uint8_t c : bytes) {
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
        } else {
            append_utf8(out, CP437_HIGH[c - 0x80]);
        }
    }
    return out;
}

std::string latin1_to_utf8(std::span<const uint8_t> bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (uint8_t c : bytes) {
        append_utf8(out, c);
    }
    return out;
}

} // namespace fatxrec
