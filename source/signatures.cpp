// signatures.cpp

#include <algorithm>
#include <array>
#include <filesystem>
#include <stdexcept>
#include <zlib.h>

#include "log.hpp"
#include "signatures.hpp"

namespace fatxrec {

namespace {

template <std::size_t N>
bool matches(const std::vector<unsigned char> &data,
             const std::array<unsigned char, N> &magic) {
    return data.size() == N && std::equal(magic.begin(), magic.end(), data.begin());
}

constexpr std::array<unsigned char, 4> XBE_MAGIC = {'X', 'B', 'E', 'H'};
constexpr std::array<unsigned char, 4> XEX_MAGIC = {'X', 'E', 'X', '2'};

constexpr std::array<unsigned char, 32> PDB_MAGIC = {
    'M', 'i', 'c', 'r', 'o', 's', 'o', 'f', 't', ' ', 'C', '/', 'C', '+', '+', ' ',
    'M', 'S', 'F', ' ', '7', '.', '0', '0', '\r', '\n', 0x1a, 'D', 'S', 0, 0, 0};

constexpr std::array<unsigned char, 8> PNG_MAGIC = {0x89, 'P',  'N',  'G',
                                                     '\r', '\n', 0x1a, '\n'};
constexpr std::array<unsigned char, 4> PNG_IEND = {'I', 'E', 'N', 'D'};

namespace gzip {
constexpr std::array<unsigned char, 3> MAGIC = {0x1f, 0x8b, 0x08};

constexpr uint8_t FEXTRA = 0x04;
constexpr uint8_t FNAME = 0x08;

constexpr std::size_t INPUT_CHUNK = 0x10000;
} // namespace gzip

} // namespace

bool XbeSignature::test() { return matches(read(XBE_MAGIC.size()), XBE_MAGIC); }

void XbeSignature::parse() {
    set_endian(std::endian::little);
    seek(0x10c); // size of image
    set_length(read_u32());
}

bool XexSignature::test() { return matches(read(XEX_MAGIC.size()), XEX_MAGIC); }

void XexSignature::parse() {
    set_endian(std::endian::big);
    seek(0x10);
    const uint32_t security_offset = read_u32();
    seek(static_cast<int64_t>(security_offset) + 4); // image size
    set_length(read_u32());
}

bool PdbSignature::test() { return matches(read(PDB_MAGIC.size()), PDB_MAGIC); }

void PdbSignature::parse() {
    set_endian(std::endian::little);
    seek(0x20);
    const uint64_t page_size = read_u32();
    seek(0x28);
    const uint64_t page_count = read_u32();
    set_length(page_size * page_count);
}

bool PngSignature::test() { return matches(read(PNG_MAGIC.size()), PNG_MAGIC); }

void PngSignature::parse() {
    set_endian(std::endian::big);

    uint64_t position = PNG_MAGIC.size();
    for (unsigned i = 0; i < MAX_CHUNKS; ++i) {
        seek(static_cast<int64_t>(position));
        const uint32_t data_length = read_u32();
        if (data_length > 0x7fffffff) {
            return;
        }
        const auto type = read(4);

        // length, type, data, crc
        position += 12 + static_cast<uint64_t>(data_length);
        if (matches(type, PNG_IEND)) {
            set_length(position);
            return;
        }
    }
    log::debug("No IEND chunk in " + to_string());
}

bool GzipSignature::test() {
    return matches(read(gzip::MAGIC.size()), gzip::MAGIC);
}

void GzipSignature::parse() {
    set_endian(std::endian::little);
    parse_header();
    set_length(inflated_member_length());
}

void GzipSignature::parse_header() {
    seek(3);
    const uint8_t flags = read_u8();
    seek(10);

    if (flags & gzip::FEXTRA) {
        const uint16_t extra_length = read_u16();
        seek(extra_length, std::ios::cur);
    }
    if (flags & gzip::FNAME) {
        // RFC 1952 stores the name in ISO-8859-1
        const auto stored =
            std::filesystem::path(read_latin1_string()).filename();
        if (!stored.empty() && stored != "." && stored != "..") {
            set_name(stored.string());
        }
    }
}

uint64_t GzipSignature::inflated_member_length() {
    z_stream stream;
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;
    stream.avail_in = 0;
    stream.next_in = Z_NULL;

    // 16 + window bits: expect a gzip wrapper
    if (inflateInit2(&stream, 16 + MAX_WBITS) != Z_OK) {
        throw std::runtime_error(
            "Failed to initialize zlib stream for decompression");
    }

    seek(0);
    std::vector<unsigned char> input;
    uint64_t fed = 0;
    unsigned char buffer[0x4000];
    int result = Z_OK;

    while (result != Z_STREAM_END) {
        if (stream.avail_in == 0) {
            if (fed >= MAX_MEMBER_SIZE) {
                break;
            }
            input = read(gzip::INPUT_CHUNK);
            if (input.empty()) {
                break;
            }
            stream.next_in = input.data();
            stream.avail_in = static_cast<uInt>(input.size());
            fed += input.size();
        }

        stream.avail_out = sizeof(buffer);
        stream.next_out = buffer;
        result = inflate(&stream, Z_NO_FLUSH);
        if (result != Z_OK && result != Z_STREAM_END) {
            break;
        }
    }

    const uint64_t unused = stream.avail_in;
    inflateEnd(&stream);

    if (result != Z_STREAM_END) {
        log::debug("Could not inflate " + to_string());
        return 0;
    }
    return fed - unused;
}

} // namespace fatxrec
