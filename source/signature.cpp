// signature.cpp

#include <algorithm>
#include <cctype>
#include <fstream>

#include "byteorder.hpp"
#include "charset.hpp"
#include "log.hpp"
#include "signature.hpp"

namespace fatxrec {

std::string SignatureNamer::next_name(std::string_view type_name) {
    auto it = m_counters.find(type_name);
    if (it == m_counters.end()) {
        it = m_counters.emplace(std::string(type_name), 1).first;
    }

    std::string name(type_name);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return name + std::to_string(it->second++);
}

Signature::Signature(std::string_view type_name, uint64_t offset,
                     FatxVolume &volume)
    : m_type_name(type_name), m_offset(offset), m_volume(volume),
      m_endian(volume.endian()) {}

std::string Signature::get_file_name(SignatureNamer &namer) const {
    if (m_name) {
        return *m_name;
    }
    return namer.next_name(m_type_name);
}

bool Signature::recover(const std::filesystem::path &dir,
                        SignatureNamer &namer) {
    auto whole_path = dir / get_file_name(namer);
    std::error_code ec;
    if (m_name && std::filesystem::exists(whole_path, ec)) {
        const auto stored = std::filesystem::path(*m_name);
        whole_path = dir / (stored.stem().string() + "_" + log::hex(m_offset) +
                            stored.extension().string());
    }
    log::info("Recovering: " + whole_path.string());

    std::ofstream out(whole_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        log::error("Failed to create file: " + whole_path.string());
        return false;
    }

    if (m_length == 0 || m_length >= UNKNOWN_LENGTH) {
        return true;
    }

    seek(0);
    uint64_t remains = m_length;
    while (remains > 0) {
        const auto chunk = read(std::min<uint64_t>(remains, COPY_CHUNK_SIZE));
        out.write(reinterpret_cast<const char *>(chunk.data()),
                  static_cast<std::streamsize>(chunk.size()));
        if (out.bad()) {
            log::error("Write error on " + whole_path.string());
            return false;
        }
        if (chunk.empty()) {
            log::error("Image ended after " +
                       std::to_string(m_length - remains) + " of " +
                       std::to_string(m_length) + " bytes of " + to_string());
            break;
        }
        remains -= chunk.size();
    }

    out.flush();
    return !out.bad();
}

std::string Signature::to_string() const {
    return m_type_name + " at " + log::hex(m_offset) + " of length " +
           log::hex(m_length);
}

void Signature::seek(int64_t offset, std::ios::seekdir whence) {
    if (whence == std::ios::cur) {
        m_volume.seek_file_area(offset, std::ios::cur);
    } else {
        m_volume.seek_file_area(static_cast<int64_t>(m_offset) + offset);
    }
}

std::vector<unsigned char> Signature::read(std::size_t size) {
    return m_volume.read(size);
}

std::vector<unsigned char> Signature::read_exact(std::size_t size) {
    auto data = m_volume.read(size);
    if (data.size() != size) {
        throw ReadError("Short read in " + m_type_name + " at " +
                        log::hex(m_offset));
    }
    return data;
}

uint8_t Signature::read_u8() { return read_exact(1)[0]; }

uint16_t Signature::read_u16() { return load_u16(read_exact(2).data(), m_endian); }

uint32_t Signature::read_u32() { return load_u32(read_exact(4).data(), m_endian); }

uint64_t Signature::read_u64() { return load_u64(read_exact(8).data(), m_endian); }

float Signature::read_float() { return load_float(read_exact(4).data(), m_endian); }

double Signature::read_double() {
    return load_double(read_exact(8).data(), m_endian);
}

std::vector<uint8_t> Signature::read_terminated_bytes(std::size_t max_length) {
    std::vector<uint8_t> bytes;
    while (bytes.size() < max_length) {
        const uint8_t c = read_u8();
        if (c == 0) {
            return bytes;
        }
        bytes.push_back(c);
    }
    throw ReadError("Unterminated string in " + m_type_name + " at " +
                    log::hex(m_offset));
}

std::string Signature::read_cstring(std::size_t max_length) {
    return cp437_to_utf8(read_terminated_bytes(max_length));
}

std::string Signature::read_latin1_string(std::size_t max_length) {
    return latin1_to_utf8(read_terminated_bytes(max_length));
}

std::string Signature::read_wstring(std::size_t max_length) {
    std::string out;
    for (std::size_t n = 0; n < max_length; ++n) {
        const char16_t unit = read_u16();
        if (unit == 0) {
            return out;
        }

        char32_t cp = unit;
        if (unit >= 0xd800 && unit < 0xdc00) {
            const char16_t low = read_u16();
            if (low >= 0xdc00 && low < 0xe000) {
                cp = 0x10000 + ((unit - 0xd800) << 10) + (low - 0xdc00);
            } else {
                cp = 0xfffd;
                seek(-2, std::ios::cur);
            }
        } else if (unit >= 0xdc00 && unit < 0xe000) {
            cp = 0xfffd;
        }
        append_utf8(out, cp);
    }
    throw ReadError("Unterminated string in " + m_type_name + " at " +
                    log::hex(m_offset));
}

} // namespace fatxrec
