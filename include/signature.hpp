/**
 * @file signature.hpp
 * @brief Base class for file carving signatures
 * @copyright Released under the GNU GPL 3 License.
 *
 * To add a file format, derive from Signature and implement test() and
 * parse().
 *
 * test() checks whether the data at the signature's offset looks like the
 * format, typically by comparing a magic number.  It is called for every
 * registered signature at every scanned offset, so it should read little.
 *
 * parse() is called only after test() returned true.  It reads further into
 * the format to fill in the length to extract, and optionally a file name.
 * A length of zero (the default) extracts nothing; the file is still dumped
 * as an empty file.
 */

#ifndef SIGNATURE_H_
#define SIGNATURE_H_

#include <bit>
#include <cstdint>
#include <filesystem>
#include <ios>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "volume.hpp"

namespace fatxrec {

//! A fixed-width read ran past the end of the image.
class ReadError : public std::runtime_error {
  public:
    explicit ReadError(const std::string &message)
        : std::runtime_error(message) {}
};

//! Hands out generated file names, one counter per signature type.
//! One namer lives for one scan run.
class SignatureNamer {
  public:
    //! Returns "<lowercased type name><N>", N counting from 1 per type.
    std::string next_name(std::string_view type_name);

  private:
    std::map<std::string, unsigned, std::less<>> m_counters;
};

class Signature {
  public:
    //! Length value meaning "unknown, do not extract".
    static constexpr uint64_t UNKNOWN_LENGTH = 0xffffffff;

    static constexpr std::size_t COPY_CHUNK_SIZE = 0x100000;

    //! \p offset is relative to the start of the volume's file area.
    Signature(std::string_view type_name, uint64_t offset, FatxVolume &volume);
    virtual ~Signature() = default;

    Signature(const Signature &) = delete;
    Signature &operator=(const Signature &) = delete;

    //! Tests whether the data at offset() begins this format.
    virtual bool test() = 0;

    //! Reads the format to determine length() and optionally name().
    virtual void parse() = 0;

    //! Writes up to length() bytes from offset() to \p dir / file name.
    //! A parsed name that already exists in \p dir gets the offset appended
    //! to its stem.  Returns false if the output file could not be written.
    bool recover(const std::filesystem::path &dir, SignatureNamer &namer);

    //! The parsed name, or a generated one.
    std::string get_file_name(SignatureNamer &namer) const;

    const std::string &type_name() const { return m_type_name; }
    uint64_t offset() const { return m_offset; }
    uint64_t length() const { return m_length; }
    void set_length(uint64_t length) { m_length = length; }
    const std::optional<std::string> &name() const { return m_name; }
    void set_name(std::string name) { m_name = std::move(name); }

    std::string to_string() const;

    //! Seeks relative to offset().
    void seek(int64_t offset, std::ios::seekdir whence = std::ios::beg);

    //! Reads up to \p size bytes; fewer at the end of the image.
    std::vector<unsigned char> read(std::size_t size);

    uint8_t read_u8();
    uint16_t read_u16();
    uint32_t read_u32();
    uint64_t read_u64();
    float read_float();
    double read_double();

    //! Reads a NUL-terminated code page 437 string, returned as UTF-8.
    std::string read_cstring(std::size_t max_length = 0x100);

    //! Reads a NUL-terminated ISO-8859-1 string, returned as UTF-8.
    std::string read_latin1_string(std::size_t max_length = 0x100);

    //! Reads a NUL-terminated UTF-16 string in the working byte order,
    //! returned as UTF-8.
    std::string read_wstring(std::size_t max_length = 0x100);

    //! Switches the working byte order; formats may mix both.
    void set_endian(std::endian order) { m_endian = order; }
    std::endian endian() const { return m_endian; }

  protected:
    FatxVolume &volume() { return m_volume; }

  private:
    std::vector<unsigned char> read_exact(std::size_t size);
    std::vector<uint8_t> read_terminated_bytes(std::size_t max_length);

    std::string m_type_name;
    uint64_t m_offset;
    FatxVolume &m_volume;
    std::endian m_endian;
    uint64_t m_length = 0;
    std::optional<std::string> m_name;
};

} // namespace fatxrec

#endif // SIGNATURE_H_
