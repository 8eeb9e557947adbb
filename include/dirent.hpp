/**
 * @file dirent.hpp
 * @brief FATX directory entry records and their packed timestamps
 * @copyright Released under the GNU GPL 3 License.
 */

#ifndef DIRENT_H_
#define DIRENT_H_

#include <bit>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace fatxrec {

namespace attr {
constexpr uint8_t READONLY = 0x01;
constexpr uint8_t HIDDEN = 0x02;
constexpr uint8_t SYSTEM = 0x04;
constexpr uint8_t DIRECTORY = 0x10;
constexpr uint8_t ARCHIVE = 0x20;
constexpr uint8_t DEVICE = 0x40;
constexpr uint8_t NORMAL = 0x80;

constexpr uint8_t VALID_FILE_ATTRIBUTES =
    READONLY | HIDDEN | SYSTEM | DIRECTORY | ARCHIVE | DEVICE | NORMAL;
} // namespace attr

//! A packed FAT-style date and time.  Date in the upper 16 bits, time in
//! the lower 16 bits, seconds stored halved.
struct FatxTimestamp {
    uint32_t raw = 0;
    int epoch = 2000;

    int year() const { return static_cast<int>((raw >> 25) & 0x7f) + epoch; }
    unsigned month() const { return (raw >> 21) & 0x0f; }
    unsigned day() const { return (raw >> 16) & 0x1f; }
    unsigned hour() const { return (raw >> 11) & 0x1f; }
    unsigned minute() const { return (raw >> 5) & 0x3f; }
    unsigned second() const { return (raw & 0x1f) * 2; }

    //! Tests if the fields form a real calendar date and time of day.
    bool is_constructible() const;

    //! Seconds since the Unix epoch, treating the stamp as UTC.
    std::time_t to_time_t() const;

    //! "YYYY-MM-DD hh:mm:ss"
    std::string to_string() const;

    static FatxTimestamp from_fields(int epoch, int year, unsigned month,
                                     unsigned day, unsigned hour = 0,
                                     unsigned minute = 0, unsigned second = 0);

    //! Unused slots hold all-zero or all-one stamps; both decode as absent.
    static std::optional<FatxTimestamp> decode(uint32_t raw, int epoch);
};

//! One 64-byte directory entry record.
struct DirectoryEntry {
    static constexpr std::size_t RECORD_SIZE = 0x40;
    static constexpr std::size_t MAX_NAME_LENGTH = 42;
    static constexpr uint8_t DELETED = 0xe5;
    static constexpr uint8_t END_OF_DIRECTORY = 0x00;
    static constexpr uint8_t UNUSED = 0xff;

    uint8_t file_name_length = 0;
    uint8_t attributes = 0;
    std::vector<uint8_t> file_name_bytes;
    std::string file_name;
    uint32_t first_cluster = 0;
    uint32_t file_size = 0;
    std::optional<FatxTimestamp> creation_time;
    std::optional<FatxTimestamp> last_write_time;
    std::optional<FatxTimestamp> last_access_time;

    //! Entries stored in this directory's first cluster, in on-disk order.
    std::vector<DirectoryEntry> children;

    //! Cluster and partition-relative offset of the record itself.
    uint32_t cluster = 0;
    uint64_t offset = 0;

    bool is_directory() const { return (attributes & attr::DIRECTORY) != 0; }
    bool is_deleted() const { return file_name_length == DELETED; }

    //! Sets the access and modification times of \p path from this entry.
    //! Creation time cannot be set on POSIX filesystems and is skipped.
    std::error_code apply_timestamps(const std::filesystem::path &path) const;

    //! Decodes a raw record.  Returns nothing for end-of-directory and unused
    //! slots or a name length that no live or deleted entry can have.
    static std::optional<DirectoryEntry>
    parse(std::span<const uint8_t> record, std::endian order, int epoch);
};

} // namespace fatxrec

#endif // DIRENT_H_
