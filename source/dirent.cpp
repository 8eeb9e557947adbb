// dirent.cpp

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>

#include <fcntl.h>
#include <sys/stat.h>

#include "byteorder.hpp"
#include "charset.hpp"
#include "dirent.hpp"

namespace fatxrec {

bool FatxTimestamp::is_constructible() const {
    const std::chrono::year_month_day date{std::chrono::year{year()},
                                           std::chrono::month{month()},
                                           std::chrono::day{day()}};
    return date.ok() && hour() < 24 && minute() < 60 && second() < 60;
}

std::time_t FatxTimestamp::to_time_t() const {
    struct tm tm = {};
    tm.tm_year = year() - 1900;
    tm.tm_mon = static_cast<int>(month()) - 1;
    tm.tm_mday = static_cast<int>(day());
    tm.tm_hour = static_cast<int>(hour());
    tm.tm_min = static_cast<int>(minute());
    tm.tm_sec = static_cast<int>(second());
    return timegm(&tm);
}

std::string FatxTimestamp::to_string() const {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u %02u:%02u:%02u",
                  year(), month(), day(), hour(), minute(), second());
    return std::string(buffer);
}

FatxTimestamp FatxTimestamp::from_fields(int epoch, int year, unsigned month,
                                         unsigned day, unsigned hour,
                                         unsigned minute, unsigned second) {
    const uint32_t raw = (static_cast<uint32_t>(year - epoch) & 0x7f) << 25 |
                         (month & 0x0f) << 21 | (day & 0x1f) << 16 |
                         (hour & 0x1f) << 11 | (minute & 0x3f) << 5 |
                         ((second / 2) & 0x1f);
    return FatxTimestamp{raw, epoch};
}

std::optional<FatxTimestamp> FatxTimestamp::decode(uint32_t raw, int epoch) {
    if (raw == 0 || raw == 0xffffffff) {
        return std::nullopt;
    }
    return FatxTimestamp{raw, epoch};
}

std::error_code
DirectoryEntry::apply_timestamps(const std::filesystem::path &path) const {
    if (!last_access_time || !last_write_time ||
        !last_access_time->is_constructible() ||
        !last_write_time->is_constructible()) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    struct timespec times[2] = {};
    times[0].tv_sec = last_access_time->to_time_t();
    times[1].tv_sec = last_write_time->to_time_t();
    if (utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
        return std::error_code(errno, std::generic_category());
    }
    return {};
}

std::optional<DirectoryEntry>
DirectoryEntry::parse(std::span<const uint8_t> record, std::endian order,
                      int epoch) {
    if (record.size() < RECORD_SIZE) {
        return std::nullopt;
    }

    DirectoryEntry entry;
    entry.file_name_length = record[0];
    if (entry.file_name_length == END_OF_DIRECTORY ||
        entry.file_name_length == UNUSED) {
        return std::nullopt;
    }
    if (entry.file_name_length > MAX_NAME_LENGTH && !entry.is_deleted()) {
        return std::nullopt;
    }

    entry.attributes = record[1];

    const auto raw_name = record.subspan(2, MAX_NAME_LENGTH);
    std::size_t name_length;
    if (entry.is_deleted()) {
        // The length byte is overwritten on deletion; names are padded
        // with 0xff.
        name_length = static_cast<std::size_t>(
            std::find(raw_name.begin(), raw_name.end(), UNUSED) -
            raw_name.begin());
    } else {
        name_length = entry.file_name_length;
    }
    entry.file_name_bytes.assign(raw_name.begin(),
                                 raw_name.begin() + name_length);
    entry.file_name = cp437_to_utf8(entry.file_name_bytes);

    const unsigned char *p = record.data();
    entry.first_cluster = load_u32(p + 0x2c, order);
    entry.file_size = load_u32(p + 0x30, order);
    entry.creation_time = FatxTimestamp::decode(load_u32(p + 0x34, order), epoch);
    entry.last_write_time = FatxTimestamp::decode(load_u32(p + 0x38, order), epoch);
    entry.last_access_time = FatxTimestamp::decode(load_u32(p + 0x3c, order), epoch);

    return entry;
}

} // namespace fatxrec
