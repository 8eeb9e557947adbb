// orphan.cpp

#include <algorithm>
#include <chrono>
#include <fstream>
#include <vector>

#include "charset.hpp"
#include "log.hpp"
#include "orphan.hpp"

namespace fatxrec {

// TODO: some genuine entries point past max_clusters; warn that their data
// will be corrupt instead of dropping them.

bool is_valid_timestamp(const std::optional<FatxTimestamp> &ts,
                        int current_year) {
    if (!ts) {
        return false;
    }

    // Only the year is compared against today.
    if (ts->year() > current_year) {
        return false;
    }

    return ts->is_constructible();
}

bool is_valid_orphan(const DirectoryEntry &entry, uint32_t max_clusters,
                     int current_year) {
    // points outside of the partition
    if (entry.first_cluster > max_clusters) {
        return false;
    }

    if (!is_valid_name(entry.file_name_bytes)) {
        return false;
    }

    if ((entry.attributes & ~attr::VALID_FILE_ATTRIBUTES) != 0) {
        return false;
    }

    return is_valid_timestamp(entry.creation_time, current_year) &&
           is_valid_timestamp(entry.last_write_time, current_year) &&
           is_valid_timestamp(entry.last_access_time, current_year);
}

bool is_valid_orphan(const DirectoryEntry &entry, const FatxVolume &volume) {
    return is_valid_orphan(entry, volume.max_clusters(), current_year());
}

int current_year() {
    const auto now = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::now());
    struct tm tm = *localtime(&now);
    return tm.tm_year + 1900;
}

void OrphanRecovery::recover(const DirectoryEntry &entry,
                             const std::filesystem::path &parent) {
    if (entry.file_name.empty() || entry.file_name == "." ||
        entry.file_name == "..") {
        log::error("Refusing to recover entry named '" + entry.file_name +
                   "' at " + log::hex(entry.offset) + " into " +
                   parent.string());
        m_stats.failures++;
        return;
    }

    const auto whole_path = parent / entry.file_name;
    log::info("Recovering: " + whole_path.string());

    if (entry.is_directory()) {
        if (recover_directory(entry, whole_path)) {
            m_stats.failures++;
            return;
        }
        m_stats.directories++;
        for (const auto &child : entry.children) {
            recover(child, whole_path);
        }
    } else {
        if (recover_file(entry, whole_path)) {
            m_stats.failures++;
        } else {
            m_stats.files++;
        }
    }

    if (auto ec = entry.apply_timestamps(whole_path)) {
        log::error("Failed to set timestamp on " + whole_path.string() + ": " +
                   ec.message());
    }
}

std::error_code
OrphanRecovery::recover_directory(const DirectoryEntry &,
                                  const std::filesystem::path &path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        log::error("Failed to create directory: " + path.string() + ": " +
                   ec.message());
    }
    return ec;
}

std::error_code
OrphanRecovery::recover_file(const DirectoryEntry &entry,
                             const std::filesystem::path &path) {
    // The FAT chain is not trusted; assume the file is contiguous.
    m_volume.seek_to_cluster(entry.first_cluster);

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        log::error("Failed to create file: " + path.string());
        return std::make_error_code(std::errc::io_error);
    }

    uint64_t remains = entry.file_size;
    while (remains > 0) {
        const auto want = static_cast<std::size_t>(
            std::min<uint64_t>(remains, COPY_CHUNK_SIZE));
        const auto chunk = m_volume.read(want);

        out.write(reinterpret_cast<const char *>(chunk.data()),
                  static_cast<std::streamsize>(chunk.size()));
        if (out.bad()) {
            log::error("Write error on " + path.string());
            return std::make_error_code(std::errc::io_error);
        }
        if (chunk.size() != want) {
            log::error("Short read at cluster " +
                       std::to_string(entry.first_cluster) + " for " +
                       path.string() + ": " +
                       std::to_string(entry.file_size - remains + chunk.size()) +
                       " of " + std::to_string(entry.file_size) + " bytes");
            return std::make_error_code(std::errc::io_error);
        }
        remains -= want;
    }

    out.flush();
    if (out.bad()) {
        log::error("Write error on " + path.string());
        return std::make_error_code(std::errc::io_error);
    }
    return {};
}

} // namespace fatxrec
