/**
 * @file orphan.hpp
 * @brief Validation and recovery of directory entries found by raw scanning
 * @copyright Released under the GNU GPL 3 License.
 *
 * An orphan is a directory entry whose parent linkage and FAT chain cannot be
 * trusted.  Orphans are checked for plausibility and their data is dumped
 * from sequential clusters instead of following the allocation table.
 */

#ifndef ORPHAN_H_
#define ORPHAN_H_

#include <cstdint>
#include <filesystem>
#include <optional>

#include "dirent.hpp"
#include "volume.hpp"

namespace fatxrec {

//! Tests if a timestamp is present, constructible, and not in a year after
//! \p current_year.  Dates later in the current year are accepted.
bool is_valid_timestamp(const std::optional<FatxTimestamp> &ts,
                        int current_year);

//! Tests if a recovered entry is plausible: first cluster inside the volume,
//! name bytes from the FATX character set, known attribute bits only, and
//! three valid timestamps.
bool is_valid_orphan(const DirectoryEntry &entry, uint32_t max_clusters,
                     int current_year);

//! As above, against the volume geometry and today's year.
bool is_valid_orphan(const DirectoryEntry &entry, const FatxVolume &volume);

//! The current calendar year (local time).
int current_year();

struct RecoveryStats {
    uint64_t files = 0;
    uint64_t directories = 0;
    uint64_t failures = 0;
};

//! Writes orphan entries to a local directory tree.
class OrphanRecovery {
  public:
    static constexpr std::size_t COPY_CHUNK_SIZE = 0x100000;

    explicit OrphanRecovery(FatxVolume &volume) : m_volume(volume) {}

    //! Recovers \p entry into \p parent / entry.file_name.  Directories are
    //! created and their children recovered in order.  Failures are logged
    //! and stop only this entry.
    void recover(const DirectoryEntry &entry,
                 const std::filesystem::path &parent);

    //! Extension point for directory-specific rescue heuristics.
    void rescue_dir(const DirectoryEntry &, const std::filesystem::path &) {}

    const RecoveryStats &stats() const { return m_stats; }

  private:
    std::error_code recover_directory(const DirectoryEntry &entry,
                                      const std::filesystem::path &path);
    std::error_code recover_file(const DirectoryEntry &entry,
                                 const std::filesystem::path &path);

    FatxVolume &m_volume;
    RecoveryStats m_stats;
};

} // namespace fatxrec

#endif // ORPHAN_H_
