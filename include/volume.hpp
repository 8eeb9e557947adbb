/**
 * @file volume.hpp
 * @brief Read-only access to a FATX partition inside an image file
 * @copyright Released under the GNU GPL 3 License.
 */

#ifndef VOLUME_H_
#define VOLUME_H_

#include <bit>
#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace fatxrec {

//! A FATX partition: superblock, cluster geometry and the shared read cursor.
//!
//! Every seek and read moves the one cursor of the underlying stream, so a
//! volume must not be used from more than one thread.
class FatxVolume {
  public:
    static constexpr uint32_t SECTOR_SIZE = 512;
    static constexpr uint64_t SUPERBLOCK_SIZE = 0x1000;
    static constexpr uint32_t RESERVED_CLUSTERS = 1;
    static constexpr uint32_t FATX16_LIMIT = 0xfff0;

    //! Reads the superblock of the partition at \p offset.  A \p length of 0
    //! extends the partition to the end of the stream.
    //! Throws std::runtime_error if the partition is not a usable FATX volume.
    FatxVolume(std::unique_ptr<std::istream> in, uint64_t offset = 0,
               uint64_t length = 0);

    //! Opens an image file and reads the partition at \p offset.
    static std::unique_ptr<FatxVolume>
    open(const std::string &filename, uint64_t offset = 0, uint64_t length = 0);

    std::istream &infile() { return *m_in; }

    //! Byte order of the on-disk structures ("FATX" little, "XTAF" big).
    std::endian endian() const { return m_endian; }

    //! Year that a raw timestamp year of zero stands for.
    int timestamp_epoch() const {
        return m_endian == std::endian::little ? 2000 : 1980;
    }

    uint64_t offset() const { return m_offset; }
    uint64_t length() const { return m_length; }
    uint32_t volume_id() const { return m_volume_id; }
    uint32_t sectors_per_cluster() const { return m_sectors_per_cluster; }
    uint32_t root_dir_first_cluster() const { return m_root_dir_first_cluster; }
    uint32_t bytes_per_cluster() const { return m_bytes_per_cluster; }
    uint32_t max_clusters() const { return m_max_clusters; }
    uint32_t bytes_per_fat() const { return m_bytes_per_fat; }
    uint64_t fat_byte_offset() const { return SUPERBLOCK_SIZE; }
    uint64_t file_area_byte_offset() const { return m_file_area_byte_offset; }
    uint64_t file_area_length() const { return m_length - m_file_area_byte_offset; }

    //! Number of whole clusters in the file area.
    uint32_t file_area_clusters() const {
        return static_cast<uint32_t>(file_area_length() / m_bytes_per_cluster);
    }

    //! Partition-relative offset of a cluster.  Cluster 1 is the first
    //! cluster of the file area.
    uint64_t cluster_to_physical_offset(uint32_t cluster) const;

    void seek_to_cluster(uint32_t cluster);

    //! Seeks relative to the start of the file area (std::ios::beg) or to the
    //! current position (std::ios::cur).
    void seek_file_area(int64_t offset,
                        std::ios::seekdir whence = std::ios::beg);

    //! Reads up to \p size bytes at the cursor.  Fewer bytes are returned at
    //! the end of the partition or the image.
    std::vector<unsigned char> read(std::size_t size);

  private:
    void seek_absolute(uint64_t pos);

    std::unique_ptr<std::istream> m_in;
    uint64_t m_offset;
    uint64_t m_length;
    std::endian m_endian;
    uint32_t m_volume_id;
    uint32_t m_sectors_per_cluster;
    uint32_t m_root_dir_first_cluster;
    uint32_t m_bytes_per_cluster;
    uint32_t m_max_clusters;
    uint32_t m_bytes_per_fat;
    uint64_t m_file_area_byte_offset;
};

} // namespace fatxrec

#endif // VOLUME_H_
