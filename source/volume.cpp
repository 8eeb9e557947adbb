// volume.cpp

#include <algorithm>
#include <array>
#include <cstring>
#include <fstream>
#include <stdexcept>

#include "byteorder.hpp"
#include "log.hpp"
#include "volume.hpp"

namespace fatxrec {

namespace {

constexpr std::array<unsigned char, 4> FATX_MAGIC = {'F', 'A', 'T', 'X'};
constexpr std::array<unsigned char, 4> XTAF_MAGIC = {'X', 'T', 'A', 'F'};

// signature, volume id, sectors per cluster, root directory cluster
constexpr std::size_t SUPERBLOCK_HEADER_BYTES = 16;

constexpr uint64_t FAT_ALIGNMENT = 0x1000;

} // namespace

FatxVolume::FatxVolume(std::unique_ptr<std::istream> in, uint64_t offset,
                       uint64_t length)
    : m_in(std::move(in)), m_offset(offset), m_length(length) {
    if (!m_in) {
        throw std::runtime_error("No input stream for FATX volume");
    }

    m_in->seekg(0, std::ios::end);
    const auto stream_end = m_in->tellg();
    if (stream_end < 0) {
        throw std::runtime_error("Failed to determine image size");
    }
    const auto image_size = static_cast<uint64_t>(stream_end);
    if (m_offset >= image_size) {
        throw std::runtime_error("Partition offset " + log::hex(m_offset) +
                                 " is beyond the end of the image");
    }
    if (m_length == 0 || m_length > image_size - m_offset) {
        m_length = image_size - m_offset;
    }
    if (m_length < SUPERBLOCK_SIZE) {
        throw std::runtime_error("Partition is smaller than a superblock");
    }

    seek_absolute(0);
    auto header = read(SUPERBLOCK_HEADER_BYTES);
    if (header.size() != SUPERBLOCK_HEADER_BYTES) {
        throw std::runtime_error("Failed to read FATX superblock");
    }

    if (std::memcmp(header.data(), FATX_MAGIC.data(), 4) == 0) {
        m_endian = std::endian::little;
    } else if (std::memcmp(header.data(), XTAF_MAGIC.data(), 4) == 0) {
        m_endian = std::endian::big;
    } else {
        throw std::runtime_error("Not a FATX volume (bad superblock magic)");
    }

    m_volume_id = load_u32(&header[4], m_endian);
    m_sectors_per_cluster = load_u32(&header[8], m_endian);
    m_root_dir_first_cluster = load_u32(&header[12], m_endian);

    // Retail volumes use 1 to 128 sectors per cluster.  Cap at 64 MiB.
    if (m_sectors_per_cluster == 0 ||
        !std::has_single_bit(m_sectors_per_cluster) ||
        m_sectors_per_cluster > 0x20000) {
        throw std::runtime_error("Invalid sectors per cluster: " +
                                 std::to_string(m_sectors_per_cluster));
    }
    m_bytes_per_cluster = m_sectors_per_cluster * SECTOR_SIZE;

    m_max_clusters = static_cast<uint32_t>(m_length / m_bytes_per_cluster) +
                     RESERVED_CLUSTERS;
    m_bytes_per_fat = (m_max_clusters < FATX16_LIMIT) ? 2 : 4;

    uint64_t fat_length = static_cast<uint64_t>(m_max_clusters) * m_bytes_per_fat;
    fat_length = (fat_length + FAT_ALIGNMENT - 1) & ~(FAT_ALIGNMENT - 1);
    m_file_area_byte_offset = fat_byte_offset() + fat_length;

    if (m_file_area_byte_offset > m_length) {
        throw std::runtime_error("Partition is too small for its FAT");
    }

    log::debug("FATX volume at " + log::hex(m_offset) + ": " +
               std::to_string(m_bytes_per_cluster) + " bytes per cluster, " +
               std::to_string(m_max_clusters) + " clusters, FAT" +
               std::to_string(m_bytes_per_fat * 8) + ", file area at " +
               log::hex(m_file_area_byte_offset));
}

std::unique_ptr<FatxVolume> FatxVolume::open(const std::string &filename,
                                             uint64_t offset, uint64_t length) {
    auto file = std::make_unique<std::ifstream>(filename, std::ios::binary);
    if (!file->is_open()) {
        throw std::runtime_error("Failed to open file: " + filename);
    }
    return std::make_unique<FatxVolume>(std::move(file), offset, length);
}

uint64_t FatxVolume::cluster_to_physical_offset(uint32_t cluster) const {
    const int64_t index = static_cast<int64_t>(cluster) - RESERVED_CLUSTERS;
    return static_cast<uint64_t>(static_cast<int64_t>(m_file_area_byte_offset) +
                                 index * m_bytes_per_cluster);
}

void FatxVolume::seek_to_cluster(uint32_t cluster) {
    seek_absolute(cluster_to_physical_offset(cluster));
}

void FatxVolume::seek_file_area(int64_t offset, std::ios::seekdir whence) {
    if (whence == std::ios::cur) {
        m_in->clear();
        m_in->seekg(offset, std::ios::cur);
        return;
    }
    seek_absolute(m_file_area_byte_offset + offset);
}

std::vector<unsigned char> FatxVolume::read(std::size_t size) {
    // Stop at the end of the partition, not the end of the image.
    const auto here = m_in->tellg();
    if (here < 0 || static_cast<uint64_t>(here) < m_offset) {
        return {};
    }
    const uint64_t position = static_cast<uint64_t>(here) - m_offset;
    if (position >= m_length) {
        return {};
    }
    size = static_cast<std::size_t>(std::min<uint64_t>(size, m_length - position));

    std::vector<unsigned char> buf(size);
    m_in->read(reinterpret_cast<char *>(buf.data()),
               static_cast<std::streamsize>(size));
    buf.resize(static_cast<std::size_t>(m_in->gcount()));
    return buf;
}

void FatxVolume::seek_absolute(uint64_t pos) {
    m_in->clear();
    m_in->seekg(static_cast<std::streamoff>(m_offset + pos), std::ios::beg);
}

} // namespace fatxrec
