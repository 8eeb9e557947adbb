// test_image.hpp - builds small FATX partitions in memory for tests

#ifndef TEST_IMAGE_H_
#define TEST_IMAGE_H_

#include <algorithm>
#include <bit>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "dirent.hpp"
#include "volume.hpp"

namespace fatxrec::test {

inline void store_u32(std::vector<uint8_t> &buf, uint64_t pos, uint32_t value,
                      std::endian order) {
    for (unsigned i = 0; i < 4; ++i) {
        const unsigned shift = (order == std::endian::little) ? 8 * i : 8 * (3 - i);
        buf[pos + i] = static_cast<uint8_t>(value >> shift);
    }
}

struct DirentFields {
    std::string name;
    uint8_t attributes = 0;
    uint32_t first_cluster = 0;
    uint32_t file_size = 0;
    uint32_t creation = 0;
    uint32_t last_write = 0;
    uint32_t last_access = 0;
    bool deleted = false;
};

//! A FATX partition laid out the way FatxVolume computes its geometry.
class ImageBuilder {
  public:
    ImageBuilder(uint32_t sectors_per_cluster, uint32_t data_clusters,
                 std::endian order = std::endian::little)
        : m_order(order), m_bytes_per_cluster(sectors_per_cluster * 512) {
        uint64_t fat_length = 0x1000;
        for (;;) {
            const uint64_t length = FatxVolume::SUPERBLOCK_SIZE + fat_length +
                                    uint64_t{data_clusters} * m_bytes_per_cluster;
            const uint64_t max_clusters = length / m_bytes_per_cluster + 1;
            const uint64_t per_entry = max_clusters < 0xfff0 ? 2 : 4;
            const uint64_t needed = (max_clusters * per_entry + 0xfff) & ~0xfffull;
            if (needed == fat_length) {
                m_file_area = FatxVolume::SUPERBLOCK_SIZE + fat_length;
                m_bytes.assign(length, 0);
                break;
            }
            fat_length = needed;
        }

        const char *magic = (order == std::endian::little) ? "FATX" : "XTAF";
        std::copy(magic, magic + 4, m_bytes.begin());
        store_u32(m_bytes, 4, 0x12345678, order);
        store_u32(m_bytes, 8, sectors_per_cluster, order);
        store_u32(m_bytes, 12, 1, order);
    }

    int epoch() const { return m_order == std::endian::little ? 2000 : 1980; }

    uint64_t file_area() const { return m_file_area; }
    uint32_t bytes_per_cluster() const { return m_bytes_per_cluster; }

    uint64_t cluster_offset(uint32_t cluster) const {
        return m_file_area + uint64_t{cluster - 1} * m_bytes_per_cluster;
    }

    std::vector<uint8_t> &bytes() { return m_bytes; }

    //! Writes \p data at a file-area-relative offset.
    void write(uint64_t offset, const std::vector<uint8_t> &data) {
        std::copy(data.begin(), data.end(), m_bytes.begin() + m_file_area + offset);
    }

    void write_u32(uint64_t offset, uint32_t value) {
        store_u32(m_bytes, m_file_area + offset, value, m_order);
    }

    void write_dirent(uint32_t cluster, unsigned slot, const DirentFields &d) {
        const uint64_t pos = cluster_offset(cluster) + slot * 0x40;
        m_bytes[pos] = d.deleted ? 0xe5 : static_cast<uint8_t>(d.name.size());
        m_bytes[pos + 1] = d.attributes;
        std::fill(m_bytes.begin() + pos + 2, m_bytes.begin() + pos + 44, 0xff);
        std::copy(d.name.begin(), d.name.end(), m_bytes.begin() + pos + 2);
        store_u32(m_bytes, pos + 0x2c, d.first_cluster, m_order);
        store_u32(m_bytes, pos + 0x30, d.file_size, m_order);
        store_u32(m_bytes, pos + 0x34, d.creation, m_order);
        store_u32(m_bytes, pos + 0x38, d.last_write, m_order);
        store_u32(m_bytes, pos + 0x3c, d.last_access, m_order);
    }

    //! Fills clusters with a recognisable pseudo-random pattern and returns
    //! it.
    std::vector<uint8_t> fill_clusters(uint32_t first, uint32_t count,
                                       uint32_t seed = 1) {
        std::mt19937 rng(seed);
        std::vector<uint8_t> data(uint64_t{count} * m_bytes_per_cluster);
        for (auto &b : data) {
            b = static_cast<uint8_t>(rng());
        }
        std::copy(data.begin(), data.end(), m_bytes.begin() + cluster_offset(first));
        return data;
    }

    std::unique_ptr<FatxVolume> volume() const {
        std::string image(m_bytes.begin(), m_bytes.end());
        return std::make_unique<FatxVolume>(
            std::make_unique<std::istringstream>(std::move(image)));
    }

  private:
    std::endian m_order;
    uint32_t m_bytes_per_cluster;
    uint64_t m_file_area = 0;
    std::vector<uint8_t> m_bytes;
};

inline uint32_t stamp(int epoch, int year, unsigned month, unsigned day,
                      unsigned hour = 0, unsigned minute = 0,
                      unsigned second = 0) {
    return FatxTimestamp::from_fields(epoch, year, month, day, hour, minute,
                                      second)
        .raw;
}

inline std::vector<uint8_t> read_file(const std::filesystem::path &path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in),
                                std::istreambuf_iterator<char>());
}

//! A fresh directory under the system temp directory, removed on scope exit.
class TempDir {
  public:
    TempDir() {
        const auto tick =
            std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = std::filesystem::temp_directory_path() /
                 ("fatxrec-test-" + std::to_string(tick) + "-" +
                  std::to_string(s_counter++));
        std::filesystem::create_directories(m_path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }
    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const { return m_path; }

  private:
    static inline unsigned s_counter = 0;
    std::filesystem::path m_path;
};

} // namespace fatxrec::test

#endif // TEST_IMAGE_H_
