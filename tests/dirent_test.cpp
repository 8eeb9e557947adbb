#include <gtest/gtest.h>

#include <fstream>
#include <span>

#include <sys/stat.h>

#include "dirent.hpp"
#include "test_image.hpp"

using namespace fatxrec;
using namespace fatxrec::test;

namespace {

std::vector<uint8_t> record_from(ImageBuilder &image, uint32_t cluster,
                                 unsigned slot) {
    const auto pos = image.cluster_offset(cluster) + slot * 0x40;
    return std::vector<uint8_t>(image.bytes().begin() + pos,
                                image.bytes().begin() + pos + 0x40);
}

} // namespace

TEST(TimestampTest, DecodesPackedFields) {
    const auto ts = FatxTimestamp::from_fields(2000, 2009, 11, 22, 13, 45, 58);
    EXPECT_EQ(ts.year(), 2009);
    EXPECT_EQ(ts.month(), 11u);
    EXPECT_EQ(ts.day(), 22u);
    EXPECT_EQ(ts.hour(), 13u);
    EXPECT_EQ(ts.minute(), 45u);
    EXPECT_EQ(ts.second(), 58u);
    EXPECT_TRUE(ts.is_constructible());
    EXPECT_EQ(ts.to_string(), "2009-11-22 13:45:58");
}

TEST(TimestampTest, EpochDependsOnConsole) {
    const uint32_t raw = stamp(2000, 2005, 6, 1);
    EXPECT_EQ(FatxTimestamp::decode(raw, 2000)->year(), 2005);
    EXPECT_EQ(FatxTimestamp::decode(raw, 1980)->year(), 1985);
}

TEST(TimestampTest, EmptyStampsAreAbsent) {
    EXPECT_FALSE(FatxTimestamp::decode(0, 2000).has_value());
    EXPECT_FALSE(FatxTimestamp::decode(0xffffffff, 2000).has_value());
    EXPECT_TRUE(FatxTimestamp::decode(1, 2000).has_value());
}

TEST(TimestampTest, RejectsImpossibleCalendarValues) {
    EXPECT_FALSE(FatxTimestamp::from_fields(2000, 2010, 13, 1).is_constructible());
    EXPECT_FALSE(FatxTimestamp::from_fields(2000, 2010, 0, 1).is_constructible());
    EXPECT_FALSE(FatxTimestamp::from_fields(2000, 2010, 2, 30).is_constructible());
    EXPECT_FALSE(FatxTimestamp::from_fields(2000, 2010, 1, 0).is_constructible());
    EXPECT_FALSE(FatxTimestamp::from_fields(2000, 2010, 1, 1, 24).is_constructible());
    EXPECT_FALSE(FatxTimestamp::from_fields(2000, 2010, 1, 1, 0, 61).is_constructible());
    EXPECT_FALSE(FatxTimestamp::from_fields(2000, 2010, 1, 1, 0, 0, 60).is_constructible());
    EXPECT_TRUE(FatxTimestamp::from_fields(2000, 2012, 2, 29).is_constructible());
}

TEST(DirentTest, ParsesLittleEndianRecord) {
    ImageBuilder image(8, 2);
    image.write_dirent(1, 0,
                       {.name = "default.xbe",
                        .attributes = attr::ARCHIVE,
                        .first_cluster = 2,
                        .file_size = 0x1234,
                        .creation = stamp(2000, 2003, 4, 5, 6, 7, 8),
                        .last_write = stamp(2000, 2004, 1, 1),
                        .last_access = stamp(2000, 2005, 12, 31)});

    const auto record = record_from(image, 1, 0);
    auto entry = DirectoryEntry::parse(record, std::endian::little, 2000);

    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->file_name, "default.xbe");
    EXPECT_EQ(entry->file_name_bytes.size(), 11u);
    EXPECT_EQ(entry->attributes, attr::ARCHIVE);
    EXPECT_FALSE(entry->is_directory());
    EXPECT_FALSE(entry->is_deleted());
    EXPECT_EQ(entry->first_cluster, 2u);
    EXPECT_EQ(entry->file_size, 0x1234u);
    ASSERT_TRUE(entry->creation_time.has_value());
    EXPECT_EQ(entry->creation_time->to_string(), "2003-04-05 06:07:08");
    EXPECT_EQ(entry->last_write_time->year(), 2004);
    EXPECT_EQ(entry->last_access_time->day(), 31u);
}

TEST(DirentTest, ParsesBigEndianRecord) {
    ImageBuilder image(32, 2, std::endian::big);
    image.write_dirent(1, 3,
                       {.name = "Content",
                        .attributes = attr::DIRECTORY,
                        .first_cluster = 0x01020304,
                        .creation = stamp(1980, 2011, 8, 9),
                        .last_write = stamp(1980, 2011, 8, 9),
                        .last_access = stamp(1980, 2011, 8, 9)});

    const auto record = record_from(image, 1, 3);
    auto entry = DirectoryEntry::parse(record, std::endian::big, 1980);

    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->file_name, "Content");
    EXPECT_TRUE(entry->is_directory());
    EXPECT_EQ(entry->first_cluster, 0x01020304u);
    EXPECT_EQ(entry->creation_time->year(), 2011);
}

TEST(DirentTest, DeletedRecordNameEndsAtPadding) {
    ImageBuilder image(8, 2);
    image.write_dirent(1, 0, {.name = "gone.sav", .deleted = true});

    auto entry = DirectoryEntry::parse(record_from(image, 1, 0),
                                       std::endian::little, 2000);
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(entry->is_deleted());
    EXPECT_EQ(entry->file_name, "gone.sav");
    EXPECT_FALSE(entry->creation_time.has_value());
}

TEST(DirentTest, SkipsEndMarkersAndBadLengths) {
    std::vector<uint8_t> record(0x40, 0);
    EXPECT_FALSE(DirectoryEntry::parse(record, std::endian::little, 2000));

    record[0] = 0xff;
    EXPECT_FALSE(DirectoryEntry::parse(record, std::endian::little, 2000));

    record[0] = 43;
    EXPECT_FALSE(DirectoryEntry::parse(record, std::endian::little, 2000));

    record[0] = 42;
    EXPECT_TRUE(DirectoryEntry::parse(record, std::endian::little, 2000));

    const std::span<const uint8_t> short_record(record.data(), 0x20);
    EXPECT_FALSE(DirectoryEntry::parse(short_record, std::endian::little, 2000));
}

TEST(DirentTest, AppliesTimestampsToFile) {
    TempDir dir;
    const auto path = dir.path() / "stamped";
    std::ofstream(path) << "x";

    DirectoryEntry entry;
    entry.last_write_time = FatxTimestamp::from_fields(2000, 2006, 3, 4, 5, 6, 8);
    entry.last_access_time = FatxTimestamp::from_fields(2000, 2007, 1, 2);
    entry.creation_time = entry.last_write_time;

    EXPECT_FALSE(entry.apply_timestamps(path));

    struct stat st;
    ASSERT_EQ(stat(path.c_str(), &st), 0);
    EXPECT_EQ(st.st_mtime, entry.last_write_time->to_time_t());
    EXPECT_EQ(st.st_atime, entry.last_access_time->to_time_t());
}

TEST(DirentTest, TimestampFailuresAreReported) {
    TempDir dir;
    DirectoryEntry entry;
    entry.last_write_time = FatxTimestamp::from_fields(2000, 2006, 3, 4);
    entry.last_access_time = FatxTimestamp::from_fields(2000, 2006, 3, 4);

    EXPECT_TRUE(entry.apply_timestamps(dir.path() / "missing"));

    entry.last_access_time.reset();
    EXPECT_TRUE(entry.apply_timestamps(dir.path()));
}
