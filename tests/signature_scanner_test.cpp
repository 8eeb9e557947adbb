#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>

#include "signature_scanner.hpp"
#include "test_image.hpp"

using namespace fatxrec;
using namespace fatxrec::test;
namespace fs = std::filesystem;

namespace {

struct CallCounts {
    unsigned created = 0;
    unsigned tested = 0;
    unsigned parsed = 0;
};

//! "MAGC" followed by data; always eight bytes long.
class MagicSignature : public Signature {
  public:
    static constexpr std::string_view TYPE_NAME = "MagicSignature";

    MagicSignature(uint64_t offset, FatxVolume &volume, CallCounts &counts)
        : Signature(TYPE_NAME, offset, volume), m_counts(counts) {}

    bool test() override {
        m_counts.tested++;
        const auto magic = read(4);
        return magic == std::vector<unsigned char>{'M', 'A', 'G', 'C'};
    }

    void parse() override {
        m_counts.parsed++;
        set_length(8);
    }

  private:
    CallCounts &m_counts;
};

//! Matches "MAGC" but its length field lies past the end of the image.
class BrokenSignature : public Signature {
  public:
    BrokenSignature(uint64_t offset, FatxVolume &volume)
        : Signature("BrokenSignature", offset, volume) {}

    bool test() override {
        return read(4) == std::vector<unsigned char>{'M', 'A', 'G', 'C'};
    }

    void parse() override {
        set_length(4);
        seek(0x100000);
        set_length(read_u32());
    }
};

//! Reads a word 0x300 bytes in, which runs off the end near the image end.
class FarSignature : public Signature {
  public:
    FarSignature(uint64_t offset, FatxVolume &volume)
        : Signature("FarSignature", offset, volume) {}

    bool test() override {
        seek(0x300);
        return read_u32() == 0xffffffff;
    }
    void parse() override {}
};

SignatureRegistry::Factory magic_factory(CallCounts &counts) {
    return [&counts](uint64_t offset, FatxVolume &volume) {
        counts.created++;
        return std::make_unique<MagicSignature>(offset, volume, counts);
    };
}

const std::vector<uint8_t> MAGIC_RECORD = {'M', 'A', 'G', 'C', 1, 2, 3, 4};

} // namespace

class SignatureScannerTest : public ::testing::Test {
  protected:
    void SetUp() override {
        m_image.write(0x200, MAGIC_RECORD);
        m_image.write(0x1000, MAGIC_RECORD);
        m_image.write(0x1234, MAGIC_RECORD);
        m_volume = m_image.volume();
    }

    ImageBuilder m_image{8, 4};
    std::unique_ptr<FatxVolume> m_volume;
};

TEST_F(SignatureScannerTest, FindsMagicAtInterval) {
    CallCounts counts;
    SignatureRegistry registry;
    registry.add("MagicSignature", magic_factory(counts));

    SignatureScanner scanner(*m_volume, registry);
    EXPECT_EQ(scanner.scan(0x200), 2u);

    const auto &results = scanner.results();
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0]->offset(), 0x200u);
    EXPECT_EQ(results[1]->offset(), 0x1000u);
    EXPECT_EQ(results[0]->length(), 8u);

    // one candidate per offset, parse only after a match
    EXPECT_EQ(counts.created, 0x4000u / 0x200);
    EXPECT_EQ(counts.tested, counts.created);
    EXPECT_EQ(counts.parsed, 2u);
}

TEST_F(SignatureScannerTest, FinerIntervalFindsUnalignedMatches) {
    CallCounts counts;
    SignatureRegistry registry;
    registry.add("MagicSignature", magic_factory(counts));

    SignatureScanner scanner(*m_volume, registry);
    EXPECT_EQ(scanner.scan(4), 3u);
    EXPECT_EQ(scanner.results()[2]->offset(), 0x1234u);
}

TEST_F(SignatureScannerTest, LengthLimitsTheScan) {
    CallCounts counts;
    SignatureRegistry registry;
    registry.add("MagicSignature", magic_factory(counts));

    SignatureScanner scanner(*m_volume, registry);
    EXPECT_EQ(scanner.scan(0x200, 0x800), 1u);
    EXPECT_EQ(counts.created, 4u);
}

TEST_F(SignatureScannerTest, ParseReadErrorKeepsMatchWithoutLength) {
    SignatureRegistry registry;
    registry.add("BrokenSignature", [](uint64_t offset, FatxVolume &volume) {
        return std::make_unique<BrokenSignature>(offset, volume);
    });

    SignatureScanner scanner(*m_volume, registry);
    ASSERT_EQ(scanner.scan(0x200), 2u);
    EXPECT_EQ(scanner.results()[0]->length(), 0u);

    TempDir out;
    EXPECT_EQ(scanner.recover_all(out.path()), 2u);
    EXPECT_EQ(fs::file_size(out.path() / "BrokenSignature" / "brokensignature1"),
              0u);
}

TEST_F(SignatureScannerTest, TestReadErrorIsNoMatch) {
    SignatureRegistry registry;
    registry.add("FarSignature", [](uint64_t offset, FatxVolume &volume) {
        return std::make_unique<FarSignature>(offset, volume);
    });

    SignatureScanner scanner(*m_volume, registry);
    EXPECT_EQ(scanner.scan(0x200), 0u);
}

TEST_F(SignatureScannerTest, FilterSelectsSignatures) {
    CallCounts magic;
    CallCounts other;
    SignatureRegistry registry;
    registry.add("MagicSignature", magic_factory(magic));
    registry.add("OtherSignature", magic_factory(other));

    SignatureScanner scanner(*m_volume, registry);
    scanner.set_filter({"OtherSignature"});
    EXPECT_EQ(scanner.scan(0x200), 2u);
    EXPECT_EQ(magic.created, 0u);
    EXPECT_GT(other.created, 0u);

    scanner.set_filter({});
    EXPECT_EQ(scanner.scan(0x200), 4u);
}

TEST_F(SignatureScannerTest, RecoversIntoTypeDirectories) {
    CallCounts counts;
    SignatureRegistry registry;
    registry.add("MagicSignature", magic_factory(counts));

    SignatureScanner scanner(*m_volume, registry);
    scanner.scan(0x200);

    TempDir out;
    EXPECT_EQ(scanner.recover_all(out.path()), 2u);

    const auto dir = out.path() / "MagicSignature";
    EXPECT_EQ(read_file(dir / "magicsignature1"), MAGIC_RECORD);
    EXPECT_EQ(read_file(dir / "magicsignature2"), MAGIC_RECORD);
    EXPECT_FALSE(fs::exists(dir / "magicsignature3"));
}

TEST_F(SignatureScannerTest, RejectsZeroInterval) {
    SignatureRegistry registry;
    SignatureScanner scanner(*m_volume, registry);
    EXPECT_THROW(scanner.scan(0), std::invalid_argument);
}

TEST_F(SignatureScannerTest, FactoryMustReturnASignature) {
    SignatureRegistry registry;
    registry.add("NullSignature", [](uint64_t, FatxVolume &) {
        return std::unique_ptr<Signature>();
    });

    SignatureScanner scanner(*m_volume, registry);
    EXPECT_THROW(scanner.scan(0x200), std::logic_error);
}
