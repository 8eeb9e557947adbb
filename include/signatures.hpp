// signatures.hpp

#ifndef SIGNATURES_H_
#define SIGNATURES_H_

#include <cstdint>
#include <string_view>

#include "signature.hpp"

namespace fatxrec {

//! Xbox executable.
class XbeSignature : public Signature {
  public:
    static constexpr std::string_view TYPE_NAME = "XBESignature";

    XbeSignature(uint64_t offset, FatxVolume &volume)
        : Signature(TYPE_NAME, offset, volume) {}

    bool test() override;
    void parse() override;
};

//! Xbox 360 executable.
class XexSignature : public Signature {
  public:
    static constexpr std::string_view TYPE_NAME = "XEXSignature";

    XexSignature(uint64_t offset, FatxVolume &volume)
        : Signature(TYPE_NAME, offset, volume) {}

    bool test() override;
    void parse() override;
};

//! MSF 7.00 program database.
class PdbSignature : public Signature {
  public:
    static constexpr std::string_view TYPE_NAME = "PDBSignature";

    PdbSignature(uint64_t offset, FatxVolume &volume)
        : Signature(TYPE_NAME, offset, volume) {}

    bool test() override;
    void parse() override;
};

//! PNG image, measured by walking its chunks up to IEND.
class PngSignature : public Signature {
  public:
    static constexpr std::string_view TYPE_NAME = "PNGSignature";

    //! Images with more chunks than this are left unextracted.
    static constexpr unsigned MAX_CHUNKS = 0x10000;

    PngSignature(uint64_t offset, FatxVolume &volume)
        : Signature(TYPE_NAME, offset, volume) {}

    bool test() override;
    void parse() override;
};

//! Single gzip member, measured by inflating it.  The stored original
//! file name, if any, becomes the recovered name.
class GzipSignature : public Signature {
  public:
    static constexpr std::string_view TYPE_NAME = "GZipSignature";

    //! Compressed members larger than this are left unextracted.
    static constexpr uint64_t MAX_MEMBER_SIZE = 0x10000000;

    GzipSignature(uint64_t offset, FatxVolume &volume)
        : Signature(TYPE_NAME, offset, volume) {}

    bool test() override;
    void parse() override;

  private:
    void parse_header();
    uint64_t inflated_member_length();
};

} // namespace fatxrec

#endif // SIGNATURES_H_
