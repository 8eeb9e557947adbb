// byteorder.hpp

#ifndef BYTEORDER_H_
#define BYTEORDER_H_

#include <bit>
#include <cstdint>

namespace fatxrec {

//! Decodes an unsigned integer of N bytes stored with the given byte order.
template <typename T>
T load_uint(const unsigned char *p, std::endian order) {
    T value = 0;
    if (order == std::endian::big) {
        for (unsigned i = 0; i < sizeof(T); ++i) {
            value = static_cast<T>((value << 8) | p[i]);
        }
    } else {
        for (unsigned i = sizeof(T); i > 0; --i) {
            value = static_cast<T>((value << 8) | p[i - 1]);
        }
    }
    return value;
}

inline uint16_t load_u16(const unsigned char *p, std::endian order) {
    return load_uint<uint16_t>(p, order);
}

inline uint32_t load_u32(const unsigned char *p, std::endian order) {
    return load_uint<uint32_t>(p, order);
}

inline uint64_t load_u64(const unsigned char *p, std::endian order) {
    return load_uint<uint64_t>(p, order);
}

inline float load_float(const unsigned char *p, std::endian order) {
    return std::bit_cast<float>(load_u32(p, order));
}

inline double load_double(const unsigned char *p, std::endian order) {
    return std::bit_cast<double>(load_u64(p, order));
}

} // namespace fatxrec

#endif // BYTEORDER_H_
