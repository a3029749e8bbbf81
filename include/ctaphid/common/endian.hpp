#pragma once
#include <cstdint>
#include <bit>
#include <cstring>
#include <type_traits>

namespace ctaphid {

// Multi-byte fields on the wire (BCNT) are big-endian.
template<typename T>
constexpr T to_big_endian(T val) {
    static_assert(std::is_unsigned_v<T>, "wire fields are unsigned");
    if constexpr (std::endian::native == std::endian::big || sizeof(T) == 1) {
        return val;
    } else {
        return std::byteswap(val);
    }
}

template<typename T>
constexpr T from_big_endian(T val) {
    return to_big_endian(val);
}

template<typename T>
inline void write_be(uint8_t* buf, T val) {
    T be_val = to_big_endian(val);
    std::memcpy(buf, &be_val, sizeof(be_val));
}

template<typename T>
inline T read_be(const uint8_t* buf) {
    T temp;
    std::memcpy(&temp, buf, sizeof(temp));
    return from_big_endian(temp);
}

inline void write_be16(uint8_t* buf, uint16_t val) { write_be<uint16_t>(buf, val); }
inline uint16_t read_be16(const uint8_t* buf) { return read_be<uint16_t>(buf); }

} // namespace ctaphid
