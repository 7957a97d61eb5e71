#pragma once
/// TapMQ — Portable byte-swap and big-endian load/store helpers
/// Used by the wire codec and the connection's frame reader.

#include <cstdint>
#include <cstring>

namespace tap {

inline uint16_t bswap16(uint16_t v) {
#if defined(__GNUC__) || defined(__clang__)
    return __builtin_bswap16(v);
#else
    return (v >> 8) | (v << 8);
#endif
}

inline uint32_t bswap32(uint32_t v) {
#if defined(__GNUC__) || defined(__clang__)
    return __builtin_bswap32(v);
#else
    return ((v >> 24)) | ((v >> 8) & 0xFF00) |
           ((v << 8) & 0xFF0000) | ((v << 24));
#endif
}

inline uint64_t bswap64(uint64_t v) {
#if defined(__GNUC__) || defined(__clang__)
    return __builtin_bswap64(v);
#else
    return ((v >> 56)) | ((v >> 40) & 0xFF00ULL) |
           ((v >> 24) & 0xFF0000ULL) | ((v >> 8) & 0xFF000000ULL) |
           ((v << 8) & 0xFF00000000ULL) | ((v << 24) & 0xFF0000000000ULL) |
           ((v << 40) & 0xFF000000000000ULL) | ((v << 56));
#endif
}

#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
inline uint16_t to_be16(uint16_t v) noexcept { return v; }
inline uint32_t to_be32(uint32_t v) noexcept { return v; }
inline uint64_t to_be64(uint64_t v) noexcept { return v; }
#else
inline uint16_t to_be16(uint16_t v) noexcept { return bswap16(v); }
inline uint32_t to_be32(uint32_t v) noexcept { return bswap32(v); }
inline uint64_t to_be64(uint64_t v) noexcept { return bswap64(v); }
#endif

// Byte-order conversion is symmetric, so to_beN also converts back.
inline uint16_t load_be16(const uint8_t* p) noexcept { uint16_t v; std::memcpy(&v, p, 2); return to_be16(v); }
inline uint32_t load_be32(const uint8_t* p) noexcept { uint32_t v; std::memcpy(&v, p, 4); return to_be32(v); }
inline uint64_t load_be64(const uint8_t* p) noexcept { uint64_t v; std::memcpy(&v, p, 8); return to_be64(v); }

inline void store_be16(uint8_t* p, uint16_t v) noexcept { v = to_be16(v); std::memcpy(p, &v, 2); }
inline void store_be32(uint8_t* p, uint32_t v) noexcept { v = to_be32(v); std::memcpy(p, &v, 4); }
inline void store_be64(uint8_t* p, uint64_t v) noexcept { v = to_be64(v); std::memcpy(p, &v, 8); }

} // namespace tap
