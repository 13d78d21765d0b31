#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace pokewire {
namespace internal {

// Little-endian load/store of any integer width
// Explicit byte shuffling so the wire format does not depend on host byte order

template<typename T>
inline T LoadLE(const uint8_t* data) {
    using U = std::make_unsigned_t<T>;
    U value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value = static_cast<U>(value | (static_cast<U>(data[i]) << (i * 8)));
    }
    return static_cast<T>(value);
}

template<typename T>
inline void StoreLE(uint8_t* data, T value) {
    using U = std::make_unsigned_t<T>;
    const U raw = static_cast<U>(value);
    for (size_t i = 0; i < sizeof(T); ++i) {
        data[i] = static_cast<uint8_t>((raw >> (i * 8)) & 0xFF);
    }
}

inline uint16_t ReadUInt16LE(const uint8_t* data) { return LoadLE<uint16_t>(data); }
inline uint32_t ReadUInt32LE(const uint8_t* data) { return LoadLE<uint32_t>(data); }
inline uint64_t ReadUInt64LE(const uint8_t* data) { return LoadLE<uint64_t>(data); }

// Frame length field
inline int16_t ReadInt16LE(const uint8_t* data) { return LoadLE<int16_t>(data); }
inline void WriteInt16LE(uint8_t* data, int16_t value) { StoreLE(data, value); }

inline void WriteUInt16LE(uint8_t* data, uint16_t value) { StoreLE(data, value); }
inline void WriteUInt32LE(uint8_t* data, uint32_t value) { StoreLE(data, value); }
inline void WriteUInt64LE(uint8_t* data, uint64_t value) { StoreLE(data, value); }

} // namespace internal
} // namespace pokewire
