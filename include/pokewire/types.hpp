#ifndef POKEWIRE_TYPES_HPP
#define POKEWIRE_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pokewire {

// Type aliases
using Bytes = std::vector<uint8_t>;

// Protocol constants
namespace protocol {
    constexpr size_t MAX_FIELD_SIZE = 10 * 1024 * 1024;  // 10MiB ceiling for variable-length fields
    constexpr size_t FRAME_LENGTH_SIZE = 2;               // Length(2), counts itself
    constexpr int32_t MAX_FRAME_LENGTH = 32767;           // largest value of the i16 length field
    constexpr size_t MAX_MESSAGE_SIZE = MAX_FRAME_LENGTH - FRAME_LENGTH_SIZE;
}

// Opcodes of the login exchange
namespace opcode {
    constexpr int8_t CLIENT_HELLO = 0x00;
    constexpr int8_t SERVER_HELLO = 0x01;
    constexpr int8_t CLIENT_READY = 0x02;
    constexpr int8_t UNKNOWN = -128;  // reserved, never claimed by a known message
}

} // namespace pokewire

#endif // POKEWIRE_TYPES_HPP
