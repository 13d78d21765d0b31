#include "pokewire/config.hpp"
#include "pokewire/error.hpp"
#include <cctype>
#include <limits>

namespace pokewire {

const char* EncryptionModeName(EncryptionMode mode) {
    switch (mode) {
        case EncryptionMode::None: return "None";
    }
    return "Unknown";
}

const char* PacketChecksumName(PacketChecksum checksum) {
    switch (checksum) {
        case PacketChecksum::None: return "None";
    }
    return "Unknown";
}

uint16_t ParsePort(const std::string& text) {
    if (text.empty() || text.size() > 5) {
        throw Error("Invalid port: '" + text + "'");
    }

    uint32_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw Error("Invalid port: '" + text + "'");
        }
        value = value * 10 + static_cast<uint32_t>(c - '0');
    }

    if (value > std::numeric_limits<uint16_t>::max()) {
        throw Error("Port out of range (0..65535): " + text);
    }
    return static_cast<uint16_t>(value);
}

} // namespace pokewire
