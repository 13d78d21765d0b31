#ifndef POKEWIRE_CONFIG_HPP
#define POKEWIRE_CONFIG_HPP

#include <cstdint>
#include <string>

namespace pokewire {

/// Encryption applied to every frame body after the handshake
/// Only None exists; the stage passes bytes through unchanged
enum class EncryptionMode {
    None,
};

/// Checksum appended to every frame body after the handshake
/// Only None exists; the stage passes bytes through unchanged
enum class PacketChecksum {
    None,
};

/// Name of an encryption mode
const char* EncryptionModeName(EncryptionMode mode);

/// Name of a packet checksum
const char* PacketChecksumName(PacketChecksum checksum);

/// Parse a TCP port number
/// @throws Error if text is not a decimal integer in 0..65535
uint16_t ParsePort(const std::string& text);

/// Pre-agreed constants XORed into ClientHello fields
/// These obfuscate the values on the wire; they are not secret
struct ObfuscationKeys {
    /// Mixed into the integrity value
    int64_t primary = 3214621489648854472;

    /// Mixed into the timestamp
    int64_t secondary = -4214651440992349575;
};

/// Configuration for one login session
struct SessionConfig {
    /// Server hostname or IP address (client side)
    std::string host = "127.0.0.1";

    /// Server port (default: 2106)
    uint16_t port = 2106;

    /// Obfuscation constants shared by both peers
    ObfuscationKeys obfuscation;

    /// Checksum selector advertised in ServerHello (0 = none, 1 = CRC16, 4..32 = HMAC-SHA256 bytes)
    int8_t checksum_size = 0;

    /// Frame body encryption (default: None)
    EncryptionMode encryption = EncryptionMode::None;

    /// Frame body checksum (default: None)
    PacketChecksum packet_checksum = PacketChecksum::None;

    /// Hex-dump all traffic to stdout (default: false)
    bool log_traffic = false;
};

} // namespace pokewire

#endif // POKEWIRE_CONFIG_HPP
