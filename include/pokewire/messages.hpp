#ifndef POKEWIRE_MESSAGES_HPP
#define POKEWIRE_MESSAGES_HPP

#include "config.hpp"
#include "field_codec.hpp"
#include "types.hpp"

#include <chrono>
#include <cstdint>

namespace pokewire {

/// Frame checksum negotiated by ServerHello
class ChecksumConfig {
public:
    enum class Kind {
        None,
        Crc16,
        HmacSha256,
    };

    /// No checksum (selector 0)
    static ChecksumConfig None();

    /// CRC16 (selector 1)
    static ChecksumConfig Crc16();

    /// HMAC-SHA256 truncated to size bytes (selector 4..32)
    /// @throws ProtocolError(InvalidChecksumConfig) for other sizes
    static ChecksumConfig HmacSha256(int8_t size);

    /// Parse a selector byte
    /// @throws ProtocolError(InvalidChecksumConfig) for values outside {0, 1, 4..32}
    static ChecksumConfig FromSelector(int8_t selector);

    /// Selector byte stored on the wire
    int8_t GetSelector() const;

    /// Get the checksum family
    Kind GetKind() const;

    bool operator==(const ChecksumConfig& other) const;
    bool operator!=(const ChecksumConfig& other) const;

private:
    explicit ChecksumConfig(int8_t selector);

    int8_t selector_;
};

/// First message of the handshake, sent by the client (opcode 0x00)
/// Carries a random integrity value and the client clock, both XOR-obfuscated
struct ClientHello {
    static constexpr int8_t OPCODE = opcode::CLIENT_HELLO;

    int64_t obfuscated_integrity = 0;
    int64_t obfuscated_timestamp = 0;

    /// Obfuscate an integrity value and a Unix timestamp in milliseconds
    static ClientHello Create(int64_t integrity, int64_t timestamp_millis, const ObfuscationKeys& keys);

    /// Obfuscate an integrity value and a wall-clock time
    static ClientHello Create(int64_t integrity,
                              std::chrono::system_clock::time_point timestamp,
                              const ObfuscationKeys& keys);

    /// Recover the integrity value
    int64_t GetIntegrity(const ObfuscationKeys& keys) const;

    /// Recover the timestamp in Unix milliseconds
    int64_t GetTimestampMillis(const ObfuscationKeys& keys) const;

    /// Recover the timestamp as a wall-clock time
    std::chrono::system_clock::time_point GetTimestamp(const ObfuscationKeys& keys) const;

    static const FieldTable<ClientHello>& Fields();

    /// Encode with opcode prefix
    Bytes Encode() const;

    /// Decode an opcode-prefixed ClientHello
    /// @throws ProtocolError(TypeMismatch) if the opcode belongs to another message
    static ClientHello Decode(const Bytes& data);

    bool operator==(const ClientHello& other) const;
};

/// Server reply: public key, signature over it, and checksum selector (opcode 0x01)
/// The signature is stored but never verified here
struct ServerHello {
    static constexpr int8_t OPCODE = opcode::SERVER_HELLO;

    Bytes public_key;       // SEC1-encoded point
    Bytes signature;        // DER-encoded ECDSA signature
    int8_t checksum_size = 0;

    static ServerHello Create(Bytes public_key, Bytes signature, const ChecksumConfig& checksum);

    /// Parse the checksum selector
    /// @throws ProtocolError(InvalidChecksumConfig)
    ChecksumConfig GetChecksum() const;

    static const FieldTable<ServerHello>& Fields();

    /// Encode with opcode prefix
    Bytes Encode() const;

    /// Decode an opcode-prefixed ServerHello
    static ServerHello Decode(const Bytes& data);

    bool operator==(const ServerHello& other) const;
};

/// Final handshake message: the client's public key (opcode 0x02)
struct ClientReady {
    static constexpr int8_t OPCODE = opcode::CLIENT_READY;

    Bytes public_key;  // SEC1-encoded point

    static const FieldTable<ClientReady>& Fields();

    /// Encode with opcode prefix
    Bytes Encode() const;

    /// Decode an opcode-prefixed ClientReady
    static ClientReady Decode(const Bytes& data);

    bool operator==(const ClientReady& other) const;
};

/// Catch-all for opcodes no known message claims
/// Holds the raw opcode and the undecoded body
struct Unknown {
    int8_t opcode = opcode::UNKNOWN;
    Bytes data;

    bool operator==(const Unknown& other) const;
};

} // namespace pokewire

#endif // POKEWIRE_MESSAGES_HPP
