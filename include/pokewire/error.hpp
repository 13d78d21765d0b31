#ifndef POKEWIRE_ERROR_HPP
#define POKEWIRE_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace pokewire {

/// Kinds of protocol failure reported by the codec, framing and handshake layers
enum class ErrorKind {
    Truncated,              // not enough bytes for a field or a declared length
    InvalidLength,          // negative variable-length prefix
    SizeLimitExceeded,      // variable-length prefix above protocol::MAX_FIELD_SIZE
    LengthOverflow,         // value too long for its prefix integer when encoding
    EmptyMessage,           // no opcode byte
    UnknownOpcode,          // no matching message type and no catch-all
    MessageTooLarge,        // encoded message does not fit a frame
    InvalidFrameLength,     // frame length field below 2
    TypeMismatch,           // union holds a different message type
    InvalidChecksumConfig,  // checksum selector outside {0, 1, 4..32}
    UnexpectedMessage,      // handshake step out of order
};

/// Stable name of an error kind
const char* ErrorKindName(ErrorKind kind);

/// Base class of every error thrown by pokewire
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message);
};

/// Malformed or out-of-order data
class ProtocolError : public Error {
public:
    ProtocolError(ErrorKind kind, const std::string& message, std::string field = {});

    /// Get the failure kind
    ErrorKind GetKind() const;

    /// Get the name of the field being processed (empty when not field-specific)
    const std::string& GetField() const;

    /// Get the raw opcode byte (UnknownOpcode only)
    uint8_t GetOpcode() const;

    static ProtocolError Truncated(const std::string& field, size_t needed, size_t available);
    static ProtocolError UnknownOpcode(uint8_t opcode);

private:
    ErrorKind kind_;
    std::string field_;
    uint8_t opcode_ = 0;
};

/// Failure of the underlying byte stream (short read, closed peer, socket error)
class IoError : public Error {
public:
    explicit IoError(const std::string& message);
};

/// Failure inside the key-material collaborator
class CryptoError : public Error {
public:
    explicit CryptoError(const std::string& message);
};

} // namespace pokewire

#endif // POKEWIRE_ERROR_HPP
