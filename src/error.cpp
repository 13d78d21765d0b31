#include "pokewire/error.hpp"
#include <cstdio>
#include <utility>

namespace pokewire {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Truncated: return "Truncated";
        case ErrorKind::InvalidLength: return "InvalidLength";
        case ErrorKind::SizeLimitExceeded: return "SizeLimitExceeded";
        case ErrorKind::LengthOverflow: return "LengthOverflow";
        case ErrorKind::EmptyMessage: return "EmptyMessage";
        case ErrorKind::UnknownOpcode: return "UnknownOpcode";
        case ErrorKind::MessageTooLarge: return "MessageTooLarge";
        case ErrorKind::InvalidFrameLength: return "InvalidFrameLength";
        case ErrorKind::TypeMismatch: return "TypeMismatch";
        case ErrorKind::InvalidChecksumConfig: return "InvalidChecksumConfig";
        case ErrorKind::UnexpectedMessage: return "UnexpectedMessage";
    }
    return "Unknown";
}

Error::Error(const std::string& message)
    : std::runtime_error(message)
{}

ProtocolError::ProtocolError(ErrorKind kind, const std::string& message, std::string field)
    : Error(std::string(ErrorKindName(kind)) + ": " + message)
    , kind_(kind)
    , field_(std::move(field))
{}

ErrorKind ProtocolError::GetKind() const {
    return kind_;
}

const std::string& ProtocolError::GetField() const {
    return field_;
}

uint8_t ProtocolError::GetOpcode() const {
    return opcode_;
}

ProtocolError ProtocolError::Truncated(const std::string& field, size_t needed, size_t available) {
    return ProtocolError(
        ErrorKind::Truncated,
        "Insufficient data for " + field + " (need " + std::to_string(needed) +
            " bytes, have " + std::to_string(available) + ")",
        field);
}

ProtocolError ProtocolError::UnknownOpcode(uint8_t opcode) {
    char hex[8];
    std::snprintf(hex, sizeof(hex), "0x%02X", static_cast<unsigned>(opcode));
    ProtocolError error(ErrorKind::UnknownOpcode, std::string("No message registered for opcode ") + hex);
    error.opcode_ = opcode;
    return error;
}

IoError::IoError(const std::string& message)
    : Error(message)
{}

CryptoError::CryptoError(const std::string& message)
    : Error(message)
{}

} // namespace pokewire
