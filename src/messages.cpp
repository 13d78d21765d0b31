#include "pokewire/messages.hpp"
#include <string>
#include <utility>

namespace pokewire {

namespace {
    template<typename T>
    Bytes EncodeWithOpcode(const T& message) {
        ByteWriter writer;
        writer.WriteUInt8(static_cast<uint8_t>(T::OPCODE));
        T::Fields().Serialize(message, writer);
        return writer.Take();
    }

    template<typename T>
    T DecodeWithOpcode(const Bytes& data, const char* name) {
        if (data.empty()) {
            throw ProtocolError(ErrorKind::EmptyMessage, std::string("No opcode found for ") + name);
        }
        int8_t opcode = static_cast<int8_t>(data[0]);
        if (opcode != T::OPCODE) {
            throw ProtocolError(ErrorKind::TypeMismatch,
                                std::string("Expected opcode ") + std::to_string(T::OPCODE) +
                                    " for " + name + ", found " + std::to_string(opcode));
        }
        ByteReader reader(data.data() + 1, data.size() - 1);
        return T::Fields().Deserialize(reader);
    }
}

// ChecksumConfig

ChecksumConfig::ChecksumConfig(int8_t selector)
    : selector_(selector)
{}

ChecksumConfig ChecksumConfig::None() {
    return ChecksumConfig(0);
}

ChecksumConfig ChecksumConfig::Crc16() {
    return ChecksumConfig(1);
}

ChecksumConfig ChecksumConfig::HmacSha256(int8_t size) {
    if (size < 4 || size > 32) {
        throw ProtocolError(ErrorKind::InvalidChecksumConfig,
                            "HMAC-SHA256 checksum size must be 4..32, got " + std::to_string(size));
    }
    return ChecksumConfig(size);
}

ChecksumConfig ChecksumConfig::FromSelector(int8_t selector) {
    if (selector == 0) {
        return None();
    }
    if (selector == 1) {
        return Crc16();
    }
    if (selector >= 4 && selector <= 32) {
        return ChecksumConfig(selector);
    }
    throw ProtocolError(ErrorKind::InvalidChecksumConfig,
                        "Invalid checksum size " + std::to_string(selector), "checksum_size");
}

int8_t ChecksumConfig::GetSelector() const {
    return selector_;
}

ChecksumConfig::Kind ChecksumConfig::GetKind() const {
    if (selector_ == 0) {
        return Kind::None;
    }
    if (selector_ == 1) {
        return Kind::Crc16;
    }
    return Kind::HmacSha256;
}

bool ChecksumConfig::operator==(const ChecksumConfig& other) const {
    return selector_ == other.selector_;
}

bool ChecksumConfig::operator!=(const ChecksumConfig& other) const {
    return !(*this == other);
}

// ClientHello

ClientHello ClientHello::Create(int64_t integrity, int64_t timestamp_millis, const ObfuscationKeys& keys) {
    ClientHello hello;
    hello.obfuscated_integrity = integrity ^ keys.primary;
    hello.obfuscated_timestamp = timestamp_millis ^ integrity ^ keys.secondary;
    return hello;
}

ClientHello ClientHello::Create(int64_t integrity,
                                std::chrono::system_clock::time_point timestamp,
                                const ObfuscationKeys& keys) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch());
    return Create(integrity, static_cast<int64_t>(millis.count()), keys);
}

int64_t ClientHello::GetIntegrity(const ObfuscationKeys& keys) const {
    return obfuscated_integrity ^ keys.primary;
}

int64_t ClientHello::GetTimestampMillis(const ObfuscationKeys& keys) const {
    return obfuscated_timestamp ^ GetIntegrity(keys) ^ keys.secondary;
}

std::chrono::system_clock::time_point ClientHello::GetTimestamp(const ObfuscationKeys& keys) const {
    std::chrono::milliseconds millis(GetTimestampMillis(keys));
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(millis));
}

const FieldTable<ClientHello>& ClientHello::Fields() {
    static const FieldTable<ClientHello> table = FieldTable<ClientHello>()
        .Integer("obfuscated_integrity", &ClientHello::obfuscated_integrity)
        .Integer("obfuscated_timestamp", &ClientHello::obfuscated_timestamp);
    return table;
}

Bytes ClientHello::Encode() const {
    return EncodeWithOpcode(*this);
}

ClientHello ClientHello::Decode(const Bytes& data) {
    return DecodeWithOpcode<ClientHello>(data, "ClientHello");
}

bool ClientHello::operator==(const ClientHello& other) const {
    return obfuscated_integrity == other.obfuscated_integrity &&
           obfuscated_timestamp == other.obfuscated_timestamp;
}

// ServerHello

ServerHello ServerHello::Create(Bytes public_key, Bytes signature, const ChecksumConfig& checksum) {
    ServerHello hello;
    hello.public_key = std::move(public_key);
    hello.signature = std::move(signature);
    hello.checksum_size = checksum.GetSelector();
    return hello;
}

ChecksumConfig ServerHello::GetChecksum() const {
    return ChecksumConfig::FromSelector(checksum_size);
}

const FieldTable<ServerHello>& ServerHello::Fields() {
    static const FieldTable<ServerHello> table = FieldTable<ServerHello>()
        .Prefixed<int16_t>("public_key", &ServerHello::public_key)
        .Prefixed<int16_t>("signature", &ServerHello::signature)
        .Integer("checksum_size", &ServerHello::checksum_size);
    return table;
}

Bytes ServerHello::Encode() const {
    return EncodeWithOpcode(*this);
}

ServerHello ServerHello::Decode(const Bytes& data) {
    return DecodeWithOpcode<ServerHello>(data, "ServerHello");
}

bool ServerHello::operator==(const ServerHello& other) const {
    return public_key == other.public_key &&
           signature == other.signature &&
           checksum_size == other.checksum_size;
}

// ClientReady

const FieldTable<ClientReady>& ClientReady::Fields() {
    static const FieldTable<ClientReady> table = FieldTable<ClientReady>()
        .Prefixed<int16_t>("public_key", &ClientReady::public_key);
    return table;
}

Bytes ClientReady::Encode() const {
    return EncodeWithOpcode(*this);
}

ClientReady ClientReady::Decode(const Bytes& data) {
    return DecodeWithOpcode<ClientReady>(data, "ClientReady");
}

bool ClientReady::operator==(const ClientReady& other) const {
    return public_key == other.public_key;
}

// Unknown

bool Unknown::operator==(const Unknown& other) const {
    return opcode == other.opcode && data == other.data;
}

} // namespace pokewire
