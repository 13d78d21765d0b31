#ifndef POKEWIRE_FIELD_CODEC_HPP
#define POKEWIRE_FIELD_CODEC_HPP

#include "error.hpp"
#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace pokewire {

/// On-wire representation of a message field
enum class WireKind : uint8_t {
    Int8,
    Int16,
    Int32,
    Int64,
    UInt8,
    UInt16,
    UInt32,
    UInt64,
    Blob,  // length-prefixed byte sequence
};

/// Byte width of an integer wire kind (0 for Blob)
size_t WireKindWidth(WireKind kind);

/// Name of a wire kind ("i16", "u8", "blob", ...)
const char* WireKindName(WireKind kind);

/// Wire kind of a C++ integer type
template<typename T>
constexpr WireKind WireKindOf() {
    static_assert(std::is_integral_v<T> && !std::is_same_v<T, bool>, "integer type required");
    static_assert(sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8,
                  "unsupported integer width");
    if constexpr (std::is_signed_v<T>) {
        if constexpr (sizeof(T) == 1) return WireKind::Int8;
        else if constexpr (sizeof(T) == 2) return WireKind::Int16;
        else if constexpr (sizeof(T) == 4) return WireKind::Int32;
        else return WireKind::Int64;
    } else {
        if constexpr (sizeof(T) == 1) return WireKind::UInt8;
        else if constexpr (sizeof(T) == 2) return WireKind::UInt16;
        else if constexpr (sizeof(T) == 4) return WireKind::UInt32;
        else return WireKind::UInt64;
    }
}

/// Name and wire kind of one message field
struct FieldDescriptor {
    std::string name;
    WireKind kind;

    /// Integer kind of the length prefix; set only for Blob fields
    std::optional<WireKind> prefix;
};

/// Appends little-endian values to a growing buffer
class ByteWriter {
public:
    ByteWriter() = default;

    void WriteUInt8(uint8_t value);
    void WriteUInt16LE(uint16_t value);
    void WriteUInt32LE(uint32_t value);
    void WriteUInt64LE(uint64_t value);
    void WriteBytes(const uint8_t* data, size_t size);

    /// Write any integer as sizeof(T) little-endian bytes (two's complement for signed types)
    template<typename T>
    void WriteInt(T value) {
        using U = std::make_unsigned_t<T>;
        const U raw = static_cast<U>(value);
        if constexpr (sizeof(T) == 1) WriteUInt8(raw);
        else if constexpr (sizeof(T) == 2) WriteUInt16LE(raw);
        else if constexpr (sizeof(T) == 4) WriteUInt32LE(raw);
        else WriteUInt64LE(raw);
    }

    /// Get number of bytes written so far
    size_t GetSize() const;

    /// Get written bytes
    const Bytes& GetBuffer() const;

    /// Move written bytes out of the writer
    Bytes Take();

private:
    Bytes buffer_;
};

/// Consumes little-endian values from a byte range
/// Every read throws ProtocolError(Truncated) naming the field when too few bytes remain
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size);
    explicit ByteReader(const Bytes& data);

    uint8_t ReadUInt8(const std::string& field);
    uint16_t ReadUInt16LE(const std::string& field);
    uint32_t ReadUInt32LE(const std::string& field);
    uint64_t ReadUInt64LE(const std::string& field);
    Bytes ReadBytes(size_t size, const std::string& field);

    /// Read sizeof(T) little-endian bytes as T
    template<typename T>
    T ReadInt(const std::string& field) {
        if constexpr (sizeof(T) == 1) return static_cast<T>(ReadUInt8(field));
        else if constexpr (sizeof(T) == 2) return static_cast<T>(ReadUInt16LE(field));
        else if constexpr (sizeof(T) == 4) return static_cast<T>(ReadUInt32LE(field));
        else return static_cast<T>(ReadUInt64LE(field));
    }

    /// Copy everything not yet consumed
    Bytes ReadRemaining();

    /// Get number of bytes consumed
    size_t GetOffset() const;

    /// Get number of bytes left
    size_t GetRemaining() const;

private:
    void Require(size_t size, const std::string& field) const;

    const uint8_t* data_;
    size_t size_;
    size_t offset_;
};

namespace internal {

/// Validate a decoded length prefix against sign and protocol::MAX_FIELD_SIZE
size_t CheckDecodedLength(int64_t length, const std::string& field);
size_t CheckDecodedLength(uint64_t length, const std::string& field);

[[noreturn]] void ThrowLengthOverflow(const std::string& field, size_t length, WireKind prefix);

template<typename Prefix>
void WriteLengthPrefix(ByteWriter& writer, size_t length, const std::string& field) {
    if (static_cast<uint64_t>(length) > static_cast<uint64_t>(std::numeric_limits<Prefix>::max())) {
        ThrowLengthOverflow(field, length, WireKindOf<Prefix>());
    }
    writer.WriteInt<Prefix>(static_cast<Prefix>(length));
}

template<typename Prefix>
size_t ReadLengthPrefix(ByteReader& reader, const std::string& field) {
    Prefix raw = reader.ReadInt<Prefix>(field + " length");
    if constexpr (std::is_signed_v<Prefix>) {
        return CheckDecodedLength(static_cast<int64_t>(raw), field);
    } else {
        return CheckDecodedLength(static_cast<uint64_t>(raw), field);
    }
}

} // namespace internal

/// Field layout of a message type, declared once and interpreted at run time
///
/// Example:
///   static const auto table = FieldTable<ServerHello>()
///       .Prefixed<int16_t>("public_key", &ServerHello::public_key)
///       .Prefixed<int16_t>("signature", &ServerHello::signature)
///       .Integer("checksum_size", &ServerHello::checksum_size);
///
/// Fields are written in declaration order; decoding consumes them in the same
/// order and returns a value only when every field decoded.
template<typename Message>
class FieldTable {
public:
    /// Append a fixed-width integer field
    template<typename Int>
    FieldTable& Integer(std::string name, Int Message::*member) {
        Entry entry;
        entry.descriptor = FieldDescriptor{std::move(name), WireKindOf<Int>(), std::nullopt};
        entry.encode = [member](const Message& message, ByteWriter& writer, const std::string&) {
            writer.WriteInt<Int>(message.*member);
        };
        entry.decode = [member](ByteReader& reader, Message& message, const std::string& field) {
            message.*member = reader.ReadInt<Int>(field);
        };
        entry.size = [](const Message&) {
            return sizeof(Int);
        };
        entries_.push_back(std::move(entry));
        return *this;
    }

    /// Append a variable-length field (Bytes or std::string) preceded by a Prefix-typed length
    template<typename Prefix, typename Container>
    FieldTable& Prefixed(std::string name, Container Message::*member) {
        static_assert(sizeof(typename Container::value_type) == 1, "byte container required");
        Entry entry;
        entry.descriptor = FieldDescriptor{std::move(name), WireKind::Blob, WireKindOf<Prefix>()};
        entry.encode = [member](const Message& message, ByteWriter& writer, const std::string& field) {
            const Container& value = message.*member;
            internal::WriteLengthPrefix<Prefix>(writer, value.size(), field);
            writer.WriteBytes(reinterpret_cast<const uint8_t*>(value.data()), value.size());
        };
        entry.decode = [member](ByteReader& reader, Message& message, const std::string& field) {
            size_t length = internal::ReadLengthPrefix<Prefix>(reader, field);
            Bytes raw = reader.ReadBytes(length, field);
            message.*member = Container(raw.begin(), raw.end());
        };
        entry.size = [member](const Message& message) {
            return sizeof(Prefix) + (message.*member).size();
        };
        entries_.push_back(std::move(entry));
        return *this;
    }

    /// Serialize all fields of a value in declaration order
    Bytes Serialize(const Message& message) const {
        ByteWriter writer;
        Serialize(message, writer);
        return writer.Take();
    }

    /// Serialize into an existing writer
    void Serialize(const Message& message, ByteWriter& writer) const {
        for (const auto& entry : entries_) {
            entry.encode(message, writer, entry.descriptor.name);
        }
    }

    /// Deserialize a value from the reader's current position
    Message Deserialize(ByteReader& reader) const {
        Message message{};
        for (const auto& entry : entries_) {
            entry.decode(reader, message, entry.descriptor.name);
        }
        return message;
    }

    /// Deserialize a value from a byte range
    /// @param consumed Receives the number of bytes used by the fields
    Message Deserialize(const uint8_t* data, size_t size, size_t& consumed) const {
        ByteReader reader(data, size);
        Message message = Deserialize(reader);
        consumed = reader.GetOffset();
        return message;
    }

    /// Deserialize a value, ignoring the consumed count
    Message Deserialize(const Bytes& data) const {
        size_t consumed = 0;
        return Deserialize(data.data(), data.size(), consumed);
    }

    /// Total serialized size of a value
    size_t EncodedSize(const Message& message) const {
        size_t total = 0;
        for (const auto& entry : entries_) {
            total += entry.size(message);
        }
        return total;
    }

    /// Get the declared fields in wire order
    std::vector<FieldDescriptor> Descriptors() const {
        std::vector<FieldDescriptor> descriptors;
        descriptors.reserve(entries_.size());
        for (const auto& entry : entries_) {
            descriptors.push_back(entry.descriptor);
        }
        return descriptors;
    }

private:
    struct Entry {
        FieldDescriptor descriptor;
        std::function<void(const Message&, ByteWriter&, const std::string&)> encode;
        std::function<void(ByteReader&, Message&, const std::string&)> decode;
        std::function<size_t(const Message&)> size;
    };

    std::vector<Entry> entries_;
};

} // namespace pokewire

#endif // POKEWIRE_FIELD_CODEC_HPP
