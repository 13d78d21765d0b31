#include "pokewire/field_codec.hpp"
#include "endian_utils.hpp"

namespace pokewire {

size_t WireKindWidth(WireKind kind) {
    switch (kind) {
        case WireKind::Int8:
        case WireKind::UInt8:
            return 1;
        case WireKind::Int16:
        case WireKind::UInt16:
            return 2;
        case WireKind::Int32:
        case WireKind::UInt32:
            return 4;
        case WireKind::Int64:
        case WireKind::UInt64:
            return 8;
        case WireKind::Blob:
            return 0;
    }
    return 0;
}

const char* WireKindName(WireKind kind) {
    switch (kind) {
        case WireKind::Int8: return "i8";
        case WireKind::Int16: return "i16";
        case WireKind::Int32: return "i32";
        case WireKind::Int64: return "i64";
        case WireKind::UInt8: return "u8";
        case WireKind::UInt16: return "u16";
        case WireKind::UInt32: return "u32";
        case WireKind::UInt64: return "u64";
        case WireKind::Blob: return "blob";
    }
    return "?";
}

// ByteWriter

void ByteWriter::WriteUInt8(uint8_t value) {
    buffer_.push_back(value);
}

void ByteWriter::WriteUInt16LE(uint16_t value) {
    uint8_t raw[2];
    internal::WriteUInt16LE(raw, value);
    buffer_.insert(buffer_.end(), raw, raw + 2);
}

void ByteWriter::WriteUInt32LE(uint32_t value) {
    uint8_t raw[4];
    internal::WriteUInt32LE(raw, value);
    buffer_.insert(buffer_.end(), raw, raw + 4);
}

void ByteWriter::WriteUInt64LE(uint64_t value) {
    uint8_t raw[8];
    internal::WriteUInt64LE(raw, value);
    buffer_.insert(buffer_.end(), raw, raw + 8);
}

void ByteWriter::WriteBytes(const uint8_t* data, size_t size) {
    if (size > 0) {
        buffer_.insert(buffer_.end(), data, data + size);
    }
}

size_t ByteWriter::GetSize() const {
    return buffer_.size();
}

const Bytes& ByteWriter::GetBuffer() const {
    return buffer_;
}

Bytes ByteWriter::Take() {
    Bytes out;
    out.swap(buffer_);
    return out;
}

// ByteReader

ByteReader::ByteReader(const uint8_t* data, size_t size)
    : data_(data)
    , size_(size)
    , offset_(0)
{}

ByteReader::ByteReader(const Bytes& data)
    : ByteReader(data.data(), data.size())
{}

void ByteReader::Require(size_t size, const std::string& field) const {
    if (size > size_ - offset_) {
        throw ProtocolError::Truncated(field, size, size_ - offset_);
    }
}

uint8_t ByteReader::ReadUInt8(const std::string& field) {
    Require(1, field);
    return data_[offset_++];
}

uint16_t ByteReader::ReadUInt16LE(const std::string& field) {
    Require(2, field);
    uint16_t value = internal::ReadUInt16LE(data_ + offset_);
    offset_ += 2;
    return value;
}

uint32_t ByteReader::ReadUInt32LE(const std::string& field) {
    Require(4, field);
    uint32_t value = internal::ReadUInt32LE(data_ + offset_);
    offset_ += 4;
    return value;
}

uint64_t ByteReader::ReadUInt64LE(const std::string& field) {
    Require(8, field);
    uint64_t value = internal::ReadUInt64LE(data_ + offset_);
    offset_ += 8;
    return value;
}

Bytes ByteReader::ReadBytes(size_t size, const std::string& field) {
    Require(size, field);
    Bytes out(data_ + offset_, data_ + offset_ + size);
    offset_ += size;
    return out;
}

Bytes ByteReader::ReadRemaining() {
    Bytes out(data_ + offset_, data_ + size_);
    offset_ = size_;
    return out;
}

size_t ByteReader::GetOffset() const {
    return offset_;
}

size_t ByteReader::GetRemaining() const {
    return size_ - offset_;
}

namespace internal {

size_t CheckDecodedLength(int64_t length, const std::string& field) {
    if (length < 0) {
        throw ProtocolError(ErrorKind::InvalidLength,
                            "Negative length " + std::to_string(length) + " for " + field,
                            field);
    }
    return CheckDecodedLength(static_cast<uint64_t>(length), field);
}

size_t CheckDecodedLength(uint64_t length, const std::string& field) {
    if (length > protocol::MAX_FIELD_SIZE) {
        throw ProtocolError(ErrorKind::SizeLimitExceeded,
                            "Field " + field + " size " + std::to_string(length) +
                                " exceeds maximum allowed " + std::to_string(protocol::MAX_FIELD_SIZE),
                            field);
    }
    return static_cast<size_t>(length);
}

void ThrowLengthOverflow(const std::string& field, size_t length, WireKind prefix) {
    throw ProtocolError(ErrorKind::LengthOverflow,
                        "Field " + field + " length " + std::to_string(length) +
                            " does not fit a " + WireKindName(prefix) + " prefix",
                        field);
}

} // namespace internal

} // namespace pokewire
