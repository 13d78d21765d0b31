#include "pokewire/framing.hpp"
#include "pokewire/error.hpp"
#include "endian_utils.hpp"
#include <algorithm>
#include <string>
#include <utility>

namespace pokewire {

FramedStream::FramedStream(IByteStream& stream, EncryptionMode encryption, PacketChecksum checksum)
    : stream_(stream)
    , encryption_(encryption)
    , checksum_(checksum)
{}

EncryptionMode FramedStream::GetEncryption() const {
    return encryption_;
}

PacketChecksum FramedStream::GetChecksum() const {
    return checksum_;
}

Bytes FramedStream::ApplyOutboundStages(const Bytes& encoded) const {
    Bytes body = encoded;

    switch (encryption_) {
        case EncryptionMode::None:
            break;
    }

    switch (checksum_) {
        case PacketChecksum::None:
            break;
    }

    return body;
}

Bytes FramedStream::ApplyInboundStages(Bytes body) const {
    switch (checksum_) {
        case PacketChecksum::None:
            break;
    }

    switch (encryption_) {
        case EncryptionMode::None:
            break;
    }

    return body;
}

Bytes FramedStream::EncodeFrame(const Bytes& encoded) {
    if (encoded.size() > protocol::MAX_MESSAGE_SIZE) {
        throw ProtocolError(ErrorKind::MessageTooLarge,
                            "Message of " + std::to_string(encoded.size()) +
                                " bytes exceeds frame limit of " + std::to_string(protocol::MAX_MESSAGE_SIZE));
    }

    const int16_t length = static_cast<int16_t>(encoded.size() + protocol::FRAME_LENGTH_SIZE);

    Bytes frame(protocol::FRAME_LENGTH_SIZE + encoded.size());
    internal::WriteInt16LE(frame.data(), length);
    std::copy(encoded.begin(), encoded.end(), frame.begin() + protocol::FRAME_LENGTH_SIZE);
    return frame;
}

void FramedStream::WriteMessage(const Bytes& encoded) {
    Bytes frame = EncodeFrame(ApplyOutboundStages(encoded));
    stream_.WriteAll(frame.data(), frame.size());
    stream_.Flush();
}

Bytes FramedStream::ReadMessage() {
    uint8_t length_bytes[protocol::FRAME_LENGTH_SIZE];
    stream_.ReadExact(length_bytes, sizeof(length_bytes));

    const int16_t length = internal::ReadInt16LE(length_bytes);
    if (length < static_cast<int16_t>(protocol::FRAME_LENGTH_SIZE)) {
        throw ProtocolError(ErrorKind::InvalidFrameLength,
                            "Invalid frame length: " + std::to_string(length));
    }

    Bytes message(static_cast<size_t>(length) - protocol::FRAME_LENGTH_SIZE);
    stream_.ReadExact(message.data(), message.size());
    return ApplyInboundStages(std::move(message));
}

} // namespace pokewire
