#ifndef POKEWIRE_FRAMING_HPP
#define POKEWIRE_FRAMING_HPP

#include "config.hpp"
#include "stream.hpp"
#include "types.hpp"

#include <utility>

namespace pokewire {

/// Length-prefixed framing over a byte stream
/// Format: Length(2, i16 LE, counts itself) + Message(Length - 2)
///
/// Stream failures surface as IoError; a bad length field as ProtocolError.
/// The message bytes are not interpreted.
///
/// Outbound bodies pass the encryption stage then the checksum stage before
/// the length is written; inbound bodies pass them in reverse. Both stages
/// are None only, which leaves the bytes unchanged.
class FramedStream {
public:
    /// @param stream Underlying stream (must outlive this object)
    explicit FramedStream(IByteStream& stream,
                          EncryptionMode encryption = EncryptionMode::None,
                          PacketChecksum checksum = PacketChecksum::None);

    /// Write one frame and flush
    /// @throws ProtocolError(MessageTooLarge) if encoded is longer than protocol::MAX_MESSAGE_SIZE
    void WriteMessage(const Bytes& encoded);

    /// Read one complete frame and return its message bytes
    /// @throws ProtocolError(InvalidFrameLength) if the length field is below 2
    Bytes ReadMessage();

    /// Build a frame in memory: length prefix followed by encoded
    static Bytes EncodeFrame(const Bytes& encoded);

    /// Get the encryption stage
    EncryptionMode GetEncryption() const;

    /// Get the checksum stage
    PacketChecksum GetChecksum() const;

private:
    Bytes ApplyOutboundStages(const Bytes& encoded) const;
    Bytes ApplyInboundStages(Bytes body) const;

    IByteStream& stream_;
    EncryptionMode encryption_;
    PacketChecksum checksum_;
};

/// Typed message exchange over a framed stream
/// @tparam Codec A MessageCodec instantiation
template<typename Codec>
class MessageStream {
public:
    using Message = typename Codec::Message;

    /// @param stream Underlying stream (must outlive this object)
    explicit MessageStream(IByteStream& stream,
                           EncryptionMode encryption = EncryptionMode::None,
                           PacketChecksum checksum = PacketChecksum::None)
        : framed_(stream, encryption, checksum)
    {}

    /// Get the underlying framing
    const FramedStream& GetFramed() const {
        return framed_;
    }

    /// Encode and send a message (any member type of the codec, or the union itself)
    template<typename T>
    void Write(T message) {
        framed_.WriteMessage(Codec::Encode(Message(std::move(message))));
    }

    /// Receive and decode the next message
    Message Read() {
        Bytes encoded = framed_.ReadMessage();
        return Codec::Decode(encoded);
    }

    /// Receive the next message as a specific type
    /// @throws ProtocolError(TypeMismatch) if another message arrives
    template<typename T>
    T ReadAs() {
        return Codec::template Unwrap<T>(Read());
    }

private:
    FramedStream framed_;
};

} // namespace pokewire

#endif // POKEWIRE_FRAMING_HPP
