#ifndef POKEWIRE_STREAM_HPP
#define POKEWIRE_STREAM_HPP

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace pokewire {

/// Blocking duplex byte stream the framing layer runs on
/// Implementations throw IoError when the stream cannot deliver or accept bytes
class IByteStream {
public:
    virtual ~IByteStream() = default;

    /// Read exactly size bytes into dest
    virtual void ReadExact(uint8_t* dest, size_t size) = 0;

    /// Write all size bytes from data
    virtual void WriteAll(const uint8_t* data, size_t size) = 0;

    /// Push buffered output to the peer
    virtual void Flush() = 0;
};

/// In-memory duplex stream
/// Reads consume bytes supplied with Feed(); writes accumulate in an outbound buffer
class MemoryStream : public IByteStream {
public:
    MemoryStream() = default;

    /// Construct with initial inbound bytes
    explicit MemoryStream(Bytes inbound);

    void ReadExact(uint8_t* dest, size_t size) override;
    void WriteAll(const uint8_t* data, size_t size) override;
    void Flush() override;

    /// Append bytes to the inbound side
    void Feed(const Bytes& data);

    /// Get bytes written so far
    const Bytes& Written() const;

    /// Move written bytes out, leaving the outbound buffer empty
    Bytes TakeWritten();

    /// Get number of inbound bytes not yet read
    size_t GetAvailable() const;

    /// Get number of Flush() calls
    size_t GetFlushCount() const;

private:
    Bytes inbound_;
    size_t read_offset_ = 0;
    Bytes outbound_;
    size_t flush_count_ = 0;
};

/// Decorator that hex-dumps every read, write and flush of another stream
class LoggingStream : public IByteStream {
public:
    /// @param inner Stream to forward to (must outlive this object)
    /// @param out Destination of the dump
    explicit LoggingStream(IByteStream& inner);
    LoggingStream(IByteStream& inner, std::ostream& out);

    void ReadExact(uint8_t* dest, size_t size) override;
    void WriteAll(const uint8_t* data, size_t size) override;
    void Flush() override;

private:
    IByteStream& inner_;
    std::ostream& out_;
};

/// Canonical hex dump: offset, 16 hex bytes (split after 8), printable ASCII column
std::string FormatHexDump(const uint8_t* data, size_t size);

} // namespace pokewire

#endif // POKEWIRE_STREAM_HPP
