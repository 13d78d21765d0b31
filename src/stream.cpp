#include "pokewire/stream.hpp"
#include "pokewire/error.hpp"
#include <cstdio>
#include <cstring>
#include <iostream>
#include <utility>

namespace pokewire {

// MemoryStream

MemoryStream::MemoryStream(Bytes inbound)
    : inbound_(std::move(inbound))
{}

void MemoryStream::ReadExact(uint8_t* dest, size_t size) {
    if (size > GetAvailable()) {
        throw IoError("Unexpected end of stream: wanted " + std::to_string(size) +
                      " bytes, " + std::to_string(GetAvailable()) + " available");
    }
    if (size == 0) {
        return;
    }
    std::memcpy(dest, inbound_.data() + read_offset_, size);
    read_offset_ += size;
}

void MemoryStream::WriteAll(const uint8_t* data, size_t size) {
    if (size > 0) {
        outbound_.insert(outbound_.end(), data, data + size);
    }
}

void MemoryStream::Flush() {
    ++flush_count_;
}

void MemoryStream::Feed(const Bytes& data) {
    inbound_.insert(inbound_.end(), data.begin(), data.end());
}

const Bytes& MemoryStream::Written() const {
    return outbound_;
}

Bytes MemoryStream::TakeWritten() {
    Bytes out;
    out.swap(outbound_);
    return out;
}

size_t MemoryStream::GetAvailable() const {
    return inbound_.size() - read_offset_;
}

size_t MemoryStream::GetFlushCount() const {
    return flush_count_;
}

// LoggingStream

LoggingStream::LoggingStream(IByteStream& inner)
    : LoggingStream(inner, std::cout)
{}

LoggingStream::LoggingStream(IByteStream& inner, std::ostream& out)
    : inner_(inner)
    , out_(out)
{}

void LoggingStream::ReadExact(uint8_t* dest, size_t size) {
    inner_.ReadExact(dest, size);
    if (size > 0) {
        out_ << "[READ] " << size << " bytes:\n" << FormatHexDump(dest, size) << std::endl;
    }
}

void LoggingStream::WriteAll(const uint8_t* data, size_t size) {
    out_ << "[WRITE] " << size << " bytes:\n" << FormatHexDump(data, size) << std::endl;
    inner_.WriteAll(data, size);
}

void LoggingStream::Flush() {
    out_ << "[FLUSH]" << std::endl;
    inner_.Flush();
}

std::string FormatHexDump(const uint8_t* data, size_t size) {
    std::string result;
    char cell[24];

    for (size_t line = 0; line < size; line += 16) {
        if (line > 0) {
            result.push_back('\n');
        }

        std::snprintf(cell, sizeof(cell), "%04zx  ", line);
        result += cell;

        for (size_t i = 0; i < 16; ++i) {
            if (i == 8) {
                result.push_back(' ');
            }
            if (line + i < size) {
                std::snprintf(cell, sizeof(cell), "%02x ", static_cast<unsigned>(data[line + i]));
                result += cell;
            } else {
                result += "   ";
            }
        }

        result += " |";
        for (size_t i = 0; i < 16 && line + i < size; ++i) {
            uint8_t byte = data[line + i];
            result.push_back(byte >= 0x20 && byte <= 0x7e ? static_cast<char>(byte) : '.');
        }
        result.push_back('|');
    }

    return result;
}

} // namespace pokewire
