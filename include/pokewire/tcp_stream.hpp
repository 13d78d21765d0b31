#ifndef POKEWIRE_TCP_STREAM_HPP
#define POKEWIRE_TCP_STREAM_HPP

#include "stream.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace pokewire {

class TcpListener;

/// Blocking TCP byte stream using asio
/// Every socket failure is thrown as IoError
class TcpStream : public IByteStream {
    class Impl;

    // Restricts construction to Connect and TcpListener::Accept
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    TcpStream(PrivateTag, std::unique_ptr<Impl> impl);
    ~TcpStream();

    // Delete copy operations
    TcpStream(const TcpStream&) = delete;
    TcpStream& operator=(const TcpStream&) = delete;

    /// Resolve host and connect
    /// @throws IoError on resolve or connect failure
    static std::unique_ptr<TcpStream> Connect(const std::string& host, uint16_t port);

    void ReadExact(uint8_t* dest, size_t size) override;
    void WriteAll(const uint8_t* data, size_t size) override;

    /// No-op: writes go straight to the socket
    void Flush() override;

    /// Shut down and close the socket
    void Close();

    /// Check if the socket is open
    bool IsOpen() const;

    /// Get the remote endpoint as "address:port"
    std::string GetRemoteEndpoint() const;

private:
    friend class TcpListener;

    std::unique_ptr<Impl> impl_;
};

/// Listening TCP socket handing out blocking streams
class TcpListener {
public:
    /// Bind and listen
    /// @param port Port to bind (0 picks an ephemeral port)
    /// @throws IoError on bind or listen failure
    explicit TcpListener(uint16_t port, const std::string& address = "0.0.0.0");
    ~TcpListener();

    // Delete copy operations
    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    /// Block until a client connects
    std::unique_ptr<TcpStream> Accept();

    /// Get the bound port
    uint16_t GetPort() const;

    /// Stop listening
    void Close();

    /// Check if the listener still accepts
    bool IsOpen() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pokewire

#endif // POKEWIRE_TCP_STREAM_HPP
