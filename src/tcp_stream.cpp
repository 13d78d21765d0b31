#include "pokewire/tcp_stream.hpp"
#include "pokewire/error.hpp"
#include "asio_include.hpp"
#include <string>
#include <utility>

namespace pokewire {

namespace {

[[noreturn]] void ThrowIo(const std::string& action, const internal::AsioErrorCode& ec) {
    throw IoError(action + ": " + ec.message());
}

} // namespace

class TcpStream::Impl {
public:
    std::shared_ptr<asio::io_context> io_context_;
    asio::ip::tcp::socket socket_;

    explicit Impl(std::shared_ptr<asio::io_context> io_context)
        : io_context_(std::move(io_context))
        , socket_(*io_context_)
    {}

    ~Impl() {
        Close();
    }

    void Close() {
        internal::AsioErrorCode ec;
        if (socket_.is_open()) {
            // Errors here mean the peer is already gone
            socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
            socket_.close(ec);
        }
    }
};

TcpStream::TcpStream(PrivateTag, std::unique_ptr<Impl> impl)
    : impl_(std::move(impl))
{}

TcpStream::~TcpStream() = default;

std::unique_ptr<TcpStream> TcpStream::Connect(const std::string& host, uint16_t port) {
    auto impl = std::make_unique<Impl>(std::make_shared<asio::io_context>());

    internal::AsioErrorCode ec;
    asio::ip::tcp::resolver resolver(*impl->io_context_);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        ThrowIo("Failed to resolve " + host, ec);
    }

    asio::connect(impl->socket_, endpoints, ec);
    if (ec) {
        ThrowIo("Failed to connect to " + host + ":" + std::to_string(port), ec);
    }

    impl->socket_.set_option(asio::ip::tcp::no_delay(true), ec);
    if (ec) {
        ThrowIo("Failed to set TCP_NODELAY", ec);
    }

    return std::make_unique<TcpStream>(PrivateTag{}, std::move(impl));
}

void TcpStream::ReadExact(uint8_t* dest, size_t size) {
    if (size == 0) {
        return;
    }
    if (!impl_->socket_.is_open()) {
        throw IoError("Read on closed socket");
    }

    internal::AsioErrorCode ec;
    asio::read(impl_->socket_, asio::buffer(dest, size), ec);
    if (ec == asio::error::eof) {
        throw IoError("Connection closed by peer");
    }
    if (ec) {
        ThrowIo("Read failed", ec);
    }
}

void TcpStream::WriteAll(const uint8_t* data, size_t size) {
    if (size == 0) {
        return;
    }
    if (!impl_->socket_.is_open()) {
        throw IoError("Write on closed socket");
    }

    internal::AsioErrorCode ec;
    asio::write(impl_->socket_, asio::buffer(data, size), ec);
    if (ec) {
        ThrowIo("Write failed", ec);
    }
}

void TcpStream::Flush() {}

void TcpStream::Close() {
    impl_->Close();
}

bool TcpStream::IsOpen() const {
    return impl_->socket_.is_open();
}

std::string TcpStream::GetRemoteEndpoint() const {
    internal::AsioErrorCode ec;
    auto endpoint = impl_->socket_.remote_endpoint(ec);
    if (ec) {
        ThrowIo("Failed to query remote endpoint", ec);
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

// TcpListener

class TcpListener::Impl {
public:
    std::shared_ptr<asio::io_context> io_context_;
    asio::ip::tcp::acceptor acceptor_;

    Impl()
        : io_context_(std::make_shared<asio::io_context>())
        , acceptor_(*io_context_)
    {}
};

TcpListener::TcpListener(uint16_t port, const std::string& address)
    : impl_(std::make_unique<Impl>())
{
    internal::AsioErrorCode ec;
    auto bind_address = asio::ip::make_address(address, ec);
    if (ec) {
        ThrowIo("Invalid listen address " + address, ec);
    }

    asio::ip::tcp::endpoint endpoint(bind_address, port);
    impl_->acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        ThrowIo("Failed to open acceptor", ec);
    }
    impl_->acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
    if (ec) {
        ThrowIo("Failed to set SO_REUSEADDR", ec);
    }
    impl_->acceptor_.bind(endpoint, ec);
    if (ec) {
        ThrowIo("Failed to bind " + address + ":" + std::to_string(port), ec);
    }
    impl_->acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        ThrowIo("Failed to listen", ec);
    }
}

TcpListener::~TcpListener() {
    Close();
}

std::unique_ptr<TcpStream> TcpListener::Accept() {
    auto stream_impl = std::make_unique<TcpStream::Impl>(impl_->io_context_);

    internal::AsioErrorCode ec;
    impl_->acceptor_.accept(stream_impl->socket_, ec);
    if (ec) {
        ThrowIo("Accept failed", ec);
    }

    stream_impl->socket_.set_option(asio::ip::tcp::no_delay(true), ec);
    if (ec) {
        ThrowIo("Failed to set TCP_NODELAY", ec);
    }

    return std::make_unique<TcpStream>(TcpStream::PrivateTag{}, std::move(stream_impl));
}

uint16_t TcpListener::GetPort() const {
    internal::AsioErrorCode ec;
    auto endpoint = impl_->acceptor_.local_endpoint(ec);
    if (ec) {
        ThrowIo("Failed to query local endpoint", ec);
    }
    return endpoint.port();
}

void TcpListener::Close() {
    internal::AsioErrorCode ec;
    if (impl_ && impl_->acceptor_.is_open()) {
        impl_->acceptor_.close(ec);
    }
}

bool TcpListener::IsOpen() const {
    return impl_ && impl_->acceptor_.is_open();
}

} // namespace pokewire
