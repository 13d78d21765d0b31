#include <gtest/gtest.h>
#include <pokewire/crypto.hpp>
#include <pokewire/error.hpp>
#include <pokewire/handshake.hpp>
#include <pokewire/tcp_stream.hpp>
#include <chrono>
#include <future>
#include <iostream>
#include <optional>
#include <thread>

using namespace pokewire;

class TcpHandshakeTest : public ::testing::Test {
protected:
    void SetUp() override {
        listener_ = std::make_unique<TcpListener>(0, "127.0.0.1");
        config_.port = listener_->GetPort();
        config_.checksum_size = 16;
    }

    void TearDown() override {
        ReleaseServer();
        listener_->Close();
    }

    /// Join the server thread, waking it first if it is still in Accept()
    /// A listener close does not interrupt a blocking accept on every
    /// platform, so a throwaway connection is made and dropped instead
    void ReleaseServer() {
        if (!server_thread_.joinable()) {
            return;
        }
        if (listener_->IsOpen()) {
            try {
                auto wake = TcpStream::Connect("127.0.0.1", listener_->GetPort());
                wake->Close();
            } catch (const IoError& e) {
                std::cerr << "Wake-up connect failed: " << e.what() << std::endl;
            }
        }
        server_thread_.join();
    }

    /// Accept one client and run the server handshake on a background thread
    std::future<std::optional<HandshakeSession>> StartServer(ServerCredentials credentials) {
        auto promise = std::make_shared<std::promise<std::optional<HandshakeSession>>>();
        auto future = promise->get_future();

        server_thread_ = std::thread([this, promise, credentials]() {
            try {
                auto socket = listener_->Accept();
                MessageStream<LoginCodec> stream(*socket);
                promise->set_value(PerformServerHandshake(stream, config_, credentials));
            } catch (const std::exception& e) {
                std::cerr << "Server handshake error: " << e.what() << std::endl;
                promise->set_value(std::nullopt);
            }
        });
        return future;
    }

    std::unique_ptr<TcpListener> listener_;
    SessionConfig config_;
    std::thread server_thread_;
};

TEST_F(TcpHandshakeTest, LoopbackHandshake) {
    EcKeyPair server_key = EcKeyPair::Generate();
    ServerCredentials credentials;
    credentials.public_key = server_key.PublicKeySec1();
    credentials.signature = server_key.Sign(credentials.public_key);

    auto server_result = StartServer(credentials);

    EcKeyPair client_key = EcKeyPair::Generate();
    const int64_t integrity = RandomInt64();

    auto socket = TcpStream::Connect("127.0.0.1", config_.port);
    ASSERT_TRUE(socket->IsOpen());
    MessageStream<LoginCodec> stream(*socket);
    HandshakeSession client = PerformClientHandshake(stream, config_, integrity, client_key.PublicKeySec1());

    ASSERT_EQ(server_result.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    std::optional<HandshakeSession> server = server_result.get();
    ASSERT_TRUE(server.has_value());

    EXPECT_TRUE(client.IsComplete());
    EXPECT_TRUE(server->IsComplete());
    EXPECT_EQ(server->GetIntegrity(), integrity);
    EXPECT_EQ(server->GetTimestampMillis(), client.GetTimestampMillis());
    EXPECT_EQ(server->GetClientPublicKey(), client_key.PublicKeySec1());

    EXPECT_EQ(client.GetServerPublicKey(), credentials.public_key);
    EXPECT_EQ(client.GetChecksum()->GetSelector(), 16);
    EXPECT_TRUE(VerifySignature(client.GetServerPublicKey(),
                                client.GetServerPublicKey(),
                                client.GetServerSignature()));

    // The checks the example programs run on the peer material
    EXPECT_NO_THROW(RequireValidPublicKey(client.GetServerPublicKey(), "server"));
    EXPECT_NO_THROW(RequireValidSignature(client.GetServerPublicKey(),
                                          client.GetServerPublicKey(),
                                          client.GetServerSignature()));
    EXPECT_NO_THROW(RequireValidPublicKey(server->GetClientPublicKey(), "client"));

    socket->Close();
    EXPECT_FALSE(socket->IsOpen());
}

TEST_F(TcpHandshakeTest, ForgedClientKeyCompletesButFailsValidation) {
    EcKeyPair server_key = EcKeyPair::Generate();
    ServerCredentials credentials;
    credentials.public_key = server_key.PublicKeySec1();
    credentials.signature = server_key.Sign(credentials.public_key);

    auto server_result = StartServer(credentials);

    auto socket = TcpStream::Connect("127.0.0.1", config_.port);
    MessageStream<LoginCodec> stream(*socket);
    PerformClientHandshake(stream, config_, 7, Bytes(65, 0x05));

    ASSERT_EQ(server_result.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    std::optional<HandshakeSession> server = server_result.get();
    ASSERT_TRUE(server.has_value());
    EXPECT_TRUE(server->IsComplete());
    EXPECT_THROW(RequireValidPublicKey(server->GetClientPublicKey(), "client"), CryptoError);
}

TEST_F(TcpHandshakeTest, ServerThreadReleasedWhenClientNeverConnects) {
    auto server_result = StartServer(ServerCredentials{});

    ReleaseServer();

    // The wake-up connection closes before ClientHello, so the server gives up
    ASSERT_EQ(server_result.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    EXPECT_FALSE(server_result.get().has_value());
}

TEST_F(TcpHandshakeTest, PeerCloseIsIoError) {
    server_thread_ = std::thread([this]() {
        try {
            auto socket = listener_->Accept();
            socket->Close();
        } catch (const std::exception& e) {
            std::cerr << "Server error: " << e.what() << std::endl;
        }
    });

    auto socket = TcpStream::Connect("127.0.0.1", config_.port);
    MessageStream<LoginCodec> stream(*socket);
    EXPECT_THROW(stream.Read(), IoError);
}

TEST_F(TcpHandshakeTest, ConnectFailureIsIoError) {
    uint16_t port = listener_->GetPort();
    EXPECT_TRUE(listener_->IsOpen());
    listener_->Close();
    EXPECT_FALSE(listener_->IsOpen());
    EXPECT_THROW(TcpStream::Connect("127.0.0.1", port), IoError);
}

TEST_F(TcpHandshakeTest, InvalidListenAddress) {
    EXPECT_THROW(TcpListener(0, "not-an-address"), IoError);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
