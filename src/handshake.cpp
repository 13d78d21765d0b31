#include "pokewire/handshake.hpp"
#include "pokewire/error.hpp"
#include <chrono>
#include <string>
#include <utility>

namespace pokewire {

const char* HandshakeStateName(HandshakeState state) {
    switch (state) {
        case HandshakeState::Start: return "Start";
        case HandshakeState::AwaitingServerHello: return "AwaitingServerHello";
        case HandshakeState::ServerHelloAccepted: return "ServerHelloAccepted";
        case HandshakeState::ClientHelloAccepted: return "ClientHelloAccepted";
        case HandshakeState::AwaitingClientReady: return "AwaitingClientReady";
        case HandshakeState::Complete: return "Complete";
    }
    return "Unknown";
}

HandshakeSession::HandshakeSession(HandshakeRole role, const ObfuscationKeys& keys)
    : role_(role)
    , keys_(keys)
    , state_(HandshakeState::Start)
    , integrity_(0)
    , timestamp_millis_(0)
{}

void HandshakeSession::Expect(HandshakeRole role, HandshakeState state, const char* step) const {
    if (role_ != role) {
        throw ProtocolError(ErrorKind::UnexpectedMessage,
                            std::string(step) + " is not valid for the " +
                                (role_ == HandshakeRole::Client ? "client" : "server"));
    }
    if (state_ != state) {
        throw ProtocolError(ErrorKind::UnexpectedMessage,
                            std::string(step) + " not allowed in state " + HandshakeStateName(state_));
    }
}

ClientHello HandshakeSession::CreateClientHello(int64_t integrity, int64_t timestamp_millis) {
    Expect(HandshakeRole::Client, HandshakeState::Start, "ClientHello");

    integrity_ = integrity;
    timestamp_millis_ = timestamp_millis;
    state_ = HandshakeState::AwaitingServerHello;
    return ClientHello::Create(integrity, timestamp_millis, keys_);
}

void HandshakeSession::AcceptServerHello(const ServerHello& hello) {
    Expect(HandshakeRole::Client, HandshakeState::AwaitingServerHello, "ServerHello");

    // Parse before storing anything so a bad selector leaves no partial state
    ChecksumConfig checksum = hello.GetChecksum();

    server_public_key_ = hello.public_key;
    server_signature_ = hello.signature;
    checksum_ = checksum;
    state_ = HandshakeState::ServerHelloAccepted;
}

ClientReady HandshakeSession::CreateClientReady(Bytes client_public_key) {
    Expect(HandshakeRole::Client, HandshakeState::ServerHelloAccepted, "ClientReady");

    client_public_key_ = std::move(client_public_key);
    state_ = HandshakeState::Complete;

    ClientReady ready;
    ready.public_key = client_public_key_;
    return ready;
}

void HandshakeSession::AcceptClientHello(const ClientHello& hello) {
    Expect(HandshakeRole::Server, HandshakeState::Start, "ClientHello");

    integrity_ = hello.GetIntegrity(keys_);
    timestamp_millis_ = hello.GetTimestampMillis(keys_);
    state_ = HandshakeState::ClientHelloAccepted;
}

ServerHello HandshakeSession::CreateServerHello(Bytes server_public_key,
                                                Bytes signature,
                                                const ChecksumConfig& checksum) {
    Expect(HandshakeRole::Server, HandshakeState::ClientHelloAccepted, "ServerHello");

    server_public_key_ = std::move(server_public_key);
    server_signature_ = std::move(signature);
    checksum_ = checksum;
    state_ = HandshakeState::AwaitingClientReady;
    return ServerHello::Create(server_public_key_, server_signature_, checksum);
}

void HandshakeSession::AcceptClientReady(const ClientReady& ready) {
    Expect(HandshakeRole::Server, HandshakeState::AwaitingClientReady, "ClientReady");

    client_public_key_ = ready.public_key;
    state_ = HandshakeState::Complete;
}

HandshakeRole HandshakeSession::GetRole() const {
    return role_;
}

HandshakeState HandshakeSession::GetState() const {
    return state_;
}

bool HandshakeSession::IsComplete() const {
    return state_ == HandshakeState::Complete;
}

int64_t HandshakeSession::GetIntegrity() const {
    return integrity_;
}

int64_t HandshakeSession::GetTimestampMillis() const {
    return timestamp_millis_;
}

const Bytes& HandshakeSession::GetServerPublicKey() const {
    return server_public_key_;
}

const Bytes& HandshakeSession::GetServerSignature() const {
    return server_signature_;
}

const Bytes& HandshakeSession::GetClientPublicKey() const {
    return client_public_key_;
}

const std::optional<ChecksumConfig>& HandshakeSession::GetChecksum() const {
    return checksum_;
}

HandshakeSession PerformClientHandshake(MessageStream<LoginCodec>& stream,
                                        const SessionConfig& config,
                                        int64_t integrity,
                                        const Bytes& client_public_key) {
    HandshakeSession session(HandshakeRole::Client, config.obfuscation);

    stream.Write(session.CreateClientHello(integrity, CurrentUnixMillis()));

    session.AcceptServerHello(stream.ReadAs<ServerHello>());

    stream.Write(session.CreateClientReady(client_public_key));
    return session;
}

HandshakeSession PerformServerHandshake(MessageStream<LoginCodec>& stream,
                                        const SessionConfig& config,
                                        const ServerCredentials& credentials) {
    HandshakeSession session(HandshakeRole::Server, config.obfuscation);

    session.AcceptClientHello(stream.ReadAs<ClientHello>());

    stream.Write(session.CreateServerHello(credentials.public_key,
                                           credentials.signature,
                                           ChecksumConfig::FromSelector(config.checksum_size)));

    session.AcceptClientReady(stream.ReadAs<ClientReady>());
    return session;
}

int64_t CurrentUnixMillis() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

} // namespace pokewire
