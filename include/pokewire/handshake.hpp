#ifndef POKEWIRE_HANDSHAKE_HPP
#define POKEWIRE_HANDSHAKE_HPP

#include "config.hpp"
#include "framing.hpp"
#include "message_codec.hpp"
#include "messages.hpp"
#include "types.hpp"

#include <cstdint>
#include <optional>

namespace pokewire {

/// Side of the connection a session belongs to
enum class HandshakeRole {
    Client,
    Server,
};

/// Progress of a login handshake
enum class HandshakeState {
    Start,
    AwaitingServerHello,   // client sent ClientHello
    ServerHelloAccepted,   // client holds the server's key and checksum
    ClientHelloAccepted,   // server recovered integrity and timestamp
    AwaitingClientReady,   // server sent ServerHello
    Complete,
};

/// Name of a handshake state
const char* HandshakeStateName(HandshakeState state);

/// Per-connection handshake state machine
///
/// Client: CreateClientHello -> AcceptServerHello -> CreateClientReady
/// Server: AcceptClientHello -> CreateServerHello -> AcceptClientReady
///
/// A step taken out of order, or by the wrong role, throws
/// ProtocolError(UnexpectedMessage) and the connection should be dropped.
class HandshakeSession {
public:
    HandshakeSession(HandshakeRole role, const ObfuscationKeys& keys);

    // Client side

    /// Build the opening message (Start -> AwaitingServerHello)
    ClientHello CreateClientHello(int64_t integrity, int64_t timestamp_millis);

    /// Record the server's reply (AwaitingServerHello -> ServerHelloAccepted)
    /// @throws ProtocolError(InvalidChecksumConfig) if the checksum selector is invalid
    void AcceptServerHello(const ServerHello& hello);

    /// Build the final message (ServerHelloAccepted -> Complete)
    ClientReady CreateClientReady(Bytes client_public_key);

    // Server side

    /// Record the client's opening message and recover its values
    /// (Start -> ClientHelloAccepted)
    void AcceptClientHello(const ClientHello& hello);

    /// Build the reply (ClientHelloAccepted -> AwaitingClientReady)
    ServerHello CreateServerHello(Bytes server_public_key, Bytes signature, const ChecksumConfig& checksum);

    /// Record the client's final message (-> Complete)
    void AcceptClientReady(const ClientReady& ready);

    /// Get the session role
    HandshakeRole GetRole() const;

    /// Get the current state
    HandshakeState GetState() const;

    /// Check whether the handshake finished
    bool IsComplete() const;

    /// Get the integrity value sent or recovered (0 before ClientHello)
    int64_t GetIntegrity() const;

    /// Get the client timestamp in Unix milliseconds (0 before ClientHello)
    int64_t GetTimestampMillis() const;

    /// Get the server's SEC1 public key
    const Bytes& GetServerPublicKey() const;

    /// Get the server's DER signature (not verified)
    const Bytes& GetServerSignature() const;

    /// Get the client's SEC1 public key
    const Bytes& GetClientPublicKey() const;

    /// Get the negotiated checksum (empty before ServerHello)
    const std::optional<ChecksumConfig>& GetChecksum() const;

private:
    void Expect(HandshakeRole role, HandshakeState state, const char* step) const;

    HandshakeRole role_;
    ObfuscationKeys keys_;
    HandshakeState state_;
    int64_t integrity_;
    int64_t timestamp_millis_;
    Bytes server_public_key_;
    Bytes server_signature_;
    Bytes client_public_key_;
    std::optional<ChecksumConfig> checksum_;
};

/// Key material a server presents in ServerHello
struct ServerCredentials {
    /// SEC1-encoded public key
    Bytes public_key;

    /// DER signature over public_key
    Bytes signature;
};

/// Run the client side of the handshake over a connected stream
///
/// The server's key and signature are stored, not verified. There is no
/// trusted root key to check them against yet; callers that need it run
/// RequireValidPublicKey and RequireValidSignature on the returned session.
///
/// @param integrity Random value to send (see RandomInt64)
/// @param client_public_key SEC1-encoded client key for ClientReady
/// @return The completed session
HandshakeSession PerformClientHandshake(MessageStream<LoginCodec>& stream,
                                        const SessionConfig& config,
                                        int64_t integrity,
                                        const Bytes& client_public_key);

/// Run the server side of the handshake over an accepted stream
/// The checksum selector is taken from config.checksum_size
HandshakeSession PerformServerHandshake(MessageStream<LoginCodec>& stream,
                                        const SessionConfig& config,
                                        const ServerCredentials& credentials);

/// Current Unix time in milliseconds
int64_t CurrentUnixMillis();

} // namespace pokewire

#endif // POKEWIRE_HANDSHAKE_HPP
