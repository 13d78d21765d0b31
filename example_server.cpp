// Example login server
// Usage: pokewire_example_server [port] [-v]

#include <pokewire/crypto.hpp>
#include <pokewire/error.hpp>
#include <pokewire/handshake.hpp>
#include <pokewire/tcp_stream.hpp>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    using namespace pokewire;

    // 1. Configure from the command line
    SessionConfig config;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-v") {
            config.log_traffic = true;
        } else {
            positional.push_back(arg);
        }
    }

    try {
        if (!positional.empty()) {
            config.port = ParsePort(positional[0]);
        }

        // 2. Server key signs its own public key
        EcKeyPair key = EcKeyPair::Generate();
        ServerCredentials credentials;
        credentials.public_key = key.PublicKeySec1();
        credentials.signature = key.Sign(credentials.public_key);

        // 3. Wait for one client
        TcpListener listener(config.port);
        std::cout << "Listening on port " << listener.GetPort() << "..." << std::endl;

        auto socket = listener.Accept();
        std::cout << "Client connected from " << socket->GetRemoteEndpoint() << std::endl;

        // 4. Run the handshake
        LoggingStream logged(*socket);
        IByteStream& transport = config.log_traffic ? static_cast<IByteStream&>(logged) : *socket;
        MessageStream<LoginCodec> stream(transport, config.encryption, config.packet_checksum);

        HandshakeSession session = PerformServerHandshake(stream, config, credentials);

        // 5. Refuse a client key that is not a P-256 point
        RequireValidPublicKey(session.GetClientPublicKey(), "client");

        std::cout << "Handshake complete" << std::endl;
        std::cout << "  Integrity: " << session.GetIntegrity() << std::endl;
        std::cout << "  Client timestamp: " << session.GetTimestampMillis() << " ms" << std::endl;
        std::cout << "  Client key: " << session.GetClientPublicKey().size() << " bytes" << std::endl;

        socket->Close();
    } catch (const ProtocolError& e) {
        std::cerr << "Protocol error (" << ErrorKindName(e.GetKind()) << "): " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
