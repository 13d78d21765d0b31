// Example login client
// Usage: pokewire_example_client [host] [port] [-v]

#include <pokewire/crypto.hpp>
#include <pokewire/error.hpp>
#include <pokewire/handshake.hpp>
#include <pokewire/tcp_stream.hpp>
#include <iostream>
#include <string>
#include <vector>

namespace {

const char* ChecksumKindName(pokewire::ChecksumConfig::Kind kind) {
    switch (kind) {
        case pokewire::ChecksumConfig::Kind::None: return "none";
        case pokewire::ChecksumConfig::Kind::Crc16: return "CRC16";
        case pokewire::ChecksumConfig::Kind::HmacSha256: return "HMAC-SHA256";
    }
    return "?";
}

} // namespace

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
        if (positional.size() > 0) {
            config.host = positional[0];
        }
        if (positional.size() > 1) {
            config.port = ParsePort(positional[1]);
        }

        // 2. Connect
        std::cout << "Connecting to " << config.host << ":" << config.port << "..." << std::endl;
        auto socket = TcpStream::Connect(config.host, config.port);
        std::cout << "Connected" << std::endl;

        // 3. Run the handshake
        LoggingStream logged(*socket);
        IByteStream& transport = config.log_traffic ? static_cast<IByteStream&>(logged) : *socket;
        MessageStream<LoginCodec> stream(transport, config.encryption, config.packet_checksum);

        EcKeyPair key = EcKeyPair::Generate();
        int64_t integrity = RandomInt64();

        HandshakeSession session = PerformClientHandshake(stream, config, integrity, key.PublicKeySec1());

        // 4. The server signs its own public key
        RequireValidPublicKey(session.GetServerPublicKey(), "server");
        RequireValidSignature(session.GetServerPublicKey(), session.GetServerPublicKey(),
                              session.GetServerSignature());

        const ChecksumConfig& checksum = *session.GetChecksum();
        std::cout << "Handshake complete" << std::endl;
        std::cout << "  Integrity: " << integrity << std::endl;
        std::cout << "  Checksum: " << ChecksumKindName(checksum.GetKind())
                  << " (selector " << static_cast<int>(checksum.GetSelector()) << ")" << std::endl;
        std::cout << "  Server key: " << session.GetServerPublicKey().size() << " bytes, signature verified" << std::endl;

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
