#ifndef POKEWIRE_CRYPTO_HPP
#define POKEWIRE_CRYPTO_HPP

#include "types.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace pokewire {

/// P-256 key pair backed by OpenSSL
/// Supplies the opaque key and signature bytes carried by the handshake
class EcKeyPair {
public:
    ~EcKeyPair();
    EcKeyPair(EcKeyPair&& other) noexcept;
    EcKeyPair& operator=(EcKeyPair&& other) noexcept;

    // Delete copy operations
    EcKeyPair(const EcKeyPair&) = delete;
    EcKeyPair& operator=(const EcKeyPair&) = delete;

    /// Generate a fresh key
    /// @throws CryptoError
    static EcKeyPair Generate();

    /// Uncompressed SEC1 public point (65 bytes)
    Bytes PublicKeySec1() const;

    /// DER-encoded ECDSA signature over SHA-256(data)
    Bytes Sign(const Bytes& data) const;

private:
    class Impl;
    explicit EcKeyPair(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

/// Check a DER signature over data against a SEC1 public key
/// Returns false for a bad signature or a malformed key
bool VerifySignature(const Bytes& public_key_sec1, const Bytes& data, const Bytes& der_signature);

/// Check that bytes decode to a point on P-256
bool IsValidPublicKey(const Bytes& public_key_sec1);

/// Reject a peer key that is not a point on P-256
/// @param what Names the key in the error message
/// @throws CryptoError
void RequireValidPublicKey(const Bytes& public_key_sec1, const std::string& what);

/// Reject a signature that does not verify
/// @throws CryptoError
void RequireValidSignature(const Bytes& public_key_sec1, const Bytes& data, const Bytes& der_signature);

/// Draw a cryptographically random 64-bit integer
/// @throws CryptoError if the generator fails
int64_t RandomInt64();

} // namespace pokewire

#endif // POKEWIRE_CRYPTO_HPP
