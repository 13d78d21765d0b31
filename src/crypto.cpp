#include "pokewire/crypto.hpp"
#include "pokewire/error.hpp"

#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <cstring>
#include <string>
#include <utility>

namespace pokewire {

namespace {

constexpr const char* CURVE_NAME = "P-256";
constexpr const char* CURVE_GROUP = "prime256v1";

struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

[[noreturn]] void ThrowCrypto(const std::string& action) {
    unsigned long code = ERR_get_error();
    std::string detail = "unknown error";
    if (code != 0) {
        char buffer[256];
        ERR_error_string_n(code, buffer, sizeof(buffer));
        detail = buffer;
    }
    ERR_clear_error();
    throw CryptoError(action + ": " + detail);
}

/// Import a SEC1 point as a public key; null if it is not a P-256 point
PkeyPtr ImportPublicKey(const Bytes& public_key_sec1) {
    if (public_key_sec1.empty()) {
        return nullptr;
    }

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr));
    if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
        ERR_clear_error();
        return nullptr;
    }

    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                         const_cast<char*>(CURVE_GROUP), 0),
        OSSL_PARAM_construct_octet_string(OSSL_PKEY_PARAM_PUB_KEY,
                                          const_cast<uint8_t*>(public_key_sec1.data()),
                                          public_key_sec1.size()),
        OSSL_PARAM_construct_end(),
    };

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_fromdata(ctx.get(), &raw, EVP_PKEY_PUBLIC_KEY, params) != 1) {
        ERR_clear_error();
        return nullptr;
    }
    PkeyPtr key(raw);

    // fromdata does not always check the point is on the curve
    PkeyCtxPtr check(EVP_PKEY_CTX_new_from_pkey(nullptr, key.get(), nullptr));
    if (!check || EVP_PKEY_public_check(check.get()) != 1) {
        ERR_clear_error();
        return nullptr;
    }
    return key;
}

} // namespace

class EcKeyPair::Impl {
public:
    PkeyPtr key_;

    explicit Impl(PkeyPtr key)
        : key_(std::move(key))
    {}
};

EcKeyPair::EcKeyPair(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl))
{}

EcKeyPair::~EcKeyPair() = default;
EcKeyPair::EcKeyPair(EcKeyPair&& other) noexcept = default;
EcKeyPair& EcKeyPair::operator=(EcKeyPair&& other) noexcept = default;

EcKeyPair EcKeyPair::Generate() {
    PkeyPtr key(EVP_PKEY_Q_keygen(nullptr, nullptr, "EC", CURVE_NAME));
    if (!key) {
        ThrowCrypto("Failed to generate P-256 key");
    }
    return EcKeyPair(std::make_unique<Impl>(std::move(key)));
}

Bytes EcKeyPair::PublicKeySec1() const {
    // Uncompressed is the default point format for generated EC keys
    unsigned char* raw = nullptr;
    size_t size = EVP_PKEY_get1_encoded_public_key(impl_->key_.get(), &raw);
    if (size == 0 || raw == nullptr) {
        ThrowCrypto("Failed to encode public key");
    }

    Bytes result(raw, raw + size);
    OPENSSL_free(raw);
    return result;
}

Bytes EcKeyPair::Sign(const Bytes& data) const {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        ThrowCrypto("Failed to create digest context");
    }
    if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, impl_->key_.get()) != 1) {
        ThrowCrypto("Failed to initialize signing");
    }

    size_t size = 0;
    if (EVP_DigestSign(ctx.get(), nullptr, &size, data.data(), data.size()) != 1) {
        ThrowCrypto("Failed to size signature");
    }

    Bytes signature(size);
    if (EVP_DigestSign(ctx.get(), signature.data(), &size, data.data(), data.size()) != 1) {
        ThrowCrypto("Failed to sign");
    }
    signature.resize(size);
    return signature;
}

bool VerifySignature(const Bytes& public_key_sec1, const Bytes& data, const Bytes& der_signature) {
    PkeyPtr key = ImportPublicKey(public_key_sec1);
    if (!key) {
        return false;
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        ThrowCrypto("Failed to create digest context");
    }
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.get()) != 1) {
        ThrowCrypto("Failed to initialize verification");
    }

    int result = EVP_DigestVerify(ctx.get(), der_signature.data(), der_signature.size(),
                                  data.data(), data.size());
    // 0 is a bad signature, negative a malformed one
    ERR_clear_error();
    return result == 1;
}

bool IsValidPublicKey(const Bytes& public_key_sec1) {
    return ImportPublicKey(public_key_sec1) != nullptr;
}

void RequireValidPublicKey(const Bytes& public_key_sec1, const std::string& what) {
    if (!IsValidPublicKey(public_key_sec1)) {
        throw CryptoError("Invalid " + what + " public key (" +
                          std::to_string(public_key_sec1.size()) + " bytes)");
    }
}

void RequireValidSignature(const Bytes& public_key_sec1, const Bytes& data, const Bytes& der_signature) {
    if (!VerifySignature(public_key_sec1, data, der_signature)) {
        throw CryptoError("Signature verification failed");
    }
}

int64_t RandomInt64() {
    uint8_t bytes[sizeof(int64_t)];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        ThrowCrypto("Random generator failed");
    }

    uint64_t value = 0;
    std::memcpy(&value, bytes, sizeof(value));
    return static_cast<int64_t>(value);
}

} // namespace pokewire
