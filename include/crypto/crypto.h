#pragma once

#include <string>
#include <vector>
#include <array>
#include <cstdint>

namespace zackathon {
namespace crypto {

constexpr size_t SHA256_SIZE = 32;
constexpr size_t PRIVATE_KEY_SIZE = 32;
constexpr size_t PUBLIC_KEY_SIZE = 33;
constexpr size_t SIGNATURE_SIZE = 64;

using Hash256 = std::array<uint8_t, SHA256_SIZE>;
using PrivateKey = std::array<uint8_t, PRIVATE_KEY_SIZE>;
using PublicKey = std::array<uint8_t, PUBLIC_KEY_SIZE>;
using Signature = std::array<uint8_t, SIGNATURE_SIZE>;

struct KeyPair {
    PublicKey publicKey;
    PrivateKey privateKey;
};

// Incremental SHA-256 for inputs assembled from several pieces.
class Sha256 {
public:
    Sha256();
    Sha256& update(const uint8_t* data, size_t len);
    Sha256& update(const std::string& data);
    template<size_t N>
    Sha256& update(const std::array<uint8_t, N>& data) { return update(data.data(), N); }
    Hash256 finish();

private:
    void compress(const uint8_t* block);

    uint32_t state_[8];
    uint8_t buffer_[64];
    size_t buffered_;
    uint64_t total_;
};

Hash256 sha256(const uint8_t* data, size_t len);
Hash256 sha256(const std::vector<uint8_t>& data);
Hash256 sha256(const std::string& data);
std::string sha256Hex(const std::string& data);

KeyPair generateKeyPair();
KeyPair keyPairFromSeed(const Hash256& seed);
PublicKey derivePublicKey(const PrivateKey& privateKey);

// secp256k1 compact ECDSA when built with ZACKATHON_USE_SECP256K1. Without
// it a hash-based scheme is used that is self-consistent but forgeable by
// anyone holding the public key; suitable for development only.
Signature sign(const Hash256& hash, const PrivateKey& privateKey);
bool verify(const Hash256& hash, const Signature& signature, const PublicKey& publicKey);
bool usingSecp256k1();

std::vector<uint8_t> randomBytes(size_t count);
void secureZero(void* ptr, size_t len);

std::string toHex(const uint8_t* data, size_t len);
std::string toHex(const std::vector<uint8_t>& data);
template<size_t N>
std::string toHex(const std::array<uint8_t, N>& data) {
    return toHex(data.data(), N);
}
// Accepts an optional 0x prefix. Returns empty on odd length or a non-hex digit.
std::vector<uint8_t> fromHex(const std::string& hex);

template<size_t N>
bool fromHexFixed(const std::string& hex, std::array<uint8_t, N>& out) {
    std::vector<uint8_t> raw = fromHex(hex);
    if (raw.size() != N) return false;
    for (size_t i = 0; i < N; i++) out[i] = raw[i];
    return true;
}

bool constantTimeCompare(const uint8_t* a, const uint8_t* b, size_t len);

}
}
