#include "crypto/crypto.h"
#include <algorithm>
#include <cstring>
#include <random>

#ifdef ZACKATHON_USE_SECP256K1
#include <secp256k1.h>
#include <mutex>
#endif

namespace zackathon {
namespace crypto {

namespace {

const uint32_t ROUND_CONSTANTS[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

const uint32_t INITIAL_STATE[8] = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
    0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
};

inline uint32_t rotr(uint32_t x, int n) { return (x >> n) | (x << (32 - n)); }

inline uint32_t loadBe32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

inline void storeBe32(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>(v >> 16);
    p[2] = static_cast<uint8_t>(v >> 8);
    p[3] = static_cast<uint8_t>(v);
}

#ifdef ZACKATHON_USE_SECP256K1
// Serializes use of the shared context; callers hold one for the whole call.
class SecpSession {
public:
    SecpSession() : lock_(mutex()) {}
    secp256k1_context* ctx() const { return context(); }

private:
    static std::mutex& mutex() {
        static std::mutex mtx;
        return mtx;
    }
    static secp256k1_context* context() {
        static secp256k1_context* c =
            secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
        return c;
    }
    std::lock_guard<std::mutex> lock_;
};
#else
// Development signatures: r = H(hash || pub), s = H(r || priv).
Hash256 fallbackR(const Hash256& hash, const PublicKey& pub) {
    return Sha256().update(hash).update(pub).finish();
}
#endif

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}

Sha256::Sha256() : buffered_(0), total_(0) {
    std::memcpy(state_, INITIAL_STATE, sizeof(state_));
}

void Sha256::compress(const uint8_t* block) {
    uint32_t w[64];
    for (int i = 0; i < 16; i++) w[i] = loadBe32(block + 4 * i);
    for (int i = 16; i < 64; i++) {
        uint32_t s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
        uint32_t s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
        w[i] = w[i - 16] + s0 + w[i - 7] + s1;
    }

    uint32_t v[8];
    std::memcpy(v, state_, sizeof(v));
    for (int i = 0; i < 64; i++) {
        uint32_t e = v[4];
        uint32_t a = v[0];
        uint32_t t1 = v[7] + (rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25)) +
                      ((e & v[5]) ^ (~e & v[6])) + ROUND_CONSTANTS[i] + w[i];
        uint32_t t2 = (rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22)) +
                      ((a & v[1]) ^ (a & v[2]) ^ (v[1] & v[2]));
        std::memmove(v + 1, v, 7 * sizeof(uint32_t));
        v[4] += t1;
        v[0] = t1 + t2;
    }
    for (int i = 0; i < 8; i++) state_[i] += v[i];
}

Sha256& Sha256::update(const uint8_t* data, size_t len) {
    if (len == 0) return *this;
    total_ += len;
    if (buffered_ > 0) {
        size_t take = std::min(len, sizeof(buffer_) - buffered_);
        std::memcpy(buffer_ + buffered_, data, take);
        buffered_ += take;
        data += take;
        len -= take;
        if (buffered_ < sizeof(buffer_)) return *this;
        compress(buffer_);
        buffered_ = 0;
    }
    for (; len >= 64; data += 64, len -= 64) compress(data);
    if (len > 0) {
        std::memcpy(buffer_, data, len);
        buffered_ = len;
    }
    return *this;
}

Sha256& Sha256::update(const std::string& data) {
    return update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Hash256 Sha256::finish() {
    uint64_t bits = total_ * 8;
    uint8_t pad[72] = {0x80};
    size_t padLen = (buffered_ < 56 ? 56 : 120) - buffered_;
    for (int i = 0; i < 8; i++) pad[padLen + i] = static_cast<uint8_t>(bits >> (56 - 8 * i));
    update(pad, padLen + 8);

    Hash256 out;
    for (int i = 0; i < 8; i++) storeBe32(out.data() + 4 * i, state_[i]);
    return out;
}

Hash256 sha256(const uint8_t* data, size_t len) {
    return Sha256().update(data, len).finish();
}

Hash256 sha256(const std::vector<uint8_t>& data) {
    return sha256(data.data(), data.size());
}

Hash256 sha256(const std::string& data) {
    return Sha256().update(data).finish();
}

std::string sha256Hex(const std::string& data) {
    return toHex(sha256(data));
}

bool usingSecp256k1() {
#ifdef ZACKATHON_USE_SECP256K1
    return true;
#else
    return false;
#endif
}

KeyPair generateKeyPair() {
    KeyPair kp;
    for (;;) {
        auto raw = randomBytes(PRIVATE_KEY_SIZE);
        std::memcpy(kp.privateKey.data(), raw.data(), PRIVATE_KEY_SIZE);
        secureZero(raw.data(), raw.size());
#ifdef ZACKATHON_USE_SECP256K1
        SecpSession s;
        if (secp256k1_ec_seckey_verify(s.ctx(), kp.privateKey.data())) break;
#else
        break;
#endif
    }
    kp.publicKey = derivePublicKey(kp.privateKey);
    return kp;
}

// Hashes the seed forward until it is a valid scalar, so one seed always
// yields the same identity.
KeyPair keyPairFromSeed(const Hash256& seed) {
    KeyPair kp;
    Hash256 candidate = seed;
#ifdef ZACKATHON_USE_SECP256K1
    for (int i = 0; i < 1000; ++i) {
        {
            SecpSession s;
            if (secp256k1_ec_seckey_verify(s.ctx(), candidate.data())) break;
        }
        candidate = sha256(candidate.data(), candidate.size());
    }
#endif
    std::memcpy(kp.privateKey.data(), candidate.data(), PRIVATE_KEY_SIZE);
    kp.publicKey = derivePublicKey(kp.privateKey);
    return kp;
}

PublicKey derivePublicKey(const PrivateKey& privateKey) {
    PublicKey out{};
#ifdef ZACKATHON_USE_SECP256K1
    SecpSession s;
    secp256k1_pubkey pub{};
    size_t outLen = out.size();
    bool ok = secp256k1_ec_pubkey_create(s.ctx(), &pub, privateKey.data()) &&
              secp256k1_ec_pubkey_serialize(s.ctx(), out.data(), &outLen, &pub, SECP256K1_EC_COMPRESSED) &&
              outLen == out.size();
    if (!ok) out.fill(0);
#else
    Hash256 hash = sha256(privateKey.data(), privateKey.size());
    out[0] = 0x02;
    std::memcpy(out.data() + 1, hash.data(), hash.size());
#endif
    return out;
}

Signature sign(const Hash256& hash, const PrivateKey& privateKey) {
    Signature out{};
#ifdef ZACKATHON_USE_SECP256K1
    SecpSession s;
    secp256k1_ecdsa_signature sig{};
    bool ok = secp256k1_ec_seckey_verify(s.ctx(), privateKey.data()) &&
              secp256k1_ecdsa_sign(s.ctx(), &sig, hash.data(), privateKey.data(),
                                   secp256k1_nonce_function_rfc6979, nullptr);
    if (ok) {
        secp256k1_ecdsa_signature_normalize(s.ctx(), &sig, &sig);
        ok = secp256k1_ecdsa_signature_serialize_compact(s.ctx(), out.data(), &sig);
    }
    if (!ok) out.fill(0);
#else
    Hash256 r = fallbackR(hash, derivePublicKey(privateKey));
    Hash256 sPart = Sha256().update(r).update(privateKey).finish();
    std::memcpy(out.data(), r.data(), r.size());
    std::memcpy(out.data() + r.size(), sPart.data(), sPart.size());
#endif
    return out;
}

bool verify(const Hash256& hash, const Signature& signature, const PublicKey& publicKey) {
#ifdef ZACKATHON_USE_SECP256K1
    SecpSession s;
    secp256k1_pubkey pub{};
    secp256k1_ecdsa_signature sig{};
    if (!secp256k1_ec_pubkey_parse(s.ctx(), &pub, publicKey.data(), publicKey.size())) return false;
    if (!secp256k1_ecdsa_signature_parse_compact(s.ctx(), &sig, signature.data())) return false;
    secp256k1_ecdsa_signature_normalize(s.ctx(), &sig, &sig);
    return secp256k1_ecdsa_verify(s.ctx(), &sig, hash.data(), &pub) == 1;
#else
    Hash256 r = fallbackR(hash, publicKey);
    return constantTimeCompare(r.data(), signature.data(), r.size());
#endif
}

std::vector<uint8_t> randomBytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    std::random_device rd;
    std::uniform_int_distribution<int> byte(0, 255);
    for (auto& b : bytes) b = static_cast<uint8_t>(byte(rd));
    return bytes;
}

void secureZero(void* ptr, size_t len) {
    volatile uint8_t* p = static_cast<volatile uint8_t*>(ptr);
    while (len--) *p++ = 0;
}

std::string toHex(const uint8_t* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string result(len * 2, '0');
    for (size_t i = 0; i < len; i++) {
        result[2 * i] = digits[data[i] >> 4];
        result[2 * i + 1] = digits[data[i] & 0x0f];
    }
    return result;
}

std::string toHex(const std::vector<uint8_t>& data) {
    return toHex(data.data(), data.size());
}

std::vector<uint8_t> fromHex(const std::string& hex) {
    bool prefixed = hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X');
    std::string digits = prefixed ? hex.substr(2) : hex;
    if (digits.size() % 2 != 0) return {};

    std::vector<uint8_t> result(digits.size() / 2);
    for (size_t i = 0; i < result.size(); i++) {
        int hi = hexValue(digits[2 * i]);
        int lo = hexValue(digits[2 * i + 1]);
        if (hi < 0 || lo < 0) return {};
        result[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return result;
}

bool constantTimeCompare(const uint8_t* a, const uint8_t* b, size_t len) {
    uint8_t diff = 0;
    for (size_t i = 0; i < len; i++) diff |= a[i] ^ b[i];
    return diff == 0;
}

}
}
