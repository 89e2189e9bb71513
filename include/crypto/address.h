#pragma once

#include "crypto.h"
#include <array>
#include <optional>
#include <string>

namespace zackathon {
namespace crypto {

constexpr size_t ADDRESS_SIZE = 20;
constexpr const char* ADDRESS_PREFIX = "0x";

// 20-byte account identity: the last 20 bytes of SHA-256 over the
// compressed public key. The all-zero address means "nobody".
class Address {
public:
    using Bytes = std::array<uint8_t, ADDRESS_SIZE>;

    Address();
    explicit Address(const Bytes& bytes);

    static Address fromPublicKey(const PublicKey& publicKey);
    static std::optional<Address> fromHex(const std::string& text);
    static bool isValid(const std::string& text);
    static Address zero() { return Address(); }

    std::string toHex() const;
    bool isZero() const;
    const Bytes& bytes() const { return bytes_; }

    bool operator==(const Address& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Address& other) const { return bytes_ != other.bytes_; }
    bool operator<(const Address& other) const { return bytes_ < other.bytes_; }

private:
    Bytes bytes_;
};

}
}
