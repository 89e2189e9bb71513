#include "crypto/address.h"
#include <algorithm>
#include <cstring>

namespace zackathon {
namespace crypto {

Address::Address() {
    bytes_.fill(0);
}

Address::Address(const Bytes& bytes) : bytes_(bytes) {}

Address Address::fromPublicKey(const PublicKey& publicKey) {
    Hash256 hash = sha256(publicKey.data(), publicKey.size());
    Bytes out;
    std::memcpy(out.data(), hash.data() + (SHA256_SIZE - ADDRESS_SIZE), ADDRESS_SIZE);
    return Address(out);
}

std::optional<Address> Address::fromHex(const std::string& text) {
    if (text.size() != 2 + ADDRESS_SIZE * 2) return std::nullopt;
    if (text[0] != '0' || (text[1] != 'x' && text[1] != 'X')) return std::nullopt;

    Bytes out;
    if (!fromHexFixed(text, out)) return std::nullopt;
    return Address(out);
}

bool Address::isValid(const std::string& text) {
    return fromHex(text).has_value();
}

std::string Address::toHex() const {
    return std::string(ADDRESS_PREFIX) + crypto::toHex(bytes_);
}

bool Address::isZero() const {
    return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
}

}
}
