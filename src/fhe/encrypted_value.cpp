#include "fhe/encrypted_value.h"

namespace zackathon {
namespace fhe {

CiphertextHandle::CiphertextHandle() {
    bytes_.fill(0);
}

CiphertextHandle::CiphertextHandle(const Bytes& bytes) : bytes_(bytes) {}

std::optional<CiphertextHandle> CiphertextHandle::fromHex(const std::string& text) {
    Bytes out;
    if (!crypto::fromHexFixed(text, out)) return std::nullopt;
    return CiphertextHandle(out);
}

std::string CiphertextHandle::toHex() const {
    return "0x" + crypto::toHex(bytes_);
}

bool CiphertextHandle::isNull() const {
    for (uint8_t b : bytes_) {
        if (b != 0) return false;
    }
    return true;
}

uint32_t widthBits(ValueWidth width) {
    switch (width) {
        case ValueWidth::U8: return 8;
        case ValueWidth::U16: return 16;
        case ValueWidth::U32: return 32;
        case ValueWidth::U64: return 64;
        case ValueWidth::U256: return 256;
    }
    return 256;
}

const char* widthToString(ValueWidth width) {
    switch (width) {
        case ValueWidth::U8: return "u8";
        case ValueWidth::U16: return "u16";
        case ValueWidth::U32: return "u32";
        case ValueWidth::U64: return "u64";
        case ValueWidth::U256: return "u256";
    }
    return "u256";
}

std::optional<ValueWidth> widthFromString(const std::string& name) {
    if (name == "u8") return ValueWidth::U8;
    if (name == "u16") return ValueWidth::U16;
    if (name == "u32") return ValueWidth::U32;
    if (name == "u64") return ValueWidth::U64;
    if (name == "u256") return ValueWidth::U256;
    return std::nullopt;
}

bool fitsWidth(const Word256& value, ValueWidth width) {
    size_t valueBytes = widthBits(width) / 8;
    for (size_t i = 0; i < value.size() - valueBytes; i++) {
        if (value[i] != 0) return false;
    }
    return true;
}

ExternalInput EncryptedValueService::encryptUint(uint64_t value, ValueWidth width,
                                                 const Address& contract, const Address& caller) {
    return encrypt(utils::wordFromUint64(value), width, contract, caller);
}

}
}
