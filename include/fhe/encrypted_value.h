#pragma once

#include "crypto/address.h"
#include "utils/serialize.h"
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace zackathon {
namespace fhe {

using crypto::Address;
using utils::Word256;

constexpr size_t HANDLE_SIZE = 32;

// Opaque reference to an encrypted value. The contract stores and forwards
// handles but never interprets their bytes.
class CiphertextHandle {
public:
    using Bytes = std::array<uint8_t, HANDLE_SIZE>;

    CiphertextHandle();
    explicit CiphertextHandle(const Bytes& bytes);

    static std::optional<CiphertextHandle> fromHex(const std::string& text);
    std::string toHex() const;
    bool isNull() const;
    const Bytes& bytes() const { return bytes_; }

    bool operator==(const CiphertextHandle& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const CiphertextHandle& other) const { return bytes_ != other.bytes_; }
    bool operator<(const CiphertextHandle& other) const { return bytes_ < other.bytes_; }

private:
    Bytes bytes_;
};

enum class ValueWidth : uint8_t {
    U8 = 0,
    U16 = 1,
    U32 = 2,
    U64 = 3,
    U256 = 4
};

uint32_t widthBits(ValueWidth width);
const char* widthToString(ValueWidth width);
std::optional<ValueWidth> widthFromString(const std::string& name);
// False when the value needs more bits than the width carries.
bool fitsWidth(const Word256& value, ValueWidth width);

// Ciphertext produced off-chain plus the proof that binds it to a
// (contract, caller, width) triple.
struct ExternalInput {
    CiphertextHandle handle;
    ValueWidth width = ValueWidth::U256;
    std::vector<uint8_t> proof;
};

struct PublicDecryptResult {
    std::map<CiphertextHandle, Word256> clearValues;
    // One 32-byte big-endian word per handle, in request order.
    std::vector<uint8_t> encodedValues;
    std::vector<uint8_t> proof;
};

// Call contract of the external encryption service. Every operation that can
// be refused reports it through its return value; implementations never throw
// for a rejected request.
class EncryptedValueService {
public:
    virtual ~EncryptedValueService() = default;

    virtual ExternalInput encrypt(const Word256& value, ValueWidth width,
                                  const Address& contract, const Address& caller) = 0;
    ExternalInput encryptUint(uint64_t value, ValueWidth width,
                              const Address& contract, const Address& caller);

    // Checks the proof against (contract, caller, expectedWidth) and returns
    // the handle usable inside the contract. The contract gains access to it.
    virtual std::optional<CiphertextHandle> verifyProofAndImport(const ExternalInput& input,
                                                                 ValueWidth expectedWidth,
                                                                 const Address& contract,
                                                                 const Address& caller) = 0;

    virtual bool grantAccess(const CiphertextHandle& handle, const Address& grantee) = 0;
    virtual bool isAllowed(const CiphertextHandle& handle, const Address& account) const = 0;

    // Homomorphic operations; the caller must hold access to every operand
    // and receives access to the result.
    virtual std::optional<CiphertextHandle> add(const CiphertextHandle& a, const CiphertextHandle& b,
                                                const Address& caller) = 0;
    virtual std::optional<CiphertextHandle> widen(const CiphertextHandle& handle, ValueWidth target,
                                                  const Address& caller) = 0;

    virtual bool markPubliclyDecryptable(const CiphertextHandle& handle, const Address& caller) = 0;
    virtual bool isPubliclyDecryptable(const CiphertextHandle& handle) const = 0;

    virtual std::optional<PublicDecryptResult> publicDecrypt(const std::vector<CiphertextHandle>& handles) = 0;
    virtual bool verifySignatures(const std::vector<CiphertextHandle>& handles,
                                  const std::vector<uint8_t>& encodedValues,
                                  const std::vector<uint8_t>& proof) const = 0;
};

}
}
