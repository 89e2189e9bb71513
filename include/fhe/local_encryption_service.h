#pragma once

#include "fhe/encrypted_value.h"
#include "crypto/crypto.h"
#include <memory>
#include <mutex>
#include <string>

namespace zackathon {
namespace fhe {

// In-process stand-in for the external encryption service. Values are held
// in the clear; handles, input proofs and decryption proofs are real digests
// and signatures by the service key, so the contract exercises the same
// checks it would against the remote service. Not a cryptographic scheme.
class LocalEncryptionService : public EncryptedValueService {
public:
    LocalEncryptionService();
    explicit LocalEncryptionService(const crypto::KeyPair& signer);
    ~LocalEncryptionService() override;

    // Persists ciphertext state under the "fhe:" prefix and reloads any
    // state already present, including the signing key.
    bool open(const std::string& dbPath);
    void close();

    // Inputs are reduced modulo 2^width.
    ExternalInput encrypt(const Word256& value, ValueWidth width,
                          const Address& contract, const Address& caller) override;
    std::optional<CiphertextHandle> verifyProofAndImport(const ExternalInput& input,
                                                         ValueWidth expectedWidth,
                                                         const Address& contract,
                                                         const Address& caller) override;

    bool grantAccess(const CiphertextHandle& handle, const Address& grantee) override;
    bool isAllowed(const CiphertextHandle& handle, const Address& account) const override;

    std::optional<CiphertextHandle> add(const CiphertextHandle& a, const CiphertextHandle& b,
                                        const Address& caller) override;
    std::optional<CiphertextHandle> widen(const CiphertextHandle& handle, ValueWidth target,
                                          const Address& caller) override;

    bool markPubliclyDecryptable(const CiphertextHandle& handle, const Address& caller) override;
    bool isPubliclyDecryptable(const CiphertextHandle& handle) const override;

    std::optional<PublicDecryptResult> publicDecrypt(const std::vector<CiphertextHandle>& handles) override;
    bool verifySignatures(const std::vector<CiphertextHandle>& handles,
                          const std::vector<uint8_t>& encodedValues,
                          const std::vector<uint8_t>& proof) const override;

    // Decryption for an account on the handle's access list.
    std::optional<Word256> userDecrypt(const CiphertextHandle& handle, const Address& account) const;
    std::optional<ValueWidth> widthOf(const CiphertextHandle& handle) const;

    crypto::PublicKey publicKey() const;
    size_t size() const;

    static crypto::Hash256 inputDigest(const CiphertextHandle& handle, ValueWidth width,
                                       const Address& contract, const Address& caller);
    static crypto::Hash256 decryptionDigest(const std::vector<CiphertextHandle>& handles,
                                            const std::vector<uint8_t>& encodedValues);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
