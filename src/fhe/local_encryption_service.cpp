#include "fhe/local_encryption_service.h"
#include "database/database.h"
#include "utils/logger.h"
#include "utils/serialize.h"
#include <cstring>
#include <set>
#include <stdexcept>

namespace zackathon {
namespace fhe {

namespace {

const std::string KEY_SIGNER = "fhe:meta:signer";
const std::string KEY_COUNTER = "fhe:meta:counter";
const std::string HANDLE_PREFIX = "fhe:handle:";

struct Entry {
    Word256 value{};
    ValueWidth width = ValueWidth::U256;
    std::set<Address> acl;
    bool publiclyDecryptable = false;
};

void reduceToWidth(Word256& value, ValueWidth width) {
    size_t keep = widthBits(width) / 8;
    for (size_t i = 0; i < value.size() - keep; i++) value[i] = 0;
}

Word256 addWords(const Word256& a, const Word256& b) {
    Word256 out{};
    uint32_t carry = 0;
    for (size_t i = out.size(); i-- > 0; ) {
        uint32_t sum = static_cast<uint32_t>(a[i]) + b[i] + carry;
        out[i] = static_cast<uint8_t>(sum & 0xff);
        carry = sum >> 8;
    }
    return out;
}

std::vector<uint8_t> serializeEntry(const Entry& e) {
    utils::ByteBuffer buf;
    buf.writeArray(e.value);
    buf.writeUint8(static_cast<uint8_t>(e.width));
    buf.writeBool(e.publiclyDecryptable);
    buf.writeVarInt(e.acl.size());
    for (const auto& a : e.acl) buf.writeArray(a.bytes());
    return buf.data();
}

Entry deserializeEntry(const std::vector<uint8_t>& data) {
    utils::ByteBuffer buf(data);
    Entry e;
    e.value = buf.readArray<32>();
    uint8_t w = buf.readUint8();
    if (w > static_cast<uint8_t>(ValueWidth::U256)) throw std::runtime_error("Invalid width");
    e.width = static_cast<ValueWidth>(w);
    e.publiclyDecryptable = buf.readBool();
    uint64_t n = buf.readVarInt();
    for (uint64_t i = 0; i < n; i++) {
        e.acl.insert(Address(buf.readArray<crypto::ADDRESS_SIZE>()));
    }
    return e;
}

}

struct LocalEncryptionService::Impl {
    crypto::KeyPair signer;
    std::map<CiphertextHandle, Entry> entries;
    uint64_t counter = 0;
    std::unique_ptr<database::Database> db;
    mutable std::mutex mtx;

    CiphertextHandle nextHandle(const std::string& tag, ValueWidth width,
                                const std::vector<uint8_t>& context) {
        utils::ByteBuffer buf;
        buf.writeUint64(++counter);
        buf.writeString(tag);
        buf.writeUint8(static_cast<uint8_t>(width));
        buf.writeFixedBytes(context.data(), context.size());
        crypto::Hash256 h = crypto::sha256(buf.data());
        return CiphertextHandle(h);
    }

    bool persist(const CiphertextHandle& handle, const Entry& entry) {
        if (!db) return true;
        database::WriteBatch batch;
        batch.put(HANDLE_PREFIX + crypto::toHex(handle.bytes()), serializeEntry(entry));
        utils::ByteBuffer cnt;
        cnt.writeUint64(counter);
        batch.put(KEY_COUNTER, cnt.data());
        if (!db->write(batch)) {
            LOG_ERROR("Encryption service persistence failed: " + db->lastError());
            return false;
        }
        return true;
    }

    // Stores a new or updated entry; memory changes only after the write succeeds.
    bool store(const CiphertextHandle& handle, const Entry& entry) {
        if (!persist(handle, entry)) return false;
        entries[handle] = entry;
        return true;
    }

    const Entry* find(const CiphertextHandle& handle) const {
        auto it = entries.find(handle);
        return it != entries.end() ? &it->second : nullptr;
    }
};

LocalEncryptionService::LocalEncryptionService() : impl_(std::make_unique<Impl>()) {
    impl_->signer = crypto::generateKeyPair();
}

LocalEncryptionService::LocalEncryptionService(const crypto::KeyPair& signer)
    : impl_(std::make_unique<Impl>()) {
    impl_->signer = signer;
}

LocalEncryptionService::~LocalEncryptionService() {
    close();
}

bool LocalEncryptionService::open(const std::string& dbPath) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto db = std::make_unique<database::Database>();
    if (!db->open(dbPath)) {
        LOG_ERROR("Failed to open encryption service store: " + dbPath);
        return false;
    }

    auto signerBytes = db->get(KEY_SIGNER);
    if (signerBytes.size() == crypto::PRIVATE_KEY_SIZE) {
        crypto::PrivateKey priv;
        std::memcpy(priv.data(), signerBytes.data(), priv.size());
        impl_->signer.privateKey = priv;
        impl_->signer.publicKey = crypto::derivePublicKey(priv);
    } else {
        std::vector<uint8_t> raw(impl_->signer.privateKey.begin(), impl_->signer.privateKey.end());
        if (!db->put(KEY_SIGNER, raw)) {
            LOG_ERROR("Failed to store encryption service key: " + db->lastError());
            return false;
        }
    }

    std::map<CiphertextHandle, Entry> loaded;
    uint64_t counter = 0;
    try {
        auto cnt = db->get(KEY_COUNTER);
        if (!cnt.empty()) {
            utils::ByteBuffer buf(cnt);
            counter = buf.readUint64();
        }
        bool ok = true;
        db->forEach(HANDLE_PREFIX, [&](const std::string& key, const std::vector<uint8_t>& value) {
            auto handle = CiphertextHandle::fromHex(key.substr(HANDLE_PREFIX.size()));
            if (!handle) {
                ok = false;
                return false;
            }
            loaded[*handle] = deserializeEntry(value);
            return true;
        });
        if (!ok) {
            LOG_ERROR("Malformed handle key in encryption service store");
            return false;
        }
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Corrupt encryption service store: ") + e.what());
        return false;
    }

    for (auto& [handle, entry] : loaded) impl_->entries[handle] = std::move(entry);
    if (counter > impl_->counter) impl_->counter = counter;
    impl_->db = std::move(db);
    LOG_INFO("Encryption service loaded " + std::to_string(impl_->entries.size()) + " ciphertexts");
    return true;
}

void LocalEncryptionService::close() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->db) {
        impl_->db->close();
        impl_->db.reset();
    }
}

crypto::Hash256 LocalEncryptionService::inputDigest(const CiphertextHandle& handle, ValueWidth width,
                                                    const Address& contract, const Address& caller) {
    utils::ByteBuffer buf;
    buf.writeString("input");
    buf.writeArray(handle.bytes());
    buf.writeUint8(static_cast<uint8_t>(width));
    buf.writeArray(contract.bytes());
    buf.writeArray(caller.bytes());
    return crypto::sha256(buf.data());
}

crypto::Hash256 LocalEncryptionService::decryptionDigest(const std::vector<CiphertextHandle>& handles,
                                                         const std::vector<uint8_t>& encodedValues) {
    utils::ByteBuffer buf;
    buf.writeString("decrypt");
    buf.writeVarInt(handles.size());
    for (const auto& h : handles) buf.writeArray(h.bytes());
    buf.writeBytes(encodedValues);
    return crypto::sha256(buf.data());
}

ExternalInput LocalEncryptionService::encrypt(const Word256& value, ValueWidth width,
                                              const Address& contract, const Address& caller) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<uint8_t> context(contract.bytes().begin(), contract.bytes().end());
    context.insert(context.end(), caller.bytes().begin(), caller.bytes().end());

    Entry entry;
    entry.value = value;
    entry.width = width;
    reduceToWidth(entry.value, width);

    ExternalInput input;
    input.handle = impl_->nextHandle("encrypt", width, context);
    input.width = width;
    if (!impl_->store(input.handle, entry)) {
        // An unknown handle never passes import, so the caller sees InvalidProof.
        input.proof.clear();
        return input;
    }

    crypto::Signature sig = crypto::sign(inputDigest(input.handle, width, contract, caller),
                                         impl_->signer.privateKey);
    input.proof.assign(sig.begin(), sig.end());
    LOG_DEBUG("Encrypted " + std::string(widthToString(width)) + " input " + input.handle.toHex());
    return input;
}

std::optional<CiphertextHandle> LocalEncryptionService::verifyProofAndImport(const ExternalInput& input,
                                                                             ValueWidth expectedWidth,
                                                                             const Address& contract,
                                                                             const Address& caller) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (input.width != expectedWidth) return std::nullopt;
    if (input.proof.size() != crypto::SIGNATURE_SIZE) return std::nullopt;

    const Entry* existing = impl_->find(input.handle);
    if (!existing || existing->width != expectedWidth) return std::nullopt;

    crypto::Signature sig;
    std::memcpy(sig.data(), input.proof.data(), sig.size());
    if (!crypto::verify(inputDigest(input.handle, input.width, contract, caller), sig,
                        impl_->signer.publicKey)) {
        return std::nullopt;
    }

    Entry updated = *existing;
    if (updated.acl.insert(contract).second) {
        if (!impl_->store(input.handle, updated)) return std::nullopt;
    }
    return input.handle;
}

bool LocalEncryptionService::grantAccess(const CiphertextHandle& handle, const Address& grantee) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const Entry* existing = impl_->find(handle);
    if (!existing) return false;
    if (existing->acl.count(grantee)) return true;
    Entry updated = *existing;
    updated.acl.insert(grantee);
    return impl_->store(handle, updated);
}

bool LocalEncryptionService::isAllowed(const CiphertextHandle& handle, const Address& account) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const Entry* existing = impl_->find(handle);
    return existing && existing->acl.count(account) > 0;
}

std::optional<CiphertextHandle> LocalEncryptionService::add(const CiphertextHandle& a, const CiphertextHandle& b,
                                                            const Address& caller) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const Entry* lhs = impl_->find(a);
    const Entry* rhs = impl_->find(b);
    if (!lhs || !rhs) return std::nullopt;
    if (lhs->width != rhs->width) return std::nullopt;
    if (!lhs->acl.count(caller) || !rhs->acl.count(caller)) return std::nullopt;

    Entry sum;
    sum.width = lhs->width;
    sum.value = addWords(lhs->value, rhs->value);
    reduceToWidth(sum.value, sum.width);
    sum.acl.insert(caller);

    std::vector<uint8_t> context(a.bytes().begin(), a.bytes().end());
    context.insert(context.end(), b.bytes().begin(), b.bytes().end());
    CiphertextHandle result = impl_->nextHandle("add", sum.width, context);
    if (!impl_->store(result, sum)) return std::nullopt;
    return result;
}

std::optional<CiphertextHandle> LocalEncryptionService::widen(const CiphertextHandle& handle, ValueWidth target,
                                                              const Address& caller) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const Entry* src = impl_->find(handle);
    if (!src || !src->acl.count(caller)) return std::nullopt;
    if (widthBits(target) < widthBits(src->width)) return std::nullopt;

    Entry wide;
    wide.width = target;
    wide.value = src->value;
    wide.acl.insert(caller);

    std::vector<uint8_t> context(handle.bytes().begin(), handle.bytes().end());
    CiphertextHandle result = impl_->nextHandle("widen", target, context);
    if (!impl_->store(result, wide)) return std::nullopt;
    return result;
}

bool LocalEncryptionService::markPubliclyDecryptable(const CiphertextHandle& handle, const Address& caller) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const Entry* existing = impl_->find(handle);
    if (!existing || !existing->acl.count(caller)) return false;
    if (existing->publiclyDecryptable) return true;
    Entry updated = *existing;
    updated.publiclyDecryptable = true;
    return impl_->store(handle, updated);
}

bool LocalEncryptionService::isPubliclyDecryptable(const CiphertextHandle& handle) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const Entry* existing = impl_->find(handle);
    return existing && existing->publiclyDecryptable;
}

std::optional<PublicDecryptResult> LocalEncryptionService::publicDecrypt(const std::vector<CiphertextHandle>& handles) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (handles.empty()) return std::nullopt;

    PublicDecryptResult result;
    std::vector<Word256> words;
    words.reserve(handles.size());
    for (const auto& h : handles) {
        const Entry* e = impl_->find(h);
        if (!e || !e->publiclyDecryptable) return std::nullopt;
        result.clearValues[h] = e->value;
        words.push_back(e->value);
    }
    result.encodedValues = utils::abiEncodeWords(words);

    crypto::Signature sig = crypto::sign(decryptionDigest(handles, result.encodedValues),
                                         impl_->signer.privateKey);
    result.proof.assign(sig.begin(), sig.end());
    return result;
}

bool LocalEncryptionService::verifySignatures(const std::vector<CiphertextHandle>& handles,
                                              const std::vector<uint8_t>& encodedValues,
                                              const std::vector<uint8_t>& proof) const {
    if (proof.size() != crypto::SIGNATURE_SIZE) return false;
    if (encodedValues.size() != handles.size() * 32) return false;

    crypto::PublicKey pub;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        pub = impl_->signer.publicKey;
    }
    crypto::Signature sig;
    std::memcpy(sig.data(), proof.data(), sig.size());
    return crypto::verify(decryptionDigest(handles, encodedValues), sig, pub);
}

std::optional<Word256> LocalEncryptionService::userDecrypt(const CiphertextHandle& handle,
                                                           const Address& account) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const Entry* e = impl_->find(handle);
    if (!e || !e->acl.count(account)) return std::nullopt;
    return e->value;
}

std::optional<ValueWidth> LocalEncryptionService::widthOf(const CiphertextHandle& handle) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const Entry* e = impl_->find(handle);
    if (!e) return std::nullopt;
    return e->width;
}

crypto::PublicKey LocalEncryptionService::publicKey() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->signer.publicKey;
}

size_t LocalEncryptionService::size() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->entries.size();
}

}
}
