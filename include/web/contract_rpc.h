#pragma once

#include "core/contract.h"
#include "crypto/crypto.h"
#include "web/rpc_server.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace zackathon {
namespace web {

// Base of the JSON-RPC error codes that carry a contract ErrorCode:
// rpc code = CONTRACT_ERROR_BASE - ErrorCode.
constexpr int CONTRACT_ERROR_BASE = -33000;

// Maps the hackathon_* (and, with a development encryption service, fhe_*)
// JSON-RPC methods onto a HackathonContract.
//
// State-changing calls carry "from" (compressed public key hex), "nonce"
// (strictly increasing per key) and "signature" over requestDigest(). With
// signatures disabled the caller is taken from "caller" unchecked.
class ContractRpc {
public:
    ContractRpc(core::HackathonContract& contract, bool requireSignatures,
                std::shared_ptr<fhe::EncryptedValueService> devService = nullptr);

    void registerMethods(RpcServer& server, int rateLimit = 100);
    // Throws RpcError.
    std::string call(const std::string& method, const std::string& paramsJson);
    std::vector<std::string> methodNames() const;

    // SHA-256 of method, nonce and the params JSON with "signature" removed
    // and keys sorted.
    static crypto::Hash256 requestDigest(const std::string& method, uint64_t nonce,
                                         const std::string& paramsJson);
    // Returns paramsJson extended with from/nonce/signature.
    static std::string signParams(const std::string& method, const std::string& paramsJson,
                                  const crypto::KeyPair& key, uint64_t nonce);

    static int errorCodeFor(ErrorCode code) { return CONTRACT_ERROR_BASE - static_cast<int>(code); }

private:
    core::HackathonContract& contract_;
    bool requireSignatures_;
    std::shared_ptr<fhe::EncryptedValueService> devService_;
    std::map<std::string, uint64_t> lastNonce_;
    std::mutex nonceMtx_;
};

}
}
