#include "web/contract_rpc.h"
#include "utils/logger.h"
#include <nlohmann/json.hpp>
#include <limits>

namespace zackathon {
namespace web {

using json = nlohmann::json;
using crypto::Address;
using fhe::CiphertextHandle;

namespace {

struct MethodSpec {
    const char* name;
    bool authenticated;
    bool devOnly;
};

const MethodSpec METHODS[] = {
    {"hackathon_create", true, false},
    {"hackathon_register", true, false},
    {"hackathon_submitProject", true, false},
    {"hackathon_submitScore", true, false},
    {"hackathon_grantJudgeAccess", true, false},
    {"hackathon_calculateWinners", true, false},
    {"hackathon_submitDecryptedScores", true, false},
    {"hackathon_getEncryptedReference", true, false},
    {"hackathon_getScoreHandle", true, false},
    {"hackathon_getDetails", false, false},
    {"hackathon_getParticipant", false, false},
    {"hackathon_getParticipants", false, false},
    {"hackathon_getSubmissionCount", false, false},
    {"hackathon_getSubmission", false, false},
    {"hackathon_getWinners", false, false},
    {"hackathon_getDecryptedScore", false, false},
    {"hackathon_isJudge", false, false},
    {"hackathon_getTotal", false, false},
    {"hackathon_getAggregateHandle", false, false},
    {"hackathon_getEvents", false, false},
    {"fhe_encrypt", false, true},
    {"fhe_publicDecrypt", false, true},
    {"fhe_isPubliclyDecryptable", false, true},
};

const MethodSpec* findMethod(const std::string& name) {
    for (const auto& m : METHODS) {
        if (name == m.name) return &m;
    }
    return nullptr;
}

[[noreturn]] void badParam(const std::string& key) {
    throw RpcError(RpcErrorCode::INVALID_PARAMS, "Missing or invalid '" + key + "'");
}

uint64_t requireUint(const json& p, const std::string& key) {
    auto it = p.find(key);
    if (it == p.end()) badParam(key);
    if (it->is_number_unsigned()) return it->get<uint64_t>();
    if (it->is_number_integer() && it->get<int64_t>() >= 0) return static_cast<uint64_t>(it->get<int64_t>());
    badParam(key);
}

uint64_t optUint(const json& p, const std::string& key, uint64_t def) {
    return p.contains(key) ? requireUint(p, key) : def;
}

uint32_t optUint32(const json& p, const std::string& key, uint32_t def) {
    uint64_t v = optUint(p, key, def);
    if (v > std::numeric_limits<uint32_t>::max()) badParam(key);
    return static_cast<uint32_t>(v);
}

std::string requireString(const json& p, const std::string& key) {
    auto it = p.find(key);
    if (it == p.end() || !it->is_string()) badParam(key);
    return it->get<std::string>();
}

std::string optString(const json& p, const std::string& key) {
    return p.contains(key) ? requireString(p, key) : std::string();
}

Address toAddress(const json& v, const std::string& key) {
    if (!v.is_string()) badParam(key);
    auto a = Address::fromHex(v.get<std::string>());
    if (!a) badParam(key);
    return *a;
}

Address requireAddress(const json& p, const std::string& key) {
    auto it = p.find(key);
    if (it == p.end()) badParam(key);
    return toAddress(*it, key);
}

std::vector<Address> addressList(const json& p, const std::string& key) {
    std::vector<Address> out;
    auto it = p.find(key);
    if (it == p.end()) return out;
    if (!it->is_array()) badParam(key);
    for (const auto& v : *it) out.push_back(toAddress(v, key));
    return out;
}

CiphertextHandle toHandle(const json& v, const std::string& key) {
    if (!v.is_string()) badParam(key);
    auto h = CiphertextHandle::fromHex(v.get<std::string>());
    if (!h) badParam(key);
    return *h;
}

std::vector<uint8_t> requireBytes(const json& p, const std::string& key) {
    std::string text = requireString(p, key);
    std::vector<uint8_t> out = crypto::fromHex(text);
    std::string digits = text.compare(0, 2, "0x") == 0 ? text.substr(2) : text;
    if (out.empty() && !digits.empty()) badParam(key);
    return out;
}

fhe::ExternalInput requireInput(const json& p, fhe::ValueWidth defaultWidth) {
    fhe::ExternalInput input;
    input.handle = toHandle(p.contains("handle") ? p.at("handle") : json(), "handle");
    input.width = defaultWidth;
    std::string width = optString(p, "width");
    if (!width.empty()) {
        auto w = fhe::widthFromString(width);
        if (!w) badParam("width");
        input.width = *w;
    }
    input.proof = requireBytes(p, "proof");
    return input;
}

utils::Word256 requireWord(const json& p, const std::string& key) {
    auto it = p.find(key);
    if (it == p.end()) badParam(key);
    if (it->is_number_unsigned() || it->is_number_integer()) {
        return utils::wordFromUint64(requireUint(p, key));
    }
    std::vector<uint8_t> raw = requireBytes(p, key);
    if (raw.size() > 32) badParam(key);
    utils::Word256 word{};
    std::copy(raw.begin(), raw.end(), word.begin() + (32 - raw.size()));
    return word;
}

void check(const Result<void>& r) {
    if (!r.ok()) throw RpcError(ContractRpc::errorCodeFor(r.code()), r.error().message);
}

template<typename T>
T unwrap(Result<T> r) {
    if (!r.ok()) throw RpcError(ContractRpc::errorCodeFor(r.code()), r.error().message);
    return std::move(r.value());
}

json addressesToJson(const std::vector<Address>& list) {
    json out = json::array();
    for (const auto& a : list) out.push_back(a.toHex());
    return out;
}

json detailsToJson(const core::HackathonDetails& d) {
    return {
        {"id", d.id},
        {"name", d.name},
        {"description", d.description},
        {"prizeDetails", d.prizeDetails},
        {"submissionDeadline", d.submissionDeadline},
        {"judgingDeadline", d.judgingDeadline},
        {"maxParticipants", d.maxParticipants},
        {"organizer", d.organizer.toHex()},
        {"judges", addressesToJson(d.judges)},
        {"phase", core::phaseToString(d.phase)},
        {"participantCount", d.participantCount},
        {"submissionCount", d.submissionCount},
        {"judgeAccessGranted", d.judgeAccessGranted},
        {"winnersFinalized", d.winnersFinalized},
        {"createdAt", d.createdAt},
    };
}

json participantToJson(const core::Participant& p) {
    return {
        {"wallet", p.wallet.toHex()},
        {"email", p.info.email},
        {"discordHandle", p.info.discordHandle},
        {"twitterHandle", p.info.twitterHandle},
        {"teamName", p.info.teamName},
        {"teamMembers", addressesToJson(p.info.teamMembers)},
        {"registrationTime", p.registrationTime},
        {"hasSubmitted", p.hasSubmitted},
    };
}

json submissionToJson(const core::SubmissionInfo& s) {
    return {
        {"id", s.id},
        {"participant", s.participant.toHex()},
        {"submissionTime", s.submissionTime},
        {"status", core::statusToString(s.status)},
        {"judgeCount", s.judgeCount},
    };
}

json winnersToJson(const std::vector<core::Winner>& winners) {
    json out = json::array();
    for (const auto& w : winners) {
        out.push_back({{"participant", w.participant.toHex()},
                       {"ranking", w.ranking},
                       {"finalScore", w.finalScore},
                       {"submissionId", w.submissionId}});
    }
    return out;
}

json eventsToJson(const std::vector<core::ContractEvent>& events) {
    json out = json::array();
    for (const auto& e : events) {
        out.push_back({{"sequence", e.sequence},
                       {"type", core::eventTypeToString(e.type)},
                       {"hackathonId", e.hackathonId},
                       {"timestamp", e.timestamp},
                       {"fields", e.fields}});
    }
    return out;
}

std::string canonicalWithoutSignature(const std::string& paramsJson) {
    json p = json::parse(paramsJson, nullptr, false);
    if (p.is_discarded() || !p.is_object()) return paramsJson;
    p.erase("signature");
    return p.dump();
}

}

ContractRpc::ContractRpc(core::HackathonContract& contract, bool requireSignatures,
                         std::shared_ptr<fhe::EncryptedValueService> devService)
    : contract_(contract), requireSignatures_(requireSignatures), devService_(std::move(devService)) {}

std::vector<std::string> ContractRpc::methodNames() const {
    std::vector<std::string> out;
    for (const auto& m : METHODS) {
        if (m.devOnly && !devService_) continue;
        out.push_back(m.name);
    }
    return out;
}

void ContractRpc::registerMethods(RpcServer& server, int rateLimit) {
    for (const auto& name : methodNames()) {
        server.registerMethod(name, [this, name](const std::string& params) {
            return call(name, params);
        }, rateLimit);
    }
}

crypto::Hash256 ContractRpc::requestDigest(const std::string& method, uint64_t nonce,
                                           const std::string& paramsJson) {
    return crypto::Sha256()
        .update(method).update(std::string("\n"))
        .update(std::to_string(nonce)).update(std::string("\n"))
        .update(canonicalWithoutSignature(paramsJson))
        .finish();
}

std::string ContractRpc::signParams(const std::string& method, const std::string& paramsJson,
                                    const crypto::KeyPair& key, uint64_t nonce) {
    json p = json::parse(paramsJson.empty() ? "{}" : paramsJson);
    p["from"] = crypto::toHex(key.publicKey);
    p["nonce"] = nonce;
    p.erase("signature");
    crypto::Signature sig = crypto::sign(requestDigest(method, nonce, p.dump()), key.privateKey);
    p["signature"] = crypto::toHex(sig);
    return p.dump();
}

std::string ContractRpc::call(const std::string& method, const std::string& paramsJson) {
    const MethodSpec* entry = findMethod(method);
    if (!entry || (entry->devOnly && !devService_)) {
        throw RpcError(RpcErrorCode::METHOD_NOT_FOUND, "Method not found: " + method);
    }

    json p = json::parse(paramsJson.empty() ? "{}" : paramsJson, nullptr, false);
    if (p.is_discarded() || !p.is_object()) {
        throw RpcError(RpcErrorCode::INVALID_PARAMS, "Params must be a JSON object");
    }

    Address caller;
    if (entry->authenticated) {
        if (!requireSignatures_) {
            caller = requireAddress(p, "caller");
        } else {
            crypto::PublicKey pub;
            crypto::Signature sig;
            if (!crypto::fromHexFixed(requireString(p, "from"), pub)) badParam("from");
            if (!crypto::fromHexFixed(requireString(p, "signature"), sig)) badParam("signature");
            uint64_t nonce = requireUint(p, "nonce");
            if (!crypto::verify(requestDigest(method, nonce, p.dump()), sig, pub)) {
                throw RpcError(RpcErrorCode::UNAUTHORIZED, "Invalid signature");
            }
            std::string key = crypto::toHex(pub);
            {
                std::lock_guard<std::mutex> lock(nonceMtx_);
                auto it = lastNonce_.find(key);
                if (it != lastNonce_.end() && nonce <= it->second) {
                    throw RpcError(RpcErrorCode::UNAUTHORIZED, "Stale nonce");
                }
                lastNonce_[key] = nonce;
            }
            caller = Address::fromPublicKey(pub);
        }
    }

    json result;
    if (method == "hackathon_create") {
        core::HackathonConfig config;
        config.name = requireString(p, "name");
        config.description = optString(p, "description");
        config.prizeDetails = optString(p, "prizeDetails");
        config.submissionDeadline = requireUint(p, "submissionDeadline");
        config.judgingDeadline = requireUint(p, "judgingDeadline");
        config.maxParticipants = optUint32(p, "maxParticipants", 0);
        config.judges = addressList(p, "judges");
        result = {{"hackathonId", unwrap(contract_.createHackathon(caller, config))}};
    } else if (method == "hackathon_register") {
        core::RegistrationInfo info;
        info.email = requireString(p, "email");
        info.discordHandle = optString(p, "discordHandle");
        info.twitterHandle = optString(p, "twitterHandle");
        info.teamName = optString(p, "teamName");
        info.teamMembers = addressList(p, "teamMembers");
        check(contract_.registerForHackathon(caller, requireUint(p, "hackathonId"), info));
        result = true;
    } else if (method == "hackathon_submitProject") {
        fhe::ExternalInput input = requireInput(p, core::REFERENCE_WIDTH);
        result = {{"submissionId", unwrap(contract_.submitProject(caller, requireUint(p, "hackathonId"), input))}};
    } else if (method == "hackathon_submitScore") {
        fhe::ExternalInput input = requireInput(p, core::SCORE_WIDTH);
        check(contract_.submitScore(caller, requireUint(p, "hackathonId"), requireUint(p, "submissionId"), input));
        result = true;
    } else if (method == "hackathon_grantJudgeAccess") {
        check(contract_.grantJudgeAccess(caller, requireUint(p, "hackathonId")));
        result = true;
    } else if (method == "hackathon_calculateWinners") {
        check(contract_.calculateWinners(caller, requireUint(p, "hackathonId")));
        result = true;
    } else if (method == "hackathon_submitDecryptedScores") {
        auto it = p.find("scores");
        if (it == p.end() || !it->is_array()) badParam("scores");
        std::vector<uint64_t> scores;
        for (const auto& v : *it) {
            if (!v.is_number_unsigned()) badParam("scores");
            scores.push_back(v.get<uint64_t>());
        }
        check(contract_.submitDecryptedScores(caller, requireUint(p, "hackathonId"), scores,
                                              requireBytes(p, "proof")));
        result = true;
    } else if (method == "hackathon_getEncryptedReference") {
        result = unwrap(contract_.getEncryptedReference(caller, requireUint(p, "hackathonId"),
                                                        requireUint(p, "submissionId"))).toHex();
    } else if (method == "hackathon_getScoreHandle") {
        result = unwrap(contract_.getScoreHandle(caller, requireUint(p, "hackathonId"),
                                                 requireUint(p, "submissionId"),
                                                 requireAddress(p, "judge"))).toHex();
    } else if (method == "hackathon_getDetails") {
        result = detailsToJson(unwrap(contract_.getHackathonDetails(requireUint(p, "hackathonId"))));
    } else if (method == "hackathon_getParticipant") {
        result = participantToJson(unwrap(contract_.getParticipant(requireUint(p, "hackathonId"),
                                                                   requireAddress(p, "account"))));
    } else if (method == "hackathon_getParticipants") {
        result = addressesToJson(unwrap(contract_.getParticipantList(requireUint(p, "hackathonId"))));
    } else if (method == "hackathon_getSubmissionCount") {
        result = unwrap(contract_.getSubmissionCount(requireUint(p, "hackathonId")));
    } else if (method == "hackathon_getSubmission") {
        result = submissionToJson(unwrap(contract_.getSubmission(requireUint(p, "hackathonId"),
                                                                 requireUint(p, "submissionId"))));
    } else if (method == "hackathon_getWinners") {
        result = winnersToJson(unwrap(contract_.getWinners(requireUint(p, "hackathonId"))));
    } else if (method == "hackathon_getDecryptedScore") {
        core::DecryptedScore s = unwrap(contract_.getDecryptedScore(requireUint(p, "hackathonId"),
                                                                    requireUint(p, "submissionId")));
        result = {{"score", s.score}, {"isDecrypted", s.isDecrypted}};
    } else if (method == "hackathon_isJudge") {
        result = unwrap(contract_.isJudge(requireUint(p, "hackathonId"), requireAddress(p, "account")));
    } else if (method == "hackathon_getTotal") {
        result = contract_.getTotalHackathonCount();
    } else if (method == "hackathon_getAggregateHandle") {
        result = unwrap(contract_.getAggregateScoreHandle(requireUint(p, "hackathonId"),
                                                          requireUint(p, "submissionId"))).toHex();
    } else if (method == "hackathon_getEvents") {
        uint64_t limit = optUint(p, "limit", 100);
        result = eventsToJson(contract_.getEvents(optUint(p, "fromSequence", 1), static_cast<size_t>(limit)));
    } else if (method == "fhe_encrypt") {
        auto width = fhe::widthFromString(optString(p, "width").empty() ? "u16" : optString(p, "width"));
        if (!width) badParam("width");
        utils::Word256 value = requireWord(p, "value");
        if (!fhe::fitsWidth(value, *width)) badParam("value");
        fhe::ExternalInput input = devService_->encrypt(value, *width, contract_.address(),
                                                         requireAddress(p, "account"));
        result = {{"handle", input.handle.toHex()},
                  {"width", fhe::widthToString(input.width)},
                  {"proof", crypto::toHex(input.proof)}};
    } else if (method == "fhe_publicDecrypt") {
        auto it = p.find("handles");
        if (it == p.end() || !it->is_array()) badParam("handles");
        std::vector<CiphertextHandle> handles;
        for (const auto& v : *it) handles.push_back(toHandle(v, "handles"));
        auto decrypted = devService_->publicDecrypt(handles);
        if (!decrypted) {
            throw RpcError(errorCodeFor(ErrorCode::ENCRYPTION_SERVICE_ERROR), "Public decryption refused");
        }
        json values = json::array();
        for (const auto& h : handles) values.push_back(crypto::toHex(decrypted->clearValues.at(h)));
        result = {{"values", values},
                  {"encoded", crypto::toHex(decrypted->encodedValues)},
                  {"proof", crypto::toHex(decrypted->proof)}};
    } else if (method == "fhe_isPubliclyDecryptable") {
        result = devService_->isPubliclyDecryptable(toHandle(p.contains("handle") ? p.at("handle") : json(), "handle"));
    }

    LOG_DEBUG("rpc " + method + " ok");
    return result.dump();
}

}
}
