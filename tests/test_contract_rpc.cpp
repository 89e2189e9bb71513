#include "contract_fixture.h"
#include "web/contract_rpc.h"
#include "web/rpc_server.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <map>

using namespace zackathon;
using namespace zackathon::web;
using json = nlohmann::json;

class ContractRpcTest : public ContractTestBase {
protected:
    void SetUp() override {
        ContractTestBase::SetUp();
        rpc = std::make_unique<ContractRpc>(*contract, true, service);
    }

    static crypto::KeyPair key(const std::string& label) {
        return crypto::keyPairFromSeed(crypto::sha256(label));
    }

    json signedCall(const std::string& method, const json& params, const std::string& who) {
        std::string body = ContractRpc::signParams(method, params.dump(), key(who), ++nonces[who]);
        return json::parse(rpc->call(method, body));
    }

    // Runs fn and returns the RpcError code it threw, or 0.
    template<typename Fn>
    static int errorCode(Fn fn, std::string* message = nullptr) {
        try {
            fn();
        } catch (const RpcError& e) {
            if (message) *message = e.what();
            return e.code();
        }
        return 0;
    }

    json createParams() const {
        return {{"name", "FHE Build Weekend"},
                {"description", "Private judging"},
                {"submissionDeadline", SUBMISSION_DEADLINE},
                {"judgingDeadline", JUDGING_DEADLINE},
                {"judges", json::array({judgeA.toHex()})}};
    }

    std::unique_ptr<ContractRpc> rpc;
    std::map<std::string, uint64_t> nonces;
};

TEST_F(ContractRpcTest, SignedCreateUsesSignerAsOrganizer) {
    json created = signedCall("hackathon_create", createParams(), "organizer");
    EXPECT_EQ(created["hackathonId"], 1u);

    json details = json::parse(rpc->call("hackathon_getDetails", R"({"hackathonId":1})"));
    EXPECT_EQ(details["organizer"], organizer.toHex());
    EXPECT_EQ(details["phase"], core::phaseToString(core::Phase::REGISTRATION_OPEN));
    EXPECT_EQ(details["judges"].size(), 1u);
    EXPECT_EQ(json::parse(rpc->call("hackathon_getTotal", "{}")), 1u);
}

TEST_F(ContractRpcTest, RegisterAndSubmitThroughDevService) {
    signedCall("hackathon_create", createParams(), "organizer");
    signedCall("hackathon_register", {{"hackathonId", 1}, {"email", "alice@example.org"},
                                      {"teamName", "alice"}}, "alice");

    json participants = json::parse(rpc->call("hackathon_getParticipants", R"({"hackathonId":1})"));
    ASSERT_EQ(participants.size(), 1u);
    EXPECT_EQ(participants[0], alice.toHex());

    json participant = json::parse(rpc->call("hackathon_getParticipant",
                                             json({{"hackathonId", 1}, {"account", alice.toHex()}}).dump()));
    EXPECT_EQ(participant["email"], "alice@example.org");
    EXPECT_FALSE(participant["hasSubmitted"].get<bool>());

    json encrypted = json::parse(rpc->call("fhe_encrypt", json({{"value", crypto::sha256Hex("QmAlice")},
                                                                {"width", "u256"},
                                                                {"account", alice.toHex()}}).dump()));
    json submitted = signedCall("hackathon_submitProject", {{"hackathonId", 1},
                                                            {"handle", encrypted["handle"]},
                                                            {"width", "u256"},
                                                            {"proof", encrypted["proof"]}}, "alice");
    EXPECT_EQ(submitted["submissionId"], 0u);
    EXPECT_EQ(json::parse(rpc->call("hackathon_getSubmissionCount", R"({"hackathonId":1})")), 1u);

    json read = {{"hackathonId", 1}, {"submissionId", 0}};
    EXPECT_EQ(errorCode([&] { signedCall("hackathon_getEncryptedReference", read, "alice"); }),
              ContractRpc::errorCodeFor(ErrorCode::NOT_JUDGE));

    now = SUBMISSION_DEADLINE;
    signedCall("hackathon_grantJudgeAccess", {{"hackathonId", 1}}, "organizer");
    EXPECT_EQ(signedCall("hackathon_getEncryptedReference", read, "judge-a"), encrypted["handle"]);
}

TEST_F(ContractRpcTest, ReplayedNonceIsRejected) {
    std::string body = ContractRpc::signParams("hackathon_create", createParams().dump(), key("organizer"), 7);
    rpc->call("hackathon_create", body);

    std::string message;
    EXPECT_EQ(errorCode([&] { rpc->call("hackathon_create", body); }, &message),
              static_cast<int>(RpcErrorCode::UNAUTHORIZED));
    EXPECT_EQ(message, "Stale nonce");

    std::string older = ContractRpc::signParams("hackathon_create", createParams().dump(), key("organizer"), 3);
    EXPECT_EQ(errorCode([&] { rpc->call("hackathon_create", older); }),
              static_cast<int>(RpcErrorCode::UNAUTHORIZED));
    EXPECT_EQ(contract->getTotalHackathonCount(), 1u);
}

TEST_F(ContractRpcTest, TamperedParamsFailSignature) {
    json body = json::parse(ContractRpc::signParams("hackathon_create", createParams().dump(),
                                                    key("organizer"), 1));
    body["name"] = "Someone else's hackathon";

    std::string message;
    EXPECT_EQ(errorCode([&] { rpc->call("hackathon_create", body.dump()); }, &message),
              static_cast<int>(RpcErrorCode::UNAUTHORIZED));
    EXPECT_EQ(message, "Invalid signature");

    json unsignedBody = createParams();
    EXPECT_EQ(errorCode([&] { rpc->call("hackathon_create", unsignedBody.dump()); }),
              static_cast<int>(RpcErrorCode::INVALID_PARAMS));
}

TEST_F(ContractRpcTest, ContractErrorsMapToOffsetCodes) {
    EXPECT_EQ(ContractRpc::errorCodeFor(ErrorCode::NOT_FOUND),
              CONTRACT_ERROR_BASE - static_cast<int>(ErrorCode::NOT_FOUND));

    signedCall("hackathon_create", createParams(), "organizer");
    int code = errorCode([&] {
        signedCall("hackathon_register", {{"hackathonId", 1}, {"email", "judge@example.org"}}, "judge-a");
    });
    EXPECT_EQ(code, ContractRpc::errorCodeFor(ErrorCode::JUDGE_CANNOT_PARTICIPATE));

    EXPECT_EQ(errorCode([&] { rpc->call("hackathon_getDetails", R"({"hackathonId":9})"); }),
              ContractRpc::errorCodeFor(ErrorCode::NOT_FOUND));
    EXPECT_EQ(errorCode([&] { signedCall("hackathon_grantJudgeAccess", {{"hackathonId", 1}}, "alice"); }),
              ContractRpc::errorCodeFor(ErrorCode::NOT_ORGANIZER));
}

TEST_F(ContractRpcTest, MalformedParamsAreInvalidParams) {
    int invalid = static_cast<int>(RpcErrorCode::INVALID_PARAMS);
    EXPECT_EQ(errorCode([&] { rpc->call("hackathon_getDetails", "{}"); }), invalid);
    EXPECT_EQ(errorCode([&] { rpc->call("hackathon_getDetails", R"({"hackathonId":-1})"); }), invalid);
    EXPECT_EQ(errorCode([&] { rpc->call("hackathon_getDetails", "[1]"); }), invalid);
    EXPECT_EQ(errorCode([&] {
        rpc->call("hackathon_isJudge", R"({"hackathonId":1,"account":"0x1234"})");
    }), invalid);
    EXPECT_EQ(errorCode([&] {
        rpc->call("fhe_encrypt", json({{"value", 70000}, {"width", "u16"}, {"account", alice.toHex()}}).dump());
    }), invalid);

    // A capacity past 32 bits must not wrap to a small limit.
    json oversized = createParams();
    oversized["maxParticipants"] = 4294967297ULL;
    EXPECT_EQ(errorCode([&] { signedCall("hackathon_create", oversized, "organizer"); }), invalid);
    EXPECT_EQ(contract->getTotalHackathonCount(), 0u);

    json widest = createParams();
    widest["maxParticipants"] = 4294967295ULL;
    EXPECT_EQ(signedCall("hackathon_create", widest, "organizer")["hackathonId"], 1u);
    EXPECT_EQ(contract->getHackathonDetails(1).value().maxParticipants, 4294967295u);
}

TEST_F(ContractRpcTest, UnsignedModeTakesCallerParam) {
    ContractRpc open(*contract, false);
    json params = createParams();
    params["caller"] = organizer.toHex();
    EXPECT_EQ(json::parse(open.call("hackathon_create", params.dump()))["hackathonId"], 1u);

    json details = json::parse(open.call("hackathon_getDetails", R"({"hackathonId":1})"));
    EXPECT_EQ(details["organizer"], organizer.toHex());
}

TEST_F(ContractRpcTest, DevMethodsNeedDevService) {
    ContractRpc production(*contract, true);
    auto names = production.methodNames();
    EXPECT_EQ(std::count(names.begin(), names.end(), "fhe_encrypt"), 0);
    EXPECT_EQ(std::count(names.begin(), names.end(), "hackathon_getWinners"), 1);
    EXPECT_EQ(errorCode([&] { production.call("fhe_encrypt", "{}"); }),
              static_cast<int>(RpcErrorCode::METHOD_NOT_FOUND));
}

TEST_F(ContractRpcTest, PublicDecryptRefusesUnmarkedHandles) {
    json encrypted = json::parse(rpc->call("fhe_encrypt", json({{"value", 5}, {"width", "u16"},
                                                                {"account", alice.toHex()}}).dump()));
    json params = {{"handles", json::array({encrypted["handle"]})}};
    EXPECT_EQ(errorCode([&] { rpc->call("fhe_publicDecrypt", params.dump()); }),
              ContractRpc::errorCodeFor(ErrorCode::ENCRYPTION_SERVICE_ERROR));
    EXPECT_FALSE(json::parse(rpc->call("fhe_isPubliclyDecryptable",
                                       json({{"handle", encrypted["handle"]}}).dump())).get<bool>());
}

TEST_F(ContractRpcTest, EventsAreExposedInOrder) {
    signedCall("hackathon_create", createParams(), "organizer");
    signedCall("hackathon_register", {{"hackathonId", 1}, {"email", "bob@example.org"}}, "bob");

    json events = json::parse(rpc->call("hackathon_getEvents", R"({"fromSequence":1})"));
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0]["sequence"], 1u);
    EXPECT_EQ(events[0]["type"], core::eventTypeToString(core::ContractEventType::HackathonCreated));
    EXPECT_EQ(events[1]["type"], core::eventTypeToString(core::ContractEventType::ParticipantRegistered));

    json tail = json::parse(rpc->call("hackathon_getEvents", R"({"fromSequence":2,"limit":5})"));
    ASSERT_EQ(tail.size(), 1u);
    EXPECT_EQ(tail[0]["sequence"], 2u);
}

class RpcServerDispatchTest : public ContractRpcTest {
protected:
    void SetUp() override {
        ContractRpcTest::SetUp();
        rpc->registerMethods(server, 3);
    }

    RpcServer server;
};

TEST_F(RpcServerDispatchTest, RegistersEveryMethod) {
    EXPECT_EQ(server.getMethodCount(), rpc->methodNames().size());
    EXPECT_TRUE(server.hasMethod("hackathon_calculateWinners"));
    EXPECT_TRUE(server.hasMethod("fhe_publicDecrypt"));
}

TEST_F(RpcServerDispatchTest, WrapsResultsAndErrors) {
    json ok = json::parse(server.dispatch(R"({"jsonrpc":"2.0","id":4,"method":"hackathon_getTotal"})"));
    EXPECT_EQ(ok["id"], 4);
    EXPECT_EQ(ok["result"], 0);
    EXPECT_FALSE(ok.contains("error"));

    json missing = json::parse(server.dispatch(
        R"({"jsonrpc":"2.0","id":5,"method":"hackathon_getDetails","params":{"hackathonId":3}})"));
    EXPECT_EQ(missing["error"]["code"], ContractRpc::errorCodeFor(ErrorCode::NOT_FOUND));

    json unknown = json::parse(server.dispatch(R"({"jsonrpc":"2.0","id":6,"method":"eth_call"})"));
    EXPECT_EQ(unknown["error"]["code"], static_cast<int>(RpcErrorCode::METHOD_NOT_FOUND));

    json garbage = json::parse(server.dispatch("{not json"));
    EXPECT_EQ(garbage["error"]["code"], static_cast<int>(RpcErrorCode::PARSE_ERROR));
}

TEST_F(RpcServerDispatchTest, RateLimitIsPerClientAndMethod) {
    const std::string body = R"({"jsonrpc":"2.0","id":1,"method":"hackathon_getTotal"})";
    for (int i = 0; i < 3; i++) {
        EXPECT_FALSE(json::parse(server.dispatch(body, "10.0.0.1")).contains("error"));
    }
    json limited = json::parse(server.dispatch(body, "10.0.0.1"));
    EXPECT_EQ(limited["error"]["code"], static_cast<int>(RpcErrorCode::RATE_LIMITED));

    EXPECT_FALSE(json::parse(server.dispatch(body, "10.0.0.2")).contains("error"));
    EXPECT_EQ(server.getTotalRequests(), 5u);
}

TEST_F(RpcServerDispatchTest, ExpiredRateWindowsAreDropped) {
    const std::string body = R"({"jsonrpc":"2.0","id":1,"method":"hackathon_getTotal"})";
    for (int i = 0; i < 20; i++) {
        server.dispatch(body, "10.1.0." + std::to_string(i));
    }
    EXPECT_EQ(server.getRateLimitEntryCount(), 20u);

    // With a zero-length window every earlier entry has expired by the next request.
    server.setRateLimitWindow(0);
    for (int i = 0; i < 20; i++) {
        EXPECT_FALSE(json::parse(server.dispatch(body, "10.2.0." + std::to_string(i))).contains("error"));
    }
    EXPECT_EQ(server.getRateLimitEntryCount(), 1u);
}
