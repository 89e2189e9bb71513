#include "contract_fixture.h"
#include "client/decryption_workflow.h"

using namespace zackathon;
using namespace zackathon::core;

namespace {

// Forwards to the local service, but reports aggregates as not yet
// decryptable for the first few polls and can drop the decryption proof.
class SlowGateway : public fhe::EncryptedValueService {
public:
    explicit SlowGateway(fhe::LocalEncryptionService& inner) : inner_(inner) {}

    fhe::ExternalInput encrypt(const fhe::Word256& value, fhe::ValueWidth width,
                               const crypto::Address& contract, const crypto::Address& caller) override {
        return inner_.encrypt(value, width, contract, caller);
    }
    std::optional<fhe::CiphertextHandle> verifyProofAndImport(const fhe::ExternalInput& input,
                                                              fhe::ValueWidth expectedWidth,
                                                              const crypto::Address& contract,
                                                              const crypto::Address& caller) override {
        return inner_.verifyProofAndImport(input, expectedWidth, contract, caller);
    }
    bool grantAccess(const fhe::CiphertextHandle& handle, const crypto::Address& grantee) override {
        return inner_.grantAccess(handle, grantee);
    }
    bool isAllowed(const fhe::CiphertextHandle& handle, const crypto::Address& account) const override {
        return inner_.isAllowed(handle, account);
    }
    std::optional<fhe::CiphertextHandle> add(const fhe::CiphertextHandle& a, const fhe::CiphertextHandle& b,
                                             const crypto::Address& caller) override {
        return inner_.add(a, b, caller);
    }
    std::optional<fhe::CiphertextHandle> widen(const fhe::CiphertextHandle& handle, fhe::ValueWidth target,
                                               const crypto::Address& caller) override {
        return inner_.widen(handle, target, caller);
    }
    bool markPubliclyDecryptable(const fhe::CiphertextHandle& handle, const crypto::Address& caller) override {
        return inner_.markPubliclyDecryptable(handle, caller);
    }
    bool isPubliclyDecryptable(const fhe::CiphertextHandle& handle) const override {
        polls++;
        if (notReadyFor > 0) {
            notReadyFor--;
            return false;
        }
        return inner_.isPubliclyDecryptable(handle);
    }
    std::optional<fhe::PublicDecryptResult> publicDecrypt(const std::vector<fhe::CiphertextHandle>& handles) override {
        auto r = inner_.publicDecrypt(handles);
        if (r && dropProof) r->proof.clear();
        return r;
    }
    bool verifySignatures(const std::vector<fhe::CiphertextHandle>& handles,
                          const std::vector<uint8_t>& encodedValues,
                          const std::vector<uint8_t>& proof) const override {
        return inner_.verifySignatures(handles, encodedValues, proof);
    }

    mutable int notReadyFor = 0;
    mutable int polls = 0;
    bool dropProof = false;

private:
    fhe::LocalEncryptionService& inner_;
};

}

class DecryptionWorkflowTest : public ContractTestBase {
protected:
    void SetUp() override {
        ContractTestBase::SetUp();
        config.pollAttempts = 4;
        config.pollDelayMs = 250;
        sleeper = [this](uint32_t ms) { sleeps.push_back(ms); };
    }

    // Three submissions scored 18, 40, 40 by a single judge, winners calculated.
    uint64_t setupCompleted() {
        uint64_t id = createHackathon({judgeA});
        registerAndSubmit(id, alice, "alice");
        registerAndSubmit(id, bob, "bob");
        registerAndSubmit(id, carol, "carol");
        now = SUBMISSION_DEADLINE;
        EXPECT_TRUE(contract->grantJudgeAccess(organizer, id).ok());
        score(id, judgeA, 0, 18);
        score(id, judgeA, 1, 40);
        score(id, judgeA, 2, 40);
        now = JUDGING_DEADLINE;
        EXPECT_TRUE(contract->calculateWinners(organizer, id).ok());
        return id;
    }

    utils::DecryptConfig config;
    std::vector<uint32_t> sleeps;
    client::DecryptionWorkflow::SleepFn sleeper;
};

TEST_F(DecryptionWorkflowTest, SubmitsScoresInSubmissionOrder) {
    uint64_t id = setupCompleted();
    client::DecryptionWorkflow workflow(*contract, *service, organizer, config, sleeper);

    auto r = workflow.run(id);
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(r.value(), (std::vector<uint64_t>{18, 40, 40}));
    EXPECT_TRUE(sleeps.empty());

    auto winners = contract->getWinners(id).value();
    ASSERT_EQ(winners.size(), 3u);
    EXPECT_EQ(winners[0].participant, bob);
    EXPECT_EQ(winners[1].participant, carol);
    EXPECT_EQ(winners[2].participant, alice);
    EXPECT_TRUE(contract->isWinnersFinalized(id).value());
}

TEST_F(DecryptionWorkflowTest, PollsWithFixedDelay) {
    uint64_t id = setupCompleted();
    SlowGateway gateway(*service);
    gateway.notReadyFor = 2;
    client::DecryptionWorkflow workflow(*contract, gateway, organizer, config, sleeper);

    ASSERT_TRUE(workflow.run(id).ok());
    EXPECT_EQ(sleeps, (std::vector<uint32_t>{250, 250}));
    EXPECT_EQ(gateway.polls, 5);
}

TEST_F(DecryptionWorkflowTest, GivesUpAfterBoundedAttempts) {
    uint64_t id = setupCompleted();
    SlowGateway gateway(*service);
    gateway.notReadyFor = 100;
    client::DecryptionWorkflow workflow(*contract, gateway, organizer, config, sleeper);

    auto r = workflow.run(id);
    EXPECT_EQ(r.code(), ErrorCode::ENCRYPTION_SERVICE_ERROR);
    EXPECT_EQ(gateway.polls, 4);
    EXPECT_EQ(sleeps.size(), 3u);
    EXPECT_FALSE(contract->isWinnersFinalized(id).value());
}

TEST_F(DecryptionWorkflowTest, MissingProofIsRejected) {
    uint64_t id = setupCompleted();
    SlowGateway gateway(*service);
    gateway.dropProof = true;
    client::DecryptionWorkflow workflow(*contract, gateway, organizer, config, sleeper);

    EXPECT_EQ(workflow.run(id).code(), ErrorCode::ENCRYPTION_SERVICE_ERROR);
    EXPECT_TRUE(contract->getWinners(id).value().empty());
}

TEST_F(DecryptionWorkflowTest, RequiresCompletedPhase) {
    uint64_t id = createHackathon({judgeA});
    registerAndSubmit(id, alice, "alice");
    client::DecryptionWorkflow workflow(*contract, *service, organizer, config, sleeper);
    EXPECT_EQ(workflow.run(id).code(), ErrorCode::INVALID_PHASE);
    EXPECT_EQ(workflow.run(77).code(), ErrorCode::NOT_FOUND);
}

TEST_F(DecryptionWorkflowTest, OnlyOrganizerCanFinalize) {
    uint64_t id = setupCompleted();
    client::DecryptionWorkflow workflow(*contract, *service, alice, config, sleeper);

    auto decrypted = workflow.decrypt(id);
    ASSERT_TRUE(decrypted.ok());
    EXPECT_EQ(decrypted.value().handles.size(), 3u);
    EXPECT_FALSE(decrypted.value().proof.empty());

    EXPECT_EQ(workflow.run(id).code(), ErrorCode::NOT_ORGANIZER);
}
