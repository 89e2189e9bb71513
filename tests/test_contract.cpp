#include "contract_fixture.h"
#include "infrastructure/error_handling.h"
#include <mutex>
#include <thread>

using namespace zackathon;
using namespace zackathon::core;

class ContractTest : public ContractTestBase {
protected:
    // Two judges, four submissions from alice, bob, carol, dave (ids 0..3),
    // access granted, clock inside the judging window.
    uint64_t setupJudging() {
        uint64_t id = createHackathon({judgeA, judgeB});
        registerAndSubmit(id, alice, "alice");
        registerAndSubmit(id, bob, "bob");
        registerAndSubmit(id, carol, "carol");
        registerAndSubmit(id, dave, "dave");
        now = SUBMISSION_DEADLINE;
        EXPECT_TRUE(contract->grantJudgeAccess(organizer, id).ok());
        return id;
    }

    void scoreAll(uint64_t id, const std::vector<uint64_t>& a, const std::vector<uint64_t>& b) {
        for (size_t i = 0; i < a.size(); i++) score(id, judgeA, i, a[i]);
        for (size_t i = 0; i < b.size(); i++) score(id, judgeB, i, b[i]);
    }
};

TEST_F(ContractTest, CreateAssignsSequentialIdsFromOne) {
    EXPECT_EQ(contract->getTotalHackathonCount(), 0u);
    EXPECT_EQ(createHackathon({judgeA}), 1u);
    EXPECT_EQ(createHackathon({judgeA, judgeB}), 2u);
    EXPECT_EQ(contract->getTotalHackathonCount(), 2u);

    auto details = contract->getHackathonDetails(2);
    ASSERT_TRUE(details.ok());
    EXPECT_EQ(details.value().organizer, organizer);
    EXPECT_EQ(details.value().judges.size(), 2u);
    EXPECT_EQ(details.value().phase, Phase::REGISTRATION_OPEN);
    EXPECT_EQ(details.value().createdAt, T0);
    EXPECT_FALSE(details.value().judgeAccessGranted);
}

TEST_F(ContractTest, CreateRejectsInvalidConfig) {
    auto expectRejected = [&](const HackathonConfig& config) {
        auto r = contract->createHackathon(organizer, config);
        EXPECT_FALSE(r.ok());
        EXPECT_EQ(r.code(), ErrorCode::INVALID_CONFIG);
    };

    HackathonConfig c = makeConfig({judgeA});
    c.name.clear();
    expectRejected(c);

    c = makeConfig({judgeA});
    c.submissionDeadline = T0;
    expectRejected(c);

    c = makeConfig({judgeA});
    c.judgingDeadline = c.submissionDeadline;
    expectRejected(c);

    expectRejected(makeConfig({}));
    expectRejected(makeConfig({organizer}));
    expectRejected(makeConfig({judgeA, judgeA}));
    expectRejected(makeConfig({crypto::Address::zero()}));

    ContractLimits small;
    small.maxJudges = 1;
    contract = makeContract(small);
    expectRejected(makeConfig({judgeA, judgeB}));

    EXPECT_EQ(contract->getTotalHackathonCount(), 0u);
    EXPECT_EQ(contract->getHackathonDetails(1).code(), ErrorCode::NOT_FOUND);
}

TEST_F(ContractTest, FirstRegistrationOpensSubmissions) {
    uint64_t id = createHackathon({judgeA});
    ASSERT_TRUE(contract->registerForHackathon(alice, id, info("alice")).ok());

    EXPECT_EQ(contract->getHackathonDetails(id).value().phase, Phase::SUBMISSIONS_OPEN);
    auto p = contract->getParticipant(id, alice);
    ASSERT_TRUE(p.ok());
    EXPECT_EQ(p.value().info.teamName, "alice");
    EXPECT_EQ(p.value().registrationTime, T0);
    EXPECT_FALSE(p.value().hasSubmitted);
    EXPECT_EQ(contract->getParticipantList(id).value(), std::vector<crypto::Address>{alice});
}

TEST_F(ContractTest, RegistrationRules) {
    uint64_t id = createHackathon({judgeA});
    ASSERT_TRUE(contract->registerForHackathon(alice, id, info("alice")).ok());

    EXPECT_EQ(contract->registerForHackathon(alice, id, info("again")).code(), ErrorCode::ALREADY_REGISTERED);
    EXPECT_EQ(contract->registerForHackathon(judgeA, id, info("judge")).code(),
              ErrorCode::JUDGE_CANNOT_PARTICIPATE);
    RegistrationInfo noEmail = info("bob");
    noEmail.email.clear();
    EXPECT_EQ(contract->registerForHackathon(bob, id, noEmail).code(), ErrorCode::INVALID_INPUT);
    EXPECT_EQ(contract->registerForHackathon(bob, 99, info("bob")).code(), ErrorCode::NOT_FOUND);

    // The organizer is not barred from competing.
    EXPECT_TRUE(contract->registerForHackathon(organizer, id, info("org")).ok());

    now = SUBMISSION_DEADLINE;
    EXPECT_EQ(contract->registerForHackathon(bob, id, info("bob")).code(), ErrorCode::DEADLINE_PASSED);
    EXPECT_EQ(contract->getHackathonDetails(id).value().participantCount, 2u);
    EXPECT_EQ(contract->getParticipant(id, bob).code(), ErrorCode::NOT_REGISTERED);
}

TEST_F(ContractTest, RegistrationCapacity) {
    HackathonConfig config = makeConfig({judgeA});
    config.maxParticipants = 1;
    uint64_t id = contract->createHackathon(organizer, config).value();

    ASSERT_TRUE(contract->registerForHackathon(alice, id, info("alice")).ok());
    EXPECT_EQ(contract->registerForHackathon(bob, id, info("bob")).code(), ErrorCode::CAPACITY_REACHED);
}

TEST_F(ContractTest, SubmissionRules) {
    uint64_t id = createHackathon({judgeA});
    EXPECT_EQ(contract->submitProject(alice, id, referenceFor(alice, "QmA")).code(), ErrorCode::NOT_REGISTERED);

    ASSERT_TRUE(contract->registerForHackathon(alice, id, info("alice")).ok());
    ASSERT_TRUE(contract->registerForHackathon(bob, id, info("bob")).ok());

    // A reference bound to another caller does not verify.
    EXPECT_EQ(contract->submitProject(alice, id, referenceFor(bob, "QmA")).code(), ErrorCode::INVALID_PROOF);
    EXPECT_FALSE(contract->getParticipant(id, alice).value().hasSubmitted);
    EXPECT_EQ(contract->getSubmissionCount(id).value(), 0u);

    auto first = contract->submitProject(alice, id, referenceFor(alice, "QmA"));
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.value(), 0u);
    EXPECT_TRUE(contract->getParticipant(id, alice).value().hasSubmitted);
    EXPECT_EQ(contract->submitProject(alice, id, referenceFor(alice, "QmA2")).code(), ErrorCode::ALREADY_SUBMITTED);

    now = SUBMISSION_DEADLINE;
    EXPECT_EQ(contract->submitProject(bob, id, referenceFor(bob, "QmB")).code(), ErrorCode::DEADLINE_PASSED);

    auto info0 = contract->getSubmission(id, 0);
    ASSERT_TRUE(info0.ok());
    EXPECT_EQ(info0.value().participant, alice);
    EXPECT_EQ(info0.value().status, SubmissionStatus::PENDING);
    EXPECT_EQ(info0.value().judgeCount, 0u);
    EXPECT_EQ(contract->getSubmission(id, 1).code(), ErrorCode::INVALID_SUBMISSION);
}

TEST_F(ContractTest, SubmissionLimit) {
    ContractLimits limits;
    limits.maxSubmissions = 1;
    contract = makeContract(limits);
    uint64_t id = createHackathon({judgeA});
    registerAndSubmit(id, alice, "alice");
    ASSERT_TRUE(contract->registerForHackathon(bob, id, info("bob")).ok());
    EXPECT_EQ(contract->submitProject(bob, id, referenceFor(bob, "QmB")).code(), ErrorCode::CAPACITY_REACHED);
}

TEST_F(ContractTest, EncryptedReferenceVisibleToJudgesAfterAccess) {
    uint64_t id = createHackathon({judgeA});
    registerAndSubmit(id, alice, "alice");

    EXPECT_EQ(contract->getEncryptedReference(alice, id, 0).code(), ErrorCode::NOT_JUDGE);
    EXPECT_EQ(contract->getEncryptedReference(judgeA, id, 0).code(), ErrorCode::ACCESS_NOT_GRANTED);

    now = SUBMISSION_DEADLINE;
    ASSERT_TRUE(contract->grantJudgeAccess(organizer, id).ok());

    auto handle = contract->getEncryptedReference(judgeA, id, 0);
    ASSERT_TRUE(handle.ok());
    EXPECT_EQ(contract->getEncryptedReference(judgeA, id, 1).code(), ErrorCode::INVALID_SUBMISSION);
    auto clear = service->userDecrypt(handle.value(), judgeA);
    ASSERT_TRUE(clear.has_value());
    EXPECT_EQ(*clear, crypto::sha256(std::string("Qmalice")));
    EXPECT_FALSE(service->userDecrypt(handle.value(), bob).has_value());
}

TEST_F(ContractTest, GrantJudgeAccessRules) {
    uint64_t id = createHackathon({judgeA});
    registerAndSubmit(id, alice, "alice");

    EXPECT_EQ(contract->grantJudgeAccess(alice, id).code(), ErrorCode::NOT_ORGANIZER);
    EXPECT_EQ(contract->grantJudgeAccess(organizer, id).code(), ErrorCode::TOO_EARLY);

    now = SUBMISSION_DEADLINE;
    ASSERT_TRUE(contract->grantJudgeAccess(organizer, id).ok());
    auto details = contract->getHackathonDetails(id).value();
    EXPECT_EQ(details.phase, Phase::JUDGING);
    EXPECT_TRUE(details.judgeAccessGranted);

    size_t eventsBefore = contract->getEvents(1, 0).size();
    EXPECT_EQ(contract->grantJudgeAccess(organizer, id).code(), ErrorCode::ACCESS_ALREADY_GRANTED);
    EXPECT_EQ(contract->getHackathonDetails(id).value().phase, Phase::JUDGING);
    EXPECT_EQ(contract->getEvents(1, 0).size(), eventsBefore);
}

TEST_F(ContractTest, NoSubmissionsBlocksJudging) {
    uint64_t id = createHackathon({judgeA});
    ASSERT_TRUE(contract->registerForHackathon(alice, id, info("alice")).ok());
    now = JUDGING_DEADLINE;
    EXPECT_EQ(contract->grantJudgeAccess(organizer, id).code(), ErrorCode::NO_SUBMISSIONS);
    EXPECT_EQ(contract->calculateWinners(organizer, id).code(), ErrorCode::NO_SUBMISSIONS);
    EXPECT_EQ(contract->getHackathonDetails(id).value().phase, Phase::SUBMISSIONS_OPEN);
}

TEST_F(ContractTest, ScoreBeforeAccessIsRejected) {
    uint64_t id = createHackathon({judgeA});
    registerAndSubmit(id, alice, "alice");
    now = SUBMISSION_DEADLINE;

    auto r = contract->submitScore(judgeA, id, 0, scoreFor(judgeA, 40));
    EXPECT_EQ(r.code(), ErrorCode::ACCESS_NOT_GRANTED);
    EXPECT_EQ(contract->getScoreHandle(judgeA, id, 0, judgeA).code(), ErrorCode::NOT_FOUND);
    EXPECT_EQ(contract->getSubmission(id, 0).value().judgeCount, 0u);
}

TEST_F(ContractTest, ScoringRules) {
    uint64_t id = setupJudging();

    EXPECT_EQ(contract->submitScore(alice, id, 0, scoreFor(alice, 10)).code(), ErrorCode::NOT_JUDGE);
    EXPECT_EQ(contract->submitScore(judgeA, id, 7, scoreFor(judgeA, 10)).code(), ErrorCode::INVALID_SUBMISSION);
    // Width and caller are both bound into the proof.
    auto wide = service->encryptUint(10, fhe::ValueWidth::U32, contractAddr, judgeA);
    EXPECT_EQ(contract->submitScore(judgeA, id, 0, wide).code(), ErrorCode::INVALID_PROOF);
    EXPECT_EQ(contract->submitScore(judgeA, id, 0, scoreFor(judgeB, 10)).code(), ErrorCode::INVALID_PROOF);

    score(id, judgeA, 0, 10);
    auto s = contract->getSubmission(id, 0).value();
    EXPECT_EQ(s.status, SubmissionStatus::JUDGED);
    EXPECT_EQ(s.judgeCount, 1u);
    EXPECT_EQ(contract->submitScore(judgeA, id, 0, scoreFor(judgeA, 12)).code(), ErrorCode::ALREADY_SCORED);
    EXPECT_EQ(contract->getSubmission(id, 0).value().judgeCount, 1u);

    // Score handles are readable by the judge and the submitter only.
    EXPECT_TRUE(contract->getScoreHandle(judgeA, id, 0, judgeA).ok());
    EXPECT_TRUE(contract->getScoreHandle(alice, id, 0, judgeA).ok());
    EXPECT_EQ(contract->getScoreHandle(bob, id, 0, judgeA).code(), ErrorCode::NOT_AUTHORIZED);
    auto mine = contract->getScoreHandle(alice, id, 0, judgeA).value();
    EXPECT_TRUE(service->isAllowed(mine, alice));

    now = JUDGING_DEADLINE;
    EXPECT_EQ(contract->submitScore(judgeB, id, 0, scoreFor(judgeB, 10)).code(), ErrorCode::OUT_OF_WINDOW);
}

TEST_F(ContractTest, IncompleteScoringKeepsJudging) {
    uint64_t id = setupJudging();
    scoreAll(id, {10, 20, 25, 5}, {20, 25, 20});

    EXPECT_EQ(contract->calculateWinners(organizer, id).code(), ErrorCode::TOO_EARLY);
    now = JUDGING_DEADLINE;
    EXPECT_EQ(contract->calculateWinners(alice, id).code(), ErrorCode::NOT_ORGANIZER);
    EXPECT_EQ(contract->calculateWinners(organizer, id).code(), ErrorCode::INCOMPLETE_SCORING);
    EXPECT_EQ(contract->getHackathonDetails(id).value().phase, Phase::JUDGING);
    EXPECT_EQ(contract->getAggregateScoreHandle(id, 0).code(), ErrorCode::INVALID_PHASE);
}

TEST_F(ContractTest, EndToEndSingleJudge) {
    uint64_t id = createHackathon({judgeA});
    ASSERT_TRUE(contract->registerForHackathon(alice, id, info("alice")).ok());
    now = T0 + 50;
    ASSERT_TRUE(contract->submitProject(alice, id, referenceFor(alice, "QmAlice")).ok());

    now = SUBMISSION_DEADLINE;
    ASSERT_TRUE(contract->grantJudgeAccess(organizer, id).ok());
    now = T0 + 150;
    score(id, judgeA, 0, 45);

    now = JUDGING_DEADLINE;
    ASSERT_TRUE(contract->calculateWinners(organizer, id).ok());
    EXPECT_EQ(contract->getHackathonDetails(id).value().phase, Phase::COMPLETED);
    auto aggregate = contract->getAggregateScoreHandle(id, 0).value();
    EXPECT_TRUE(service->isPubliclyDecryptable(aggregate));
    EXPECT_EQ(service->widthOf(aggregate), fhe::ValueWidth::U32);

    EXPECT_FALSE(contract->getDecryptedScore(id, 0).value().isDecrypted);
    fhe::PublicDecryptResult decrypted = decryptAggregates(id);
    ASSERT_TRUE(contract->submitDecryptedScores(organizer, id, {45}, decrypted.proof).ok());

    auto winners = contract->getWinners(id).value();
    ASSERT_EQ(winners.size(), 1u);
    EXPECT_EQ(winners[0].participant, alice);
    EXPECT_EQ(winners[0].ranking, 1);
    EXPECT_EQ(winners[0].finalScore, 45u);
    EXPECT_EQ(winners[0].submissionId, 0u);

    auto d = contract->getDecryptedScore(id, 0).value();
    EXPECT_TRUE(d.isDecrypted);
    EXPECT_EQ(d.score, 45u);
    EXPECT_TRUE(contract->isWinnersFinalized(id).value());
    EXPECT_EQ(contract->getHackathonDetails(id).value().phase, Phase::COMPLETED);

    auto events = contract->getEvents(1, 0);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().type, ContractEventType::WinnersAnnounced);
    EXPECT_EQ(events.back().field("first"), alice.toHex());
    EXPECT_EQ(events.back().field("second"), crypto::Address::zero().toHex());
}

TEST_F(ContractTest, EarlierSubmissionWinsTies) {
    uint64_t id = setupJudging();
    // Totals 30, 45, 45, 10.
    scoreAll(id, {10, 20, 25, 5}, {20, 25, 20, 5});
    now = JUDGING_DEADLINE;
    ASSERT_TRUE(contract->calculateWinners(organizer, id).ok());

    fhe::PublicDecryptResult decrypted = decryptAggregates(id);
    std::vector<uint64_t> clear;
    for (size_t i = 0; i < 4; i++) {
        uint64_t v = 0;
        ASSERT_TRUE(utils::wordToUint64(decrypted.clearValues.at(contract->getAggregateScoreHandle(id, i).value()), v));
        clear.push_back(v);
    }
    EXPECT_EQ(clear, (std::vector<uint64_t>{30, 45, 45, 10}));
    ASSERT_TRUE(contract->submitDecryptedScores(organizer, id, clear, decrypted.proof).ok());

    auto winners = contract->getWinners(id).value();
    ASSERT_EQ(winners.size(), 3u);
    EXPECT_EQ(winners[0].submissionId, 1u);
    EXPECT_EQ(winners[0].participant, bob);
    EXPECT_EQ(winners[0].finalScore, 45u);
    EXPECT_EQ(winners[1].submissionId, 2u);
    EXPECT_EQ(winners[1].participant, carol);
    EXPECT_EQ(winners[1].ranking, 2);
    EXPECT_EQ(winners[2].submissionId, 0u);
    EXPECT_EQ(winners[2].finalScore, 30u);
}

TEST_F(ContractTest, DecryptedScoreSubmissionRules) {
    uint64_t id = setupJudging();
    scoreAll(id, {10, 20, 25, 5}, {20, 25, 20, 5});
    EXPECT_EQ(contract->submitDecryptedScores(organizer, id, {30, 45, 45, 10}, {}).code(), ErrorCode::INVALID_PHASE);

    now = JUDGING_DEADLINE;
    ASSERT_TRUE(contract->calculateWinners(organizer, id).ok());
    fhe::PublicDecryptResult decrypted = decryptAggregates(id);
    std::vector<uint64_t> clear = {30, 45, 45, 10};

    EXPECT_EQ(contract->submitDecryptedScores(alice, id, clear, decrypted.proof).code(), ErrorCode::NOT_ORGANIZER);
    EXPECT_EQ(contract->submitDecryptedScores(organizer, id, {30, 45, 45}, decrypted.proof).code(),
              ErrorCode::SCORE_COUNT_MISMATCH);
    EXPECT_EQ(contract->submitDecryptedScores(organizer, id, {30, 45, 45, 99}, decrypted.proof).code(),
              ErrorCode::INVALID_DECRYPTION_PROOF);
    EXPECT_TRUE(contract->getWinners(id).value().empty());

    ASSERT_TRUE(contract->submitDecryptedScores(organizer, id, clear, decrypted.proof).ok());
    auto winners = contract->getWinners(id).value();

    auto replay = contract->submitDecryptedScores(organizer, id, clear, decrypted.proof);
    EXPECT_EQ(replay.code(), ErrorCode::ALREADY_FINALIZED);
    EXPECT_EQ(contract->getWinners(id).value().size(), winners.size());
}

TEST_F(ContractTest, PhaseNeverDecreases) {
    std::vector<Phase> observed;
    uint64_t id = createHackathon({judgeA});
    contract->events().subscribeAll([&](const ContractEvent& e) {
        observed.push_back(contract->getHackathonDetails(e.hackathonId).value().phase);
    });

    registerAndSubmit(id, alice, "alice");
    registerAndSubmit(id, bob, "bob");
    now = SUBMISSION_DEADLINE;
    ASSERT_TRUE(contract->grantJudgeAccess(organizer, id).ok());
    score(id, judgeA, 0, 7);
    score(id, judgeA, 1, 9);
    EXPECT_FALSE(contract->registerForHackathon(carol, id, info("carol")).ok());
    now = JUDGING_DEADLINE;
    ASSERT_TRUE(contract->calculateWinners(organizer, id).ok());

    ASSERT_GE(observed.size(), 7u);
    for (size_t i = 1; i < observed.size(); i++) {
        EXPECT_LE(observed[i - 1], observed[i]);
    }
    EXPECT_EQ(observed.back(), Phase::COMPLETED);
}

TEST_F(ContractTest, EventsCarrySequenceAndFields) {
    std::vector<ContractEvent> seen;
    contract->events().subscribe(ContractEventType::ProjectSubmitted,
                                 [&](const ContractEvent& e) { seen.push_back(e); });

    uint64_t id = createHackathon({judgeA});
    registerAndSubmit(id, alice, "alice");
    EXPECT_FALSE(contract->submitProject(alice, id, referenceFor(alice, "QmX")).ok());

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].field("participant"), alice.toHex());
    EXPECT_EQ(seen[0].field("submissionId"), "0");

    auto all = contract->getEvents(1, 0);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].type, ContractEventType::HackathonCreated);
    EXPECT_EQ(all[0].field("name"), "FHE Build Weekend");
    for (size_t i = 0; i < all.size(); i++) EXPECT_EQ(all[i].sequence, i + 1);

    auto tail = contract->getEvents(2, 1);
    ASSERT_EQ(tail.size(), 1u);
    EXPECT_EQ(tail[0].type, ContractEventType::ParticipantRegistered);
}

TEST_F(ContractTest, ConcurrentMutationsDeliverInSequenceOrder) {
    uint64_t id = createHackathon({judgeA});
    std::mutex seenMtx;
    std::vector<uint64_t> seen;
    contract->events().subscribeAll([&](const ContractEvent& e) {
        std::lock_guard<std::mutex> lock(seenMtx);
        seen.push_back(e.sequence);
    });

    const int threads = 4;
    const int perThread = 25;
    std::vector<std::vector<crypto::Address>> entrants(threads);
    for (int t = 0; t < threads; t++) {
        for (int i = 0; i < perThread; i++) {
            entrants[t].push_back(account("entrant-" + std::to_string(t) + "-" + std::to_string(i)));
        }
    }

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; t++) {
        workers.emplace_back([&, t]() {
            for (int i = 0; i < perThread; i++) {
                EXPECT_TRUE(contract->registerForHackathon(entrants[t][i], id, info("team")).ok());
            }
        });
    }
    for (auto& w : workers) w.join();

    ASSERT_EQ(seen.size(), static_cast<size_t>(threads * perThread));
    for (size_t i = 0; i < seen.size(); i++) {
        EXPECT_EQ(seen[i], i + 2);
    }
}

TEST_F(ContractTest, MutationFromHandlerIsDeliveredAfterCurrentEvent) {
    uint64_t id = createHackathon({judgeA});
    std::vector<std::string> order;
    contract->events().subscribe(ContractEventType::ParticipantRegistered, [&](const ContractEvent& e) {
        if (e.field("participant") == alice.toHex()) {
            EXPECT_TRUE(contract->registerForHackathon(bob, id, info("bob")).ok());
        }
    });
    contract->events().subscribeAll([&](const ContractEvent& e) {
        order.push_back(e.field("participant"));
    });

    ASSERT_TRUE(contract->registerForHackathon(alice, id, info("alice")).ok());
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], alice.toHex());
    EXPECT_EQ(order[1], bob.toHex());
}

TEST_F(ContractTest, RejectionsAreReported) {
    ErrorHandler::instance().clearErrors();
    uint64_t id = createHackathon({judgeA});
    EXPECT_FALSE(contract->grantJudgeAccess(alice, id).ok());
    EXPECT_FALSE(contract->grantJudgeAccess(bob, id).ok());

    EXPECT_EQ(ErrorHandler::instance().getErrorCount(ErrorCode::NOT_ORGANIZER), 2u);
    EXPECT_EQ(ErrorHandler::instance().getErrorCount(ErrorCategory::AUTHORIZATION), 2u);
    EXPECT_EQ(ErrorHandler::instance().getLastError().context, "grant-judge-access");
}

TEST_F(ContractTest, JudgeQueries) {
    uint64_t id = createHackathon({judgeA, judgeB});
    EXPECT_TRUE(contract->isJudge(id, judgeB).value());
    EXPECT_FALSE(contract->isJudge(id, alice).value());
    EXPECT_EQ(contract->isJudge(42, alice).code(), ErrorCode::NOT_FOUND);
}
