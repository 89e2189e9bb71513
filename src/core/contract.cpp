#include "core/contract.h"
#include "core/contract_store.h"
#include "core/participation.h"
#include "core/registry.h"
#include "core/scoring.h"
#include "core/submission_store.h"
#include "core/winner_resolver.h"
#include "utils/logger.h"
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <optional>

namespace zackathon {
namespace core {

namespace {

uint64_t wallClock() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

ContractEvent makeEvent(ContractEventType type, uint64_t hackathonId, uint64_t now,
                        std::map<std::string, std::string> fields) {
    ContractEvent e;
    e.type = type;
    e.hackathonId = hackathonId;
    e.timestamp = now;
    e.fields = std::move(fields);
    return e;
}

}

struct HackathonContract::Impl {
    std::shared_ptr<fhe::EncryptedValueService> encryption;
    Address contractAddress;
    ContractLimits limits;
    Clock clock;

    std::map<uint64_t, HackathonRecord> records;
    uint64_t hackathonCount = 0;
    std::vector<ContractEvent> eventLog;
    uint64_t nextSequence = 1;

    ContractStore store;
    EventBus bus;
    // Committed events not yet handed to the bus, in sequence order.
    std::deque<ContractEvent> outbox;
    bool delivering = false;
    mutable std::mutex mtx;

    // Numbers the staged events and writes them with the record. In-memory
    // event state only advances once the write has succeeded.
    Result<void> persist(const HackathonRecord& record, std::vector<ContractEvent>& staged) {
        for (size_t i = 0; i < staged.size(); i++) {
            staged[i].sequence = nextSequence + i;
        }
        if (store.isOpen()) {
            auto r = store.commit(record, hackathonCount, staged);
            if (!r.ok()) return r;
        }
        nextSequence += staged.size();
        eventLog.insert(eventLog.end(), staged.begin(), staged.end());
        outbox.insert(outbox.end(), staged.begin(), staged.end());
        return {};
    }

    // Publishes queued events outside the state lock. Only one thread drains
    // at a time, so subscribers see sequences in increasing order; a mutation
    // made from inside a handler is delivered after the current event.
    void deliver() {
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (delivering) return;
            delivering = true;
        }
        for (;;) {
            ContractEvent next;
            {
                std::lock_guard<std::mutex> lock(mtx);
                if (outbox.empty()) {
                    delivering = false;
                    return;
                }
                next = std::move(outbox.front());
                outbox.pop_front();
            }
            bus.publish(next);
        }
    }

    void report(const char* op, const Address& caller, uint64_t hackathonId, const Error* err) {
        std::string who = utils::Logger::redactAddress(caller.toHex());
        if (!err) {
            utils::Logger::log(utils::LogLevel::INFO, op,
                               "hackathon=" + std::to_string(hackathonId) + " caller=" + who);
            return;
        }
        utils::Logger::log(utils::LogLevel::WARN, op,
                           "rejected hackathon=" + std::to_string(hackathonId) + " caller=" + who +
                           " code=" + errorCodeName(err->code) + ": " + err->message);
        Error reported = *err;
        reported.context = op;
        ErrorHandler::instance().handle(reported);
    }

    template<typename T, typename Op>
    Result<T> mutate(const char* opName, const Address& caller, uint64_t hackathonId, Op op) {
        std::vector<ContractEvent> staged;
        Result<T> result = [&]() -> Result<T> {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = records.find(hackathonId);
            if (it == records.end()) return makeError(ErrorCode::NOT_FOUND);
            HackathonRecord& record = it->second;

            std::optional<HackathonRecord> before;
            if (store.isOpen()) before = record;

            OperationContext ctx{*encryption, contractAddress, caller, clock(), limits};
            Result<T> r = op(record, ctx, staged);
            if (!r.ok()) {
                staged.clear();
                return r;
            }
            auto written = persist(record, staged);
            if (!written.ok()) {
                if (before) record = std::move(*before);
                staged.clear();
                return written.error();
            }
            return r;
        }();

        report(opName, caller, hackathonId, result.ok() ? nullptr : &result.error());
        deliver();
        return result;
    }

    const HackathonRecord* find(uint64_t hackathonId) const {
        auto it = records.find(hackathonId);
        return it != records.end() ? &it->second : nullptr;
    }
};

HackathonContract::HackathonContract(std::shared_ptr<fhe::EncryptedValueService> encryption,
                                     const Address& contractAddress,
                                     const ContractLimits& limits,
                                     Clock clock)
    : impl_(std::make_unique<Impl>()) {
    impl_->encryption = std::move(encryption);
    impl_->contractAddress = contractAddress;
    impl_->limits = limits;
    impl_->clock = clock ? std::move(clock) : Clock(wallClock);
}

HackathonContract::~HackathonContract() {
    close();
}

Result<void> HackathonContract::open(const std::string& dbPath) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->store.isOpen()) return makeError(ErrorCode::PERSISTENCE_ERROR, "Store already open");
    if (!impl_->store.open(dbPath)) {
        return makeError(ErrorCode::PERSISTENCE_ERROR, "Cannot open " + dbPath);
    }

    auto loaded = impl_->store.load();
    if (!loaded.ok()) {
        impl_->store.close();
        return loaded.error();
    }

    StoredState& state = loaded.value();
    impl_->records = std::move(state.records);
    impl_->hackathonCount = state.hackathonCount;
    impl_->eventLog = std::move(state.events);
    impl_->nextSequence = impl_->eventLog.empty() ? 1 : impl_->eventLog.back().sequence + 1;

    LOG_INFO("Contract state loaded: " + std::to_string(impl_->records.size()) + " hackathons, " +
             std::to_string(impl_->eventLog.size()) + " events");
    return {};
}

void HackathonContract::close() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->store.close();
}

bool HackathonContract::isPersistent() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->store.isOpen();
}

Result<uint64_t> HackathonContract::createHackathon(const Address& caller, const HackathonConfig& config) {
    std::vector<ContractEvent> staged;
    uint64_t assigned = 0;
    Result<uint64_t> result = [&]() -> Result<uint64_t> {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        uint64_t now = impl_->clock();
        auto valid = Registry::validateConfig(config, caller, now, impl_->limits);
        if (!valid.ok()) return valid.error();

        uint64_t id = impl_->hackathonCount + 1;
        impl_->records[id] = Registry::create(id, config, caller, now);
        impl_->hackathonCount = id;

        staged.push_back(makeEvent(ContractEventType::HackathonCreated, id, now,
                                   {{"name", config.name}, {"organizer", caller.toHex()}}));
        auto written = impl_->persist(impl_->records[id], staged);
        if (!written.ok()) {
            impl_->records.erase(id);
            impl_->hackathonCount = id - 1;
            staged.clear();
            return written.error();
        }
        assigned = id;
        return id;
    }();

    impl_->report("create-hackathon", caller, assigned, result.ok() ? nullptr : &result.error());
    impl_->deliver();
    return result;
}

Result<void> HackathonContract::registerForHackathon(const Address& caller, uint64_t hackathonId,
                                                     const RegistrationInfo& info) {
    return impl_->mutate<void>("register", caller, hackathonId,
        [&](HackathonRecord& record, const OperationContext& ctx, std::vector<ContractEvent>& staged) -> Result<void> {
            auto r = ParticipationLedger::registerParticipant(record, ctx, info);
            if (!r.ok()) return r;
            staged.push_back(makeEvent(ContractEventType::ParticipantRegistered, record.id, ctx.now,
                                       {{"participant", caller.toHex()}, {"teamName", info.teamName}}));
            return r;
        });
}

Result<uint64_t> HackathonContract::submitProject(const Address& caller, uint64_t hackathonId,
                                                  const fhe::ExternalInput& encryptedReference) {
    return impl_->mutate<uint64_t>("submit-project", caller, hackathonId,
        [&](HackathonRecord& record, const OperationContext& ctx, std::vector<ContractEvent>& staged) -> Result<uint64_t> {
            auto r = SubmissionStore::submit(record, ctx, encryptedReference);
            if (!r.ok()) return r;
            staged.push_back(makeEvent(ContractEventType::ProjectSubmitted, record.id, ctx.now,
                                       {{"participant", caller.toHex()},
                                        {"submissionId", std::to_string(r.value())}}));
            return r;
        });
}

Result<void> HackathonContract::submitScore(const Address& caller, uint64_t hackathonId, uint64_t submissionId,
                                            const fhe::ExternalInput& encryptedScore) {
    return impl_->mutate<void>("submit-score", caller, hackathonId,
        [&](HackathonRecord& record, const OperationContext& ctx, std::vector<ContractEvent>& staged) -> Result<void> {
            auto r = ScoringEngine::submitScore(record, ctx, submissionId, encryptedScore);
            if (!r.ok()) return r;
            staged.push_back(makeEvent(ContractEventType::ScoreSubmitted, record.id, ctx.now,
                                       {{"judge", caller.toHex()},
                                        {"submissionId", std::to_string(submissionId)}}));
            return r;
        });
}

Result<void> HackathonContract::grantJudgeAccess(const Address& caller, uint64_t hackathonId) {
    return impl_->mutate<void>("grant-judge-access", caller, hackathonId,
        [&](HackathonRecord& record, const OperationContext& ctx, std::vector<ContractEvent>& staged) -> Result<void> {
            auto r = Registry::grantJudgeAccess(record, ctx);
            if (!r.ok()) return r;
            staged.push_back(makeEvent(ContractEventType::JudgeAccessGranted, record.id, ctx.now,
                                       {{"submissionCount", std::to_string(record.submissionCount)}}));
            return r;
        });
}

Result<void> HackathonContract::calculateWinners(const Address& caller, uint64_t hackathonId) {
    return impl_->mutate<void>("calculate-winners", caller, hackathonId,
        [&](HackathonRecord& record, const OperationContext& ctx, std::vector<ContractEvent>& staged) -> Result<void> {
            auto r = Registry::calculateWinners(record, ctx);
            if (!r.ok()) return r;
            staged.push_back(makeEvent(ContractEventType::WinnersCalculated, record.id, ctx.now,
                                       {{"submissionCount", std::to_string(record.submissionCount)}}));
            return r;
        });
}

Result<void> HackathonContract::submitDecryptedScores(const Address& caller, uint64_t hackathonId,
                                                      const std::vector<uint64_t>& clearScores,
                                                      const std::vector<uint8_t>& decryptionProof) {
    return impl_->mutate<void>("submit-decrypted-scores", caller, hackathonId,
        [&](HackathonRecord& record, const OperationContext& ctx, std::vector<ContractEvent>& staged) -> Result<void> {
            auto r = WinnerResolver::submitDecryptedScores(record, ctx, clearScores, decryptionProof);
            if (!r.ok()) return r;
            for (size_t i = 0; i < record.decryptedScores.size(); i++) {
                staged.push_back(makeEvent(ContractEventType::ScoreDecrypted, record.id, ctx.now,
                                           {{"submissionId", std::to_string(i)},
                                            {"score", std::to_string(record.decryptedScores[i].score)}}));
            }
            Address ranks[3];
            for (const auto& w : record.winners) ranks[w.ranking - 1] = w.participant;
            staged.push_back(makeEvent(ContractEventType::WinnersAnnounced, record.id, ctx.now,
                                       {{"first", ranks[0].toHex()},
                                        {"second", ranks[1].toHex()},
                                        {"third", ranks[2].toHex()}}));
            return r;
        });
}

Result<HackathonDetails> HackathonContract::getHackathonDetails(uint64_t hackathonId) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const HackathonRecord* record = impl_->find(hackathonId);
    if (!record) ZACKATHON_FAIL(ErrorCode::NOT_FOUND);
    return record->details();
}

Result<Participant> HackathonContract::getParticipant(uint64_t hackathonId, const Address& account) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const HackathonRecord* record = impl_->find(hackathonId);
    if (!record) ZACKATHON_FAIL(ErrorCode::NOT_FOUND);
    const Participant* p = record->findParticipant(account);
    if (!p) ZACKATHON_FAIL(ErrorCode::NOT_REGISTERED);
    return *p;
}

Result<std::vector<Address>> HackathonContract::getParticipantList(uint64_t hackathonId) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const HackathonRecord* record = impl_->find(hackathonId);
    if (!record) ZACKATHON_FAIL(ErrorCode::NOT_FOUND);
    return record->participantList;
}

Result<uint32_t> HackathonContract::getSubmissionCount(uint64_t hackathonId) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const HackathonRecord* record = impl_->find(hackathonId);
    if (!record) ZACKATHON_FAIL(ErrorCode::NOT_FOUND);
    return record->submissionCount;
}

Result<SubmissionInfo> HackathonContract::getSubmission(uint64_t hackathonId, uint64_t submissionId) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const HackathonRecord* record = impl_->find(hackathonId);
    if (!record) ZACKATHON_FAIL(ErrorCode::NOT_FOUND);
    if (submissionId >= record->submissions.size()) ZACKATHON_FAIL(ErrorCode::INVALID_SUBMISSION);
    return record->submissionInfo(submissionId);
}

Result<std::vector<Winner>> HackathonContract::getWinners(uint64_t hackathonId) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const HackathonRecord* record = impl_->find(hackathonId);
    if (!record) ZACKATHON_FAIL(ErrorCode::NOT_FOUND);
    return record->winners;
}

Result<DecryptedScore> HackathonContract::getDecryptedScore(uint64_t hackathonId, uint64_t submissionId) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const HackathonRecord* record = impl_->find(hackathonId);
    if (!record) ZACKATHON_FAIL(ErrorCode::NOT_FOUND);
    if (submissionId >= record->submissions.size()) ZACKATHON_FAIL(ErrorCode::INVALID_SUBMISSION);
    if (submissionId >= record->decryptedScores.size()) return DecryptedScore{};
    return record->decryptedScores[submissionId];
}

Result<bool> HackathonContract::isJudge(uint64_t hackathonId, const Address& account) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const HackathonRecord* record = impl_->find(hackathonId);
    if (!record) ZACKATHON_FAIL(ErrorCode::NOT_FOUND);
    return record->isJudge(account);
}

Result<bool> HackathonContract::isWinnersFinalized(uint64_t hackathonId) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const HackathonRecord* record = impl_->find(hackathonId);
    if (!record) ZACKATHON_FAIL(ErrorCode::NOT_FOUND);
    return record->winnersFinalized;
}

uint64_t HackathonContract::getTotalHackathonCount() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->hackathonCount;
}

Result<CiphertextHandle> HackathonContract::getAggregateScoreHandle(uint64_t hackathonId,
                                                                    uint64_t submissionId) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const HackathonRecord* record = impl_->find(hackathonId);
    if (!record) ZACKATHON_FAIL(ErrorCode::NOT_FOUND);
    if (record->phase != Phase::COMPLETED) ZACKATHON_FAIL(ErrorCode::INVALID_PHASE);
    if (submissionId >= record->aggregateScores.size()) ZACKATHON_FAIL(ErrorCode::INVALID_SUBMISSION);
    return record->aggregateScores[submissionId];
}

Result<CiphertextHandle> HackathonContract::getEncryptedReference(const Address& caller, uint64_t hackathonId,
                                                                  uint64_t submissionId) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const HackathonRecord* record = impl_->find(hackathonId);
    if (!record) ZACKATHON_FAIL(ErrorCode::NOT_FOUND);
    return SubmissionStore::encryptedReference(*record, caller, submissionId);
}

Result<CiphertextHandle> HackathonContract::getScoreHandle(const Address& caller, uint64_t hackathonId,
                                                           uint64_t submissionId, const Address& judge) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    const HackathonRecord* record = impl_->find(hackathonId);
    if (!record) ZACKATHON_FAIL(ErrorCode::NOT_FOUND);
    if (submissionId >= record->submissions.size()) ZACKATHON_FAIL(ErrorCode::INVALID_SUBMISSION);
    if (caller != judge && caller != record->submissions[submissionId].participant) {
        ZACKATHON_FAIL(ErrorCode::NOT_AUTHORIZED);
    }
    auto it = record->scores.find(ScoreKey(submissionId, judge));
    if (it == record->scores.end()) return makeError(ErrorCode::NOT_FOUND, "Score not found");
    return it->second;
}

std::vector<ContractEvent> HackathonContract::getEvents(uint64_t fromSequence, size_t limit) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<ContractEvent> out;
    for (const auto& e : impl_->eventLog) {
        if (e.sequence < fromSequence) continue;
        if (limit > 0 && out.size() >= limit) break;
        out.push_back(e);
    }
    return out;
}

EventBus& HackathonContract::events() {
    return impl_->bus;
}

const Address& HackathonContract::address() const {
    return impl_->contractAddress;
}

const ContractLimits& HackathonContract::limits() const {
    return impl_->limits;
}

uint64_t HackathonContract::now() const {
    return impl_->clock();
}

}
}
