#pragma once

#include "core/context.h"
#include "core/events.h"
#include "core/hackathon.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace zackathon {
namespace core {

// Hosts every hackathon behind one lock. Each operation either applies
// completely (in memory and, when a store is open, on disk) or leaves state
// untouched. Events are published after the lock is released, one thread at
// a time and in sequence order.
class HackathonContract {
public:
    using Clock = std::function<uint64_t()>;

    HackathonContract(std::shared_ptr<fhe::EncryptedValueService> encryption,
                      const Address& contractAddress,
                      const ContractLimits& limits = ContractLimits(),
                      Clock clock = nullptr);
    ~HackathonContract();

    // Opens the store and replaces in-memory state with its contents.
    Result<void> open(const std::string& dbPath);
    void close();
    bool isPersistent() const;

    Result<uint64_t> createHackathon(const Address& caller, const HackathonConfig& config);
    Result<void> registerForHackathon(const Address& caller, uint64_t hackathonId, const RegistrationInfo& info);
    Result<uint64_t> submitProject(const Address& caller, uint64_t hackathonId,
                                   const fhe::ExternalInput& encryptedReference);
    Result<void> submitScore(const Address& caller, uint64_t hackathonId, uint64_t submissionId,
                             const fhe::ExternalInput& encryptedScore);
    Result<void> grantJudgeAccess(const Address& caller, uint64_t hackathonId);
    Result<void> calculateWinners(const Address& caller, uint64_t hackathonId);
    Result<void> submitDecryptedScores(const Address& caller, uint64_t hackathonId,
                                       const std::vector<uint64_t>& clearScores,
                                       const std::vector<uint8_t>& decryptionProof);

    Result<HackathonDetails> getHackathonDetails(uint64_t hackathonId) const;
    Result<Participant> getParticipant(uint64_t hackathonId, const Address& account) const;
    Result<std::vector<Address>> getParticipantList(uint64_t hackathonId) const;
    Result<uint32_t> getSubmissionCount(uint64_t hackathonId) const;
    Result<SubmissionInfo> getSubmission(uint64_t hackathonId, uint64_t submissionId) const;
    Result<std::vector<Winner>> getWinners(uint64_t hackathonId) const;
    Result<DecryptedScore> getDecryptedScore(uint64_t hackathonId, uint64_t submissionId) const;
    Result<bool> isJudge(uint64_t hackathonId, const Address& account) const;
    Result<bool> isWinnersFinalized(uint64_t hackathonId) const;
    uint64_t getTotalHackathonCount() const;

    Result<CiphertextHandle> getAggregateScoreHandle(uint64_t hackathonId, uint64_t submissionId) const;
    Result<CiphertextHandle> getEncryptedReference(const Address& caller, uint64_t hackathonId,
                                                   uint64_t submissionId) const;
    // Visible to the judge who wrote it and to the submitter.
    Result<CiphertextHandle> getScoreHandle(const Address& caller, uint64_t hackathonId,
                                            uint64_t submissionId, const Address& judge) const;
    std::vector<ContractEvent> getEvents(uint64_t fromSequence, size_t limit) const;

    EventBus& events();
    const Address& address() const;
    const ContractLimits& limits() const;
    uint64_t now() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
