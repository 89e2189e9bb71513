#pragma once

#include "crypto/address.h"
#include "fhe/encrypted_value.h"
#include "infrastructure/error_handling.h"
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace zackathon {
namespace core {

using crypto::Address;
using fhe::CiphertextHandle;

enum class Phase : uint8_t {
    REGISTRATION_OPEN = 0,
    SUBMISSIONS_OPEN = 1,
    JUDGING = 2,
    COMPLETED = 3
};

const char* phaseToString(Phase phase);
// Phases only move forward; any later phase is a legal target.
bool canAdvance(Phase from, Phase to);
Result<void> advancePhase(Phase& phase, Phase to);

// JUDGED means at least one judge has scored, not that every judge has.
enum class SubmissionStatus : uint8_t {
    PENDING = 0,
    JUDGED = 1
};

const char* statusToString(SubmissionStatus status);

struct HackathonConfig {
    std::string name;
    std::string description;
    std::string prizeDetails;
    uint64_t submissionDeadline = 0;
    uint64_t judgingDeadline = 0;
    uint32_t maxParticipants = 0;
    std::vector<Address> judges;
};

struct RegistrationInfo {
    std::string email;
    std::string discordHandle;
    std::string twitterHandle;
    std::string teamName;
    std::vector<Address> teamMembers;
};

struct Participant {
    Address wallet;
    RegistrationInfo info;
    uint64_t registrationTime = 0;
    bool hasSubmitted = false;
};

struct Submission {
    uint64_t id = 0;
    Address participant;
    CiphertextHandle encryptedReference;
    uint64_t submissionTime = 0;
    SubmissionStatus status = SubmissionStatus::PENDING;
    uint32_t judgeCount = 0;
};

// Public projection of a submission; never carries the encrypted reference.
struct SubmissionInfo {
    uint64_t id = 0;
    Address participant;
    uint64_t submissionTime = 0;
    SubmissionStatus status = SubmissionStatus::PENDING;
    uint32_t judgeCount = 0;
};

struct DecryptedScore {
    uint64_t score = 0;
    bool isDecrypted = false;
};

struct Winner {
    Address participant;
    uint8_t ranking = 0;
    uint64_t finalScore = 0;
    uint64_t submissionId = 0;
};

struct HackathonDetails {
    uint64_t id = 0;
    std::string name;
    std::string description;
    std::string prizeDetails;
    uint64_t submissionDeadline = 0;
    uint64_t judgingDeadline = 0;
    uint32_t maxParticipants = 0;
    Address organizer;
    std::vector<Address> judges;
    Phase phase = Phase::REGISTRATION_OPEN;
    uint32_t participantCount = 0;
    uint32_t submissionCount = 0;
    bool judgeAccessGranted = false;
    bool winnersFinalized = false;
    uint64_t createdAt = 0;
};

using ScoreKey = std::pair<uint64_t, Address>;

// Everything one hackathon owns. Records are never removed once created.
struct HackathonRecord {
    uint64_t id = 0;
    Address organizer;
    HackathonConfig config;
    Phase phase = Phase::REGISTRATION_OPEN;
    uint32_t participantCount = 0;
    uint32_t submissionCount = 0;
    bool judgeAccessGranted = false;
    bool winnersFinalized = false;
    uint64_t createdAt = 0;

    std::vector<Address> participantList;
    std::map<Address, Participant> participants;
    std::vector<Submission> submissions;
    std::map<ScoreKey, CiphertextHandle> scores;
    std::vector<CiphertextHandle> aggregateScores;
    std::vector<DecryptedScore> decryptedScores;
    std::vector<Winner> winners;

    bool isJudge(const Address& account) const;
    const Participant* findParticipant(const Address& account) const;
    bool hasScore(uint64_t submissionId, const Address& judge) const;
    HackathonDetails details() const;
    SubmissionInfo submissionInfo(uint64_t submissionId) const;

    std::vector<uint8_t> serialize() const;
    // Throws std::runtime_error on truncated or malformed input.
    static HackathonRecord deserialize(const std::vector<uint8_t>& data);
};

}
}
