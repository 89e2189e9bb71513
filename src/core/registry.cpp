#include "core/registry.h"
#include "core/scoring.h"
#include <set>

namespace zackathon {
namespace core {

Result<void> Registry::validateConfig(const HackathonConfig& config, const Address& organizer,
                                      uint64_t now, const ContractLimits& limits) {
    if (config.name.empty()) {
        return makeError(ErrorCode::INVALID_CONFIG, "Name required");
    }
    if (config.submissionDeadline <= now) {
        return makeError(ErrorCode::INVALID_CONFIG, "Invalid submission deadline");
    }
    if (config.judgingDeadline <= config.submissionDeadline) {
        return makeError(ErrorCode::INVALID_CONFIG, "Invalid judging deadline");
    }
    if (config.judges.empty()) {
        return makeError(ErrorCode::INVALID_CONFIG, "At least one judge required");
    }
    if (config.judges.size() > limits.maxJudges) {
        return makeError(ErrorCode::INVALID_CONFIG,
                         "Too many judges (max " + std::to_string(limits.maxJudges) + ")");
    }

    std::set<Address> seen;
    for (const auto& judge : config.judges) {
        if (judge.isZero()) {
            return makeError(ErrorCode::INVALID_CONFIG, "Invalid judge address");
        }
        if (judge == organizer) {
            return makeError(ErrorCode::INVALID_CONFIG, "Organizer cannot be judge");
        }
        if (!seen.insert(judge).second) {
            return makeError(ErrorCode::INVALID_CONFIG, "Duplicate judge");
        }
    }
    return {};
}

HackathonRecord Registry::create(uint64_t id, const HackathonConfig& config,
                                 const Address& organizer, uint64_t now) {
    HackathonRecord record;
    record.id = id;
    record.organizer = organizer;
    record.config = config;
    record.phase = Phase::REGISTRATION_OPEN;
    record.createdAt = now;
    return record;
}

Result<void> Registry::grantJudgeAccess(HackathonRecord& record, const OperationContext& ctx) {
    if (ctx.caller != record.organizer) ZACKATHON_FAIL(ErrorCode::NOT_ORGANIZER);
    if (ctx.now < record.config.submissionDeadline) ZACKATHON_FAIL(ErrorCode::TOO_EARLY);
    if (record.judgeAccessGranted) ZACKATHON_FAIL(ErrorCode::ACCESS_ALREADY_GRANTED);
    if (record.submissionCount == 0) ZACKATHON_FAIL(ErrorCode::NO_SUBMISSIONS);
    if (!canAdvance(record.phase, Phase::JUDGING)) ZACKATHON_FAIL(ErrorCode::INVALID_PHASE);

    for (const auto& submission : record.submissions) {
        for (const auto& judge : record.config.judges) {
            if (!ctx.encryption.grantAccess(submission.encryptedReference, judge)) {
                return makeError(ErrorCode::ENCRYPTION_SERVICE_ERROR,
                                 "Grant failed for submission " + std::to_string(submission.id));
            }
        }
        if (!ctx.encryption.grantAccess(submission.encryptedReference, ctx.contract)) {
            return makeError(ErrorCode::ENCRYPTION_SERVICE_ERROR,
                             "Grant failed for submission " + std::to_string(submission.id));
        }
    }

    record.judgeAccessGranted = true;
    return advancePhase(record.phase, Phase::JUDGING);
}

Result<void> Registry::calculateWinners(HackathonRecord& record, const OperationContext& ctx) {
    if (ctx.caller != record.organizer) ZACKATHON_FAIL(ErrorCode::NOT_ORGANIZER);
    if (record.submissionCount == 0) ZACKATHON_FAIL(ErrorCode::NO_SUBMISSIONS);
    if (record.phase != Phase::JUDGING) ZACKATHON_FAIL(ErrorCode::INVALID_PHASE);
    if (ctx.now < record.config.judgingDeadline) ZACKATHON_FAIL(ErrorCode::TOO_EARLY);

    auto missing = ScoringEngine::findMissingScore(record);
    if (missing) {
        return makeError(ErrorCode::INCOMPLETE_SCORING,
                         std::string(errorToString(ErrorCode::INCOMPLETE_SCORING)) +
                         " (submission " + std::to_string(missing->first) + ")");
    }

    auto sums = ScoringEngine::aggregate(record, ctx);
    if (!sums.ok()) return sums.error();

    for (const auto& handle : sums.value()) {
        if (!ctx.encryption.markPubliclyDecryptable(handle, ctx.contract)) {
            return makeError(ErrorCode::ENCRYPTION_SERVICE_ERROR, "Cannot publish aggregate score");
        }
    }

    record.aggregateScores = sums.value();
    return advancePhase(record.phase, Phase::COMPLETED);
}

}
}
