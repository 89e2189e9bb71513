#include "core/scoring.h"

namespace zackathon {
namespace core {

Result<void> ScoringEngine::submitScore(HackathonRecord& record, const OperationContext& ctx,
                                        uint64_t submissionId, const fhe::ExternalInput& encryptedScore) {
    if (!record.isJudge(ctx.caller)) ZACKATHON_FAIL(ErrorCode::NOT_JUDGE);
    if (!record.judgeAccessGranted) ZACKATHON_FAIL(ErrorCode::ACCESS_NOT_GRANTED);
    if (ctx.now < record.config.submissionDeadline || ctx.now >= record.config.judgingDeadline) {
        ZACKATHON_FAIL(ErrorCode::OUT_OF_WINDOW);
    }
    if (submissionId >= record.submissions.size()) ZACKATHON_FAIL(ErrorCode::INVALID_SUBMISSION);
    if (record.hasScore(submissionId, ctx.caller)) ZACKATHON_FAIL(ErrorCode::ALREADY_SCORED);
    if (record.phase != Phase::JUDGING) ZACKATHON_FAIL(ErrorCode::INVALID_PHASE);

    auto handle = ctx.encryption.verifyProofAndImport(encryptedScore, SCORE_WIDTH, ctx.contract, ctx.caller);
    if (!handle) ZACKATHON_FAIL(ErrorCode::INVALID_PROOF);

    Submission& submission = record.submissions[submissionId];
    if (!ctx.encryption.grantAccess(*handle, ctx.contract) ||
        !ctx.encryption.grantAccess(*handle, submission.participant)) {
        return makeError(ErrorCode::ENCRYPTION_SERVICE_ERROR, "Cannot grant access to score");
    }

    record.scores[ScoreKey(submissionId, ctx.caller)] = *handle;
    submission.judgeCount++;
    submission.status = SubmissionStatus::JUDGED;
    return {};
}

std::optional<ScoreKey> ScoringEngine::findMissingScore(const HackathonRecord& record) {
    for (const auto& submission : record.submissions) {
        for (const auto& judge : record.config.judges) {
            if (!record.hasScore(submission.id, judge)) return ScoreKey(submission.id, judge);
        }
    }
    return std::nullopt;
}

Result<std::vector<CiphertextHandle>> ScoringEngine::aggregate(const HackathonRecord& record,
                                                               const OperationContext& ctx) {
    std::vector<CiphertextHandle> sums;
    sums.reserve(record.submissions.size());

    for (const auto& submission : record.submissions) {
        std::optional<CiphertextHandle> acc;
        for (const auto& judge : record.config.judges) {
            auto it = record.scores.find(ScoreKey(submission.id, judge));
            if (it == record.scores.end()) ZACKATHON_FAIL(ErrorCode::INCOMPLETE_SCORING);

            auto wide = ctx.encryption.widen(it->second, AGGREGATE_WIDTH, ctx.contract);
            if (!wide) {
                return makeError(ErrorCode::ENCRYPTION_SERVICE_ERROR, "Cannot widen score");
            }
            if (!acc) {
                acc = wide;
                continue;
            }
            auto sum = ctx.encryption.add(*acc, *wide, ctx.contract);
            if (!sum) {
                return makeError(ErrorCode::ENCRYPTION_SERVICE_ERROR, "Cannot add scores");
            }
            acc = sum;
        }
        if (!acc) ZACKATHON_FAIL(ErrorCode::INCOMPLETE_SCORING);
        sums.push_back(*acc);
    }
    return sums;
}

}
}
