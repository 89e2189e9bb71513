#include "core/submission_store.h"

namespace zackathon {
namespace core {

Result<uint64_t> SubmissionStore::submit(HackathonRecord& record, const OperationContext& ctx,
                                         const fhe::ExternalInput& encryptedReference) {
    const Participant* participant = record.findParticipant(ctx.caller);
    if (!participant) ZACKATHON_FAIL(ErrorCode::NOT_REGISTERED);
    if (participant->hasSubmitted) ZACKATHON_FAIL(ErrorCode::ALREADY_SUBMITTED);
    if (ctx.now >= record.config.submissionDeadline) ZACKATHON_FAIL(ErrorCode::DEADLINE_PASSED);
    if (record.phase != Phase::SUBMISSIONS_OPEN) ZACKATHON_FAIL(ErrorCode::INVALID_PHASE);
    if (ctx.limits.maxSubmissions > 0 && record.submissionCount >= ctx.limits.maxSubmissions) {
        return makeError(ErrorCode::CAPACITY_REACHED, "Max submissions reached");
    }

    auto handle = ctx.encryption.verifyProofAndImport(encryptedReference, REFERENCE_WIDTH,
                                                      ctx.contract, ctx.caller);
    if (!handle) ZACKATHON_FAIL(ErrorCode::INVALID_PROOF);
    if (!ctx.encryption.grantAccess(*handle, ctx.contract) ||
        !ctx.encryption.grantAccess(*handle, ctx.caller)) {
        return makeError(ErrorCode::ENCRYPTION_SERVICE_ERROR, "Cannot grant access to submission");
    }

    Submission submission;
    submission.id = record.submissions.size();
    submission.participant = ctx.caller;
    submission.encryptedReference = *handle;
    submission.submissionTime = ctx.now;
    submission.status = SubmissionStatus::PENDING;
    submission.judgeCount = 0;

    record.submissions.push_back(submission);
    record.participants[ctx.caller].hasSubmitted = true;
    record.submissionCount++;
    return submission.id;
}

Result<CiphertextHandle> SubmissionStore::encryptedReference(const HackathonRecord& record, const Address& caller,
                                                             uint64_t submissionId) {
    if (!record.isJudge(caller)) ZACKATHON_FAIL(ErrorCode::NOT_JUDGE);
    if (!record.judgeAccessGranted) ZACKATHON_FAIL(ErrorCode::ACCESS_NOT_GRANTED);
    if (submissionId >= record.submissions.size()) ZACKATHON_FAIL(ErrorCode::INVALID_SUBMISSION);
    return record.submissions[submissionId].encryptedReference;
}

}
}
