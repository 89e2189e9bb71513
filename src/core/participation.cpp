#include "core/participation.h"

namespace zackathon {
namespace core {

Result<void> ParticipationLedger::registerParticipant(HackathonRecord& record, const OperationContext& ctx,
                                                      const RegistrationInfo& info) {
    if (ctx.now >= record.config.submissionDeadline) ZACKATHON_FAIL(ErrorCode::DEADLINE_PASSED);
    if (record.phase != Phase::REGISTRATION_OPEN && record.phase != Phase::SUBMISSIONS_OPEN) {
        ZACKATHON_FAIL(ErrorCode::INVALID_PHASE);
    }
    if (record.findParticipant(ctx.caller)) ZACKATHON_FAIL(ErrorCode::ALREADY_REGISTERED);
    if (record.isJudge(ctx.caller)) ZACKATHON_FAIL(ErrorCode::JUDGE_CANNOT_PARTICIPATE);
    if (info.email.empty()) return makeError(ErrorCode::INVALID_INPUT, "Email required");
    if (record.config.maxParticipants > 0 &&
        record.participantCount >= record.config.maxParticipants) {
        ZACKATHON_FAIL(ErrorCode::CAPACITY_REACHED);
    }

    Participant participant;
    participant.wallet = ctx.caller;
    participant.info = info;
    participant.registrationTime = ctx.now;
    participant.hasSubmitted = false;

    record.participants[ctx.caller] = participant;
    record.participantList.push_back(ctx.caller);
    record.participantCount++;

    if (record.phase == Phase::REGISTRATION_OPEN) {
        return advancePhase(record.phase, Phase::SUBMISSIONS_OPEN);
    }
    return {};
}

}
}
