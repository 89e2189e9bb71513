#pragma once

#include "core/context.h"
#include "core/hackathon.h"

namespace zackathon {
namespace core {

class ParticipationLedger {
public:
    // Registers ctx.caller. The first registration opens submissions.
    static Result<void> registerParticipant(HackathonRecord& record, const OperationContext& ctx,
                                            const RegistrationInfo& info);
};

}
}
