#pragma once

#include "core/context.h"
#include "core/hackathon.h"

namespace zackathon {
namespace core {

// Hackathon lifecycle: creation and the two organizer-driven transitions.
class Registry {
public:
    static Result<void> validateConfig(const HackathonConfig& config, const Address& organizer,
                                       uint64_t now, const ContractLimits& limits);
    static HackathonRecord create(uint64_t id, const HackathonConfig& config,
                                  const Address& organizer, uint64_t now);

    // SubmissionsOpen -> Judging. Reveals every submission reference to every
    // judge and lets the contract operate on it.
    static Result<void> grantJudgeAccess(HackathonRecord& record, const OperationContext& ctx);

    // Judging -> Completed. Sums each submission's scores and publishes the
    // sums for public decryption.
    static Result<void> calculateWinners(HackathonRecord& record, const OperationContext& ctx);
};

}
}
