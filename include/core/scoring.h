#pragma once

#include "core/context.h"
#include "core/hackathon.h"
#include <optional>
#include <vector>

namespace zackathon {
namespace core {

class ScoringEngine {
public:
    static Result<void> submitScore(HackathonRecord& record, const OperationContext& ctx,
                                    uint64_t submissionId, const fhe::ExternalInput& encryptedScore);

    // First (submission, judge) pair without a score, scanning submissions
    // in index order and judges in list order. O(submissions x judges).
    static std::optional<ScoreKey> findMissingScore(const HackathonRecord& record);

    // Homomorphic per-submission sums at AGGREGATE_WIDTH, added in judge list
    // order. Requires every score to be present.
    static Result<std::vector<CiphertextHandle>> aggregate(const HackathonRecord& record,
                                                           const OperationContext& ctx);
};

}
}
