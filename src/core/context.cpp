#include "core/context.h"
#include "utils/config.h"
#include <limits>

namespace zackathon {
namespace core {

Result<void> ContractLimits::validate() const {
    if (maxJudges == 0) {
        return makeError(ErrorCode::INVALID_CONFIG, "hackathon.max_judges must be at least 1");
    }
    uint64_t scoreCeiling = (1ULL << fhe::widthBits(SCORE_WIDTH)) - 1;
    if (maxScorePerJudge == 0 || maxScorePerJudge > scoreCeiling) {
        return makeError(ErrorCode::INVALID_CONFIG, "scoring.max_score_per_judge out of range");
    }
    uint64_t worst = static_cast<uint64_t>(maxScorePerJudge) * maxJudges;
    // Scores are encrypted, so the rubric bound cannot be enforced; the
    // accumulator must also hold maxJudges full-width scores.
    uint64_t unchecked = scoreCeiling * maxJudges;
    if (worst > std::numeric_limits<uint32_t>::max() ||
        unchecked > std::numeric_limits<uint32_t>::max()) {
        return makeError(ErrorCode::INVALID_CONFIG, "Aggregate score would overflow 32 bits");
    }
    return {};
}

Result<ContractLimits> ContractLimits::fromConfig(const utils::Config& config) {
    utils::ScoringConfig scoring = config.getScoringConfig();
    ContractLimits limits;
    limits.maxJudges = scoring.maxJudges;
    limits.maxSubmissions = scoring.maxSubmissions;
    limits.maxScorePerJudge = scoring.maxScorePerJudge;
    auto check = limits.validate();
    if (!check.ok()) return check.error();
    return limits;
}

}
}
