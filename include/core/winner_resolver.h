#pragma once

#include "core/context.h"
#include "core/hackathon.h"
#include <vector>

namespace zackathon {
namespace core {

struct RankedScore {
    uint64_t submissionId = 0;
    uint64_t score = 0;
};

// Cascading top-3 scan with strict '>' comparisons: among equal scores the
// lower submission index keeps the higher rank. Returns min(3, n) entries.
std::vector<RankedScore> rankTopThree(const std::vector<uint64_t>& clearScores);

class WinnerResolver {
public:
    // Verifies the decryption proof over the aggregate handles, records the
    // clear scores and replaces the winner list. Callable once per hackathon.
    static Result<void> submitDecryptedScores(HackathonRecord& record, const OperationContext& ctx,
                                              const std::vector<uint64_t>& clearScores,
                                              const std::vector<uint8_t>& decryptionProof);
};

}
}
