#include "core/winner_resolver.h"
#include "utils/serialize.h"

namespace zackathon {
namespace core {

namespace {

struct Slot {
    bool filled = false;
    RankedScore entry;

    bool beatenBy(uint64_t score) const { return !filled || score > entry.score; }
};

}

std::vector<RankedScore> rankTopThree(const std::vector<uint64_t>& clearScores) {
    Slot first, second, third;

    for (size_t i = 0; i < clearScores.size(); i++) {
        Slot candidate;
        candidate.filled = true;
        candidate.entry.submissionId = i;
        candidate.entry.score = clearScores[i];

        if (first.beatenBy(clearScores[i])) {
            third = second;
            second = first;
            first = candidate;
        } else if (second.beatenBy(clearScores[i])) {
            third = second;
            second = candidate;
        } else if (third.beatenBy(clearScores[i])) {
            third = candidate;
        }
    }

    std::vector<RankedScore> ranked;
    for (const Slot* slot : {&first, &second, &third}) {
        if (slot->filled) ranked.push_back(slot->entry);
    }
    return ranked;
}

Result<void> WinnerResolver::submitDecryptedScores(HackathonRecord& record, const OperationContext& ctx,
                                                   const std::vector<uint64_t>& clearScores,
                                                   const std::vector<uint8_t>& decryptionProof) {
    if (ctx.caller != record.organizer) ZACKATHON_FAIL(ErrorCode::NOT_ORGANIZER);
    if (record.phase != Phase::COMPLETED) ZACKATHON_FAIL(ErrorCode::INVALID_PHASE);
    if (record.winnersFinalized) ZACKATHON_FAIL(ErrorCode::ALREADY_FINALIZED);
    if (clearScores.size() != record.submissionCount) ZACKATHON_FAIL(ErrorCode::SCORE_COUNT_MISMATCH);
    if (record.aggregateScores.size() != record.submissionCount) {
        return makeError(ErrorCode::INTERNAL_ERROR, "Aggregate scores missing");
    }

    std::vector<uint8_t> encoded = utils::abiEncodeUints(clearScores);
    if (!ctx.encryption.verifySignatures(record.aggregateScores, encoded, decryptionProof)) {
        ZACKATHON_FAIL(ErrorCode::INVALID_DECRYPTION_PROOF);
    }

    std::vector<DecryptedScore> decrypted;
    decrypted.reserve(clearScores.size());
    for (uint64_t score : clearScores) {
        DecryptedScore d;
        d.score = score;
        d.isDecrypted = true;
        decrypted.push_back(d);
    }

    std::vector<Winner> winners;
    uint8_t rank = 1;
    for (const auto& r : rankTopThree(clearScores)) {
        Winner w;
        w.participant = record.submissions[r.submissionId].participant;
        w.ranking = rank++;
        w.finalScore = r.score;
        w.submissionId = r.submissionId;
        winners.push_back(w);
    }

    record.decryptedScores = std::move(decrypted);
    record.winners = std::move(winners);
    record.winnersFinalized = true;
    return {};
}

}
}
