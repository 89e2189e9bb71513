#include "client/decryption_workflow.h"
#include "utils/logger.h"
#include <chrono>
#include <thread>

namespace zackathon {
namespace client {

DecryptionWorkflow::DecryptionWorkflow(core::HackathonContract& contract,
                                       fhe::EncryptedValueService& service,
                                       const crypto::Address& organizer,
                                       const utils::DecryptConfig& config,
                                       SleepFn sleep)
    : contract_(contract), service_(service), organizer_(organizer), config_(config),
      sleep_(std::move(sleep)) {
    if (!sleep_) {
        sleep_ = [](uint32_t ms) { std::this_thread::sleep_for(std::chrono::milliseconds(ms)); };
    }
}

Result<void> DecryptionWorkflow::waitUntilDecryptable(const fhe::CiphertextHandle& handle) const {
    uint32_t attempts = config_.pollAttempts > 0 ? config_.pollAttempts : 1;
    for (uint32_t attempt = 1; attempt <= attempts; attempt++) {
        if (service_.isPubliclyDecryptable(handle)) return {};
        if (attempt < attempts) {
            LOG_DEBUG("Aggregate not decryptable yet, attempt " + std::to_string(attempt) + "/" +
                      std::to_string(attempts));
            sleep_(config_.pollDelayMs);
        }
    }
    return makeError(ErrorCode::ENCRYPTION_SERVICE_ERROR,
                     "Aggregate not publicly decryptable after " + std::to_string(attempts) + " attempts");
}

Result<DecryptedAggregates> DecryptionWorkflow::decrypt(uint64_t hackathonId) const {
    auto count = contract_.getSubmissionCount(hackathonId);
    if (!count.ok()) return count.error();
    if (count.value() == 0) ZACKATHON_FAIL(ErrorCode::NO_SUBMISSIONS);

    DecryptedAggregates out;
    for (uint64_t i = 0; i < count.value(); i++) {
        auto handle = contract_.getAggregateScoreHandle(hackathonId, i);
        if (!handle.ok()) return handle.error();
        out.handles.push_back(handle.value());
    }

    for (const auto& h : out.handles) {
        auto ready = waitUntilDecryptable(h);
        if (!ready.ok()) return ready.error();
    }

    auto decrypted = service_.publicDecrypt(out.handles);
    if (!decrypted) {
        return makeError(ErrorCode::ENCRYPTION_SERVICE_ERROR, "Public decryption refused");
    }
    if (decrypted->clearValues.size() != out.handles.size()) {
        return makeError(ErrorCode::ENCRYPTION_SERVICE_ERROR,
                         "Expected " + std::to_string(out.handles.size()) + " clear values, got " +
                         std::to_string(decrypted->clearValues.size()));
    }
    if (decrypted->proof.empty()) {
        return makeError(ErrorCode::ENCRYPTION_SERVICE_ERROR, "Decryption proof missing");
    }

    for (const auto& h : out.handles) {
        auto it = decrypted->clearValues.find(h);
        if (it == decrypted->clearValues.end()) {
            return makeError(ErrorCode::ENCRYPTION_SERVICE_ERROR, "No clear value for " + h.toHex());
        }
        uint64_t score = 0;
        if (!utils::wordToUint64(it->second, score)) {
            return makeError(ErrorCode::ENCRYPTION_SERVICE_ERROR, "Clear value exceeds 64 bits");
        }
        out.scores.push_back(score);
    }
    out.proof = std::move(decrypted->proof);
    return out;
}

Result<std::vector<uint64_t>> DecryptionWorkflow::run(uint64_t hackathonId) {
    auto decrypted = decrypt(hackathonId);
    if (!decrypted.ok()) {
        LOG_WARN("Decryption of hackathon " + std::to_string(hackathonId) + " failed: " +
                 decrypted.error().message);
        return decrypted.error();
    }

    const DecryptedAggregates& batch = decrypted.value();
    auto submitted = contract_.submitDecryptedScores(organizer_, hackathonId, batch.scores, batch.proof);
    if (!submitted.ok()) return submitted.error();

    LOG_INFO("Submitted " + std::to_string(batch.scores.size()) + " decrypted scores for hackathon " +
             std::to_string(hackathonId));
    return batch.scores;
}

}
}
