#pragma once

#include "core/contract.h"
#include "utils/config.h"
#include <functional>
#include <vector>

namespace zackathon {
namespace client {

struct DecryptedAggregates {
    std::vector<fhe::CiphertextHandle> handles;
    std::vector<uint64_t> scores;        // index = submission id
    std::vector<uint8_t> proof;
};

// Organizer-side finalization: after calculateWinners has marked every
// aggregate publicly decryptable, fetch the handles, wait for the service to
// accept them, decrypt them in one batch and submit the clear scores.
class DecryptionWorkflow {
public:
    using SleepFn = std::function<void(uint32_t milliseconds)>;

    DecryptionWorkflow(core::HackathonContract& contract,
                       fhe::EncryptedValueService& service,
                       const crypto::Address& organizer,
                       const utils::DecryptConfig& config = utils::DecryptConfig(),
                       SleepFn sleep = nullptr);

    Result<DecryptedAggregates> decrypt(uint64_t hackathonId) const;
    // decrypt() followed by submitDecryptedScores as the organizer.
    Result<std::vector<uint64_t>> run(uint64_t hackathonId);

private:
    Result<void> waitUntilDecryptable(const fhe::CiphertextHandle& handle) const;

    core::HackathonContract& contract_;
    fhe::EncryptedValueService& service_;
    crypto::Address organizer_;
    utils::DecryptConfig config_;
    SleepFn sleep_;
};

}
}
