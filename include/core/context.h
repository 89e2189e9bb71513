#pragma once

#include "crypto/address.h"
#include "fhe/encrypted_value.h"
#include "infrastructure/error_handling.h"
#include <cstdint>

namespace zackathon {
namespace utils { class Config; }

namespace core {

// Width of an individual judge score and of the per-submission accumulator.
constexpr fhe::ValueWidth SCORE_WIDTH = fhe::ValueWidth::U16;
constexpr fhe::ValueWidth AGGREGATE_WIDTH = fhe::ValueWidth::U32;
constexpr fhe::ValueWidth REFERENCE_WIDTH = fhe::ValueWidth::U256;

// Bounds on the O(submissions x judges) loops and on the aggregate range.
struct ContractLimits {
    uint32_t maxJudges = 64;
    uint32_t maxSubmissions = 1024;   // 0 = unlimited
    uint32_t maxScorePerJudge = 50;

    // Rejects limits whose worst-case aggregate overflows the accumulator.
    Result<void> validate() const;
    static Result<ContractLimits> fromConfig(const utils::Config& config);
};

// Inputs shared by every state-changing component call.
struct OperationContext {
    fhe::EncryptedValueService& encryption;
    const crypto::Address& contract;
    const crypto::Address& caller;
    uint64_t now;
    const ContractLimits& limits;
};

}
}
