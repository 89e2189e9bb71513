#pragma once

#include "fhe/encrypted_value.h"
#include "infrastructure/error_handling.h"
#include <nlohmann/json.hpp>
#include <cstdint>

namespace zackathon {
namespace client {

// A judge's marks for one submission. The contract only ever sees the
// encrypted total.
struct ScoreRubric {
    static constexpr uint32_t MIN_MARK = 1;
    static constexpr uint32_t MAX_MARK = 10;
    static constexpr uint32_t CRITERIA = 5;

    uint32_t innovation = 0;
    uint32_t technical = 0;
    uint32_t ux = 0;
    uint32_t completeness = 0;
    uint32_t documentation = 0;

    uint32_t total() const;

    // Each mark in [MIN_MARK, MAX_MARK] and the total within the per-judge cap.
    Result<uint32_t> validate(uint32_t maxScorePerJudge) const;

    Result<fhe::ExternalInput> encrypt(fhe::EncryptedValueService& service,
                                       const crypto::Address& contract,
                                       const crypto::Address& judge,
                                       uint32_t maxScorePerJudge) const;

    static Result<ScoreRubric> fromJson(const nlohmann::json& j);
};

}
}
