#include "client/score_rubric.h"

namespace zackathon {
namespace client {

namespace {

struct Criterion {
    const char* name;
    uint32_t ScoreRubric::*mark;
};

const Criterion CRITERIA_FIELDS[] = {
    {"innovation", &ScoreRubric::innovation},
    {"technical", &ScoreRubric::technical},
    {"ux", &ScoreRubric::ux},
    {"completeness", &ScoreRubric::completeness},
    {"documentation", &ScoreRubric::documentation},
};

}

uint32_t ScoreRubric::total() const {
    uint32_t sum = 0;
    for (const auto& c : CRITERIA_FIELDS) sum += this->*c.mark;
    return sum;
}

Result<uint32_t> ScoreRubric::validate(uint32_t maxScorePerJudge) const {
    for (const auto& c : CRITERIA_FIELDS) {
        uint32_t mark = this->*c.mark;
        if (mark < MIN_MARK || mark > MAX_MARK) {
            return makeError(ErrorCode::INVALID_INPUT,
                             std::string(c.name) + " must be between 1 and 10, got " + std::to_string(mark));
        }
    }
    uint32_t sum = total();
    if (sum > maxScorePerJudge) {
        return makeError(ErrorCode::INVALID_INPUT,
                         "Total " + std::to_string(sum) + " exceeds the per-judge maximum of " +
                         std::to_string(maxScorePerJudge));
    }
    return sum;
}

Result<fhe::ExternalInput> ScoreRubric::encrypt(fhe::EncryptedValueService& service,
                                                const crypto::Address& contract,
                                                const crypto::Address& judge,
                                                uint32_t maxScorePerJudge) const {
    auto sum = validate(maxScorePerJudge);
    if (!sum.ok()) return sum.error();
    return service.encryptUint(sum.value(), fhe::ValueWidth::U16, contract, judge);
}

Result<ScoreRubric> ScoreRubric::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) return makeError(ErrorCode::INVALID_INPUT, "Rubric must be an object");
    ScoreRubric rubric;
    for (const auto& c : CRITERIA_FIELDS) {
        auto it = j.find(c.name);
        if (it == j.end() || !it->is_number_integer() || it->get<int64_t>() < 0 ||
            it->get<int64_t>() > MAX_MARK) {
            return makeError(ErrorCode::INVALID_INPUT, std::string("Missing or invalid mark '") + c.name + "'");
        }
        rubric.*c.mark = static_cast<uint32_t>(it->get<int64_t>());
    }
    return rubric;
}

}
}
