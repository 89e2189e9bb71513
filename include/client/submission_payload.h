#pragma once

#include "infrastructure/error_handling.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace zackathon {
namespace client {

// The off-chain document a participant publishes; its content identifier is
// what gets encrypted as the submission reference.
struct SubmissionPayload {
    static constexpr const char* FORMAT_VERSION = "1.0";

    std::string projectName;
    std::string description;
    std::string githubRepo;
    std::string liveDemo;
    std::string videoDemo;
    std::vector<std::string> techStack;
    std::string additionalNotes;
    std::string timestamp;      // ISO-8601 UTC, set by prepare()
    std::string version;

    // Trims every text field and stamps the time and format version.
    // Fails when the project name or description is blank.
    static Result<SubmissionPayload> prepare(const SubmissionPayload& draft, uint64_t now);

    // Form-level checks; an empty list means the draft may be published.
    static std::vector<std::string> validate(const SubmissionPayload& draft);

    nlohmann::json toJson() const;
    static Result<SubmissionPayload> fromJson(const std::string& body);
};

bool isValidUrl(const std::string& url);

}
}
