#include "client/submission_payload.h"
#include "utils/logger.h"
#include <cctype>
#include <ctime>

namespace zackathon {
namespace client {

using json = nlohmann::json;

namespace {

const size_t MIN_NAME_LENGTH = 3;
const size_t MIN_DESCRIPTION_LENGTH = 50;

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string isoTime(uint64_t now) {
    time_t t = static_cast<time_t>(now);
    std::tm tmBuf{};
    gmtime_r(&t, &tmBuf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S.000Z", &tmBuf);
    return buf;
}

std::string optText(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return "";
    return it->get<std::string>();
}

}

bool isValidUrl(const std::string& url) {
    auto sep = url.find("://");
    if (sep == std::string::npos || sep == 0) return false;
    if (!std::isalpha(static_cast<unsigned char>(url[0]))) return false;
    for (size_t i = 0; i < sep; i++) {
        char c = url[i];
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') return false;
    }
    std::string rest = url.substr(sep + 3);
    std::string host = rest.substr(0, rest.find_first_of("/?#"));
    if (host.empty()) return false;
    for (char c : host) {
        if (std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

Result<SubmissionPayload> SubmissionPayload::prepare(const SubmissionPayload& draft, uint64_t now) {
    SubmissionPayload p;
    p.projectName = trim(draft.projectName);
    p.description = trim(draft.description);
    if (p.projectName.empty() || p.description.empty()) {
        return makeError(ErrorCode::INVALID_INPUT, "Project name and description are required");
    }
    p.githubRepo = trim(draft.githubRepo);
    p.liveDemo = trim(draft.liveDemo);
    p.videoDemo = trim(draft.videoDemo);
    p.techStack = draft.techStack;
    p.additionalNotes = trim(draft.additionalNotes);
    p.timestamp = isoTime(now);
    p.version = FORMAT_VERSION;

    LOG_DEBUG("Prepared submission payload for " + p.projectName + " (" +
              std::to_string(p.techStack.size()) + " technologies)");
    return p;
}

std::vector<std::string> SubmissionPayload::validate(const SubmissionPayload& draft) {
    std::vector<std::string> errors;
    if (trim(draft.projectName).size() < MIN_NAME_LENGTH) {
        errors.push_back("Project name must be at least 3 characters");
    }
    if (trim(draft.description).size() < MIN_DESCRIPTION_LENGTH) {
        errors.push_back("Description must be at least 50 characters");
    }
    if (!trim(draft.githubRepo).empty() && !isValidUrl(trim(draft.githubRepo))) {
        errors.push_back("Invalid GitHub repository URL");
    }
    if (!trim(draft.liveDemo).empty() && !isValidUrl(trim(draft.liveDemo))) {
        errors.push_back("Invalid live demo URL");
    }
    if (!trim(draft.videoDemo).empty() && !isValidUrl(trim(draft.videoDemo))) {
        errors.push_back("Invalid video demo URL");
    }
    if (draft.techStack.empty()) {
        errors.push_back("At least one technology must be specified");
    }
    return errors;
}

json SubmissionPayload::toJson() const {
    return {
        {"projectName", projectName},
        {"description", description},
        {"githubRepo", githubRepo},
        {"liveDemo", liveDemo},
        {"videoDemo", videoDemo},
        {"techStack", techStack},
        {"additionalNotes", additionalNotes},
        {"timestamp", timestamp},
        {"version", version}
    };
}

Result<SubmissionPayload> SubmissionPayload::fromJson(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return makeError(ErrorCode::INVALID_INPUT, "Submission payload is not a JSON object");
    }
    try {
        SubmissionPayload p;
        p.projectName = optText(j, "projectName");
        p.description = optText(j, "description");
        p.githubRepo = optText(j, "githubRepo");
        p.liveDemo = optText(j, "liveDemo");
        p.videoDemo = optText(j, "videoDemo");
        if (j.contains("techStack") && j["techStack"].is_array()) {
            p.techStack = j["techStack"].get<std::vector<std::string>>();
        }
        p.additionalNotes = optText(j, "additionalNotes");
        p.timestamp = optText(j, "timestamp");
        p.version = optText(j, "version");
        if (p.projectName.empty()) return makeError(ErrorCode::INVALID_INPUT, "Payload has no project name");
        return p;
    } catch (const json::exception& e) {
        return makeError(ErrorCode::INVALID_INPUT, std::string("Malformed submission payload: ") + e.what());
    }
}

}
}
