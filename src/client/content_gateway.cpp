#include "client/content_gateway.h"
#include "crypto/crypto.h"
#include "utils/logger.h"
#include <cctype>

namespace zackathon {
namespace client {

ContentGateway::ContentGateway(const utils::ContentConfig& config, Fetcher fetcher)
    : fetcher_(std::move(fetcher)) {
    for (const auto& g : config.gateways) {
        if (g.empty()) continue;
        gateways_.push_back(g.back() == '/' ? g : g + "/");
    }
    options_.timeoutSeconds = config.timeoutSeconds;
    if (!fetcher_) fetcher_ = web::curlFetch;
}

bool ContentGateway::isValidCid(const std::string& cid) {
    if (cid.empty() || cid.size() > 128) return false;
    for (char c : cid) {
        if (!std::isalnum(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

utils::Word256 ContentGateway::contentDigest(const std::string& cid) {
    return crypto::sha256(cid);
}

Result<FetchedContent> ContentGateway::fetch(const std::string& cid) const {
    if (!isValidCid(cid)) return makeError(ErrorCode::INVALID_INPUT, "Malformed content identifier");
    if (gateways_.empty()) return makeError(ErrorCode::INVALID_CONFIG, "No content gateways configured");

    std::string lastError;
    for (const auto& gateway : gateways_) {
        web::CurlFetchResult r = fetcher_(gateway + cid, options_);
        if (r.ok() && !r.body.empty() && !r.truncated) {
            LOG_DEBUG("Fetched " + cid + " from " + gateway);
            return FetchedContent{gateway, std::move(r.body)};
        }
        lastError = r.error.empty() ? "exit " + std::to_string(r.exitCode) : r.error;
        utils::Logger::log(utils::LogLevel::WARN, "content",
                           "Gateway " + gateway + " failed for " + cid + ": " + lastError);
    }
    return makeError(ErrorCode::NOT_FOUND, "Content unavailable from every gateway: " + lastError);
}

}
}
