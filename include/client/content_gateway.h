#pragma once

#include "infrastructure/error_handling.h"
#include "utils/config.h"
#include "utils/serialize.h"
#include "web/curl_fetch.h"
#include <functional>
#include <string>
#include <vector>

namespace zackathon {
namespace client {

struct FetchedContent {
    std::string gateway;
    std::string body;
};

// Retrieves off-chain submission payloads by content identifier from a list
// of gateway prefixes, falling back to the next gateway on any failure.
class ContentGateway {
public:
    using Fetcher = std::function<web::CurlFetchResult(const std::string&, const web::CurlFetchOptions&)>;

    explicit ContentGateway(const utils::ContentConfig& config, Fetcher fetcher = nullptr);

    Result<FetchedContent> fetch(const std::string& cid) const;
    const std::vector<std::string>& gateways() const { return gateways_; }

    // The 256-bit value encrypted as a submission reference.
    static utils::Word256 contentDigest(const std::string& cid);
    static bool isValidCid(const std::string& cid);

private:
    std::vector<std::string> gateways_;
    web::CurlFetchOptions options_;
    Fetcher fetcher_;
};

}
}
