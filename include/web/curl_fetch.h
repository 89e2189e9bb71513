#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace zackathon {
namespace web {

struct CurlFetchOptions {
    uint32_t timeoutSeconds = 10;
    size_t maxBytes = 4 * 1024 * 1024;
    std::string userAgent = "zackathon/0.1";
    bool followRedirects = true;
    // HTTP status >= 400 makes curl exit non-zero instead of returning the error page.
    bool failOnHttpError = true;
};

struct CurlFetchResult {
    std::string body;
    int exitCode = -1;
    std::string error;
    bool truncated = false;

    bool ok() const { return exitCode == 0; }
};

// Runs the curl binary; the body is capped at maxBytes.
CurlFetchResult curlFetch(const std::string& url, const CurlFetchOptions& options);

}
}
