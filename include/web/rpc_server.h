#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace zackathon {
namespace web {

enum class RpcErrorCode {
    PARSE_ERROR = -32700,
    INVALID_REQUEST = -32600,
    METHOD_NOT_FOUND = -32601,
    INVALID_PARAMS = -32602,
    INTERNAL_ERROR = -32603,
    SERVER_ERROR = -32000,
    UNAUTHORIZED = -32001,
    RATE_LIMITED = -32002
};

// Thrown by method handlers to produce a JSON-RPC error object.
class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string& message) : std::runtime_error(message), code_(code) {}
    RpcError(RpcErrorCode code, const std::string& message)
        : RpcError(static_cast<int>(code), message) {}
    int code() const { return code_; }

private:
    int code_;
};

// JSON-RPC 2.0 over HTTP/1.1 POST. Handlers take the params JSON and return
// the result JSON.
class RpcServer {
public:
    using Handler = std::function<std::string(const std::string&)>;

    RpcServer();
    ~RpcServer();

    bool start(uint16_t port, const std::string& bindAddress = "127.0.0.1");
    void stop();
    uint16_t port() const;

    void registerMethod(const std::string& name, Handler handler, int rateLimit = 100);
    bool hasMethod(const std::string& name) const;

    void setRateLimitWindow(int seconds);

    // Processes one request body as if it arrived from clientIp.
    std::string dispatch(const std::string& body, const std::string& clientIp = "local");

    size_t getMethodCount() const;
    uint64_t getTotalRequests() const;
    // Client/method windows currently tracked; expired windows are dropped as requests arrive.
    size_t getRateLimitEntryCount() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
