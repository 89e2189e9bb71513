#include "web/rpc_server.h"
#include "utils/logger.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cerrno>
#include <cstring>
#include <map>
#include <mutex>
#include <queue>
#include <sstream>
#include <thread>
#include <vector>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace zackathon {
namespace web {

using json = nlohmann::json;

namespace {

constexpr size_t MAX_REQUEST_BYTES = 1024 * 1024;

struct RpcRequest {
    json id;
    std::string method;
    std::string params;
    std::string clientIp;
};

struct RpcResponse {
    json id;
    std::string result;
    int errorCode = 0;
    std::string errorMessage;
};

struct RpcMethod {
    RpcServer::Handler handler;
    int rateLimit = 100;
};

struct RateLimitEntry {
    uint64_t windowStart;
    int requestCount;
};

uint64_t unixNow() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string parseJsonRpc(const std::string& data, RpcRequest& request) {
    json parsed = json::parse(data, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return "Invalid JSON-RPC request";
    }

    auto idIt = parsed.find("id");
    if (idIt != parsed.end() && (idIt->is_string() || idIt->is_number())) {
        request.id = *idIt;
    }

    auto methodIt = parsed.find("method");
    if (methodIt == parsed.end() || !methodIt->is_string()) {
        return "Missing method field";
    }
    request.method = methodIt->get<std::string>();

    auto paramsIt = parsed.find("params");
    request.params = paramsIt != parsed.end() ? paramsIt->dump() : "{}";
    return "";
}

std::string formatResponse(const RpcResponse& response) {
    json out = {{"jsonrpc", "2.0"}, {"id", response.id}};
    if (response.errorCode != 0) {
        out["error"] = {{"code", response.errorCode}, {"message", response.errorMessage}};
    } else {
        json result = json::parse(response.result, nullptr, false);
        out["result"] = result.is_discarded() ? json(nullptr) : result;
    }
    return out.dump();
}

}

struct RpcServer::Impl {
    std::map<std::string, RpcMethod> methods;
    std::map<std::string, RateLimitEntry> rateLimits;
    mutable std::mutex mtx;
    std::mutex queueMtx;
    std::atomic<bool> running{false};
    std::thread acceptThread;
    std::vector<std::thread> workerThreads;
    std::queue<std::pair<int, std::string>> connectionQueue;
    std::condition_variable cv;

    int serverSocket = -1;
    uint16_t port = 0;
    int rateLimitWindow = 60;
    uint64_t lastRateSweep = 0;
    static constexpr int LISTEN_BACKLOG = 100;
    static constexpr int REQUEST_TIMEOUT_SECONDS = 30;
    std::atomic<uint64_t> totalRequests{0};

    void acceptLoop();
    void workerLoop();
    void handleConnection(int clientSocket, const std::string& clientIp);
    RpcResponse processRequest(const RpcRequest& request);
    bool checkRateLimit(const std::string& key, int limit);
    std::string dispatch(const std::string& body, const std::string& clientIp);
};

RpcServer::RpcServer() : impl_(std::make_unique<Impl>()) {}

RpcServer::~RpcServer() {
    stop();
}

bool RpcServer::start(uint16_t port, const std::string& bindAddress) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->running) return false;

    impl_->serverSocket = socket(AF_INET, SOCK_STREAM, 0);
    if (impl_->serverSocket < 0) return false;

    int opt = 1;
    setsockopt(impl_->serverSocket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, bindAddress.c_str(), &addr.sin_addr) != 1) {
        close(impl_->serverSocket);
        impl_->serverSocket = -1;
        return false;
    }

    if (bind(impl_->serverSocket, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0 ||
        listen(impl_->serverSocket, Impl::LISTEN_BACKLOG) < 0) {
        LOG_ERROR("RPC bind to " + bindAddress + ":" + std::to_string(port) + " failed: " +
                  std::strerror(errno));
        close(impl_->serverSocket);
        impl_->serverSocket = -1;
        return false;
    }

    impl_->port = port;
    impl_->running = true;
    impl_->acceptThread = std::thread(&Impl::acceptLoop, impl_.get());

    int numWorkers = static_cast<int>(std::thread::hardware_concurrency());
    if (numWorkers < 2) numWorkers = 2;
    for (int i = 0; i < numWorkers; i++) {
        impl_->workerThreads.emplace_back(&Impl::workerLoop, impl_.get());
    }

    LOG_INFO("RPC listening on " + bindAddress + ":" + std::to_string(port));
    return true;
}

void RpcServer::stop() {
    bool wasRunning = impl_->running.exchange(false);
    impl_->cv.notify_all();

    if (impl_->acceptThread.joinable()) impl_->acceptThread.join();
    for (auto& thread : impl_->workerThreads) {
        if (thread.joinable()) thread.join();
    }
    impl_->workerThreads.clear();

    if (impl_->serverSocket >= 0) {
        shutdown(impl_->serverSocket, SHUT_RDWR);
        close(impl_->serverSocket);
        impl_->serverSocket = -1;
    }
    std::lock_guard<std::mutex> lock(impl_->queueMtx);
    while (!impl_->connectionQueue.empty()) {
        close(impl_->connectionQueue.front().first);
        impl_->connectionQueue.pop();
    }
    if (wasRunning) LOG_INFO("RPC server stopped");
}

uint16_t RpcServer::port() const {
    return impl_->port;
}

void RpcServer::registerMethod(const std::string& name, Handler handler, int rateLimit) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    RpcMethod method;
    method.handler = std::move(handler);
    method.rateLimit = rateLimit;
    impl_->methods[name] = std::move(method);
}

bool RpcServer::hasMethod(const std::string& name) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->methods.count(name) > 0;
}

void RpcServer::setRateLimitWindow(int seconds) {
    impl_->rateLimitWindow = seconds;
}

std::string RpcServer::dispatch(const std::string& body, const std::string& clientIp) {
    return impl_->dispatch(body, clientIp);
}

size_t RpcServer::getMethodCount() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->methods.size();
}

uint64_t RpcServer::getTotalRequests() const {
    return impl_->totalRequests;
}

size_t RpcServer::getRateLimitEntryCount() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->rateLimits.size();
}

void RpcServer::Impl::acceptLoop() {
    while (running) {
        struct pollfd pfd;
        pfd.fd = serverSocket;
        pfd.events = POLLIN;

        int ret = poll(&pfd, 1, 1000);
        if (ret <= 0) continue;

        struct sockaddr_in clientAddr;
        socklen_t clientLen = sizeof(clientAddr);
        int clientSocket = accept(serverSocket, reinterpret_cast<struct sockaddr*>(&clientAddr), &clientLen);
        if (clientSocket < 0) continue;

        char ipBuf[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &clientAddr.sin_addr, ipBuf, sizeof(ipBuf));

        {
            std::lock_guard<std::mutex> lock(queueMtx);
            connectionQueue.emplace(clientSocket, std::string(ipBuf));
        }
        cv.notify_one();
    }
}

void RpcServer::Impl::workerLoop() {
    while (true) {
        std::pair<int, std::string> conn(-1, std::string());
        {
            std::unique_lock<std::mutex> lock(queueMtx);
            cv.wait_for(lock, std::chrono::seconds(1), [this] {
                return !connectionQueue.empty() || !running;
            });
            if (!running) break;
            if (connectionQueue.empty()) continue;
            conn = connectionQueue.front();
            connectionQueue.pop();
        }
        handleConnection(conn.first, conn.second);
        close(conn.first);
    }
}

void RpcServer::Impl::handleConnection(int clientSocket, const std::string& clientIp) {
    struct timeval tv;
    tv.tv_sec = REQUEST_TIMEOUT_SECONDS;
    tv.tv_usec = 0;
    setsockopt(clientSocket, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    char buffer[65536];
    std::string requestData;

    while (running) {
        ssize_t bytesRead = recv(clientSocket, buffer, sizeof(buffer), 0);
        if (bytesRead <= 0) break;
        requestData.append(buffer, static_cast<size_t>(bytesRead));
        if (requestData.size() > MAX_REQUEST_BYTES) break;

        size_t headerEnd = requestData.find("\r\n\r\n");
        if (headerEnd == std::string::npos) continue;

        size_t contentLength = 0;
        size_t clPos = requestData.find("Content-Length:");
        if (clPos != std::string::npos && clPos < headerEnd) {
            contentLength = std::strtoul(requestData.c_str() + clPos + 15, nullptr, 10);
        }
        if (contentLength > MAX_REQUEST_BYTES) break;

        if (requestData.size() - headerEnd - 4 < contentLength) continue;
        std::string body = requestData.substr(headerEnd + 4, contentLength);

        std::string responseStr = dispatch(body, clientIp);

        std::ostringstream httpResponse;
        httpResponse << "HTTP/1.1 200 OK\r\n";
        httpResponse << "Content-Type: application/json\r\n";
        httpResponse << "Content-Length: " << responseStr.length() << "\r\n";
        httpResponse << "Connection: keep-alive\r\n";
        httpResponse << "\r\n";
        httpResponse << responseStr;

        std::string httpStr = httpResponse.str();
        if (send(clientSocket, httpStr.c_str(), httpStr.length(), MSG_NOSIGNAL) < 0) break;

        requestData.erase(0, headerEnd + 4 + contentLength);
    }
}

std::string RpcServer::Impl::dispatch(const std::string& body, const std::string& clientIp) {
    totalRequests++;
    RpcRequest request;
    request.clientIp = clientIp;
    std::string parseError = parseJsonRpc(body, request);

    RpcResponse response;
    if (!parseError.empty()) {
        response.id = request.id;
        response.errorCode = static_cast<int>(RpcErrorCode::PARSE_ERROR);
        response.errorMessage = parseError;
    } else {
        response = processRequest(request);
    }
    return formatResponse(response);
}

RpcResponse RpcServer::Impl::processRequest(const RpcRequest& request) {
    RpcResponse response;
    response.id = request.id;

    Handler handler;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = methods.find(request.method);
        if (it == methods.end()) {
            response.errorCode = static_cast<int>(RpcErrorCode::METHOD_NOT_FOUND);
            response.errorMessage = "Method not found: " + request.method;
            return response;
        }
        if (!checkRateLimit(request.clientIp + "|" + request.method, it->second.rateLimit)) {
            response.errorCode = static_cast<int>(RpcErrorCode::RATE_LIMITED);
            response.errorMessage = "Rate limit exceeded";
            return response;
        }
        handler = it->second.handler;
    }

    try {
        response.result = handler(request.params);
    } catch (const RpcError& e) {
        response.errorCode = e.code();
        response.errorMessage = e.what();
    } catch (const json::exception& e) {
        response.errorCode = static_cast<int>(RpcErrorCode::INVALID_PARAMS);
        response.errorMessage = e.what();
    } catch (const std::exception& e) {
        LOG_ERROR("RPC " + request.method + " failed: " + e.what());
        response.errorCode = static_cast<int>(RpcErrorCode::INTERNAL_ERROR);
        response.errorMessage = e.what();
    }
    return response;
}

bool RpcServer::Impl::checkRateLimit(const std::string& key, int limit) {
    if (limit <= 0) return true;
    uint64_t now = unixNow();
    uint64_t window = static_cast<uint64_t>(rateLimitWindow);

    if (now - lastRateSweep >= window) {
        for (auto sweep = rateLimits.begin(); sweep != rateLimits.end(); ) {
            if (now - sweep->second.windowStart >= window) sweep = rateLimits.erase(sweep);
            else ++sweep;
        }
        lastRateSweep = now;
    }

    auto it = rateLimits.find(key);
    if (it == rateLimits.end()) {
        rateLimits[key] = {now, 1};
        return true;
    }

    RateLimitEntry& entry = it->second;
    if (now - entry.windowStart >= window) {
        entry.windowStart = now;
        entry.requestCount = 1;
        return true;
    }
    if (entry.requestCount >= limit) return false;
    entry.requestCount++;
    return true;
}

}
}
