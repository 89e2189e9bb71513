#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace zackathon {
namespace utils {

struct NodeConfig {
    std::string dataDir;
    std::string dbFile = "zackathon.db";
    std::string logLevel = "info";
    uint64_t logMaxBytes = 10 * 1024 * 1024;
    uint32_t logMaxFiles = 5;
};

struct RpcConfig {
    uint16_t port = 8645;
    int rateLimit = 100;
    bool requireSignatures = true;
};

struct ScoringConfig {
    uint32_t maxJudges = 64;
    uint32_t maxSubmissions = 1024;
    uint32_t maxScorePerJudge = 50;
};

struct DecryptConfig {
    uint32_t pollAttempts = 10;
    uint32_t pollDelayMs = 2000;
};

struct ContentConfig {
    std::vector<std::string> gateways;
    uint32_t timeoutSeconds = 10;
};

class Config {
public:
    static Config& instance();

    bool load(const std::string& path);
    bool save(const std::string& path);
    // Drops every setting, including loaded ones, and restores the built-in defaults.
    void reset();

    std::string getString(const std::string& key, const std::string& def = "") const;
    int getInt(const std::string& key, int def = 0) const;
    bool getBool(const std::string& key, bool def = false) const;
    std::vector<std::string> getList(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);

    NodeConfig getNodeConfig() const;
    RpcConfig getRpcConfig() const;
    ScoringConfig getScoringConfig() const;
    DecryptConfig getDecryptConfig() const;
    ContentConfig getContentConfig() const;

    std::string getDataDir() const;
    std::string getConfigPath() const;
    void setDataDir(const std::string& path);

private:
    Config();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
