#include "utils/config.h"
#include <unordered_map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>

namespace zackathon {
namespace utils {

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

struct Config::Impl {
    std::unordered_map<std::string, std::string> data;
    std::string configPath;
    std::string dataDir;
    mutable std::mutex mtx;

    void store(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mtx);
        data[key] = value;
    }

    void applyDefaults();
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    const char* home = std::getenv("HOME");
    if (home) {
        impl_->dataDir = std::string(home) + "/.zackathon";
    } else {
        impl_->dataDir = ".zackathon";
    }
    impl_->applyDefaults();
}

Config& Config::instance() {
    static Config inst;
    return inst;
}

void Config::Impl::applyDefaults() {
    store("node.db_file", "zackathon.db");
    store("node.log_level", "info");
    store("node.log_max_bytes", std::to_string(10 * 1024 * 1024));
    store("node.log_max_files", "5");

    store("rpc.port", "8645");
    store("rpc.rate_limit", "100");
    store("rpc.require_signatures", "true");

    store("hackathon.max_judges", "64");
    store("hackathon.max_submissions", "1024");
    store("scoring.max_score_per_judge", "50");

    store("decrypt.poll_attempts", "10");
    store("decrypt.poll_delay_ms", "2000");

    store("content.gateways",
          "https://w3s.link/ipfs/,https://ipfs.io/ipfs/,"
          "https://gateway.pinata.cloud/ipfs/,https://dweb.link/ipfs/");
    store("content.timeout_seconds", "10");
}

void Config::reset() {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data.clear();
        impl_->configPath.clear();
    }
    impl_->applyDefaults();
}

bool Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->configPath = path;
    std::string line;

    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto pos = line.find('=');
        if (pos == std::string::npos) continue;
        std::string key = trim(line.substr(0, pos));
        std::string value = trim(line.substr(pos + 1));
        if (!key.empty()) impl_->data[key] = value;
    }
    return true;
}

bool Config::save(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::string savePath = path.empty() ? impl_->configPath : path;
    if (savePath.empty()) return false;

    std::ofstream file(savePath);
    if (!file.is_open()) return false;

    file << "# Zackathon node configuration\n\n";

    std::vector<std::string> sortedKeys;
    for (const auto& [key, value] : impl_->data) {
        sortedKeys.push_back(key);
    }
    std::sort(sortedKeys.begin(), sortedKeys.end());

    std::string lastPrefix;
    for (const auto& key : sortedKeys) {
        auto pos = key.find('.');
        std::string prefix = pos != std::string::npos ? key.substr(0, pos) : "";
        if (prefix != lastPrefix && !lastPrefix.empty()) {
            file << "\n";
        }
        lastPrefix = prefix;
        file << key << " = " << impl_->data[key] << "\n";
    }
    return static_cast<bool>(file);
}

std::string Config::getString(const std::string& key, const std::string& def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    return it != impl_->data.end() ? it->second : def;
}

int Config::getInt(const std::string& key, int def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    try { return std::stoi(it->second); }
    catch (const std::exception&) { return def; }
}

bool Config::getBool(const std::string& key, bool def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    std::string val = it->second;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return val == "true" || val == "1" || val == "yes" || val == "on";
}

std::vector<std::string> Config::getList(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return result;

    std::istringstream iss(it->second);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

void Config::set(const std::string& key, const std::string& value) {
    impl_->store(key, value);
}

void Config::set(const std::string& key, const char* value) {
    impl_->store(key, value ? std::string(value) : std::string());
}

void Config::set(const std::string& key, int value) {
    impl_->store(key, std::to_string(value));
}

void Config::set(const std::string& key, bool value) {
    impl_->store(key, value ? "true" : "false");
}

NodeConfig Config::getNodeConfig() const {
    NodeConfig cfg;
    cfg.dataDir = getString("node.data_dir", getDataDir());
    cfg.dbFile = getString("node.db_file", "zackathon.db");
    cfg.logLevel = getString("node.log_level", "info");
    std::string maxBytes = getString("node.log_max_bytes", "10485760");
    try { cfg.logMaxBytes = std::stoull(maxBytes); }
    catch (const std::exception&) { cfg.logMaxBytes = 10 * 1024 * 1024; }
    cfg.logMaxFiles = static_cast<uint32_t>(std::max(1, getInt("node.log_max_files", 5)));
    return cfg;
}

RpcConfig Config::getRpcConfig() const {
    RpcConfig cfg;
    cfg.port = static_cast<uint16_t>(getInt("rpc.port", 8645));
    cfg.rateLimit = getInt("rpc.rate_limit", 100);
    cfg.requireSignatures = getBool("rpc.require_signatures", true);
    return cfg;
}

ScoringConfig Config::getScoringConfig() const {
    ScoringConfig cfg;
    cfg.maxJudges = static_cast<uint32_t>(std::max(0, getInt("hackathon.max_judges", 64)));
    cfg.maxSubmissions = static_cast<uint32_t>(std::max(0, getInt("hackathon.max_submissions", 1024)));
    cfg.maxScorePerJudge = static_cast<uint32_t>(std::max(0, getInt("scoring.max_score_per_judge", 50)));
    return cfg;
}

DecryptConfig Config::getDecryptConfig() const {
    DecryptConfig cfg;
    cfg.pollAttempts = static_cast<uint32_t>(std::max(1, getInt("decrypt.poll_attempts", 10)));
    cfg.pollDelayMs = static_cast<uint32_t>(std::max(0, getInt("decrypt.poll_delay_ms", 2000)));
    return cfg;
}

ContentConfig Config::getContentConfig() const {
    ContentConfig cfg;
    cfg.gateways = getList("content.gateways");
    cfg.timeoutSeconds = static_cast<uint32_t>(std::max(1, getInt("content.timeout_seconds", 10)));
    return cfg;
}

std::string Config::getDataDir() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->dataDir;
}

std::string Config::getConfigPath() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->configPath;
}

void Config::setDataDir(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->dataDir = path;
}

}
}
