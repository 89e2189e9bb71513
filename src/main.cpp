#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <getopt.h>

#include "core/contract.h"
#include "core/contract_store.h"
#include "crypto/crypto.h"
#include "fhe/local_encryption_service.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/single_instance.h"
#include "web/contract_rpc.h"
#include "web/rpc_server.h"

namespace zackathon {

static std::atomic<bool> g_running{true};

struct NodeOptions {
    std::string configPath;
    std::string dataDir;
    std::string logLevel;
    int rpcPort = -1;
    bool dev = false;
    bool memory = false;
    bool showHelp = false;
    bool showVersion = false;
};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) g_running = false;
}

void printHelp(const char* progName) {
    std::cout << "zackathond v0.1.0 - confidential hackathon contract node\n\n";
    std::cout << "Usage: " << progName << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help          Show this help\n";
    std::cout << "  -v, --version       Show version\n";
    std::cout << "  -c, --config FILE   Use custom config file\n";
    std::cout << "  -D, --datadir DIR   Data directory (default: ~/.zackathon)\n";
    std::cout << "  -r, --rpcport PORT  JSON-RPC port (default: 8645)\n";
    std::cout << "  -l, --loglevel LVL  trace/debug/info/warn/error\n";
    std::cout << "  --dev               Host a local encryption service and expose fhe_* methods\n";
    std::cout << "  --memory            Keep all state in memory\n";
}

void printVersion() {
    std::cout << "zackathond v0.1.0\n";
    std::cout << "Store format: " << core::STORE_FORMAT_VERSION << "\n";
    std::cout << "Signatures: " << (crypto::usingSecp256k1() ? "secp256k1" : "hash-based (development)") << "\n";
}

bool parseArgs(int argc, char* argv[], NodeOptions& options) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"config", required_argument, nullptr, 'c'},
        {"datadir", required_argument, nullptr, 'D'},
        {"rpcport", required_argument, nullptr, 'r'},
        {"loglevel", required_argument, nullptr, 'l'},
        {"dev", no_argument, nullptr, 'E'},
        {"memory", no_argument, nullptr, 'M'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;
    while ((opt = getopt_long(argc, argv, "hvc:D:r:l:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                options.showHelp = true;
                return true;
            case 'v':
                options.showVersion = true;
                return true;
            case 'c':
                options.configPath = optarg;
                break;
            case 'D':
                options.dataDir = optarg;
                break;
            case 'r': {
                char* end = nullptr;
                long port = std::strtol(optarg, &end, 10);
                if (!end || *end != '\0' || port <= 0 || port > 65535) {
                    std::cerr << "Invalid RPC port: " << optarg << "\n";
                    return false;
                }
                options.rpcPort = static_cast<int>(port);
                break;
            }
            case 'l':
                options.logLevel = optarg;
                break;
            case 'E':
                options.dev = true;
                break;
            case 'M':
                options.memory = true;
                break;
            default:
                return false;
        }
    }
    if (optind < argc) {
        std::cerr << "Unexpected argument: " << argv[optind] << "\n";
        return false;
    }
    return true;
}

void registerSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);
}

// Fixed identity of the hosted contract; encrypted inputs are bound to it.
crypto::Address contractAddress() {
    crypto::KeyPair kp = crypto::keyPairFromSeed(crypto::sha256(std::string("zackathon/contract/v1")));
    return crypto::Address::fromPublicKey(kp.publicKey);
}

int runNode(const NodeOptions& options) {
    utils::Config& config = utils::Config::instance();
    if (!options.dataDir.empty()) config.setDataDir(options.dataDir);
    if (!options.configPath.empty()) {
        if (!config.load(options.configPath)) {
            std::cerr << "Cannot read config " << options.configPath << "\n";
            return 1;
        }
    } else {
        std::string defaultPath = config.getDataDir() + "/zackathon.conf";
        if (std::filesystem::exists(defaultPath) && !config.load(defaultPath)) {
            std::cerr << "Cannot read config " << defaultPath << "\n";
            return 1;
        }
    }

    utils::NodeConfig node = config.getNodeConfig();
    if (!options.dataDir.empty()) node.dataDir = options.dataDir;
    utils::RpcConfig rpc = config.getRpcConfig();
    if (options.rpcPort > 0) rpc.port = static_cast<uint16_t>(options.rpcPort);

    std::string level = options.logLevel.empty() ? node.logLevel : options.logLevel;
    if (!utils::Logger::setLevel(level)) {
        std::cerr << "Unknown log level: " << level << "\n";
        return 1;
    }

    std::string lockErr;
    std::unique_ptr<utils::SingleInstanceLock> instanceLock;
    if (!options.memory) {
        instanceLock = utils::SingleInstanceLock::acquire(node.dataDir, &lockErr);
        if (!instanceLock) {
            std::cerr << "zackathond: " << lockErr << "\n";
            return 1;
        }
        utils::LogFileOptions logFiles;
        logFiles.maxBytes = node.logMaxBytes;
        logFiles.maxFiles = node.logMaxFiles;
        if (!utils::Logger::init(node.dataDir + "/logs/zackathond.log", logFiles)) {
            std::cerr << "zackathond: cannot open log file in " << node.dataDir << "/logs\n";
        }
    }
    utils::Logger::enableConsole(true);
    if (!config.getConfigPath().empty()) LOG_INFO("Loaded config " + config.getConfigPath());

    auto limits = core::ContractLimits::fromConfig(config);
    if (!limits.ok()) {
        LOG_FATAL("Invalid configuration: " + limits.error().message);
        return 1;
    }

    if (!options.dev) {
        LOG_FATAL("No encryption service configured; start with --dev to host a local one");
        return 1;
    }

    std::string dbPath = node.dataDir + "/" + node.dbFile;
    auto service = std::make_shared<fhe::LocalEncryptionService>();
    if (!options.memory && !service->open(dbPath)) {
        LOG_FATAL("Cannot open encryption state in " + dbPath);
        return 1;
    }
    LOG_WARN("Development encryption service active: values are held in the clear");

    core::HackathonContract contract(service, contractAddress(), limits.value());
    if (!options.memory) {
        auto opened = contract.open(dbPath);
        if (!opened.ok()) {
            LOG_FATAL("Cannot open contract store: " + opened.error().message);
            return 1;
        }
    }
    LOG_INFO("Contract " + contract.address().toHex() + " hosting " +
             std::to_string(contract.getTotalHackathonCount()) + " hackathons");

    web::ContractRpc handlers(contract, rpc.requireSignatures, service);
    web::RpcServer server;
    handlers.registerMethods(server, rpc.rateLimit);
    if (!server.start(rpc.port)) {
        LOG_FATAL("Cannot start RPC server on port " + std::to_string(rpc.port));
        return 1;
    }
    LOG_INFO("RPC listening on 127.0.0.1:" + std::to_string(server.port()));
    if (!rpc.requireSignatures) {
        LOG_WARN("RPC signature checks disabled; callers are trusted");
    }

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_INFO("Shutting down");
    server.stop();
    contract.close();
    service->close();
    utils::Logger::shutdown();
    return 0;
}

}

int main(int argc, char* argv[]) {
    zackathon::registerSignalHandlers();

    zackathon::NodeOptions options;
    if (!zackathon::parseArgs(argc, argv, options)) {
        zackathon::printHelp(argv[0]);
        return 1;
    }
    if (options.showHelp) {
        zackathon::printHelp(argv[0]);
        return 0;
    }
    if (options.showVersion) {
        zackathon::printVersion();
        return 0;
    }
    return zackathon::runNode(options);
}
