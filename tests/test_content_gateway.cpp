#include <gtest/gtest.h>
#include "client/content_gateway.h"
#include "crypto/crypto.h"
#include "utils/logger.h"
#include <map>

using namespace zackathon;
using namespace zackathon::client;

class ContentGatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::enableConsole(false);
        config.gateways = {"https://one.example/ipfs", "https://two.example/ipfs/", ""};
        config.timeoutSeconds = 3;
    }

    ContentGateway::Fetcher recorder(std::map<std::string, web::CurlFetchResult> responses) {
        return [this, responses](const std::string& url, const web::CurlFetchOptions& options) {
            requested.push_back(url);
            lastTimeout = options.timeoutSeconds;
            auto it = responses.find(url);
            if (it != responses.end()) return it->second;
            web::CurlFetchResult miss;
            miss.exitCode = 22;
            miss.error = "HTTP 404";
            return miss;
        };
    }

    static web::CurlFetchResult body(const std::string& text) {
        web::CurlFetchResult r;
        r.exitCode = 0;
        r.body = text;
        return r;
    }

    utils::ContentConfig config;
    std::vector<std::string> requested;
    int lastTimeout = 0;
};

TEST_F(ContentGatewayTest, NormalizesGatewayPrefixes) {
    ContentGateway gateway(config, recorder({}));
    ASSERT_EQ(gateway.gateways().size(), 2u);
    EXPECT_EQ(gateway.gateways()[0], "https://one.example/ipfs/");
    EXPECT_EQ(gateway.gateways()[1], "https://two.example/ipfs/");
}

TEST_F(ContentGatewayTest, FirstGatewayWins) {
    ContentGateway gateway(config, recorder({{"https://one.example/ipfs/QmProject", body("{\"title\":\"x\"}")}}));
    auto r = gateway.fetch("QmProject");
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(r.value().gateway, "https://one.example/ipfs/");
    EXPECT_EQ(r.value().body, "{\"title\":\"x\"}");
    EXPECT_EQ(requested.size(), 1u);
    EXPECT_EQ(lastTimeout, 3);
}

TEST_F(ContentGatewayTest, FallsBackInOrder) {
    web::CurlFetchResult empty = body("");
    web::CurlFetchResult cut = body("partial");
    cut.truncated = true;
    config.gateways = {"https://a.example/", "https://b.example/", "https://c.example/"};
    ContentGateway gateway(config, recorder({{"https://a.example/QmX", empty},
                                             {"https://b.example/QmX", cut},
                                             {"https://c.example/QmX", body("payload")}}));
    auto r = gateway.fetch("QmX");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value().gateway, "https://c.example/");
    EXPECT_EQ(requested, (std::vector<std::string>{"https://a.example/QmX", "https://b.example/QmX",
                                                   "https://c.example/QmX"}));
}

TEST_F(ContentGatewayTest, AllGatewaysFailing) {
    ContentGateway gateway(config, recorder({}));
    auto r = gateway.fetch("QmMissing");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.code(), ErrorCode::NOT_FOUND);
    EXPECT_NE(r.error().message.find("HTTP 404"), std::string::npos);
    EXPECT_EQ(requested.size(), 2u);
}

TEST_F(ContentGatewayTest, RejectsMalformedIdentifiers) {
    ContentGateway gateway(config, recorder({}));
    EXPECT_EQ(gateway.fetch("").code(), ErrorCode::INVALID_INPUT);
    EXPECT_EQ(gateway.fetch("../etc/passwd").code(), ErrorCode::INVALID_INPUT);
    EXPECT_EQ(gateway.fetch("Qm x").code(), ErrorCode::INVALID_INPUT);
    EXPECT_EQ(gateway.fetch(std::string(129, 'a')).code(), ErrorCode::INVALID_INPUT);
    EXPECT_TRUE(requested.empty());
}

TEST_F(ContentGatewayTest, NoGatewaysIsConfigError) {
    config.gateways.clear();
    ContentGateway gateway(config, recorder({}));
    EXPECT_EQ(gateway.fetch("QmProject").code(), ErrorCode::INVALID_CONFIG);
}

TEST_F(ContentGatewayTest, DigestIsSha256OfIdentifier) {
    EXPECT_EQ(ContentGateway::contentDigest("QmProject"), crypto::sha256(std::string("QmProject")));
    EXPECT_NE(ContentGateway::contentDigest("QmA"), ContentGateway::contentDigest("QmB"));
}
