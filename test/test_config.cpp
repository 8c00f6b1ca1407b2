#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include "paykit/config.hpp"
#include "paykit/notify/notify.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;
using namespace paykit;

namespace {

// 测试结束时删除临时文件
class TempFile {
public:
    TempFile(const std::string& name, const std::string& content)
        : path_(fs::temp_directory_path() / ("paykit_test_" + name)) {
        std::ofstream file(path_, std::ios::binary);
        file << content;
    }
    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }
    std::string Path() const { return path_.string(); }

private:
    fs::path path_;
};

} // namespace

TEST_CASE("配置解析测试", "[config]") {

    SECTION("完整配置") {
        auto config = ParseConfig(nlohmann::json::parse(R"({
            "logging": {"level": "debug", "format": "text"},
            "channels": {
                "wechat": {"algorithm": "HMAC-SHA256", "secret": "secret", "profile": "keyed-mac"},
                "allinpay": {"secret": "abc"}
            }
        })"));
        REQUIRE(config.ok());
        REQUIRE(config.value().logging.level == "debug");
        REQUIRE(config.value().logging.format == "text");
        REQUIRE(config.value().logging.output == "console");

        auto wechat = config.value().Channel("wechat");
        REQUIRE(wechat.ok());
        REQUIRE(wechat.value().channel == notify::Channel::Wechat);
        REQUIRE(wechat.value().algorithm == HMAC_SHA256_SIGN);
        REQUIRE(wechat.value().profile == params::ProfileKind::KeyedMac);
        REQUIRE(wechat.value().key.secret == "secret");

        auto allinpay = config.value().Channel("allinpay");
        REQUIRE(allinpay.ok());
        REQUIRE(allinpay.value().algorithm.empty());
        REQUIRE_FALSE(allinpay.value().profile.has_value());

        auto missing = config.value().Channel("qq");
        REQUIRE_FALSE(missing.ok());
        REQUIRE(missing.error().code() == ErrorCode::ConfigError);
    }

    SECTION("未知渠道与规则") {
        auto badChannel = ParseConfig(nlohmann::json::parse(R"({"channels": {"paypal": {"secret": "x"}}})"));
        REQUIRE_FALSE(badChannel.ok());
        REQUIRE(badChannel.error().code() == ErrorCode::ConfigError);

        auto badProfile = ParseConfig(nlohmann::json::parse(R"({"channels": {"wechat": {"profile": "sorted"}}})"));
        REQUIRE_FALSE(badProfile.ok());
        REQUIRE(badProfile.error().code() == ErrorCode::ConfigError);

        auto badType = ParseConfig(nlohmann::json::parse(R"({"channels": {"wechat": {"secret": 42}}})"));
        REQUIRE_FALSE(badType.ok());
        REQUIRE(badType.error().code() == ErrorCode::ConfigError);

        auto badLogging = ParseConfig(nlohmann::json::parse(R"({"logging": {"level": 3}})"));
        REQUIRE_FALSE(badLogging.ok());
        REQUIRE(badLogging.error().code() == ErrorCode::ConfigError);
    }

    SECTION("算法标识在构造签名器时才校验") {
        auto config = ParseConfig(nlohmann::json::parse(R"({"channels": {"wechat": {"algorithm": "FOO", "secret": "x"}}})"));
        REQUIRE(config.ok());

        auto registry = crypto::SignerRegistry::NewDefault();
        auto verifier = notify::NotifyVerifier::Create(config.value().Channel("wechat").value(), *registry);
        REQUIRE_FALSE(verifier.ok());
        REQUIRE(verifier.error().code() == ErrorCode::UnsupportedAlgorithm);
    }
}

TEST_CASE("配置文件加载测试", "[config]") {

    SECTION("读取密钥文件") {
        auto pair = testing::GenerateRSAKeyPair();
        TempFile privateKey("app_private.pem", pair.privateKey);
        TempFile config("config.json",
            R"({"channels": {"alipay": {"algorithm": "RSA2", "private_key_file": ")" + privateKey.Path() +
            R"(", "public_key": ")" + testing::StripPEM(pair.publicKey) + R"("}}})");

        auto loaded = LoadConfig(config.Path());
        REQUIRE(loaded.ok());
        auto alipay = loaded.value().Channel("alipay");
        REQUIRE(alipay.ok());
        REQUIRE(alipay.value().key.privateKey == pair.privateKey);

        auto registry = crypto::SignerRegistry::NewDefault();
        auto verifier = notify::NotifyVerifier::Create(alipay.value(), *registry);
        REQUIRE(verifier.ok());
    }

    SECTION("密钥文件不存在") {
        TempFile config("missing_key.json",
            R"({"channels": {"alipay": {"private_key_file": "/nonexistent/paykit/app.pem"}}})");
        auto loaded = LoadConfig(config.Path());
        REQUIRE_FALSE(loaded.ok());
        REQUIRE(loaded.error().code() == ErrorCode::ConfigError);
    }

    SECTION("配置文件格式错误") {
        TempFile config("broken.json", "{\"channels\": ");
        auto loaded = LoadConfig(config.Path());
        REQUIRE_FALSE(loaded.ok());
        REQUIRE(loaded.error().code() == ErrorCode::ConfigError);

        auto missing = LoadConfig("/nonexistent/paykit/config.json");
        REQUIRE_FALSE(missing.ok());
        REQUIRE(missing.error().code() == ErrorCode::ConfigError);
    }
}
