#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "paykit/config.hpp"
#include "paykit/crypto/signer_registry.hpp"
#include "paykit/notify/channel.hpp"
#include "paykit/notify/notify.hpp"
#include "paykit/params/param_map.hpp"
#include "paykit/utils/logger.hpp"

using namespace paykit;

namespace {

// k=v 形式的命令行参数
Result<params::ParamMap> parseParams(const std::vector<std::string>& pairs) {
    params::ParamMap result;
    for (const auto& pair : pairs) {
        size_t eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) {
            return Error(ErrorCode::FormatError, "参数格式应为 key=value: " + pair);
        }
        result.Set(pair.substr(0, eq), pair.substr(eq + 1));
    }
    return result;
}

// 输出里不出现明文密钥
std::string maskSecret(std::string text, const std::string& secret) {
    if (secret.empty()) {
        return text;
    }
    size_t pos = 0;
    while ((pos = text.find(secret, pos)) != std::string::npos) {
        text.replace(pos, secret.size(), "******");
        pos += 6;
    }
    return text;
}

Result<std::string> readInput(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error(ErrorCode::FormatError, "无法打开输入文件: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// 加载配置并初始化日志，命令行上的日志选项覆盖配置文件
Result<notify::ChannelConfig> loadChannel(const std::string& configFile, const std::string& channel,
                                          const std::string& logLevel, const std::string& logFormat) {
    auto config = LoadConfig(configFile);
    if (!config.ok()) {
        return config.error();
    }
    utils::LoggingConfig logging = config.value().logging;
    if (!logLevel.empty()) {
        logging.level = logLevel;
    }
    if (!logFormat.empty()) {
        logging.format = logFormat;
    }
    utils::GetLogger().Initialize(logging);

    return config.value().Channel(channel);
}

int fail(const Error& err) {
    utils::GetLogger().Error(err.what(), utils::LogContext()
        .With("code", ErrorCodeToString(err.code())));
    return 1;
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"paykit - 支付报文签名与异步通知验签工具"};
    app.require_subcommand(1);

    // 全局选项
    std::string configFile;
    std::string channel;
    std::string logLevel;
    std::string logFormat;
    std::vector<std::string> paramPairs;
    std::string inputFile;
    int exitCode = 0;

    app.add_option("-c,--config", configFile, "Configuration file path")->required();
    app.add_option("--channel", channel, "Channel name (alipay, wechat, qq, allinpay, saobei)")->required();
    app.add_option("--log-level", logLevel, "Log level (debug, info, warn, error, fatal)");
    app.add_option("--log-format", logFormat, "Log format (json, text)");

    // canonical 命令
    auto canonical = app.add_subcommand("canonical", "Print the signing string for the given parameters");
    canonical->add_option("-p,--param", paramPairs, "Request parameter key=value");

    canonical->callback([&]() {
        auto channelConfig = loadChannel(configFile, channel, logLevel, logFormat);
        if (!channelConfig.ok()) {
            exitCode = fail(channelConfig.error());
            return;
        }
        auto signer = notify::ChannelSigner::Create(channelConfig.value(), crypto::SignerRegistry::Default());
        if (!signer.ok()) {
            exitCode = fail(signer.error());
            return;
        }
        auto parsed = parseParams(paramPairs);
        if (!parsed.ok()) {
            exitCode = fail(parsed.error());
            return;
        }
        std::cout << maskSecret(signer.value().SigningString(parsed.value()),
                                channelConfig.value().key.secret) << std::endl;
    });

    // sign 命令
    auto sign = app.add_subcommand("sign", "Sign the given parameters and print the wire-format request");
    sign->add_option("-p,--param", paramPairs, "Request parameter key=value");

    sign->callback([&]() {
        auto channelConfig = loadChannel(configFile, channel, logLevel, logFormat);
        if (!channelConfig.ok()) {
            exitCode = fail(channelConfig.error());
            return;
        }
        auto signer = notify::ChannelSigner::Create(channelConfig.value(), crypto::SignerRegistry::Default());
        if (!signer.ok()) {
            exitCode = fail(signer.error());
            return;
        }
        auto parsed = parseParams(paramPairs);
        if (!parsed.ok()) {
            exitCode = fail(parsed.error());
            return;
        }
        params::ParamMap request = parsed.value();
        auto signature = signer.value().SignRequest(request);
        if (!signature.ok()) {
            exitCode = fail(signature.error());
            return;
        }
        auto encoded = signer.value().EncodeRequest(request);
        if (!encoded.ok()) {
            exitCode = fail(encoded.error());
            return;
        }
        std::cout << encoded.value() << std::endl;
    });

    // notify 命令
    auto notifyCmd = app.add_subcommand("notify", "Verify a stored notification payload and print the acknowledgement");
    notifyCmd->add_option("-i,--input", inputFile, "Raw notification payload file")->required();

    notifyCmd->callback([&]() {
        auto channelConfig = loadChannel(configFile, channel, logLevel, logFormat);
        if (!channelConfig.ok()) {
            exitCode = fail(channelConfig.error());
            return;
        }
        auto verifier = notify::NotifyVerifier::Create(channelConfig.value(), crypto::SignerRegistry::Default());
        if (!verifier.ok()) {
            exitCode = fail(verifier.error());
            return;
        }
        auto raw = readInput(inputFile);
        if (!raw.ok()) {
            exitCode = fail(raw.error());
            return;
        }

        auto outcome = verifier.value().Process(raw.value(), nullptr);
        std::cout << outcome.acknowledgement << std::endl;
        std::cerr << outcome.ToResponse().ToJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
        if (!outcome.Succeeded()) {
            exitCode = 2;
        }
    });

    CLI11_PARSE(app, argc, argv);
    return exitCode;
}
