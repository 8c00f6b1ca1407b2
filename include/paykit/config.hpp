#pragma once

#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "paykit/types.hpp"
#include "paykit/utils/logger.hpp"
#include "paykit/notify/channel.hpp"

namespace paykit {

// 日志配置 + 各渠道配置
struct Config {
    utils::LoggingConfig logging;
    std::map<std::string, notify::ChannelConfig> channels;   // 渠道名 -> 配置

    // 未配置返回 ConfigError
    Result<notify::ChannelConfig> Channel(const std::string& name) const;
};

// 解析JSON配置。密钥文件在这里读入，算法标识留到构造签名器时再校验
Result<Config> ParseConfig(const nlohmann::json& document);

// 从文件加载
Result<Config> LoadConfig(const std::string& path);

} // namespace paykit
