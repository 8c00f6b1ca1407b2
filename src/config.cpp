#include "paykit/config.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace paykit {

namespace {

Result<std::string> ReadKeyFile(const std::string& path) {
    if (!fs::exists(path)) {
        return Error(ErrorCode::ConfigError, "密钥文件不存在: " + path);
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error(ErrorCode::ConfigError, "无法打开密钥文件: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

Result<std::string> StringField(const nlohmann::json& object, const std::string& key,
                                const std::string& where) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::string();
    }
    if (!it->is_string()) {
        return Error(ErrorCode::ConfigError, where + "." + key + " 必须是字符串");
    }
    return it->get<std::string>();
}

// 内联密钥与文件密钥二选一，文件优先
Result<std::string> KeyField(const nlohmann::json& object, const std::string& key,
                             const std::string& where) {
    auto filePath = StringField(object, key + "_file", where);
    if (!filePath.ok()) {
        return filePath.error();
    }
    if (!filePath.value().empty()) {
        return ReadKeyFile(filePath.value());
    }
    return StringField(object, key, where);
}

Result<notify::ChannelConfig> ParseChannelConfig(const std::string& name, const nlohmann::json& entry) {
    std::string where = "channels." + name;
    if (!entry.is_object()) {
        return Error(ErrorCode::ConfigError, where + " 必须是对象");
    }

    auto channel = notify::ParseChannel(name);
    if (!channel.ok()) {
        return channel.error();
    }

    notify::ChannelConfig config;
    config.channel = channel.value();

    auto algorithm = StringField(entry, "algorithm", where);
    if (!algorithm.ok()) {
        return algorithm.error();
    }
    config.algorithm = algorithm.value();

    auto profile = StringField(entry, "profile", where);
    if (!profile.ok()) {
        return profile.error();
    }
    if (!profile.value().empty()) {
        auto kind = params::ParseProfileKind(profile.value());
        if (!kind.ok()) {
            return kind.error();
        }
        config.profile = kind.value();
    }

    auto secret = StringField(entry, "secret", where);
    if (!secret.ok()) {
        return secret.error();
    }
    config.key.secret = secret.value();

    auto privateKey = KeyField(entry, "private_key", where);
    if (!privateKey.ok()) {
        return privateKey.error();
    }
    config.key.privateKey = privateKey.value();

    auto publicKey = KeyField(entry, "public_key", where);
    if (!publicKey.ok()) {
        return publicKey.error();
    }
    config.key.publicKey = publicKey.value();

    return config;
}

} // namespace

Result<notify::ChannelConfig> Config::Channel(const std::string& name) const {
    auto it = channels.find(name);
    if (it == channels.end()) {
        return Error(ErrorCode::ConfigError, "渠道未配置: " + name);
    }
    return it->second;
}

Result<Config> ParseConfig(const nlohmann::json& document) {
    if (!document.is_object()) {
        return Error(ErrorCode::ConfigError, "配置必须是JSON对象");
    }

    Config config;

    auto logging = document.find("logging");
    if (logging != document.end()) {
        if (!logging->is_object()) {
            return Error(ErrorCode::ConfigError, "logging 必须是对象");
        }
        try {
            config.logging.level  = logging->value("level", config.logging.level);
            config.logging.format = logging->value("format", config.logging.format);
            config.logging.output = logging->value("output", config.logging.output);
            config.logging.file   = logging->value("file", config.logging.file);
        } catch (const nlohmann::json::exception& e) {
            return Error(ErrorCode::ConfigError, std::string("logging 配置错误: ") + e.what());
        }
    }

    auto channels = document.find("channels");
    if (channels != document.end()) {
        if (!channels->is_object()) {
            return Error(ErrorCode::ConfigError, "channels 必须是对象");
        }
        for (auto it = channels->begin(); it != channels->end(); ++it) {
            auto channel = ParseChannelConfig(it.key(), it.value());
            if (!channel.ok()) {
                return channel.error();
            }
            config.channels[it.key()] = channel.value();
        }
    }

    return config;
}

Result<Config> LoadConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return Error(ErrorCode::ConfigError, "无法打开配置文件: " + path);
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        return Error(ErrorCode::ConfigError, std::string("配置文件格式错误: ") + e.what());
    }

    return ParseConfig(document);
}

} // namespace paykit
