#pragma once

#include <optional>
#include <string>
#include <vector>
#include "paykit/types.hpp"
#include "paykit/params/param_map.hpp"
#include "paykit/params/canonical.hpp"
#include "paykit/crypto/signer.hpp"
#include "paykit/crypto/signer_registry.hpp"

namespace paykit {
namespace notify {

// 支付渠道
enum class Channel {
    Alipay,
    Wechat,
    QQ,
    AllinPay,
    Saobei
};

// 报文格式
enum class WireFormat {
    Form,
    Xml,
    Json
};

// 渠道固定的协议约定
struct ChannelInfo {
    Channel channel;
    std::string name;
    WireFormat format;
    std::string defaultAlgorithm;
    std::string signField;
    std::vector<std::string> notifyExcludedFields;   // 异步通知验签时额外排除
    std::string xmlRoot;
    std::string successAck;
    std::string failureAck;
};

const ChannelInfo& GetChannelInfo(Channel channel);
std::string ChannelName(Channel channel);
Result<Channel> ParseChannel(const std::string& name);

// 渠道 + 算法对应的默认签名串规则
params::ProfileKind DefaultProfile(Channel channel, const std::string& algorithm);

// 配置方提供的单个渠道配置
struct ChannelConfig {
    Channel channel = Channel::Wechat;
    std::string algorithm;                            // 为空时取渠道默认算法
    std::optional<params::ProfileKind> profile;       // 为空时取默认规则
    crypto::KeyMaterial key;
};

// 已校验的渠道：规则 + 签名器 + 签名串中使用的密钥
class ChannelSigner {
public:
    ChannelSigner() = default;

    // 算法、密钥、规则在这里一次性校验
    static Result<ChannelSigner> Create(const ChannelConfig& config,
                                        const crypto::SignerRegistry& registry);

    const ChannelInfo& Info() const { return GetChannelInfo(channel_); }
    Channel GetChannel() const { return channel_; }
    const params::CanonicalProfile& Profile() const { return profile_; }
    const crypto::Signer& GetSigner() const { return signer_; }

    // 出站签名串
    std::string SigningString(const params::ParamMap& params) const;
    // 异步通知签名串（额外排除渠道声明的字段）
    std::string NotifySigningString(const params::ParamMap& params) const;

    // 签名并写入签名字段，返回签名
    Result<std::string> SignRequest(params::ParamMap& params) const;

    // 按渠道报文格式序列化。字段无法按该格式编码时返回 FormatError，不会丢字段
    Result<std::string> EncodeRequest(const params::ParamMap& params) const;

private:
    Channel channel_ = Channel::Wechat;
    params::CanonicalProfile profile_;
    params::CanonicalProfile notifyProfile_;
    crypto::Signer signer_;
    std::string secret_;
};

} // namespace notify
} // namespace paykit
