#include "paykit/notify/channel.hpp"
#include "paykit/params/xml_map.hpp"
#include "paykit/utils/logger.hpp"
#include <variant>

namespace paykit {
namespace notify {

namespace {

const std::string WECHAT_SUCCESS_ACK =
    "<xml><return_code><![CDATA[SUCCESS]]></return_code><return_msg><![CDATA[OK]]></return_msg></xml>";
const std::string WECHAT_FAILURE_ACK =
    "<xml><return_code><![CDATA[FAIL]]></return_code><return_msg><![CDATA[FAIL]]></return_msg></xml>";

const std::vector<ChannelInfo>& ChannelTable() {
    static const std::vector<ChannelInfo> table = {
        {Channel::Alipay, "alipay", WireFormat::Form, RSA2_SIGN, SIGN_FIELD,
         {"sign_type"}, "", "success", "failure"},
        {Channel::Wechat, "wechat", WireFormat::Xml, HMAC_SHA256_SIGN, SIGN_FIELD,
         {}, "xml", WECHAT_SUCCESS_ACK, WECHAT_FAILURE_ACK},
        {Channel::QQ, "qq", WireFormat::Xml, HMAC_SHA256_SIGN, SIGN_FIELD,
         {}, "xml", WECHAT_SUCCESS_ACK, WECHAT_FAILURE_ACK},
        {Channel::AllinPay, "allinpay", WireFormat::Form, MD5_SIGN, SIGN_FIELD,
         {}, "", "success", "fail"},
        {Channel::Saobei, "saobei", WireFormat::Json, MD5_SIGN, SIGN_FIELD,
         {}, "", R"({"return_code":"01","return_msg":"success"})",
         R"({"return_code":"02","return_msg":"fail"})"},
    };
    return table;
}

bool IsRSA(const std::string& algorithm) {
    return algorithm == RSA_SIGN || algorithm == RSA2_SIGN;
}

} // namespace

const ChannelInfo& GetChannelInfo(Channel channel) {
    for (const auto& info : ChannelTable()) {
        if (info.channel == channel) {
            return info;
        }
    }
    // 表覆盖了全部枚举值
    return ChannelTable().front();
}

std::string ChannelName(Channel channel) {
    return GetChannelInfo(channel).name;
}

Result<Channel> ParseChannel(const std::string& name) {
    for (const auto& info : ChannelTable()) {
        if (info.name == name) {
            return info.channel;
        }
    }
    return Error(ErrorCode::ConfigError, "未知的支付渠道: " + name);
}

params::ProfileKind DefaultProfile(Channel channel, const std::string& algorithm) {
    if (IsRSA(algorithm)) {
        return params::ProfileKind::Asymmetric;
    }
    if (algorithm == MD5_SIGN) {
        return params::ProfileKind::KeyedDigest;
    }
    if (algorithm == HMAC_SHA256_SIGN) {
        // XML渠道的HMAC串尾同样拼接密钥
        if (GetChannelInfo(channel).format == WireFormat::Xml) {
            return params::ProfileKind::KeyedMac;
        }
        return params::ProfileKind::Mac;
    }
    return params::ProfileKind::Mac;
}

Result<ChannelSigner> ChannelSigner::Create(const ChannelConfig& config,
                                            const crypto::SignerRegistry& registry) {
    const ChannelInfo& info = GetChannelInfo(config.channel);
    std::string algorithm = config.algorithm.empty() ? info.defaultAlgorithm : config.algorithm;

    auto signer = registry.Get(algorithm, config.key);
    if (!signer.ok()) {
        return signer.error();
    }

    params::ProfileKind kind = config.profile ? *config.profile : DefaultProfile(config.channel, algorithm);
    params::CanonicalProfile profile = params::MakeProfile(kind);
    profile.signField = info.signField;

    if (profile.secretPlacement != params::SecretPlacement::None && config.key.secret.empty()) {
        return Error(ErrorCode::InvalidKeyMaterial,
                     "签名串规则 " + params::ProfileName(kind) + " 需要共享密钥");
    }

    // 摘要本身不带密钥时，签名串必须带上密钥，否则等于没有签名
    if (const auto* digest = std::get_if<crypto::SharedSecretDigest>(&signer.value().Impl())) {
        if (digest->suffix == crypto::SecretSuffix::None &&
            profile.secretPlacement == params::SecretPlacement::None) {
            return Error(ErrorCode::ConfigError,
                         algorithm + " 与签名串规则 " + params::ProfileName(kind) + " 组合后签名不含密钥");
        }
    }

    ChannelSigner result;
    result.channel_ = config.channel;
    result.profile_ = profile;
    result.notifyProfile_ = profile;
    for (const auto& field : info.notifyExcludedFields) {
        result.notifyProfile_.excludedFields.insert(field);
    }
    result.signer_ = signer.value();
    result.secret_ = config.key.secret;
    return result;
}

std::string ChannelSigner::SigningString(const params::ParamMap& params) const {
    return params.ToSigningText(profile_, secret_);
}

std::string ChannelSigner::NotifySigningString(const params::ParamMap& params) const {
    return params.ToSigningText(notifyProfile_, secret_);
}

Result<std::string> ChannelSigner::SignRequest(params::ParamMap& params) const {
    auto signature = signer_.Sign(SigningString(params));
    if (!signature.ok()) {
        utils::GetLogger().Error("请求签名失败",
            utils::LogContext()
                .With("channel", Info().name)
                .With("algorithm", signer_.Algorithm())
                .With("error", signature.error().what()));
        return signature.error();
    }
    params.Set(Info().signField, signature.value());
    return signature;
}

Result<std::string> ChannelSigner::EncodeRequest(const params::ParamMap& params) const {
    switch (Info().format) {
        case WireFormat::Xml: {
            for (const auto& key : params.Keys()) {
                if (!params::IsValidElementName(key)) {
                    return Error(ErrorCode::FormatError, "字段名不能作为XML元素名: " + key);
                }
            }
            return params::XmlMap::FromParamMap(params, Info().xmlRoot).Serialize();
        }
        case WireFormat::Json:
            return params.ToJsonText();
        case WireFormat::Form:
        default:
            return params.ToQueryText();
    }
}

} // namespace notify
} // namespace paykit
