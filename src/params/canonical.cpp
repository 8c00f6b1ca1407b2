#include "paykit/params/canonical.hpp"
#include <algorithm>
#include <utility>
#include <vector>

namespace paykit {
namespace params {

CanonicalProfile MakeProfile(ProfileKind kind) {
    CanonicalProfile profile;
    profile.kind = kind;
    profile.sortKeys = true;
    profile.join = JoinStyle::Pairs;

    switch (kind) {
        case ProfileKind::KeyedDigest:
        case ProfileKind::KeyedMac:
            profile.secretPlacement = SecretPlacement::AppendKeyParam;
            break;
        case ProfileKind::Mac:
        case ProfileKind::Asymmetric:
            profile.secretPlacement = SecretPlacement::None;
            break;
    }
    return profile;
}

std::string ProfileName(ProfileKind kind) {
    switch (kind) {
        case ProfileKind::KeyedDigest: return "keyed-digest";
        case ProfileKind::Mac: return "mac";
        case ProfileKind::Asymmetric: return "asymmetric";
        case ProfileKind::KeyedMac: return "keyed-mac";
        default: return "unknown";
    }
}

Result<ProfileKind> ParseProfileKind(const std::string& name) {
    if (name == "keyed-digest") return ProfileKind::KeyedDigest;
    if (name == "mac") return ProfileKind::Mac;
    if (name == "asymmetric") return ProfileKind::Asymmetric;
    if (name == "keyed-mac") return ProfileKind::KeyedMac;
    return Error(ErrorCode::ConfigError, "未知的签名串规则: " + name);
}

std::string BuildSigningString(const ParamMap& params,
                               const CanonicalProfile& profile,
                               const std::string& secret) {
    std::vector<std::pair<std::string, std::string>> fields;
    const json& mapping = params.ToMapping();
    fields.reserve(mapping.size());

    for (auto it = mapping.begin(); it != mapping.end(); ++it) {
        const std::string& key = it.key();
        if (key == profile.signField || profile.excludedFields.count(key) > 0) {
            continue;
        }
        if (IsEmptyValue(it.value())) {
            continue;
        }
        fields.emplace_back(key, ValueToString(it.value()));
    }

    if (profile.sortKeys) {
        // std::string 的比较按 unsigned char 逐字节进行，与区域设置无关
        std::sort(fields.begin(), fields.end(),
                  [](const std::pair<std::string, std::string>& a,
                     const std::pair<std::string, std::string>& b) {
                      return a.first < b.first;
                  });
    }

    std::string result;
    if (profile.secretPlacement == SecretPlacement::PrependRaw) {
        result += secret;
    }

    bool first = true;
    for (const auto& field : fields) {
        if (profile.join == JoinStyle::Pairs) {
            if (!first) {
                result += "&";
            }
            result += field.first;
            result += "=";
        }
        result += field.second;
        first = false;
    }

    if (profile.secretPlacement == SecretPlacement::AppendKeyParam) {
        if (profile.join == JoinStyle::Pairs) {
            result += fields.empty() ? "key=" : "&key=";
        }
        result += secret;
    }
    return result;
}

} // namespace params
} // namespace paykit
