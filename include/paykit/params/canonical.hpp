#pragma once

#include <set>
#include <string>
#include "paykit/types.hpp"
#include "paykit/params/param_map.hpp"

namespace paykit {
namespace params {

// 签名串规则
//   KeyedDigest (A): 排除sign和空值，升序，k=v&...，串尾追加 &key=SECRET
//   Mac         (B): 排除sign和空值，升序，k=v&...，密钥只交给MAC
//   Asymmetric  (C): 排除sign和空值，升序，k=v&...，私钥只交给签名器
//   KeyedMac    (D): 同A，且MAC也使用同一密钥
enum class ProfileKind {
    KeyedDigest,
    Mac,
    Asymmetric,
    KeyedMac
};

enum class JoinStyle {
    Pairs,       // k=v&k=v
    ValuesOnly   // 只拼接值，无分隔符
};

enum class SecretPlacement {
    None,            // 密钥不进入签名串
    AppendKeyParam,  // 追加 &key=SECRET（ValuesOnly 时直接追加 SECRET）
    PrependRaw       // 串首直接拼接 SECRET
};

struct CanonicalProfile {
    ProfileKind kind = ProfileKind::Mac;
    std::string signField = SIGN_FIELD;
    std::set<std::string> excludedFields;   // 除签名字段外额外排除的字段
    bool sortKeys = true;                   // 按字节升序
    JoinStyle join = JoinStyle::Pairs;
    SecretPlacement secretPlacement = SecretPlacement::None;
};

// 预置规则
CanonicalProfile MakeProfile(ProfileKind kind);

// 配置中使用的名称: keyed-digest / mac / asymmetric / keyed-mac
std::string ProfileName(ProfileKind kind);
Result<ProfileKind> ParseProfileKind(const std::string& name);

// 构造签名串。空值字段总是被排除，包括解析不可信输入时带进来的空值
std::string BuildSigningString(const ParamMap& params,
                               const CanonicalProfile& profile,
                               const std::string& secret = "");

} // namespace params
} // namespace paykit
