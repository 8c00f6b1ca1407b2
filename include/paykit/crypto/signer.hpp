#pragma once

#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <openssl/evp.h>
#include "paykit/types.hpp"

namespace paykit {
namespace crypto {

enum class DigestAlgorithm {
    MD5,
    SHA1,
    SHA256
};

const EVP_MD* ToEVP(DigestAlgorithm digest);

// 配置方提供的密钥材料，按算法取用其中的字段
struct KeyMaterial {
    std::string secret;       // 对称密钥
    std::string privateKey;   // PEM 或裸 base64
    std::string publicKey;    // PEM 或裸 base64
};

// 共享密钥摘要的密钥位置
enum class SecretSuffix {
    None,     // 密钥已由签名串规则拼入内容
    Concat    // digest(content || secret)
};

// RSA 摘要/填充组合
enum class RSAProfile {
    Legacy,   // PKCS1v15 + SHA1  ("RSA")
    Modern    // PKCS1v15 + SHA256 ("RSA2")
};

using EVPKeyPtr = std::shared_ptr<EVP_PKEY>;

// 共享密钥摘要，输出大写十六进制
struct SharedSecretDigest {
    std::string secret;
    DigestAlgorithm digest = DigestAlgorithm::MD5;
    SecretSuffix suffix = SecretSuffix::None;
};

// HMAC，输出大写十六进制
struct SharedSecretMAC {
    std::string secret;
    DigestAlgorithm digest = DigestAlgorithm::SHA256;
};

// RSA 签名，输出 base64；私钥/公钥可以只有其一
struct AsymmetricSignature {
    EVPKeyPtr privateKey;
    EVPKeyPtr publicKey;
    RSAProfile profile = RSAProfile::Modern;
};

// 自定义算法
struct CustomSignature {
    std::function<Result<std::string>(const std::string&)> sign;
    std::function<bool(const std::string&, const std::string&)> verify;
};

// 签名器。调用方只看到 Sign / Verify，不关心背后是哪种实现
// 默认构造的签名器未配置任何算法：Sign 返回 SignFailure，Verify 总是 false
class Signer {
public:
    using Variant = std::variant<std::monostate, SharedSecretDigest, SharedSecretMAC,
                                 AsymmetricSignature, CustomSignature>;

    Signer() = default;
    Signer(std::string algorithm, Variant impl)
        : algorithm_(std::move(algorithm)), impl_(std::move(impl)) {}

    const std::string& Algorithm() const { return algorithm_; }
    const Variant& Impl() const { return impl_; }

    // 对称实现结果确定；RSA PKCS1v15 同样确定，但调用方不应依赖
    Result<std::string> Sign(const std::string& content) const;

    // 对称实现使用恒定时间比较；签名格式非法时返回 false，不抛异常
    bool Verify(const std::string& content, const std::string& signature) const;

    bool IsSymmetric() const;
    bool IsConfigured() const { return !std::holds_alternative<std::monostate>(impl_); }

private:
    std::string algorithm_;
    Variant impl_;
};

// 构造函数，密钥材料在此一次性校验
Result<Signer> NewDigestSigner(const std::string& algorithm, const std::string& secret,
                               DigestAlgorithm digest, SecretSuffix suffix = SecretSuffix::None);
Result<Signer> NewMACSigner(const std::string& algorithm, const std::string& secret,
                            DigestAlgorithm digest);
Result<Signer> NewRSASigner(const std::string& algorithm, const KeyMaterial& key, RSAProfile profile);
Result<Signer> NewCustomSigner(const std::string& algorithm, CustomSignature impl);

// 解析RSA密钥，接受 PEM（PKCS#8 / PKCS#1 / SPKI）或不带头尾的 base64
Result<EVPKeyPtr> LoadRSAPrivateKey(const std::string& keyText);
Result<EVPKeyPtr> LoadRSAPublicKey(const std::string& keyText);

} // namespace crypto
} // namespace paykit
