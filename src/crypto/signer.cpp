#include "paykit/crypto/signer.hpp"
#include "paykit/utils/logger.hpp"
#include "paykit/utils/tools.hpp"
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <exception>

namespace paykit {
namespace crypto {

namespace {

EVPKeyPtr WrapKey(EVP_PKEY* key) {
    return EVPKeyPtr(key, EVP_PKEY_free);
}

// 裸 base64 按 64 字符一行包成 PEM
std::string ToPEM(const std::string& body, const std::string& label) {
    std::string compact;
    compact.reserve(body.size());
    for (char c : body) {
        if (c != '\n' && c != '\r' && c != ' ' && c != '\t') {
            compact.push_back(c);
        }
    }

    std::string pem = "-----BEGIN " + label + "-----\n";
    for (size_t i = 0; i < compact.size(); i += 64) {
        pem += compact.substr(i, 64);
        pem += "\n";
    }
    pem += "-----END " + label + "-----\n";
    return pem;
}

bool HasPEMHeader(const std::string& text) {
    return text.find("-----BEGIN") != std::string::npos;
}

EVP_PKEY* ReadPrivateKeyPEM(const std::string& pem) {
    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio) {
        return nullptr;
    }
    EVP_PKEY* key = PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    return key;
}

EVP_PKEY* ReadPublicKeyPEM(const std::string& pem) {
    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio) {
        return nullptr;
    }

    EVP_PKEY* key = nullptr;
    if (pem.find("BEGIN CERTIFICATE") != std::string::npos) {
        // 证书形式的公钥
        X509* cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
        if (cert) {
            key = X509_get_pubkey(cert);
            X509_free(cert);
        }
    } else {
        key = PEM_read_bio_PUBKEY(bio, nullptr, nullptr, nullptr);
    }
    BIO_free(bio);
    return key;
}

Error CheckRSA(EVP_PKEY* key) {
    if (EVP_PKEY_id(key) != EVP_PKEY_RSA) {
        return Error(ErrorCode::InvalidKeyMaterial, "密钥不是RSA密钥");
    }
    return Error();
}

DigestAlgorithm RSADigest(RSAProfile profile) {
    return profile == RSAProfile::Legacy ? DigestAlgorithm::SHA1 : DigestAlgorithm::SHA256;
}

Result<std::string> SignSymmetric(const SharedSecretDigest& impl, const std::string& content) {
    std::string data = content;
    if (impl.suffix == SecretSuffix::Concat) {
        data += impl.secret;
    }
    auto digest = utils::CalculateDigest(data, ToEVP(impl.digest));
    if (!digest.ok()) {
        return digest.error();
    }
    return utils::ToUpper(utils::HexEncode(digest.value()));
}

Result<std::string> SignSymmetric(const SharedSecretMAC& impl, const std::string& content) {
    auto mac = utils::CalculateHMAC(impl.secret, content, ToEVP(impl.digest));
    if (!mac.ok()) {
        return mac.error();
    }
    return utils::ToUpper(utils::HexEncode(mac.value()));
}

Result<std::string> SignRSA(const AsymmetricSignature& impl, const std::string& content) {
    if (!impl.privateKey) {
        return Error(ErrorCode::SignFailure, "未配置私钥，无法签名");
    }

    auto digest = utils::CalculateDigest(content, ToEVP(RSADigest(impl.profile)));
    if (!digest.ok()) {
        return digest.error();
    }

    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new(impl.privateKey.get(), nullptr);
    if (!ctx) {
        return Error(ErrorCode::SignFailure, "Failed to create signing context");
    }

    if (EVP_PKEY_sign_init(ctx) <= 0) {
        EVP_PKEY_CTX_free(ctx);
        return Error(ErrorCode::SignFailure, "Failed to initialize signing: " + utils::OpenSSLErrorString());
    }

    if (EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_PADDING) <= 0) {
        EVP_PKEY_CTX_free(ctx);
        return Error(ErrorCode::SignFailure, "Failed to set PKCS1 padding");
    }

    if (EVP_PKEY_CTX_set_signature_md(ctx, ToEVP(RSADigest(impl.profile))) <= 0) {
        EVP_PKEY_CTX_free(ctx);
        return Error(ErrorCode::SignFailure, "Failed to set signature hash");
    }

    size_t sigLen = 0;
    const std::vector<uint8_t>& md = digest.value();
    if (EVP_PKEY_sign(ctx, nullptr, &sigLen, md.data(), md.size()) <= 0) {
        EVP_PKEY_CTX_free(ctx);
        return Error(ErrorCode::SignFailure, "Failed to determine signature length: " + utils::OpenSSLErrorString());
    }

    std::vector<uint8_t> signature(sigLen);
    if (EVP_PKEY_sign(ctx, signature.data(), &sigLen, md.data(), md.size()) <= 0) {
        EVP_PKEY_CTX_free(ctx);
        return Error(ErrorCode::SignFailure, "RSA签名失败: " + utils::OpenSSLErrorString());
    }
    EVP_PKEY_CTX_free(ctx);

    signature.resize(sigLen);
    return utils::Base64Encode(signature);
}

bool VerifyRSA(const AsymmetricSignature& impl, const std::string& content, const std::string& signature) {
    // 只有私钥时用其公钥部分验签
    EVP_PKEY* key = impl.publicKey ? impl.publicKey.get() : impl.privateKey.get();
    if (key == nullptr) {
        return false;
    }

    auto sig = utils::Base64Decode(signature);
    if (!sig.ok() || sig.value().empty()) {
        return false;
    }
    if (static_cast<int>(sig.value().size()) != EVP_PKEY_size(key)) {
        return false;
    }

    auto digest = utils::CalculateDigest(content, ToEVP(RSADigest(impl.profile)));
    if (!digest.ok()) {
        return false;
    }

    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new(key, nullptr);
    if (!ctx) {
        return false;
    }

    bool valid = EVP_PKEY_verify_init(ctx) > 0 &&
                 EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_PADDING) > 0 &&
                 EVP_PKEY_CTX_set_signature_md(ctx, ToEVP(RSADigest(impl.profile))) > 0 &&
                 EVP_PKEY_verify(ctx, sig.value().data(), sig.value().size(),
                                 digest.value().data(), digest.value().size()) == 1;
    EVP_PKEY_CTX_free(ctx);

    // 验签失败会在错误队列里留下记录，清掉避免污染后续调用
    ERR_clear_error();
    return valid;
}

} // namespace

const EVP_MD* ToEVP(DigestAlgorithm digest) {
    switch (digest) {
        case DigestAlgorithm::MD5: return EVP_md5();
        case DigestAlgorithm::SHA1: return EVP_sha1();
        case DigestAlgorithm::SHA256: return EVP_sha256();
        default: return EVP_sha256();
    }
}

Result<std::string> Signer::Sign(const std::string& content) const {
    if (!IsConfigured()) {
        return Error(ErrorCode::SignFailure, "签名器未配置");
    }
    if (const auto* digest = std::get_if<SharedSecretDigest>(&impl_)) {
        return SignSymmetric(*digest, content);
    }
    if (const auto* mac = std::get_if<SharedSecretMAC>(&impl_)) {
        return SignSymmetric(*mac, content);
    }
    if (const auto* rsa = std::get_if<AsymmetricSignature>(&impl_)) {
        return SignRSA(*rsa, content);
    }

    const auto& custom = std::get<CustomSignature>(impl_);
    if (!custom.sign) {
        return Error(ErrorCode::SignFailure, "自定义签名器未提供签名函数: " + algorithm_);
    }
    try {
        return custom.sign(content);
    } catch (const std::exception& e) {
        return Error(ErrorCode::SignFailure, "自定义签名器异常: " + std::string(e.what()));
    }
}

bool Signer::Verify(const std::string& content, const std::string& signature) const {
    if (!IsConfigured() || signature.empty()) {
        return false;
    }

    if (std::holds_alternative<SharedSecretDigest>(impl_) ||
        std::holds_alternative<SharedSecretMAC>(impl_)) {
        auto expected = Sign(content);
        if (!expected.ok()) {
            return false;
        }
        return utils::ConstantTimeEquals(expected.value(), utils::ToUpper(signature));
    }

    if (const auto* rsa = std::get_if<AsymmetricSignature>(&impl_)) {
        return VerifyRSA(*rsa, content, signature);
    }

    const auto& custom = std::get<CustomSignature>(impl_);
    if (!custom.verify) {
        return false;
    }
    try {
        return custom.verify(content, signature);
    } catch (const std::exception& e) {
        utils::GetLogger().Error("自定义验签函数异常",
            utils::LogContext().With("algorithm", algorithm_).With("error", e.what()));
        return false;
    }
}

bool Signer::IsSymmetric() const {
    return std::holds_alternative<SharedSecretDigest>(impl_) ||
           std::holds_alternative<SharedSecretMAC>(impl_);
}

Result<Signer> NewDigestSigner(const std::string& algorithm, const std::string& secret,
                               DigestAlgorithm digest, SecretSuffix suffix) {
    if (secret.empty()) {
        return Error(ErrorCode::InvalidKeyMaterial, algorithm + " 需要非空的共享密钥");
    }
    SharedSecretDigest impl;
    impl.secret = secret;
    impl.digest = digest;
    impl.suffix = suffix;
    return Signer(algorithm, impl);
}

Result<Signer> NewMACSigner(const std::string& algorithm, const std::string& secret,
                            DigestAlgorithm digest) {
    if (secret.empty()) {
        return Error(ErrorCode::InvalidKeyMaterial, algorithm + " 需要非空的共享密钥");
    }
    SharedSecretMAC impl;
    impl.secret = secret;
    impl.digest = digest;
    return Signer(algorithm, impl);
}

Result<Signer> NewRSASigner(const std::string& algorithm, const KeyMaterial& key, RSAProfile profile) {
    if (key.privateKey.empty() && key.publicKey.empty()) {
        return Error(ErrorCode::InvalidKeyMaterial, algorithm + " 需要私钥或公钥");
    }

    AsymmetricSignature impl;
    impl.profile = profile;

    if (!key.privateKey.empty()) {
        auto priv = LoadRSAPrivateKey(key.privateKey);
        if (!priv.ok()) {
            return priv.error();
        }
        impl.privateKey = priv.value();
    }
    if (!key.publicKey.empty()) {
        auto pub = LoadRSAPublicKey(key.publicKey);
        if (!pub.ok()) {
            return pub.error();
        }
        impl.publicKey = pub.value();
    }
    return Signer(algorithm, impl);
}

Result<Signer> NewCustomSigner(const std::string& algorithm, CustomSignature impl) {
    if (!impl.sign && !impl.verify) {
        return Error(ErrorCode::InvalidKeyMaterial, algorithm + " 未提供签名或验签函数");
    }
    return Signer(algorithm, std::move(impl));
}

Result<EVPKeyPtr> LoadRSAPrivateKey(const std::string& keyText) {
    EVP_PKEY* key = nullptr;
    if (HasPEMHeader(keyText)) {
        key = ReadPrivateKeyPEM(keyText);
    } else {
        // 先按 PKCS#8，再按 PKCS#1
        key = ReadPrivateKeyPEM(ToPEM(keyText, "PRIVATE KEY"));
        if (!key) {
            ERR_clear_error();
            key = ReadPrivateKeyPEM(ToPEM(keyText, "RSA PRIVATE KEY"));
        }
    }

    if (!key) {
        return Error(ErrorCode::InvalidKeyMaterial, "加载私钥失败: " + utils::OpenSSLErrorString());
    }
    EVPKeyPtr wrapped = WrapKey(key);
    Error err = CheckRSA(key);
    if (err.hasError()) {
        return err;
    }
    return wrapped;
}

Result<EVPKeyPtr> LoadRSAPublicKey(const std::string& keyText) {
    std::string pem = HasPEMHeader(keyText) ? keyText : ToPEM(keyText, "PUBLIC KEY");
    EVP_PKEY* key = ReadPublicKeyPEM(pem);
    if (!key) {
        return Error(ErrorCode::InvalidKeyMaterial, "加载公钥失败: " + utils::OpenSSLErrorString());
    }
    EVPKeyPtr wrapped = WrapKey(key);
    Error err = CheckRSA(key);
    if (err.hasError()) {
        return err;
    }
    return wrapped;
}

} // namespace crypto
} // namespace paykit
