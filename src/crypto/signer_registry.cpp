#include "paykit/crypto/signer_registry.hpp"
#include "paykit/utils/logger.hpp"

namespace paykit {
namespace crypto {

SignerRegistry::SignerRegistry() : table_(std::make_shared<const Table>()) {}

std::shared_ptr<SignerRegistry> SignerRegistry::NewDefault() {
    auto registry = std::make_shared<SignerRegistry>();
    RegisterBuiltinSigners(*registry);
    return registry;
}

SignerRegistry& SignerRegistry::Default() {
    static std::shared_ptr<SignerRegistry> instance = NewDefault();
    return *instance;
}

std::shared_ptr<const SignerRegistry::Table> SignerRegistry::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_;
}

void SignerRegistry::Register(const std::string& algorithm, SignerFactoryFn factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto next = std::make_shared<Table>(*table_);
    if (next->count(algorithm) > 0) {
        utils::GetLogger().Info("覆盖已注册的签名算法",
            utils::LogContext().With("algorithm", algorithm));
    }
    (*next)[algorithm] = std::move(factory);
    table_ = std::move(next);
}

bool SignerRegistry::Contains(const std::string& algorithm) const {
    auto table = Snapshot();
    return table->count(algorithm) > 0;
}

std::vector<std::string> SignerRegistry::Algorithms() const {
    auto table = Snapshot();
    std::vector<std::string> names;
    names.reserve(table->size());
    for (const auto& entry : *table) {
        names.push_back(entry.first);
    }
    return names;
}

Result<Signer> SignerRegistry::Get(const std::string& algorithm, const KeyMaterial& key) const {
    auto table = Snapshot();
    auto it = table->find(algorithm);
    if (it == table->end()) {
        return Error(ErrorCode::UnsupportedAlgorithm, "不支持的签名类型: " + algorithm);
    }
    if (!it->second) {
        return Error(ErrorCode::UnsupportedAlgorithm, "签名类型未提供工厂函数: " + algorithm);
    }

    auto signer = it->second(key);
    if (signer.ok() && !signer.value().IsConfigured()) {
        signer = Error(ErrorCode::InvalidKeyMaterial, "工厂函数返回了未配置的签名器: " + algorithm);
    }
    if (!signer.ok()) {
        utils::GetLogger().Error("构造签名器失败",
            utils::LogContext()
                .With("algorithm", algorithm)
                .With("error", signer.error().what()));
    }
    return signer;
}

void RegisterBuiltinSigners(SignerRegistry& registry) {
    registry.Register(MD5_SIGN, [](const KeyMaterial& key) {
        return NewDigestSigner(MD5_SIGN, key.secret, DigestAlgorithm::MD5, SecretSuffix::None);
    });
    registry.Register(HMAC_SHA256_SIGN, [](const KeyMaterial& key) {
        return NewMACSigner(HMAC_SHA256_SIGN, key.secret, DigestAlgorithm::SHA256);
    });
    registry.Register(RSA_SIGN, [](const KeyMaterial& key) {
        return NewRSASigner(RSA_SIGN, key, RSAProfile::Legacy);
    });
    registry.Register(RSA2_SIGN, [](const KeyMaterial& key) {
        return NewRSASigner(RSA2_SIGN, key, RSAProfile::Modern);
    });
}

} // namespace crypto
} // namespace paykit
