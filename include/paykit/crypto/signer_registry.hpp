#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "paykit/types.hpp"
#include "paykit/crypto/signer.hpp"

namespace paykit {
namespace crypto {

// 由密钥材料构造签名器
using SignerFactoryFn = std::function<Result<Signer>(const KeyMaterial&)>;

// 算法标识 -> 签名器工厂
// 写入时整表复制后替换，读者拿到的总是一张完整的表
class SignerRegistry {
public:
    SignerRegistry();

    // 带内置算法的注册表: MD5, HMAC-SHA256, RSA, RSA2
    static std::shared_ptr<SignerRegistry> NewDefault();

    // 进程级默认实例，只应在最外层装配处使用
    static SignerRegistry& Default();

    // 同名覆盖
    void Register(const std::string& algorithm, SignerFactoryFn factory);

    bool Contains(const std::string& algorithm) const;
    std::vector<std::string> Algorithms() const;

    // 未注册返回 UnsupportedAlgorithm；密钥无法解析返回 InvalidKeyMaterial
    Result<Signer> Get(const std::string& algorithm, const KeyMaterial& key) const;

private:
    using Table = std::map<std::string, SignerFactoryFn>;

    std::shared_ptr<const Table> Snapshot() const;

    mutable std::mutex mutex_;
    std::shared_ptr<const Table> table_;
};

// 注册内置算法
void RegisterBuiltinSigners(SignerRegistry& registry);

} // namespace crypto
} // namespace paykit
