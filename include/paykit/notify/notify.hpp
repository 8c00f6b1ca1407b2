#pragma once

#include <functional>
#include <optional>
#include <string>
#include "paykit/types.hpp"
#include "paykit/response.hpp"
#include "paykit/params/param_map.hpp"
#include "paykit/crypto/signer_registry.hpp"
#include "paykit/notify/channel.hpp"

namespace paykit {
namespace notify {

// 单次通知处理的状态
enum class NotifyState {
    Received,
    Parsed,
    Verified,
    Dispatched,
    Acknowledged,
    Rejected
};

std::string NotifyStateToString(NotifyState state);

// 业务回调。返回 true 表示业务处理成功；预期内的业务失败用 false 或 Error 表达，不要抛异常。
// 渠道可能重复投递同一通知，回调需要自行保证幂等。
using NotifyCallback = std::function<Result<bool>(const params::ParamMap& fields)>;

// 通知处理结果
// 报文/验签失败止于 Rejected；进入 Dispatched 后总是 Acknowledged，
// 回调失败时 success 为 false，error 为 CallbackFailure，应答为渠道失败报文
struct NotifyOutcome {
    NotifyState state = NotifyState::Received;
    NotifyState lastState = NotifyState::Received;   // 进入终态前的最后状态
    bool success = false;                            // 验签通过且业务处理成功
    Error error;
    std::optional<params::ParamMap> fields;          // 解析成功后才有，不含签名字段
    std::string acknowledgement;                     // 原样返回给渠道

    bool Acknowledged() const { return state == NotifyState::Acknowledged; }
    bool Succeeded() const { return success; }

    ResponseData ToResponse() const;
};

// 异步通知验签 + 分发
class NotifyVerifier {
public:
    // 默认构造的验签器没有可用的签名器，拒绝所有通知
    NotifyVerifier() = default;
    explicit NotifyVerifier(ChannelSigner signer) : signer_(std::move(signer)) {}

    static Result<NotifyVerifier> Create(const ChannelConfig& config,
                                         const crypto::SignerRegistry& registry);

    // 单次处理，不保存跨调用状态。任何失败都返回渠道的失败应答，不会抛异常
    NotifyOutcome Process(const std::string& raw, const NotifyCallback& callback) const;

    // 按渠道报文格式解析
    Result<params::ParamMap> Parse(const std::string& raw) const;

    // 取出并移除签名字段后验签
    Error Verify(params::ParamMap& fields) const;

    const std::string& SuccessResponse() const { return signer_.Info().successAck; }
    const std::string& FailureResponse() const { return signer_.Info().failureAck; }

    const ChannelSigner& GetChannelSigner() const { return signer_; }

private:
    NotifyOutcome Reject(NotifyOutcome outcome, const Error& error) const;
    NotifyOutcome Acknowledge(NotifyOutcome outcome, const Error& callbackErr) const;

    ChannelSigner signer_;
};

} // namespace notify
} // namespace paykit
