#include "paykit/notify/notify.hpp"
#include "paykit/params/xml_map.hpp"
#include "paykit/utils/logger.hpp"
#include <exception>

namespace paykit {
namespace notify {

std::string NotifyStateToString(NotifyState state) {
    switch (state) {
        case NotifyState::Received:     return "received";
        case NotifyState::Parsed:       return "parsed";
        case NotifyState::Verified:     return "verified";
        case NotifyState::Dispatched:   return "dispatched";
        case NotifyState::Acknowledged: return "acknowledged";
        case NotifyState::Rejected:     return "rejected";
        default:                        return "unknown";
    }
}

ResponseData NotifyOutcome::ToResponse() const {
    if (success) {
        ResponseData::json data = ResponseData::json::object();
        data["state"] = NotifyStateToString(state);
        data["fields"] = fields ? fields->ToMapping() : ResponseData::json::object();
        return ResponseData::Success(data, acknowledgement);
    }
    return ResponseData::FromError(error, acknowledgement);
}

Result<NotifyVerifier> NotifyVerifier::Create(const ChannelConfig& config,
                                              const crypto::SignerRegistry& registry) {
    auto signer = ChannelSigner::Create(config, registry);
    if (!signer.ok()) {
        return signer.error();
    }
    return NotifyVerifier(signer.value());
}

Result<params::ParamMap> NotifyVerifier::Parse(const std::string& raw) const {
    const ChannelInfo& info = signer_.Info();
    switch (info.format) {
        case WireFormat::Xml: {
            auto doc = params::XmlMap::Parse(raw, info.xmlRoot);
            if (!doc.ok()) {
                return doc.error();
            }
            return doc.value().ToParamMap();
        }
        case WireFormat::Json:
            return params::ParamMap::FromJsonText(raw);
        case WireFormat::Form:
        default:
            return params::ParamMap::FromQueryText(raw);
    }
}

Error NotifyVerifier::Verify(params::ParamMap& fields) const {
    if (!signer_.GetSigner().IsConfigured()) {
        return Error(ErrorCode::SignatureError, "渠道签名器未配置，拒绝所有通知");
    }

    const std::string& signField = signer_.Info().signField;
    std::string signature = fields.GetString(signField);
    fields.Remove(signField);

    if (signature.empty()) {
        return Error(ErrorCode::SignatureError, "通知缺少签名字段: " + signField);
    }

    std::string content = signer_.NotifySigningString(fields);
    if (!signer_.GetSigner().Verify(content, signature)) {
        return Error(ErrorCode::SignatureError, "通知验签失败");
    }
    return Error();
}

NotifyOutcome NotifyVerifier::Reject(NotifyOutcome outcome, const Error& error) const {
    outcome.lastState = outcome.state;
    outcome.state = NotifyState::Rejected;
    outcome.error = error;
    outcome.acknowledgement = FailureResponse();

    utils::GetLogger().Warn("拒绝异步通知",
        utils::LogContext()
            .With("channel", signer_.Info().name)
            .With("state", NotifyStateToString(outcome.lastState))
            .With("code", ErrorCodeToString(error.code()))
            .With("error", error.what()));
    return outcome;
}

NotifyOutcome NotifyVerifier::Acknowledge(NotifyOutcome outcome, const Error& callbackErr) const {
    outcome.lastState = outcome.state;
    outcome.state = NotifyState::Acknowledged;
    outcome.error = callbackErr;
    outcome.success = callbackErr.ok();

    if (outcome.success) {
        outcome.acknowledgement = SuccessResponse();
        utils::GetLogger().Debug("异步通知处理成功",
            utils::LogContext()
                .With("channel", signer_.Info().name)
                .With("fields", std::to_string(outcome.fields ? outcome.fields->Size() : 0)));
    } else {
        outcome.acknowledgement = FailureResponse();
        utils::GetLogger().Error("通知业务回调失败",
            utils::LogContext()
                .With("channel", signer_.Info().name)
                .With("code", ErrorCodeToString(callbackErr.code()))
                .With("error", callbackErr.what()));
    }
    return outcome;
}

NotifyOutcome NotifyVerifier::Process(const std::string& raw, const NotifyCallback& callback) const {
    NotifyOutcome outcome;
    outcome.state = NotifyState::Received;

    if (raw.empty()) {
        return Reject(std::move(outcome), Error(ErrorCode::FormatError, "通知报文为空"));
    }

    auto parsed = Parse(raw);
    if (!parsed.ok()) {
        return Reject(std::move(outcome), Error(ErrorCode::FormatError, parsed.error().what()));
    }
    params::ParamMap fields = parsed.value();
    outcome.state = NotifyState::Parsed;

    Error verifyErr = Verify(fields);
    outcome.fields = fields;
    if (verifyErr.hasError()) {
        return Reject(std::move(outcome), verifyErr);
    }
    outcome.state = NotifyState::Verified;

    // 回调异常在这里统一兜住，渠道只会收到失败应答
    // 未提供回调视为业务成功
    Error callbackErr;
    outcome.state = NotifyState::Dispatched;
    if (callback) {
        try {
            auto handled = callback(fields);
            if (!handled.ok()) {
                callbackErr = Error(ErrorCode::CallbackFailure, handled.error().what());
            } else if (!handled.value()) {
                callbackErr = Error(ErrorCode::CallbackFailure, "业务回调返回失败");
            }
        } catch (const std::exception& e) {
            callbackErr = Error(ErrorCode::CallbackFailure, std::string("业务回调异常: ") + e.what());
        } catch (...) {
            callbackErr = Error(ErrorCode::CallbackFailure, "业务回调抛出未知异常");
        }
    }

    return Acknowledge(std::move(outcome), callbackErr);
}

} // namespace notify
} // namespace paykit
