#pragma once

#include <string>
#include <utility>

namespace paykit {

// 签名算法标识（大小写敏感）
const std::string MD5_SIGN          = "MD5";
const std::string HMAC_SHA256_SIGN  = "HMAC-SHA256";
const std::string RSA_SIGN          = "RSA";    // PKCS1v15 + SHA1
const std::string RSA2_SIGN         = "RSA2";   // PKCS1v15 + SHA256

// 默认签名字段
const std::string SIGN_FIELD = "sign";

// 错误分类
enum class ErrorCode {
    None = 0,
    FormatError,            // 报文格式错误
    UnsupportedAlgorithm,   // 未注册的签名算法
    InvalidKeyMaterial,     // 密钥无法解析
    SignatureError,         // 验签失败或缺少签名
    CallbackFailure,        // 业务回调失败
    ConfigError,            // 配置错误
    SignFailure             // 签名过程失败
};

std::string ErrorCodeToString(ErrorCode code);

// 错误类型
class Error {
public:
    Error() : code_(ErrorCode::None), isError_(false) {}
    explicit Error(const std::string& message)
        : message_(message), code_(ErrorCode::FormatError), isError_(true) {}
    Error(ErrorCode code, const std::string& message)
        : message_(message), code_(code), isError_(code != ErrorCode::None) {}

    const std::string& what() const { return message_; }
    ErrorCode code() const { return code_; }
    bool ok() const { return !isError_; }
    bool hasError() const { return isError_; }

private:
    std::string message_;
    ErrorCode code_;
    bool isError_;
};

// 结果类型
template<typename T>
class Result {
public:
    Result() : hasError_(true) {}
    Result(const T& value) : value_(value), hasError_(false) {}
    Result(T&& value) : value_(std::move(value)), hasError_(false) {}
    Result(const Error& error) : error_(error), hasError_(true) {}

    bool ok() const { return !hasError_; }
    const T& value() const & { return value_; }
    T&& value() && { return std::move(value_); }
    const Error& error() const { return error_; }

private:
    T value_;
    Error error_;
    bool hasError_;
};

} // namespace paykit
