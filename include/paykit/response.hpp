#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "paykit/types.hpp"

namespace paykit {

// 统一的返回值: success / data / error / code / raw_response
// success 时没有 error 和 code；失败时没有 data。构造后不可修改
class ResponseData {
public:
    using json = nlohmann::ordered_json;

    static ResponseData Success(json data, std::optional<std::string> rawResponse = std::nullopt);
    static ResponseData Failure(std::string error,
                                std::optional<std::string> code = std::nullopt,
                                std::optional<std::string> rawResponse = std::nullopt);
    // code 取 ErrorCodeToString
    static ResponseData FromError(const Error& error,
                                  std::optional<std::string> rawResponse = std::nullopt);

    bool IsSuccess() const { return success_; }
    const std::optional<json>& Data() const { return data_; }
    const std::optional<std::string>& ErrorMessage() const { return error_; }
    const std::optional<std::string>& Code() const { return code_; }
    const std::optional<std::string>& RawResponse() const { return rawResponse_; }

    // 缺省字段输出为 null
    json ToJson() const;

private:
    ResponseData() = default;

    bool success_ = false;
    std::optional<json> data_;
    std::optional<std::string> error_;
    std::optional<std::string> code_;
    std::optional<std::string> rawResponse_;
};

} // namespace paykit
