#include "paykit/response.hpp"

namespace paykit {

ResponseData ResponseData::Success(json data, std::optional<std::string> rawResponse) {
    ResponseData response;
    response.success_ = true;
    response.data_ = std::move(data);
    response.rawResponse_ = std::move(rawResponse);
    return response;
}

ResponseData ResponseData::Failure(std::string error,
                                   std::optional<std::string> code,
                                   std::optional<std::string> rawResponse) {
    ResponseData response;
    response.success_ = false;
    response.error_ = std::move(error);
    response.code_ = std::move(code);
    response.rawResponse_ = std::move(rawResponse);
    return response;
}

ResponseData ResponseData::FromError(const Error& error, std::optional<std::string> rawResponse) {
    return Failure(error.what(), ErrorCodeToString(error.code()), std::move(rawResponse));
}

ResponseData::json ResponseData::ToJson() const {
    json j = json::object();
    j["success"] = success_;
    j["data"] = data_ ? *data_ : json(nullptr);
    j["error"] = error_ ? json(*error_) : json(nullptr);
    j["code"] = code_ ? json(*code_) : json(nullptr);
    j["raw_response"] = rawResponse_ ? json(*rawResponse_) : json(nullptr);
    return j;
}

} // namespace paykit
