#include "paykit/params/param_map.hpp"
#include "paykit/params/canonical.hpp"
#include "paykit/utils/tools.hpp"

namespace paykit {
namespace params {

std::string ValueToString(const json& value) {
    switch (value.type()) {
        case json::value_t::null:
            return "";
        case json::value_t::string:
            return value.get<std::string>();
        case json::value_t::boolean:
            return value.get<bool>() ? "true" : "false";
        default:
            // 数字、对象、数组
            return value.dump(-1, ' ', false, json::error_handler_t::replace);
    }
}

bool IsEmptyValue(const json& value) {
    if (value.is_null()) {
        return true;
    }
    return value.is_string() && value.get_ref<const std::string&>().empty();
}

void ParamMap::SetRaw(const std::string& key, const json& value) {
    // ordered_json 对已存在的键原位覆盖，保留原插入位置
    data_[key] = value;
}

ParamMap& ParamMap::Set(const std::string& key, const json& value) {
    if (!IsEmptyValue(value)) {
        SetRaw(key, value);
    }
    return *this;
}

ParamMap& ParamMap::Set(const std::string& key, const ParamMap& nested) {
    SetRaw(key, nested.data_);
    return *this;
}

json ParamMap::Get(const std::string& key, const json& defaultValue) const {
    auto it = data_.find(key);
    if (it == data_.end()) {
        return defaultValue;
    }
    return *it;
}

std::string ParamMap::GetString(const std::string& key, const std::string& defaultValue) const {
    auto it = data_.find(key);
    if (it == data_.end()) {
        return defaultValue;
    }
    return ValueToString(*it);
}

ParamMap& ParamMap::Remove(const std::string& key) {
    data_.erase(key);
    return *this;
}

bool ParamMap::Contains(const std::string& key) const {
    return data_.contains(key);
}

ParamMap& ParamMap::Clear() {
    data_ = json::object();
    return *this;
}

ParamMap& ParamMap::Update(const ParamMap& other) {
    return Update(other.data_);
}

ParamMap& ParamMap::Update(const json& object) {
    if (!object.is_object()) {
        return *this;
    }
    for (auto it = object.begin(); it != object.end(); ++it) {
        Set(it.key(), it.value());
    }
    return *this;
}

ParamMap& ParamMap::FilterEmpty() {
    json filtered = json::object();
    for (auto it = data_.begin(); it != data_.end(); ++it) {
        if (!IsEmptyValue(it.value())) {
            filtered[it.key()] = it.value();
        }
    }
    data_ = std::move(filtered);
    return *this;
}

std::vector<std::string> ParamMap::Keys() const {
    std::vector<std::string> keys;
    keys.reserve(data_.size());
    for (auto it = data_.begin(); it != data_.end(); ++it) {
        keys.push_back(it.key());
    }
    return keys;
}

std::string ParamMap::ToJsonText() const {
    return data_.dump(-1, ' ', false, json::error_handler_t::replace);
}

Result<std::string> ParamMap::ToQueryText() const {
    std::string query;
    for (auto it = data_.begin(); it != data_.end(); ++it) {
        auto key = utils::PercentEncode(it.key());
        if (!key.ok()) {
            return key.error();
        }
        auto value = utils::PercentEncode(ValueToString(it.value()));
        if (!value.ok()) {
            return value.error();
        }
        if (!query.empty()) {
            query += "&";
        }
        query += key.value() + "=" + value.value();
    }
    return query;
}

std::string ParamMap::ToSigningText(const CanonicalProfile& profile, const std::string& secret) const {
    return BuildSigningString(*this, profile, secret);
}

Result<ParamMap> ParamMap::FromJsonText(const std::string& text) {
    json parsed;
    try {
        parsed = json::parse(text);
    } catch (const json::parse_error& e) {
        return Error(ErrorCode::FormatError, std::string("JSON解析失败: ") + e.what());
    }

    if (!parsed.is_object()) {
        return Error(ErrorCode::FormatError, "JSON报文不是对象");
    }
    return FromMapping(parsed);
}

Result<ParamMap> ParamMap::FromQueryText(const std::string& text) {
    ParamMap result;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t end = text.find('&', pos);
        if (end == std::string::npos) {
            end = text.size();
        }
        std::string pair = text.substr(pos, end - pos);
        pos = end + 1;

        if (pair.empty()) {
            continue;
        }

        size_t eq = pair.find('=');
        std::string rawKey = pair.substr(0, eq);
        std::string rawValue = eq == std::string::npos ? "" : pair.substr(eq + 1);

        auto key = utils::PercentDecode(rawKey);
        if (!key.ok()) {
            return key.error();
        }
        if (key.value().empty()) {
            return Error(ErrorCode::FormatError, "表单字段名为空");
        }
        auto value = utils::PercentDecode(rawValue);
        if (!value.ok()) {
            return value.error();
        }
        // 重复的字段以第一次出现的值为准
        if (!result.Contains(key.value())) {
            result.SetRaw(key.value(), value.value());
        }
    }
    return result;
}

ParamMap ParamMap::FromMapping(const json& object) {
    ParamMap result;
    if (!object.is_object()) {
        return result;
    }
    for (auto it = object.begin(); it != object.end(); ++it) {
        result.SetRaw(it.key(), it.value());
    }
    return result;
}

} // namespace params
} // namespace paykit
