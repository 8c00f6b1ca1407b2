#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "paykit/types.hpp"

namespace paykit {
namespace params {

// 保持插入顺序的JSON值
using json = nlohmann::ordered_json;

struct CanonicalProfile;

// 将标量/嵌套值渲染为文本：字符串原样，数字取JSON文本，布尔为true/false，嵌套对象为紧凑JSON
std::string ValueToString(const json& value);

// 值为null或空字符串
bool IsEmptyValue(const json& value);

// 请求/应答参数容器
// Set 会自动过滤 null 和空字符串；解析得到的容器不经过过滤，签名时再做一次
class ParamMap {
public:
    ParamMap() : data_(json::object()) {}

    // 设置参数，value 为 null 或 "" 时忽略（已有的值保持不变）
    ParamMap& Set(const std::string& key, const json& value);
    ParamMap& Set(const std::string& key, const ParamMap& nested);

    // 取值，不存在时返回 defaultValue
    json Get(const std::string& key, const json& defaultValue = nullptr) const;

    // 按类型取值，类型不匹配时返回 defaultValue
    template<typename T>
    T GetAs(const std::string& key, const T& defaultValue) const {
        auto it = data_.find(key);
        if (it == data_.end()) {
            return defaultValue;
        }
        try {
            return it->template get<T>();
        } catch (const json::exception&) {
            return defaultValue;
        }
    }

    // 取值并渲染为文本
    std::string GetString(const std::string& key, const std::string& defaultValue = "") const;

    ParamMap& Remove(const std::string& key);
    bool Contains(const std::string& key) const;
    ParamMap& Clear();

    // 合并，规则与 Set 相同
    ParamMap& Update(const ParamMap& other);
    ParamMap& Update(const json& object);

    // 丢弃解析时带入的 null / 空字符串
    ParamMap& FilterEmpty();

    size_t Size() const { return data_.size(); }
    bool Empty() const { return data_.empty(); }
    std::vector<std::string> Keys() const;

    // 按插入顺序的键值视图
    const json& ToMapping() const { return data_; }

    // JSON文本（UTF-8，不转义非ASCII字符）
    std::string ToJsonText() const;

    // 传输用 k=v&k=v，按插入顺序，RFC 3986 百分号编码
    Result<std::string> ToQueryText() const;

    // 签名串，见 canonical.hpp
    std::string ToSigningText(const CanonicalProfile& profile, const std::string& secret = "") const;

    // 解析不可信输入，不做空值过滤
    static Result<ParamMap> FromJsonText(const std::string& text);
    static Result<ParamMap> FromQueryText(const std::string& text);

    // 直接包装一个JSON对象，不做空值过滤；非对象返回空容器
    static ParamMap FromMapping(const json& object);

    bool operator==(const ParamMap& other) const { return data_ == other.data_; }
    bool operator!=(const ParamMap& other) const { return !(*this == other); }

private:
    void SetRaw(const std::string& key, const json& value);

    json data_;
};

} // namespace params
} // namespace paykit
