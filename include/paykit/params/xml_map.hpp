#pragma once

#include <string>
#include <utility>
#include <vector>
#include "paykit/types.hpp"
#include "paykit/params/param_map.hpp"

namespace paykit {
namespace params {

// XML报文容器（微信/QQ钱包）
// 一层子元素对应一个字段，值一律为文本
class XmlMap {
public:
    explicit XmlMap(std::string rootName = "xml") : rootName_(std::move(rootName)) {}

    // 空值忽略；键必须是合法的元素名，否则忽略并记录告警
    XmlMap& Set(const std::string& key, const std::string& value);
    XmlMap& Set(const std::string& key, const char* value);
    XmlMap& Set(const std::string& key, const json& value);

    std::string Get(const std::string& key, const std::string& defaultValue = "") const;
    XmlMap& Remove(const std::string& key);
    bool Contains(const std::string& key) const;

    size_t Size() const { return entries_.size(); }
    bool Empty() const { return entries_.empty(); }
    std::vector<std::string> Keys() const;
    const std::string& RootName() const { return rootName_; }

    // 序列化；值中含有标记字符时用 CDATA 包裹
    std::string Serialize() const;
    std::string Serialize(const std::string& rootTag) const;

    // 解析；格式错误或根元素不匹配时返回 FormatError
    static Result<XmlMap> Parse(const std::string& text, const std::string& rootTag = "xml");

    // 展开为参数容器，供签名串使用
    ParamMap ToParamMap() const;
    static XmlMap FromParamMap(const ParamMap& params, const std::string& rootTag = "xml");

    bool operator==(const XmlMap& other) const { return entries_ == other.entries_; }
    bool operator!=(const XmlMap& other) const { return !(*this == other); }

private:
    void SetRaw(const std::string& key, const std::string& value);

    std::string rootName_;
    std::vector<std::pair<std::string, std::string>> entries_;
};

// 是否为可用的XML元素名
bool IsValidElementName(const std::string& name);

} // namespace params
} // namespace paykit
