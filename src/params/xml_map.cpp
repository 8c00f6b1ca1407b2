#include "paykit/params/xml_map.hpp"
#include "paykit/utils/logger.hpp"
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <boost/property_tree/detail/rapidxml.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace pt = boost::property_tree;
namespace rx = boost::property_tree::detail::rapidxml;

namespace paykit {
namespace params {

namespace {

const std::string XML_ATTR = "<xmlattr>";
const std::string XML_COMMENT = "<xmlcomment>";

bool NeedsCData(const std::string& value) {
    return value.find_first_of("<>&'\"") != std::string::npos;
}

// "]]>" 不能出现在 CDATA 内部，拆成两段
std::string WrapCData(const std::string& value) {
    std::string result = "<![CDATA[";
    size_t pos = 0;
    while (true) {
        size_t found = value.find("]]>", pos);
        if (found == std::string::npos) {
            result.append(value, pos, std::string::npos);
            break;
        }
        result.append(value, pos, found - pos);
        result += "]]]]><![CDATA[>";
        pos = found + 3;
    }
    result += "]]>";
    return result;
}

bool IsMetaNode(const std::string& key) {
    return key == XML_ATTR || key == XML_COMMENT;
}

// read_xml 不校验闭合标签名，先用同一解析器带校验标志过一遍
Error CheckClosingTags(const std::string& text) {
    std::vector<char> buffer(text.begin(), text.end());
    buffer.push_back('\0');
    try {
        rx::xml_document<char> doc;
        doc.parse<rx::parse_validate_closing_tags>(buffer.data());
    } catch (const rx::parse_error& e) {
        return Error(ErrorCode::FormatError, std::string("XML解析失败: ") + e.what());
    }
    return Error();
}

} // namespace

bool IsValidElementName(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    auto isStart = [](unsigned char c) {
        return std::isalpha(c) || c == '_' || c >= 0x80;
    };
    auto isPart = [&isStart](unsigned char c) {
        return isStart(c) || std::isdigit(c) || c == '-' || c == '.';
    };

    if (!isStart(static_cast<unsigned char>(name[0]))) {
        return false;
    }
    return std::all_of(name.begin() + 1, name.end(),
                       [&isPart](char c) { return isPart(static_cast<unsigned char>(c)); });
}

void XmlMap::SetRaw(const std::string& key, const std::string& value) {
    for (auto& entry : entries_) {
        if (entry.first == key) {
            entry.second = value;
            return;
        }
    }
    entries_.emplace_back(key, value);
}

XmlMap& XmlMap::Set(const std::string& key, const std::string& value) {
    if (value.empty()) {
        return *this;
    }
    if (!IsValidElementName(key)) {
        utils::GetLogger().Warn("忽略非法的XML元素名",
            utils::LogContext().With("key", key));
        return *this;
    }
    SetRaw(key, value);
    return *this;
}

XmlMap& XmlMap::Set(const std::string& key, const char* value) {
    if (value == nullptr) {
        return *this;
    }
    return Set(key, std::string(value));
}

XmlMap& XmlMap::Set(const std::string& key, const json& value) {
    return Set(key, ValueToString(value));
}

std::string XmlMap::Get(const std::string& key, const std::string& defaultValue) const {
    for (const auto& entry : entries_) {
        if (entry.first == key) {
            return entry.second;
        }
    }
    return defaultValue;
}

XmlMap& XmlMap::Remove(const std::string& key) {
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&key](const std::pair<std::string, std::string>& entry) {
                                      return entry.first == key;
                                  }),
                   entries_.end());
    return *this;
}

bool XmlMap::Contains(const std::string& key) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [&key](const std::pair<std::string, std::string>& entry) {
                           return entry.first == key;
                       });
}

std::vector<std::string> XmlMap::Keys() const {
    std::vector<std::string> keys;
    keys.reserve(entries_.size());
    for (const auto& entry : entries_) {
        keys.push_back(entry.first);
    }
    return keys;
}

std::string XmlMap::Serialize() const {
    return Serialize(rootName_);
}

std::string XmlMap::Serialize(const std::string& rootTag) const {
    std::string xml = "<" + rootTag + ">";
    for (const auto& entry : entries_) {
        xml += "<" + entry.first + ">";
        if (NeedsCData(entry.second)) {
            xml += WrapCData(entry.second);
        } else {
            xml += entry.second;
        }
        xml += "</" + entry.first + ">";
    }
    xml += "</" + rootTag + ">";
    return xml;
}

Result<XmlMap> XmlMap::Parse(const std::string& text, const std::string& rootTag) {
    Error wellFormed = CheckClosingTags(text);
    if (wellFormed.hasError()) {
        return wellFormed;
    }

    pt::ptree tree;
    std::istringstream stream(text);
    try {
        // 不裁剪空白，CDATA 与文本节点直接拼接
        pt::read_xml(stream, tree);
    } catch (const pt::xml_parser_error& e) {
        return Error(ErrorCode::FormatError, std::string("XML解析失败: ") + e.what());
    }

    const pt::ptree* root = nullptr;
    for (const auto& node : tree) {
        if (node.first == XML_COMMENT) {
            continue;
        }
        if (root != nullptr) {
            return Error(ErrorCode::FormatError, "XML存在多个根元素");
        }
        if (node.first != rootTag) {
            return Error(ErrorCode::FormatError,
                         "XML根元素不匹配: 期望 " + rootTag + "，实际 " + node.first);
        }
        root = &node.second;
    }
    if (root == nullptr) {
        return Error(ErrorCode::FormatError, "XML缺少根元素");
    }

    XmlMap result(rootTag);
    for (const auto& child : *root) {
        if (IsMetaNode(child.first)) {
            continue;
        }
        for (const auto& grandChild : child.second) {
            if (!IsMetaNode(grandChild.first)) {
                return Error(ErrorCode::FormatError, "不支持嵌套元素: " + child.first);
            }
        }
        // 解析结果不做空值过滤
        result.SetRaw(child.first, child.second.data());
    }
    return result;
}

ParamMap XmlMap::ToParamMap() const {
    json mapping = json::object();
    for (const auto& entry : entries_) {
        mapping[entry.first] = entry.second;
    }
    return ParamMap::FromMapping(mapping);
}

XmlMap XmlMap::FromParamMap(const ParamMap& params, const std::string& rootTag) {
    XmlMap result(rootTag);
    const json& mapping = params.ToMapping();
    for (auto it = mapping.begin(); it != mapping.end(); ++it) {
        result.Set(it.key(), it.value());
    }
    return result;
}

} // namespace params
} // namespace paykit
