#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <openssl/evp.h>
#include "paykit/types.hpp"

namespace paykit {
namespace utils {

// 摘要计算，algorithm 为 EVP_md5() / EVP_sha1() / EVP_sha256() 等
Result<std::vector<uint8_t>> CalculateDigest(const std::string& data, const EVP_MD* algorithm);

// HMAC计算
Result<std::vector<uint8_t>> CalculateHMAC(const std::string& key, const std::string& data, const EVP_MD* algorithm);

// 将字节数组转换为十六进制字符串（小写）
std::string HexEncode(const std::vector<uint8_t>& data);

// Base64编码（不换行）
std::string Base64Encode(const std::vector<uint8_t>& data);
// Base64解码，输入非法时返回错误
Result<std::vector<uint8_t>> Base64Decode(const std::string& base64);

// ASCII大小写转换
std::string ToUpper(const std::string& s);
std::string ToLower(const std::string& s);

// 恒定时间比较；长度不同直接返回false
bool ConstantTimeEquals(const std::string& a, const std::string& b);

// RFC 3986 百分号编码（非保留字符之外全部编码）
Result<std::string> PercentEncode(const std::string& s);
// 百分号解码；formEncoded 为 true 时 '+' 视为空格
Result<std::string> PercentDecode(const std::string& s, bool formEncoded = true);

// 取出并清空OpenSSL错误队列
std::string OpenSSLErrorString();

} // namespace utils
} // namespace paykit
