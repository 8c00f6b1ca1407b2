#include "paykit/utils/tools.hpp"
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/hmac.h>
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>

namespace paykit {
namespace utils {

namespace {

// curl 的转义函数需要一个 easy handle
struct CurlHandleDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;

CurlHandle NewCurlHandle() {
    static std::once_flag globalInit;
    std::call_once(globalInit, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    return CurlHandle(curl_easy_init());
}

} // namespace

Result<std::vector<uint8_t>> CalculateDigest(const std::string& data, const EVP_MD* algorithm) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (mdctx == nullptr) {
        return Error(ErrorCode::SignFailure, "创建MD上下文失败");
    }

    if (EVP_DigestInit_ex(mdctx, algorithm, nullptr) != 1) {
        EVP_MD_CTX_free(mdctx);
        return Error(ErrorCode::SignFailure, "初始化摘要失败: " + OpenSSLErrorString());
    }

    if (EVP_DigestUpdate(mdctx, data.data(), data.size()) != 1) {
        EVP_MD_CTX_free(mdctx);
        return Error(ErrorCode::SignFailure, "更新摘要失败: " + OpenSSLErrorString());
    }

    if (EVP_DigestFinal_ex(mdctx, hash, &hashLen) != 1) {
        EVP_MD_CTX_free(mdctx);
        return Error(ErrorCode::SignFailure, "完成摘要失败: " + OpenSSLErrorString());
    }

    EVP_MD_CTX_free(mdctx);
    return std::vector<uint8_t>(hash, hash + hashLen);
}

Result<std::vector<uint8_t>> CalculateHMAC(const std::string& key, const std::string& data, const EVP_MD* algorithm) {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int macLen = 0;

    unsigned char* out = HMAC(algorithm,
                              key.data(), static_cast<int>(key.size()),
                              reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                              mac, &macLen);
    if (out == nullptr) {
        return Error(ErrorCode::SignFailure, "HMAC计算失败: " + OpenSSLErrorString());
    }
    return std::vector<uint8_t>(mac, mac + macLen);
}

std::string HexEncode(const std::vector<uint8_t>& data) {
    std::stringstream ss;
    ss << std::hex;
    for (size_t i = 0; i < data.size(); i++) {
        ss << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return ss.str();
}

std::string Base64Encode(const std::vector<uint8_t>& data) {
    BIO* bio, * b64;
    BUF_MEM* bufferPtr;

    b64 = BIO_new(BIO_f_base64());
    // 不换行（默认 Base64 会每 64 字符换行）
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_new(BIO_s_mem());
    bio = BIO_push(b64, bio);

    BIO_write(bio, data.data(), static_cast<int>(data.size()));
    BIO_flush(bio);
    BIO_get_mem_ptr(bio, &bufferPtr);

    std::string result(bufferPtr->data, bufferPtr->length);
    BIO_free_all(bio);
    return result;
}

Result<std::vector<uint8_t>> Base64Decode(const std::string& base64) {
    // 去掉空白，签名经过表单传输时可能被折行
    std::string input;
    input.reserve(base64.size());
    for (char c : base64) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            input.push_back(c);
        }
    }

    if (input.empty() || input.size() % 4 != 0) {
        return Error(ErrorCode::FormatError, "Base64长度非法");
    }
    for (char c : input) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/' || c == '=')) {
            return Error(ErrorCode::FormatError, "Base64包含非法字符");
        }
    }

    std::vector<uint8_t> decoded(input.size() / 4 * 3);
    int decodedLen = EVP_DecodeBlock(decoded.data(),
                                     reinterpret_cast<const unsigned char*>(input.data()),
                                     static_cast<int>(input.size()));
    if (decodedLen < 0) {
        return Error(ErrorCode::FormatError, "Base64解码失败");
    }

    // EVP_DecodeBlock 不处理填充，按 '=' 个数截掉
    size_t padding = 0;
    if (input[input.size() - 1] == '=') padding++;
    if (input[input.size() - 2] == '=') padding++;
    decoded.resize(static_cast<size_t>(decodedLen) - padding);
    return decoded;
}

std::string ToUpper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string ToLower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool ConstantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

Result<std::string> PercentEncode(const std::string& s) {
    if (s.empty()) {
        return s;
    }
    CurlHandle curl = NewCurlHandle();
    if (!curl) {
        return Error(ErrorCode::FormatError, "初始化curl失败");
    }
    char* escaped = curl_easy_escape(curl.get(), s.data(), static_cast<int>(s.size()));
    if (escaped == nullptr) {
        return Error(ErrorCode::FormatError, "百分号编码失败");
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

Result<std::string> PercentDecode(const std::string& s, bool formEncoded) {
    if (s.empty()) {
        return s;
    }

    std::string input = s;
    if (formEncoded) {
        std::replace(input.begin(), input.end(), '+', ' ');
    }

    // curl 对非法转义原样保留，这里先做严格检查
    for (size_t i = 0; i < input.size(); ++i) {
        if (input[i] != '%') continue;
        if (i + 2 >= input.size()) {
            return Error(ErrorCode::FormatError, "百分号编码被截断");
        }
        if (!std::isxdigit(static_cast<unsigned char>(input[i + 1])) ||
            !std::isxdigit(static_cast<unsigned char>(input[i + 2]))) {
            return Error(ErrorCode::FormatError, "非法的百分号编码");
        }
    }

    CurlHandle curl = NewCurlHandle();
    if (!curl) {
        return Error(ErrorCode::FormatError, "初始化curl失败");
    }
    int outLen = 0;
    char* unescaped = curl_easy_unescape(curl.get(), input.data(), static_cast<int>(input.size()), &outLen);
    if (unescaped == nullptr) {
        return Error(ErrorCode::FormatError, "百分号解码失败");
    }
    std::string result(unescaped, static_cast<size_t>(outLen));
    curl_free(unescaped);
    return result;
}

std::string OpenSSLErrorString() {
    std::string message;
    unsigned long err = 0;
    while ((err = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        if (!message.empty()) message += "; ";
        message += buf;
    }
    return message.empty() ? "unknown openssl error" : message;
}

} // namespace utils
} // namespace paykit
