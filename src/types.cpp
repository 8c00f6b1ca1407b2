#include "paykit/types.hpp"

namespace paykit {

std::string ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "OK";
        case ErrorCode::FormatError: return "FORMAT_ERROR";
        case ErrorCode::UnsupportedAlgorithm: return "UNSUPPORTED_ALGORITHM";
        case ErrorCode::InvalidKeyMaterial: return "INVALID_KEY_MATERIAL";
        case ErrorCode::SignatureError: return "SIGNATURE_ERROR";
        case ErrorCode::CallbackFailure: return "CALLBACK_FAILURE";
        case ErrorCode::ConfigError: return "CONFIG_ERROR";
        case ErrorCode::SignFailure: return "SIGN_FAILURE";
        default: return "UNKNOWN";
    }
}

} // namespace paykit
