#include "errors.hpp"

namespace Auth {

AuthError::AuthError(AuthErrorType type, const std::string& message)
    : std::runtime_error(message), type_(type) {}

nlohmann::json AuthError::to_json() const {
    return nlohmann::json{
        {"error", error_name()},
        {"message", what()}
    };
}

std::string AuthError::error_name() const {
    switch (type_) {
        case AuthErrorType::ENCODING: return "encoding_error";
        case AuthErrorType::CONFIGURATION: return "configuration_error";
        case AuthErrorType::CRYPTO: return "crypto_error";
        default: return "unknown_error";
    }
}

AuthError AuthError::encoding(const std::string& message) {
    return AuthError(AuthErrorType::ENCODING, message);
}

AuthError AuthError::configuration(const std::string& message) {
    return AuthError(AuthErrorType::CONFIGURATION, message);
}

AuthError AuthError::crypto(const std::string& message) {
    return AuthError(AuthErrorType::CRYPTO, message);
}

} // namespace Auth
