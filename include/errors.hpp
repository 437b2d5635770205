#pragma once
#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace Auth {

enum class AuthErrorType {
    ENCODING,
    CONFIGURATION,
    CRYPTO
};

class AuthError : public std::runtime_error {
private:
    AuthErrorType type_;

public:
    AuthError(AuthErrorType type, const std::string& message);
    
    AuthErrorType type() const { return type_; }
    nlohmann::json to_json() const;
    std::string error_name() const;
    
    static AuthError encoding(const std::string& message);
    static AuthError configuration(const std::string& message);
    static AuthError crypto(const std::string& message);
};

} // namespace Auth
