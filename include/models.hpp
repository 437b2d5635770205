#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace Auth {

using Timestamp = std::chrono::system_clock::time_point;

// Integer or string identifier carried in the token payload.
using UserId = std::variant<std::int64_t, std::string>;

std::string to_string(const UserId& user_id);
// Digits without a leading zero become an integer id; anything else stays a string.
UserId parse_user_id(const std::string& text);
nlohmann::json user_id_to_json(const UserId& user_id);

struct TokenClaims {
    UserId user_id;
    Timestamp expires_at;
    std::optional<Timestamp> issued_at;
    
    nlohmann::json to_json() const;
    static TokenClaims from_json(const nlohmann::json& j);
};

enum class TokenStatus {
    VALID,
    EXPIRED,
    INVALID
};

struct TokenCheck {
    TokenStatus status = TokenStatus::INVALID;
    std::optional<UserId> user_id;
    
    bool valid() const { return status == TokenStatus::VALID; }
    
    static TokenCheck accepted(UserId user_id);
    static TokenCheck expired();
    static TokenCheck invalid();
};

std::string to_string(TokenStatus status);

} // namespace Auth
