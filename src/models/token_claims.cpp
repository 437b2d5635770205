#include "models.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

namespace Auth {

namespace {

// Largest |seconds| a Timestamp can hold.
const std::int64_t MAX_NUMERIC_DATE =
    std::chrono::duration_cast<std::chrono::seconds>(Timestamp::duration::max()).count();

std::int64_t to_numeric_date(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

Timestamp from_numeric_date(const nlohmann::json& value, const char* name) {
    std::int64_t seconds = 0;
    if (value.is_number_unsigned()) {
        auto raw = value.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(MAX_NUMERIC_DATE)) {
            throw std::invalid_argument(std::string(name) + " is out of range");
        }
        seconds = static_cast<std::int64_t>(raw);
    } else if (value.is_number_integer()) {
        seconds = value.get<std::int64_t>();
        if (seconds < -MAX_NUMERIC_DATE || seconds > MAX_NUMERIC_DATE) {
            throw std::invalid_argument(std::string(name) + " is out of range");
        }
    } else if (value.is_number_float()) {
        const double floored = std::floor(value.get<double>());
        if (!(std::fabs(floored) <= static_cast<double>(MAX_NUMERIC_DATE))) {
            throw std::invalid_argument(std::string(name) + " is out of range");
        }
        seconds = static_cast<std::int64_t>(floored);
    } else {
        throw std::invalid_argument(std::string(name) + " must be a numeric date");
    }
    return Timestamp(std::chrono::seconds(seconds));
}

} // namespace

std::string to_string(const UserId& user_id) {
    if (const auto* number = std::get_if<std::int64_t>(&user_id)) {
        return std::to_string(*number);
    }
    return std::get<std::string>(user_id);
}

UserId parse_user_id(const std::string& text) {
    if (text.empty() || text.size() > 18) return text;
    if (text.size() > 1 && text[0] == '0') return text;
    for (char c : text) {
        if (c < '0' || c > '9') return text;
    }
    return static_cast<std::int64_t>(std::stoll(text));
}

nlohmann::json user_id_to_json(const UserId& user_id) {
    if (const auto* number = std::get_if<std::int64_t>(&user_id)) {
        return nlohmann::json(*number);
    }
    return nlohmann::json(std::get<std::string>(user_id));
}

nlohmann::json TokenClaims::to_json() const {
    nlohmann::json j{
        {"user_id", user_id_to_json(user_id)},
        {"exp", to_numeric_date(expires_at)}
    };
    if (issued_at) {
        j["iat"] = to_numeric_date(*issued_at);
    }
    return j;
}

TokenClaims TokenClaims::from_json(const nlohmann::json& j) {
    TokenClaims claims;
    
    const auto& user_id = j.at("user_id");
    if (user_id.is_number_integer()) {
        claims.user_id = user_id.get<std::int64_t>();
    } else if (user_id.is_string()) {
        claims.user_id = user_id.get<std::string>();
    } else {
        throw std::invalid_argument("user_id must be an integer or a string");
    }
    
    claims.expires_at = from_numeric_date(j.at("exp"), "exp");
    if (j.contains("iat")) {
        claims.issued_at = from_numeric_date(j.at("iat"), "iat");
    }
    
    return claims;
}

TokenCheck TokenCheck::accepted(UserId user_id) {
    return TokenCheck{TokenStatus::VALID, std::move(user_id)};
}

TokenCheck TokenCheck::expired() {
    return TokenCheck{TokenStatus::EXPIRED, std::nullopt};
}

TokenCheck TokenCheck::invalid() {
    return TokenCheck{TokenStatus::INVALID, std::nullopt};
}

std::string to_string(TokenStatus status) {
    switch (status) {
        case TokenStatus::VALID: return "valid";
        case TokenStatus::EXPIRED: return "expired";
        case TokenStatus::INVALID: return "invalid";
        default: return "unknown";
    }
}

} // namespace Auth
