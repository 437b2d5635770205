#include "security.hpp"
#include <jwt-cpp/traits/nlohmann-json/defaults.h>
#include <spdlog/spdlog.h>
#include <system_error>

namespace Auth {

namespace {

// Pins the verifier to the caller's notion of "now".
struct FixedClock {
    Timestamp instant;
    jwt::date now() const { return instant; }
};

} // namespace

std::string JWT::create_token(const TokenClaims& claims, const std::string& secret) {
    auto builder = jwt::create();
    builder.set_type("JWT");
    
    for (const auto& item : claims.to_json().items()) {
        builder.set_payload_claim(item.key(), jwt::claim(item.value()));
    }
    
    return builder.sign(jwt::algorithm::hs256{secret});
}

TokenCheck JWT::decode_token(const std::string& token, const std::string& secret, Timestamp now) {
    try {
        auto decoded = jwt::decode(token);
        // Claim types and ranges are checked before the verifier converts exp/iat to dates.
        auto claims = TokenClaims::from_json(decoded.get_payload_json());
        
        std::error_code ec;
        jwt::verify<FixedClock, jwt::traits::nlohmann_json>(FixedClock{now})
            .allow_algorithm(jwt::algorithm::hs256{secret})
            .verify(decoded, ec);
        
        // The expiry claim is checked only after the signature has passed.
        if (ec && ec != jwt::error::token_verification_error::token_expired) {
            spdlog::debug("Token rejected: {}", ec.message());
            return TokenCheck::invalid();
        }
        
        if (now >= claims.expires_at) {
            return TokenCheck::expired();
        }
        if (ec) {
            spdlog::debug("Token rejected: {}", ec.message());
            return TokenCheck::invalid();
        }
        
        return TokenCheck::accepted(std::move(claims.user_id));
    } catch (const std::exception& e) {
        spdlog::debug("Malformed token: {}", e.what());
        return TokenCheck::invalid();
    }
}

} // namespace Auth
