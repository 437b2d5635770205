#include "credential_manager.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <utility>

namespace Auth {

namespace {

uint32_t positive_or(int value, uint32_t fallback) {
    return value > 0 ? static_cast<uint32_t>(value) : fallback;
}

const std::chrono::seconds DEFAULT_TOKEN_LIFETIME = std::chrono::hours(24);

} // namespace

CredentialManager::CredentialManager(std::string secret)
    : CredentialManager(std::move(secret), Options{}) {}

CredentialManager::CredentialManager(std::string secret, Options options)
    : secret_(std::move(secret)), options_(std::move(options)) {
    if (!options_.now) {
        options_.now = std::chrono::system_clock::now;
    }
    if (options_.token_lifetime <= std::chrono::seconds::zero() ||
        options_.token_lifetime > MAX_TOKEN_LIFETIME) {
        spdlog::warn("Token lifetime of {}s is out of range, using {}s",
                     options_.token_lifetime.count(), DEFAULT_TOKEN_LIFETIME.count());
        options_.token_lifetime = DEFAULT_TOKEN_LIFETIME;
    }
}

CredentialManager CredentialManager::from_config(const Config& config) {
    HashParams defaults;
    
    Options options;
    options.token_lifetime = std::chrono::hours(config.jwt_exp_hours());
    options.hash_params.time_cost = positive_or(config.argon2_time_cost(), defaults.time_cost);
    options.hash_params.memory_kib = positive_or(config.argon2_memory_kib(), defaults.memory_kib);
    options.hash_params.parallelism = positive_or(config.argon2_parallelism(), defaults.parallelism);
    options.pepper = config.password_pepper();
    
    CredentialManager manager(config.jwt_secret(), std::move(options));
    const auto& applied = manager.options();
    spdlog::info("Credential manager configured: token lifetime {}s, argon2id t={} m={} p={}",
                 applied.token_lifetime.count(), applied.hash_params.time_cost,
                 applied.hash_params.memory_kib, applied.hash_params.parallelism);
    
    return manager;
}

std::string CredentialManager::peppered(const std::string& password) const {
    if (!is_valid_utf8(password)) {
        throw AuthError::encoding("Password is not valid UTF-8");
    }
    return password + options_.pepper;
}

std::string CredentialManager::hash_password(const std::string& password) const {
    spdlog::debug("Hashing password (not logging the password)");
    return Password::hash(peppered(password), options_.hash_params);
}

bool CredentialManager::verify_password(const std::string& password, const std::string& hashed) const {
    if (Password::verify(hashed, peppered(password))) {
        spdlog::debug("Password verified");
        return true;
    }
    
    spdlog::warn("Password verification failed");
    return false;
}

std::string CredentialManager::generate_token(const UserId& user_id) const {
    if (const auto* name = std::get_if<std::string>(&user_id)) {
        if (!is_valid_utf8(*name)) {
            throw AuthError::encoding("User id is not valid UTF-8");
        }
    }
    
    TokenClaims claims;
    claims.user_id = user_id;
    claims.issued_at = options_.now();
    claims.expires_at = *claims.issued_at + options_.token_lifetime;
    
    spdlog::debug("Issuing token for user '{}'", to_string(user_id));
    return JWT::create_token(claims, secret_);
}

TokenCheck CredentialManager::check_token(const std::string& token) const {
    auto result = JWT::decode_token(token, secret_, options_.now());
    if (!result.valid()) {
        spdlog::warn("Token rejected: {}", to_string(result.status));
    }
    return result;
}

std::optional<UserId> CredentialManager::verify_token(const std::string& token) const {
    return check_token(token).user_id;
}

} // namespace Auth
