#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include "config.hpp"
#include "models.hpp"
#include "security.hpp"

namespace Auth {

// Password hashing and session token issuance behind one secret.
// Immutable after construction; safe to share across threads.
class CredentialManager {
public:
    using NowProvider = std::function<Timestamp()>;
    
    // Lifetimes outside (0, MAX_TOKEN_LIFETIME] fall back to 24 hours.
    static constexpr std::chrono::hours MAX_TOKEN_LIFETIME{24 * 365 * 10};
    
    struct Options {
        std::chrono::seconds token_lifetime = std::chrono::hours(24);
        HashParams hash_params;
        // Appended to every password before hashing and verifying.
        std::string pepper;
        NowProvider now = std::chrono::system_clock::now;
    };
    
    explicit CredentialManager(std::string secret);
    CredentialManager(std::string secret, Options options);
    
    static CredentialManager from_config(const Config& config);
    
    // Throws AuthError(ENCODING) when the password is not valid UTF-8.
    std::string hash_password(const std::string& password) const;
    bool verify_password(const std::string& password, const std::string& hashed) const;
    
    std::string generate_token(const UserId& user_id) const;
    // Expired and invalid tokens both yield an empty result.
    std::optional<UserId> verify_token(const std::string& token) const;
    TokenCheck check_token(const std::string& token) const;
    
    const Options& options() const { return options_; }

private:
    std::string secret_;
    Options options_;
    
    std::string peppered(const std::string& password) const;
};

} // namespace Auth
