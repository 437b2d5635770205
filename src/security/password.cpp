#include "security.hpp"
#include "errors.hpp"
#include <argon2.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace Auth {

std::string Password::hash(const std::string& password, const HashParams& params) {
    if (password.size() > ARGON2_MAX_PWD_LENGTH) {
        throw AuthError::encoding("Password exceeds the Argon2 length limit");
    }
    
    std::vector<uint8_t> salt(SALT_LENGTH);
    if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1) {
        throw AuthError::crypto("Failed to generate salt");
    }
    
    std::vector<char> encoded(argon2_encodedlen(
        params.time_cost, params.memory_kib, params.parallelism,
        static_cast<uint32_t>(SALT_LENGTH), static_cast<uint32_t>(HASH_LENGTH),
        Argon2_id));
    
    int result = argon2id_hash_encoded(
        params.time_cost, params.memory_kib, params.parallelism,
        password.data(), password.size(),
        salt.data(), salt.size(),
        HASH_LENGTH,
        encoded.data(), encoded.size()
    );
    
    if (result == ARGON2_PWD_TOO_LONG) {
        throw AuthError::encoding("Password exceeds the Argon2 length limit");
    }
    if (result != ARGON2_OK) {
        spdlog::error("Argon2 hashing failed: {}", argon2_error_message(result));
        throw AuthError::crypto(std::string("Argon2 hashing failed: ") + argon2_error_message(result));
    }
    
    return std::string(encoded.data());
}

bool Password::verify(const std::string& hash, const std::string& password) {
    if (hash.empty() || password.size() > ARGON2_MAX_PWD_LENGTH) return false;
    
    int result = argon2id_verify(hash.c_str(), password.data(), password.size());
    if (result == ARGON2_OK) return true;
    
    if (result != ARGON2_VERIFY_MISMATCH) {
        spdlog::debug("Stored hash rejected by Argon2: {}", argon2_error_message(result));
    }
    return false;
}

} // namespace Auth
