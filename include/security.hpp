#pragma once
#include <cstdint>
#include <string>
#include "models.hpp"

namespace Auth {
    // Argon2id cost parameters
    struct HashParams {
        uint32_t time_cost = 4;
        uint32_t memory_kib = 65536;
        uint32_t parallelism = 3;
    };
    
    // Password hashing with Argon2id, PHC string encoding
    class Password {
    public:
        static constexpr size_t SALT_LENGTH = 16;
        static constexpr size_t HASH_LENGTH = 32;
        
        static std::string hash(const std::string& password, const HashParams& params = HashParams{});
        static bool verify(const std::string& hash, const std::string& password);
    };
    
    // HS256 JWT handling
    class JWT {
    public:
        static std::string create_token(const TokenClaims& claims, const std::string& secret);
        static TokenCheck decode_token(const std::string& token, const std::string& secret, Timestamp now);
    };
    
    bool is_valid_utf8(const std::string& text);
}
