#pragma once
#include <chrono>
#include <string>
#include "credential_manager.hpp"

namespace test_support {

// Cheapest parameters libargon2 accepts; keeps the suite fast.
inline Auth::HashParams fast_hash_params() {
    Auth::HashParams params;
    params.time_cost = 1;
    params.memory_kib = 1024;
    params.parallelism = 1;
    return params;
}

inline Auth::Timestamp fixed_instant() {
    return Auth::Timestamp(std::chrono::seconds(1700000000));
}

inline Auth::CredentialManager::Options fast_options() {
    Auth::CredentialManager::Options options;
    options.hash_params = fast_hash_params();
    return options;
}

// Replaces the first character of the signature segment with another base64url character.
inline std::string tamper_signature(std::string token) {
    auto pos = token.rfind('.');
    if (pos == std::string::npos || pos + 1 >= token.size()) return token;
    char& c = token[pos + 1];
    c = (c == 'A') ? 'B' : 'A';
    return token;
}

} // namespace test_support
