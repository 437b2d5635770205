#include "config.hpp"
#include "errors.hpp"
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

namespace Auth {

Config::Config(const std::string& env_file) {
    load_env_file(env_file);
}

void Config::load_env_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::debug("{} not found, using process environment only", path);
        return;
    }
    
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        
        auto pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = line.substr(0, pos);
            std::string value = line.substr(pos + 1);
            env_vars[key] = value;
        }
    }
    spdlog::debug("Loaded {} entries from {}", env_vars.size(), path);
}

std::string Config::get(const std::string& key, const std::string& default_value) const {
    if (const char* value = std::getenv(key.c_str())) {
        return value;
    }
    auto it = env_vars.find(key);
    return (it != env_vars.end()) ? it->second : default_value;
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get(key);
    if (value.empty()) return default_value;
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        spdlog::warn("{} is not an integer, using {}", key, default_value);
        return default_value;
    }
}

std::string Config::jwt_secret() const {
    auto secret = get("JWT_SECRET");
    if (secret.empty()) {
        throw AuthError::configuration("JWT_SECRET is required");
    }
    return secret;
}

int Config::jwt_exp_hours() const {
    return get_int("JWT_EXP_HOURS", 24);
}

std::string Config::password_pepper() const {
    return get("PASSWORD_PEPPER");
}

int Config::argon2_time_cost() const {
    return get_int("ARGON2_TIME_COST", 4);
}

int Config::argon2_memory_kib() const {
    return get_int("ARGON2_MEMORY_KIB", 65536);
}

int Config::argon2_parallelism() const {
    return get_int("ARGON2_PARALLELISM", 3);
}

std::string Config::log_level() const {
    return get("LOG_LEVEL", "info");
}

} // namespace Auth
