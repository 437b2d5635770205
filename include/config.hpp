#pragma once
#include <string>
#include <unordered_map>

namespace Auth {

class Config {
private:
    std::unordered_map<std::string, std::string> env_vars;
    void load_env_file(const std::string& path);

public:
    explicit Config(const std::string& env_file = ".env");
    
    // Process environment wins over the .env file.
    std::string get(const std::string& key, const std::string& default_value = "") const;
    int get_int(const std::string& key, int default_value = 0) const;
    
    std::string jwt_secret() const;
    int jwt_exp_hours() const;
    std::string password_pepper() const;
    int argon2_time_cost() const;
    int argon2_memory_kib() const;
    int argon2_parallelism() const;
    std::string log_level() const;
};

} // namespace Auth
