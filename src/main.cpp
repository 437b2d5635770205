#include <iostream>
#include <string>
#include <vector>

#include "config.hpp"
#include "credential_manager.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace {

void print_usage() {
    std::cerr << "Usage: authkit <command> [args]\n"
              << "  hash <password>            print an Argon2id hash\n"
              << "  verify <password> <hash>   check a password against a hash\n"
              << "  issue <user-id>            print a signed session token\n"
              << "  check <token>              print the user id carried by a token\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) {
        print_usage();
        return 2;
    }
    
    try {
        Log::init();
        Auth::Config config;
        Log::set_level(config.log_level());
        
        const std::string& command = args[0];
        
        if (command == "hash" && args.size() == 2) {
            auto manager = Auth::CredentialManager::from_config(config);
            std::cout << manager.hash_password(args[1]) << "\n";
            return 0;
        }
        
        if (command == "verify" && args.size() == 3) {
            auto manager = Auth::CredentialManager::from_config(config);
            bool ok = manager.verify_password(args[1], args[2]);
            std::cout << (ok ? "valid" : "invalid") << "\n";
            return ok ? 0 : 1;
        }
        
        if (command == "issue" && args.size() == 2) {
            auto manager = Auth::CredentialManager::from_config(config);
            std::cout << manager.generate_token(Auth::parse_user_id(args[1])) << "\n";
            return 0;
        }
        
        if (command == "check" && args.size() == 2) {
            auto manager = Auth::CredentialManager::from_config(config);
            auto result = manager.check_token(args[1]);
            if (result.valid()) {
                std::cout << Auth::to_string(*result.user_id) << "\n";
                return 0;
            }
            std::cout << Auth::to_string(result.status) << "\n";
            return 1;
        }
        
        print_usage();
        return 2;
        
    } catch (const Auth::AuthError& e) {
        std::cerr << e.to_json().dump() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
