#include "config.hpp"
#include "credential_manager.hpp"
#include "errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

namespace {
namespace fs = std::filesystem;

const char* const kKeys[] = {
    "JWT_SECRET", "JWT_EXP_HOURS", "PASSWORD_PEPPER", "ARGON2_TIME_COST",
    "ARGON2_MEMORY_KIB", "ARGON2_PARALLELISM", "LOG_LEVEL"
};

class ConfigTest : public ::testing::Test {
protected:
    fs::path envFile;

    void SetUp() override {
        for (const char* key : kKeys) {
            ::unsetenv(key);
        }
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        envFile = fs::temp_directory_path() / (std::string("authkit_") + info->name() + ".env");
        fs::remove(envFile);
    }

    void TearDown() override {
        for (const char* key : kKeys) {
            ::unsetenv(key);
        }
        fs::remove(envFile);
    }

    void writeEnv(const std::string& content) {
        std::ofstream out(envFile, std::ios::binary);
        out << content;
    }
};
} // namespace

TEST_F(ConfigTest, MissingFileUsesDefaults) {
    const Auth::Config config{envFile.string()};

    EXPECT_EQ(config.jwt_exp_hours(), 24);
    EXPECT_EQ(config.password_pepper(), "");
    EXPECT_EQ(config.argon2_time_cost(), 4);
    EXPECT_EQ(config.argon2_memory_kib(), 65536);
    EXPECT_EQ(config.argon2_parallelism(), 3);
    EXPECT_EQ(config.log_level(), "info");
}

TEST_F(ConfigTest, MissingSecretIsConfigurationError) {
    const Auth::Config config{envFile.string()};

    try {
        (void)config.jwt_secret();
        FAIL() << "expected AuthError";
    } catch (const Auth::AuthError& e) {
        EXPECT_EQ(e.type(), Auth::AuthErrorType::CONFIGURATION);
    }
}

TEST_F(ConfigTest, ReadsEnvFile) {
    writeEnv("# signing\n"
             "JWT_SECRET=abc=def\n"
             "\n"
             "JWT_EXP_HOURS=48\r\n"
             "PASSWORD_PEPPER=spice\n"
             "not a pair\n");
    const Auth::Config config{envFile.string()};

    EXPECT_EQ(config.jwt_secret(), "abc=def");
    EXPECT_EQ(config.jwt_exp_hours(), 48);
    EXPECT_EQ(config.password_pepper(), "spice");
}

TEST_F(ConfigTest, ProcessEnvironmentWins) {
    writeEnv("JWT_EXP_HOURS=48\n");
    ::setenv("JWT_EXP_HOURS", "12", 1);
    const Auth::Config config{envFile.string()};

    EXPECT_EQ(config.jwt_exp_hours(), 12);
}

TEST_F(ConfigTest, UnparsableIntegerFallsBack) {
    writeEnv("ARGON2_TIME_COST=lots\n");
    const Auth::Config config{envFile.string()};

    EXPECT_EQ(config.argon2_time_cost(), 4);
}

TEST_F(ConfigTest, ManagerFromConfig) {
    writeEnv("JWT_SECRET=test-secret\n"
             "JWT_EXP_HOURS=2\n"
             "PASSWORD_PEPPER=spice\n"
             "ARGON2_TIME_COST=1\n"
             "ARGON2_MEMORY_KIB=1024\n"
             "ARGON2_PARALLELISM=0\n");
    const auto manager = Auth::CredentialManager::from_config(Auth::Config{envFile.string()});

    EXPECT_EQ(manager.options().token_lifetime, std::chrono::hours(2));
    EXPECT_EQ(manager.options().pepper, "spice");
    EXPECT_EQ(manager.options().hash_params.time_cost, 1U);
    EXPECT_EQ(manager.options().hash_params.memory_kib, 1024U);
    EXPECT_EQ(manager.options().hash_params.parallelism, 3U);

    const auto userId = manager.verify_token(manager.generate_token(5));
    ASSERT_TRUE(userId.has_value());
    EXPECT_EQ(std::get<std::int64_t>(*userId), 5);
}

TEST_F(ConfigTest, ManagerFromConfigRequiresSecret) {
    EXPECT_THROW((void)Auth::CredentialManager::from_config(Auth::Config{envFile.string()}), Auth::AuthError);
}

TEST_F(ConfigTest, NonPositiveLifetimeFallsBackToOneDay) {
    writeEnv("JWT_SECRET=test-secret\n"
             "JWT_EXP_HOURS=-5\n");
    const auto negative = Auth::CredentialManager::from_config(Auth::Config{envFile.string()});
    EXPECT_EQ(negative.options().token_lifetime, std::chrono::hours(24));

    ::setenv("JWT_EXP_HOURS", "0", 1);
    const auto zero = Auth::CredentialManager::from_config(Auth::Config{envFile.string()});
    EXPECT_EQ(zero.options().token_lifetime, std::chrono::hours(24));
}

TEST_F(ConfigTest, OversizedLifetimeFallsBackToOneDay) {
    writeEnv("JWT_SECRET=test-secret\n"
             "JWT_EXP_HOURS=3000000\n");
    const auto manager = Auth::CredentialManager::from_config(Auth::Config{envFile.string()});

    EXPECT_EQ(manager.options().token_lifetime, std::chrono::hours(24));

    // The issued token must still be valid right away.
    const auto userId = manager.verify_token(manager.generate_token(8));
    ASSERT_TRUE(userId.has_value());
    EXPECT_EQ(std::get<std::int64_t>(*userId), 8);
}

TEST_F(ConfigTest, TenYearLifetimeIsAccepted) {
    writeEnv("JWT_SECRET=test-secret\n"
             "JWT_EXP_HOURS=87600\n");
    const auto manager = Auth::CredentialManager::from_config(Auth::Config{envFile.string()});

    EXPECT_EQ(manager.options().token_lifetime, std::chrono::hours(87600));
}
