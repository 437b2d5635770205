#include "errors.hpp"

#include <gtest/gtest.h>

TEST(AuthError, FactoriesSetTypeAndName) {
    EXPECT_EQ(Auth::AuthError::encoding("x").type(), Auth::AuthErrorType::ENCODING);
    EXPECT_EQ(Auth::AuthError::encoding("x").error_name(), "encoding_error");
    EXPECT_EQ(Auth::AuthError::configuration("x").error_name(), "configuration_error");
    EXPECT_EQ(Auth::AuthError::crypto("x").error_name(), "crypto_error");
}

TEST(AuthError, IsARuntimeError) {
    try {
        throw Auth::AuthError::encoding("bad bytes");
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "bad bytes");
    }
}

TEST(AuthError, JsonCarriesNameAndMessage) {
    const auto j = Auth::AuthError::configuration("JWT_SECRET is required").to_json();
    EXPECT_EQ(j.at("error"), "configuration_error");
    EXPECT_EQ(j.at("message"), "JWT_SECRET is required");
}
