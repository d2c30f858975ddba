/**
 * @file test_core_types.cpp
 * @brief Unit tests for error codes, result types and endpoints
 */

#include <gtest/gtest.h>

#include <kcenon/xdcc_client/core/types.h>

#include <string>

namespace kcenon::xdcc_client::test {

// =============================================================================
// Error codes
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    // Network errors
    EXPECT_EQ(static_cast<int>(error_code::connection_failed), -160);
    EXPECT_EQ(static_cast<int>(error_code::connection_timeout), -161);
    EXPECT_EQ(static_cast<int>(error_code::connection_closed), -164);
    EXPECT_EQ(static_cast<int>(error_code::send_failed), -165);

    // Protocol errors
    EXPECT_EQ(static_cast<int>(error_code::malformed_frame), -180);

    // Configuration errors
    EXPECT_EQ(static_cast<int>(error_code::invalid_configuration), -141);

    // Session errors
    EXPECT_EQ(static_cast<int>(error_code::transfer_cancelled), -221);

    // Internal errors
    EXPECT_EQ(static_cast<int>(error_code::already_initialized), -202);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::connection_closed), "connection closed");
    EXPECT_STREQ(to_string(error_code::malformed_frame), "malformed frame");
    EXPECT_STREQ(to_string(error_code::invalid_configuration), "invalid configuration");
    EXPECT_STREQ(to_string(error_code::transfer_cancelled), "transfer cancelled");
}

TEST_F(ErrorCodeTest, ErrorMessageDefaultsToCodeName) {
    error err(error_code::connection_lost);

    EXPECT_EQ(err.message, "connection lost");
    EXPECT_TRUE(static_cast<bool>(err));
    EXPECT_FALSE(static_cast<bool>(error{}));
}

// =============================================================================
// Result
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, HoldsValue) {
    result<int> r(42);

    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, HoldsError) {
    result<std::string> r = unexpected{error{error_code::send_failed, "Broken pipe"}};

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::send_failed);
    EXPECT_EQ(r.error().message, "Broken pipe");
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    result<void> failed = unexpected{error{error_code::not_initialized}};

    EXPECT_TRUE(ok.has_value());
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, error_code::not_initialized);
}

// =============================================================================
// Endpoint
// =============================================================================

class EndpointTest : public ::testing::Test {};

TEST_F(EndpointTest, DefaultConstruction) {
    endpoint ep;

    EXPECT_TRUE(ep.host.empty());
    EXPECT_EQ(ep.port, 0);
}

TEST_F(EndpointTest, ToString) {
    endpoint ep{"localhost", 8080};

    EXPECT_EQ(ep.to_string(), "localhost:8080");
}

}  // namespace kcenon::xdcc_client::test
