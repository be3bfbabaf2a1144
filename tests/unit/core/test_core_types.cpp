/**
 * @file test_core_types.cpp
 * @brief Unit tests for core types (error codes, error classes, result)
 */

#include <gtest/gtest.h>

#include <kcenon/media_relay/core/types.h>

#include <memory>
#include <string>

namespace kcenon::media_relay::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    // File errors: -100 to -119
    EXPECT_EQ(static_cast<int>(error_code::file_not_found), -100);
    EXPECT_EQ(static_cast<int>(error_code::malformed_document), -106);

    // Catalog errors: -120 to -139
    EXPECT_EQ(static_cast<int>(error_code::catalog_parse_error), -120);
    EXPECT_EQ(static_cast<int>(error_code::no_eligible_item), -124);

    // State errors: -140 to -159
    EXPECT_EQ(static_cast<int>(error_code::state_corrupted), -140);

    // Transfer errors: -160 to -179
    EXPECT_EQ(static_cast<int>(error_code::transfer_timeout), -160);
    EXPECT_EQ(static_cast<int>(error_code::upload_failed), -165);

    // Remote errors: -180 to -199
    EXPECT_EQ(static_cast<int>(error_code::remote_server_error), -180);

    // Compression errors: -200 to -219
    EXPECT_EQ(static_cast<int>(error_code::encoder_unavailable), -200);

    // Configuration errors: -220 to -239
    EXPECT_EQ(static_cast<int>(error_code::invalid_configuration), -220);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::transfer_timeout), "transfer timeout");
    EXPECT_STREQ(to_string(error_code::upload_failed), "upload failed after maximum retries");
    EXPECT_STREQ(to_string(error_code::encoding_not_smaller), "encoding did not reduce size");
    EXPECT_STREQ(to_string(static_cast<error_code>(-999)), "unknown error");
}

// =============================================================================
// error_class Tests
// =============================================================================

class ErrorClassTest : public ::testing::Test {};

TEST_F(ErrorClassTest, TransientTransportErrors) {
    for (auto code : {error_code::transfer_timeout, error_code::transfer_stalled,
                      error_code::connection_failed, error_code::connection_lost,
                      error_code::remote_server_error}) {
        EXPECT_EQ(classify(code), error_class::transient_transport) << to_string(code);
        EXPECT_TRUE(is_retryable(code)) << to_string(code);
    }
}

TEST_F(ErrorClassTest, PermanentErrors) {
    for (auto code : {error_code::remote_client_error, error_code::invalid_locator,
                      error_code::source_not_found, error_code::file_not_found,
                      error_code::download_failed, error_code::upload_failed,
                      error_code::invalid_configuration}) {
        EXPECT_EQ(classify(code), error_class::permanent) << to_string(code);
        EXPECT_FALSE(is_retryable(code)) << to_string(code);
    }
}

TEST_F(ErrorClassTest, DegradedErrors) {
    for (auto code : {error_code::encoder_unavailable, error_code::encoding_failed,
                      error_code::encoding_not_smaller}) {
        EXPECT_EQ(classify(code), error_class::degraded) << to_string(code);
        EXPECT_FALSE(is_retryable(code)) << to_string(code);
    }
}

TEST_F(ErrorClassTest, SuccessHasNoClass) {
    EXPECT_EQ(classify(error_code::success), error_class::none);
    EXPECT_FALSE(is_retryable(error_code::success));
}

TEST_F(ErrorClassTest, StallCountsAsTimeout) {
    EXPECT_TRUE(is_timeout(error_code::transfer_timeout));
    EXPECT_TRUE(is_timeout(error_code::transfer_stalled));
    EXPECT_FALSE(is_timeout(error_code::connection_lost));
    EXPECT_FALSE(is_timeout(error_code::remote_server_error));
}

// =============================================================================
// result Tests
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, HoldsValue) {
    result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, HoldsError) {
    result<int> r = unexpected(error{error_code::item_not_found, "item 9 not found"});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::item_not_found);
    EXPECT_EQ(r.error().message, "item 9 not found");
}

TEST_F(ResultTest, ErrorWithoutMessageUsesDescription) {
    error err(error_code::state_write_error);
    EXPECT_EQ(err.message, "state write error");
    EXPECT_TRUE(static_cast<bool>(err));
    EXPECT_FALSE(static_cast<bool>(error{}));
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected(error{error_code::state_write_error, "disk full"});
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().message, "disk full");
}

TEST_F(ResultTest, MoveOnlyValue) {
    result<std::unique_ptr<int>> r = std::make_unique<int>(5);
    ASSERT_TRUE(r.has_value());
    auto owned = std::move(r).value();
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 5);
}

}  // namespace kcenon::media_relay::test
