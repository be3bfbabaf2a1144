/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and the logging progress sink
 */

#include <gtest/gtest.h>

#include <kcenon/media_relay/core/logging.h>
#include <kcenon/media_relay/core/progress_sink.h>

#include <string>
#include <tuple>
#include <vector>

namespace kcenon::media_relay::test {

// =============================================================================
// item_log_context Tests
// =============================================================================

class ItemLogContextTest : public ::testing::Test {};

TEST_F(ItemLogContextTest, EmptyContextToJson) {
    item_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(ItemLogContextTest, BasicFieldsToJson) {
    item_log_context ctx;
    ctx.item_id = "7";
    ctx.filename = "original_7.mp4";
    ctx.file_size = 1024;

    auto json = ctx.to_json();
    EXPECT_NE(json.find("\"item_id\":\"7\""), std::string::npos);
    EXPECT_NE(json.find("\"filename\":\"original_7.mp4\""), std::string::npos);
    EXPECT_NE(json.find("\"size\":1024"), std::string::npos);
}

TEST_F(ItemLogContextTest, RetryFieldsToJson) {
    item_log_context ctx;
    ctx.item_id = "12";
    ctx.attempt = 3;
    ctx.delay_ms = 8000;
    ctx.stage = "uploading";
    ctx.error_message = "transfer timeout";

    auto json = ctx.to_json();
    EXPECT_NE(json.find("\"attempt\":3"), std::string::npos);
    EXPECT_NE(json.find("\"delay_ms\":8000"), std::string::npos);
    EXPECT_NE(json.find("\"stage\":\"uploading\""), std::string::npos);
    EXPECT_NE(json.find("\"error_message\":\"transfer timeout\""), std::string::npos);
}

TEST_F(ItemLogContextTest, JsonEscaping) {
    item_log_context ctx;
    ctx.item_id = "a\"b";
    ctx.error_message = "line1\nline2";

    auto json = ctx.to_json();
    EXPECT_NE(json.find("a\\\"b"), std::string::npos);
    EXPECT_NE(json.find("line1\\nline2"), std::string::npos);
}

// =============================================================================
// Log Level Tests
// =============================================================================

class LogLevelTest : public ::testing::Test {};

TEST_F(LogLevelTest, LogLevelToString) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::debug), "DEBUG");
    EXPECT_EQ(log_level_to_string(log_level::info), "INFO");
    EXPECT_EQ(log_level_to_string(log_level::warn), "WARN");
    EXPECT_EQ(log_level_to_string(log_level::error), "ERROR");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

TEST_F(LogLevelTest, LogLevelFromString) {
    EXPECT_EQ(log_level_from_string("debug"), log_level::debug);
    EXPECT_EQ(log_level_from_string("WARNING"), log_level::warn);
    EXPECT_EQ(log_level_from_string("Error"), log_level::error);
    EXPECT_FALSE(log_level_from_string("verbose").has_value());
}

// =============================================================================
// Logger Integration Tests
// =============================================================================

class MediaRelayLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().initialize();
        get_logger().set_level(log_level::trace);
        get_logger().enable_json_output(false);
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_level(log_level::info);
        get_logger().enable_json_output(false);
    }
};

TEST_F(MediaRelayLoggerTest, SetOutputFormat) {
    get_logger().set_output_format(log_output_format::json);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::json);

    get_logger().set_output_format(log_output_format::text);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::text);
}

TEST_F(MediaRelayLoggerTest, LogCallback) {
    std::vector<std::tuple<log_level, std::string, std::string>> captured;

    get_logger().set_callback([&](log_level level, std::string_view category,
                                  std::string_view message, const item_log_context*) {
        captured.emplace_back(level, std::string(category), std::string(message));
    });

    MR_LOG_INFO(log_category::pipeline, "Test message");

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(std::get<0>(captured[0]), log_level::info);
    EXPECT_EQ(std::get<1>(captured[0]), log_category::pipeline);
    EXPECT_EQ(std::get<2>(captured[0]), "Test message");
}

TEST_F(MediaRelayLoggerTest, CallbackReceivesContext) {
    std::vector<std::string> item_ids;

    get_logger().set_callback([&](log_level, std::string_view, std::string_view,
                                  const item_log_context* ctx) {
        if (ctx) {
            item_ids.push_back(ctx->item_id);
        }
    });

    item_log_context ctx;
    ctx.item_id = "42";
    MR_LOG_WARN_CTX(log_category::upload, "Chunk upload timed out", ctx);
    MR_LOG_WARN(log_category::upload, "No context");

    ASSERT_EQ(item_ids.size(), 1u);
    EXPECT_EQ(item_ids[0], "42");
}

TEST_F(MediaRelayLoggerTest, LogLevelFiltering) {
    std::vector<std::string> captured;

    get_logger().set_callback([&](log_level, std::string_view,
                                  std::string_view message, const item_log_context*) {
        captured.push_back(std::string(message));
    });

    get_logger().set_level(log_level::warn);

    MR_LOG_DEBUG(log_category::download, "Debug message");
    MR_LOG_INFO(log_category::download, "Info message");
    MR_LOG_WARN(log_category::download, "Warn message");
    MR_LOG_ERROR(log_category::download, "Error message");

    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0], "Warn message");
    EXPECT_EQ(captured[1], "Error message");
}

// =============================================================================
// logging_progress_sink Tests
// =============================================================================

TEST_F(MediaRelayLoggerTest, ProgressSinkLogsOncePerPercent) {
    std::vector<std::string> captured;
    get_logger().set_callback([&](log_level, std::string_view category,
                                  std::string_view message, const item_log_context*) {
        if (category == log_category::download) {
            captured.push_back(std::string(message));
        }
    });

    logging_progress_sink sink;
    progress_event event;
    event.item_id = "7";
    event.direction = transfer_direction::download;
    event.total_bytes = 1000;

    for (double percent : {10.0, 10.4, 10.9, 11.0, 50.0}) {
        event.percent = percent;
        event.bytes_transferred = static_cast<uint64_t>(percent * 10);
        sink.on_progress(event);
    }

    ASSERT_EQ(captured.size(), 3u);
    EXPECT_EQ(captured[0], "download 10%");
    EXPECT_EQ(captured[1], "download 11%");
    EXPECT_EQ(captured[2], "download 50%");
}

TEST_F(MediaRelayLoggerTest, ProgressSinkSwitchesCategoryByDirection) {
    std::vector<std::string> categories;
    get_logger().set_callback([&](log_level, std::string_view category,
                                  std::string_view, const item_log_context*) {
        categories.emplace_back(category);
    });

    logging_progress_sink sink;
    progress_event event;
    event.item_id = "7";
    event.percent = 100.0;
    event.direction = transfer_direction::download;
    sink.on_progress(event);
    event.direction = transfer_direction::upload;
    sink.on_progress(event);

    ASSERT_EQ(categories.size(), 2u);
    EXPECT_EQ(categories[0], log_category::download);
    EXPECT_EQ(categories[1], log_category::upload);
}

}  // namespace kcenon::media_relay::test
