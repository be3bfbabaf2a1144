// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cctype>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

// logger_system integration requires common_system
#if defined(BUILD_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
#define MEDIA_RELAY_USE_LOGGER_SYSTEM 1
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::media_relay {

/**
 * @brief Log categories for media relay
 */
struct log_category {
    static constexpr std::string_view catalog = "media_relay.catalog";
    static constexpr std::string_view ledger = "media_relay.ledger";
    static constexpr std::string_view resume = "media_relay.resume";
    static constexpr std::string_view download = "media_relay.download";
    static constexpr std::string_view compress = "media_relay.compress";
    static constexpr std::string_view upload = "media_relay.upload";
    static constexpr std::string_view pipeline = "media_relay.pipeline";
    static constexpr std::string_view cli = "media_relay.cli";
};

/**
 * @brief Log levels for media relay
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Upper-case name of a log level
 */
inline std::string_view log_level_to_string(log_level level) {
    static constexpr std::array<std::string_view, 6> names = {
        "TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
    const auto index = static_cast<std::size_t>(level);
    return index < names.size() ? names[index] : "UNKNOWN";
}

/**
 * @brief Parse a log level name, case-insensitive; "warning" is accepted for warn
 */
inline std::optional<log_level> log_level_from_string(std::string_view name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "WARNING") {
        return log_level::warn;
    }
    for (auto level : {log_level::trace, log_level::debug, log_level::info,
                       log_level::warn, log_level::error, log_level::fatal}) {
        if (upper == log_level_to_string(level)) {
            return level;
        }
    }
    return std::nullopt;
}

namespace detail {

inline auto escape_json_string(std::string_view input) -> std::string {
    static constexpr char hex[] = "0123456789abcdef";
    std::string output;
    output.reserve(input.size());
    for (char c : input) {
        const auto byte = static_cast<unsigned char>(c);
        if (c == '"' || c == '\\') {
            output += '\\';
            output += c;
        } else if (c == '\n') {
            output += "\\n";
        } else if (c == '\r') {
            output += "\\r";
        } else if (c == '\t') {
            output += "\\t";
        } else if (byte < 0x20) {
            output += "\\u00";
            output += hex[byte >> 4];
            output += hex[byte & 0x0F];
        } else {
            output += c;
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Structured log context for a pipeline item
 */
struct item_log_context {
    std::string item_id;
    std::string filename;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> bytes_transferred;
    std::optional<double> progress_percent;
    std::optional<uint32_t> attempt;
    std::optional<uint64_t> delay_ms;
    std::optional<std::string> stage;
    std::optional<std::string> error_message;

    /**
     * @brief Serialize the populated fields as a flat JSON object
     */
    [[nodiscard]] auto to_json() const -> std::string {
        std::string out = "{";
        auto key = [&out](const char* name) {
            if (out.size() > 1) {
                out += ',';
            }
            out += '"';
            out += name;
            out += "\":";
        };
        auto text = [&](const char* name, std::string_view value) {
            key(name);
            out += '"' + detail::escape_json_string(value) + '"';
        };
        auto number = [&](const char* name, uint64_t value) {
            key(name);
            out += std::to_string(value);
        };

        if (!item_id.empty()) text("item_id", item_id);
        if (!filename.empty()) text("filename", filename);
        if (file_size) number("size", *file_size);
        if (bytes_transferred) number("bytes_transferred", *bytes_transferred);
        if (progress_percent) {
            std::ostringstream percent;
            percent << std::fixed << std::setprecision(2) << *progress_percent;
            key("progress_percent");
            out += percent.str();
        }
        if (attempt) number("attempt", *attempt);
        if (delay_ms) number("delay_ms", *delay_ms);
        if (stage) text("stage", *stage);
        if (error_message) text("error_message", *error_message);

        out += '}';
        return out;
    }
};

/**
 * @brief Line format written by the logger
 */
enum class log_output_format {
    text,   ///< "<time> [LEVEL] [category] message {context}"
    json    ///< One JSON object per line
};

/**
 * @brief Process-wide logger for media relay
 *
 * Writes to kcenon::logger when built with logger_system, otherwise to stderr.
 */
class media_relay_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const item_log_context*)>;

    media_relay_logger() = default;
    ~media_relay_logger() = default;

    media_relay_logger(const media_relay_logger&) = delete;
    media_relay_logger& operator=(const media_relay_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times - subsequent calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#ifdef MEDIA_RELAY_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    /**
     * @brief Flush and release the backend
     */
    void shutdown() {
#ifdef MEDIA_RELAY_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#ifdef MEDIA_RELAY_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) { output_format_.store(format); }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        return output_format_.load();
    }

    void enable_json_output(bool enable = true) {
        set_output_format(enable ? log_output_format::json : log_output_format::text);
    }

    /**
     * @brief Set custom log callback, invoked for every enabled record
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const item_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {

        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        std::string line_str = get_output_format() == log_output_format::json
            ? format_json(level, category, message, context)
            : format_text(category, message, context);

#ifdef MEDIA_RELAY_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), line_str, file, line, function);
            } else {
                logger_->log(to_logger_level(level), line_str);
            }
            return;
        }
#endif
        if (get_output_format() == log_output_format::text) {
            line_str = timestamp(false) + " [" + std::string(log_level_to_string(level)) +
                       "] " + line_str;
        }
        output_to_stderr(line_str);
    }

    void flush() {
#ifdef MEDIA_RELAY_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
        std::cerr.flush();
    }

private:
    static auto format_text(std::string_view category,
                            std::string_view message,
                            const item_log_context* context) -> std::string {
        std::ostringstream oss;
        oss << "[" << category << "] " << message;
        if (context) {
            oss << " " << context->to_json();
        }
        return oss.str();
    }

    static auto format_json(log_level level,
                            std::string_view category,
                            std::string_view message,
                            const item_log_context* context) -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << timestamp(true) << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"message\":\"" << detail::escape_json_string(message) << "\"";
        if (context) {
            std::string ctx_json = context->to_json();
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }
        oss << "}";
        return oss.str();
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#ifdef MEDIA_RELAY_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    /**
     * @brief Current time with milliseconds, local or as UTC ISO-8601
     */
    static auto timestamp(bool iso8601) -> std::string {
        const auto now = std::chrono::system_clock::now();
        const auto seconds = std::chrono::system_clock::to_time_t(now);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                now.time_since_epoch()).count() % 1000;

        std::tm parts{};
        if (iso8601) {
            gmtime_r(&seconds, &parts);
        } else {
            localtime_r(&seconds, &parts);
        }

        std::ostringstream oss;
        oss << std::put_time(&parts, iso8601 ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << millis;
        if (iso8601) {
            oss << 'Z';
        }
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<log_output_format> output_format_{log_output_format::text};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline media_relay_logger& get_logger() {
    static media_relay_logger instance;
    return instance;
}

// Logging macros for convenience
#define MR_LOG(level, category, message) \
    kcenon::media_relay::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define MR_LOG_CTX(level, category, message, context) \
    kcenon::media_relay::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define MR_LOG_TRACE(category, message) \
    MR_LOG(kcenon::media_relay::log_level::trace, category, message)

#define MR_LOG_DEBUG(category, message) \
    MR_LOG(kcenon::media_relay::log_level::debug, category, message)

#define MR_LOG_INFO(category, message) \
    MR_LOG(kcenon::media_relay::log_level::info, category, message)

#define MR_LOG_WARN(category, message) \
    MR_LOG(kcenon::media_relay::log_level::warn, category, message)

#define MR_LOG_ERROR(category, message) \
    MR_LOG(kcenon::media_relay::log_level::error, category, message)

#define MR_LOG_FATAL(category, message) \
    MR_LOG(kcenon::media_relay::log_level::fatal, category, message)

#define MR_LOG_DEBUG_CTX(category, message, ctx) \
    MR_LOG_CTX(kcenon::media_relay::log_level::debug, category, message, ctx)

#define MR_LOG_INFO_CTX(category, message, ctx) \
    MR_LOG_CTX(kcenon::media_relay::log_level::info, category, message, ctx)

#define MR_LOG_WARN_CTX(category, message, ctx) \
    MR_LOG_CTX(kcenon::media_relay::log_level::warn, category, message, ctx)

#define MR_LOG_ERROR_CTX(category, message, ctx) \
    MR_LOG_CTX(kcenon::media_relay::log_level::error, category, message, ctx)

} // namespace kcenon::media_relay
