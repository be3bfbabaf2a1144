/**
 * @file types.h
 * @brief Core type definitions for media_relay
 *
 * Error codes are grouped by range:
 * - -100 to -119: File Errors
 * - -120 to -139: Catalog Errors
 * - -140 to -159: State Errors
 * - -160 to -179: Transfer Errors
 * - -180 to -199: Remote Errors
 * - -200 to -219: Compression Errors
 * - -220 to -239: Configuration Errors
 * - -240 to -259: Internal Errors
 */

#ifndef KCENON_MEDIA_RELAY_CORE_TYPES_H
#define KCENON_MEDIA_RELAY_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::media_relay {

/**
 * @brief Error codes for media relay operations
 */
enum class error_code : int32_t {
    success = 0,

    // File errors (-100 to -119)
    file_not_found = -100,
    file_access_denied = -101,
    file_read_error = -102,
    file_write_error = -103,
    file_size_mismatch = -104,
    checksum_mismatch = -105,
    malformed_document = -106,

    // Catalog errors (-120 to -139)
    catalog_parse_error = -120,
    item_not_found = -121,
    already_published = -122,
    invalid_locator = -123,
    no_eligible_item = -124,

    // State errors (-140 to -159)
    state_corrupted = -140,
    state_write_error = -141,

    // Transfer errors (-160 to -179)
    transfer_timeout = -160,
    transfer_stalled = -161,
    connection_failed = -162,
    connection_lost = -163,
    download_failed = -164,
    upload_failed = -165,

    // Remote errors (-180 to -199)
    remote_server_error = -180,
    remote_client_error = -181,
    source_not_found = -182,
    source_access_denied = -183,

    // Compression errors (-200 to -219)
    encoder_unavailable = -200,
    encoding_failed = -201,
    encoding_not_smaller = -202,

    // Configuration errors (-220 to -239)
    invalid_configuration = -220,

    // Internal errors (-240 to -259)
    internal_error = -240,
    process_spawn_failed = -241,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::file_size_mismatch:
            return "file size mismatch";
        case error_code::checksum_mismatch:
            return "checksum mismatch";
        case error_code::malformed_document:
            return "malformed document";
        case error_code::catalog_parse_error:
            return "catalog parse error";
        case error_code::item_not_found:
            return "item not found";
        case error_code::already_published:
            return "item already published";
        case error_code::invalid_locator:
            return "invalid source locator";
        case error_code::no_eligible_item:
            return "no eligible item";
        case error_code::state_corrupted:
            return "state corrupted";
        case error_code::state_write_error:
            return "state write error";
        case error_code::transfer_timeout:
            return "transfer timeout";
        case error_code::transfer_stalled:
            return "transfer stalled";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_lost:
            return "connection lost";
        case error_code::download_failed:
            return "download failed after maximum retries";
        case error_code::upload_failed:
            return "upload failed after maximum retries";
        case error_code::remote_server_error:
            return "remote server error";
        case error_code::remote_client_error:
            return "remote client error";
        case error_code::source_not_found:
            return "source file not found";
        case error_code::source_access_denied:
            return "source access denied";
        case error_code::encoder_unavailable:
            return "encoder unavailable";
        case error_code::encoding_failed:
            return "encoding failed";
        case error_code::encoding_not_smaller:
            return "encoding did not reduce size";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::internal_error:
            return "internal error";
        case error_code::process_spawn_failed:
            return "failed to spawn process";
        default:
            return "unknown error";
    }
}

/**
 * @brief Recovery class of an error
 */
enum class error_class {
    none,                 ///< Not an error
    transient_transport,  ///< Timeouts, stalls, 5xx: retry with backoff
    permanent,            ///< 4xx, malformed input, missing source: no retry
    degraded              ///< Optional step failed: fall back and continue
};

[[nodiscard]] constexpr auto to_string(error_class cls) -> const char* {
    switch (cls) {
        case error_class::none: return "none";
        case error_class::transient_transport: return "transient_transport";
        case error_class::permanent: return "permanent";
        case error_class::degraded: return "degraded";
        default: return "unknown";
    }
}

/**
 * @brief Classify an error code by how it can be recovered
 */
[[nodiscard]] constexpr auto classify(error_code code) noexcept -> error_class {
    switch (code) {
        case error_code::success:
            return error_class::none;
        case error_code::transfer_timeout:
        case error_code::transfer_stalled:
        case error_code::connection_failed:
        case error_code::connection_lost:
        case error_code::remote_server_error:
            return error_class::transient_transport;
        case error_code::encoder_unavailable:
        case error_code::encoding_failed:
        case error_code::encoding_not_smaller:
            return error_class::degraded;
        default:
            return error_class::permanent;
    }
}

/**
 * @brief Check if the error is retryable
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) noexcept -> bool {
    return classify(code) == error_class::transient_transport;
}

/**
 * @brief Check if the error is a timeout-like transport failure
 *
 * Stalls count as timeouts.
 */
[[nodiscard]] constexpr auto is_timeout(error_code code) noexcept -> bool {
    return code == error_code::transfer_timeout ||
           code == error_code::transfer_stalled;
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_CORE_TYPES_H
