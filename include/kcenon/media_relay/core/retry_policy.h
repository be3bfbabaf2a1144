/**
 * @file retry_policy.h
 * @brief Bounded exponential backoff for transient transport failures
 */

#ifndef KCENON_MEDIA_RELAY_CORE_RETRY_POLICY_H
#define KCENON_MEDIA_RELAY_CORE_RETRY_POLICY_H

#include <kcenon/media_relay/core/types.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>

namespace kcenon::media_relay {

/**
 * @brief Retry policy for chunked transfers
 *
 * Delay for attempt n (1-based) is
 * min(initial_delay * backoff_multiplier^(n-1), max_delay). With the defaults
 * this is min(2^n, cap) seconds.
 */
struct retry_policy {
    /// Maximum number of retries before giving up
    std::size_t max_attempts = 5;

    /// Delay before the first retry
    std::chrono::milliseconds initial_delay{2000};

    /// Cap on the exponential delay
    std::chrono::milliseconds max_delay{60000};

    /// Multiplier for exponential backoff
    double backoff_multiplier = 2.0;

    /// Fixed delay for transient errors that are not timeouts; when unset
    /// such errors use the exponential schedule as well
    std::optional<std::chrono::milliseconds> non_timeout_delay;

    /**
     * @brief Validate the policy
     * @return Success or invalid_configuration error
     */
    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Sleep hook used between retries
 *
 * Production code sleeps the calling thread; tests inject a recorder.
 */
using sleep_function = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief Sleep function that blocks the calling thread
 */
[[nodiscard]] auto thread_sleeper() -> sleep_function;

/**
 * @brief Calculate the exponential delay for a retry attempt
 * @param policy Retry policy
 * @param attempt 1-based retry attempt
 * @return Delay before the retry
 */
[[nodiscard]] auto calculate_retry_delay(const retry_policy& policy,
                                         std::size_t attempt)
    -> std::chrono::milliseconds;

/**
 * @brief Delay for a retry, taking the error kind into account
 *
 * Timeouts and stalls always use the exponential schedule. Other transient
 * errors use non_timeout_delay when the policy sets one.
 */
[[nodiscard]] auto retry_delay_for(const retry_policy& policy,
                                   error_code code,
                                   std::size_t attempt)
    -> std::chrono::milliseconds;

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_CORE_RETRY_POLICY_H
