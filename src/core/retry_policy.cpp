/**
 * @file retry_policy.cpp
 * @brief Implementation of retry delay calculation
 */

#include <kcenon/media_relay/core/retry_policy.h>

#include <algorithm>
#include <thread>

namespace kcenon::media_relay {

auto retry_policy::validate() const -> result<void> {
    if (initial_delay.count() < 0 || max_delay.count() < 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "retry delays must not be negative"});
    }
    if (max_delay < initial_delay) {
        return unexpected(error{error_code::invalid_configuration,
                                "retry max_delay must be at least initial_delay"});
    }
    if (backoff_multiplier < 1.0) {
        return unexpected(error{error_code::invalid_configuration,
                                "retry backoff_multiplier must be >= 1.0"});
    }
    if (non_timeout_delay && non_timeout_delay->count() < 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "retry non_timeout_delay must not be negative"});
    }
    return {};
}

auto thread_sleeper() -> sleep_function {
    return [](std::chrono::milliseconds delay) {
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
    };
}

auto calculate_retry_delay(const retry_policy& policy,
                           std::size_t attempt) -> std::chrono::milliseconds {
    auto delay = static_cast<double>(policy.initial_delay.count());
    const auto cap = static_cast<double>(policy.max_delay.count());

    for (std::size_t i = 1; i < attempt && delay < cap; ++i) {
        delay *= policy.backoff_multiplier;
    }

    delay = std::min(delay, cap);
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

auto retry_delay_for(const retry_policy& policy,
                     error_code code,
                     std::size_t attempt) -> std::chrono::milliseconds {
    if (!is_timeout(code) && policy.non_timeout_delay) {
        return *policy.non_timeout_delay;
    }
    return calculate_retry_delay(policy, attempt);
}

}  // namespace kcenon::media_relay
