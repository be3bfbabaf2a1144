/**
 * @file process_runner.h
 * @brief Subprocess execution with captured output
 */

#ifndef KCENON_MEDIA_RELAY_CORE_PROCESS_RUNNER_H
#define KCENON_MEDIA_RELAY_CORE_PROCESS_RUNNER_H

#include <kcenon/media_relay/core/types.h>

#include <string>
#include <vector>

namespace kcenon::media_relay {

/**
 * @brief Outcome of a finished subprocess
 */
struct process_result {
    int exit_code = 0;     ///< Exit status, or 128 + signal if killed
    std::string output;    ///< Combined stdout and stderr
};

/**
 * @brief Runs external programs via posix_spawnp
 *
 * stdin is redirected from /dev/null; stdout and stderr are merged into a
 * single pipe and returned in process_result::output.
 */
class process_runner {
public:
    /**
     * @brief Run a program to completion
     * @param argv Program name (resolved through PATH) followed by arguments
     * @return Exit status and output, or process_spawn_failed
     */
    [[nodiscard]] static auto run(const std::vector<std::string>& argv)
        -> result<process_result>;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_CORE_PROCESS_RUNNER_H
