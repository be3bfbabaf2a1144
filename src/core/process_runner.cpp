/**
 * @file process_runner.cpp
 * @brief posix_spawn based implementation of process_runner
 */

#include <kcenon/media_relay/core/process_runner.h>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace kcenon::media_relay {

namespace {

/**
 * @brief RAII owner for posix_spawn_file_actions_t
 */
class spawn_file_actions {
public:
    spawn_file_actions() { ok_ = posix_spawn_file_actions_init(&actions_) == 0; }
    ~spawn_file_actions() {
        if (ok_) {
            posix_spawn_file_actions_destroy(&actions_);
        }
    }

    spawn_file_actions(const spawn_file_actions&) = delete;
    auto operator=(const spawn_file_actions&) -> spawn_file_actions& = delete;

    [[nodiscard]] auto get() -> posix_spawn_file_actions_t* { return &actions_; }
    [[nodiscard]] explicit operator bool() const { return ok_; }

private:
    posix_spawn_file_actions_t actions_{};
    bool ok_ = false;
};

/**
 * @brief Closes a file descriptor on scope exit
 */
class fd_guard {
public:
    explicit fd_guard(int fd = -1) : fd_(fd) {}
    ~fd_guard() { reset(); }

    fd_guard(const fd_guard&) = delete;
    auto operator=(const fd_guard&) -> fd_guard& = delete;

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

    [[nodiscard]] auto get() const -> int { return fd_; }

private:
    int fd_;
};

auto spawn_error(const std::string& what, int err) -> unexpected {
    return unexpected(error{error_code::process_spawn_failed,
                            what + ": " + std::strerror(err)});
}

}  // namespace

auto process_runner::run(const std::vector<std::string>& argv) -> result<process_result> {
    if (argv.empty() || argv.front().empty()) {
        return unexpected(error{error_code::invalid_configuration,
                                "no program specified"});
    }

    int pipe_fds[2];
    if (::pipe2(pipe_fds, O_CLOEXEC) != 0) {
        return spawn_error("pipe", errno);
    }
    fd_guard read_end(pipe_fds[0]);
    fd_guard write_end(pipe_fds[1]);

    spawn_file_actions actions;
    if (!actions) {
        return spawn_error("posix_spawn_file_actions_init", errno);
    }
    posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(actions.get(), write_end.get(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(actions.get(), write_end.get(), STDERR_FILENO);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, args[0], actions.get(), nullptr, args.data(), environ);
    if (rc != 0) {
        return spawn_error("failed to start " + argv.front(), rc);
    }
    write_end.reset();

    process_result out;
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(read_end.get(), buffer, sizeof(buffer));
        if (n > 0) {
            out.output.append(buffer, static_cast<std::size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            break;
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return spawn_error("waitpid", errno);
        }
    }

    if (WIFEXITED(status)) {
        out.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        out.exit_code = 128 + WTERMSIG(status);
    } else {
        out.exit_code = -1;
    }
    return out;
}

}  // namespace kcenon::media_relay
