/**
 * @file state_backend.cpp
 * @brief File and in-memory state backends
 */

#include <kcenon/media_relay/storage/state_backend.h>
#include <kcenon/media_relay/core/logging.h>

#include <fstream>
#include <sstream>

namespace kcenon::media_relay {

// ============================================================================
// file_state_backend
// ============================================================================

file_state_backend::file_state_backend(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

auto file_state_backend::path_for(std::string_view name) const -> std::filesystem::path {
    return directory_ / std::string(name);
}

auto file_state_backend::describe(std::string_view name) const -> std::string {
    return path_for(name).string();
}

auto file_state_backend::read(std::string_view name)
    -> result<std::optional<std::string>> {
    auto path = path_for(name);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::optional<std::string>{};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(error{error_code::file_read_error,
                                "failed to open state file: " + path.string()});
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        return unexpected(error{error_code::file_read_error,
                                "failed to read state file: " + path.string()});
    }
    return std::optional<std::string>{oss.str()};
}

auto file_state_backend::write(std::string_view name, std::string_view content)
    -> result<void> {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return unexpected(error{error_code::state_write_error,
                                "failed to create state directory " +
                                    directory_.string() + ": " + ec.message()});
    }

    auto path = path_for(name);
    auto temp_path = path;
    temp_path += ".tmp";

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return unexpected(error{error_code::state_write_error,
                                    "failed to open state file for writing: " +
                                        temp_path.string()});
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();
        if (!file) {
            std::filesystem::remove(temp_path, ec);
            return unexpected(error{error_code::state_write_error,
                                    "failed to write state file: " + temp_path.string()});
        }
    }

    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return unexpected(error{error_code::state_write_error,
                                "failed to replace state file " + path.string() +
                                    ": " + ec.message()});
    }

    MR_LOG_TRACE(log_category::resume, "State persisted to: " + path.string());
    return {};
}

auto file_state_backend::remove(std::string_view name) -> result<void> {
    auto path = path_for(name);
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return unexpected(error{error_code::state_write_error,
                                "failed to delete state file " + path.string() +
                                    ": " + ec.message()});
    }
    return {};
}

// ============================================================================
// memory_state_backend
// ============================================================================

auto memory_state_backend::read(std::string_view name)
    -> result<std::optional<std::string>> {
    std::lock_guard lock(mutex_);
    auto it = documents_.find(name);
    if (it == documents_.end()) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{it->second};
}

auto memory_state_backend::write(std::string_view name, std::string_view content)
    -> result<void> {
    std::lock_guard lock(mutex_);
    if (read_only_) {
        return unexpected(error{error_code::state_write_error,
                                "state backend is read-only"});
    }
    documents_[std::string(name)] = std::string(content);
    return {};
}

auto memory_state_backend::remove(std::string_view name) -> result<void> {
    std::lock_guard lock(mutex_);
    if (read_only_) {
        return unexpected(error{error_code::state_write_error,
                                "state backend is read-only"});
    }
    auto it = documents_.find(name);
    if (it != documents_.end()) {
        documents_.erase(it);
    }
    return {};
}

auto memory_state_backend::describe(std::string_view name) const -> std::string {
    return "memory:" + std::string(name);
}

void memory_state_backend::set_read_only(bool read_only) {
    std::lock_guard lock(mutex_);
    read_only_ = read_only;
}

}  // namespace kcenon::media_relay
