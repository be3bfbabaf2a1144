/**
 * @file state_backend.h
 * @brief Persisted blob storage for ledger and resume state
 */

#ifndef KCENON_MEDIA_RELAY_STORAGE_STATE_BACKEND_H
#define KCENON_MEDIA_RELAY_STORAGE_STATE_BACKEND_H

#include <kcenon/media_relay/core/types.h>

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::media_relay {

/**
 * @brief Abstract store of named documents
 *
 * Each write replaces the whole document. A write either fully succeeds or
 * leaves the previous content in place.
 */
class state_backend {
public:
    virtual ~state_backend() = default;

    /**
     * @brief Read a document
     * @param name Document name
     * @return Content, nullopt if the document does not exist, or error
     */
    [[nodiscard]] virtual auto read(std::string_view name)
        -> result<std::optional<std::string>> = 0;

    /**
     * @brief Replace a document
     * @param name Document name
     * @param content New content
     * @return Success or state_write_error
     */
    [[nodiscard]] virtual auto write(std::string_view name, std::string_view content)
        -> result<void> = 0;

    /**
     * @brief Remove a document; removing a missing document succeeds
     */
    [[nodiscard]] virtual auto remove(std::string_view name) -> result<void> = 0;

    /**
     * @brief Human-readable location of a document, for log messages
     */
    [[nodiscard]] virtual auto describe(std::string_view name) const -> std::string = 0;
};

/**
 * @brief Stores documents as files in a directory
 *
 * Writes go to "<name>.tmp" and are renamed over the target, so a crash
 * mid-write never leaves a truncated document.
 */
class file_state_backend final : public state_backend {
public:
    explicit file_state_backend(std::filesystem::path directory);

    [[nodiscard]] auto read(std::string_view name)
        -> result<std::optional<std::string>> override;
    [[nodiscard]] auto write(std::string_view name, std::string_view content)
        -> result<void> override;
    [[nodiscard]] auto remove(std::string_view name) -> result<void> override;
    [[nodiscard]] auto describe(std::string_view name) const -> std::string override;

    [[nodiscard]] auto directory() const -> const std::filesystem::path& { return directory_; }

private:
    [[nodiscard]] auto path_for(std::string_view name) const -> std::filesystem::path;

    std::filesystem::path directory_;
};

/**
 * @brief Keeps documents in memory
 */
class memory_state_backend final : public state_backend {
public:
    [[nodiscard]] auto read(std::string_view name)
        -> result<std::optional<std::string>> override;
    [[nodiscard]] auto write(std::string_view name, std::string_view content)
        -> result<void> override;
    [[nodiscard]] auto remove(std::string_view name) -> result<void> override;
    [[nodiscard]] auto describe(std::string_view name) const -> std::string override;

    /**
     * @brief Make subsequent writes fail with state_write_error
     */
    void set_read_only(bool read_only);

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string, std::less<>> documents_;
    bool read_only_ = false;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_STORAGE_STATE_BACKEND_H
