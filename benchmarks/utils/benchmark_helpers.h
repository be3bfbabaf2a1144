/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_MEDIA_RELAY_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_MEDIA_RELAY_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kcenon::media_relay::benchmark {

// ============================================================================
// Generated inputs
// ============================================================================

/**
 * @brief Deterministic pseudo-random bytes standing in for clip content
 * @param seed Random seed (0 for a nondeterministic seed)
 */
auto random_bytes(std::size_t size, uint32_t seed = 0) -> std::vector<std::byte>;

/**
 * @brief Catalog document with identifiers 1..count in shuffled order
 *
 * Each entry carries a name, a file locator and three ingredients, matching
 * the default catalog field names.
 */
auto make_catalog_document(std::size_t count, uint32_t seed = 0) -> std::string;

/**
 * @brief Ledger document listing identifiers 1..count
 */
auto make_ledger_document(std::size_t count) -> std::string;

// ============================================================================
// Scratch directory
// ============================================================================

/**
 * @brief Uniquely named scratch directory, removed with its contents on destruction
 */
class relay_workspace {
public:
    relay_workspace();
    ~relay_workspace();

    relay_workspace(const relay_workspace&) = delete;
    auto operator=(const relay_workspace&) -> relay_workspace& = delete;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

    /**
     * @brief Write a file below the workspace, creating parent directories
     * @param relative Path relative to the workspace root
     */
    auto write_bytes(const std::filesystem::path& relative, const std::vector<std::byte>& data)
        -> std::filesystem::path;
    auto write_text(const std::filesystem::path& relative, const std::string& text)
        -> std::filesystem::path;
    auto write_random(const std::filesystem::path& relative, std::size_t size, uint32_t seed)
        -> std::filesystem::path;

private:
    auto prepare(const std::filesystem::path& relative) const -> std::filesystem::path;

    std::filesystem::path root_;
};

/**
 * @brief Format bytes as human-readable string (e.g. "4.00 MB")
 */
auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t short_clip = 4 * MB;
constexpr std::size_t long_clip = 64 * MB;

constexpr std::size_t download_chunk = 256 * KB;
}  // namespace sizes

}  // namespace kcenon::media_relay::benchmark

#endif  // KCENON_MEDIA_RELAY_BENCHMARKS_BENCHMARK_HELPERS_H
