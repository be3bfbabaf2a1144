/**
 * @file checksum.h
 * @brief SHA-256 digests for artifact integrity verification
 */

#ifndef KCENON_MEDIA_RELAY_CORE_CHECKSUM_H
#define KCENON_MEDIA_RELAY_CORE_CHECKSUM_H

#include <kcenon/media_relay/core/types.h>

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>

namespace kcenon::media_relay {

/**
 * @brief SHA-256 utilities backed by OpenSSL EVP
 *
 * Used to fingerprint upload artifacts so a resumed upload can prove the
 * file on disk is the one recorded before the crash.
 */
class checksum {
public:
    /**
     * @brief Calculate SHA-256 hash of a file
     * @param path Path to the file
     * @return SHA-256 hash as lowercase hex string, or error
     */
    [[nodiscard]] static auto sha256_file(const std::filesystem::path& path)
        -> result<std::string>;

    /**
     * @brief Verify SHA-256 hash of a file
     * @param path Path to the file
     * @param expected Expected hash as hex string
     * @return true if hash matches, false otherwise
     */
    [[nodiscard]] static auto verify_sha256(
        const std::filesystem::path& path, const std::string& expected) -> bool;

    /**
     * @brief Calculate SHA-256 hash of data
     * @param data Input data span
     * @return SHA-256 hash as lowercase hex string, or error
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data)
        -> result<std::string>;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_CORE_CHECKSUM_H
