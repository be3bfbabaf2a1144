/**
 * @file checksum.cpp
 * @brief Implementation of SHA-256 utilities
 */

#include <kcenon/media_relay/core/checksum.h>

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace kcenon::media_relay {

namespace {

constexpr std::size_t read_buffer_size = 64 * 1024;

/**
 * @brief RAII wrapper for EVP_MD_CTX
 */
class evp_md_ctx_wrapper {
public:
    evp_md_ctx_wrapper() : ctx_(EVP_MD_CTX_new()) {}

    ~evp_md_ctx_wrapper() {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
    }

    evp_md_ctx_wrapper(const evp_md_ctx_wrapper&) = delete;
    auto operator=(const evp_md_ctx_wrapper&) -> evp_md_ctx_wrapper& = delete;

    [[nodiscard]] auto get() const -> EVP_MD_CTX* { return ctx_; }
    [[nodiscard]] explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

auto digest_to_hex(const unsigned char* digest, unsigned int length) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

auto digest_error(const char* step) -> unexpected {
    return unexpected(error{error_code::internal_error,
                            std::string("SHA-256 ") + step + " failed"});
}

}  // namespace

auto checksum::sha256_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_not_found, "cannot open file: " + path.string()});
    }

    evp_md_ctx_wrapper ctx;
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return digest_error("init");
    }

    std::vector<char> buffer(read_buffer_size);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto bytes_read = file.gcount();
        if (bytes_read > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(),
                             static_cast<std::size_t>(bytes_read)) != 1) {
            return digest_error("update");
        }
    }
    if (file.bad()) {
        return unexpected(
            error{error_code::file_read_error, "read failed: " + path.string()});
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
        return digest_error("final");
    }

    return digest_to_hex(digest.data(), digest_len);
}

auto checksum::verify_sha256(const std::filesystem::path& path, const std::string& expected)
    -> bool {
    auto result = sha256_file(path);
    if (!result) {
        return false;
    }
    return result.value() == expected;
}

auto checksum::sha256(std::span<const std::byte> data) -> result<std::string> {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len,
                   EVP_sha256(), nullptr) != 1) {
        return digest_error("digest");
    }
    return digest_to_hex(digest.data(), digest_len);
}

}  // namespace kcenon::media_relay
