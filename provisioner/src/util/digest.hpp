#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include <openssl/evp.h>

namespace util {

    /**
     * Streaming SHA-256 over OpenSSL EVP.
     */
    class Sha256 {
        struct ContextDeleter {
            void operator()(EVP_MD_CTX *ctx) const noexcept {
                EVP_MD_CTX_free(ctx);
            }
        };
        std::unique_ptr<EVP_MD_CTX, ContextDeleter> _ctx;

    public:
        Sha256();

        Sha256 &update(std::string_view data);

        /**
         * Finish the digest, returning lower-case hex. The instance cannot be updated afterwards.
         */
        [[nodiscard]] std::string hexDigest();

        /**
         * Hash a whole file in fixed-size chunks.
         */
        [[nodiscard]] static std::string ofFile(const std::filesystem::path &path);
    };

} // namespace util
