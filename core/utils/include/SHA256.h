#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace ChunkVault {

/**
 * @brief SHA-256 over OpenSSL EVP, hex-encoded lowercase.
 */
class SHA256 {
public:
    static constexpr std::size_t DIGEST_HEX_LENGTH = 64;

    /**
     * @brief Hash a string to hex-encoded SHA256
     */
    static std::string hash(const std::string& input);

    /**
     * @brief Hash binary data to hex-encoded SHA256
     */
    static std::string hashBytes(const std::vector<uint8_t>& data);
    static std::string hashBytes(const uint8_t* data, std::size_t length);

    /**
     * @brief Incremental digest for data that arrives in pieces.
     *
     * Used for the whole-file hash while chunks stream past. A Hasher can
     * be finalized once; later update() calls are ignored and return false.
     */
    class Hasher {
    public:
        Hasher();
        ~Hasher();

        Hasher(const Hasher&) = delete;
        Hasher& operator=(const Hasher&) = delete;

        bool update(const uint8_t* data, std::size_t length);
        bool update(const std::vector<uint8_t>& data) { return update(data.data(), data.size()); }

        /**
         * @return hex digest, or an empty string if OpenSSL reported a failure
         */
        std::string finalize();

    private:
        struct CtxDeleter {
            void operator()(evp_md_ctx_st* ctx) const;
        };
        std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
        bool ok_{false};
        bool finalized_{false};
    };

    static std::string toHex(const unsigned char* digest, std::size_t length);
};

} // namespace ChunkVault
