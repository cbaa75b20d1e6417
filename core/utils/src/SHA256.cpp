#include "SHA256.h"

#include <openssl/evp.h>
#include <openssl/sha.h>

namespace ChunkVault {

void SHA256::Hasher::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

SHA256::Hasher::Hasher() : ctx_(EVP_MD_CTX_new()) {
    ok_ = ctx_ && EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) == 1;
}

SHA256::Hasher::~Hasher() = default;

bool SHA256::Hasher::update(const uint8_t* data, std::size_t length) {
    if (!ok_ || finalized_) {
        return false;
    }
    if (length == 0) {
        return true;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, length) != 1) {
        ok_ = false;
    }
    return ok_;
}

std::string SHA256::Hasher::finalize() {
    if (!ok_ || finalized_) {
        return "";
    }
    finalized_ = true;

    unsigned char digest[SHA256_DIGEST_LENGTH];
    unsigned int digestLen = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest, &digestLen) != 1) {
        ok_ = false;
        return "";
    }
    return toHex(digest, digestLen);
}

std::string SHA256::hash(const std::string& input) {
    return hashBytes(reinterpret_cast<const uint8_t*>(input.data()), input.size());
}

std::string SHA256::hashBytes(const std::vector<uint8_t>& data) {
    return hashBytes(data.data(), data.size());
}

std::string SHA256::hashBytes(const uint8_t* data, std::size_t length) {
    Hasher hasher;
    if (!hasher.update(data, length)) {
        return "";
    }
    return hasher.finalize();
}

std::string SHA256::toHex(const unsigned char* digest, std::size_t length) {
    static const char* kDigits = "0123456789abcdef";
    std::string hex;
    hex.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        hex.push_back(kDigits[(digest[i] >> 4) & 0x0F]);
        hex.push_back(kDigits[digest[i] & 0x0F]);
    }
    return hex;
}

} // namespace ChunkVault
