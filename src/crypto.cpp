#include "licenseguard/crypto.hpp"

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/sha.h>

#include <iomanip>
#include <memory>
#include <sstream>

namespace licenseguard {
namespace crypto {

// ==================== Base64 Encoding ====================

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return "";
    }

    std::unique_ptr<BIO, decltype(&BIO_free_all)> b64(BIO_new(BIO_f_base64()), BIO_free_all);
    BIO_set_flags(b64.get(), BIO_FLAGS_BASE64_NO_NL);

    BIO* bmem = BIO_new(BIO_s_mem());
    BIO_push(b64.get(), bmem);

    BIO_write(b64.get(), data.data(), static_cast<int>(data.size()));
    (void)BIO_flush(b64.get());

    BUF_MEM* bptr = nullptr;
    BIO_get_mem_ptr(b64.get(), &bptr);

    return std::string(bptr->data, bptr->length);
}

std::string base64_encode(const std::string& data) {
    return base64_encode(std::vector<uint8_t>(data.begin(), data.end()));
}

// ==================== Hashing ====================

std::string sha256_hex(const std::string& input) {
    unsigned char hash[SHA256_DIGEST_LENGTH];

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                                 EVP_MD_CTX_free);
    if (!ctx) {
        return "";
    }

    unsigned int len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash, &len) != 1) {
        return "";
    }

    std::ostringstream ss;
    for (unsigned int i = 0; i < len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::string basic_auth_header(const std::string& user, const std::string& password) {
    return "Basic " + base64_encode(user + ":" + password);
}

}  // namespace crypto
}  // namespace licenseguard
