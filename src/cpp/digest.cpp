#include "../h/digest.h"
#include <stdexcept>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace {

// Compute HMAC of message with the given EVP digest
std::string hmac(const EVP_MD* md, const std::string& key, const std::string& message) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;

    if (!HMAC(md, key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(message.data()), message.size(), out, &out_len)) {
        throw std::runtime_error("Failed to compute HMAC");
    }

    return std::string(reinterpret_cast<char*>(out), out_len);
}

}

std::string Digest::hmacSha1(const std::string& key, const std::string& message) {
    return hmac(EVP_sha1(), key, message);
}

std::string Digest::hmacSha256(const std::string& key, const std::string& message) {
    return hmac(EVP_sha256(), key, message);
}

std::string Digest::hmacSha512(const std::string& key, const std::string& message) {
    return hmac(EVP_sha512(), key, message);
}

DigestFunction Digest::byName(const std::string& name) {
    const EVP_MD* md = EVP_get_digestbyname(name.c_str());
    if (!md) {
        throw std::invalid_argument("Unknown digest algorithm: " + name);
    }

    return [md](const std::string& key, const std::string& message) {
        return hmac(md, key, message);
    };
}
