#ifndef DIGEST_H
#define DIGEST_H

#include <functional>
#include <string>

// Keyed hash strategy: (key bytes, message bytes) -> digest bytes
using DigestFunction = std::function<std::string(const std::string& key, const std::string& message)>;

// HMAC strategies backed by OpenSSL
class Digest {
public:
    // HMAC-SHA1, the only algorithm Google Authenticator supports
    static std::string hmacSha1(const std::string& key, const std::string& message);
    static std::string hmacSha256(const std::string& key, const std::string& message);
    static std::string hmacSha512(const std::string& key, const std::string& message);

    // HMAC over any digest OpenSSL knows by name, e.g. "SHA256"
    static DigestFunction byName(const std::string& name);
};

#endif // DIGEST_H
