#include "../h/secret.h"
#include "../h/exceptions.h"
#include <liboath/oath.h>
#include <cstdlib>

// Strip spaces, fold case and check the RFC 4648 base32 layout
std::string Secret::normalize(const std::string& text, bool casefold) {
    std::string result;
    result.reserve(text.size());

    for (char c : text) {
        if (c == ' ') continue;
        if (casefold && c >= 'a' && c <= 'z') {
            c = static_cast<char>(c - 'a' + 'A');
        }
        bool in_alphabet = (c >= 'A' && c <= 'Z') || (c >= '2' && c <= '7') || c == '=';
        if (!in_alphabet) {
            throw InvalidSecret("Invalid secret: unexpected character in base32 text");
        }
        result += c;
    }

    if (result.empty()) {
        throw InvalidSecret("Invalid secret: empty secret is not allowed");
    }
    if (result.size() % 8 != 0) {
        throw InvalidSecret("Invalid secret: incorrect base32 padding");
    }

    // Padding is only allowed at the end, in one of the lengths a 5 byte group can produce
    size_t data_len = result.find('=');
    if (data_len != std::string::npos) {
        if (result.find_first_not_of('=', data_len) != std::string::npos) {
            throw InvalidSecret("Invalid secret: padding in the middle of base32 text");
        }
        size_t pad_len = result.size() - data_len;
        if (pad_len != 1 && pad_len != 3 && pad_len != 4 && pad_len != 6) {
            throw InvalidSecret("Invalid secret: incorrect base32 padding");
        }
    }

    return result;
}

std::string Secret::decode(const std::string& text, bool casefold) {
    std::string normalized = normalize(text, casefold);

    char* decoded = nullptr;
    size_t decoded_len = 0;
    int rc = oath_base32_decode(normalized.c_str(), normalized.size(), &decoded, &decoded_len);
    if (rc != OATH_OK || decoded == nullptr) {
        if (decoded) free(decoded);
        throw InvalidSecret(std::string("Invalid secret: ") + oath_strerror(rc));
    }

    std::string key(decoded, decoded_len);
    free(decoded);

    if (key.empty()) {
        throw InvalidSecret("Invalid secret: decodes to an empty key");
    }
    return key;
}

bool Secret::isValid(const std::string& text, bool casefold) {
    try {
        decode(text, casefold);
    } catch (const InvalidSecret&) {
        return false;
    }
    return true;
}
