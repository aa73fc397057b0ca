#include "../h/hotp.h"
#include "../h/secret.h"
#include <limits>
#include <stdexcept>

void HOTP::checkDigits(int digits) {
    if (digits < 1) {
        throw std::invalid_argument("Code length must be at least 1 digit");
    }
}

uint32_t HOTP::truncate(const std::string& digest, int digits) {
    checkDigits(digits);
    if (digest.empty()) {
        throw std::runtime_error("Digest function returned no data");
    }

    size_t offset = static_cast<unsigned char>(digest[digest.size() - 1]) & 0x0F;
    if (offset + 4 > digest.size()) {
        throw std::runtime_error("Digest is too short for dynamic truncation");
    }

    const unsigned char* p = reinterpret_cast<const unsigned char*>(digest.data()) + offset;
    uint32_t value = (static_cast<uint32_t>(p[0] & 0x7F) << 24) |
                     (static_cast<uint32_t>(p[1]) << 16) |
                     (static_cast<uint32_t>(p[2]) << 8) |
                     static_cast<uint32_t>(p[3]);

    // Past 10 digits the modulus exceeds the 31-bit value and stops mattering
    uint64_t modulus = 1;
    for (int i = 0; i < digits && modulus <= std::numeric_limits<uint32_t>::max(); i++) {
        modulus *= 10;
    }
    return static_cast<uint32_t>(value % modulus);
}

std::string HOTP::formatCode(uint32_t code, int digits) {
    checkDigits(digits);
    std::string result = std::to_string(code);
    if (result.size() < static_cast<size_t>(digits)) {
        result.insert(0, static_cast<size_t>(digits) - result.size(), '0');
    }
    return result;
}

uint32_t HOTP::compute(const std::string& key, uint64_t counter, const OtpOptions& options) {
    if (!options.digest) {
        throw std::invalid_argument("No digest function configured");
    }

    // Counter as 8 bytes, big endian
    std::string message(8, '\0');
    for (int i = 7; i >= 0; i--) {
        message[i] = static_cast<char>(counter & 0xFF);
        counter >>= 8;
    }

    return truncate(options.digest(key, message), options.digits);
}

uint32_t HOTP::generateCode(const std::string& secret, uint64_t counter, const OtpOptions& options) {
    checkDigits(options.digits);
    std::string key = Secret::decode(secret, options.casefold);
    return compute(key, counter, options);
}

std::string HOTP::generateCodeString(const std::string& secret, uint64_t counter, const OtpOptions& options) {
    return formatCode(generateCode(secret, counter, options), options.digits);
}

bool HOTP::isPossibleCode(const std::string& candidate, int digits) {
    if (digits < 1 || candidate.empty() || candidate.size() > static_cast<size_t>(digits)) {
        return false;
    }
    for (char c : candidate) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

// Numeric value of a candidate that passed isPossibleCode. Returns false when the
// value is beyond anything truncation can produce.
bool HOTP::parseCode(const std::string& candidate, uint32_t& code) {
    size_t start = candidate.find_first_not_of('0');
    if (start == std::string::npos) {
        code = 0;
        return true;
    }
    if (candidate.size() - start > 10) {
        return false;
    }

    uint64_t value = std::stoull(candidate.substr(start));
    if (value > std::numeric_limits<uint32_t>::max()) {
        return false;
    }
    code = static_cast<uint32_t>(value);
    return true;
}

bool HOTP::verifyCode(const std::string& candidate, const std::string& secret, uint64_t last,
                      const OtpOptions& options, uint64_t& counter) {
    checkDigits(options.digits);
    if (!isPossibleCode(candidate, options.digits)) {
        return false;
    }

    // Decode before searching so a bad secret is reported even when nothing could match
    std::string key = Secret::decode(secret, options.casefold);

    uint32_t code;
    if (!parseCode(candidate, code)) {
        return false;
    }

    for (uint64_t step = 1; step <= options.trials; step++) {
        if (last > std::numeric_limits<uint64_t>::max() - step) break;
        uint64_t i = last + step;
        if (compute(key, i, options) == code) {
            counter = i;
            return true;
        }
    }
    return false;
}

bool HOTP::verifyCode(uint64_t candidate, const std::string& secret, uint64_t last,
                      const OtpOptions& options, uint64_t& counter) {
    return verifyCode(std::to_string(candidate), secret, last, options, counter);
}

bool HOTP::verifyCode(const std::string& candidate, const std::string& secret, uint64_t& counter) {
    return verifyCode(candidate, secret, 1, OtpOptions(), counter);
}
