#include "../h/totp.h"
#include "../h/hotp.h"
#include "../h/secret.h"
#include <ctime>
#include <limits>
#include <stdexcept>

void TOTP::checkInterval(uint64_t interval) {
    if (interval == 0) {
        throw std::invalid_argument("TOTP interval must be at least 1 second");
    }
}

uint64_t TOTP::now() {
    time_t t = time(nullptr);
    return t > 0 ? static_cast<uint64_t>(t) : 0;
}

uint64_t TOTP::counterAt(uint64_t clock, uint64_t interval) {
    checkInterval(interval);
    return clock / interval;
}

uint32_t TOTP::generateCode(const std::string& secret, const OtpOptions& options) {
    return generateCode(secret, now(), options);
}

uint32_t TOTP::generateCode(const std::string& secret, uint64_t clock, const OtpOptions& options) {
    return HOTP::generateCode(secret, counterAt(clock, options.interval), options);
}

std::string TOTP::generateCodeString(const std::string& secret, const OtpOptions& options) {
    return generateCodeString(secret, now(), options);
}

std::string TOTP::generateCodeString(const std::string& secret, uint64_t clock, const OtpOptions& options) {
    return HOTP::formatCode(generateCode(secret, clock, options), options.digits);
}

bool TOTP::matchCounter(const std::string& candidate, const std::string& secret, uint64_t clock,
                        const OtpOptions& options, uint64_t& counter) {
    HOTP::checkDigits(options.digits);
    checkInterval(options.interval);
    if (!HOTP::isPossibleCode(candidate, options.digits)) {
        return false;
    }

    std::string key = Secret::decode(secret, options.casefold);

    uint32_t code;
    if (!HOTP::parseCode(candidate, code)) {
        return false;
    }

    // clock + w * interval falls in step current + w; steps before the epoch are skipped
    uint64_t current = clock / options.interval;
    uint64_t first = current >= options.window ? current - options.window : 0;
    uint64_t last = current <= std::numeric_limits<uint64_t>::max() - options.window
                        ? current + options.window
                        : std::numeric_limits<uint64_t>::max();
    for (uint64_t i = first; ; i++) {
        if (HOTP::compute(key, i, options) == code) {
            counter = i;
            return true;
        }
        if (i == last) break;
    }
    return false;
}

bool TOTP::verifyCode(const std::string& candidate, const std::string& secret, const OtpOptions& options) {
    return verifyCode(candidate, secret, now(), options);
}

bool TOTP::verifyCode(const std::string& candidate, const std::string& secret, uint64_t clock,
                      const OtpOptions& options) {
    uint64_t counter;
    return matchCounter(candidate, secret, clock, options, counter);
}

bool TOTP::verifyCode(uint64_t candidate, const std::string& secret, uint64_t clock, const OtpOptions& options) {
    return verifyCode(std::to_string(candidate), secret, clock, options);
}
