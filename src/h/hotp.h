#ifndef HOTP_H
#define HOTP_H

#include <cstdint>
#include <string>
#include "options.h"

// HMAC-based one time password (RFC 4226)
class HOTP {
public:
    // Generates the code for a base32 secret and counter
    static uint32_t generateCode(const std::string& secret, uint64_t counter, const OtpOptions& options = OtpOptions());
    // Same code, zero padded to options.digits characters
    static std::string generateCodeString(const std::string& secret, uint64_t counter,
                                          const OtpOptions& options = OtpOptions());

    // Dynamic truncation of a keyed digest, reduced to the given number of digits
    static uint32_t truncate(const std::string& digest, int digits);
    // Formats a code with leading zeros
    static std::string formatCode(uint32_t code, int digits);

    // Cheap pre-filter: non-empty, decimal digits only, no longer than digits
    static bool isPossibleCode(const std::string& candidate, int digits);

    // Searches counters last+1 .. last+options.trials and stores the first match in counter.
    // Returns false when the candidate is malformed or nothing matched.
    static bool verifyCode(const std::string& candidate, const std::string& secret, uint64_t last,
                           const OtpOptions& options, uint64_t& counter);
    static bool verifyCode(uint64_t candidate, const std::string& secret, uint64_t last,
                           const OtpOptions& options, uint64_t& counter);
    // Starts the search after counter 1
    static bool verifyCode(const std::string& candidate, const std::string& secret, uint64_t& counter);

private:
    static void checkDigits(int digits);
    static uint32_t compute(const std::string& key, uint64_t counter, const OtpOptions& options);
    static bool parseCode(const std::string& candidate, uint32_t& code);

    friend class TOTP;
};

#endif // HOTP_H
