#ifndef TOTP_H
#define TOTP_H

#include <cstdint>
#include <string>
#include "options.h"

// Time-based one time password (RFC 6238), Google Authenticator compatible.
// A TOTP code at clock c is the HOTP code at counter c / interval.
class TOTP {
public:
    // Current epoch seconds
    static uint64_t now();
    static uint64_t counterAt(uint64_t clock, uint64_t interval);

    // Generates the TOTP code for the current time or a given clock
    static uint32_t generateCode(const std::string& secret, const OtpOptions& options = OtpOptions());
    static uint32_t generateCode(const std::string& secret, uint64_t clock, const OtpOptions& options);
    static std::string generateCodeString(const std::string& secret, const OtpOptions& options = OtpOptions());
    static std::string generateCodeString(const std::string& secret, uint64_t clock, const OtpOptions& options);

    // Checks a TOTP code within options.window steps on each side of the clock.
    // Accepted codes are not remembered: the same code passes again until it leaves the window.
    static bool verifyCode(const std::string& candidate, const std::string& secret,
                           const OtpOptions& options = OtpOptions());
    static bool verifyCode(const std::string& candidate, const std::string& secret, uint64_t clock,
                           const OtpOptions& options);
    static bool verifyCode(uint64_t candidate, const std::string& secret, uint64_t clock, const OtpOptions& options);

    // Like verifyCode, but reports the matching time step so callers can track replays
    static bool matchCounter(const std::string& candidate, const std::string& secret, uint64_t clock,
                             const OtpOptions& options, uint64_t& counter);

private:
    static void checkInterval(uint64_t interval);
};

#endif // TOTP_H
