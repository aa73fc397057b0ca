#ifndef OPTIONS_H
#define OPTIONS_H

#include <cstdint>
#include "digest.h"

// Call-time configuration shared by the HOTP and TOTP operations
struct OtpOptions {
    DigestFunction digest = Digest::hmacSha1; // Keyed hash used for every code
    int digits = 6;                           // Code length, must be >= 1 (above 9 only pads)
    uint64_t interval = 30;                   // TOTP time step in seconds, must be > 0
    bool casefold = true;                     // Accept lowercase base32 secrets
    uint64_t trials = 1000;                   // HOTP look-ahead after the last counter
    uint64_t window = 0;                      // TOTP steps accepted on each side of the clock
};

#endif // OPTIONS_H
