#ifndef EXCEPTIONS_H
#define EXCEPTIONS_H

#include <stdexcept>
#include <string>

// Thrown when a shared secret is not valid base32
class InvalidSecret : public std::runtime_error {
public:
    explicit InvalidSecret(const std::string& message) : std::runtime_error(message) {}
};

namespace Exceptions {
    // Parses a decimal number in [min, max], throws std::invalid_argument otherwise
    unsigned long long getValidNumber(const std::string& text, unsigned long long min, unsigned long long max,
                                      const std::string& what = "value");
}

#endif // EXCEPTIONS_H
