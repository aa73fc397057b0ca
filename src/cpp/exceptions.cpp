#include "../h/exceptions.h"
#include <cctype>

namespace Exceptions {
    unsigned long long getValidNumber(const std::string& text, unsigned long long min, unsigned long long max,
                                      const std::string& what) {
        if (text.empty()) {
            throw std::invalid_argument("Error: " + what + " must be a number");
        }
        for (char c : text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw std::invalid_argument("Error: " + what + " must be a number, got '" + text + "'");
            }
        }

        unsigned long long number;
        try {
            number = std::stoull(text);
        } catch (const std::out_of_range&) {
            throw std::invalid_argument("Error: " + what + " is too large");
        }

        if (number < min || number > max) {
            throw std::invalid_argument("Error: " + what + " must be between " + std::to_string(min) +
                                        " and " + std::to_string(max));
        }
        return number;
    }
}
