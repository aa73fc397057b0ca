#ifndef SECRET_H
#define SECRET_H

#include <string>

class Secret {
public:
    // Decodes a base32 secret into raw key bytes, throws InvalidSecret.
    // Spaces are ignored, lowercase is accepted when casefold is set.
    static std::string decode(const std::string& text, bool casefold = true);
    // Checks that a secret would decode
    static bool isValid(const std::string& text, bool casefold = true);

private:
    static std::string normalize(const std::string& text, bool casefold);
};

#endif // SECRET_H
