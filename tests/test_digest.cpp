#include <gtest/gtest.h>
#include "../src/h/digest.h"
#include <iomanip>
#include <sstream>
#include <stdexcept>

// Helper: Convert bytes to hex string
static std::string to_hex(const std::string& data) {
    std::ostringstream oss;
    for (unsigned char c : data) {
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    }
    return oss.str();
}

TEST(DigestTest, HmacSha1) {
    // RFC 2202 test case 1
    std::string key(20, '\x0b');
    EXPECT_EQ(to_hex(Digest::hmacSha1(key, "Hi There")), "b617318655057264e28bc0b6fb378c8ef146be00");
}

TEST(DigestTest, HmacSha256) {
    // RFC 4231 test case 2
    EXPECT_EQ(to_hex(Digest::hmacSha256("Jefe", "what do ya want for nothing?")),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(DigestTest, OutputSizes) {
    EXPECT_EQ(Digest::hmacSha1("key", "message").size(), 20u);
    EXPECT_EQ(Digest::hmacSha256("key", "message").size(), 32u);
    EXPECT_EQ(Digest::hmacSha512("key", "message").size(), 64u);
}

TEST(DigestTest, ByNameMatchesBuiltins) {
    EXPECT_EQ(Digest::byName("SHA1")("key", "message"), Digest::hmacSha1("key", "message"));
    EXPECT_EQ(Digest::byName("SHA256")("key", "message"), Digest::hmacSha256("key", "message"));
    EXPECT_EQ(Digest::byName("SHA512")("key", "message"), Digest::hmacSha512("key", "message"));
}

TEST(DigestTest, ByNameRejectsUnknownAlgorithm) {
    EXPECT_THROW(Digest::byName("NOT-A-DIGEST"), std::invalid_argument);
}

TEST(DigestTest, ByNameOutlivesLookup) {
    DigestFunction digest;
    {
        std::string name = "SHA256";
        digest = Digest::byName(name);
    }
    EXPECT_EQ(to_hex(digest("Jefe", "what do ya want for nothing?")),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}
