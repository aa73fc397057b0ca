#include <gtest/gtest.h>
#include "../src/h/exceptions.h"
#include <limits>

TEST(ExceptionsTest, ParsesNumberInRange) {
    EXPECT_EQ(Exceptions::getValidNumber("0", 0, 10), 0u);
    EXPECT_EQ(Exceptions::getValidNumber("10", 0, 10), 10u);
    EXPECT_EQ(Exceptions::getValidNumber("18446744073709551615", 0, std::numeric_limits<unsigned long long>::max()),
              std::numeric_limits<unsigned long long>::max());
}

TEST(ExceptionsTest, RejectsOutOfRange) {
    EXPECT_THROW(Exceptions::getValidNumber("11", 0, 10), std::invalid_argument);
    EXPECT_THROW(Exceptions::getValidNumber("0", 1, 10), std::invalid_argument);
    EXPECT_THROW(Exceptions::getValidNumber("18446744073709551616", 0, 10), std::invalid_argument);
}

TEST(ExceptionsTest, RejectsJunk) {
    EXPECT_THROW(Exceptions::getValidNumber("", 0, 10), std::invalid_argument);
    EXPECT_THROW(Exceptions::getValidNumber("-1", 0, 10), std::invalid_argument);
    EXPECT_THROW(Exceptions::getValidNumber("1x", 0, 10), std::invalid_argument);
    EXPECT_THROW(Exceptions::getValidNumber(" 1", 0, 10), std::invalid_argument);
}

TEST(ExceptionsTest, MessageNamesTheValue) {
    try {
        Exceptions::getValidNumber("abc", 0, 10, "counter");
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("counter"), std::string::npos);
    }
}

TEST(ExceptionsTest, InvalidSecretCarriesMessage) {
    InvalidSecret error("Invalid secret: test");
    EXPECT_STREQ(error.what(), "Invalid secret: test");
}
