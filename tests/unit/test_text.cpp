#include <gtest/gtest.h>
#include "../../src/utils/text/string_utils.hpp"

using namespace Glimpse::Utils::Text;

TEST(TextTest, Trim) {
    EXPECT_EQ(trim("  https://example.com \n"), "https://example.com");
    EXPECT_EQ(trim("\t\r\n "), "");
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trim("a b"), "a b");
}

TEST(TextTest, Prefix) {
    EXPECT_TRUE(starts_with("ws://127.0.0.1:9222/devtools", "ws://"));
    EXPECT_FALSE(starts_with("wss://host", "ws://"));
    EXPECT_FALSE(starts_with("ws", "ws://"));
}

TEST(TextTest, Base64KnownVectors) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("foobar"), "Zm9vYmFy");

    EXPECT_EQ(base64_decode("Zm9vYmFy"), "foobar");
    EXPECT_EQ(base64_decode("Zg=="), "f");
}

TEST(TextTest, Base64BinaryPng) {
    std::string png = {(char)0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n', 0x00, (char)0xFF};

    std::string encoded = base64_encode(png);
    EXPECT_EQ(encoded, "iVBORw0KGgoA/w==");
    EXPECT_EQ(base64_decode(encoded), png);
}
