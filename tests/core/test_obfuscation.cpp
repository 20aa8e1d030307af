#include <gtest/gtest.h>
#include "mqttd/core/errors.h"
#include "mqttd/core/obfuscation.h"
#include <string>
#include <vector>

using namespace mqttd::core;

TEST(ObfuscationTest, DecodeReversesEncode) {
    std::vector<std::string> samples = {"a", "no2typeB", "pass word with spaces", "ünïcødé", std::string(64, 'x')};
    for (const auto& plain : samples) {
        auto encoded = encodeObfuscated(plain);
        EXPECT_NE(encoded, plain);
        EXPECT_EQ(decodeObfuscated(encoded), plain);
    }
}

TEST(ObfuscationTest, InvalidInput) {
    EXPECT_THROW(decodeObfuscated(""), ConfigError);
    EXPECT_THROW(decodeObfuscated("not base64!"), ConfigError);
    EXPECT_THROW(decodeObfuscated("abc"), ConfigError);
}

TEST(ObfuscationTest, TryDecodeFallsBackToInput) {
    EXPECT_EQ(tryDecodeObfuscated("plain text!"), "plain text!");
    EXPECT_EQ(tryDecodeObfuscated(""), "");
    EXPECT_EQ(tryDecodeObfuscated(encodeObfuscated("hidden")), "hidden");
}
