#include <gtest/gtest.h>
#include "mqttd/core/errors.h"
#include "mqttd/core/utils.h"

using namespace mqttd::core;

TEST(UtilsTest, Base64) {
    EXPECT_EQ(base64Encode(""), "");
    EXPECT_EQ(base64Encode("f"), "Zg==");
    EXPECT_EQ(base64Encode("fo"), "Zm8=");
    EXPECT_EQ(base64Encode("foo"), "Zm9v");
    EXPECT_EQ(base64Encode("user:pass"), "dXNlcjpwYXNz");

    std::string decoded;
    EXPECT_TRUE(base64Decode("Zg==", decoded));
    EXPECT_EQ(decoded, "f");
    EXPECT_TRUE(base64Decode("dXNlcjpwYXNz", decoded));
    EXPECT_EQ(decoded, "user:pass");

    EXPECT_FALSE(base64Decode("Zg=", decoded));
    EXPECT_FALSE(base64Decode("Z=g=", decoded));
    EXPECT_FALSE(base64Decode("Zm9v!!!!", decoded));
}

TEST(UtilsTest, ConstantTimeEquals) {
    EXPECT_TRUE(constantTimeEquals("secret", "secret"));
    EXPECT_FALSE(constantTimeEquals("secret", "secreT"));
    EXPECT_FALSE(constantTimeEquals("secret", "secret2"));
    EXPECT_TRUE(constantTimeEquals("", ""));
}

TEST(UtilsTest, HtmlEscape) {
    EXPECT_EQ(htmlEscape("<b>\"x\" & 'y'</b>"), "&lt;b&gt;&#34;x&#34; &amp; &#39;y&#39;&lt;/b&gt;");
    EXPECT_EQ(htmlEscape("plain"), "plain");
}

TEST(UtilsTest, FormatDuration) {
    EXPECT_EQ(formatDuration(0), "0s");
    EXPECT_EQ(formatDuration(59), "59s");
    EXPECT_EQ(formatDuration(61), "1m 1s");
    EXPECT_EQ(formatDuration(3600), "1h 0m 0s");
    EXPECT_EQ(formatDuration(2 * 86400 + 3 * 3600 + 4 * 60 + 5), "2d 3h 4m 5s");
}

TEST(UtilsTest, StringHelpers) {
    EXPECT_EQ(string_utils::trim("  a b \t\n"), "a b");
    EXPECT_EQ(string_utils::toLower("AbC"), "abc");
    EXPECT_EQ(string_utils::join({"a", "b", "c"}, "; "), "a; b; c");
    EXPECT_EQ(string_utils::join({}, ","), "");
    EXPECT_TRUE(string_utils::isDigits("1883"));
    EXPECT_FALSE(string_utils::isDigits(""));
    EXPECT_FALSE(string_utils::isDigits("18a3"));
}

TEST(ErrorsTest, CodesAndCategories) {
    ParseError parse("bad yaml");
    EXPECT_EQ(parse.getErrorCode(), "PARSE_ERROR");
    EXPECT_EQ(parse.getCategory(), ErrorCategory::PARSE);

    BindError bind("port taken");
    EXPECT_EQ(bind.getErrorCode(), "BIND_ERROR");
    EXPECT_EQ(std::string(toString(bind.getCategory())), "network");

    try {
        throw ConfigError("bad filter");
    } catch (const MqttdException& e) {
        EXPECT_NE(std::string(e.what()).find("bad filter"), std::string::npos);
    }
}
