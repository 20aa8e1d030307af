#include <gtest/gtest.h>
#include "mqttd/core/utils.h"
#include "mqttd/server/protocols/http/basic_auth.h"

using namespace mqttd;
using namespace mqttd::server::protocols::http;

namespace {

std::string basic(const std::string& user, const std::string& password) {
    return "Basic " + core::base64Encode(user + ":" + password);
}

} // namespace

TEST(BasicAuthTest, EmptySnapshotLetsEverythingThrough) {
    BasicAuthenticator auth;
    EXPECT_FALSE(auth.enabled());
    EXPECT_TRUE(auth.check(""));
    EXPECT_TRUE(auth.check("Basic garbage"));
}

TEST(BasicAuthTest, ChecksUsernameAndPassword) {
    BasicAuthenticator auth(std::map<std::string, std::string>{{"admin", "s3cret"}, {"viewer", "look"}});
    EXPECT_TRUE(auth.enabled());

    EXPECT_TRUE(auth.check(basic("admin", "s3cret")));
    EXPECT_TRUE(auth.check(basic("viewer", "look")));
    EXPECT_FALSE(auth.check(basic("admin", "look")));
    EXPECT_FALSE(auth.check(basic("nobody", "s3cret")));
    EXPECT_FALSE(auth.check(""));
}

TEST(BasicAuthTest, PasswordsMayContainColons) {
    BasicAuthenticator auth(std::map<std::string, std::string>{{"admin", "a:b:c"}});
    EXPECT_TRUE(auth.check(basic("admin", "a:b:c")));
}

TEST(BasicAuthTest, SchemeIsCaseInsensitive) {
    BasicAuthenticator auth(std::map<std::string, std::string>{{"admin", "pw"}});
    EXPECT_TRUE(auth.check("basic " + core::base64Encode("admin:pw")));
    EXPECT_TRUE(auth.check("BASIC " + core::base64Encode("admin:pw")));
    EXPECT_FALSE(auth.check("Bearer " + core::base64Encode("admin:pw")));
}

TEST(BasicAuthTest, ParseHeaderRejectsMalformedValues) {
    std::string user;
    std::string password;
    EXPECT_FALSE(BasicAuthenticator::parseHeader("Basic", user, password));
    EXPECT_FALSE(BasicAuthenticator::parseHeader("Basic !!!notbase64", user, password));
    EXPECT_FALSE(BasicAuthenticator::parseHeader("Basic " + core::base64Encode("nocolon"), user, password));

    ASSERT_TRUE(BasicAuthenticator::parseHeader("Basic " + core::base64Encode("u:"), user, password));
    EXPECT_EQ(user, "u");
    EXPECT_EQ(password, "");
}

TEST(BasicAuthTest, ChallengeCarriesRealm) {
    BasicAuthenticator auth(std::map<std::string, std::string>{{"admin", "pw"}});
    auto response = auth.challenge();
    EXPECT_EQ(response.status, 401);
    EXPECT_EQ(response.body, "Unauthorized");
    EXPECT_EQ(response.headers.at("WWW-Authenticate"), "Basic realm=\"mqttd\", charset=\"UTF-8\"");
}

TEST(BasicAuthTest, ProtectOnlyRunsAuthorizedRequests) {
    BasicAuthenticator auth(std::map<std::string, std::string>{{"admin", "pw"}});
    int calls = 0;
    auto handler = auth.protect([&](const HttpRequest&) {
        calls++;
        HttpResponse response;
        response.body = "ok";
        return response;
    });

    HttpRequest anonymous;
    EXPECT_EQ(handler(anonymous).status, 401);
    EXPECT_EQ(calls, 0);

    HttpRequest authorized;
    authorized.headers["authorization"] = basic("admin", "pw");
    auto response = handler(authorized);
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body, "ok");
    EXPECT_EQ(calls, 1);
}
