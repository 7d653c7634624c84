#include "access_guard.hpp"

#include <gtest/gtest.h>

namespace {

httplib::Request make_request(std::initializer_list<std::pair<std::string, std::string>> headers) {
    httplib::Request req;
    req.method = "GET";
    req.path = "/health";
    for (const auto& [name, value] : headers) {
        req.set_header(name, value);
    }
    return req;
}

const std::optional<std::string> kToken = std::string("1234");

}

TEST(AccessGuardTest, AllowsEverythingWithoutConfiguredToken) {
    EXPECT_TRUE(check_access(make_request({}), std::nullopt));
    EXPECT_TRUE(check_access(make_request({{"X-Access-Token", "whatever"}}), std::nullopt));
}

TEST(AccessGuardTest, EmptyConfiguredTokenDisablesTheCheck) {
    EXPECT_TRUE(check_access(make_request({}), std::string()));
}

TEST(AccessGuardTest, DeniesRequestWithoutCredentials) {
    EXPECT_FALSE(check_access(make_request({}), kToken));
}

TEST(AccessGuardTest, AcceptsMatchingAccessTokenHeader) {
    EXPECT_TRUE(check_access(make_request({{"X-Access-Token", "1234"}}), kToken));
    EXPECT_FALSE(check_access(make_request({{"X-Access-Token", "12345"}}), kToken));
}

TEST(AccessGuardTest, AcceptsBearerAuthorizationInAnyCase) {
    EXPECT_TRUE(check_access(make_request({{"Authorization", "Bearer 1234"}}), kToken));
    EXPECT_TRUE(check_access(make_request({{"Authorization", "bearer 1234"}}), kToken));
    EXPECT_TRUE(check_access(make_request({{"Authorization", "BEARER 1234"}}), kToken));
}

TEST(AccessGuardTest, TrimsBearerToken) {
    EXPECT_TRUE(check_access(make_request({{"Authorization", "Bearer    1234  "}}), kToken));
}

TEST(AccessGuardTest, RejectsOtherAuthorizationSchemes) {
    EXPECT_FALSE(check_access(make_request({{"Authorization", "Basic 1234"}}), kToken));
    EXPECT_FALSE(check_access(make_request({{"Authorization", "1234"}}), kToken));
    EXPECT_FALSE(check_access(make_request({{"Authorization", "Bearer"}}), kToken));
    EXPECT_FALSE(check_access(make_request({{"Authorization", "Bearer 4321"}}), kToken));
}

TEST(AccessGuardTest, EmptyAccessTokenHeaderFallsBackToAuthorization) {
    EXPECT_TRUE(check_access(make_request({{"X-Access-Token", ""}, {"Authorization", "Bearer 1234"}}), kToken));
}

TEST(AccessGuardTest, AccessTokenHeaderTakesPrecedence) {
    EXPECT_FALSE(check_access(make_request({{"X-Access-Token", "wrong"}, {"Authorization", "Bearer 1234"}}),
                              kToken));
}

TEST(AccessGuardTest, ExtractsTokenFromHeaders) {
    EXPECT_EQ(extract_access_token(make_request({{"X-Access-Token", "abc"}})), "abc");
    EXPECT_EQ(extract_access_token(make_request({{"Authorization", "Bearer xyz"}})), "xyz");
    EXPECT_EQ(extract_access_token(make_request({})), std::nullopt);
}
