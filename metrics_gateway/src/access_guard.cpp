#include "access_guard.hpp"
#include "util.hpp"

namespace {

constexpr const char* kBearerPrefix = "bearer ";
constexpr size_t kBearerPrefixLength = 7;

}

std::optional<std::string> extract_access_token(const httplib::Request& req) {
    std::string token = req.get_header_value("X-Access-Token");
    if (!token.empty()) {
        return token;
    }

    std::string authorization = req.get_header_value("Authorization");
    if (authorization.size() < kBearerPrefixLength ||
        util::to_lower(authorization.substr(0, kBearerPrefixLength)) != kBearerPrefix) {
        return std::nullopt;
    }
    return util::trim(authorization.substr(kBearerPrefixLength));
}

bool check_access(const httplib::Request& req, const std::optional<std::string>& access_token) {
    // If no access token was set, allow access
    if (!access_token || access_token->empty()) {
        return true;
    }

    auto token = extract_access_token(req);
    return token && *token == *access_token;
}
