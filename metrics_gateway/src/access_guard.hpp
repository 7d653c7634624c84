#pragma once
#include <httplib.h>
#include <optional>
#include <string>

// Returns true when no token is configured, or when the X-Access-Token header
// (or, failing that, an "Authorization: Bearer <token>" header) carries it.
bool check_access(const httplib::Request& req, const std::optional<std::string>& access_token);

std::optional<std::string> extract_access_token(const httplib::Request& req);
