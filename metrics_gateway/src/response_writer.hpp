#pragma once
#include <httplib.h>
#include <string>

void disable_cache_and_enable_cors(httplib::Response& res);

void send_json(httplib::Response& res, const std::string& body);
void send_text(httplib::Response& res, const std::string& body, const std::string& content_type);

void send_403(httplib::Response& res);
void send_404(httplib::Response& res);
void send_500(httplib::Response& res);
