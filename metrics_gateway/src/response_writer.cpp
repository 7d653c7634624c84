#include "response_writer.hpp"

namespace {

void send_status(httplib::Response& res, int status) {
    res.status = status;
    res.set_content("", "text/plain");
}

}

void disable_cache_and_enable_cors(httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET,POST,OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
    res.set_header("Cache-Control", "no-store, no-cache, must-revalidate, private");
}

void send_json(httplib::Response& res, const std::string& body) {
    send_text(res, body, "application/json");
}

void send_text(httplib::Response& res, const std::string& body, const std::string& content_type) {
    res.status = 200;
    disable_cache_and_enable_cors(res);
    res.set_content(body, content_type);
}

void send_403(httplib::Response& res) {
    send_status(res, 403);
}

void send_404(httplib::Response& res) {
    send_status(res, 404);
}

void send_500(httplib::Response& res) {
    send_status(res, 500);
}
