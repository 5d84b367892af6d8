#include "Router.hpp"

#include <spdlog/spdlog.h>

#include <boost/json.hpp>
#include <boost/url/parse.hpp>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include "RequestValidator.hpp"

namespace warden::network {

namespace {

const std::string HELLO_BODY = "Hello, World!\n";

std::tm get_safe_gmtime(std::time_t timer) {
    std::tm tm_snapshot{};
    gmtime_r(&timer, &tm_snapshot);
    return tm_snapshot;
}

std::string iso_timestamp() {
    std::tm timeinfo = get_safe_gmtime(std::time(nullptr));
    std::ostringstream ss;
    ss << std::put_time(&timeinfo, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

bool is_read_method(const req_t& req) {
    return req.method() == http::verb::get || req.method() == http::verb::head;
}

}  // namespace

Router::Router() : started_at_(std::chrono::steady_clock::now()) {}

res_t Router::RouteRequest(const req_t& req) {
    res_t res;
    res.version(req.version());
    res.keep_alive(req.keep_alive());

    auto target = boost::urls::parse_origin_form(req.target());
    if (!target) {
        spdlog::debug("[Router] Unparsable target '{}': {}", std::string(req.target()),
                      target.error().message());
        ResponseBuilder::build_error_response(res, http::status::bad_request, req.version(),
                                              req.keep_alive());
        return res;
    }

    std::string path = target->path();
    if (path.empty()) {
        path = "/";
    }

    if (path == "/" || path == "/hello") {
        if (is_read_method(req)) {
            handle_hello(req, res);
        } else {
            handle_method_not_allowed(req, res);
        }
    } else if (path == "/health") {
        if (is_read_method(req)) {
            handle_health(req, res);
        } else {
            handle_method_not_allowed(req, res);
        }
    } else {
        spdlog::debug("[Router] No route for {}", path);
        ResponseBuilder::build_error_response(res, http::status::not_found, req.version(),
                                              req.keep_alive());
    }
    return res;
}

void Router::handle_hello(const req_t& req, res_t& res) {
    ResponseBuilder::build_text_response(res, http::status::ok, HELLO_BODY, req.version(),
                                         req.keep_alive());
}

void Router::handle_health(const req_t& req, res_t& res) {
    const auto uptime = std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                                      started_at_);
    boost::json::object body;
    body["status"] = "healthy";
    body["timestamp"] = iso_timestamp().c_str();
    body["uptime"] = uptime.count();

    ResponseBuilder::make_json_response(res, http::status::ok, body, req.version(),
                                        req.keep_alive());
}

void Router::handle_method_not_allowed(const req_t& req, res_t& res) {
    spdlog::debug("[Router] {} not supported on {}", std::string(req.method_string()),
                  std::string(req.target()));
    ResponseBuilder::build_method_not_allowed(res, core::AllowHeaderValue(), req.version(),
                                              req.keep_alive());
}

}  // namespace warden::network
