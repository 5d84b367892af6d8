#pragma once

#include "boost/beast/http/message.hpp" // Use full header
#include "boost/beast/http/status.hpp"
#include "boost/beast/version.hpp"
#include "boost/json.hpp"
#include <boost/beast.hpp>
#include <array>
#include <string>
#include <utility>

namespace warden::models {
namespace json = boost::json;
namespace http = boost::beast::http;

// Define this alias for readability
using res_t = http::response<http::string_body>;

// Attached to every response, whatever its outcome.
inline constexpr std::array<std::pair<const char *, const char *>, 6>
    SECURITY_HEADERS = {{
        {"X-Content-Type-Options", "nosniff"},
        {"X-Frame-Options", "DENY"},
        {"X-XSS-Protection", "1; mode=block"},
        {"Strict-Transport-Security", "max-age=31536000; includeSubDomains"},
        {"Content-Security-Policy", "default-src 'none'"},
        {"Referrer-Policy", "no-referrer"},
    }};

class ResponseBuilder {
public:

  static void apply_standard_headers(res_t &res) {
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    for (const auto &[name, value] : SECURITY_HEADERS) {
      res.set(name, value);
    }
  }


  static void build_text_response(res_t &res,
                                  http::status status,
                                  std::string body,
                                  unsigned int version,
                                  bool keep_alive) {
    res.version(version);
    res.keep_alive(keep_alive);
    res.result(status);

    apply_standard_headers(res);
    res.set(http::field::content_type, "text/plain");

    res.body() = std::move(body);
    res.prepare_payload();
  }


  static void make_json_response(res_t &res,
                                 http::status status,
                                 const json::value &val,
                                 unsigned int version,
                                 bool keep_alive) {
    res.result(status);
    res.version(version);
    res.keep_alive(keep_alive);

    apply_standard_headers(res);
    res.set(http::field::content_type, "application/json");

    res.body() = json::serialize(val) + "\n";
    res.prepare_payload();
  }


  // 405 with the Allow header listing every admitted method.
  static void build_method_not_allowed(res_t &res,
                                       const std::string &allow,
                                       unsigned int version,
                                       bool keep_alive) {
    build_text_response(res, http::status::method_not_allowed,
                        "Method Not Allowed\n", version, keep_alive);
    res.set(http::field::allow, allow);
  }


  static void build_error_response(res_t &res,
                                   http::status status,
                                   unsigned int version,
                                   bool keep_alive = false) {
    std::string body;
    switch (status) {
    case http::status::bad_request:
      body = "Bad Request\n";
      break;
    case http::status::not_found:
      body = "Not Found\n";
      break;
    case http::status::request_timeout:
      body = "Request Timeout\n";
      break;
    default:
      body = "Internal Server Error\n";
      status = http::status::internal_server_error;
      break;
    }
    build_text_response(res, status, std::move(body), version, keep_alive);
  }
};

} // namespace warden::models
