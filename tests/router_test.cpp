#include <gtest/gtest.h>

#include <boost/json.hpp>
#include <string>

#include "Router.hpp"
#include "Types.hpp"

using warden::network::Router;

namespace {

req_t MakeRequest(http::verb method, std::string target) {
    req_t req{method, target, 11};
    req.set(http::field::host, "localhost");
    req.prepare_payload();
    return req;
}

}  // namespace

TEST(Router, HelloOnRootAndHello) {
    Router router;
    for (const char* target : {"/", "/hello", "/hello?name=x"}) {
        auto res = router.RouteRequest(MakeRequest(http::verb::get, target));
        EXPECT_EQ(res.result(), http::status::ok) << target;
        EXPECT_EQ(res.body(), "Hello, World!\n");
        EXPECT_EQ(res[http::field::content_type], "text/plain");
    }
}

TEST(Router, HeadIsServedLikeGet) {
    Router router;
    auto res = router.RouteRequest(MakeRequest(http::verb::head, "/hello"));
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_length], "14");
}

TEST(Router, HealthReportsStatusAndUptime) {
    Router router;
    auto res = router.RouteRequest(MakeRequest(http::verb::get, "/health"));
    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "application/json");

    const auto parsed = boost::json::parse(res.body());
    const auto& doc = parsed.as_object();
    EXPECT_EQ(doc.at("status").as_string(), "healthy");
    EXPECT_TRUE(doc.at("timestamp").is_string());
    EXPECT_GE(doc.at("uptime").as_double(), 0.0);
}

TEST(Router, OtherMethodsOnKnownPathsAre405WithAllow) {
    Router router;
    for (auto method : {http::verb::post, http::verb::put, http::verb::delete_, http::verb::patch,
                        http::verb::options}) {
        for (const char* target : {"/hello", "/", "/health"}) {
            auto res = router.RouteRequest(MakeRequest(method, target));
            EXPECT_EQ(res.result(), http::status::method_not_allowed) << target;
            EXPECT_EQ(res.body(), "Method Not Allowed\n");
            EXPECT_EQ(res[http::field::allow], "GET, POST, PUT, DELETE, PATCH, HEAD, OPTIONS");
        }
    }
}

TEST(Router, UnknownPathIs404) {
    Router router;
    for (auto method : {http::verb::get, http::verb::post}) {
        auto res = router.RouteRequest(MakeRequest(method, "/missing"));
        EXPECT_EQ(res.result(), http::status::not_found);
        EXPECT_EQ(res.body(), "Not Found\n");
    }
}

TEST(Router, NonOriginFormTargetIs400) {
    Router router;
    auto res = router.RouteRequest(MakeRequest(http::verb::get, "http://localhost/hello"));
    EXPECT_EQ(res.result(), http::status::bad_request);
}

TEST(Router, SecurityHeadersOnEveryResponse) {
    Router router;
    for (const char* target : {"/hello", "/missing", "/health"}) {
        auto res = router.RouteRequest(MakeRequest(http::verb::get, target));
        EXPECT_EQ(res["X-Frame-Options"], "DENY") << target;
        EXPECT_EQ(res["X-Content-Type-Options"], "nosniff");
        EXPECT_EQ(res["Referrer-Policy"], "no-referrer");
        EXPECT_FALSE(res[http::field::server].empty());
    }
}

TEST(Router, KeepAliveMirrorsRequest) {
    Router router;
    auto req = MakeRequest(http::verb::get, "/hello");
    req.keep_alive(false);
    EXPECT_FALSE(router.RouteRequest(req).keep_alive());

    req.keep_alive(true);
    EXPECT_TRUE(router.RouteRequest(req).keep_alive());
}

using warden::models::ResponseBuilder;

TEST(ResponseBuilder, ErrorBodiesByStatus) {
    res_t res;
    ResponseBuilder::build_error_response(res, http::status::request_timeout, 11, false);
    EXPECT_EQ(res.result(), http::status::request_timeout);
    EXPECT_EQ(res.body(), "Request Timeout\n");
    EXPECT_FALSE(res.keep_alive());

    ResponseBuilder::build_error_response(res, http::status::bad_request, 11, false);
    EXPECT_EQ(res.body(), "Bad Request\n");
}

TEST(ResponseBuilder, UnmappedErrorStatusBecomes500) {
    res_t res;
    ResponseBuilder::build_error_response(res, http::status::bad_gateway, 11, true);
    EXPECT_EQ(res.result(), http::status::internal_server_error);
    EXPECT_EQ(res.body(), "Internal Server Error\n");
    EXPECT_EQ(res[http::field::content_length], "22");
}

TEST(ResponseBuilder, MethodNotAllowedCarriesAllow) {
    res_t res;
    ResponseBuilder::build_method_not_allowed(res, "GET, HEAD", 11, true);
    EXPECT_EQ(res.result(), http::status::method_not_allowed);
    EXPECT_EQ(res[http::field::allow], "GET, HEAD");
    EXPECT_EQ(res[http::field::content_type], "text/plain");
}
