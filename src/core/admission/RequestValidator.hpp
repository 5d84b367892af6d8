#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <boost/beast/http/status.hpp>

namespace warden::core {

namespace http = boost::beast::http;

struct Admit {};

struct Rejection {
    http::status status = http::status::bad_request;
    std::string reason;  // short machine-facing cause, for logs
    std::string body;    // text/plain response body

    // Only set for 405: the value of the Allow header.
    std::optional<std::string> allow;
};

/**
 * @brief Outcome of request admission: either Admit or a Rejection, never both.
 */
class ValidationVerdict {
   public:
    static ValidationVerdict admit() { return ValidationVerdict{Admit{}}; }
    static ValidationVerdict reject(Rejection rejection) {
        return ValidationVerdict{std::move(rejection)};
    }

    bool admitted() const noexcept { return std::holds_alternative<Admit>(value_); }

    // Precondition: !admitted()
    const Rejection& rejection() const { return std::get<Rejection>(value_); }

   private:
    explicit ValidationVerdict(std::variant<Admit, Rejection> value) : value_(std::move(value)) {}

    std::variant<Admit, Rejection> value_;
};

using HeaderList = std::vector<std::pair<std::string, std::string>>;

inline constexpr std::size_t MAX_URL_LENGTH = 2048;
inline constexpr std::size_t MAX_HEADER_SIZE = 8192;

inline constexpr std::array<std::string_view, 7> ALLOWED_METHODS = {
    "GET", "POST", "PUT", "DELETE", "PATCH", "HEAD", "OPTIONS"};

/**
 * @brief Case-insensitive substrings that mark a URL as a traversal attempt.
 *
 * Matching is on the raw target, not on a normalised path. This rejects some
 * benign encoded content and misses encodings that are not listed.
 */
inline constexpr std::array<std::string_view, 16> PATH_TRAVERSAL_SIGNATURES = {
    "../",       "..\\",           "%2e%2e%2f",         "%2e%2e%5c",
    "%252e%252e%252f", "%252e%252e%255c", "..%2f",      "..%5c",
    "%2e%2e/",   "%2e%2e\\",       "....//",            "....\\\\",
    "..;/",      "..;\\",          "%u002e%u002e%u002f", "%u002e%u002e%u005c"};

inline constexpr std::array<std::string_view, 4> HEADER_INJECTION_SIGNATURES = {
    "<script", "javascript:", "vbscript:", "onload="};

// "GET, POST, PUT, DELETE, PATCH, HEAD, OPTIONS"
const std::string& AllowHeaderValue();

bool IsAllowedMethod(std::string_view method) noexcept;

/**
 * @brief Serialises headers the way the size and injection checks see them:
 * a JSON object of lower-cased names, duplicate names joined by ", ".
 */
std::string SerializeHeaders(const HeaderList& headers);

/**
 * @brief Decides whether a request may be dispatched to the router.
 *
 * Checks run method -> URL -> headers; the first failure wins. Pure: no I/O,
 * no logging, no shared state.
 */
ValidationVerdict Validate(std::string_view method, std::string_view raw_url,
                           const HeaderList& headers);

}  // namespace warden::core
