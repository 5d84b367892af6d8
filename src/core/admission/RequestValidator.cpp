#include "RequestValidator.hpp"

#include <boost/json.hpp>

#include <algorithm>
#include <cctype>

namespace warden::core {

namespace {

std::string to_lower(std::string_view in) {
    std::string out(in);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

template <std::size_t N>
bool contains_any(std::string_view haystack, const std::array<std::string_view, N>& needles) {
    return std::any_of(needles.begin(), needles.end(), [haystack](std::string_view needle) {
        return haystack.find(needle) != std::string_view::npos;
    });
}

Rejection method_not_allowed() {
    return Rejection{http::status::method_not_allowed, "method not allowed",
                     "Method Not Allowed\n", AllowHeaderValue()};
}

Rejection invalid_url(std::string reason) {
    return Rejection{http::status::bad_request, std::move(reason), "Bad Request: Invalid URL\n",
                     std::nullopt};
}

Rejection invalid_headers(std::string reason) {
    return Rejection{http::status::bad_request, std::move(reason),
                     "Bad Request: Invalid Headers\n", std::nullopt};
}

}  // namespace

const std::string& AllowHeaderValue() {
    static const std::string value = [] {
        std::string joined;
        for (auto method : ALLOWED_METHODS) {
            if (!joined.empty()) {
                joined += ", ";
            }
            joined += method;
        }
        return joined;
    }();
    return value;
}

bool IsAllowedMethod(std::string_view method) noexcept {
    return std::find(ALLOWED_METHODS.begin(), ALLOWED_METHODS.end(), method) !=
           ALLOWED_METHODS.end();
}

std::string SerializeHeaders(const HeaderList& headers) {
    boost::json::object object;
    for (const auto& [name, value] : headers) {
        auto key = to_lower(name);
        if (auto* existing = object.if_contains(key)) {
            existing->as_string().append(", ").append(value);
        } else {
            object[key] = value.c_str();
        }
    }
    return boost::json::serialize(object);
}

ValidationVerdict Validate(std::string_view method, std::string_view raw_url,
                           const HeaderList& headers) {
    // 1. Method whitelist (case-sensitive, as sent on the wire)
    if (!IsAllowedMethod(method)) {
        return ValidationVerdict::reject(method_not_allowed());
    }

    // 2. URL bounds and traversal signatures
    if (raw_url.empty()) {
        return ValidationVerdict::reject(invalid_url("empty url"));
    }
    if (raw_url.size() > MAX_URL_LENGTH) {
        return ValidationVerdict::reject(invalid_url("url too long"));
    }
    if (contains_any(to_lower(raw_url), PATH_TRAVERSAL_SIGNATURES)) {
        return ValidationVerdict::reject(invalid_url("path traversal signature"));
    }

    // 3. Header size and injection signatures
    const auto serialized = SerializeHeaders(headers);
    if (serialized.size() > MAX_HEADER_SIZE) {
        return ValidationVerdict::reject(invalid_headers("headers too large"));
    }
    if (contains_any(to_lower(serialized), HEADER_INJECTION_SIGNATURES)) {
        return ValidationVerdict::reject(invalid_headers("header injection signature"));
    }

    return ValidationVerdict::admit();
}

}  // namespace warden::core
