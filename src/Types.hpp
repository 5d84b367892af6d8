#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

using req_t = http::request<http::string_body>;
using res_t = http::response<http::string_body>;
