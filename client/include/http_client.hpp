//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_CLIENT_INCLUDE_HTTP_CLIENT_HPP
#define CMDCHAT_CLIENT_INCLUDE_HTTP_CLIENT_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/beast/http/verb.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"

// Minimal HTTP client to access the server's REST endpoints.
// Each request uses its own connection.

namespace cmdchat {

struct http_request_params
{
    boost::beast::http::verb method{boost::beast::http::verb::get};
    std::string_view target;               // e.g. "/rooms"
    std::string_view body;                 // empty for GET requests
    std::string_view content_type;         // omitted if empty
    std::chrono::steady_clock::duration timeout{std::chrono::seconds(10)};  // whole request
};

struct http_result
{
    unsigned status{};
    std::string body;
};

// Issues a request and reads the entire response. Only transport errors
// are reported as errors: any HTTP status is a valid response.
boost::asio::awaitable<result<http_result>> http_request(
    boost::asio::any_io_executor ex,
    std::string_view host,
    std::string_view port,
    const http_request_params& params
);

// A room, as listed by GET /rooms
struct room_info
{
    std::string id;
    std::string name;
    std::string description;
    std::int64_t active_users{};
};

// Parses the body of a GET /rooms response
result<std::vector<room_info>> parse_rooms_response(std::string_view body);

// Retrieves the list of active rooms
boost::asio::awaitable<result<std::vector<room_info>>> fetch_rooms(
    boost::asio::any_io_executor ex,
    std::string_view host,
    std::string_view port,
    std::chrono::steady_clock::duration timeout
);

}  // namespace cmdchat

#endif
