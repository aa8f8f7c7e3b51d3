//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "http_client.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/version.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "error.hpp"

using namespace cmdchat;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;

asio::awaitable<result<http_result>> cmdchat::http_request(
    asio::any_io_executor ex,
    std::string_view host,
    std::string_view port,
    const http_request_params& params
)
{
    // Resolve the server's name
    asio::ip::tcp::resolver resolver(ex);
    auto [ec, endpoints] = co_await resolver.async_resolve(std::string(host), std::string(port), asio::as_tuple);
    if (ec)
        co_return ec;

    // Connect. The timeout applies to the entire exchange
    beast::tcp_stream stream(ex);
    stream.expires_after(params.timeout);
    auto [connect_ec, ep] = co_await stream.async_connect(endpoints, asio::as_tuple);
    if (connect_ec)
        co_return connect_ec;

    // Compose the request
    http::request<http::string_body> req(params.method, params.target, 11);
    req.set(http::field::host, std::string(host) + ':' + std::to_string(ep.port()));
    req.set(http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " cmdchat-client");
    if (!params.content_type.empty())
        req.set(http::field::content_type, params.content_type);
    req.body() = params.body;
    req.keep_alive(false);
    req.prepare_payload();

    // Write it
    std::tie(ec, std::ignore) = co_await http::async_write(stream, req, asio::as_tuple);
    if (ec)
        co_return ec;

    // Read the response
    beast::flat_buffer buff;
    http::response<http::string_body> res;
    std::tie(ec, std::ignore) = co_await http::async_read(stream, buff, res, asio::as_tuple);
    if (ec)
        co_return ec;

    // Done. Closing errors are not relevant
    stream.socket().shutdown(asio::ip::tcp::socket::shutdown_both, ec);

    co_return http_result{res.result_int(), std::move(res.body())};
}

result<std::vector<room_info>> cmdchat::parse_rooms_response(std::string_view body)
{
    error_code ec;
    auto jv = boost::json::parse(body, ec);
    if (ec)
        return ec;

    const auto* obj = jv.if_object();
    if (!obj)
        CMDCHAT_RETURN_ERROR(errc::websocket_parse_error)
    auto it = obj->find("rooms");
    if (it == obj->end() || !it->value().is_array())
        CMDCHAT_RETURN_ERROR(errc::websocket_parse_error)

    std::vector<room_info> res;
    for (const auto& elm : it->value().get_array())
    {
        const auto* room_obj = elm.if_object();
        if (!room_obj)
            CMDCHAT_RETURN_ERROR(errc::websocket_parse_error)
        const auto* id = room_obj->if_contains("id");
        const auto* name = room_obj->if_contains("name");
        if (!id || !id->is_string() || !name || !name->is_string())
            CMDCHAT_RETURN_ERROR(errc::websocket_parse_error)

        room_info info;
        info.id = id->get_string();
        info.name = name->get_string();
        if (const auto* desc = room_obj->if_contains("description"); desc && desc->is_string())
            info.description = desc->get_string();
        if (const auto* users = room_obj->if_contains("active_users"))
        {
            auto count = users->to_number<std::int64_t>(ec);
            if (!ec)
                info.active_users = count;
        }
        res.push_back(std::move(info));
    }
    return res;
}

asio::awaitable<result<std::vector<room_info>>> cmdchat::fetch_rooms(
    asio::any_io_executor ex,
    std::string_view host,
    std::string_view port,
    std::chrono::steady_clock::duration timeout
)
{
    http_request_params params;
    params.target = "/rooms";
    params.timeout = timeout;
    auto res = co_await http_request(std::move(ex), host, port, params);
    if (res.has_error())
        co_return res.error();
    if (res->status != 200u)
        CMDCHAT_CO_RETURN_ERROR(errc::websocket_parse_error)
    co_return parse_rooms_response(res->body);
}
