//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "request_context.hpp"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/test/unit_test.hpp>
#include <boost/url/parse.hpp>

#include <optional>
#include <string>
#include <string_view>

#include "error.hpp"

using namespace cmdchat;
namespace http = boost::beast::http;

BOOST_AUTO_TEST_SUITE(request_context_)

static request_context make_context(
    std::string_view target,
    std::string_view content_type = "",
    std::string body = ""
)
{
    http::request<http::string_body> req{http::verb::post, target, 11};
    if (!content_type.empty())
        req.set(http::field::content_type, content_type);
    req.body() = std::move(body);
    req.prepare_payload();
    return request_context(std::move(req), "127.0.0.1");
}

BOOST_AUTO_TEST_CASE(param_from_query)
{
    auto ctx = make_context("/get_key?password=abc&username=alice+smith&pubkey=%2Fkey");
    BOOST_TEST_REQUIRE(ctx.parse_request_target() == error_code());
    BOOST_TEST((ctx.get_param("password") == std::optional<std::string>("abc")));
    BOOST_TEST((ctx.get_param("username") == std::optional<std::string>("alice smith")));
    BOOST_TEST((ctx.get_param("pubkey") == std::optional<std::string>("/key")));
    BOOST_TEST(!ctx.get_param("other").has_value());
}

BOOST_AUTO_TEST_CASE(param_from_json_body)
{
    auto ctx = make_context("/get_key", "application/json", R"({"password": "abc", "number": 10})");
    BOOST_TEST_REQUIRE(ctx.parse_request_target() == error_code());
    BOOST_TEST((ctx.get_param("password") == std::optional<std::string>("abc")));

    // Non-string members are ignored
    BOOST_TEST(!ctx.get_param("number").has_value());
}

BOOST_AUTO_TEST_CASE(param_from_form_body)
{
    auto ctx = make_context(
        "/get_key",
        "application/x-www-form-urlencoded; charset=utf-8",
        "password=abc&pubkey=a+b%2Bc"
    );
    BOOST_TEST_REQUIRE(ctx.parse_request_target() == error_code());
    BOOST_TEST((ctx.get_param("password") == std::optional<std::string>("abc")));
    BOOST_TEST((ctx.get_param("pubkey") == std::optional<std::string>("a b+c")));
}

BOOST_AUTO_TEST_CASE(param_priority)
{
    // JSON body wins over the query string
    auto ctx = make_context("/get_key?password=query&username=bob", "application/json", R"({"password": "body"})");
    BOOST_TEST_REQUIRE(ctx.parse_request_target() == error_code());
    BOOST_TEST((ctx.get_param("password") == std::optional<std::string>("body")));

    // Parameters not in the body fall back to the query string
    BOOST_TEST((ctx.get_param("username") == std::optional<std::string>("bob")));
}

BOOST_AUTO_TEST_CASE(param_form_wins_over_query)
{
    auto ctx = make_context("/get_key?password=query", "application/x-www-form-urlencoded", "password=form");
    BOOST_TEST_REQUIRE(ctx.parse_request_target() == error_code());
    BOOST_TEST((ctx.get_param("password") == std::optional<std::string>("form")));
}

BOOST_AUTO_TEST_CASE(param_empty_values_skipped)
{
    // First non-empty value wins
    auto ctx = make_context("/get_key?password=query", "application/json", R"({"password": ""})");
    BOOST_TEST_REQUIRE(ctx.parse_request_target() == error_code());
    BOOST_TEST((ctx.get_param("password") == std::optional<std::string>("query")));
}

BOOST_AUTO_TEST_CASE(param_body_ignored_for_other_content_types)
{
    auto ctx = make_context("/get_key", "text/plain", "password=abc");
    BOOST_TEST_REQUIRE(ctx.parse_request_target() == error_code());
    BOOST_TEST(!ctx.get_param("password").has_value());
}

BOOST_AUTO_TEST_CASE(param_invalid_json_body)
{
    auto ctx = make_context("/get_key?password=query", "application/json", "{bad");
    BOOST_TEST_REQUIRE(ctx.parse_request_target() == error_code());
    BOOST_TEST((ctx.get_param("password") == std::optional<std::string>("query")));
}

BOOST_AUTO_TEST_CASE(has_content_type)
{
    auto ctx = make_context("/rooms", "Application/JSON; charset=utf-8");
    BOOST_TEST(ctx.has_content_type("application/json"));
    BOOST_TEST(!ctx.has_content_type("text/plain"));
    BOOST_TEST(!make_context("/rooms").has_content_type("application/json"));
}

BOOST_AUTO_TEST_CASE(find_query_param_)
{
    auto url = boost::urls::parse_origin_form("/talk?room_id=general&username=&password=p%40ss").value();
    BOOST_TEST((find_query_param(url, "room_id") == std::optional<std::string>("general")));
    BOOST_TEST((find_query_param(url, "password") == std::optional<std::string>("p@ss")));
    BOOST_TEST(!find_query_param(url, "username").has_value());
    BOOST_TEST(!find_query_param(url, "missing").has_value());
}

BOOST_AUTO_TEST_SUITE_END()
