//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "request_context.hpp"

#include <boost/beast/core/string.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/vector_body.hpp>
#include <boost/core/span.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <boost/url/encoding_opts.hpp>
#include <boost/url/params_encoded_view.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/parse_query.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"

using namespace cmdchat;
namespace http = boost::beast::http;
namespace beast = boost::beast;

// Intentionally don't provide exact version
static constexpr std::string_view server_header = "beast";

namespace {

// A {"error": "..."} body
struct api_error
{
    std::string_view error;

    std::string to_json() const { return boost::json::serialize(boost::json::object({{"error", error}})); }
};

}  // namespace

response_builder::response_builder(unsigned version, bool keep_alive) : keep_alive_(keep_alive)
{
    header_.version(version);
    header_.set(http::field::server, server_header);

    // The API may be called from browsers served by other origins
    header_.set(http::field::access_control_allow_origin, "*");
    header_.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    header_.set(http::field::access_control_allow_headers, "Content-Type");
}

response_builder::response_type response_builder::empty_response()
{
    header_.result(http::status::no_content);
    auto res = build_response<http::empty_body>();
    res.prepare_payload();
    return res;
}

response_builder::response_type response_builder::binary_response(boost::span<const unsigned char> body)
{
    set_content_type("application/octet-stream");
    auto res = build_response<http::vector_body<unsigned char>>(
        std::vector<unsigned char>(body.begin(), body.end())
    );
    res.prepare_payload();
    return res;
}

response_builder::response_type response_builder::json_response_impl(
    http::status status,
    std::string serialized_json
)
{
    header_.result(status);
    set_content_type("application/json");
    auto res = build_response<http::string_body>(std::move(serialized_json));
    res.prepare_payload();
    return res;
}

response_builder::response_type response_builder::plaintext_response(http::status status, std::string content)
{
    header_.result(status);
    set_content_type("text/plain");
    auto res = build_response<http::string_body>(std::move(content));
    res.prepare_payload();
    return res;
}

response_builder::response_type response_builder::json_error(http::status status, std::string_view error_message)
{
    return json_response(api_error{error_message}, status);
}

response_builder::response_type response_builder::internal_server_error(error_code ec, std::string_view what)
{
    // Log the error
    log_error(ec, "Returning internal server error", what);

    // Intentionally don't expose any error information
    return plaintext_response(http::status::internal_server_error, "An unexpected server error occurred");
}

error_code request_context::parse_request_target()
{
    auto url_result = boost::urls::parse_origin_form(request_.target());
    if (url_result.has_error())
        return url_result.error();
    target_ = url_result.value();
    return error_code();
}

bool request_context::has_content_type(std::string_view media_type) const
{
    auto it = request_.find(http::field::content_type);
    if (it == request_.end())
        return false;
    std::string_view value = it->value();
    value = trim(value.substr(0, value.find(';')));
    return beast::iequals(value, media_type);
}

//
// Parameter extraction
//

// '+' is a space in query strings and urlencoded forms
static const boost::urls::encoding_opts form_encoding{true};

static std::optional<std::string> find_encoded_param(
    boost::urls::params_encoded_view params,
    std::string_view name
)
{
    for (auto param : params)
    {
        if (!param.has_value || param.key.decode(form_encoding) != name)
            continue;
        auto value = param.value.decode(form_encoding);
        if (!value.empty())
            return value;
    }
    return std::nullopt;
}

std::optional<std::string> cmdchat::find_query_param(const boost::urls::url_view& url, std::string_view name)
{
    return find_encoded_param(url.encoded_params(), name);
}

namespace {

// A source of request parameters
using param_extractor = std::optional<std::string> (*)(const request_context&, std::string_view name);

std::optional<std::string> param_from_json_body(const request_context& ctx, std::string_view name)
{
    if (!ctx.has_content_type("application/json"))
        return std::nullopt;

    // Bodies that aren't JSON objects are not an error here: they are just not a source of parameters
    error_code ec;
    auto jv = boost::json::parse(ctx.request().body(), ec);
    if (ec || !jv.is_object())
        return std::nullopt;
    auto it = jv.get_object().find(name);
    if (it == jv.get_object().end())
        return std::nullopt;
    const auto* str = it->value().if_string();
    if (!str || str->empty())
        return std::nullopt;
    return std::string(*str);
}

std::optional<std::string> param_from_form_body(const request_context& ctx, std::string_view name)
{
    if (!ctx.has_content_type("application/x-www-form-urlencoded"))
        return std::nullopt;
    auto params = boost::urls::parse_query(ctx.request().body());
    if (params.has_error())
        return std::nullopt;
    return find_encoded_param(*params, name);
}

std::optional<std::string> param_from_query(const request_context& ctx, std::string_view name)
{
    return find_query_param(ctx.request_target(), name);
}

// In priority order
constexpr param_extractor param_extractors[] = {
    param_from_json_body,
    param_from_form_body,
    param_from_query,
};

}  // namespace

std::optional<std::string> request_context::get_param(std::string_view name) const
{
    for (auto extractor : param_extractors)
    {
        auto res = extractor(*this, name);
        if (res.has_value())
            return res;
    }
    return std::nullopt;
}
